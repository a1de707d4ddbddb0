#include "ip_address.hpp"

#include <arpa/inet.h>

#include <algorithm>
#include <cstring>
#include <ostream>
#include <stdexcept>

#include "string-format.hpp"

namespace vpsnetd {
IpAddress::IpAddress() : _family(AF_INET), _bytes{} {}

IpAddress::IpAddress(const struct in_addr &address)
    : _family(AF_INET), _bytes{} {
  std::memcpy(_bytes.data(), &address.s_addr, sizeof(address.s_addr));
}

IpAddress::IpAddress(const struct in6_addr &address)
    : _family(AF_INET6), _bytes{} {
  std::memcpy(_bytes.data(), address.s6_addr, sizeof(address.s6_addr));
}

IpAddress IpAddress::from_string(const std::string &text) {
  if (text.find(':') != std::string::npos) {
    return v6_from_string(text);
  }
  return v4_from_string(text);
}

IpAddress IpAddress::v4_from_string(const std::string &text) {
  struct in_addr parsed {};
  if (inet_pton(AF_INET, text.c_str(), &parsed) != 1) {
    throw std::invalid_argument(
        string_format("Invalid IPv4 address: %s", text.c_str()));
  }
  return IpAddress(parsed);
}

IpAddress IpAddress::v6_from_string(const std::string &text) {
  struct in6_addr parsed {};
  if (inet_pton(AF_INET6, text.c_str(), &parsed) != 1) {
    throw std::invalid_argument(
        string_format("Invalid IPv6 address: %s", text.c_str()));
  }
  return IpAddress(parsed);
}

IpAddress IpAddress::from_bytes(sa_family_t family, const uint8_t *data,
                                size_t length) {
  IpAddress address;
  if (family == AF_INET && length == 4) {
    address._family = AF_INET;
  } else if (family == AF_INET6 && length == 16) {
    address._family = AF_INET6;
  } else {
    throw std::invalid_argument(string_format(
        "Address of family %d cannot have length %zu", family, length));
  }
  std::copy(data, data + length, address._bytes.begin());
  return address;
}

size_t IpAddress::byte_length() const { return is_v4() ? 4 : 16; }

std::string IpAddress::to_string() const {
  char buffer[INET6_ADDRSTRLEN] = {0};
  if (inet_ntop(_family, _bytes.data(), buffer, sizeof(buffer)) == nullptr) {
    throw std::runtime_error("inet_ntop failed");
  }
  return std::string(buffer);
}

std::ostream &operator<<(std::ostream &os, const IpAddress &address) {
  return os << address.to_string();
}
} // namespace vpsnetd
