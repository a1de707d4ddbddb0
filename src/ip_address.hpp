#pragma once

#include <netinet/in.h>
#include <sys/socket.h>

#include <array>
#include <cstdint>
#include <iosfwd>
#include <string>

namespace vpsnetd {
class IpAddress {
private:
  sa_family_t _family;
  std::array<uint8_t, 16> _bytes;

public:
  IpAddress();
  explicit IpAddress(const struct in_addr &address);
  explicit IpAddress(const struct in6_addr &address);

  // Throws std::invalid_argument if the text is neither IPv4 nor IPv6.
  static IpAddress from_string(const std::string &text);
  static IpAddress v4_from_string(const std::string &text);
  static IpAddress v6_from_string(const std::string &text);
  // Accepts exactly 4 or 16 bytes in network order.
  static IpAddress from_bytes(sa_family_t family, const uint8_t *data,
                              size_t length);

  sa_family_t family() const { return _family; }
  bool is_v4() const { return _family == AF_INET; }
  bool is_v6() const { return _family == AF_INET6; }
  size_t byte_length() const;
  const uint8_t *data() const { return _bytes.data(); }

  std::string to_string() const;

  bool operator==(const IpAddress &other) const = default;
};

std::ostream &operator<<(std::ostream &os, const IpAddress &address);
} // namespace vpsnetd
