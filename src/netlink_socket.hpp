#pragma once

#include <linux/netlink.h>
#include <linux/rtnetlink.h>

#include <cstdint>
#include <cstring>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace vpsnetd {
class NetlinkError : public std::runtime_error {
private:
  int _error;

public:
  NetlinkError(const std::string &what, int error);
  int error() const { return _error; }
};

// A single netlink request: header, fixed payload (ifinfomsg, ifaddrmsg,
// rtmsg) and a flat or nested list of route attributes.
class NetlinkMessage {
private:
  std::vector<uint8_t> _buffer;
  std::vector<size_t> _open_nests;

  void append(const void *data, size_t length);
  void pad();

public:
  NetlinkMessage(uint16_t type, uint16_t flags);

  template <typename T> void append_payload(const T &payload) {
    append(&payload, sizeof(T));
    pad();
  }

  void add_attribute(uint16_t type, const void *data, size_t length);
  void add_string_attribute(uint16_t type, const std::string &value);
  template <typename T> void add_attribute(uint16_t type, const T &value) {
    add_attribute(type, &value, sizeof(T));
  }
  void begin_nested(uint16_t type);
  void end_nested();

  void set_sequence(uint32_t sequence);
  void add_flags(uint16_t flags);
  const struct nlmsghdr *header() const;
  const uint8_t *data() const { return _buffer.data(); }
  size_t size() const { return _buffer.size(); }
};

using AttributeMap = std::map<uint16_t, const struct rtattr *>;

// Later duplicates of an attribute type replace earlier ones.
AttributeMap parse_attributes(const struct rtattr *first, size_t length);
AttributeMap parse_nested_attributes(const struct rtattr *attribute);
std::string attribute_string(const struct rtattr *attribute);

template <typename N> N attribute_number(const struct rtattr *attribute) {
  if (RTA_PAYLOAD(attribute) < sizeof(N)) {
    throw std::invalid_argument("Netlink attribute is too short");
  }
  N value;
  std::memcpy(&value, RTA_DATA(attribute), sizeof(N));
  return value;
}

class NetlinkSocket {
private:
  int _socket_fd;
  uint32_t _sequence;
  [[noreturn]] void die(std::string error_msg);
  void send(NetlinkMessage &message);
  std::vector<std::vector<uint8_t>> receive(uint32_t sequence);

public:
  NetlinkSocket();
  ~NetlinkSocket() noexcept;
  NetlinkSocket(const NetlinkSocket &other) = delete;
  NetlinkSocket &operator=(const NetlinkSocket &other) = delete;

  operator int();
  // Sends a request and waits for the kernel's acknowledgement.
  // Throws NetlinkError carrying the errno of a negative ack.
  void request(NetlinkMessage &message);
  // Sends a dump request and collects every reply up to NLMSG_DONE.
  std::vector<std::vector<uint8_t>> dump(NetlinkMessage &message);
};
} // namespace vpsnetd
