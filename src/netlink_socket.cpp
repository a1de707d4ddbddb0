#include "netlink_socket.hpp"

#include <string.h>
#include <sys/socket.h>
#include <unistd.h>

#include <ctime>

#include "log/logger.hpp"
#include "string-format.hpp"

#define RECV_BUFFER_SIZE 65536

namespace vpsnetd {
NetlinkError::NetlinkError(const std::string &what, int error)
    : std::runtime_error(what + ": " + strerror(error)), _error(error) {}

NetlinkMessage::NetlinkMessage(uint16_t type, uint16_t flags) : _buffer() {
  struct nlmsghdr header {
    .nlmsg_len = NLMSG_HDRLEN, .nlmsg_type = type,
    .nlmsg_flags = static_cast<uint16_t>(NLM_F_REQUEST | flags),
    .nlmsg_seq = 0, .nlmsg_pid = 0
  };
  append(&header, sizeof(header));
  pad();
}

void NetlinkMessage::append(const void *data, size_t length) {
  const uint8_t *bytes = static_cast<const uint8_t *>(data);
  _buffer.insert(_buffer.end(), bytes, bytes + length);
  reinterpret_cast<struct nlmsghdr *>(_buffer.data())->nlmsg_len =
      _buffer.size();
}

void NetlinkMessage::pad() {
  size_t aligned = NLMSG_ALIGN(_buffer.size());
  if (aligned != _buffer.size()) {
    _buffer.resize(aligned, 0);
    reinterpret_cast<struct nlmsghdr *>(_buffer.data())->nlmsg_len =
        _buffer.size();
  }
}

void NetlinkMessage::add_attribute(uint16_t type, const void *data,
                                   size_t length) {
  struct rtattr attribute {
    .rta_len = static_cast<unsigned short>(RTA_LENGTH(length)),
    .rta_type = type
  };
  append(&attribute, sizeof(attribute));
  if (length > 0) {
    append(data, length);
  }
  pad();
}

void NetlinkMessage::add_string_attribute(uint16_t type,
                                          const std::string &value) {
  // the kernel expects the terminating '\0' to be part of the payload
  add_attribute(type, value.c_str(), value.size() + 1);
}

void NetlinkMessage::begin_nested(uint16_t type) {
  _open_nests.push_back(_buffer.size());
  add_attribute(type, nullptr, 0);
}

void NetlinkMessage::end_nested() {
  if (_open_nests.empty()) {
    throw std::logic_error("No nested attribute to close");
  }
  size_t offset = _open_nests.back();
  _open_nests.pop_back();
  reinterpret_cast<struct rtattr *>(_buffer.data() + offset)->rta_len =
      static_cast<unsigned short>(_buffer.size() - offset);
}

void NetlinkMessage::set_sequence(uint32_t sequence) {
  reinterpret_cast<struct nlmsghdr *>(_buffer.data())->nlmsg_seq = sequence;
}

void NetlinkMessage::add_flags(uint16_t flags) {
  reinterpret_cast<struct nlmsghdr *>(_buffer.data())->nlmsg_flags |= flags;
}

const struct nlmsghdr *NetlinkMessage::header() const {
  return reinterpret_cast<const struct nlmsghdr *>(_buffer.data());
}

AttributeMap parse_attributes(const struct rtattr *first, size_t length) {
  AttributeMap attributes;
  unsigned int remaining = static_cast<unsigned int>(length);
  for (const struct rtattr *attribute = first; RTA_OK(attribute, remaining);
       attribute = RTA_NEXT(attribute, remaining)) {
    // strip NLA_F_NESTED and NLA_F_NET_BYTEORDER
    attributes[attribute->rta_type & NLA_TYPE_MASK] = attribute;
  }
  return attributes;
}

AttributeMap parse_nested_attributes(const struct rtattr *attribute) {
  return parse_attributes(static_cast<const struct rtattr *>(RTA_DATA(
                              const_cast<struct rtattr *>(attribute))),
                          RTA_PAYLOAD(attribute));
}

std::string attribute_string(const struct rtattr *attribute) {
  const char *data = static_cast<const char *>(
      RTA_DATA(const_cast<struct rtattr *>(attribute)));
  size_t length = RTA_PAYLOAD(attribute);
  while (length > 0 && data[length - 1] == '\0') {
    length--;
  }
  return std::string(data, length);
}

NetlinkSocket::NetlinkSocket()
    : _sequence(static_cast<uint32_t>(time(nullptr))) {
  _socket_fd = socket(AF_NETLINK, SOCK_RAW | SOCK_CLOEXEC, NETLINK_ROUTE);
  if (_socket_fd == -1) {
    die("Failed to create netlink socket: ");
  }

  struct sockaddr_nl local_address {};
  local_address.nl_family = AF_NETLINK;
  if (bind(_socket_fd, reinterpret_cast<struct sockaddr *>(&local_address),
           sizeof(local_address)) == -1) {
    close(_socket_fd);
    die("Failed to bind netlink socket: ");
  }

  int enable = 1;
  // extended acks carry the kernel's reason for rejecting a request
  if (setsockopt(_socket_fd, SOL_NETLINK, NETLINK_EXT_ACK, &enable,
                 sizeof(enable)) < 0) {
    LOG_DEBUG(string_format("Extended netlink acks unavailable: %s",
                            strerror(errno)));
  }
  LOG_DEBUG("Opened rtnetlink socket");
}

NetlinkSocket::~NetlinkSocket() noexcept { close(_socket_fd); }

NetlinkSocket::operator int() { return _socket_fd; }

void NetlinkSocket::die(std::string error_msg) {
  error_msg.append(strerror(errno));
  LOG_FATAL(error_msg);
  throw std::runtime_error(error_msg);
}

void NetlinkSocket::send(NetlinkMessage &message) {
  message.set_sequence(++_sequence);
  struct sockaddr_nl kernel_address {};
  kernel_address.nl_family = AF_NETLINK;

  ssize_t sent;
  do {
    sent = sendto(_socket_fd, message.data(), message.size(), 0,
                  reinterpret_cast<struct sockaddr *>(&kernel_address),
                  sizeof(kernel_address));
  } while (sent == -1 && errno == EINTR);

  if (sent == -1) {
    throw NetlinkError("Failed to send netlink request", errno);
  }
  LOG_TRACE(string_format("Sent netlink message type %u seq %u (%zu bytes)",
                          message.header()->nlmsg_type, _sequence,
                          message.size()));
}

std::vector<std::vector<uint8_t>> NetlinkSocket::receive(uint32_t sequence) {
  std::vector<std::vector<uint8_t>> replies;
  std::vector<uint8_t> buffer(RECV_BUFFER_SIZE);

  while (true) {
    struct sockaddr_nl sender {};
    struct iovec data_buffer {
      .iov_base = buffer.data(), .iov_len = buffer.size()
    };
    struct msghdr message_header {
      .msg_name = &sender, .msg_namelen = sizeof(sender),
      .msg_iov = &data_buffer, .msg_iovlen = 1, .msg_control = nullptr,
      .msg_controllen = 0, .msg_flags = 0
    };

    ssize_t received = recvmsg(_socket_fd, &message_header, 0);
    if (received == -1) {
      if (errno == EINTR) {
        continue;
      }
      throw NetlinkError("Failed to receive netlink reply", errno);
    }
    if ((message_header.msg_flags & MSG_TRUNC) != 0) {
      throw NetlinkError("Netlink reply was truncated", EMSGSIZE);
    }
    if (sender.nl_pid != 0) {
      // not from the kernel
      continue;
    }

    unsigned int remaining = static_cast<unsigned int>(received);
    for (struct nlmsghdr *header =
             reinterpret_cast<struct nlmsghdr *>(buffer.data());
         NLMSG_OK(header, remaining); header = NLMSG_NEXT(header, remaining)) {
      if (header->nlmsg_seq != sequence) {
        LOG_TRACE(string_format("Skipping netlink message with seq %u",
                                header->nlmsg_seq));
        continue;
      }

      if (header->nlmsg_type == NLMSG_ERROR) {
        const struct nlmsgerr *error =
            static_cast<const struct nlmsgerr *>(NLMSG_DATA(header));
        if (error->error == 0) {
          return replies;
        }
        throw NetlinkError("Netlink request failed", -error->error);
      }

      if (header->nlmsg_type == NLMSG_DONE) {
        if (header->nlmsg_len >= NLMSG_LENGTH(sizeof(int))) {
          int status;
          std::memcpy(&status, NLMSG_DATA(header), sizeof(status));
          if (status < 0) {
            throw NetlinkError("Netlink dump failed", -status);
          }
        }
        return replies;
      }

      const uint8_t *start = reinterpret_cast<const uint8_t *>(header);
      replies.emplace_back(start, start + header->nlmsg_len);
    }
  }
}

void NetlinkSocket::request(NetlinkMessage &message) {
  message.add_flags(NLM_F_ACK);
  send(message);
  receive(_sequence);
}

std::vector<std::vector<uint8_t>> NetlinkSocket::dump(NetlinkMessage &message) {
  message.add_flags(NLM_F_DUMP);
  send(message);
  std::vector<std::vector<uint8_t>> replies = receive(_sequence);
  LOG_TRACE(string_format("Netlink dump returned %zu messages", replies.size()));
  return replies;
}
} // namespace vpsnetd
