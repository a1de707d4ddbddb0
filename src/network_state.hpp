#pragma once

#include <linux/netlink.h>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "ip_address.hpp"
#include "netlink_socket.hpp"

namespace vpsnetd {
const std::string VPS_INTERFACE_PREFIX = "vps";

class InterfaceNotFound : public std::runtime_error {
public:
  explicit InterfaceNotFound(const std::string &name)
      : std::runtime_error("Interface not found: " + name) {}
};

struct LinkInfo {
  std::string name;
  uint32_t index;
  // index of the parent link
  uint32_t link;
  uint16_t vlan;
};

struct AddressInfo {
  uint32_t interface;
  IpAddress address;
  uint8_t prefix_length;

  bool operator==(const AddressInfo &other) const = default;
};

struct RouteInfo {
  uint32_t interface;
  IpAddress destination;
  uint8_t destination_prefix_length;
  uint32_t table;
  uint8_t protocol;
  uint8_t scope;
  uint8_t type;

  bool operator==(const RouteInfo &other) const = default;
};

struct NetworkState {
  std::vector<LinkInfo> interfaces;
  std::vector<AddressInfo> addresses;
  std::vector<RouteInfo> routes;
};

// Parsers for single RTM_NEWLINK, RTM_NEWADDR and RTM_NEWROUTE messages. They
// return nothing for messages that do not concern vpsnetd.
std::optional<LinkInfo> parse_link(const struct nlmsghdr *header);
std::optional<AddressInfo> parse_address(const struct nlmsghdr *header);
std::optional<RouteInfo> parse_route(const struct nlmsghdr *header,
                                     uint8_t route_proto);

NetlinkMessage make_add_vlan_request(const std::string &name,
                                     uint32_t parent_index, uint16_t vlan);
NetlinkMessage make_delete_link_request(uint32_t index);
NetlinkMessage make_address_request(uint16_t type, const AddressInfo &address);
NetlinkMessage make_route_request(uint16_t type, const RouteInfo &route);

NetworkState get_state(NetlinkSocket &socket, uint8_t route_proto);
uint32_t interface_name_to_index(const std::string &name);
} // namespace vpsnetd
