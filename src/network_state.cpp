#include "network_state.hpp"

#include <linux/if_link.h>
#include <linux/rtnetlink.h>
#include <net/if.h>

#include "log/logger.hpp"
#include "string-format.hpp"

namespace vpsnetd {
const std::string VLAN_LINK_KIND = "vlan";

template <typename T>
const T *message_payload(const struct nlmsghdr *header) {
  if (header->nlmsg_len < NLMSG_LENGTH(sizeof(T))) {
    throw std::invalid_argument(string_format(
        "Netlink message of type %u is too short", header->nlmsg_type));
  }
  return static_cast<const T *>(NLMSG_DATA(header));
}

template <typename T>
AttributeMap message_attributes(const struct nlmsghdr *header) {
  const uint8_t *payload = static_cast<const uint8_t *>(NLMSG_DATA(header));
  return parse_attributes(
      reinterpret_cast<const struct rtattr *>(payload + NLMSG_ALIGN(sizeof(T))),
      header->nlmsg_len - NLMSG_LENGTH(sizeof(T)));
}

IpAddress attribute_address(sa_family_t family,
                            const struct rtattr *attribute) {
  return IpAddress::from_bytes(
      family,
      static_cast<const uint8_t *>(
          RTA_DATA(const_cast<struct rtattr *>(attribute))),
      RTA_PAYLOAD(attribute));
}

std::optional<LinkInfo> parse_link(const struct nlmsghdr *header) {
  if (header->nlmsg_type != RTM_NEWLINK) {
    return std::nullopt;
  }
  const struct ifinfomsg *info = message_payload<struct ifinfomsg>(header);
  AttributeMap attributes = message_attributes<struct ifinfomsg>(header);

  if (!attributes.contains(IFLA_IFNAME) || !attributes.contains(IFLA_LINKINFO)) {
    return std::nullopt;
  }
  std::string name = attribute_string(attributes.at(IFLA_IFNAME));
  if (!name.starts_with(VPS_INTERFACE_PREFIX)) {
    return std::nullopt;
  }

  AttributeMap link_info = parse_nested_attributes(attributes.at(IFLA_LINKINFO));
  if (!link_info.contains(IFLA_INFO_KIND) ||
      attribute_string(link_info.at(IFLA_INFO_KIND)) != VLAN_LINK_KIND) {
    return std::nullopt;
  }

  LinkInfo link{.name = name,
                .index = static_cast<uint32_t>(info->ifi_index),
                .link = 0,
                .vlan = 0};
  if (attributes.contains(IFLA_LINK)) {
    link.link = attribute_number<uint32_t>(attributes.at(IFLA_LINK));
  }
  if (link_info.contains(IFLA_INFO_DATA)) {
    AttributeMap vlan_info =
        parse_nested_attributes(link_info.at(IFLA_INFO_DATA));
    if (vlan_info.contains(IFLA_VLAN_ID)) {
      link.vlan = attribute_number<uint16_t>(vlan_info.at(IFLA_VLAN_ID));
    }
  }
  return link;
}

std::optional<AddressInfo> parse_address(const struct nlmsghdr *header) {
  if (header->nlmsg_type != RTM_NEWADDR) {
    return std::nullopt;
  }
  const struct ifaddrmsg *info = message_payload<struct ifaddrmsg>(header);
  if (info->ifa_scope != RT_SCOPE_UNIVERSE ||
      (info->ifa_family != AF_INET && info->ifa_family != AF_INET6)) {
    return std::nullopt;
  }

  AttributeMap attributes = message_attributes<struct ifaddrmsg>(header);
  const struct rtattr *address_attribute = nullptr;
  if (attributes.contains(IFA_ADDRESS)) {
    address_attribute = attributes.at(IFA_ADDRESS);
  } else if (attributes.contains(IFA_LOCAL)) {
    address_attribute = attributes.at(IFA_LOCAL);
  } else {
    return std::nullopt;
  }

  return AddressInfo{
      .interface = info->ifa_index,
      .address = attribute_address(info->ifa_family, address_attribute),
      .prefix_length = info->ifa_prefixlen};
}

std::optional<RouteInfo> parse_route(const struct nlmsghdr *header,
                                     uint8_t route_proto) {
  if (header->nlmsg_type != RTM_NEWROUTE) {
    return std::nullopt;
  }
  const struct rtmsg *info = message_payload<struct rtmsg>(header);
  if (info->rtm_protocol != route_proto) {
    return std::nullopt;
  }

  RouteInfo route{.interface = 0,
                  .destination = {},
                  .destination_prefix_length = info->rtm_dst_len,
                  .table = info->rtm_table,
                  .protocol = info->rtm_protocol,
                  .scope = info->rtm_scope,
                  .type = info->rtm_type};
  if (info->rtm_family == AF_INET6) {
    route.destination = IpAddress(in6addr_any);
  } else if (info->rtm_family != AF_INET) {
    return std::nullopt;
  }

  AttributeMap attributes = message_attributes<struct rtmsg>(header);
  if (attributes.contains(RTA_OIF)) {
    route.interface = attribute_number<uint32_t>(attributes.at(RTA_OIF));
  }
  if (attributes.contains(RTA_DST)) {
    route.destination =
        attribute_address(info->rtm_family, attributes.at(RTA_DST));
  }
  if (attributes.contains(RTA_TABLE)) {
    route.table = attribute_number<uint32_t>(attributes.at(RTA_TABLE));
  }
  return route;
}

NetlinkMessage make_add_vlan_request(const std::string &name,
                                     uint32_t parent_index, uint16_t vlan) {
  NetlinkMessage message(RTM_NEWLINK, NLM_F_CREATE | NLM_F_EXCL);
  struct ifinfomsg info {};
  info.ifi_family = AF_UNSPEC;
  info.ifi_flags = IFF_UP;
  info.ifi_change = IFF_UP;
  message.append_payload(info);

  message.add_string_attribute(IFLA_IFNAME, name);
  message.add_attribute(IFLA_LINK, parent_index);
  message.begin_nested(IFLA_LINKINFO);
  message.add_string_attribute(IFLA_INFO_KIND, VLAN_LINK_KIND);
  message.begin_nested(IFLA_INFO_DATA);
  message.add_attribute(IFLA_VLAN_ID, vlan);
  message.end_nested();
  message.end_nested();
  return message;
}

NetlinkMessage make_delete_link_request(uint32_t index) {
  NetlinkMessage message(RTM_DELLINK, 0);
  struct ifinfomsg info {};
  info.ifi_family = AF_UNSPEC;
  info.ifi_index = static_cast<int>(index);
  message.append_payload(info);
  return message;
}

NetlinkMessage make_address_request(uint16_t type, const AddressInfo &address) {
  NetlinkMessage message(type, type == RTM_NEWADDR
                                   ? NLM_F_CREATE | NLM_F_EXCL
                                   : 0);
  struct ifaddrmsg info {
    .ifa_family = static_cast<uint8_t>(address.address.family()),
    .ifa_prefixlen = address.prefix_length, .ifa_flags = 0,
    .ifa_scope = RT_SCOPE_UNIVERSE, .ifa_index = address.interface
  };
  message.append_payload(info);
  message.add_attribute(IFA_LOCAL, address.address.data(),
                        address.address.byte_length());
  message.add_attribute(IFA_ADDRESS, address.address.data(),
                        address.address.byte_length());
  return message;
}

NetlinkMessage make_route_request(uint16_t type, const RouteInfo &route) {
  NetlinkMessage message(type, type == RTM_NEWROUTE
                                   ? NLM_F_CREATE | NLM_F_EXCL
                                   : 0);
  struct rtmsg info {
    .rtm_family = static_cast<uint8_t>(route.destination.family()),
    .rtm_dst_len = route.destination_prefix_length, .rtm_src_len = 0,
    .rtm_tos = 0,
    .rtm_table = static_cast<uint8_t>(route.table < 256 ? route.table
                                                         : RT_TABLE_UNSPEC),
    .rtm_protocol = route.protocol, .rtm_scope = route.scope,
    .rtm_type = route.type, .rtm_flags = 0
  };
  message.append_payload(info);
  message.add_attribute(RTA_DST, route.destination.data(),
                        route.destination.byte_length());
  message.add_attribute(RTA_OIF, route.interface);
  if (route.table >= 256) {
    message.add_attribute(RTA_TABLE, route.table);
  }
  return message;
}

NetworkState get_state(NetlinkSocket &socket, uint8_t route_proto) {
  NetworkState state;

  NetlinkMessage link_request(RTM_GETLINK, 0);
  struct ifinfomsg link_filter {};
  link_filter.ifi_family = AF_UNSPEC;
  link_request.append_payload(link_filter);
  for (const std::vector<uint8_t> &reply : socket.dump(link_request)) {
    auto link =
        parse_link(reinterpret_cast<const struct nlmsghdr *>(reply.data()));
    if (link.has_value()) {
      LOG_TRACE(string_format("Found interface %s (index %u, VLAN %u)",
                              link->name.c_str(), link->index, link->vlan));
      state.interfaces.push_back(*link);
    }
  }

  NetlinkMessage address_request(RTM_GETADDR, 0);
  struct ifaddrmsg address_filter {};
  address_filter.ifa_family = AF_UNSPEC;
  address_request.append_payload(address_filter);
  for (const std::vector<uint8_t> &reply : socket.dump(address_request)) {
    auto address =
        parse_address(reinterpret_cast<const struct nlmsghdr *>(reply.data()));
    if (address.has_value()) {
      state.addresses.push_back(*address);
    }
  }

  for (uint8_t family : {AF_INET, AF_INET6}) {
    NetlinkMessage route_request(RTM_GETROUTE, 0);
    struct rtmsg route_filter {};
    route_filter.rtm_family = family;
    route_request.append_payload(route_filter);
    for (const std::vector<uint8_t> &reply : socket.dump(route_request)) {
      auto route = parse_route(
          reinterpret_cast<const struct nlmsghdr *>(reply.data()), route_proto);
      if (route.has_value()) {
        state.routes.push_back(*route);
      }
    }
  }

  LOG_DEBUG(string_format(
      "Kernel state: %zu interfaces | %zu addresses | %zu routes",
      state.interfaces.size(), state.addresses.size(), state.routes.size()));
  return state;
}

uint32_t interface_name_to_index(const std::string &name) {
  unsigned int index = if_nametoindex(name.c_str());
  if (index == 0) {
    throw InterfaceNotFound(name);
  }
  return index;
}
} // namespace vpsnetd
