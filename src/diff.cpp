#include "diff.hpp"

#include <linux/rtnetlink.h>

#include <algorithm>
#include <cstdlib>
#include <sstream>

#include "log/logger.hpp"

namespace vpsnetd {
namespace {
// Numeric suffix of a vps<N> interface name, 0 if there is none.
size_t interface_number(const std::string &name) {
  if (name.size() <= VPS_INTERFACE_PREFIX.size()) {
    return 0;
  }
  const std::string suffix = name.substr(VPS_INTERFACE_PREFIX.size());
  char *end = nullptr;
  unsigned long number = std::strtoul(suffix.c_str(), &end, 10);
  if (end == suffix.c_str() || *end != '\0') {
    return 0;
  }
  return number;
}

Change make_change(ChangeKind kind, const std::string &interface_name) {
  return Change{.kind = kind,
                .interface_name = interface_name,
                .link = {},
                .address = {},
                .route = {}};
}

Change add_address(const std::string &interface_name, const IpAddress &address,
                   uint8_t prefix_length) {
  Change change = make_change(ChangeKind::ADD_ADDRESS, interface_name);
  change.address = AddressInfo{
      .interface = 0, .address = address, .prefix_length = prefix_length};
  return change;
}

Change add_route(const std::string &interface_name, uint8_t route_proto,
                 const IpAddress &destination, uint8_t prefix_length) {
  Change change = make_change(ChangeKind::ADD_ROUTE, interface_name);
  change.route = RouteInfo{.interface = 0,
                           .destination = destination,
                           .destination_prefix_length = prefix_length,
                           .table = RT_TABLE_MAIN,
                           .protocol = route_proto,
                           .scope = RT_SCOPE_UNIVERSE,
                           .type = RTN_UNICAST};
  return change;
}

template <typename T>
bool contains(const std::vector<T> &values, const T &value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}
} // namespace

Diff make_diff(const NetworkState &state, uint32_t parent_index,
               uint8_t route_proto,
               const std::vector<VpsConfiguration> &target) {
  std::vector<uint32_t> keep_interfaces;
  std::vector<RouteInfo> keep_routes;
  std::vector<AddressInfo> remove_addresses;
  std::vector<Change> additions;
  Diff diff;

  size_t next_interface_id = 0;
  for (const LinkInfo &link : state.interfaces) {
    next_interface_id =
        std::max(next_interface_id, interface_number(link.name));
  }
  next_interface_id++;

  for (const VpsConfiguration &vps : target) {
    auto existing = std::find_if(
        state.interfaces.begin(), state.interfaces.end(),
        [&vps](const LinkInfo &link) { return link.vlan == vps.vlan; });

    if (existing == state.interfaces.end()) {
      const std::string interface_name =
          VPS_INTERFACE_PREFIX + std::to_string(next_interface_id++);
      diff.interfaces.push_back(
          InterfaceState{.name = interface_name, .vps = vps});

      Change new_link = make_change(ChangeKind::ADD_INTERFACE, interface_name);
      new_link.link = LinkInfo{.name = interface_name,
                               .index = 0,
                               .link = parent_index,
                               .vlan = vps.vlan};
      additions.push_back(new_link);
      additions.push_back(
          add_address(interface_name, vps.v4_addr, VPS_V4_PREFIX_LENGTH));
      for (const IpAddress &public_address : vps.v4_public) {
        additions.push_back(add_route(interface_name, route_proto,
                                      public_address,
                                      VPS_PUBLIC_V4_PREFIX_LENGTH));
      }
      additions.push_back(add_route(interface_name, route_proto,
                                    vps.v6_prefix, VPS_V6_PREFIX_LENGTH));
      continue;
    }

    const LinkInfo &link = *existing;
    keep_interfaces.push_back(link.index);
    diff.interfaces.push_back(InterfaceState{.name = link.name, .vps = vps});

    bool found_v4_addr = false;
    for (const AddressInfo &address : state.addresses) {
      if (address.interface != link.index || !address.address.is_v4()) {
        continue;
      }
      if (address.address == vps.v4_addr &&
          address.prefix_length == VPS_V4_PREFIX_LENGTH) {
        found_v4_addr = true;
      } else {
        remove_addresses.push_back(address);
      }
    }
    if (!found_v4_addr) {
      additions.push_back(
          add_address(link.name, vps.v4_addr, VPS_V4_PREFIX_LENGTH));
    }

    std::vector<IpAddress> found_v4;
    bool found_v6 = false;
    for (const RouteInfo &route : state.routes) {
      if (route.interface != link.index) {
        continue;
      }
      if (route.destination.is_v4()) {
        if (contains(vps.v4_public, route.destination) &&
            route.destination_prefix_length == VPS_PUBLIC_V4_PREFIX_LENGTH) {
          keep_routes.push_back(route);
          found_v4.push_back(route.destination);
        }
      } else if (route.destination == vps.v6_prefix &&
                 route.destination_prefix_length == VPS_V6_PREFIX_LENGTH) {
        keep_routes.push_back(route);
        found_v6 = true;
      }
    }

    for (const IpAddress &public_address : vps.v4_public) {
      if (!contains(found_v4, public_address)) {
        additions.push_back(add_route(link.name, route_proto, public_address,
                                      VPS_PUBLIC_V4_PREFIX_LENGTH));
      }
    }
    if (!found_v6) {
      additions.push_back(add_route(link.name, route_proto, vps.v6_prefix,
                                    VPS_V6_PREFIX_LENGTH));
    }
  }

  std::vector<uint32_t> remove_interfaces;
  for (const LinkInfo &link : state.interfaces) {
    if (!contains(keep_interfaces, link.index)) {
      Change removal = make_change(ChangeKind::REMOVE_INTERFACE, link.name);
      removal.link = link;
      diff.changes.push_back(removal);
      remove_interfaces.push_back(link.index);
    }
  }

  // routes on removed interfaces disappear together with the interface
  for (const RouteInfo &route : state.routes) {
    if (!contains(keep_routes, route) &&
        !contains(remove_interfaces, route.interface)) {
      Change removal = make_change(ChangeKind::REMOVE_ROUTE, "");
      removal.route = route;
      diff.changes.push_back(removal);
    }
  }

  for (const AddressInfo &address : remove_addresses) {
    Change removal = make_change(ChangeKind::REMOVE_ADDRESS, "");
    removal.address = address;
    diff.changes.push_back(removal);
  }

  diff.changes.insert(diff.changes.end(), additions.begin(), additions.end());
  return diff;
}

void apply_diff(NetlinkSocket &socket, const std::vector<Change> &changes) {
  for (const Change &change : changes) {
    LOG_INFO(describe_change(change));
    switch (change.kind) {
    case ChangeKind::ADD_INTERFACE: {
      NetlinkMessage request = make_add_vlan_request(
          change.link.name, change.link.link, change.link.vlan);
      socket.request(request);
      break;
    }

    case ChangeKind::REMOVE_INTERFACE: {
      NetlinkMessage request = make_delete_link_request(change.link.index);
      socket.request(request);
      break;
    }

    case ChangeKind::ADD_ADDRESS: {
      AddressInfo address = change.address;
      address.interface = interface_name_to_index(change.interface_name);
      NetlinkMessage request = make_address_request(RTM_NEWADDR, address);
      socket.request(request);
      break;
    }

    case ChangeKind::REMOVE_ADDRESS: {
      NetlinkMessage request =
          make_address_request(RTM_DELADDR, change.address);
      socket.request(request);
      break;
    }

    case ChangeKind::ADD_ROUTE: {
      RouteInfo route = change.route;
      route.interface = interface_name_to_index(change.interface_name);
      NetlinkMessage request = make_route_request(RTM_NEWROUTE, route);
      socket.request(request);
      break;
    }

    case ChangeKind::REMOVE_ROUTE: {
      NetlinkMessage request = make_route_request(RTM_DELROUTE, change.route);
      socket.request(request);
      break;
    }
    }
  }
}

std::string describe_change(const Change &change) {
  std::ostringstream os;
  switch (change.kind) {
  case ChangeKind::ADD_INTERFACE:
    os << "Adding interface " << change.link.name << " (VLAN "
       << change.link.vlan << " on link " << change.link.link << ")";
    break;
  case ChangeKind::REMOVE_INTERFACE:
    os << "Removing interface " << change.link.name << " (index "
       << change.link.index << ")";
    break;
  case ChangeKind::ADD_ADDRESS:
    os << "Adding address " << change.address.address << "/"
       << static_cast<int>(change.address.prefix_length) << " to "
       << change.interface_name;
    break;
  case ChangeKind::REMOVE_ADDRESS:
    os << "Removing address " << change.address.address << "/"
       << static_cast<int>(change.address.prefix_length)
       << " from interface index " << change.address.interface;
    break;
  case ChangeKind::ADD_ROUTE:
    os << "Adding route " << change.route.destination << "/"
       << static_cast<int>(change.route.destination_prefix_length) << " via "
       << change.interface_name;
    break;
  case ChangeKind::REMOVE_ROUTE:
    os << "Removing route " << change.route.destination << "/"
       << static_cast<int>(change.route.destination_prefix_length)
       << " via interface index " << change.route.interface;
    break;
  }
  return os.str();
}
} // namespace vpsnetd
