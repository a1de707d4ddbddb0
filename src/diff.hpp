#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "network_state.hpp"
#include "vps_config.hpp"

namespace vpsnetd {
enum struct ChangeKind : uint8_t {
  ADD_INTERFACE,
  REMOVE_INTERFACE,
  ADD_ADDRESS,
  REMOVE_ADDRESS,
  ADD_ROUTE,
  REMOVE_ROUTE
};

// One step towards the desired state. Only the member matching the kind is
// meaningful. Additions carry the interface name because a freshly created
// interface has no index until the change before them was applied.
struct Change {
  ChangeKind kind;
  std::string interface_name;
  LinkInfo link;
  AddressInfo address;
  RouteInfo route;
};

// A provisioned interface as it is exposed to the config templates.
struct InterfaceState {
  std::string name;
  VpsConfiguration vps;
};

struct Diff {
  std::vector<Change> changes;
  std::vector<InterfaceState> interfaces;
};

Diff make_diff(const NetworkState &state, uint32_t parent_index,
               uint8_t route_proto, const std::vector<VpsConfiguration> &target);
void apply_diff(NetlinkSocket &socket, const std::vector<Change> &changes);

std::string describe_change(const Change &change);
} // namespace vpsnetd
