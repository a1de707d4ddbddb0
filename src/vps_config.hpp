#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "ip_address.hpp"

namespace vpsnetd {
constexpr uint8_t VPS_V4_PREFIX_LENGTH = 31;
constexpr uint8_t VPS_PUBLIC_V4_PREFIX_LENGTH = 32;
constexpr uint8_t VPS_V6_PREFIX_LENGTH = 64;

struct VpsConfiguration {
  uint16_t vlan;
  IpAddress v4_addr;
  // empty when the VPS has no public IPv4 addresses
  std::vector<IpAddress> v4_public;
  IpAddress v6_prefix;
};

struct NetworkConfiguration {
  std::string interface;
  uint8_t rt_proto;
  std::vector<VpsConfiguration> vps;
};
} // namespace vpsnetd
