#include "configuration.hpp"

#include <libconfig.h++>

#include <set>
#include <sstream>
#include <stdexcept>

#include "log/logger.hpp"
#include "string-format.hpp"

namespace vpsnetd {
NetworkConfiguration parse_configuration(const std::string &confpath) {
  ::libconfig::Config configuration;

  LOG_INFO("Reading config file");
  configuration.readFile(confpath.c_str());
  return parse_configuration(configuration);
}

NetworkConfiguration
parse_configuration(const libconfig::Config &configuration) {
  using ::libconfig::Setting;
  LOG_TRACE("Parsing configuration...");

  NetworkConfiguration network_cfg;
  if (!configuration.lookupValue(INTERFACE_KEY, network_cfg.interface) ||
      network_cfg.interface.empty()) {
    throw std::invalid_argument("No parent interface given!");
  }

  int rt_proto;
  if (!configuration.lookupValue(RT_PROTO_KEY, rt_proto)) {
    throw std::invalid_argument("No routing protocol number (rt-proto) given!");
  }
  if (rt_proto < 0 || rt_proto > 255) {
    throw std::invalid_argument(string_format(
        "Routing protocol number %d is out of range (0-255)!", rt_proto));
  }
  network_cfg.rt_proto = static_cast<uint8_t>(rt_proto);

  if (configuration.exists(VPS_KEY)) {
    const Setting &vps_list_cfg = configuration.lookup(VPS_KEY);
    if (!vps_list_cfg.isList() && !vps_list_cfg.isArray()) {
      throw std::invalid_argument("The vps setting must be a list!");
    }
    for (int i = 0; i < vps_list_cfg.getLength(); i++) {
      network_cfg.vps.push_back(parse_vps(vps_list_cfg[i]));
    }
  } else {
    LOG_WARN("No VPS declared, all vps interfaces will be removed");
  }

  check_vps_list(network_cfg.vps);
  LOG_DEBUG(string_format("Read %zu VPS declarations", network_cfg.vps.size()));
  return network_cfg;
}

VpsConfiguration parse_vps(const libconfig::Setting &vps_cfg_block) {
  if (!vps_cfg_block.isGroup()) {
    throw std::invalid_argument(string_format(
        "Invalid VPS declaration at line %u!", vps_cfg_block.getSourceLine()));
  }

  int vlan;
  std::string config_v4_addr, config_v6_prefix;
  if (!vps_cfg_block.lookupValue(VPS_VLAN_KEY, vlan) ||
      !vps_cfg_block.lookupValue(VPS_V4_ADDR_KEY, config_v4_addr) ||
      !vps_cfg_block.lookupValue(VPS_V6_PREFIX_KEY, config_v6_prefix)) {
    throw std::invalid_argument(string_format(
        "Invalid VPS declaration at line %u! (vlan, v4-addr, v6-prefix) "
        "are required",
        vps_cfg_block.getSourceLine()));
  }
  if (vlan < MIN_VLAN_ID || vlan > MAX_VLAN_ID) {
    throw std::invalid_argument(
        string_format("VLAN id %d is out of range (%d-%d)!", vlan, MIN_VLAN_ID,
                      MAX_VLAN_ID));
  }

  VpsConfiguration vps_cfg{.vlan = static_cast<uint16_t>(vlan),
                           .v4_addr = IpAddress::v4_from_string(config_v4_addr),
                           .v4_public = {},
                           .v6_prefix =
                               IpAddress::v6_from_string(config_v6_prefix)};

  if (vps_cfg_block.exists(VPS_V4_PUBLIC_KEY)) {
    vps_cfg.v4_public =
        parse_public_addresses(vps_cfg_block.lookup(VPS_V4_PUBLIC_KEY));
  }

  std::ostringstream os;
  os << "Read VPS on VLAN " << vps_cfg.vlan << " | v4: " << vps_cfg.v4_addr
     << " | public: " << vps_cfg.v4_public.size()
     << " | v6: " << vps_cfg.v6_prefix;
  LOG_TRACE(os.str());
  return vps_cfg;
}

std::vector<IpAddress>
parse_public_addresses(const libconfig::Setting &setting) {
  using ::libconfig::Setting;
  std::vector<IpAddress> addresses;

  switch (setting.getType()) {
  case Setting::Type::TypeString:
    addresses.push_back(
        IpAddress::v4_from_string(static_cast<const char *>(setting)));
    break;

  case Setting::Type::TypeArray:
  case Setting::Type::TypeList:
    for (int i = 0; i < setting.getLength(); i++) {
      const Setting &element = setting[i];
      if (element.getType() != Setting::Type::TypeString) {
        throw std::invalid_argument(string_format(
            "Public address at line %u must be a string!",
            element.getSourceLine()));
      }
      addresses.push_back(
          IpAddress::v4_from_string(static_cast<const char *>(element)));
    }
    break;

  default:
    throw std::invalid_argument(string_format(
        "v4-public at line %u must be an address or a list of addresses!",
        setting.getSourceLine()));
  }
  return addresses;
}

void check_vps_list(const std::vector<VpsConfiguration> &vps_list) {
  std::set<uint16_t> seen_vlans;
  for (const VpsConfiguration &vps : vps_list) {
    if (!seen_vlans.insert(vps.vlan).second) {
      throw std::invalid_argument(
          string_format("VLAN id %u is used more than once!",
                        static_cast<unsigned>(vps.vlan)));
    }
  }
}
} // namespace vpsnetd
