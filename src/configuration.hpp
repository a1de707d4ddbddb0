#pragma once

#include <libconfig.h++>

#include <string>
#include <vector>

#include "vps_config.hpp"

namespace vpsnetd {
const std::string INTERFACE_KEY = "interface";
const std::string RT_PROTO_KEY = "rt-proto";
const std::string VPS_KEY = "vps";

const std::string VPS_VLAN_KEY = "vlan";
const std::string VPS_V4_ADDR_KEY = "v4-addr";
const std::string VPS_V4_PUBLIC_KEY = "v4-public";
const std::string VPS_V6_PREFIX_KEY = "v6-prefix";

constexpr int MIN_VLAN_ID = 1;
constexpr int MAX_VLAN_ID = 4094;

const std::string KEA_TEMPLATE_NAME = "kea-dhcp4.conf.tmpl";
const std::string RADVD_TEMPLATE_NAME = "radvd.conf.tmpl";
const std::string KEA_CONFIG_NAME = "kea-dhcp4.conf";
const std::string RADVD_CONFIG_NAME = "radvd.conf";

enum DAEMON_TYPE {
#ifdef HAVE_SYSTEMD
  SYSTEMD,
#endif
  SYSV
};

struct ProgramConfiguration {
  std::string confpath;
  std::string template_dir;
  std::string run_dir;
  std::string radvd_path;
  std::string kea_path;
  bool foreground;
  bool oneshot;
  DAEMON_TYPE daemon_type;
  NetworkConfiguration network;
};

// Reads the daemon config file. Throws libconfig::ParseException and
// libconfig::FileIOException for syntax and IO problems and
// std::invalid_argument for values that are missing or out of range.
NetworkConfiguration parse_configuration(const std::string &confpath);
NetworkConfiguration parse_configuration(const libconfig::Config &configuration);
VpsConfiguration parse_vps(const libconfig::Setting &vps_cfg_block);
std::vector<IpAddress> parse_public_addresses(const libconfig::Setting &setting);
void check_vps_list(const std::vector<VpsConfiguration> &vps_list);
} // namespace vpsnetd
