#pragma once

#include <vector>

#include "diff.hpp"
#include "template.hpp"

namespace vpsnetd {
// Builds { interfaces: [ { name, vps: { vlan, v4_addr, v4_public, v6_prefix } } ] }.
// v4_public is always a list so templates can test and iterate it.
TemplateValue make_template_context(const std::vector<InterfaceState> &interfaces);
TemplateValue to_template_value(const VpsConfiguration &vps);
} // namespace vpsnetd
