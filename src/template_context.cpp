#include "template_context.hpp"

namespace vpsnetd {
TemplateValue to_template_value(const VpsConfiguration &vps) {
  TemplateValue public_addresses = TemplateValue::list();
  for (const IpAddress &address : vps.v4_public) {
    public_addresses.push_back(address.to_string());
  }

  TemplateValue value = TemplateValue::map();
  value.set("vlan", TemplateValue::integer(vps.vlan));
  value.set("v4_addr", vps.v4_addr.to_string());
  value.set("v4_public", public_addresses);
  value.set("v6_prefix", vps.v6_prefix.to_string());
  return value;
}

TemplateValue
make_template_context(const std::vector<InterfaceState> &interfaces) {
  TemplateValue interface_list = TemplateValue::list();
  for (const InterfaceState &interface : interfaces) {
    TemplateValue entry = TemplateValue::map();
    entry.set("name", interface.name);
    entry.set("vps", to_template_value(interface.vps));
    interface_list.push_back(entry);
  }

  TemplateValue context = TemplateValue::map();
  context.set("interfaces", interface_list);
  return context;
}
} // namespace vpsnetd
