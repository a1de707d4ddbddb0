#include "config_writer.hpp"
#include "template.hpp"
#include "template_context.hpp"

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/test/unit_test.hpp>

#include <sstream>
#include <string>
#include <vector>

namespace vpsnetd {
namespace tests {

namespace pt = boost::property_tree;

namespace {
InterfaceState make_interface(const std::string &name, uint16_t vlan,
                              const std::string &v4_addr,
                              const std::vector<std::string> &v4_public) {
  VpsConfiguration vps{.vlan = vlan,
                       .v4_addr = IpAddress::from_string(v4_addr),
                       .v4_public = {},
                       .v6_prefix = IpAddress::from_string("2001:db8::")};
  for (const std::string &address : v4_public) {
    vps.v4_public.push_back(IpAddress::from_string(address));
  }
  return InterfaceState{.name = name, .vps = vps};
}

// Renders the shipped Kea template and parses the result as JSON.
class KeaTemplateFixture {
protected:
  Template kea_template;

  KeaTemplateFixture()
      : kea_template(
            Template::from_file(std::string(TEMPLATE_DIR) +
                                "/kea-dhcp4.conf.tmpl")) {}

  std::string render(const std::vector<InterfaceState> &interfaces) {
    return kea_template.render(make_template_context(interfaces));
  }

  pt::ptree render_json(const std::vector<InterfaceState> &interfaces) {
    std::istringstream is(render(interfaces));
    pt::ptree tree;
    pt::read_json(is, tree);
    return tree;
  }

  static std::vector<const pt::ptree *> children(const pt::ptree &tree,
                                                 const std::string &path) {
    std::vector<const pt::ptree *> result;
    for (const auto &child : tree.get_child(path)) {
      result.push_back(&child.second);
    }
    return result;
  }
};
} // namespace

BOOST_FIXTURE_TEST_SUITE(TestKeaTemplate, KeaTemplateFixture)

BOOST_AUTO_TEST_CASE(GlobalSettings)
{
  pt::ptree tree =
      render_json({make_interface("vps1", 100, "10.0.0.1", {})});

  BOOST_CHECK_GT(tree.get<int>("Dhcp4.valid-lifetime"), 0);
  BOOST_CHECK_GT(tree.get<int>("Dhcp4.renew-timer"), 0);
  BOOST_CHECK_GT(tree.get<int>("Dhcp4.rebind-timer"), 0);
  BOOST_CHECK_EQUAL(tree.get<std::string>("Dhcp4.lease-database.type"),
                    "memfile");
  BOOST_CHECK_EQUAL(tree.get<bool>("Dhcp4.lease-database.persist"), true);
  BOOST_CHECK(!tree.get<std::string>("Dhcp4.lease-database.name").empty());

  std::vector<const pt::ptree *> interfaces =
      children(tree, "Dhcp4.interfaces-config.interfaces");
  BOOST_REQUIRE_EQUAL(interfaces.size(), 1);
  BOOST_CHECK_EQUAL(interfaces[0]->data(), "*");

  std::vector<const pt::ptree *> options = children(tree, "Dhcp4.option-data");
  BOOST_REQUIRE_EQUAL(options.size(), 2);
  BOOST_CHECK_EQUAL(options[0]->get<std::string>("name"), "domain-name-servers");
  BOOST_CHECK_EQUAL(options[1]->get<std::string>("name"), "routers");
  for (const pt::ptree *option : options) {
    BOOST_CHECK(!option->get<std::string>("data").empty());
  }
}

BOOST_AUTO_TEST_CASE(OneSharedNetworkPerInterface)
{
  pt::ptree tree = render_json({make_interface("vps3", 100, "10.0.0.1", {}),
                                make_interface("vps1", 101, "10.0.0.3", {}),
                                make_interface("vps2", 102, "10.0.0.5", {})});

  std::vector<const pt::ptree *> networks =
      children(tree, "Dhcp4.shared-networks");
  BOOST_REQUIRE_EQUAL(networks.size(), 3);
  BOOST_CHECK_EQUAL(networks[0]->get<std::string>("name"), "vps3");
  BOOST_CHECK_EQUAL(networks[0]->get<std::string>("interface"), "vps3");
  BOOST_CHECK_EQUAL(networks[1]->get<std::string>("name"), "vps1");
  BOOST_CHECK_EQUAL(networks[2]->get<std::string>("name"), "vps2");
}

BOOST_AUTO_TEST_CASE(PrimarySubnet)
{
  pt::ptree tree =
      render_json({make_interface("vps1", 100, "10.0.0.1", {})});

  std::vector<const pt::ptree *> networks =
      children(tree, "Dhcp4.shared-networks");
  BOOST_REQUIRE_EQUAL(networks.size(), 1);
  std::vector<const pt::ptree *> subnets = children(*networks[0], "subnet4");
  BOOST_REQUIRE_EQUAL(subnets.size(), 1);
  BOOST_CHECK_EQUAL(subnets[0]->get<std::string>("subnet"), "10.0.0.1/31");

  std::vector<const pt::ptree *> pools = children(*subnets[0], "pools");
  BOOST_REQUIRE_EQUAL(pools.size(), 1);
  BOOST_CHECK_EQUAL(pools[0]->get<std::string>("pool"), "10.0.0.1/32");
}

BOOST_AUTO_TEST_CASE(OneSubnetPerPublicAddress)
{
  pt::ptree tree = render_json(
      {make_interface("vps1", 100, "10.0.0.1", {"203.0.113.10", "203.0.113.11"}),
       make_interface("vps2", 101, "10.0.0.3", {}),
       make_interface("vps3", 102, "10.0.0.5", {"203.0.113.12"})});

  std::vector<const pt::ptree *> networks =
      children(tree, "Dhcp4.shared-networks");
  BOOST_REQUIRE_EQUAL(networks.size(), 3);

  std::vector<const pt::ptree *> subnets = children(*networks[0], "subnet4");
  BOOST_REQUIRE_EQUAL(subnets.size(), 3);
  BOOST_CHECK_EQUAL(subnets[0]->get<std::string>("subnet"), "10.0.0.1/31");
  BOOST_CHECK_EQUAL(subnets[1]->get<std::string>("subnet"), "203.0.113.10/32");
  BOOST_CHECK_EQUAL(children(*subnets[1], "pools")[0]->get<std::string>("pool"),
                    "203.0.113.10/32");
  BOOST_CHECK_EQUAL(subnets[2]->get<std::string>("subnet"), "203.0.113.11/32");

  BOOST_CHECK_EQUAL(children(*networks[1], "subnet4").size(), 1);

  subnets = children(*networks[2], "subnet4");
  BOOST_REQUIRE_EQUAL(subnets.size(), 2);
  BOOST_CHECK_EQUAL(subnets[1]->get<std::string>("subnet"), "203.0.113.12/32");
}

BOOST_AUTO_TEST_CASE(NoTrailingSeparator)
{
  std::string rendered =
      render({make_interface("vps1", 100, "10.0.0.1", {"203.0.113.10"}),
              make_interface("vps2", 101, "10.0.0.3", {})});

  // each shared network but the last is followed by a comma
  BOOST_CHECK(rendered.find("},\n      {\n        \"name\": \"vps2\"") !=
              std::string::npos);
  BOOST_CHECK(rendered.find("}\n    ]") != std::string::npos);
  BOOST_CHECK(rendered.find(",\n    ]") == std::string::npos);
  BOOST_CHECK(rendered.find(",\n        ]") == std::string::npos);
}

BOOST_AUTO_TEST_CASE(NoInterfaces)
{
  pt::ptree tree = render_json({});
  BOOST_CHECK(tree.get_child("Dhcp4.shared-networks").empty());
}

BOOST_AUTO_TEST_CASE(RadvdTemplate)
{
  Template radvd_template = Template::from_file(std::string(TEMPLATE_DIR) +
                                                "/radvd.conf.tmpl");
  InterfaceState first = make_interface("vps1", 100, "10.0.0.1", {});
  first.vps.v6_prefix = IpAddress::from_string("2001:db8:100::");
  InterfaceState second = make_interface("vps2", 101, "10.0.0.3", {});
  second.vps.v6_prefix = IpAddress::from_string("2001:db8:101::");

  std::string rendered =
      radvd_template.render(make_template_context({first, second}));
  BOOST_CHECK(rendered.find("interface vps1\n") != std::string::npos);
  BOOST_CHECK(rendered.find("prefix 2001:db8:100::/64") != std::string::npos);
  BOOST_CHECK(rendered.find("interface vps2\n") != std::string::npos);
  BOOST_CHECK(rendered.find("prefix 2001:db8:101::/64") != std::string::npos);
  BOOST_CHECK(rendered.find("interface vps1") < rendered.find("interface vps2"));
}

BOOST_AUTO_TEST_SUITE_END()

} // namespace tests
} // namespace vpsnetd
