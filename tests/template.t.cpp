#include "template.hpp"

#include <boost/test/unit_test.hpp>

#include <string>

namespace vpsnetd {
namespace tests {

namespace {
std::string render(const std::string &source, const TemplateValue &context) {
  return Template::from_string("test", source).render(context);
}

TemplateValue make_names(std::initializer_list<const char *> names) {
  TemplateValue list = TemplateValue::list();
  for (const char *name : names) {
    list.push_back(name);
  }
  TemplateValue context = TemplateValue::map();
  context.set("names", list);
  return context;
}
} // namespace

BOOST_AUTO_TEST_SUITE(TestTemplate)

BOOST_AUTO_TEST_CASE(PlainText)
{
  BOOST_CHECK_EQUAL(render("no directives { here }", TemplateValue::map()),
                    "no directives { here }");
  BOOST_CHECK_EQUAL(render("", TemplateValue::map()), "");
}

BOOST_AUTO_TEST_CASE(Interpolation)
{
  TemplateValue vps = TemplateValue::map();
  vps.set("v4_addr", "10.0.0.1");
  vps.set("vlan", TemplateValue::integer(100));
  vps.set("enabled", TemplateValue::boolean(true));
  TemplateValue context = TemplateValue::map();
  context.set("vps", vps);

  BOOST_CHECK_EQUAL(render("{{ vps.v4_addr }}/31", context), "10.0.0.1/31");
  BOOST_CHECK_EQUAL(render("{{vps.vlan}}", context), "100");
  BOOST_CHECK_EQUAL(render("{{ vps.enabled }}", context), "true");
}

BOOST_AUTO_TEST_CASE(ListIndex)
{
  BOOST_CHECK_EQUAL(render("{{ names.1 }}", make_names({"a", "b"})), "b");
  BOOST_CHECK_THROW(render("{{ names.2 }}", make_names({"a", "b"})),
                    TemplateError);
}

BOOST_AUTO_TEST_CASE(ForLoop)
{
  BOOST_CHECK_EQUAL(
      render("{% for name in names %}[{{ name }}]{% endfor %}",
             make_names({"vps1", "vps2", "vps3"})),
      "[vps1][vps2][vps3]");
  BOOST_CHECK_EQUAL(
      render("before{% for name in names %}{{ name }}{% endfor %}after",
             make_names({})),
      "beforeafter");
}

BOOST_AUTO_TEST_CASE(LoopVariables)
{
  TemplateValue context = make_names({"a", "b", "c"});
  BOOST_CHECK_EQUAL(
      render("{% for n in names %}{{ n }}{% if not loop.last %},{% endif %}"
             "{% endfor %}",
             context),
      "a,b,c");
  BOOST_CHECK_EQUAL(
      render("{% for n in names %}{{ loop.index }}/{{ loop.length }} "
             "{% endfor %}",
             context),
      "1/3 2/3 3/3 ");
  BOOST_CHECK_EQUAL(
      render("{% for n in names %}{% if loop.first %}{{ loop.index0 }}"
             "{% endif %}{% endfor %}",
             context),
      "0");
}

BOOST_AUTO_TEST_CASE(NestedLoopsRestoreOuterLoop)
{
  TemplateValue inner = TemplateValue::list();
  inner.push_back("x");
  inner.push_back("y");
  TemplateValue outer = TemplateValue::list();
  TemplateValue first = TemplateValue::map();
  first.set("items", inner);
  outer.push_back(first);
  TemplateValue second = TemplateValue::map();
  second.set("items", TemplateValue::list());
  outer.push_back(second);
  TemplateValue context = TemplateValue::map();
  context.set("groups", outer);

  BOOST_CHECK_EQUAL(render("{% for g in groups %}"
                           "({% for i in g.items %}{{ i }}{% endfor %})"
                           "{% if not loop.last %};{% endif %}"
                           "{% endfor %}",
                           context),
                    "(xy);()");
}

BOOST_AUTO_TEST_CASE(Conditions)
{
  TemplateValue context = TemplateValue::map();
  context.set("empty", TemplateValue::list());
  TemplateValue full = TemplateValue::list();
  full.push_back("a");
  context.set("full", full);
  context.set("zero", TemplateValue::integer(0));
  context.set("text", "");

  BOOST_CHECK_EQUAL(render("{% if full %}yes{% endif %}", context), "yes");
  BOOST_CHECK_EQUAL(render("{% if empty %}yes{% endif %}", context), "");
  BOOST_CHECK_EQUAL(render("{% if zero %}yes{% else %}no{% endif %}", context),
                    "no");
  BOOST_CHECK_EQUAL(render("{% if not text %}empty{% endif %}", context),
                    "empty");
  // undefined variables are false in conditions
  BOOST_CHECK_EQUAL(render("{% if missing.value %}yes{% else %}no{% endif %}",
                           context),
                    "no");
  BOOST_CHECK_EQUAL(render("{% if not not full %}yes{% endif %}", context),
                    "yes");
}

BOOST_AUTO_TEST_CASE(Elif)
{
  TemplateValue context = TemplateValue::map();
  context.set("second", TemplateValue::boolean(true));
  const std::string source =
      "{% if first %}1{% elif second %}2{% elif third %}3{% else %}0{% endif %}";
  BOOST_CHECK_EQUAL(render(source, context), "2");

  context.set("second", TemplateValue::boolean(false));
  BOOST_CHECK_EQUAL(render(source, context), "0");

  context.set("first", TemplateValue::boolean(true));
  BOOST_CHECK_EQUAL(render(source, context), "1");
}

BOOST_AUTO_TEST_CASE(Comments)
{
  BOOST_CHECK_EQUAL(render("a{# ignored {{ nothing }} #}b", TemplateValue::map()),
                    "ab");
}

BOOST_AUTO_TEST_CASE(WhitespaceControl)
{
  TemplateValue context = make_names({"a", "b"});
  BOOST_CHECK_EQUAL(render("[\n  {%- for n in names %}\n  {{ n }}\n"
                           "  {%- endfor %}\n]",
                           context),
                    "[\n  a\n  b\n]");
  BOOST_CHECK_EQUAL(render("x   {{- names.0 -}}   y", context), "xay");
  BOOST_CHECK_EQUAL(render("x\n{#- comment -#}\ny", context), "xy");
}

BOOST_AUTO_TEST_CASE(RenderErrors)
{
  TemplateValue context = make_names({"a"});
  BOOST_CHECK_THROW(render("{{ undefined }}", context), TemplateError);
  BOOST_CHECK_THROW(render("{{ names }}", context), TemplateError);
  BOOST_CHECK_THROW(render("{% for n in names.0 %}{% endfor %}", context),
                    TemplateError);
  BOOST_CHECK_THROW(render("{% for n in nothing %}{% endfor %}", context),
                    TemplateError);
  BOOST_CHECK_THROW(render("{{ names.99999999999999999999999 }}", context),
                    TemplateError);
}

BOOST_AUTO_TEST_CASE(SyntaxErrors)
{
  BOOST_CHECK_THROW(Template::from_string("t", "{% for n in names %}"),
                    TemplateError);
  BOOST_CHECK_THROW(Template::from_string("t", "{% if a %}{% else %}"),
                    TemplateError);
  BOOST_CHECK_THROW(Template::from_string("t", "{% endif %}"), TemplateError);
  BOOST_CHECK_THROW(Template::from_string("t", "{% include x %}"),
                    TemplateError);
  BOOST_CHECK_THROW(Template::from_string("t", "{% %}"), TemplateError);
  BOOST_CHECK_THROW(Template::from_string("t", "{{ a b }}"), TemplateError);
  BOOST_CHECK_THROW(Template::from_string("t", "{{ not a }}"), TemplateError);
  BOOST_CHECK_THROW(Template::from_string("t", "{{ a.-b }}"), TemplateError);
  BOOST_CHECK_THROW(Template::from_string("t", "{% for x of y %}{% endfor %}"),
                    TemplateError);
  BOOST_CHECK_THROW(Template::from_string("t", "{% if a %}{% endif garbage %}"),
                    TemplateError);
  BOOST_CHECK_THROW(
      Template::from_string("t", "{% for n in names %}{% endfor junk %}"),
      TemplateError);
  BOOST_CHECK_THROW(
      Template::from_string("t", "{% if a %}{% else %}{% endif x %}"),
      TemplateError);
}

BOOST_AUTO_TEST_CASE(ErrorLocation)
{
  try {
    Template::from_string("kea.tmpl", "line one\nline two\n{{ unclosed");
    BOOST_FAIL("expected TemplateError");
  } catch (const TemplateError &error) {
    BOOST_CHECK_EQUAL(error.template_name(), "kea.tmpl");
    BOOST_CHECK_EQUAL(error.line(), 3);
    BOOST_CHECK_EQUAL(std::string(error.what()).rfind("kea.tmpl:3:", 0), 0);
  }
}

BOOST_AUTO_TEST_CASE(MissingFile)
{
  BOOST_CHECK_THROW(Template::from_file("/nonexistent/vpsnetd/missing.tmpl"),
                    TemplateError);
}

BOOST_AUTO_TEST_SUITE_END()

} // namespace tests
} // namespace vpsnetd
