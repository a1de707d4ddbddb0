#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace vpsnetd {
class TemplateError : public std::runtime_error {
private:
  std::string _template_name;
  size_t _line;

public:
  TemplateError(const std::string &template_name, size_t line,
                const std::string &message);
  const std::string &template_name() const { return _template_name; }
  size_t line() const { return _line; }
};

// Value tree a template is rendered against. Maps keep insertion order.
class TemplateValue {
public:
  enum struct Kind : uint8_t { BOOLEAN, INTEGER, STRING, LIST, MAP };

private:
  Kind _kind;
  bool _boolean;
  int64_t _integer;
  std::string _string;
  std::vector<TemplateValue> _items;
  std::vector<std::string> _keys;

  explicit TemplateValue(Kind kind);

public:
  TemplateValue(const std::string &value);
  TemplateValue(const char *value);

  static TemplateValue boolean(bool value);
  static TemplateValue integer(int64_t value);
  static TemplateValue list();
  static TemplateValue map();

  Kind kind() const { return _kind; }
  bool is_scalar() const;

  void push_back(const TemplateValue &item);
  void set(const std::string &key, const TemplateValue &value);
  // nullptr if this is not a map or the key is missing
  const TemplateValue *find(const std::string &key) const;
  // nullptr if this is not a list or the index is out of range
  const TemplateValue *at(size_t index) const;
  const std::vector<TemplateValue> &items() const { return _items; }
  size_t size() const { return _items.size(); }

  bool truthy() const;
  std::string to_string() const;
};

// A parsed template. Supported syntax:
//   {{ path }}                       interpolation of a scalar
//   {% for item in path %}…{% endfor %}
//   {% if [not] path %}…{% elif [not] path %}…{% else %}…{% endif %}
//   {# comment #}
// Paths are dotted lookups (interface.vps.v4_addr, list.0). Inside a loop
// loop.index, loop.index0, loop.first, loop.last and loop.length are defined.
// A '-' next to a delimiter ({%- -%} {{- -}} {#- -#}) strips the whitespace
// on that side.
class Template {
public:
  enum struct NodeKind : uint8_t { TEXT, OUTPUT, FOR, IF };

  struct Expression {
    bool negated;
    std::vector<std::string> path;
  };

  struct Node {
    NodeKind kind;
    size_t line;
    std::string text;
    Expression expression;
    std::string loop_variable;
    std::vector<Node> body;
    std::vector<Node> else_body;
  };

private:
  std::string _name;
  std::vector<Node> _nodes;

  Template(const std::string &name, std::vector<Node> nodes);

public:
  // Both throw TemplateError on syntax errors.
  static Template from_string(const std::string &name,
                              const std::string &source);
  static Template from_file(const std::string &path);

  const std::string &name() const { return _name; }
  // Throws TemplateError for undefined variables, iterating a value that is
  // not a list and interpolating a list or map.
  std::string render(const TemplateValue &context) const;
};
} // namespace vpsnetd
