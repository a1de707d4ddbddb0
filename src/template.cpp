#include "template.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "log/logger.hpp"
#include "string-format.hpp"

namespace vpsnetd {
TemplateError::TemplateError(const std::string &template_name, size_t line,
                             const std::string &message)
    : std::runtime_error(
          string_format("%s:%zu: %s", template_name.c_str(), line,
                        message.c_str())),
      _template_name(template_name), _line(line) {}

TemplateValue::TemplateValue(Kind kind)
    : _kind(kind), _boolean(false), _integer(0), _string(), _items(),
      _keys() {}

TemplateValue::TemplateValue(const std::string &value)
    : TemplateValue(Kind::STRING) {
  _string = value;
}

TemplateValue::TemplateValue(const char *value)
    : TemplateValue(std::string(value)) {}

TemplateValue TemplateValue::boolean(bool value) {
  TemplateValue result(Kind::BOOLEAN);
  result._boolean = value;
  return result;
}

TemplateValue TemplateValue::integer(int64_t value) {
  TemplateValue result(Kind::INTEGER);
  result._integer = value;
  return result;
}

TemplateValue TemplateValue::list() { return TemplateValue(Kind::LIST); }

TemplateValue TemplateValue::map() { return TemplateValue(Kind::MAP); }

bool TemplateValue::is_scalar() const {
  return _kind != Kind::LIST && _kind != Kind::MAP;
}

void TemplateValue::push_back(const TemplateValue &item) {
  if (_kind != Kind::LIST) {
    throw std::logic_error("push_back on a template value that is no list");
  }
  _items.push_back(item);
}

void TemplateValue::set(const std::string &key, const TemplateValue &value) {
  if (_kind != Kind::MAP) {
    throw std::logic_error("set on a template value that is no map");
  }
  auto existing = std::find(_keys.begin(), _keys.end(), key);
  if (existing != _keys.end()) {
    _items[existing - _keys.begin()] = value;
    return;
  }
  _keys.push_back(key);
  _items.push_back(value);
}

const TemplateValue *TemplateValue::find(const std::string &key) const {
  if (_kind != Kind::MAP) {
    return nullptr;
  }
  auto existing = std::find(_keys.begin(), _keys.end(), key);
  if (existing == _keys.end()) {
    return nullptr;
  }
  return &_items[existing - _keys.begin()];
}

const TemplateValue *TemplateValue::at(size_t index) const {
  if (_kind != Kind::LIST || index >= _items.size()) {
    return nullptr;
  }
  return &_items[index];
}

bool TemplateValue::truthy() const {
  switch (_kind) {
  case Kind::BOOLEAN:
    return _boolean;
  case Kind::INTEGER:
    return _integer != 0;
  case Kind::STRING:
    return !_string.empty();
  case Kind::LIST:
  case Kind::MAP:
  default:
    return !_items.empty();
  }
}

std::string TemplateValue::to_string() const {
  switch (_kind) {
  case Kind::BOOLEAN:
    return _boolean ? "true" : "false";
  case Kind::INTEGER:
    return std::to_string(_integer);
  case Kind::STRING:
    return _string;
  default:
    throw std::logic_error("Only scalar template values can be printed");
  }
}

namespace {
enum struct TokenType : uint8_t { TEXT, OUTPUT, TAG };

struct Token {
  TokenType type;
  std::string content;
  size_t line;
};

const std::string WHITESPACE = " \t\r\n";

void trim_left(std::string &text) {
  text.erase(0, std::min(text.find_first_not_of(WHITESPACE), text.size()));
}

void trim_right(std::string &text) {
  size_t last = text.find_last_not_of(WHITESPACE);
  text.erase(last == std::string::npos ? 0 : last + 1);
}

std::string trimmed(std::string text) {
  trim_left(text);
  trim_right(text);
  return text;
}

size_t count_lines(const std::string &text, size_t from, size_t to) {
  return std::count(text.begin() + from, text.begin() + to, '\n');
}

size_t find_delimiter(const std::string &source, size_t from) {
  for (size_t i = source.find('{', from); i != std::string::npos;
       i = source.find('{', i + 1)) {
    if (i + 1 < source.size() &&
        (source[i + 1] == '{' || source[i + 1] == '%' || source[i + 1] == '#')) {
      return i;
    }
  }
  return std::string::npos;
}

std::vector<Token> tokenize(const std::string &name, const std::string &source) {
  std::vector<Token> tokens;
  size_t pos = 0;
  size_t line = 1;
  bool trim_next_text = false;

  while (pos < source.size()) {
    size_t open = find_delimiter(source, pos);
    size_t text_end = open == std::string::npos ? source.size() : open;

    std::string text = source.substr(pos, text_end - pos);
    if (trim_next_text) {
      trim_left(text);
      trim_next_text = false;
    }
    size_t text_line = line;
    line += count_lines(source, pos, text_end);
    if (open == std::string::npos) {
      if (!text.empty()) {
        tokens.push_back({TokenType::TEXT, text, text_line});
      }
      break;
    }

    char kind = source[open + 1];
    std::string closing = kind == '{' ? "}}" : (kind == '%' ? "%}" : "#}");
    size_t inner_start = open + 2;
    if (inner_start < source.size() && source[inner_start] == '-') {
      trim_right(text);
      inner_start++;
    }
    if (!text.empty()) {
      tokens.push_back({TokenType::TEXT, text, text_line});
    }

    size_t close = source.find(closing, inner_start);
    if (close == std::string::npos) {
      throw TemplateError(name, line,
                          string_format("Missing closing '%s'", closing.c_str()));
    }
    size_t inner_end = close;
    if (inner_end > inner_start && source[inner_end - 1] == '-') {
      trim_next_text = true;
      inner_end--;
    }

    std::string content = source.substr(inner_start, inner_end - inner_start);
    if (kind == '{') {
      tokens.push_back({TokenType::OUTPUT, trimmed(content), line});
    } else if (kind == '%') {
      tokens.push_back({TokenType::TAG, trimmed(content), line});
    }
    line += count_lines(source, open, close);
    pos = close + closing.size();
  }
  return tokens;
}

std::vector<std::string> split_words(const std::string &text) {
  std::istringstream is(text);
  std::vector<std::string> words;
  std::string word;
  while (is >> word) {
    words.push_back(word);
  }
  return words;
}

bool is_identifier(const std::string &segment) {
  return !segment.empty() &&
         std::all_of(segment.begin(), segment.end(), [](unsigned char c) {
           return std::isalnum(c) || c == '_';
         });
}

std::string join_path(const std::vector<std::string> &path) {
  std::string joined;
  for (const std::string &segment : path) {
    if (!joined.empty()) {
      joined += ".";
    }
    joined += segment;
  }
  return joined;
}

class Parser {
private:
  const std::string &name;
  const std::vector<Token> &tokens;
  size_t pos;

  Template::Expression parse_expression(const std::vector<std::string> &words,
                                        size_t first, size_t line) {
    Template::Expression expression{.negated = false, .path = {}};
    size_t i = first;
    while (i < words.size() && words[i] == "not") {
      expression.negated = !expression.negated;
      i++;
    }
    if (i + 1 != words.size()) {
      throw TemplateError(name, line, "Expected exactly one variable");
    }

    std::string segment;
    std::istringstream is(words[i]);
    while (std::getline(is, segment, '.')) {
      if (!is_identifier(segment)) {
        throw TemplateError(name, line,
                            string_format("Invalid variable name '%s'",
                                          words[i].c_str()));
      }
      expression.path.push_back(segment);
    }
    if (expression.path.empty() || words[i].back() == '.') {
      throw TemplateError(name, line,
                          string_format("Invalid variable name '%s'",
                                        words[i].c_str()));
    }
    return expression;
  }

  Template::Node parse_if(const std::vector<std::string> &words, size_t first,
                          size_t line) {
    Template::Node node{.kind = Template::NodeKind::IF,
                        .line = line,
                        .text = "",
                        .expression = parse_expression(words, first, line),
                        .loop_variable = "",
                        .body = {},
                        .else_body = {}};

    const Token *terminator = nullptr;
    node.body = parse_block(terminator, {"elif", "else", "endif"});
    if (terminator == nullptr) {
      throw TemplateError(
          name, line,
          "Missing {% endif %} for the if opened here");
    }

    std::vector<std::string> terminator_words = split_words(terminator->content);
    if (terminator_words[0] == "elif") {
      node.else_body.push_back(parse_if(terminator_words, 1, terminator->line));
    } else if (terminator_words[0] == "else") {
      if (terminator_words.size() != 1) {
        throw TemplateError(name, terminator->line,
                            "{% else %} takes no arguments");
      }
      node.else_body = parse_block(terminator, {"endif"});
      if (terminator == nullptr) {
        throw TemplateError(
            name, line,
            "Missing {% endif %} for the if opened here");
      }
    }
    return node;
  }

  Template::Node parse_for(const std::vector<std::string> &words,
                           size_t line) {
    if (words.size() != 4 || words[2] != "in" || !is_identifier(words[1])) {
      throw TemplateError(name, line,
                          "Expected {% for <variable> in <expression> %}");
    }
    Template::Node node{.kind = Template::NodeKind::FOR,
                        .line = line,
                        .text = "",
                        .expression = parse_expression(words, 3, line),
                        .loop_variable = words[1],
                        .body = {},
                        .else_body = {}};
    if (node.expression.negated) {
      throw TemplateError(name, line, "Cannot loop over a negation");
    }

    const Token *terminator = nullptr;
    node.body = parse_block(terminator, {"endfor"});
    if (terminator == nullptr) {
      throw TemplateError(
          name, line,
          "Missing {% endfor %} for the loop opened here");
    }
    return node;
  }

public:
  Parser(const std::string &name, const std::vector<Token> &tokens)
      : name(name), tokens(tokens), pos(0) {}

  // Parses until one of the terminator tags, which is consumed and returned.
  // The terminator is nullptr when the input ended first.
  std::vector<Template::Node>
  parse_block(const Token *&terminator,
              const std::vector<std::string> &terminators) {
    std::vector<Template::Node> nodes;
    terminator = nullptr;

    while (pos < tokens.size()) {
      const Token &token = tokens[pos++];
      switch (token.type) {
      case TokenType::TEXT:
        nodes.push_back({.kind = Template::NodeKind::TEXT,
                         .line = token.line,
                         .text = token.content,
                         .expression = {},
                         .loop_variable = "",
                         .body = {},
                         .else_body = {}});
        break;

      case TokenType::OUTPUT: {
        Template::Expression expression =
            parse_expression(split_words(token.content), 0, token.line);
        if (expression.negated) {
          throw TemplateError(name, token.line,
                              "'not' can only be used in conditions");
        }
        nodes.push_back({.kind = Template::NodeKind::OUTPUT,
                         .line = token.line,
                         .text = "",
                         .expression = expression,
                         .loop_variable = "",
                         .body = {},
                         .else_body = {}});
        break;
      }

      case TokenType::TAG: {
        std::vector<std::string> words = split_words(token.content);
        if (words.empty()) {
          throw TemplateError(name, token.line, "Empty tag");
        }
        const std::string &keyword = words[0];
        if (std::find(terminators.begin(), terminators.end(), keyword) !=
            terminators.end()) {
          if ((keyword == "endif" || keyword == "endfor") &&
              words.size() != 1) {
            throw TemplateError(
                name, token.line,
                string_format("{%% %s %%} takes no arguments",
                              keyword.c_str()));
          }
          terminator = &token;
          return nodes;
        }

        if (keyword == "for") {
          nodes.push_back(parse_for(words, token.line));
        } else if (keyword == "if") {
          nodes.push_back(parse_if(words, 1, token.line));
        } else if (keyword == "endfor" || keyword == "endif" ||
                   keyword == "else" || keyword == "elif") {
          throw TemplateError(
              name, token.line,
              string_format("Unexpected {%% %s %%}", keyword.c_str()));
        } else {
          throw TemplateError(
              name, token.line,
              string_format("Unknown tag '%s'", keyword.c_str()));
        }
        break;
      }
      }
    }
    return nodes;
  }
};

class Renderer {
private:
  struct Scope {
    std::string name;
    const TemplateValue *value;
  };

  const std::string &name;
  const TemplateValue &context;
  std::vector<Scope> scopes;
  std::string output;

  const TemplateValue *resolve(const Template::Expression &expression,
                               size_t line, bool required) const {
    const std::string &root = expression.path.front();
    const TemplateValue *value = nullptr;
    for (auto scope = scopes.rbegin(); scope != scopes.rend(); ++scope) {
      if (scope->name == root) {
        value = scope->value;
        break;
      }
    }
    if (value == nullptr) {
      value = context.find(root);
    }

    for (size_t i = 1; i < expression.path.size() && value != nullptr; i++) {
      const std::string &segment = expression.path[i];
      if (value->kind() == TemplateValue::Kind::LIST &&
          std::all_of(segment.begin(), segment.end(),
                      [](unsigned char c) { return std::isdigit(c); })) {
        size_t index = 0;
        const auto [end, error] = std::from_chars(
            segment.data(), segment.data() + segment.size(), index);
        value = error == std::errc() ? value->at(index) : nullptr;
      } else {
        value = value->find(segment);
      }
    }

    if (value == nullptr && required) {
      throw TemplateError(name, line,
                          string_format("Variable '%s' is not defined",
                                        join_path(expression.path).c_str()));
    }
    return value;
  }

  void render_for(const Template::Node &node) {
    const TemplateValue *list = resolve(node.expression, node.line, true);
    if (list->kind() != TemplateValue::Kind::LIST) {
      throw TemplateError(name, node.line,
                          string_format("'%s' is not a list",
                                        join_path(node.expression.path).c_str()));
    }

    const size_t length = list->size();
    for (size_t i = 0; i < length; i++) {
      TemplateValue loop = TemplateValue::map();
      loop.set("index", TemplateValue::integer(i + 1));
      loop.set("index0", TemplateValue::integer(i));
      loop.set("first", TemplateValue::boolean(i == 0));
      loop.set("last", TemplateValue::boolean(i + 1 == length));
      loop.set("length", TemplateValue::integer(length));

      scopes.push_back({node.loop_variable, list->at(i)});
      scopes.push_back({"loop", &loop});
      render(node.body);
      scopes.pop_back();
      scopes.pop_back();
    }
  }

public:
  Renderer(const std::string &name, const TemplateValue &context)
      : name(name), context(context), scopes(), output() {}

  void render(const std::vector<Template::Node> &nodes) {
    for (const Template::Node &node : nodes) {
      switch (node.kind) {
      case Template::NodeKind::TEXT:
        output += node.text;
        break;

      case Template::NodeKind::OUTPUT: {
        const TemplateValue *value = resolve(node.expression, node.line, true);
        if (!value->is_scalar()) {
          throw TemplateError(
              name, node.line,
              string_format("'%s' is not a scalar and cannot be printed",
                            join_path(node.expression.path).c_str()));
        }
        output += value->to_string();
        break;
      }

      case Template::NodeKind::FOR:
        render_for(node);
        break;

      case Template::NodeKind::IF: {
        // undefined variables are false in conditions
        const TemplateValue *value =
            resolve(node.expression, node.line, false);
        bool condition = value != nullptr && value->truthy();
        if (node.expression.negated) {
          condition = !condition;
        }
        render(condition ? node.body : node.else_body);
        break;
      }
      }
    }
  }

  std::string result() { return std::move(output); }
};
} // namespace

Template::Template(const std::string &name, std::vector<Node> nodes)
    : _name(name), _nodes(std::move(nodes)) {}

Template Template::from_string(const std::string &name,
                               const std::string &source) {
  std::vector<Token> tokens = tokenize(name, source);
  Parser parser(name, tokens);
  const Token *terminator = nullptr;
  std::vector<Node> nodes = parser.parse_block(terminator, {});
  LOG_TRACE(string_format("Parsed template %s into %zu nodes", name.c_str(),
                          nodes.size()));
  return Template(name, std::move(nodes));
}

Template Template::from_file(const std::string &path) {
  const std::string name = std::filesystem::path(path).filename().string();
  std::ifstream template_file(path);
  if (!template_file.is_open()) {
    throw TemplateError(name, 0,
                        string_format("Unable to open %s", path.c_str()));
  }
  std::ostringstream source;
  source << template_file.rdbuf();
  LOG_DEBUG(string_format("Loaded template %s", path.c_str()));
  return from_string(name, source.str());
}

std::string Template::render(const TemplateValue &context) const {
  Renderer renderer(_name, context);
  renderer.render(_nodes);
  return renderer.result();
}
} // namespace vpsnetd
