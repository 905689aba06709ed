// reactc/transform/jsx_transformer.cpp - JSX to DOM helper calls
#include "reactc/transform/jsx_transformer.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <array>
#include <cctype>
#include <cstdlib>
#include <map>
#include <utility>
#include <vector>

#include "reactc/ast/ast_walk.hpp"

namespace reactc
{

// ============================================================================
// JSX Text
// ============================================================================

namespace
{

void append_utf8(std::string & out, unsigned long cp)
{
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp <= 0x10FFFF) {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

struct NamedEntity
{
  std::string_view name;
  unsigned long code_point;
};

constexpr std::array<NamedEntity, 20> k_entities = {{
  {"amp", 0x26},     {"lt", 0x3C},      {"gt", 0x3E},      {"quot", 0x22},
  {"apos", 0x27},    {"nbsp", 0xA0},    {"copy", 0xA9},    {"reg", 0xAE},
  {"trade", 0x2122}, {"hellip", 0x2026}, {"mdash", 0x2014}, {"ndash", 0x2013},
  {"lsquo", 0x2018}, {"rsquo", 0x2019}, {"ldquo", 0x201C}, {"rdquo", 0x201D},
  {"bull", 0x2022},  {"middot", 0xB7},  {"times", 0xD7},   {"euro", 0x20AC},
}};

/// Decode `&name;`, `&#123;` and `&#x1F;`; unknown references are kept.
std::string decode_entities(std::string_view text)
{
  std::string out;
  out.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    const size_t semi = text[i] == '&' ? text.find(';', i + 1) : std::string_view::npos;
    if (semi == std::string_view::npos || semi - i > 10) {
      out += text[i++];
      continue;
    }
    const std::string_view ref = text.substr(i + 1, semi - i - 1);
    bool decoded = false;
    if (ref.size() > 1 && ref[0] == '#') {
      const bool hex = ref[1] == 'x' || ref[1] == 'X';
      const std::string digits(ref.substr(hex ? 2 : 1));
      char * end = nullptr;
      const unsigned long cp = std::strtoul(digits.c_str(), &end, hex ? 16 : 10);
      if (!digits.empty() && end != nullptr && *end == '\0') {
        append_utf8(out, cp);
        decoded = true;
      }
    } else {
      for (const auto & e : k_entities) {
        if (e.name == ref) {
          append_utf8(out, e.code_point);
          decoded = true;
          break;
        }
      }
    }
    if (decoded) {
      i = semi + 1;
    } else {
      out += text[i++];
    }
  }
  return out;
}

/// A JSX string attribute as a JavaScript string literal.
std::string attribute_string(std::string_view raw)
{
  if (raw.find_first_of("\n\r\\&") == std::string_view::npos) {
    return std::string(raw);
  }
  const std::string_view inner = raw.size() >= 2 ? raw.substr(1, raw.size() - 2) : raw;
  return quote_js(decode_entities(inner));
}

}  // namespace

std::string clean_jsx_text(std::string_view raw)
{
  std::vector<std::string_view> lines;
  size_t pos = 0;
  while (true) {
    const size_t nl = raw.find_first_of("\r\n", pos);
    if (nl == std::string_view::npos) {
      lines.push_back(raw.substr(pos));
      break;
    }
    lines.push_back(raw.substr(pos, nl - pos));
    pos = nl + (raw[nl] == '\r' && nl + 1 < raw.size() && raw[nl + 1] == '\n' ? 2 : 1);
  }

  auto is_blank = [](char c) { return c == ' ' || c == '\t'; };
  size_t last_non_empty = 0;
  for (size_t i = 0; i < lines.size(); ++i) {
    for (char c : lines[i]) {
      if (!is_blank(c)) {
        last_non_empty = i;
        break;
      }
    }
  }

  std::string out;
  for (size_t i = 0; i < lines.size(); ++i) {
    std::string_view line = lines[i];
    if (i != 0) {
      while (!line.empty() && is_blank(line.front())) {
        line.remove_prefix(1);
      }
    }
    if (i + 1 != lines.size()) {
      while (!line.empty() && is_blank(line.back())) {
        line.remove_suffix(1);
      }
    }
    if (line.empty()) {
      continue;
    }
    std::string piece(line);
    for (char & c : piece) {
      if (c == '\t') {
        c = ' ';
      }
    }
    out += piece;
    if (i != last_non_empty) {
      out += ' ';
    }
  }
  return decode_entities(out);
}

// ============================================================================
// Code generation
// ============================================================================

namespace
{

bool is_jsx(const AstNode * node) { return isa<JsxElement>(node) || isa<JsxFragment>(node); }

/// Outermost JSX nodes under root (root itself when it is JSX).
std::vector<const Expr *> top_level_jsx(const AstNode * root)
{
  std::vector<const Expr *> out;
  walk_preorder(root, [&](const AstNode * node, const AstNode *) {
    if (is_jsx(node)) {
      out.push_back(cast<Expr>(node));
      return false;
    }
    return true;
  });
  return out;
}

/// `__el0` plus the statements that build it.
struct ElementBlock
{
  std::string var;
  std::vector<std::string> statements;

  [[nodiscard]] std::string finish() const
  {
    std::string out = "(() => {\n";
    for (const auto & s : statements) {
      out += fmt::format("  {};\n", s);
    }
    out += fmt::format("  return {};\n}})()", var);
    return out;
  }
};

/// `items.map((item, i) => <li key={item.id}/>)`
struct ListMatch
{
  const Expr * source = nullptr;
  const ArrowFunctionExpr * callback = nullptr;
  std::string_view item;
  std::string_view index;
  const JsxElement * element = nullptr;  ///< Returned element, for its key
};

const Expr * returned_jsx(const AstNode * body)
{
  if (const auto * expr = dyn_cast<Expr>(body)) {
    const Expr * inner = skip_parens(expr);
    return is_jsx(inner) ? inner : nullptr;
  }
  const auto * block = dyn_cast<BlockStmt>(body);
  if (block == nullptr) {
    return nullptr;
  }
  for (const Stmt * s : block->body) {
    if (const auto * ret = dyn_cast<ReturnStmt>(s)) {
      return ret->argument != nullptr ? returned_jsx(ret->argument) : nullptr;
    }
  }
  return nullptr;
}

bool match_list(const Expr * expr, ListMatch & out)
{
  const auto * call = dyn_cast<CallExpr>(expr);
  if (call == nullptr || call->optional || call->args.empty()) {
    return false;
  }
  const auto * member = dyn_cast<MemberExpr>(call->callee);
  if (member == nullptr || member->optional || member->property != "map") {
    return false;
  }
  const auto * arrow = dyn_cast<ArrowFunctionExpr>(skip_parens(call->args[0]));
  if (arrow == nullptr || arrow->fn.params.empty()) {
    return false;
  }
  const auto * item = dyn_cast<BindingIdent>(arrow->fn.params[0]);
  const Expr * jsx = returned_jsx(arrow->fn.body);
  if (item == nullptr || jsx == nullptr) {
    return false;
  }

  out.source = member->object;
  out.callback = arrow;
  out.item = item->name;
  if (arrow->fn.params.size() > 1) {
    if (const auto * index = dyn_cast<BindingIdent>(arrow->fn.params[1])) {
      out.index = index->name;
    }
  }
  out.element = dyn_cast<JsxElement>(jsx);
  return true;
}

const JsxAttribute * find_attribute(const JsxElement & element, std::string_view name)
{
  for (const AstNode * a : element.attributes) {
    const auto * attr = dyn_cast<JsxAttribute>(a);
    if (attr != nullptr && attr->name == name) {
      return attr;
    }
  }
  return nullptr;
}

/// onClick -> click
bool event_name(std::string_view attr, std::string & out)
{
  if (attr.size() <= 2 || attr.substr(0, 2) != "on") {
    return false;
  }
  out = std::string(attr.substr(2));
  out[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(out[0])));
  return true;
}

class JsxCodeGen
{
public:
  JsxCodeGen(
    const EditBuffer & buffer, const std::vector<JsxExpressionInfo> & expressions,
    HelperUsage & helpers)
  : buffer_(buffer), helpers_(helpers)
  {
    for (const auto & info : expressions) {
      reactive_.emplace(info.range.start, info.reactive);
    }
  }

  /// Current text of `node` with every JSX tree inside it compiled.
  std::string render(const AstNode * node)
  {
    if (is_jsx(node)) {
      return generate(cast<Expr>(node));
    }
    std::string out;
    uint32_t pos = node->start();
    for (const Expr * jsx : top_level_jsx(node)) {
      out += buffer_.slice(pos, jsx->start());
      out += generate(jsx);
      pos = jsx->end();
    }
    out += buffer_.slice(pos, node->end());
    return out;
  }

  std::string generate(const Expr * node)
  {
    if (const auto * fragment = dyn_cast<JsxFragment>(node)) {
      ElementBlock block{next_var(), {}};
      block.statements.push_back(
        fmt::format("const {} = document.createDocumentFragment()", block.var));
      for (const AstNode * child : fragment->children) {
        append_child(block, child);
      }
      return block.finish();
    }
    const auto * element = cast<JsxElement>(node);
    return element->is_component() ? component(*element) : intrinsic(*element);
  }

private:
  std::string next_var() { return fmt::format("__el{}", next_id_++); }

  std::string_view use(std::string_view helper)
  {
    helpers_.internals.emplace(helper);
    return helper;
  }

  bool is_reactive(const JsxExpressionContainer & container) const
  {
    auto it = reactive_.find(container.start());
    return it != reactive_.end() && it->second;
  }

  /// `() => expr`, parenthesizing object literals.
  std::string thunk(const Expr * expr)
  {
    const std::string text = render(expr);
    return isa<ObjectLiteralExpr>(expr) ? fmt::format("() => ({})", text)
                                        : fmt::format("() => {}", text);
  }

  // --------------------------------------------------------------------------
  // Intrinsic elements
  // --------------------------------------------------------------------------

  std::string intrinsic(const JsxElement & element)
  {
    ElementBlock block{next_var(), {}};
    block.statements.push_back(
      fmt::format("const {} = {}({})", block.var, use("__element"), quote_js(element.tag)));
    for (const AstNode * attr : element.attributes) {
      add_attribute(block, attr);
    }
    for (const AstNode * child : element.children) {
      append_child(block, child);
    }
    return block.finish();
  }

  void add_attribute(ElementBlock & block, const AstNode * node)
  {
    if (const auto * spread = dyn_cast<JsxSpreadAttribute>(node)) {
      block.statements.push_back(fmt::format(
        "for (const [__k, __v] of Object.entries({})) {}.setAttribute(__k, __v)",
        render(spread->argument), block.var));
      return;
    }
    const auto * attr = cast<JsxAttribute>(node);
    if (attr->name == "key") {
      return;
    }
    const std::string name = quote_js(attr->name);

    if (attr->value == nullptr) {
      block.statements.push_back(fmt::format("{}.setAttribute({}, \"\")", block.var, name));
      return;
    }
    if (const auto * literal = dyn_cast<LiteralExpr>(attr->value)) {
      block.statements.push_back(
        fmt::format("{}.setAttribute({}, {})", block.var, name, attribute_string(literal->raw)));
      return;
    }
    if (is_jsx(attr->value)) {
      block.statements.push_back(
        fmt::format("{}.setAttribute({}, {})", block.var, name, render(attr->value)));
      return;
    }
    const auto * container = dyn_cast<JsxExpressionContainer>(attr->value);
    if (container == nullptr || container->expression == nullptr) {
      return;
    }

    const std::string text = render(container->expression);
    std::string event;
    if (event_name(attr->name, event)) {
      block.statements.push_back(
        fmt::format("{}({}, {}, {})", use("__on"), block.var, quote_js(event), text));
    } else if (is_reactive(*container)) {
      block.statements.push_back(
        fmt::format("{}({}, {}, () => {})", use("__attr"), block.var, name, text));
    } else {
      block.statements.push_back(fmt::format("{}.setAttribute({}, {})", block.var, name, text));
    }
  }

  void append_child(ElementBlock & block, const AstNode * child)
  {
    if (const auto * text = dyn_cast<JsxText>(child)) {
      const std::string cleaned = clean_jsx_text(text->raw);
      if (!cleaned.empty()) {
        block.statements.push_back(fmt::format(
          "{}({}, {}({}))", use("__append"), block.var, use("__staticText"), quote_js(cleaned)));
      }
      return;
    }
    if (is_jsx(child)) {
      block.statements.push_back(
        fmt::format("{}({}, {})", use("__append"), block.var, generate(cast<Expr>(child))));
      return;
    }
    const auto * container = dyn_cast<JsxExpressionContainer>(child);
    if (container == nullptr || container->expression == nullptr) {
      return;
    }
    const Expr * expr = container->expression;

    if (!is_reactive(*container)) {
      block.statements.push_back(
        fmt::format("{}({}, {})", use("__insert"), block.var, render(expr)));
      return;
    }

    const Expr * inner = skip_parens(expr);
    if (const auto * cond = dyn_cast<ConditionalExpr>(inner)) {
      block.statements.push_back(fmt::format(
        "{}({}, {}({}, {}, {}))", use("__append"), block.var, use("__conditional"),
        thunk(cond->test), thunk(cond->consequent), thunk(cond->alternate)));
      return;
    }
    if (const auto * logical = dyn_cast<BinaryExpr>(inner)) {
      if (logical->op == BinaryOp::LogicalAnd) {
        block.statements.push_back(fmt::format(
          "{}({}, {}({}, {}, () => null))", use("__append"), block.var, use("__conditional"),
          thunk(logical->lhs), thunk(logical->rhs)));
        return;
      }
    }
    ListMatch list;
    if (match_list(inner, list)) {
      block.statements.push_back(fmt::format(
        "{}({}, () => {}, {}, {})", use("__list"), block.var, render(list.source),
        key_function(list), render_function(list)));
      return;
    }
    block.statements.push_back(fmt::format(
      "{}({}, {}({}))", use("__append"), block.var, use("__child"), thunk(expr)));
  }

  std::string key_function(const ListMatch & list)
  {
    const JsxAttribute * key =
      list.element != nullptr ? find_attribute(*list.element, "key") : nullptr;
    if (key != nullptr) {
      if (const auto * literal = dyn_cast<LiteralExpr>(key->value)) {
        return fmt::format("({}) => {}", list.item, attribute_string(literal->raw));
      }
      const auto * container = dyn_cast<JsxExpressionContainer>(key->value);
      if (container != nullptr && container->expression != nullptr) {
        return fmt::format("({}) => {}", list.item, render(container->expression));
      }
    }
    if (!list.index.empty()) {
      return fmt::format("(_item, {0}) => {0}", list.index);
    }
    return "(_item, __i) => __i";
  }

  std::string render_function(const ListMatch & list)
  {
    const std::string params = list.index.empty()
                                 ? fmt::format("({})", list.item)
                                 : fmt::format("({}, {})", list.item, list.index);
    return fmt::format("{} => {}", params, render(list.callback->fn.body));
  }

  // --------------------------------------------------------------------------
  // Components
  // --------------------------------------------------------------------------

  std::string component(const JsxElement & element)
  {
    std::vector<std::string> props;
    bool explicit_children = false;
    for (const AstNode * node : element.attributes) {
      if (const auto * spread = dyn_cast<JsxSpreadAttribute>(node)) {
        props.push_back(fmt::format("...{}", render(spread->argument)));
        continue;
      }
      const auto * attr = cast<JsxAttribute>(node);
      if (attr->name == "key") {
        continue;
      }
      explicit_children = explicit_children || attr->name == "children";
      const std::string key = property_key(attr->name);

      if (attr->value == nullptr) {
        props.push_back(fmt::format("{}: true", key));
      } else if (const auto * literal = dyn_cast<LiteralExpr>(attr->value)) {
        props.push_back(fmt::format("{}: {}", key, attribute_string(literal->raw)));
      } else if (is_jsx(attr->value)) {
        props.push_back(fmt::format("{}: {}", key, render(attr->value)));
      } else if (const auto * container = dyn_cast<JsxExpressionContainer>(attr->value)) {
        if (container->expression == nullptr) {
          continue;
        }
        const std::string text = render(container->expression);
        if (is_reactive(*container)) {
          props.push_back(fmt::format("get {}() {{ return {}; }}", key, text));
        } else {
          props.push_back(fmt::format("{}: {}", key, text));
        }
      }
    }

    if (!explicit_children) {
      std::vector<std::string> children;
      for (const AstNode * child : element.children) {
        if (const auto * text = dyn_cast<JsxText>(child)) {
          const std::string cleaned = clean_jsx_text(text->raw);
          if (!cleaned.empty()) {
            children.push_back(quote_js(cleaned));
          }
        } else if (const auto * container = dyn_cast<JsxExpressionContainer>(child)) {
          if (container->expression != nullptr) {
            children.push_back(render(container->expression));
          }
        } else {
          children.push_back(render(child));
        }
      }
      if (children.size() == 1) {
        props.push_back(fmt::format("children: () => {}", children.front()));
      } else if (children.size() > 1) {
        props.push_back(fmt::format("children: () => [{}]", fmt::join(children, ", ")));
      }
    }

    if (props.empty()) {
      return fmt::format("{}({{}})", element.tag);
    }
    return fmt::format("{}({{ {} }})", element.tag, fmt::join(props, ", "));
  }

  const EditBuffer & buffer_;
  HelperUsage & helpers_;
  std::map<uint32_t, bool> reactive_;  ///< Container start -> reactive
  unsigned next_id_ = 0;
};

}  // namespace

void JsxTransformer::transform(
  EditBuffer & buffer, const ComponentInfo & component,
  const std::vector<JsxExpressionInfo> & expressions, HelperUsage & helpers) const
{
  const AstNode * body = component.body_node();
  if (body == nullptr) {
    return;
  }

  JsxCodeGen codegen(buffer, expressions, helpers);
  // Generate everything before editing: generation reads the buffer back.
  std::vector<std::pair<SourceRange, std::string>> replacements;
  for (const Expr * jsx : top_level_jsx(body)) {
    replacements.emplace_back(jsx->get_range(), codegen.generate(jsx));
  }
  for (const auto & [range, code] : replacements) {
    buffer.replace(range, code);
  }
}

}  // namespace reactc
