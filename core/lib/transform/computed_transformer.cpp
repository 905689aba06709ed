// reactc/transform/computed_transformer.cpp - Wraps derived bindings in computed()
#include "reactc/transform/computed_transformer.hpp"

#include <fmt/format.h>

#include <string>

#include "reactc/analysis/variable_classifier.hpp"

namespace reactc
{

namespace
{

std::string member_access(std::string_view object, const PatternBinding & b)
{
  return b.index_access ? fmt::format("{}[{}]", object, b.property)
                        : fmt::format("{}.{}", object, b.property);
}

std::string join_declarations(const std::vector<std::string> & lines, std::string_view indent)
{
  std::string text;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i != 0) {
      text += fmt::format(";\n{}", indent);
    }
    text += lines[i];
  }
  text += ';';
  return text;
}

class ComputedRewriter
{
public:
  ComputedRewriter(
    EditBuffer & buffer, const std::vector<VariableInfo> & variables, HelperUsage & helpers)
  : buffer_(buffer), variables_(variables), helpers_(helpers)
  {
  }

  void rewrite_statement(const VarStmt & stmt)
  {
    for (const VarDeclarator * decl : stmt.declarators) {
      if (decl->init == nullptr) {
        continue;
      }
      if (const auto * target = dyn_cast<BindingIdent>(decl->target)) {
        wrap_initializer(*target, *decl->init);
      } else if (is_expandable_declaration(stmt, *decl)) {
        expand(stmt, *decl);
      }
    }
  }

private:
  void wrap_initializer(const BindingIdent & target, const Expr & init)
  {
    const VariableInfo * v = find_variable(variables_, target.name);
    if (v == nullptr || v->kind != ReactivityKind::Computed) {
      return;
    }
    // An object literal body would parse as a block.
    const bool object_body = isa<ObjectLiteralExpr>(&init);
    buffer_.append_left(init.start(), object_body ? "computed(() => (" : "computed(() => ");
    buffer_.append_right(init.end(), object_body ? "))" : ")");
    helpers_.runtime.insert("computed");
  }

  void expand(const VarStmt & stmt, const VarDeclarator & decl)
  {
    const auto bindings = expandable_bindings(decl.target);
    const VariableInfo * first = find_variable(variables_, bindings.front().name);
    if (first == nullptr) {
      return;
    }

    const VariableInfo * source =
      first->destructured_from ? find_variable(variables_, *first->destructured_from) : nullptr;
    const std::string init_text = buffer_.slice(decl.init->get_range());
    const std::string indent(line_indent(buffer_.original(), stmt.start()));
    std::vector<std::string> lines;

    if (source != nullptr && source->is_synthetic) {
      // Signal-API result: capture once, then read each property from the capture.
      lines.push_back(fmt::format("const {} = {}", source->name, init_text));
      for (const auto & b : bindings) {
        const std::string access = member_access(source->name, b);
        if (!b.index_access && source->signal_properties.count(b.property) != 0) {
          lines.push_back(fmt::format("const {} = computed(() => {}.value)", b.name, access));
          helpers_.runtime.insert("computed");
        } else {
          lines.push_back(fmt::format("const {} = {}", b.name, access));
        }
      }
    } else {
      bool any_computed = false;
      for (const auto & b : bindings) {
        const VariableInfo * v = find_variable(variables_, b.name);
        any_computed = any_computed || (v != nullptr && v->kind == ReactivityKind::Computed);
      }
      if (!any_computed) {
        return;
      }
      const std::string object =
        needs_parens_for_member(decl.init) ? fmt::format("({})", init_text) : init_text;
      for (const auto & b : bindings) {
        const VariableInfo * v = find_variable(variables_, b.name);
        if (v != nullptr && v->kind == ReactivityKind::Computed) {
          lines.push_back(
            fmt::format("const {} = computed(() => {})", b.name, member_access(object, b)));
          helpers_.runtime.insert("computed");
        } else {
          lines.push_back(fmt::format("const {} = {}", b.name, member_access(object, b)));
        }
      }
    }
    buffer_.overwrite(stmt.get_range(), join_declarations(lines, indent));
  }

  EditBuffer & buffer_;
  const std::vector<VariableInfo> & variables_;
  HelperUsage & helpers_;
};

}  // namespace

void ComputedTransformer::transform(
  EditBuffer & buffer, const ComponentInfo & component,
  const std::vector<VariableInfo> & variables, HelperUsage & helpers) const
{
  const BlockStmt * body = component.block_body();
  if (body == nullptr) {
    return;
  }

  rewrite_reads(buffer, body, names_of_kind(variables, ReactivityKind::Computed));

  ComputedRewriter rewriter(buffer, variables, helpers);
  for (const Stmt * s : body->body) {
    const auto * stmt = dyn_cast<VarStmt>(s);
    if (stmt != nullptr && stmt->var_kind == VarKind::Const) {
      rewriter.rewrite_statement(*stmt);
    }
  }
}

}  // namespace reactc
