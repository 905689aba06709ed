// reactc/transform/signal_transformer.cpp - Rewrites signal declarations and reads
#include "reactc/transform/signal_transformer.hpp"

#include <fmt/format.h>

#include <set>
#include <string>

#include "reactc/analysis/scope.hpp"
#include "reactc/analysis/variable_classifier.hpp"

namespace reactc
{

namespace
{

const VariableInfo * api_variable(
  const std::vector<VariableInfo> & variables, const Expr * object, const ScopeWalker & scopes)
{
  const auto * id = dyn_cast<Identifier>(object);
  if (id == nullptr || scopes.is_shadowed(id->name)) {
    return nullptr;
  }
  const VariableInfo * v = find_variable(variables, id->name);
  return v != nullptr && !v->is_synthetic && v->has_api_properties() ? v : nullptr;
}

/// `tasks.loading` or `form.title.error`.
bool is_api_signal_read(
  const MemberExpr * member, const std::vector<VariableInfo> & variables,
  const ScopeWalker & scopes)
{
  if (const VariableInfo * v = api_variable(variables, member->object, scopes)) {
    return v->signal_properties.count(member->property) != 0;
  }
  const auto * inner = dyn_cast<MemberExpr>(member->object);
  if (inner == nullptr) {
    return false;
  }
  const VariableInfo * v = api_variable(variables, inner->object, scopes);
  return v != nullptr && v->field_signal_properties.count(member->property) != 0 &&
         v->signal_properties.count(inner->property) == 0 &&
         v->plain_properties.count(inner->property) == 0;
}

void rewrite_api_reads(
  EditBuffer & buffer, const AstNode * body, const std::vector<VariableInfo> & variables)
{
  bool any = false;
  for (const auto & v : variables) {
    any = any || (!v.is_synthetic && v.has_api_properties());
  }
  if (!any) {
    return;
  }

  ScopeWalker walker([&](const AstNode * node, const AstNode * parent, const ScopeWalker & scopes) {
    const auto * member = dyn_cast<MemberExpr>(node);
    if (member == nullptr || !is_api_signal_read(member, variables, scopes)) {
      return true;
    }
    if (const auto * outer = dyn_cast<MemberExpr>(parent)) {
      if (outer->object == member && outer->property == "value") {
        return true;
      }
    }
    if (!ends_with(buffer.slice(member->get_range()), ".value")) {
      buffer.append_left(member->end(), ".value");
    }
    return true;
  });
  walker.walk(body);
}

/// Replace a `let` destructuring statement by a capture plus one signal per binding.
void expand_let_destructuring(
  EditBuffer & buffer, const VarStmt & stmt, const VarDeclarator & decl,
  const std::vector<VariableInfo> & variables)
{
  const auto bindings = expandable_bindings(decl.target);
  const VariableInfo * first = find_variable(variables, bindings.front().name);
  if (first == nullptr || !first->destructured_from) {
    return;
  }
  const std::string & source = *first->destructured_from;
  const std::string indent(line_indent(buffer.original(), stmt.start()));

  std::string text = fmt::format("const {} = {};", source, buffer.slice(decl.init->get_range()));
  for (const auto & b : bindings) {
    const std::string access = b.index_access ? fmt::format("{}[{}]", source, b.property)
                                              : fmt::format("{}.{}", source, b.property);
    text += fmt::format("\n{}const {} = signal({});", indent, b.name, access);
  }
  buffer.overwrite(stmt.get_range(), text);
}

}  // namespace

void SignalTransformer::transform(
  EditBuffer & buffer, const ComponentInfo & component,
  const std::vector<VariableInfo> & variables, const std::vector<MutationInfo> & mutations,
  HelperUsage & helpers) const
{
  const BlockStmt * body = component.block_body();
  if (body == nullptr) {
    return;
  }

  std::set<uint32_t> mutation_roots;
  for (const auto & m : mutations) {
    mutation_roots.insert(m.root_range.start);
  }

  // Reads first: declaration edits below slice text that already carries them.
  rewrite_reads(buffer, body, names_of_kind(variables, ReactivityKind::Signal), mutation_roots);
  rewrite_api_reads(buffer, body, variables);

  for (const Stmt * s : body->body) {
    const auto * stmt = dyn_cast<VarStmt>(s);
    if (stmt == nullptr || stmt->var_kind == VarKind::Const) {
      continue;
    }

    size_t rewritten = 0;
    for (const VarDeclarator * decl : stmt->declarators) {
      if (const auto * target = dyn_cast<BindingIdent>(decl->target)) {
        const VariableInfo * v = find_variable(variables, target->name);
        if (v == nullptr || v->kind != ReactivityKind::Signal) {
          continue;
        }
        if (decl->init != nullptr) {
          buffer.append_left(decl->init->start(), "signal(");
          buffer.append_right(decl->init->end(), ")");
        } else {
          buffer.append_left(decl->end(), " = signal(undefined)");
        }
        helpers.runtime.insert("signal");
        ++rewritten;
      } else if (is_expandable_declaration(*stmt, *decl)) {
        expand_let_destructuring(buffer, *stmt, *decl, variables);
        helpers.runtime.insert("signal");
        // The keyword went with the statement.
        rewritten = 0;
        break;
      }
    }

    if (rewritten != 0 && rewritten == stmt->declarators.size()) {
      buffer.overwrite(stmt->keyword_range, "const");
    }
  }
}

}  // namespace reactc
