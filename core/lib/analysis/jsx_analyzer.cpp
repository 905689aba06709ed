// reactc/analysis/jsx_analyzer.cpp - Reactivity of markup expressions
#include "reactc/analysis/jsx_analyzer.hpp"

#include <algorithm>

#include "reactc/analysis/scope.hpp"
#include "reactc/analysis/variable_classifier.hpp"
#include "reactc/ast/ast_walk.hpp"

namespace reactc
{

namespace
{

/// Name of the binding whose reactive API property `member` reads, or empty.
std::string_view api_property_root(
  const MemberExpr * member, const std::vector<VariableInfo> & variables,
  const ScopeWalker & scopes)
{
  // tasks.loading
  if (const auto * id = dyn_cast<Identifier>(member->object)) {
    const VariableInfo * v = find_variable(variables, id->name);
    if (
      v != nullptr && v->signal_properties.count(member->property) != 0 &&
      !scopes.is_shadowed(id->name)) {
      return id->name;
    }
    return {};
  }
  // form.title.error
  if (const auto * inner = dyn_cast<MemberExpr>(member->object)) {
    const auto * id = dyn_cast<Identifier>(inner->object);
    if (id == nullptr) {
      return {};
    }
    const VariableInfo * v = find_variable(variables, id->name);
    if (
      v != nullptr && v->field_signal_properties.count(member->property) != 0 &&
      v->signal_properties.count(inner->property) == 0 &&
      v->plain_properties.count(inner->property) == 0 && !scopes.is_shadowed(id->name)) {
      return id->name;
    }
  }
  return {};
}

}  // namespace

std::vector<JsxExpressionInfo> JsxAnalyzer::analyze(
  const ComponentInfo & component, const std::vector<VariableInfo> & variables) const
{
  std::vector<JsxExpressionInfo> infos;
  const AstNode * body = component.body_node();
  if (body == nullptr) {
    return infos;
  }

  walk_preorder(body, [&](const AstNode * node, const AstNode *) {
    if (isa<JsxExpressionContainer>(node)) {
      JsxExpressionInfo info;
      info.range = node->get_range();
      infos.push_back(std::move(info));
    }
    return true;
  });
  if (infos.empty()) {
    return infos;
  }

  NameSet reactive;
  for (const auto & v : variables) {
    if (v.is_reactive() || v.is_reactive_source) {
      reactive.insert(v.name);
    }
  }

  auto hit = [&](std::string_view name, uint32_t pos) {
    for (auto & info : infos) {
      if (!info.range.contains(pos)) {
        continue;
      }
      info.reactive = true;
      if (
        std::find(info.dependencies.begin(), info.dependencies.end(), name) ==
        info.dependencies.end()) {
        info.dependencies.emplace_back(name);
      }
    }
  };

  ScopeWalker walker([&](const AstNode * node, const AstNode *, const ScopeWalker & scopes) {
    if (const auto * id = dyn_cast<Identifier>(node)) {
      if (reactive.count(id->name) != 0 && !scopes.is_shadowed(id->name)) {
        hit(id->name, id->start());
      }
    } else if (const auto * member = dyn_cast<MemberExpr>(node)) {
      const std::string_view root = api_property_root(member, variables, scopes);
      if (!root.empty()) {
        hit(root, member->start());
      }
    }
    return true;
  });
  walker.walk(body);
  return infos;
}

}  // namespace reactc
