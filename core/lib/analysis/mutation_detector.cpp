// reactc/analysis/mutation_detector.cpp - In-place mutation sites on reactive bindings
#include "reactc/analysis/mutation_detector.hpp"

#include <algorithm>
#include <array>
#include <iterator>
#include <unordered_map>

#include "reactc/analysis/scope.hpp"
#include "reactc/analysis/variable_classifier.hpp"

namespace reactc
{

bool is_mutation_method(std::string_view name) noexcept
{
  static constexpr std::array<std::string_view, 9> k_methods = {
    "push", "pop", "shift", "unshift", "splice", "sort", "reverse", "fill", "copyWithin",
  };
  return std::find(k_methods.begin(), k_methods.end(), name) != k_methods.end();
}

namespace
{

/// Object.assign
bool is_bulk_assign_callee(const Expr * callee)
{
  const auto * member = dyn_cast<MemberExpr>(skip_parens(callee));
  if (member == nullptr || member->property != "assign") {
    return false;
  }
  const auto * object = dyn_cast<Identifier>(skip_parens(member->object));
  return object != nullptr && object->name == "Object";
}

using ParentMap = std::unordered_map<const AstNode *, const AstNode *>;

bool is_value_used(const AstNode * site, const ParentMap & parents)
{
  const AstNode * node = site;
  for (;;) {
    const auto it = parents.find(node);
    const AstNode * parent = it == parents.end() ? nullptr : it->second;
    if (parent == nullptr) {
      return true;
    }
    switch (parent->get_kind()) {
      case NodeKind::Paren:
        node = parent;
        continue;
      case NodeKind::ExprStmt:
        return false;
      case NodeKind::Sequence: {
        const auto * seq = cast<SequenceExpr>(parent);
        if (seq->exprs.empty() || seq->exprs[seq->exprs.size() - 1] != node) {
          return false;
        }
        node = parent;
        continue;
      }
      case NodeKind::Unary:
        return cast<UnaryExpr>(parent)->op != UnaryOp::Void;
      case NodeKind::ArrowFunction:
        return cast<ArrowFunctionExpr>(parent)->fn.body != node;
      default:
        return true;
    }
  }
}

}  // namespace

std::vector<MutationInfo> MutationDetector::find_sites(
  const ComponentInfo & component, const NameSet & roots)
{
  std::vector<MutationInfo> sites;
  const AstNode * body = component.body_node();
  if (body == nullptr || roots.empty()) {
    return sites;
  }

  ParentMap parents;
  auto record = [&](
                  const ScopeWalker & scopes, MutationKind kind, const AstNode * site,
                  const Identifier * root, std::string_view method) {
    if (root == nullptr || roots.count(root->name) == 0 || scopes.is_shadowed(root->name)) {
      return;
    }
    // One site per root occurrence; the outermost wins.
    for (const auto & existing : sites) {
      if (existing.root_range == root->get_range()) {
        return;
      }
    }
    MutationInfo info;
    info.kind = kind;
    info.root = std::string(root->name);
    info.range = site->get_range();
    info.root_range = root->get_range();
    info.method = std::string(method);
    info.value_used = is_value_used(site, parents);
    sites.push_back(std::move(info));
  };

  ScopeWalker walker([&](const AstNode * node, const AstNode * parent, const ScopeWalker & scopes) {
    parents.emplace(node, parent);
    switch (node->get_kind()) {
      case NodeKind::Call: {
        const auto * call = cast<CallExpr>(node);
        if (const auto * member = dyn_cast<MemberExpr>(call->callee)) {
          if (is_mutation_method(member->property)) {
            record(
              scopes, MutationKind::MethodCall, call, root_identifier(member->object),
              member->property);
            break;
          }
        }
        if (is_bulk_assign_callee(call->callee) && !call->args.empty()) {
          record(
            scopes, MutationKind::BulkAssign, call,
            dyn_cast<Identifier>(skip_parens(call->args[0])), "");
        }
        break;
      }
      case NodeKind::Assign: {
        const auto * assign = cast<AssignExpr>(node);
        if (const auto * member = dyn_cast<MemberExpr>(assign->target)) {
          record(
            scopes, MutationKind::PropertyAssign, assign, root_identifier(member->object), "");
        } else if (const auto * index = dyn_cast<IndexExpr>(assign->target)) {
          record(scopes, MutationKind::IndexAssign, assign, root_identifier(index->object), "");
        }
        break;
      }
      case NodeKind::Unary: {
        const auto * unary = cast<UnaryExpr>(node);
        if (unary->op != UnaryOp::Delete) {
          break;
        }
        const Expr * operand = skip_parens(unary->operand);
        if (const auto * member = dyn_cast<MemberExpr>(operand)) {
          record(scopes, MutationKind::Delete, unary, root_identifier(member->object), "");
        } else if (const auto * index = dyn_cast<IndexExpr>(operand)) {
          record(scopes, MutationKind::Delete, unary, root_identifier(index->object), "");
        }
        break;
      }
      default:
        break;
    }
    return true;
  });
  walker.walk(body);
  return sites;
}

std::vector<MutationInfo> MutationDetector::detect(
  const ComponentInfo & component, const std::vector<VariableInfo> & variables) const
{
  NameSet roots = names_of_kind(variables, ReactivityKind::Signal);
  if (scope_ == MutationScope::Markup) {
    const NameSet markup = collect_markup_references(component);
    for (auto it = roots.begin(); it != roots.end();) {
      it = markup.count(*it) != 0 ? std::next(it) : roots.erase(it);
    }
  }
  return find_sites(component, roots);
}

}  // namespace reactc
