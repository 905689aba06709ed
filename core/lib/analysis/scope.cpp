// reactc/analysis/scope.cpp - Lexical scoping helpers
#include "reactc/analysis/scope.hpp"

#include "reactc/ast/ast_walk.hpp"

namespace reactc
{

namespace
{

void collect_declared_in(gsl::span<Stmt *> stmts, std::vector<std::string_view> & out)
{
  for (const Stmt * stmt : stmts) {
    if (const auto * var = dyn_cast<VarStmt>(stmt)) {
      for (const VarDeclarator * decl : var->declarators) {
        collect_binding_names(decl->target, out);
      }
    } else if (const auto * fn = dyn_cast<FunctionDecl>(stmt)) {
      if (!fn->fn.name.empty()) {
        out.push_back(fn->fn.name);
      }
    } else if (const auto * cls = dyn_cast<ClassDecl>(stmt)) {
      if (!cls->name.empty()) {
        out.push_back(cls->name);
      }
    }
  }
}

void collect_from_head(const AstNode * head, std::vector<std::string_view> & out)
{
  if (const auto * var = dyn_cast<VarStmt>(head)) {
    for (const VarDeclarator * decl : var->declarators) {
      collect_binding_names(decl->target, out);
    }
  }
}

}  // namespace

void collect_binding_names(const Pattern * pattern, std::vector<std::string_view> & out)
{
  if (pattern == nullptr) {
    return;
  }
  switch (pattern->get_kind()) {
    case NodeKind::BindingIdent:
      out.push_back(cast<BindingIdent>(pattern)->name);
      return;
    case NodeKind::ObjectPattern: {
      const auto * obj = cast<ObjectPattern>(pattern);
      for (const BindingProperty * prop : obj->properties) {
        collect_binding_names(prop->value, out);
      }
      collect_binding_names(obj->rest, out);
      return;
    }
    case NodeKind::ArrayPattern: {
      const auto * arr = cast<ArrayPattern>(pattern);
      for (const Pattern * elem : arr->elements) {
        collect_binding_names(elem, out);
      }
      collect_binding_names(arr->rest, out);
      return;
    }
    case NodeKind::AssignPattern:
      collect_binding_names(cast<AssignPattern>(pattern)->target, out);
      return;
    case NodeKind::RestElement:
      collect_binding_names(cast<RestElement>(pattern)->target, out);
      return;
    default:
      return;
  }
}

const Identifier * root_identifier(const Expr * expr) noexcept
{
  while (expr != nullptr) {
    if (const auto * id = dyn_cast<Identifier>(expr)) {
      return id;
    }
    if (const auto * member = dyn_cast<MemberExpr>(expr)) {
      expr = member->object;
    } else if (const auto * index = dyn_cast<IndexExpr>(expr)) {
      expr = index->object;
    } else {
      return nullptr;
    }
  }
  return nullptr;
}

// ============================================================================
// ScopeWalker
// ============================================================================

void ScopeWalker::walk(const AstNode * root)
{
  root_ = root;
  scopes_.clear();
  visit(root, nullptr);
}

bool ScopeWalker::is_shadowed(std::string_view name) const noexcept
{
  for (const auto & scope : scopes_) {
    for (std::string_view declared : scope) {
      if (declared == name) {
        return true;
      }
    }
  }
  return false;
}

void ScopeWalker::visit(const AstNode * node, const AstNode * parent)
{
  if (!fn_(node, parent, *this)) {
    return;
  }
  const bool pushed =
    (node != root_ || is_function_kind(node->get_kind())) && open_scope(node);
  for_each_child(node, [&](const AstNode * child) { visit(child, node); });
  if (pushed) {
    scopes_.pop_back();
  }
}

bool ScopeWalker::open_scope(const AstNode * node)
{
  std::vector<std::string_view> names;
  switch (node->get_kind()) {
    case NodeKind::FunctionDecl:
    case NodeKind::FunctionExpr:
    case NodeKind::ArrowFunction: {
      const FunctionData * fn = function_data(node);
      for (const Pattern * param : fn->params) {
        collect_binding_names(param, names);
      }
      // A named function expression sees its own name.
      if (isa<FunctionExpr>(node) && !fn->name.empty()) {
        names.push_back(fn->name);
      }
      break;
    }
    case NodeKind::Block:
      collect_declared_in(cast<BlockStmt>(node)->body, names);
      break;
    case NodeKind::For:
      collect_from_head(cast<ForStmt>(node)->init, names);
      break;
    case NodeKind::ForInOf:
      collect_from_head(cast<ForInOfStmt>(node)->left, names);
      break;
    case NodeKind::CatchClause:
      collect_binding_names(cast<CatchClause>(node)->param, names);
      break;
    case NodeKind::Switch:
      for (const SwitchCase * c : cast<SwitchStmt>(node)->cases) {
        collect_declared_in(c->body, names);
      }
      break;
    default:
      break;
  }
  if (names.empty()) {
    return false;
  }
  scopes_.push_back(std::move(names));
  return true;
}

// ============================================================================
// Reference queries
// ============================================================================

void for_each_free_reference(const AstNode * root, const ReferenceFn & fn)
{
  ScopeWalker walker(
    [&](const AstNode * node, const AstNode * parent, const ScopeWalker & scopes) {
      if (const auto * id = dyn_cast<Identifier>(node)) {
        if (!scopes.is_shadowed(id->name)) {
          fn(id, parent);
        }
      }
      return true;
    });
  walker.walk(root);
}

bool references_any(const AstNode * root, const NameSet & names)
{
  if (names.empty()) {
    return false;
  }
  bool found = false;
  for_each_free_reference(root, [&](const Identifier * id, const AstNode *) {
    if (names.count(id->name) != 0) {
      found = true;
    }
  });
  return found;
}

NameSet collect_markup_references(const ComponentInfo & component)
{
  NameSet result;
  const AstNode * body = component.body_node();
  if (body == nullptr) {
    return result;
  }

  std::vector<SourceRange> containers;
  walk_preorder(body, [&](const AstNode * node, const AstNode *) {
    if (isa<JsxExpressionContainer>(node) || isa<JsxSpreadAttribute>(node)) {
      containers.push_back(node->get_range());
    }
    return true;
  });
  if (containers.empty()) {
    return result;
  }

  for_each_free_reference(body, [&](const Identifier * id, const AstNode *) {
    for (const SourceRange & r : containers) {
      if (r.contains(id->start())) {
        result.emplace(id->name);
        return;
      }
    }
  });
  return result;
}

}  // namespace reactc
