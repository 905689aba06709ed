// reactc/analysis/component_detector.cpp - Component boundary detection
#include "reactc/analysis/component_detector.hpp"

#include "reactc/ast/ast_walk.hpp"

namespace reactc
{

bool ComponentDetector::is_jsx_expression(const Expr * expr) noexcept
{
  expr = skip_parens(expr);
  if (expr == nullptr) {
    return false;
  }
  if (is_jsx_kind(expr->get_kind())) {
    return true;
  }
  if (const auto * cond = dyn_cast<ConditionalExpr>(expr)) {
    return is_jsx_expression(cond->consequent) || is_jsx_expression(cond->alternate);
  }
  if (const auto * bin = dyn_cast<BinaryExpr>(expr)) {
    if (
      bin->op == BinaryOp::LogicalAnd || bin->op == BinaryOp::LogicalOr ||
      bin->op == BinaryOp::Nullish) {
      return is_jsx_expression(bin->lhs) || is_jsx_expression(bin->rhs);
    }
  }
  return false;
}

bool ComponentDetector::returns_jsx(const FunctionData & fn)
{
  if (fn.body == nullptr) {
    return false;
  }
  if (fn.has_expression_body()) {
    return is_jsx_expression(cast<Expr>(fn.body));
  }

  bool found = false;
  walk_preorder(fn.body, [&](const AstNode * node, const AstNode *) {
    if (found) {
      return false;
    }
    // Returns of nested functions belong to those functions.
    if (node != fn.body && is_function_kind(node->get_kind())) {
      return false;
    }
    if (const auto * ret = dyn_cast<ReturnStmt>(node)) {
      if (is_jsx_expression(ret->argument)) {
        found = true;
      }
      return false;
    }
    // Statements only; expressions cannot contain return statements.
    return isa<Stmt>(node) || isa<SwitchCase>(node) || isa<CatchClause>(node);
  });
  return found;
}

std::vector<ComponentInfo> ComponentDetector::detect(const Program & program) const
{
  std::vector<ComponentInfo> out;
  for (const Stmt * stmt : program.body) {
    if (const auto * exp = dyn_cast<ExportDecl>(stmt)) {
      if (exp->declaration != nullptr) {
        stmt = exp->declaration;
      } else if (exp->default_expr != nullptr) {
        const Expr * e = skip_parens(exp->default_expr);
        if (const FunctionData * fn = function_data(e)) {
          const std::string_view name = fn->name.empty() ? "default" : fn->name;
          consider(e, *fn, name, fn->name.empty() ? e->get_range() : fn->name_range, out);
        }
        continue;
      } else {
        continue;
      }
    }

    if (const auto * decl = dyn_cast<FunctionDecl>(stmt)) {
      const std::string_view name = decl->fn.name.empty() ? "default" : decl->fn.name;
      consider(decl, decl->fn, name, decl->fn.name_range, out);
    } else if (const auto * var = dyn_cast<VarStmt>(stmt)) {
      consider_var_stmt(*var, out);
    }
  }
  return out;
}

void ComponentDetector::consider_var_stmt(const VarStmt & stmt, std::vector<ComponentInfo> & out)
  const
{
  if (stmt.var_kind == VarKind::Var) {
    return;
  }
  for (const VarDeclarator * decl : stmt.declarators) {
    const auto * target = dyn_cast<BindingIdent>(decl->target);
    if (target == nullptr || decl->init == nullptr) {
      continue;
    }
    const Expr * init = skip_parens(decl->init);
    if (!isa<ArrowFunctionExpr>(init) && !isa<FunctionExpr>(init)) {
      continue;
    }
    consider(init, *function_data(init), target->name, target->get_range(), out);
  }
}

void ComponentDetector::consider(
  const AstNode * node, const FunctionData & fn, std::string_view name, SourceRange name_range,
  std::vector<ComponentInfo> & out) const
{
  if (!returns_jsx(fn)) {
    return;
  }

  ComponentInfo info;
  info.name = std::string(name);
  info.name_range = name_range;
  info.fn = &fn;
  info.node = node;
  info.body = fn.body->get_range();

  info.params.count = fn.params.size();
  if (!fn.params.empty()) {
    const Pattern * first = fn.params[0];
    info.params.first_param = first->get_range();
    if (const auto * with_default = dyn_cast<AssignPattern>(first)) {
      first = with_default->target;
    }
    info.params.has_destructured_props = isa<ObjectPattern>(first);
  }

  out.push_back(std::move(info));
}

}  // namespace reactc
