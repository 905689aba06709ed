// reactc/ast/ast.cpp - AST helpers and enum printing
#include "reactc/ast/ast.hpp"

#include <cctype>

namespace reactc
{

std::string_view to_string(NodeKind k) noexcept
{
  switch (k) {
#define AST_NODE_EXPR(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Snake;
#define AST_NODE_JSX(Class, Kind, Snake) \
  case NodeKind::Kind:                   \
    return #Snake;
#define AST_NODE_PATTERN(Class, Kind, Snake) \
  case NodeKind::Kind:                       \
    return #Snake;
#define AST_NODE_STMT(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Snake;
#define AST_NODE_SUPPORT(Class, Kind, Snake) \
  case NodeKind::Kind:                       \
    return #Snake;
#define AST_NODE_TOP(Class, Kind, Snake) \
  case NodeKind::Kind:                   \
    return #Snake;
#include "reactc/ast/ast_nodes.def"
  }
  return "unknown";
}

std::string_view to_string(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::Add:
      return "+";
    case BinaryOp::Sub:
      return "-";
    case BinaryOp::Mul:
      return "*";
    case BinaryOp::Div:
      return "/";
    case BinaryOp::Mod:
      return "%";
    case BinaryOp::Exp:
      return "**";
    case BinaryOp::Eq:
      return "==";
    case BinaryOp::Ne:
      return "!=";
    case BinaryOp::StrictEq:
      return "===";
    case BinaryOp::StrictNe:
      return "!==";
    case BinaryOp::Lt:
      return "<";
    case BinaryOp::Le:
      return "<=";
    case BinaryOp::Gt:
      return ">";
    case BinaryOp::Ge:
      return ">=";
    case BinaryOp::Shl:
      return "<<";
    case BinaryOp::Shr:
      return ">>";
    case BinaryOp::UShr:
      return ">>>";
    case BinaryOp::BitAnd:
      return "&";
    case BinaryOp::BitOr:
      return "|";
    case BinaryOp::BitXor:
      return "^";
    case BinaryOp::LogicalAnd:
      return "&&";
    case BinaryOp::LogicalOr:
      return "||";
    case BinaryOp::Nullish:
      return "??";
    case BinaryOp::In:
      return "in";
    case BinaryOp::InstanceOf:
      return "instanceof";
  }
  return "";
}

std::string_view to_string(AssignOp op) noexcept
{
  switch (op) {
    case AssignOp::Assign:
      return "=";
    case AssignOp::AddAssign:
      return "+=";
    case AssignOp::SubAssign:
      return "-=";
    case AssignOp::MulAssign:
      return "*=";
    case AssignOp::DivAssign:
      return "/=";
    case AssignOp::ModAssign:
      return "%=";
    case AssignOp::ExpAssign:
      return "**=";
    case AssignOp::ShlAssign:
      return "<<=";
    case AssignOp::ShrAssign:
      return ">>=";
    case AssignOp::UShrAssign:
      return ">>>=";
    case AssignOp::BitAndAssign:
      return "&=";
    case AssignOp::BitOrAssign:
      return "|=";
    case AssignOp::BitXorAssign:
      return "^=";
    case AssignOp::AndAssign:
      return "&&=";
    case AssignOp::OrAssign:
      return "||=";
    case AssignOp::NullishAssign:
      return "??=";
  }
  return "";
}

bool JsxElement::is_component() const noexcept
{
  if (tag.empty()) {
    return false;
  }
  if (tag.find('.') != std::string_view::npos) {
    return true;
  }
  return std::isupper(static_cast<unsigned char>(tag.front())) != 0;
}

const FunctionData * function_data(const AstNode * node) noexcept
{
  if (const auto * d = dyn_cast<FunctionDecl>(node)) {
    return &d->fn;
  }
  if (const auto * e = dyn_cast<FunctionExpr>(node)) {
    return &e->fn;
  }
  if (const auto * a = dyn_cast<ArrowFunctionExpr>(node)) {
    return &a->fn;
  }
  return nullptr;
}

const Expr * skip_parens(const Expr * e) noexcept
{
  while (e != nullptr) {
    if (const auto * p = dyn_cast<ParenExpr>(e)) {
      e = p->inner;
    } else if (const auto * w = dyn_cast<TypeWrapperExpr>(e)) {
      e = w->inner;
    } else {
      break;
    }
  }
  return e;
}

}  // namespace reactc
