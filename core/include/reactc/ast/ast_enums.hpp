// reactc/ast/ast_enums.hpp - AST enumeration definitions
//
// Node kinds, operators and declaration flavours used by the TSX AST.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace reactc
{

// ============================================================================
// NodeKind - Identifies all AST node types
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Nodes are grouped by category so classof checks are range comparisons.
 */
enum class NodeKind : uint8_t {
#define AST_NODE_EXPR(Class, Kind, Snake) Kind,
#define AST_NODE_JSX(Class, Kind, Snake) Kind,
#include "reactc/ast/ast_nodes.def"

#define AST_NODE_PATTERN(Class, Kind, Snake) Kind,
#include "reactc/ast/ast_nodes.def"

#define AST_NODE_STMT(Class, Kind, Snake) Kind,
#include "reactc/ast/ast_nodes.def"

#define AST_NODE_SUPPORT(Class, Kind, Snake) Kind,
#include "reactc/ast/ast_nodes.def"

#define AST_NODE_TOP(Class, Kind, Snake) Kind,
#include "reactc/ast/ast_nodes.def"
};

// ============================================================================
// Node Categories
// ============================================================================

[[nodiscard]] constexpr bool is_expr_kind(NodeKind k) noexcept
{
  return k >= NodeKind::Identifier && k <= NodeKind::JsxFragment;
}

[[nodiscard]] constexpr bool is_jsx_kind(NodeKind k) noexcept
{
  return k == NodeKind::JsxElement || k == NodeKind::JsxFragment;
}

[[nodiscard]] constexpr bool is_pattern_kind(NodeKind k) noexcept
{
  return k >= NodeKind::BindingIdent && k <= NodeKind::RestElement;
}

[[nodiscard]] constexpr bool is_stmt_kind(NodeKind k) noexcept
{
  return k >= NodeKind::VarStmt && k <= NodeKind::TypeDecl;
}

[[nodiscard]] constexpr bool is_function_kind(NodeKind k) noexcept
{
  return k == NodeKind::FunctionExpr || k == NodeKind::ArrowFunction ||
         k == NodeKind::FunctionDecl;
}

/// Printable name of a node kind (the X-macro snake name).
[[nodiscard]] std::string_view to_string(NodeKind k) noexcept;

// ============================================================================
// Operators
// ============================================================================

enum class UnaryOp : uint8_t {
  Not,     ///< !
  BitNot,  ///< ~
  Plus,    ///< +
  Minus,   ///< -
  Typeof,  ///< typeof
  Void,    ///< void
  Delete,  ///< delete
};

enum class BinaryOp : uint8_t {
  Add,
  Sub,
  Mul,
  Div,
  Mod,
  Exp,
  Eq,
  Ne,
  StrictEq,
  StrictNe,
  Lt,
  Le,
  Gt,
  Ge,
  Shl,
  Shr,
  UShr,
  BitAnd,
  BitOr,
  BitXor,
  LogicalAnd,
  LogicalOr,
  Nullish,
  In,
  InstanceOf,
};

enum class AssignOp : uint8_t {
  Assign,
  AddAssign,
  SubAssign,
  MulAssign,
  DivAssign,
  ModAssign,
  ExpAssign,
  ShlAssign,
  ShrAssign,
  UShrAssign,
  BitAndAssign,
  BitOrAssign,
  BitXorAssign,
  AndAssign,
  OrAssign,
  NullishAssign,
};

// ============================================================================
// Declaration and literal flavours
// ============================================================================

enum class VarKind : uint8_t { Var, Let, Const };

enum class LiteralKind : uint8_t { Number, BigInt, String, Boolean, Null, Regex };

enum class JumpKind : uint8_t { Break, Continue, Debugger };

enum class ImportKind : uint8_t {
  Default,    ///< import x from 'm'
  Namespace,  ///< import * as x from 'm'
  Named,      ///< import { a as x } from 'm'
};

/// Which TypeScript-only construct a TypeDeclStmt stands for.
enum class TypeDeclKind : uint8_t { Interface, TypeAlias, Enum, Declare, Namespace };

// ============================================================================
// to_string() Helper Functions
// ============================================================================

[[nodiscard]] constexpr std::string_view to_string(VarKind k) noexcept
{
  switch (k) {
    case VarKind::Var:
      return "var";
    case VarKind::Let:
      return "let";
    case VarKind::Const:
      return "const";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(UnaryOp op) noexcept
{
  switch (op) {
    case UnaryOp::Not:
      return "!";
    case UnaryOp::BitNot:
      return "~";
    case UnaryOp::Plus:
      return "+";
    case UnaryOp::Minus:
      return "-";
    case UnaryOp::Typeof:
      return "typeof";
    case UnaryOp::Void:
      return "void";
    case UnaryOp::Delete:
      return "delete";
  }
  return "";
}

[[nodiscard]] std::string_view to_string(BinaryOp op) noexcept;
[[nodiscard]] std::string_view to_string(AssignOp op) noexcept;

}  // namespace reactc
