// reactc/ast/ast.hpp - AST node class definitions for TSX sources
//
// LLVM/Clang style nodes with classof() for RTTI. Nodes are allocated in an
// AstContext arena and must stay trivially destructible.
//
// Name positions that never denote a binding reference (declared names,
// property names after '.', object keys, JSX attribute names) are stored as
// plain string_view + range, so every Identifier node in a tree is a read or
// a write of some binding.
//
#pragma once

#include <gsl/span>
#include <string_view>

#include "reactc/ast/ast_enums.hpp"
#include "reactc/basic/casting.hpp"
#include "reactc/basic/source_manager.hpp"

namespace reactc
{

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Every AST node has a NodeKind for RTTI and the half-open byte range it
 * covers in the source file. Nodes are non-copyable and owned by AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }
  [[nodiscard]] uint32_t start() const noexcept { return range_.start; }
  [[nodiscard]] uint32_t end() const noexcept { return range_.end; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;
};

/**
 * CRTP base class that implements classof() for a concrete kind.
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind_value = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

class Expr : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Pattern : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_pattern_kind(node->kind); }

protected:
  explicit Pattern(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Stmt : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_stmt_kind(node->kind); }

protected:
  explicit Stmt(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class BlockStmt;
class BindingProperty;

/// Shared shape of function declarations, expressions, arrows and methods.
struct FunctionData
{
  std::string_view name;  ///< Empty for anonymous functions
  SourceRange name_range;
  gsl::span<Pattern *> params;
  SourceRange params_range;  ///< Covers the parentheses (or the bare arrow param)
  AstNode * body = nullptr;  ///< BlockStmt, or an Expr for expression-bodied arrows
  bool is_async = false;
  bool is_generator = false;

  [[nodiscard]] bool has_expression_body() const noexcept;
  [[nodiscard]] BlockStmt * block_body() const noexcept;
};

// ============================================================================
// Expression Nodes
// ============================================================================

/// Reference to a binding (read, or write target of an assignment).
class Identifier : public NodeBase<Identifier, Expr, NodeKind::Identifier>
{
public:
  std::string_view name;

  explicit Identifier(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// Number, bigint, string, boolean, null or regex literal. `raw` keeps quotes.
class LiteralExpr : public NodeBase<LiteralExpr, Expr, NodeKind::Literal>
{
public:
  LiteralKind literal_kind;
  std::string_view raw;

  LiteralExpr(LiteralKind k, std::string_view text, SourceRange r = {})
  : NodeBase(r), literal_kind(k), raw(text)
  {
  }

  [[nodiscard]] bool is_string() const noexcept { return literal_kind == LiteralKind::String; }
};

/// `a ${b} c`; only the substitutions are modelled.
class TemplateLiteralExpr
: public NodeBase<TemplateLiteralExpr, Expr, NodeKind::TemplateLiteral>
{
public:
  gsl::span<Expr *> substitutions;

  explicit TemplateLiteralExpr(gsl::span<Expr *> subs, SourceRange r = {})
  : NodeBase(r), substitutions(subs)
  {
  }
};

class TaggedTemplateExpr : public NodeBase<TaggedTemplateExpr, Expr, NodeKind::TaggedTemplate>
{
public:
  Expr * tag;
  TemplateLiteralExpr * quasi;

  TaggedTemplateExpr(Expr * t, TemplateLiteralExpr * q, SourceRange r = {})
  : NodeBase(r), tag(t), quasi(q)
  {
  }
};

class ThisExpr : public NodeBase<ThisExpr, Expr, NodeKind::This>
{
public:
  explicit ThisExpr(SourceRange r = {}) : NodeBase(r) {}
};

class SuperExpr : public NodeBase<SuperExpr, Expr, NodeKind::Super>
{
public:
  explicit SuperExpr(SourceRange r = {}) : NodeBase(r) {}
};

/// [a, , ...b]; holes are nullptr.
class ArrayLiteralExpr : public NodeBase<ArrayLiteralExpr, Expr, NodeKind::ArrayLiteral>
{
public:
  gsl::span<Expr *> elements;

  explicit ArrayLiteralExpr(gsl::span<Expr *> elems, SourceRange r = {})
  : NodeBase(r), elements(elems)
  {
  }
};

/// { k: v, k, ...s, m() {} } - members are Property, ShorthandProperty or SpreadElement.
class ObjectLiteralExpr : public NodeBase<ObjectLiteralExpr, Expr, NodeKind::ObjectLiteral>
{
public:
  gsl::span<AstNode *> members;

  explicit ObjectLiteralExpr(gsl::span<AstNode *> m, SourceRange r = {})
  : NodeBase(r), members(m)
  {
  }
};

class FunctionExpr : public NodeBase<FunctionExpr, Expr, NodeKind::FunctionExpr>
{
public:
  FunctionData fn;

  explicit FunctionExpr(FunctionData f, SourceRange r = {}) : NodeBase(r), fn(f) {}
};

class ArrowFunctionExpr : public NodeBase<ArrowFunctionExpr, Expr, NodeKind::ArrowFunction>
{
public:
  FunctionData fn;

  explicit ArrowFunctionExpr(FunctionData f, SourceRange r = {}) : NodeBase(r), fn(f) {}
};

/// Class expression. The body is kept as source text and not analysed.
class ClassExpr : public NodeBase<ClassExpr, Expr, NodeKind::ClassExpr>
{
public:
  std::string_view name;
  Expr * heritage = nullptr;

  explicit ClassExpr(std::string_view n, Expr * h, SourceRange r = {})
  : NodeBase(r), name(n), heritage(h)
  {
  }
};

class UnaryExpr : public NodeBase<UnaryExpr, Expr, NodeKind::Unary>
{
public:
  UnaryOp op;
  Expr * operand;

  UnaryExpr(UnaryOp o, Expr * e, SourceRange r = {}) : NodeBase(r), op(o), operand(e) {}
};

/// ++x, x--, ...
class UpdateExpr : public NodeBase<UpdateExpr, Expr, NodeKind::Update>
{
public:
  bool increment;
  bool prefix;
  Expr * operand;

  UpdateExpr(bool inc, bool pre, Expr * e, SourceRange r = {})
  : NodeBase(r), increment(inc), prefix(pre), operand(e)
  {
  }
};

class BinaryExpr : public NodeBase<BinaryExpr, Expr, NodeKind::Binary>
{
public:
  Expr * lhs;
  BinaryOp op;
  Expr * rhs;

  BinaryExpr(Expr * l, BinaryOp o, Expr * r, SourceRange range = {})
  : NodeBase(range), lhs(l), op(o), rhs(r)
  {
  }
};

/// target op= value. The target is an expression (array/object literals act as patterns).
class AssignExpr : public NodeBase<AssignExpr, Expr, NodeKind::Assign>
{
public:
  Expr * target;
  AssignOp op;
  Expr * value;

  AssignExpr(Expr * t, AssignOp o, Expr * v, SourceRange r = {})
  : NodeBase(r), target(t), op(o), value(v)
  {
  }
};

class ConditionalExpr : public NodeBase<ConditionalExpr, Expr, NodeKind::Conditional>
{
public:
  Expr * test;
  Expr * consequent;
  Expr * alternate;

  ConditionalExpr(Expr * t, Expr * c, Expr * a, SourceRange r = {})
  : NodeBase(r), test(t), consequent(c), alternate(a)
  {
  }
};

class CallExpr : public NodeBase<CallExpr, Expr, NodeKind::Call>
{
public:
  Expr * callee;
  gsl::span<Expr *> args;
  bool optional = false;  ///< f?.()

  CallExpr(Expr * c, gsl::span<Expr *> a, bool opt, SourceRange r = {})
  : NodeBase(r), callee(c), args(a), optional(opt)
  {
  }
};

class NewExpr : public NodeBase<NewExpr, Expr, NodeKind::New>
{
public:
  Expr * callee;
  gsl::span<Expr *> args;

  NewExpr(Expr * c, gsl::span<Expr *> a, SourceRange r = {}) : NodeBase(r), callee(c), args(a) {}
};

/// object.property / object?.property / object.#private
class MemberExpr : public NodeBase<MemberExpr, Expr, NodeKind::Member>
{
public:
  Expr * object;
  std::string_view property;
  SourceRange property_range;
  bool optional = false;

  MemberExpr(Expr * o, std::string_view p, SourceRange pr, bool opt, SourceRange r = {})
  : NodeBase(r), object(o), property(p), property_range(pr), optional(opt)
  {
  }
};

/// object[index] / object?.[index]
class IndexExpr : public NodeBase<IndexExpr, Expr, NodeKind::Index>
{
public:
  Expr * object;
  Expr * index;
  bool optional = false;

  IndexExpr(Expr * o, Expr * i, bool opt, SourceRange r = {})
  : NodeBase(r), object(o), index(i), optional(opt)
  {
  }
};

class SequenceExpr : public NodeBase<SequenceExpr, Expr, NodeKind::Sequence>
{
public:
  gsl::span<Expr *> exprs;

  explicit SequenceExpr(gsl::span<Expr *> e, SourceRange r = {}) : NodeBase(r), exprs(e) {}
};

class ParenExpr : public NodeBase<ParenExpr, Expr, NodeKind::Paren>
{
public:
  Expr * inner;

  explicit ParenExpr(Expr * e, SourceRange r = {}) : NodeBase(r), inner(e) {}
};

/// ...arg in calls, array literals and object literals.
class SpreadElement : public NodeBase<SpreadElement, Expr, NodeKind::Spread>
{
public:
  Expr * argument;

  explicit SpreadElement(Expr * a, SourceRange r = {}) : NodeBase(r), argument(a) {}
};

class YieldExpr : public NodeBase<YieldExpr, Expr, NodeKind::Yield>
{
public:
  Expr * argument = nullptr;
  bool delegate = false;

  YieldExpr(Expr * a, bool d, SourceRange r = {}) : NodeBase(r), argument(a), delegate(d) {}
};

class AwaitExpr : public NodeBase<AwaitExpr, Expr, NodeKind::Await>
{
public:
  Expr * argument;

  explicit AwaitExpr(Expr * a, SourceRange r = {}) : NodeBase(r), argument(a) {}
};

/// `e as T`, `e satisfies T`, `e!`, `<T>e`: the type part is kept verbatim.
class TypeWrapperExpr : public NodeBase<TypeWrapperExpr, Expr, NodeKind::TypeWrapper>
{
public:
  Expr * inner;

  explicit TypeWrapperExpr(Expr * e, SourceRange r = {}) : NodeBase(r), inner(e) {}
};

/// import.meta, new.target, the `import` of a dynamic import call.
class OpaqueExpr : public NodeBase<OpaqueExpr, Expr, NodeKind::Opaque>
{
public:
  explicit OpaqueExpr(SourceRange r = {}) : NodeBase(r) {}
};

/// Parser recovery placeholder.
class MissingExpr : public NodeBase<MissingExpr, Expr, NodeKind::Missing>
{
public:
  explicit MissingExpr(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// JSX Nodes
// ============================================================================

/**
 * <tag attrs>children</tag> or <tag attrs />.
 *
 * `tag` is the full source text of the tag name (`div`, `Foo`, `Ctx.Provider`,
 * `svg:path`). Attributes are JsxAttribute or JsxSpreadAttribute; children are
 * JsxText, JsxExpressionContainer, JsxElement or JsxFragment.
 */
class JsxElement : public NodeBase<JsxElement, Expr, NodeKind::JsxElement>
{
public:
  std::string_view tag;
  SourceRange tag_range;
  gsl::span<AstNode *> attributes;
  gsl::span<AstNode *> children;
  bool self_closing = false;

  JsxElement(std::string_view t, SourceRange tr, SourceRange r = {})
  : NodeBase(r), tag(t), tag_range(tr)
  {
  }

  /// Upper-case first letter or a dotted name: rendered by calling a function.
  [[nodiscard]] bool is_component() const noexcept;
};

class JsxFragment : public NodeBase<JsxFragment, Expr, NodeKind::JsxFragment>
{
public:
  gsl::span<AstNode *> children;

  explicit JsxFragment(gsl::span<AstNode *> c, SourceRange r = {}) : NodeBase(r), children(c) {}
};

// ============================================================================
// Binding Patterns
// ============================================================================

/// A declared name: `x` in `let x`, a parameter, a destructuring target.
class BindingIdent : public NodeBase<BindingIdent, Pattern, NodeKind::BindingIdent>
{
public:
  std::string_view name;

  explicit BindingIdent(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// { a, b: c, ...rest } - properties are BindingProperty, `rest` may be null.
class ObjectPattern : public NodeBase<ObjectPattern, Pattern, NodeKind::ObjectPattern>
{
public:
  gsl::span<BindingProperty *> properties;
  Pattern * rest = nullptr;

  ObjectPattern(gsl::span<BindingProperty *> p, Pattern * r, SourceRange range = {})
  : NodeBase(range), properties(p), rest(r)
  {
  }
};

/// [a, , b, ...rest] - holes are nullptr.
class ArrayPattern : public NodeBase<ArrayPattern, Pattern, NodeKind::ArrayPattern>
{
public:
  gsl::span<Pattern *> elements;
  Pattern * rest = nullptr;

  ArrayPattern(gsl::span<Pattern *> e, Pattern * r, SourceRange range = {})
  : NodeBase(range), elements(e), rest(r)
  {
  }
};

/// target = default
class AssignPattern : public NodeBase<AssignPattern, Pattern, NodeKind::AssignPattern>
{
public:
  Pattern * target;
  Expr * default_value;

  AssignPattern(Pattern * t, Expr * d, SourceRange r = {})
  : NodeBase(r), target(t), default_value(d)
  {
  }
};

/// ...target (parameters and array/object pattern rests)
class RestElement : public NodeBase<RestElement, Pattern, NodeKind::RestElement>
{
public:
  Pattern * target;

  explicit RestElement(Pattern * t, SourceRange r = {}) : NodeBase(r), target(t) {}
};

// ============================================================================
// Supporting Nodes
// ============================================================================

class VarDeclarator : public NodeBase<VarDeclarator, AstNode, NodeKind::VarDeclarator>
{
public:
  Pattern * target;
  Expr * init = nullptr;

  VarDeclarator(Pattern * t, Expr * i, SourceRange r = {}) : NodeBase(r), target(t), init(i) {}
};

/**
 * Object literal member `key: value`, method, getter or setter.
 *
 * Methods and accessors store their FunctionExpr in `value`. A computed key
 * `[expr]: v` keeps the expression in `computed_key` and an empty `key`.
 */
class Property : public NodeBase<Property, AstNode, NodeKind::Property>
{
public:
  std::string_view key;
  SourceRange key_range;
  Expr * computed_key = nullptr;
  Expr * value = nullptr;
  bool is_method = false;

  Property(std::string_view k, SourceRange kr, Expr * ck, Expr * v, SourceRange r = {})
  : NodeBase(r), key(k), key_range(kr), computed_key(ck), value(v)
  {
  }
};

/// `{ x }` in an object literal: both a key and a read of `x`.
class ShorthandProperty
: public NodeBase<ShorthandProperty, AstNode, NodeKind::ShorthandProperty>
{
public:
  Identifier * value;

  explicit ShorthandProperty(Identifier * v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/**
 * Member of an ObjectPattern: `a`, `a = 1`, `a: b`, `a: { c }`, `[k]: v`.
 *
 * `key` is the property read from the source object; `value` is the pattern
 * it is bound to (a BindingIdent for the simple and renamed forms).
 */
class BindingProperty : public NodeBase<BindingProperty, AstNode, NodeKind::BindingProperty>
{
public:
  std::string_view key;
  SourceRange key_range;
  Expr * computed_key = nullptr;
  Pattern * value;
  bool shorthand = false;

  BindingProperty(std::string_view k, SourceRange kr, Pattern * v, SourceRange r = {})
  : NodeBase(r), key(k), key_range(kr), value(v)
  {
  }
};

class SwitchCase : public NodeBase<SwitchCase, AstNode, NodeKind::SwitchCase>
{
public:
  Expr * test;  ///< nullptr for `default:`
  gsl::span<Stmt *> body;

  SwitchCase(Expr * t, gsl::span<Stmt *> b, SourceRange r = {}) : NodeBase(r), test(t), body(b) {}
};

class CatchClause : public NodeBase<CatchClause, AstNode, NodeKind::CatchClause>
{
public:
  Pattern * param = nullptr;
  BlockStmt * body;

  CatchClause(Pattern * p, BlockStmt * b, SourceRange r = {}) : NodeBase(r), param(p), body(b) {}
};

class ImportSpecifier : public NodeBase<ImportSpecifier, AstNode, NodeKind::ImportSpecifier>
{
public:
  ImportKind import_kind;
  std::string_view imported;  ///< Exported name in the source module ("default" / "*")
  std::string_view local;     ///< Local binding name

  ImportSpecifier(ImportKind k, std::string_view imp, std::string_view loc, SourceRange r = {})
  : NodeBase(r), import_kind(k), imported(imp), local(loc)
  {
  }
};

/// name, name="text", name={expr}, name=<el/>
class JsxAttribute : public NodeBase<JsxAttribute, AstNode, NodeKind::JsxAttribute>
{
public:
  std::string_view name;
  SourceRange name_range;
  AstNode * value = nullptr;  ///< nullptr, string LiteralExpr, JsxExpressionContainer or JSX

  JsxAttribute(std::string_view n, SourceRange nr, AstNode * v, SourceRange r = {})
  : NodeBase(r), name(n), name_range(nr), value(v)
  {
  }
};

class JsxSpreadAttribute
: public NodeBase<JsxSpreadAttribute, AstNode, NodeKind::JsxSpreadAttribute>
{
public:
  Expr * argument;

  explicit JsxSpreadAttribute(Expr * a, SourceRange r = {}) : NodeBase(r), argument(a) {}
};

/// { expr } inside JSX. The range includes the braces; `expression` is null for `{}`.
class JsxExpressionContainer
: public NodeBase<JsxExpressionContainer, AstNode, NodeKind::JsxExpressionContainer>
{
public:
  Expr * expression = nullptr;

  explicit JsxExpressionContainer(Expr * e, SourceRange r = {}) : NodeBase(r), expression(e) {}
};

class JsxText : public NodeBase<JsxText, AstNode, NodeKind::JsxText>
{
public:
  std::string_view raw;

  explicit JsxText(std::string_view t, SourceRange r = {}) : NodeBase(r), raw(t) {}
};

// ============================================================================
// Statement Nodes
// ============================================================================

class VarStmt : public NodeBase<VarStmt, Stmt, NodeKind::VarStmt>
{
public:
  VarKind var_kind;
  gsl::span<VarDeclarator *> declarators;
  SourceRange keyword_range;

  VarStmt(VarKind k, gsl::span<VarDeclarator *> d, SourceRange kw, SourceRange r = {})
  : NodeBase(r), var_kind(k), declarators(d), keyword_range(kw)
  {
  }
};

class FunctionDecl : public NodeBase<FunctionDecl, Stmt, NodeKind::FunctionDecl>
{
public:
  FunctionData fn;

  explicit FunctionDecl(FunctionData f, SourceRange r = {}) : NodeBase(r), fn(f) {}
};

class ClassDecl : public NodeBase<ClassDecl, Stmt, NodeKind::ClassDecl>
{
public:
  std::string_view name;
  Expr * heritage = nullptr;

  ClassDecl(std::string_view n, Expr * h, SourceRange r = {}) : NodeBase(r), name(n), heritage(h)
  {
  }
};

class ReturnStmt : public NodeBase<ReturnStmt, Stmt, NodeKind::Return>
{
public:
  Expr * argument = nullptr;

  explicit ReturnStmt(Expr * a, SourceRange r = {}) : NodeBase(r), argument(a) {}
};

class IfStmt : public NodeBase<IfStmt, Stmt, NodeKind::If>
{
public:
  Expr * test;
  Stmt * consequent;
  Stmt * alternate = nullptr;

  IfStmt(Expr * t, Stmt * c, Stmt * a, SourceRange r = {})
  : NodeBase(r), test(t), consequent(c), alternate(a)
  {
  }
};

class ForStmt : public NodeBase<ForStmt, Stmt, NodeKind::For>
{
public:
  AstNode * init = nullptr;  ///< VarStmt or Expr
  Expr * test = nullptr;
  Expr * update = nullptr;
  Stmt * body;

  ForStmt(AstNode * i, Expr * t, Expr * u, Stmt * b, SourceRange r = {})
  : NodeBase(r), init(i), test(t), update(u), body(b)
  {
  }
};

/// for (left in right) / for (left of right) / for await (left of right)
class ForInOfStmt : public NodeBase<ForInOfStmt, Stmt, NodeKind::ForInOf>
{
public:
  AstNode * left;  ///< VarStmt or Expr
  Expr * right;
  Stmt * body;
  bool is_of;

  ForInOfStmt(AstNode * l, Expr * rt, Stmt * b, bool of, SourceRange r = {})
  : NodeBase(r), left(l), right(rt), body(b), is_of(of)
  {
  }
};

class WhileStmt : public NodeBase<WhileStmt, Stmt, NodeKind::While>
{
public:
  Expr * test;
  Stmt * body;

  WhileStmt(Expr * t, Stmt * b, SourceRange r = {}) : NodeBase(r), test(t), body(b) {}
};

class DoWhileStmt : public NodeBase<DoWhileStmt, Stmt, NodeKind::DoWhile>
{
public:
  Stmt * body;
  Expr * test;

  DoWhileStmt(Stmt * b, Expr * t, SourceRange r = {}) : NodeBase(r), body(b), test(t) {}
};

class BlockStmt : public NodeBase<BlockStmt, Stmt, NodeKind::Block>
{
public:
  gsl::span<Stmt *> body;

  explicit BlockStmt(gsl::span<Stmt *> b, SourceRange r = {}) : NodeBase(r), body(b) {}
};

class ExprStmt : public NodeBase<ExprStmt, Stmt, NodeKind::ExprStmt>
{
public:
  Expr * expr;

  explicit ExprStmt(Expr * e, SourceRange r = {}) : NodeBase(r), expr(e) {}
};

/// break / continue (optionally labelled) and debugger.
class JumpStmt : public NodeBase<JumpStmt, Stmt, NodeKind::Jump>
{
public:
  JumpKind jump_kind;
  std::string_view label;

  JumpStmt(JumpKind k, std::string_view l, SourceRange r = {}) : NodeBase(r), jump_kind(k), label(l)
  {
  }
};

class ThrowStmt : public NodeBase<ThrowStmt, Stmt, NodeKind::Throw>
{
public:
  Expr * argument;

  explicit ThrowStmt(Expr * a, SourceRange r = {}) : NodeBase(r), argument(a) {}
};

class TryStmt : public NodeBase<TryStmt, Stmt, NodeKind::Try>
{
public:
  BlockStmt * block;
  CatchClause * handler = nullptr;
  BlockStmt * finalizer = nullptr;

  TryStmt(BlockStmt * b, CatchClause * h, BlockStmt * f, SourceRange r = {})
  : NodeBase(r), block(b), handler(h), finalizer(f)
  {
  }
};

class SwitchStmt : public NodeBase<SwitchStmt, Stmt, NodeKind::Switch>
{
public:
  Expr * discriminant;
  gsl::span<SwitchCase *> cases;

  SwitchStmt(Expr * d, gsl::span<SwitchCase *> c, SourceRange r = {})
  : NodeBase(r), discriminant(d), cases(c)
  {
  }
};

class LabeledStmt : public NodeBase<LabeledStmt, Stmt, NodeKind::Labeled>
{
public:
  std::string_view label;
  Stmt * body;

  LabeledStmt(std::string_view l, Stmt * b, SourceRange r = {}) : NodeBase(r), label(l), body(b) {}
};

class EmptyStmt : public NodeBase<EmptyStmt, Stmt, NodeKind::Empty>
{
public:
  explicit EmptyStmt(SourceRange r = {}) : NodeBase(r) {}
};

class ImportDecl : public NodeBase<ImportDecl, Stmt, NodeKind::Import>
{
public:
  std::string_view module;  ///< Module specifier without quotes
  gsl::span<ImportSpecifier *> specifiers;
  bool type_only = false;

  ImportDecl(std::string_view m, gsl::span<ImportSpecifier *> s, bool t, SourceRange r = {})
  : NodeBase(r), module(m), specifiers(s), type_only(t)
  {
  }
};

/**
 * export <decl> / export default <decl|expr> / export { a as b } [from 'm'] / export * from 'm'.
 *
 * Only the declaration or default expression is modelled; specifier lists
 * are kept as source text.
 */
class ExportDecl : public NodeBase<ExportDecl, Stmt, NodeKind::Export>
{
public:
  Stmt * declaration = nullptr;
  Expr * default_expr = nullptr;
  bool is_default = false;

  ExportDecl(Stmt * d, Expr * e, bool def, SourceRange r = {})
  : NodeBase(r), declaration(d), default_expr(e), is_default(def)
  {
  }
};

/// interface / type / enum / declare / namespace: kept verbatim.
class TypeDeclStmt : public NodeBase<TypeDeclStmt, Stmt, NodeKind::TypeDecl>
{
public:
  TypeDeclKind decl_kind;
  std::string_view name;

  TypeDeclStmt(TypeDeclKind k, std::string_view n, SourceRange r = {})
  : NodeBase(r), decl_kind(k), name(n)
  {
  }
};

// ============================================================================
// Top-level
// ============================================================================

class Program : public NodeBase<Program, AstNode, NodeKind::Program>
{
public:
  gsl::span<Stmt *> body;

  explicit Program(gsl::span<Stmt *> b, SourceRange r = {}) : NodeBase(r), body(b) {}
};

// ============================================================================
// Helpers
// ============================================================================

inline bool FunctionData::has_expression_body() const noexcept
{
  return body != nullptr && !isa<BlockStmt>(body);
}

inline BlockStmt * FunctionData::block_body() const noexcept { return dyn_cast<BlockStmt>(body); }

/// FunctionData of a FunctionDecl / FunctionExpr / ArrowFunctionExpr, else nullptr.
[[nodiscard]] const FunctionData * function_data(const AstNode * node) noexcept;

/// Strip ParenExpr and TypeWrapperExpr layers.
[[nodiscard]] const Expr * skip_parens(const Expr * e) noexcept;

}  // namespace reactc
