// reactc/ast/ast_walk.cpp - Child enumeration for every node kind
#include "reactc/ast/ast_walk.hpp"

namespace reactc
{

namespace
{

template <typename Span>
void each(const Span & items, const ChildFn & fn)
{
  for (const auto * item : items) {
    if (item != nullptr) {
      fn(item);
    }
  }
}

void opt(const AstNode * node, const ChildFn & fn)
{
  if (node != nullptr) {
    fn(node);
  }
}

void function_children(const FunctionData & f, const ChildFn & fn)
{
  each(f.params, fn);
  opt(f.body, fn);
}

}  // namespace

void for_each_child(const AstNode * node, const ChildFn & fn)
{
  if (node == nullptr) {
    return;
  }

  switch (node->get_kind()) {
    // Leaves
    case NodeKind::Identifier:
    case NodeKind::Literal:
    case NodeKind::This:
    case NodeKind::Super:
    case NodeKind::Opaque:
    case NodeKind::Missing:
    case NodeKind::BindingIdent:
    case NodeKind::ImportSpecifier:
    case NodeKind::JsxText:
    case NodeKind::Jump:
    case NodeKind::Empty:
    case NodeKind::TypeDecl:
      return;

    case NodeKind::TemplateLiteral:
      each(cast<TemplateLiteralExpr>(node)->substitutions, fn);
      return;
    case NodeKind::TaggedTemplate: {
      const auto * n = cast<TaggedTemplateExpr>(node);
      opt(n->tag, fn);
      opt(n->quasi, fn);
      return;
    }
    case NodeKind::ArrayLiteral:
      each(cast<ArrayLiteralExpr>(node)->elements, fn);
      return;
    case NodeKind::ObjectLiteral:
      each(cast<ObjectLiteralExpr>(node)->members, fn);
      return;
    case NodeKind::FunctionExpr:
      function_children(cast<FunctionExpr>(node)->fn, fn);
      return;
    case NodeKind::ArrowFunction:
      function_children(cast<ArrowFunctionExpr>(node)->fn, fn);
      return;
    case NodeKind::ClassExpr:
      opt(cast<ClassExpr>(node)->heritage, fn);
      return;
    case NodeKind::Unary:
      opt(cast<UnaryExpr>(node)->operand, fn);
      return;
    case NodeKind::Update:
      opt(cast<UpdateExpr>(node)->operand, fn);
      return;
    case NodeKind::Binary: {
      const auto * n = cast<BinaryExpr>(node);
      opt(n->lhs, fn);
      opt(n->rhs, fn);
      return;
    }
    case NodeKind::Assign: {
      const auto * n = cast<AssignExpr>(node);
      opt(n->target, fn);
      opt(n->value, fn);
      return;
    }
    case NodeKind::Conditional: {
      const auto * n = cast<ConditionalExpr>(node);
      opt(n->test, fn);
      opt(n->consequent, fn);
      opt(n->alternate, fn);
      return;
    }
    case NodeKind::Call: {
      const auto * n = cast<CallExpr>(node);
      opt(n->callee, fn);
      each(n->args, fn);
      return;
    }
    case NodeKind::New: {
      const auto * n = cast<NewExpr>(node);
      opt(n->callee, fn);
      each(n->args, fn);
      return;
    }
    case NodeKind::Member:
      opt(cast<MemberExpr>(node)->object, fn);
      return;
    case NodeKind::Index: {
      const auto * n = cast<IndexExpr>(node);
      opt(n->object, fn);
      opt(n->index, fn);
      return;
    }
    case NodeKind::Sequence:
      each(cast<SequenceExpr>(node)->exprs, fn);
      return;
    case NodeKind::Paren:
      opt(cast<ParenExpr>(node)->inner, fn);
      return;
    case NodeKind::Spread:
      opt(cast<SpreadElement>(node)->argument, fn);
      return;
    case NodeKind::Yield:
      opt(cast<YieldExpr>(node)->argument, fn);
      return;
    case NodeKind::Await:
      opt(cast<AwaitExpr>(node)->argument, fn);
      return;
    case NodeKind::TypeWrapper:
      opt(cast<TypeWrapperExpr>(node)->inner, fn);
      return;

    case NodeKind::JsxElement: {
      const auto * n = cast<JsxElement>(node);
      each(n->attributes, fn);
      each(n->children, fn);
      return;
    }
    case NodeKind::JsxFragment:
      each(cast<JsxFragment>(node)->children, fn);
      return;

    case NodeKind::ObjectPattern: {
      const auto * n = cast<ObjectPattern>(node);
      each(n->properties, fn);
      opt(n->rest, fn);
      return;
    }
    case NodeKind::ArrayPattern: {
      const auto * n = cast<ArrayPattern>(node);
      each(n->elements, fn);
      opt(n->rest, fn);
      return;
    }
    case NodeKind::AssignPattern: {
      const auto * n = cast<AssignPattern>(node);
      opt(n->target, fn);
      opt(n->default_value, fn);
      return;
    }
    case NodeKind::RestElement:
      opt(cast<RestElement>(node)->target, fn);
      return;

    case NodeKind::VarStmt:
      each(cast<VarStmt>(node)->declarators, fn);
      return;
    case NodeKind::FunctionDecl:
      function_children(cast<FunctionDecl>(node)->fn, fn);
      return;
    case NodeKind::ClassDecl:
      opt(cast<ClassDecl>(node)->heritage, fn);
      return;
    case NodeKind::Return:
      opt(cast<ReturnStmt>(node)->argument, fn);
      return;
    case NodeKind::If: {
      const auto * n = cast<IfStmt>(node);
      opt(n->test, fn);
      opt(n->consequent, fn);
      opt(n->alternate, fn);
      return;
    }
    case NodeKind::For: {
      const auto * n = cast<ForStmt>(node);
      opt(n->init, fn);
      opt(n->test, fn);
      opt(n->update, fn);
      opt(n->body, fn);
      return;
    }
    case NodeKind::ForInOf: {
      const auto * n = cast<ForInOfStmt>(node);
      opt(n->left, fn);
      opt(n->right, fn);
      opt(n->body, fn);
      return;
    }
    case NodeKind::While: {
      const auto * n = cast<WhileStmt>(node);
      opt(n->test, fn);
      opt(n->body, fn);
      return;
    }
    case NodeKind::DoWhile: {
      const auto * n = cast<DoWhileStmt>(node);
      opt(n->body, fn);
      opt(n->test, fn);
      return;
    }
    case NodeKind::Block:
      each(cast<BlockStmt>(node)->body, fn);
      return;
    case NodeKind::ExprStmt:
      opt(cast<ExprStmt>(node)->expr, fn);
      return;
    case NodeKind::Throw:
      opt(cast<ThrowStmt>(node)->argument, fn);
      return;
    case NodeKind::Try: {
      const auto * n = cast<TryStmt>(node);
      opt(n->block, fn);
      opt(n->handler, fn);
      opt(n->finalizer, fn);
      return;
    }
    case NodeKind::Switch: {
      const auto * n = cast<SwitchStmt>(node);
      opt(n->discriminant, fn);
      each(n->cases, fn);
      return;
    }
    case NodeKind::Labeled:
      opt(cast<LabeledStmt>(node)->body, fn);
      return;
    case NodeKind::Import:
      each(cast<ImportDecl>(node)->specifiers, fn);
      return;
    case NodeKind::Export: {
      const auto * n = cast<ExportDecl>(node);
      opt(n->declaration, fn);
      opt(n->default_expr, fn);
      return;
    }

    case NodeKind::VarDeclarator: {
      const auto * n = cast<VarDeclarator>(node);
      opt(n->target, fn);
      opt(n->init, fn);
      return;
    }
    case NodeKind::Property: {
      const auto * n = cast<Property>(node);
      opt(n->computed_key, fn);
      opt(n->value, fn);
      return;
    }
    case NodeKind::ShorthandProperty:
      opt(cast<ShorthandProperty>(node)->value, fn);
      return;
    case NodeKind::BindingProperty: {
      const auto * n = cast<BindingProperty>(node);
      opt(n->computed_key, fn);
      opt(n->value, fn);
      return;
    }
    case NodeKind::SwitchCase: {
      const auto * n = cast<SwitchCase>(node);
      opt(n->test, fn);
      each(n->body, fn);
      return;
    }
    case NodeKind::CatchClause: {
      const auto * n = cast<CatchClause>(node);
      opt(n->param, fn);
      opt(n->body, fn);
      return;
    }
    case NodeKind::JsxAttribute:
      opt(cast<JsxAttribute>(node)->value, fn);
      return;
    case NodeKind::JsxSpreadAttribute:
      opt(cast<JsxSpreadAttribute>(node)->argument, fn);
      return;
    case NodeKind::JsxExpressionContainer:
      opt(cast<JsxExpressionContainer>(node)->expression, fn);
      return;

    case NodeKind::Program:
      each(cast<Program>(node)->body, fn);
      return;
  }
}

void walk_preorder(const AstNode * root, const WalkFn & fn, const AstNode * parent)
{
  if (root == nullptr || !fn(root, parent)) {
    return;
  }
  for_each_child(root, [&](const AstNode * child) { walk_preorder(child, fn, root); });
}

}  // namespace reactc
