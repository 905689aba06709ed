#include <gtest/gtest.h>

#include <string>

#include "reactc/ast/ast.hpp"
#include "reactc/test_support/parse_helpers.hpp"

using namespace reactc;
using reactc::test_support::parse;

namespace
{

const ReturnStmt * first_return(const BlockStmt * block)
{
  for (const Stmt * s : block->body) {
    if (const auto * ret = dyn_cast<ReturnStmt>(s)) {
      return ret;
    }
  }
  return nullptr;
}

}  // namespace

TEST(SyntaxParser, ParsesImportForms)
{
  auto unit = parse(
    "import React from 'react';\n"
    "import { signal as s, computed } from '@vertz/ui';\n"
    "import * as ns from './ns';\n"
    "import type { Props } from './types';\n"
    "import './side-effect.css';\n");
  ASSERT_FALSE(unit->diags.has_errors());
  ASSERT_EQ(unit->program->body.size(), 5u);

  const auto * def = dyn_cast<ImportDecl>(unit->program->body[0]);
  ASSERT_NE(def, nullptr);
  EXPECT_EQ(def->module, "react");
  ASSERT_EQ(def->specifiers.size(), 1u);
  EXPECT_EQ(def->specifiers[0]->import_kind, ImportKind::Default);
  EXPECT_EQ(def->specifiers[0]->local, "React");

  const auto * named = dyn_cast<ImportDecl>(unit->program->body[1]);
  ASSERT_NE(named, nullptr);
  ASSERT_EQ(named->specifiers.size(), 2u);
  EXPECT_EQ(named->specifiers[0]->imported, "signal");
  EXPECT_EQ(named->specifiers[0]->local, "s");
  EXPECT_EQ(named->specifiers[1]->local, "computed");

  const auto * ns = dyn_cast<ImportDecl>(unit->program->body[2]);
  ASSERT_NE(ns, nullptr);
  ASSERT_EQ(ns->specifiers.size(), 1u);
  EXPECT_EQ(ns->specifiers[0]->import_kind, ImportKind::Namespace);
  EXPECT_EQ(ns->specifiers[0]->local, "ns");

  const auto * side = dyn_cast<ImportDecl>(unit->program->body[4]);
  ASSERT_NE(side, nullptr);
  EXPECT_EQ(side->module, "./side-effect.css");
  EXPECT_TRUE(side->specifiers.empty());
}

TEST(SyntaxParser, VarStmtRangeIncludesSemicolon)
{
  const std::string src = "let count = 0;\nconst a = 1, b = 2\n";
  auto unit = parse(src);
  ASSERT_FALSE(unit->diags.has_errors());
  ASSERT_EQ(unit->program->body.size(), 2u);

  const auto * first = dyn_cast<VarStmt>(unit->program->body[0]);
  ASSERT_NE(first, nullptr);
  EXPECT_EQ(first->var_kind, VarKind::Let);
  EXPECT_EQ(unit->slice(first->get_range()), "let count = 0;");
  EXPECT_EQ(unit->slice(first->keyword_range), "let");

  const auto * second = dyn_cast<VarStmt>(unit->program->body[1]);
  ASSERT_NE(second, nullptr);
  EXPECT_EQ(second->declarators.size(), 2u);
  EXPECT_EQ(unit->slice(second->get_range()), "const a = 1, b = 2");
}

TEST(SyntaxParser, ComponentWithJsxBody)
{
  auto unit = parse(
    "export function Counter() {\n"
    "  let count = 0;\n"
    "  return <button class=\"btn\" onClick={() => count++}>Count: {count}</button>;\n"
    "}\n");
  ASSERT_FALSE(unit->diags.has_errors());
  ASSERT_EQ(unit->program->body.size(), 1u);

  const auto * exp = dyn_cast<ExportDecl>(unit->program->body[0]);
  ASSERT_NE(exp, nullptr);
  const auto * fn = dyn_cast<FunctionDecl>(exp->declaration);
  ASSERT_NE(fn, nullptr);
  EXPECT_EQ(fn->fn.name, "Counter");

  const ReturnStmt * ret = first_return(fn->fn.block_body());
  ASSERT_NE(ret, nullptr);
  const auto * el = dyn_cast<JsxElement>(skip_parens(ret->argument));
  ASSERT_NE(el, nullptr);
  EXPECT_EQ(el->tag, "button");
  EXPECT_FALSE(el->is_component());
  EXPECT_FALSE(el->self_closing);

  ASSERT_EQ(el->attributes.size(), 2u);
  const auto * cls = dyn_cast<JsxAttribute>(el->attributes[0]);
  ASSERT_NE(cls, nullptr);
  EXPECT_EQ(cls->name, "class");
  const auto * cls_value = dyn_cast<LiteralExpr>(cls->value);
  ASSERT_NE(cls_value, nullptr);
  EXPECT_EQ(cls_value->raw, "\"btn\"");

  const auto * on_click = dyn_cast<JsxAttribute>(el->attributes[1]);
  ASSERT_NE(on_click, nullptr);
  const auto * handler = dyn_cast<JsxExpressionContainer>(on_click->value);
  ASSERT_NE(handler, nullptr);
  EXPECT_TRUE(isa<ArrowFunctionExpr>(handler->expression));

  ASSERT_EQ(el->children.size(), 2u);
  const auto * text = dyn_cast<JsxText>(el->children[0]);
  ASSERT_NE(text, nullptr);
  EXPECT_EQ(text->raw, "Count: ");
  const auto * container = dyn_cast<JsxExpressionContainer>(el->children[1]);
  ASSERT_NE(container, nullptr);
  EXPECT_EQ(unit->slice(container->get_range()), "{count}");
}

TEST(SyntaxParser, NestedElementsFragmentsAndComponents)
{
  auto unit = parse(
    "const App = () => (\n"
    "  <>\n"
    "    <Layout.Header title={t} />\n"
    "    <ul>{items.map((i) => <li key={i.id}>{i.name}</li>)}</ul>\n"
    "  </>\n"
    ");\n");
  ASSERT_FALSE(unit->diags.has_errors());

  const auto * stmt = dyn_cast<VarStmt>(unit->program->body[0]);
  ASSERT_NE(stmt, nullptr);
  const auto * arrow = dyn_cast<ArrowFunctionExpr>(stmt->declarators[0]->init);
  ASSERT_NE(arrow, nullptr);
  const auto * frag = dyn_cast<JsxFragment>(skip_parens(dyn_cast<Expr>(arrow->fn.body)));
  ASSERT_NE(frag, nullptr);

  const JsxElement * header = nullptr;
  const JsxElement * list = nullptr;
  for (const AstNode * child : frag->children) {
    if (const auto * el = dyn_cast<JsxElement>(child)) {
      (el->tag == "ul" ? list : header) = el;
    }
  }
  ASSERT_NE(header, nullptr);
  EXPECT_EQ(header->tag, "Layout.Header");
  EXPECT_TRUE(header->is_component());
  EXPECT_TRUE(header->self_closing);

  ASSERT_NE(list, nullptr);
  ASSERT_EQ(list->children.size(), 1u);
  const auto * map = dyn_cast<JsxExpressionContainer>(list->children[0]);
  ASSERT_NE(map, nullptr);
  EXPECT_TRUE(isa<CallExpr>(map->expression));
}

TEST(SyntaxParser, TypeScriptSyntaxIsSkipped)
{
  auto unit = parse(
    "interface Props { label: string; onClick?: () => void }\n"
    "type Id = string | number;\n"
    "enum Color { Red, Green }\n"
    "export function Field<T,>(props: Props): JSX.Element {\n"
    "  const value = props.label as string;\n"
    "  const n = (props as any)!.count satisfies number;\n"
    "  return <span>{value}</span>;\n"
    "}\n");
  ASSERT_FALSE(unit->diags.has_errors());
  ASSERT_EQ(unit->program->body.size(), 4u);

  const auto * iface = dyn_cast<TypeDeclStmt>(unit->program->body[0]);
  ASSERT_NE(iface, nullptr);
  EXPECT_EQ(iface->decl_kind, TypeDeclKind::Interface);
  EXPECT_EQ(iface->name, "Props");

  const auto * alias = dyn_cast<TypeDeclStmt>(unit->program->body[1]);
  ASSERT_NE(alias, nullptr);
  EXPECT_EQ(alias->decl_kind, TypeDeclKind::TypeAlias);

  const auto * en = dyn_cast<TypeDeclStmt>(unit->program->body[2]);
  ASSERT_NE(en, nullptr);
  EXPECT_EQ(en->decl_kind, TypeDeclKind::Enum);

  const auto * exp = dyn_cast<ExportDecl>(unit->program->body[3]);
  ASSERT_NE(exp, nullptr);
  const auto * fn = dyn_cast<FunctionDecl>(exp->declaration);
  ASSERT_NE(fn, nullptr);
  ASSERT_EQ(fn->fn.params.size(), 1u);
  const auto * param = dyn_cast<BindingIdent>(fn->fn.params[0]);
  ASSERT_NE(param, nullptr);
  EXPECT_EQ(param->name, "props");

  const auto * value = dyn_cast<VarStmt>(fn->fn.block_body()->body[0]);
  ASSERT_NE(value, nullptr);
  const Expr * init = value->declarators[0]->init;
  EXPECT_TRUE(isa<TypeWrapperExpr>(init));
  EXPECT_TRUE(isa<MemberExpr>(skip_parens(init)));
}

TEST(SyntaxParser, ReportsSyntaxErrors)
{
  auto unit = parse("function f( {\n  return <div>;\n");
  EXPECT_TRUE(unit->diags.has_errors());
  const auto parse_errors = unit->diags.with_code(diag_codes::k_parse_error);
  ASSERT_FALSE(parse_errors.empty());
  EXPECT_EQ(parse_errors.front().severity, Severity::Error);
  EXPECT_TRUE(parse_errors.front().location.is_valid());
}

TEST(SyntaxParser, UnterminatedJsxElementIsAnError)
{
  auto unit = parse("const x = <div><span></span>\n");
  EXPECT_TRUE(unit->diags.has_errors());
}
