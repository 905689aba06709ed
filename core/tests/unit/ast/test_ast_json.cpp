#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "reactc/ast/ast_json.hpp"
#include "reactc/test_support/parse_helpers.hpp"

using reactc::test_support::parse;

TEST(AstJson, NullNodeIsNull)
{
  EXPECT_TRUE(reactc::to_json(nullptr).is_null());
}

TEST(AstJson, VarStmtShape)
{
  auto unit = parse("let x = 1;");
  ASSERT_FALSE(unit->diags.has_errors());

  const nlohmann::json j = reactc::to_json(unit->program);
  EXPECT_EQ(j["type"], "program");
  EXPECT_EQ(j["range"]["start"], 0);
  ASSERT_EQ(j["children"].size(), 1u);

  const auto & stmt = j["children"][0];
  EXPECT_EQ(stmt["type"], "var_stmt");
  EXPECT_EQ(stmt["kind"], "let");
  EXPECT_EQ(stmt["range"]["end"], 10);

  const auto & decl = stmt["children"][0];
  EXPECT_EQ(decl["type"], "var_declarator");
  ASSERT_EQ(decl["children"].size(), 2u);
  EXPECT_EQ(decl["children"][0]["type"], "binding_ident");
  EXPECT_EQ(decl["children"][0]["name"], "x");
  EXPECT_EQ(decl["children"][1]["type"], "literal");
  EXPECT_EQ(decl["children"][1]["raw"], "1");
  EXPECT_FALSE(decl["children"][1].contains("children"));
}

TEST(AstJson, FunctionAndJsxAttributes)
{
  auto unit = parse("function App(a, b) { return <Card title=\"x\" />; }");
  ASSERT_FALSE(unit->diags.has_errors());

  const nlohmann::json j = reactc::to_json(unit->program);
  const auto & fn = j["children"][0];
  EXPECT_EQ(fn["type"], "function_decl");
  EXPECT_EQ(fn["name"], "App");
  EXPECT_EQ(fn["paramCount"], 2);
  EXPECT_EQ(fn["expressionBody"], false);

  // The serialized tree contains the component element somewhere below.
  const std::string dump = j.dump();
  EXPECT_NE(dump.find("\"tag\":\"Card\""), std::string::npos);
  EXPECT_NE(dump.find("\"component\":true"), std::string::npos);
  EXPECT_NE(dump.find("\"type\":\"jsx_attribute\""), std::string::npos);
}
