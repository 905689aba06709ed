#include <gtest/gtest.h>

#include <string>

#include "reactc/transform/computed_transformer.hpp"
#include "reactc/transform/signal_transformer.hpp"
#include "reactc/test_support/parse_helpers.hpp"

using namespace reactc;
using reactc::test_support::analyze;

namespace
{

struct Rewritten
{
  std::string code;
  HelperUsage helpers;
};

/// Signal pass followed by the computed pass, as the driver runs them.
Rewritten rewrite(const std::string & src)
{
  const auto mod = analyze(src);
  EXPECT_TRUE(mod.ok());
  Rewritten out;
  if (!mod.ok() || mod.components.empty()) {
    out.code = src;
    return out;
  }
  const auto variables = mod.classify();
  EditBuffer buffer(src);
  SignalTransformer().transform(buffer, mod.components[0], variables, {}, out.helpers);
  ComputedTransformer().transform(buffer, mod.components[0], variables, out.helpers);
  out.code = buffer.to_string();
  return out;
}

}  // namespace

TEST(TransformComputed, WrapsDerivedConstants)
{
  const auto out = rewrite(
    "function C() {\n"
    "  let count = 0;\n"
    "  const doubled = count * 2;\n"
    "  const label = `x${doubled}`;\n"
    "  return <p>{label}</p>;\n"
    "}\n");
  EXPECT_EQ(
    out.code,
    "function C() {\n"
    "  const count = signal(0);\n"
    "  const doubled = computed(() => count.value * 2);\n"
    "  const label = computed(() => `x${doubled.value}`);\n"
    "  return <p>{label.value}</p>;\n"
    "}\n");
  EXPECT_EQ(out.helpers.runtime, (NameSet{"computed", "signal"}));
}

TEST(TransformComputed, SecondReadRewriteLeavesTheBufferUnchanged)
{
  const std::string src =
    "function C() {\n"
    "  let count = 0;\n"
    "  const doubled = count * 2;\n"
    "  const label = `x${doubled}`;\n"
    "  return <p title={doubled}>{label}</p>;\n"
    "}\n";
  const auto mod = analyze(src);
  ASSERT_TRUE(mod.ok());
  const auto variables = mod.classify();
  EditBuffer buffer(src);
  HelperUsage helpers;
  SignalTransformer().transform(buffer, mod.components[0], variables, {}, helpers);
  ComputedTransformer().transform(buffer, mod.components[0], variables, helpers);
  const std::string once = buffer.to_string();

  const AstNode * body = mod.components[0].body_node();
  rewrite_reads(buffer, body, names_of_kind(variables, ReactivityKind::Signal));
  rewrite_reads(buffer, body, names_of_kind(variables, ReactivityKind::Computed));
  EXPECT_EQ(buffer.to_string(), once);
  EXPECT_EQ(once.find(".value.value"), std::string::npos);
}

TEST(TransformComputed, ObjectLiteralBodyIsParenthesised)
{
  const auto out = rewrite(
    "function C() {\n"
    "  let n = 0;\n"
    "  const style = { width: n };\n"
    "  return <p />;\n"
    "}\n");
  EXPECT_NE(
    out.code.find("const style = computed(() => ({ width: n.value }));"), std::string::npos);
}

TEST(TransformComputed, StaticConstantsAreUntouched)
{
  const std::string src =
    "function C() {\n"
    "  const items = [1, 2, 3];\n"
    "  const total = items.length;\n"
    "  return <p>{total}</p>;\n"
    "}\n";
  const auto out = rewrite(src);
  EXPECT_EQ(out.code, src);
  EXPECT_TRUE(out.helpers.empty());
}

TEST(TransformComputed, SignalApiDestructuringCapturesOnce)
{
  const auto out = rewrite(
    "import { query } from '@vertz/ui';\n"
    "function C() {\n"
    "  const { data: list, refetch } = query(() => load());\n"
    "  return <p onClick={refetch}>{list}</p>;\n"
    "}\n");
  EXPECT_NE(
    out.code.find(
      "  const __query_0 = query(() => load());\n"
      "  const list = computed(() => __query_0.data.value);\n"
      "  const refetch = __query_0.refetch;\n"),
    std::string::npos);
  EXPECT_NE(out.code.find("{list.value}"), std::string::npos);
  EXPECT_NE(out.code.find("onClick={refetch}"), std::string::npos);
}

TEST(TransformComputed, ReactiveDestructuringReadsThroughExpression)
{
  const auto out = rewrite(
    "function C() {\n"
    "  let user = { name: 'a', age: 1 };\n"
    "  const { name, age } = user;\n"
    "  return <p>{name}{age}</p>;\n"
    "}\n");
  EXPECT_NE(
    out.code.find(
      "  const name = computed(() => user.value.name);\n"
      "  const age = computed(() => user.value.age);\n"),
    std::string::npos);
}

TEST(TransformComputed, ComplexSourceExpressionIsParenthesised)
{
  const auto out = rewrite(
    "function C() {\n"
    "  let a = null;\n"
    "  const { x } = a ?? fallback;\n"
    "  return <p>{x}</p>;\n"
    "}\n");
  EXPECT_NE(out.code.find("const x = computed(() => (a.value ?? fallback).x);"), std::string::npos);
}

TEST(TransformComputed, ReactiveSourceDestructuring)
{
  const auto out = rewrite(
    "import { useContext } from '@vertz/ui';\n"
    "function C() {\n"
    "  const { mode } = useContext(Theme);\n"
    "  return <p>{mode}</p>;\n"
    "}\n");
  EXPECT_NE(
    out.code.find("const mode = computed(() => useContext(Theme).mode);"), std::string::npos);
  EXPECT_NE(out.code.find("{mode.value}"), std::string::npos);
}
