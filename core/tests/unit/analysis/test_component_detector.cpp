#include <gtest/gtest.h>

#include "reactc/analysis/component_detector.hpp"
#include "reactc/test_support/parse_helpers.hpp"

using reactc::test_support::analyze;

TEST(AnalysisComponentDetector, FindsDeclarationsArrowsAndExports)
{
  const auto mod = analyze(
    "function Plain() { return <div />; }\n"
    "export function Exported() { return (<span>hi</span>); }\n"
    "const Arrow = () => <p />;\n"
    "export const Expr = function () { return <></>; };\n"
    "export default function () { return <main />; }\n");
  ASSERT_TRUE(mod.ok());
  ASSERT_EQ(mod.components.size(), 5u);
  EXPECT_EQ(mod.components[0].name, "Plain");
  EXPECT_EQ(mod.components[1].name, "Exported");
  EXPECT_EQ(mod.components[2].name, "Arrow");
  EXPECT_EQ(mod.components[3].name, "Expr");
  EXPECT_EQ(mod.components[4].name, "default");

  EXPECT_EQ(mod.slice(mod.components[0].name_range), "Plain");
  EXPECT_EQ(mod.slice(mod.components[2].body), "<p />");
}

TEST(AnalysisComponentDetector, IgnoresFunctionsWithoutJsx)
{
  const auto mod = analyze(
    "function helper() { return 1; }\n"
    "const format = (x) => `${x}`;\n"
    "var Legacy = () => <div />;\n");
  ASSERT_TRUE(mod.ok());
  EXPECT_TRUE(mod.components.empty());
}

TEST(AnalysisComponentDetector, NestedReturnsDoNotCount)
{
  const auto mod = analyze(
    "function Outer() {\n"
    "  const render = () => { return <div />; };\n"
    "  return render;\n"
    "}\n");
  ASSERT_TRUE(mod.ok());
  EXPECT_TRUE(mod.components.empty());
}

TEST(AnalysisComponentDetector, ConditionalAndLogicalReturns)
{
  const auto mod = analyze(
    "function Maybe(props) {\n"
    "  if (props.hidden) {\n"
    "    return null;\n"
    "  }\n"
    "  return props.ok ? <b /> : null;\n"
    "}\n"
    "const Guard = (props) => props.show && <i />;\n");
  ASSERT_TRUE(mod.ok());
  ASSERT_EQ(mod.components.size(), 2u);
  EXPECT_EQ(mod.components[0].name, "Maybe");
  EXPECT_EQ(mod.components[1].name, "Guard");
}

TEST(AnalysisComponentDetector, ReturnInsideControlFlowCounts)
{
  const auto mod = analyze(
    "function Switchy(props) {\n"
    "  switch (props.kind) {\n"
    "    case 'a':\n"
    "      return <A />;\n"
    "    default:\n"
    "      return null;\n"
    "  }\n"
    "}\n");
  ASSERT_TRUE(mod.ok());
  ASSERT_EQ(mod.components.size(), 1u);
}

TEST(AnalysisComponentDetector, RecordsParameterShape)
{
  const auto mod = analyze(
    "function NoProps() { return <div />; }\n"
    "function WithProps(props) { return <div />; }\n"
    "function Destructured({ title, body }) { return <div />; }\n"
    "function Defaulted({ title } = {}) { return <div />; }\n");
  ASSERT_TRUE(mod.ok());
  ASSERT_EQ(mod.components.size(), 4u);

  EXPECT_EQ(mod.components[0].params.count, 0u);
  EXPECT_FALSE(mod.components[0].params.first_param.is_valid());

  EXPECT_EQ(mod.components[1].params.count, 1u);
  EXPECT_FALSE(mod.components[1].params.has_destructured_props);

  EXPECT_TRUE(mod.components[2].params.has_destructured_props);
  EXPECT_EQ(mod.slice(mod.components[2].params.first_param), "{ title, body }");

  EXPECT_TRUE(mod.components[3].params.has_destructured_props);
}
