#include <gtest/gtest.h>

#include "reactc/analysis/mutation_detector.hpp"
#include "reactc/test_support/parse_helpers.hpp"

using namespace reactc;
using reactc::test_support::analyze;

TEST(AnalysisMutationDetector, MutationMethods)
{
  EXPECT_TRUE(is_mutation_method("push"));
  EXPECT_TRUE(is_mutation_method("splice"));
  EXPECT_TRUE(is_mutation_method("copyWithin"));
  EXPECT_FALSE(is_mutation_method("map"));
  EXPECT_FALSE(is_mutation_method("concat"));
}

TEST(AnalysisMutationDetector, RecognisesEveryMutationShape)
{
  const auto mod = analyze(
    "function C() {\n"
    "  let items = [];\n"
    "  let state = { a: 1 };\n"
    "  const add = () => items.push(1);\n"
    "  const set = () => { state.a = 2; };\n"
    "  const idx = () => { items[0] = 3; };\n"
    "  const del = () => { delete state.a; };\n"
    "  const bulk = () => Object.assign(state, { b: 1 });\n"
    "  return <div />;\n"
    "}\n");
  ASSERT_TRUE(mod.ok());
  const auto sites = mod.mutations();
  ASSERT_EQ(sites.size(), 5u);

  EXPECT_EQ(sites[0].kind, MutationKind::MethodCall);
  EXPECT_EQ(sites[0].root, "items");
  EXPECT_EQ(sites[0].method, "push");
  EXPECT_EQ(mod.slice(sites[0].range), "items.push(1)");
  EXPECT_EQ(mod.slice(sites[0].root_range), "items");

  EXPECT_EQ(sites[1].kind, MutationKind::PropertyAssign);
  EXPECT_EQ(mod.slice(sites[1].range), "state.a = 2");

  EXPECT_EQ(sites[2].kind, MutationKind::IndexAssign);
  EXPECT_EQ(sites[2].root, "items");

  EXPECT_EQ(sites[3].kind, MutationKind::Delete);
  EXPECT_EQ(mod.slice(sites[3].range), "delete state.a");

  EXPECT_EQ(sites[4].kind, MutationKind::BulkAssign);
  EXPECT_EQ(sites[4].root, "state");
  EXPECT_EQ(mod.slice(sites[4].root_range), "state");
}

TEST(AnalysisMutationDetector, DeepAccessUnwrapsToRoot)
{
  const auto mod = analyze(
    "function C() {\n"
    "  let state = { user: { tags: [] } };\n"
    "  const f = () => state.user.tags.push('x');\n"
    "  return <div />;\n"
    "}\n");
  ASSERT_TRUE(mod.ok());
  const auto sites = mod.mutations();
  ASSERT_EQ(sites.size(), 1u);
  EXPECT_EQ(sites[0].root, "state");
  EXPECT_EQ(mod.slice(sites[0].range), "state.user.tags.push('x')");
}

TEST(AnalysisMutationDetector, OnlySignalRootsAreReported)
{
  const auto mod = analyze(
    "function C() {\n"
    "  const fixed = [];\n"
    "  let items = [];\n"
    "  const f = () => { fixed.push(1); items.push(2); window.x = 1; };\n"
    "  return <div />;\n"
    "}\n");
  ASSERT_TRUE(mod.ok());
  const auto sites = mod.mutations();
  ASSERT_EQ(sites.size(), 1u);
  EXPECT_EQ(sites[0].root, "items");
}

TEST(AnalysisMutationDetector, ShadowedRootsAreIgnored)
{
  const auto mod = analyze(
    "function C() {\n"
    "  let items = [];\n"
    "  const f = (items) => items.push(1);\n"
    "  const g = () => { const items = []; items.push(2); };\n"
    "  return <div />;\n"
    "}\n");
  ASSERT_TRUE(mod.ok());
  EXPECT_TRUE(mod.mutations().empty());
}

TEST(AnalysisMutationDetector, PlainAssignmentIsNotAMutation)
{
  const auto mod = analyze(
    "function C() {\n"
    "  let count = 0;\n"
    "  const f = () => { count = 1; count += 2; };\n"
    "  return <div />;\n"
    "}\n");
  ASSERT_TRUE(mod.ok());
  EXPECT_TRUE(mod.mutations().empty());
}

TEST(AnalysisMutationDetector, MarkupScopeKeepsOnlyRenderedSignals)
{
  const std::string src =
    "function C() {\n"
    "  let shown = [];\n"
    "  let hidden = [];\n"
    "  const f = () => { shown.push(1); hidden.push(2); };\n"
    "  return <ul>{shown.length}</ul>;\n"
    "}\n";
  const auto mod = analyze(src);
  ASSERT_TRUE(mod.ok());

  EXPECT_EQ(mod.mutations(MutationScope::All).size(), 2u);

  const auto markup = mod.mutations(MutationScope::Markup);
  ASSERT_EQ(markup.size(), 1u);
  EXPECT_EQ(markup[0].root, "shown");
}

TEST(AnalysisMutationDetector, FindSitesAcceptsAnyRootSet)
{
  const auto mod = analyze(
    "function C() {\n"
    "  const config = {};\n"
    "  config.debug = true;\n"
    "  return <div />;\n"
    "}\n");
  ASSERT_TRUE(mod.ok());
  const auto sites = MutationDetector::find_sites(mod.components[0], NameSet{"config"});
  ASSERT_EQ(sites.size(), 1u);
  EXPECT_EQ(sites[0].kind, MutationKind::PropertyAssign);
}

TEST(AnalysisMutationDetector, TracksWhetherTheResultIsRead)
{
  const auto mod = analyze(
    "function C() {\n"
    "  let items = [];\n"
    "  const f = () => {\n"
    "    items.sort();\n"
    "    const last = items.pop();\n"
    "    log(items.shift());\n"
    "  };\n"
    "  const g = () => items.reverse();\n"
    "  return <div />;\n"
    "}\n");
  ASSERT_TRUE(mod.ok());
  const auto sites = mod.mutations();
  ASSERT_EQ(sites.size(), 4u);
  EXPECT_EQ(sites[0].method, "sort");
  EXPECT_FALSE(sites[0].value_used);
  EXPECT_EQ(sites[1].method, "pop");
  EXPECT_TRUE(sites[1].value_used);
  EXPECT_EQ(sites[2].method, "shift");
  EXPECT_TRUE(sites[2].value_used);
  EXPECT_EQ(sites[3].method, "reverse");
  EXPECT_FALSE(sites[3].value_used);
}
