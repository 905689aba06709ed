#include <gtest/gtest.h>

#include "reactc/diagnostics/mutation_diagnostics.hpp"
#include "reactc/diagnostics/props_destructuring.hpp"
#include "reactc/test_support/parse_helpers.hpp"

using namespace reactc;
using reactc::test_support::analyze;

TEST(DiagnosticsMutation, StaticBindingReadInMarkupIsReported)
{
  const auto mod = analyze(
    "function List() {\n"
    "  const items = [];\n"
    "  const add = () => items.push(1);\n"
    "  return <ul onClick={add}>{items.length}</ul>;\n"
    "}\n");
  ASSERT_TRUE(mod.ok());
  ASSERT_EQ(mod.components.size(), 1u);

  DiagnosticBag diags(&mod.unit->source);
  MutationDiagnostics().analyze(mod.components[0], mod.classify(), diags);

  ASSERT_EQ(diags.size(), 1u);
  const Diagnostic & d = diags.all()[0];
  EXPECT_EQ(d.severity, Severity::Warning);
  EXPECT_EQ(d.code, diag_codes::k_non_reactive_mutation);
  EXPECT_EQ(mod.slice(d.primary_range()), "items.push(1)");
  ASSERT_EQ(d.labels.size(), 2u);
  EXPECT_EQ(d.labels[1].style, LabelStyle::Secondary);
  EXPECT_EQ(mod.slice(d.labels[1].range), "items = []");
  EXPECT_NE(d.message.find("`items`"), std::string::npos);
  ASSERT_TRUE(d.fix.has_value());
  EXPECT_NE(d.fix->find("`let`"), std::string::npos);
  EXPECT_EQ(d.location.line, 3u);
  EXPECT_EQ(d.location.column, 21u);
  EXPECT_FALSE(diags.has_errors());
}

TEST(DiagnosticsMutation, EachSiteKindIsReported)
{
  const auto mod = analyze(
    "function Form() {\n"
    "  const state = {};\n"
    "  const edit = () => {\n"
    "    state.name = 'x';\n"
    "    delete state.old;\n"
    "    Object.assign(state, {});\n"
    "  };\n"
    "  return <p onClick={edit}>{state.name}</p>;\n"
    "}\n");
  ASSERT_TRUE(mod.ok());

  DiagnosticBag diags;
  MutationDiagnostics().analyze(mod.components[0], mod.classify(), diags);

  ASSERT_EQ(diags.size(), 3u);
  for (const auto & d : diags) {
    EXPECT_EQ(d.code, diag_codes::k_non_reactive_mutation);
  }
}

TEST(DiagnosticsMutation, QuietForSignalsAndUnrenderedBindings)
{
  const auto mod = analyze(
    "function List() {\n"
    "  let items = [];\n"
    "  const log = [];\n"
    "  const add = () => { items.push(1); log.push('add'); };\n"
    "  return <ul onClick={add}>{items.length}</ul>;\n"
    "}\n");
  ASSERT_TRUE(mod.ok());

  DiagnosticBag diags;
  MutationDiagnostics().analyze(mod.components[0], mod.classify(), diags);
  EXPECT_TRUE(diags.empty());
}

TEST(DiagnosticsProps, DestructuredFirstParameterIsReported)
{
  const auto mod = analyze(
    "function Card({ title }) {\n"
    "  return <h1>{title}</h1>;\n"
    "}\n"
    "function Plain(props) {\n"
    "  return <h2>{props.title}</h2>;\n"
    "}\n");
  ASSERT_TRUE(mod.ok());
  ASSERT_EQ(mod.components.size(), 2u);

  DiagnosticBag diags(&mod.unit->source);
  PropsDestructuringCheck().analyze(mod.components, diags);

  ASSERT_EQ(diags.size(), 1u);
  const Diagnostic & d = diags.all()[0];
  EXPECT_EQ(d.severity, Severity::Warning);
  EXPECT_EQ(d.code, diag_codes::k_props_destructuring);
  EXPECT_EQ(mod.slice(d.primary_range()), "{ title }");
  EXPECT_NE(d.message.find("`Card`"), std::string::npos);
  ASSERT_TRUE(d.fix.has_value());
  EXPECT_NE(d.fix->find("props.name"), std::string::npos);
  EXPECT_EQ(d.location.line, 1u);
  EXPECT_EQ(d.location.column, 15u);
}

TEST(DiagnosticsProps, ComponentsWithoutParametersAreQuiet)
{
  const auto mod = analyze("export default function () { return <div />; }\n");
  ASSERT_TRUE(mod.ok());

  DiagnosticBag diags;
  PropsDestructuringCheck().analyze(mod.components, diags);
  EXPECT_TRUE(diags.empty());
}
