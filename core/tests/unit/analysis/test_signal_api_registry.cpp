#include <gtest/gtest.h>

#include "reactc/analysis/signal_api_registry.hpp"
#include "reactc/test_support/parse_helpers.hpp"

using namespace reactc;
using reactc::test_support::parse;

TEST(AnalysisSignalApiRegistry, DefaultsCoverFrameworkApis)
{
  const auto registry = SignalApiRegistry::with_defaults();
  ASSERT_NE(registry.find_api("query"), nullptr);
  ASSERT_NE(registry.find_api("createLoader"), nullptr);
  const SignalApiConfig * form = registry.find_api("form");
  ASSERT_NE(form, nullptr);
  EXPECT_EQ(form->signal_properties.count("submitting"), 1u);
  EXPECT_EQ(form->field_signal_properties.count("error"), 1u);
  EXPECT_TRUE(registry.is_reactive_source("useContext"));
  EXPECT_EQ(registry.find_api("useState"), nullptr);
}

TEST(AnalysisSignalApiRegistry, RegisterReplacesByName)
{
  auto registry = SignalApiRegistry::with_defaults();
  registry.register_api({"query", {"result"}, {}, {}});
  registry.register_api({"useStore", {"state"}, {"dispatch"}, {}});
  registry.register_reactive_source("useTheme");

  EXPECT_EQ(registry.find_api("query")->signal_properties, (NameSet{"result"}));
  ASSERT_NE(registry.find_api("useStore"), nullptr);
  EXPECT_TRUE(registry.is_reactive_source("useTheme"));
}

TEST(AnalysisSignalApiRegistry, ResolvesOnlyRuntimeModuleImports)
{
  auto unit = parse(
    "import { query as q, useContext } from '@vertz/ui';\n"
    "import { form } from './forms';\n"
    "import type { createLoader } from '@vertz/ui';\n");
  ASSERT_FALSE(unit->diags.has_errors());

  const auto registry = SignalApiRegistry::with_defaults();
  const RuntimeImports imports =
    resolve_runtime_imports(*unit->program, registry, k_default_runtime_module);

  EXPECT_EQ(imports.signal_apis.size(), 1u);
  ASSERT_EQ(imports.signal_apis.count("q"), 1u);
  EXPECT_EQ(imports.signal_apis.at("q")->name, "query");
  EXPECT_EQ(imports.signal_apis.count("form"), 0u);
  EXPECT_EQ(imports.reactive_sources.count("useContext"), 1u);
}

TEST(AnalysisSignalApiRegistry, CustomRuntimeModule)
{
  auto unit = parse("import { query } from 'my-ui';\n");
  ASSERT_FALSE(unit->diags.has_errors());

  const auto registry = SignalApiRegistry::with_defaults();
  EXPECT_TRUE(resolve_runtime_imports(*unit->program, registry, "@vertz/ui").signal_apis.empty());
  EXPECT_EQ(resolve_runtime_imports(*unit->program, registry, "my-ui").signal_apis.size(), 1u);
}
