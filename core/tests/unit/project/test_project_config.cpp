#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "reactc/project/project_config.hpp"

using namespace reactc;

namespace
{

struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(std::filesystem::path p) : path(std::move(p))
  {
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

}  // namespace

TEST(ProjectConfig, ParsesAllSections)
{
  const auto result = parse_project_config(
    "package:\n"
    "  name: shop\n"
    "  version: 1.2.0\n"
    "compiler:\n"
    "  entry_points:\n"
    "    - src/App.tsx\n"
    "    - src/Cart.tsx\n"
    "  output_dir: dist\n"
    "  runtime_module: my-ui\n"
    "  internals_module: my-ui/dom\n"
    "  mutation_scope: markup\n"
    "  warnings_as_errors: true\n"
    "signal_apis:\n"
    "  - name: useForm\n"
    "    signal_properties: [submitting, dirty]\n"
    "    plain_properties: [submit]\n"
    "    field_signal_properties: [error]\n"
    "reactive_sources:\n"
    "  - useStore\n",
    "/project");

  ASSERT_TRUE(result.success) << result.error;
  const ProjectConfig & c = result.config;
  EXPECT_EQ(c.package.name, "shop");
  EXPECT_EQ(c.package.version, "1.2.0");
  ASSERT_EQ(c.compiler.entry_points.size(), 2u);
  EXPECT_EQ(c.compiler.entry_points[0], std::filesystem::path("src/App.tsx"));
  EXPECT_EQ(c.compiler.output_dir, std::filesystem::path("dist"));
  EXPECT_EQ(c.compiler.runtime_module, "my-ui");
  EXPECT_EQ(c.compiler.internals_module, "my-ui/dom");
  EXPECT_EQ(c.compiler.mutation_scope, MutationScope::Markup);
  EXPECT_TRUE(c.compiler.warnings_as_errors);
  EXPECT_EQ(c.project_root, std::filesystem::path("/project"));

  ASSERT_EQ(c.signal_apis.size(), 1u);
  EXPECT_EQ(c.signal_apis[0].name, "useForm");
  EXPECT_EQ(c.signal_apis[0].signal_properties, (NameSet{"dirty", "submitting"}));
  EXPECT_EQ(c.signal_apis[0].plain_properties, (NameSet{"submit"}));
  EXPECT_EQ(c.signal_apis[0].field_signal_properties, (NameSet{"error"}));
  ASSERT_EQ(c.reactive_sources.size(), 1u);
  EXPECT_EQ(c.reactive_sources[0], "useStore");
}

TEST(ProjectConfig, EmptyDocumentUsesDefaults)
{
  const auto result = parse_project_config("", "/project");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_TRUE(result.config.compiler.entry_points.empty());
  EXPECT_EQ(result.config.compiler.output_dir, std::filesystem::path("generated"));
  EXPECT_EQ(result.config.compiler.runtime_module, k_default_runtime_module);
  EXPECT_EQ(result.config.compiler.internals_module, "@vertz/ui/internals");
  EXPECT_EQ(result.config.compiler.mutation_scope, MutationScope::All);
  EXPECT_FALSE(result.config.compiler.warnings_as_errors);
}

TEST(ProjectConfig, RejectsInvalidDocuments)
{
  const auto scalar = parse_project_config("just text\n", "/p");
  EXPECT_FALSE(scalar.success);
  EXPECT_EQ(scalar.error, "configuration root must be a map");

  const auto scope = parse_project_config("compiler:\n  mutation_scope: sometimes\n", "/p");
  EXPECT_FALSE(scope.success);
  EXPECT_EQ(
    scope.error, "invalid compiler.mutation_scope: 'sometimes' (must be 'all' or 'markup')");

  const auto entries = parse_project_config("compiler:\n  entry_points: App.tsx\n", "/p");
  EXPECT_FALSE(entries.success);
  EXPECT_EQ(entries.error, "compiler.entry_points must be a list");

  const auto unnamed = parse_project_config("signal_apis:\n  - signal_properties: [a]\n", "/p");
  EXPECT_FALSE(unnamed.success);
  EXPECT_EQ(unnamed.error, "invalid signal API: signal_apis entry must have a 'name'");

  const auto props = parse_project_config(
    "signal_apis:\n  - name: useX\n    signal_properties: loading\n", "/p");
  EXPECT_FALSE(props.success);
  EXPECT_EQ(props.error, "invalid signal API: signal_properties must be a list");

  const auto broken = parse_project_config("compiler: [unterminated\n", "/p");
  EXPECT_FALSE(broken.success);
  EXPECT_EQ(broken.error.rfind("failed to parse YAML: ", 0), 0u);
}

TEST(ProjectConfig, MutationScopeNames)
{
  EXPECT_EQ(parse_mutation_scope("all"), MutationScope::All);
  EXPECT_EQ(parse_mutation_scope("markup"), MutationScope::Markup);
  EXPECT_FALSE(parse_mutation_scope("ALL").has_value());
  EXPECT_FALSE(parse_mutation_scope("").has_value());
}

TEST(ProjectConfig, RegistryExtendsBuiltins)
{
  const auto result = parse_project_config(
    "signal_apis:\n"
    "  - name: useForm\n"
    "    signal_properties: [submitting]\n"
    "reactive_sources: [useStore]\n",
    "/p");
  ASSERT_TRUE(result.success) << result.error;

  const SignalApiRegistry registry = result.config.make_registry();
  ASSERT_NE(registry.find_api("useForm"), nullptr);
  EXPECT_EQ(registry.find_api("useForm")->signal_properties.count("submitting"), 1u);
  EXPECT_NE(registry.find_api("query"), nullptr);
  EXPECT_TRUE(registry.is_reactive_source("useStore"));
  EXPECT_TRUE(registry.is_reactive_source("useContext"));
  EXPECT_EQ(registry.find_api("useStore"), nullptr);
}

TEST(ProjectConfig, LoadsFromFileAndFindsUpward)
{
  const TempDir temp_dir(std::filesystem::temp_directory_path() / "reactc_config_test");
  const std::filesystem::path config_path = temp_dir.path / k_project_config_file_name;
  {
    std::ofstream f(config_path);
    f << "package:\n  name: demo\n";
  }
  const std::filesystem::path nested = temp_dir.path / "src" / "components";
  std::filesystem::create_directories(nested);

  const auto found = find_project_config(nested);
  ASSERT_TRUE(found.has_value());
  EXPECT_TRUE(std::filesystem::equivalent(*found, config_path));

  const auto loaded = load_project_config(*found);
  ASSERT_TRUE(loaded.success) << loaded.error;
  EXPECT_EQ(loaded.config.package.name, "demo");
  EXPECT_TRUE(std::filesystem::equivalent(loaded.config.project_root, temp_dir.path));
}

TEST(ProjectConfig, MissingFileFails)
{
  const auto result =
    load_project_config(std::filesystem::temp_directory_path() / "reactc_no_such" / "reactc.yaml");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.rfind("configuration file not found: ", 0), 0u);
}
