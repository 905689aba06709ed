// reactc/project/project_config.cpp - Project configuration implementation
//
#include "reactc/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include <utility>

namespace reactc
{

namespace
{

/// Read a list of names into `out`.
bool parse_name_set(const YAML::Node & node, NameSet & out, std::string & error, const char * what)
{
  if (!node) {
    return true;
  }
  if (!node.IsSequence()) {
    error = std::string(what) + " must be a list";
    return false;
  }
  for (const auto & item : node) {
    out.insert(item.as<std::string>());
  }
  return true;
}

/// Parse a single signal_apis entry
std::optional<SignalApiConfig> parse_signal_api(const YAML::Node & node, std::string & error)
{
  if (!node.IsMap()) {
    error = "signal_apis entry must be a map";
    return std::nullopt;
  }
  if (!node["name"]) {
    error = "signal_apis entry must have a 'name'";
    return std::nullopt;
  }

  SignalApiConfig api;
  api.name = node["name"].as<std::string>();
  if (
    !parse_name_set(node["signal_properties"], api.signal_properties, error, "signal_properties") ||
    !parse_name_set(node["plain_properties"], api.plain_properties, error, "plain_properties") ||
    !parse_name_set(
      node["field_signal_properties"], api.field_signal_properties, error,
      "field_signal_properties")) {
    return std::nullopt;
  }
  return api;
}

ConfigLoadResult parse_root(const YAML::Node & root, const std::filesystem::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  // Parse 'package' section
  if (root["package"]) {
    const auto & pkg = root["package"];
    if (pkg["name"]) {
      config.package.name = pkg["name"].as<std::string>();
    }
    if (pkg["version"]) {
      config.package.version = pkg["version"].as<std::string>();
    }
  }

  // Parse 'compiler' section
  if (root["compiler"]) {
    const auto & comp = root["compiler"];

    if (comp["entry_points"]) {
      if (!comp["entry_points"].IsSequence()) {
        return ConfigLoadResult::fail("compiler.entry_points must be a list");
      }
      for (const auto & ep : comp["entry_points"]) {
        config.compiler.entry_points.emplace_back(ep.as<std::string>());
      }
    }

    if (comp["output_dir"]) {
      config.compiler.output_dir = comp["output_dir"].as<std::string>();
    }
    if (comp["runtime_module"]) {
      config.compiler.runtime_module = comp["runtime_module"].as<std::string>();
    }
    if (comp["internals_module"]) {
      config.compiler.internals_module = comp["internals_module"].as<std::string>();
    }
    if (comp["warnings_as_errors"]) {
      config.compiler.warnings_as_errors = comp["warnings_as_errors"].as<bool>();
    }

    if (comp["mutation_scope"]) {
      const auto text = comp["mutation_scope"].as<std::string>();
      const auto scope = parse_mutation_scope(text);
      if (!scope) {
        return ConfigLoadResult::fail(
          "invalid compiler.mutation_scope: '" + text + "' (must be 'all' or 'markup')");
      }
      config.compiler.mutation_scope = *scope;
    }
  }

  // Parse 'signal_apis' section
  if (root["signal_apis"]) {
    if (!root["signal_apis"].IsSequence()) {
      return ConfigLoadResult::fail("signal_apis must be a list");
    }
    for (const auto & api_node : root["signal_apis"]) {
      std::string api_error;
      auto api = parse_signal_api(api_node, api_error);
      if (!api) {
        return ConfigLoadResult::fail("invalid signal API: " + api_error);
      }
      config.signal_apis.push_back(std::move(*api));
    }
  }

  // Parse 'reactive_sources' section
  if (root["reactive_sources"]) {
    if (!root["reactive_sources"].IsSequence()) {
      return ConfigLoadResult::fail("reactive_sources must be a list");
    }
    for (const auto & name : root["reactive_sources"]) {
      config.reactive_sources.push_back(name.as<std::string>());
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

SignalApiRegistry ProjectConfig::make_registry() const
{
  SignalApiRegistry registry = SignalApiRegistry::with_defaults();
  for (const auto & api : signal_apis) {
    registry.register_api(api);
  }
  for (const auto & name : reactive_sources) {
    registry.register_reactive_source(name);
  }
  return registry;
}

std::optional<MutationScope> parse_mutation_scope(std::string_view text) noexcept
{
  if (text == "all") {
    return MutationScope::All;
  }
  if (text == "markup") {
    return MutationScope::Markup;
  }
  return std::nullopt;
}

ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root)
{
  try {
    return parse_root(YAML::Load(yaml_text), project_root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
    return parse_root(root, fs::absolute(config_path).parent_path());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  fs::path current = fs::absolute(start_dir, ec);
  if (ec) {
    return std::nullopt;
  }

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current, ec)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate, ec)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace reactc
