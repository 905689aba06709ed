// reactc/project/project_config.hpp - Project configuration (reactc.yaml)
//
// Parses and validates reactc.yaml project configuration files.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "reactc/analysis/mutation_detector.hpp"
#include "reactc/analysis/signal_api_registry.hpp"

namespace reactc
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Compiler configuration section.
 */
struct CompilerConfig
{
  /// Component files to compile
  std::vector<std::filesystem::path> entry_points;

  /// Output directory for generated files
  std::filesystem::path output_dir = "generated";

  /// Module `signal`, `computed` and the signal APIs are imported from
  std::string runtime_module = k_default_runtime_module;

  /// Module the DOM helpers are imported from
  std::string internals_module = "@vertz/ui/internals";

  MutationScope mutation_scope = MutationScope::All;

  /// Treat advisory diagnostics as errors
  bool warnings_as_errors = false;
};

/**
 * Package metadata section.
 */
struct PackageConfig
{
  std::string name;
  std::string version;
};

/**
 * Complete project configuration (reactc.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;
  CompilerConfig compiler;

  /// Extra signal APIs, added on top of the built-in ones
  std::vector<SignalApiConfig> signal_apis;

  /// Extra APIs whose result is reactive as a whole
  std::vector<std::string> reactive_sources;

  /// Directory containing reactc.yaml (for resolving relative paths)
  std::filesystem::path project_root;

  /// Built-in registry extended with this project's APIs.
  [[nodiscard]] SignalApiRegistry make_registry() const;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a reactc.yaml file.
 *
 * @param config_path Path to reactc.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Parse a project configuration from YAML text.
 *
 * @param yaml_text Contents of a reactc.yaml file
 * @param project_root Directory relative paths are resolved against
 */
[[nodiscard]] ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to reactc.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/// Parse `all` / `markup`.
[[nodiscard]] std::optional<MutationScope> parse_mutation_scope(std::string_view text) noexcept;

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "reactc.yaml";

}  // namespace reactc
