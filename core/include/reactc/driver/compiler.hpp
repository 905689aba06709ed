// reactc/driver/compiler.hpp - Compiler driver
//
// Single entry point for the compile pipeline.
// Used by the CLI and by the tests.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "reactc/analysis/mutation_detector.hpp"
#include "reactc/analysis/reactivity_types.hpp"
#include "reactc/analysis/signal_api_registry.hpp"
#include "reactc/basic/diagnostic.hpp"
#include "reactc/basic/source_manager.hpp"
#include "reactc/project/project_config.hpp"

namespace reactc
{

// ============================================================================
// Compile Mode
// ============================================================================

enum class CompileMode {
  Check,  ///< Analysis and diagnostics only (no output files)
  Build,  ///< Full build, writing the transformed sources
};

// ============================================================================
// Compile Options
// ============================================================================

struct CompileOptions
{
  /// Compile mode
  CompileMode mode = CompileMode::Build;

  /// Output directory for generated files (overrides project config)
  std::optional<std::filesystem::path> output_dir;

  /// Module `signal`, `computed` and the signal APIs come from
  std::string runtime_module = k_default_runtime_module;

  /// Module the DOM helpers come from
  std::string internals_module = "@vertz/ui/internals";

  /// Which signal mutations get the peek/notify rewrite
  MutationScope mutation_scope = MutationScope::All;

  /// Warnings make the result unsuccessful (the code is still produced)
  bool warnings_as_errors = false;

  /// Signal APIs and reactive sources recognised in imports
  SignalApiRegistry registry = SignalApiRegistry::with_defaults();

  /// Enable verbose output
  bool verbose = false;

  /// Options taken from a project's reactc.yaml.
  [[nodiscard]] static CompileOptions from_config(const ProjectConfig & config);
};

// ============================================================================
// Compile Output (one source file)
// ============================================================================

/// Everything the analyses found for one component.
struct ComponentReport
{
  std::string name;
  LineColumn location;
  bool has_destructured_props = false;
  std::vector<VariableInfo> variables;
  std::vector<MutationInfo> mutations;
  std::vector<JsxExpressionInfo> jsx_expressions;
};

struct CompileOutput
{
  /// Transformed source (the input unchanged when nothing was compiled)
  std::string code;

  /// Diagnostics with 1-based locations filled in
  DiagnosticBag diagnostics;

  std::vector<ComponentReport> components;

  /// No errors (and no warnings under warnings_as_errors)
  bool success = false;
};

// ============================================================================
// Compile Result (files and projects)
// ============================================================================

struct CompiledFile
{
  SourceFile source;
  CompileOutput output;

  /// Where the code was written (empty in Check mode or without an output directory)
  std::filesystem::path output_path;
};

struct CompileResult
{
  /// Whether every file compiled successfully
  bool success = false;

  /// Diagnostics not tied to a source file (missing files, I/O errors)
  DiagnosticBag diagnostics;

  std::vector<CompiledFile> files;

  /// Paths written in Build mode
  std::vector<std::filesystem::path> generated_files;
};

// ============================================================================
// Compiler
// ============================================================================

/**
 * Compiler driver that orchestrates the full compilation pipeline.
 *
 * Per file:
 * 1. Parse (parse errors stop here; the source is returned unchanged)
 * 2. Component detection and runtime import resolution
 * 3. Per component: classification, mutation detection, then the signal,
 *    computed, mutation and JSX transformers, then mutation diagnostics
 * 4. Props-destructuring diagnostics for every component
 * 5. Import lines for the runtime helpers the generated code uses
 */
class Compiler
{
public:
  /**
   * Compile source text held in memory.
   *
   * @param source Component module source (TSX)
   * @param filename Name used in diagnostics
   * @param options Compile options (mode and output_dir are ignored)
   */
  [[nodiscard]] static CompileOutput compile(
    std::string source, const std::filesystem::path & filename, const CompileOptions & options);

  /**
   * Compile a single source file.
   *
   * In Build mode with an output directory the result is written to
   * `<output_dir>/<file name>`; otherwise it is only returned.
   */
  [[nodiscard]] static CompileResult compile_single_file(
    const std::filesystem::path & file, const CompileOptions & options);

  /**
   * Compile every entry point of a project.
   *
   * @param config Project configuration (from reactc.yaml)
   * @param options Compile options (may override config settings)
   */
  [[nodiscard]] static CompileResult compile_project(
    const ProjectConfig & config, const CompileOptions & options);

private:
  /// Read, compile and (in Build mode) write one file into `result`.
  static void compile_file_into(
    const std::filesystem::path & file, const std::optional<std::filesystem::path> & output_dir,
    const CompileOptions & options, CompileResult & result);
};

}  // namespace reactc
