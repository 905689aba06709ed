// reactc - TSX reactivity compiler command line interface
//
// Usage:
//   reactc build [file.tsx | --project] [-o output]
//   reactc check [file.tsx | --project]
//   reactc analyze <file.tsx>
//   reactc dump-ast <file.tsx>
//
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "reactc/ast/ast_json.hpp"
#include "reactc/basic/diagnostic_printer.hpp"
#include "reactc/driver/compiler.hpp"
#include "reactc/driver/report.hpp"
#include "reactc/project/project_config.hpp"
#include "reactc/syntax/frontend.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "reactc - TSX reactivity compiler v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  build [file.tsx]          Compile a file or project\n"
            << "  check [file.tsx]          Analyze and report diagnostics (no output)\n"
            << "  analyze <file.tsx>        Print the reactivity classification as JSON\n"
            << "  dump-ast <file.tsx>       Print the parsed AST as JSON\n\n"
            << "Options:\n"
            << "  -o, --output <path>       Output directory\n"
            << "  --project                 Use the project described by reactc.yaml\n"
            << "  --format <text|json>      Diagnostic output format (default: text)\n"
            << "  --mutation-scope <s>      Mutations to rewrite: 'all' or 'markup'\n"
            << "  --werror                  Treat warnings as errors\n"
            << "  -v, --verbose             Verbose output\n"
            << "  -h, --help                Show this help message\n";
}

void print_diagnostics(const reactc::CompileResult & result)
{
  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = isatty(fileno(stderr)) != 0;
  reactc::DiagnosticPrinter printer(std::cerr, use_color);

  for (const auto & diag : result.diagnostics) {
    printer.print_compact(diag, "reactc");
  }
  for (const auto & file : result.files) {
    printer.print_all(file.output.diagnostics, file.source);
  }
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::string output_path;
  std::string format = "text";
  std::optional<std::string> mutation_scope;
  bool use_project = false;
  bool werror = false;
  bool verbose = false;
  bool show_help = false;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-o" || arg == "--output") {
      if (i + 1 < argc) {
        args.output_path = argv[++i];
      }
    } else if (arg == "--format") {
      if (i + 1 < argc) {
        args.format = argv[++i];
      }
    } else if (arg == "--mutation-scope") {
      if (i + 1 < argc) {
        args.mutation_scope = argv[++i];
      }
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "--werror") {
      args.werror = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    }
  }

  return args;
}

// ============================================================================
// Shared Setup
// ============================================================================

/// Apply command line overrides on top of `options`. Returns false on a bad value.
bool apply_overrides(const CommandArgs & args, reactc::CompileOptions & options)
{
  options.verbose = args.verbose;
  if (args.werror) {
    options.warnings_as_errors = true;
  }
  if (args.mutation_scope) {
    const auto scope = reactc::parse_mutation_scope(*args.mutation_scope);
    if (!scope) {
      std::cerr << "error: invalid --mutation-scope '" << *args.mutation_scope
                << "' (must be 'all' or 'markup')\n";
      return false;
    }
    options.mutation_scope = *scope;
  }
  if (!args.output_path.empty()) {
    options.output_dir = args.output_path;
  }
  if (args.format != "text" && args.format != "json") {
    std::cerr << "error: invalid --format '" << args.format << "' (must be 'text' or 'json')\n";
    return false;
  }
  return true;
}

/**
 * Run the compiler over the project (or a single file) the arguments name.
 *
 * A reactc.yaml found above the current directory supplies defaults even in
 * single-file mode; its output directory is only used for project builds.
 */
std::optional<reactc::CompileResult> run_compiler(
  const CommandArgs & args, reactc::CompileMode mode, const char * verb)
{
  std::optional<reactc::ProjectConfig> config;
  if (auto config_path = reactc::find_project_config(fs::current_path())) {
    auto config_result = reactc::load_project_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_result.error << "\n";
      return std::nullopt;
    }
    config = std::move(config_result.config);
  }

  const bool project_mode = args.use_project || args.input_file.empty();
  if (project_mode && !config) {
    std::cerr << "error: no " << reactc::k_project_config_file_name
              << " found in current directory or parents\n";
    return std::nullopt;
  }

  reactc::CompileOptions options =
    config ? reactc::CompileOptions::from_config(*config) : reactc::CompileOptions{};
  if (!project_mode) {
    options.output_dir.reset();
  }
  options.mode = mode;
  if (!apply_overrides(args, options)) {
    return std::nullopt;
  }

  if (project_mode) {
    if (args.verbose) {
      std::cerr << verb << " project: " << config->package.name << "\n";
    }
    return reactc::Compiler::compile_project(*config, options);
  }

  const fs::path input_path = fs::absolute(args.input_file);
  if (!fs::exists(input_path)) {
    std::cerr << "error: file not found: " << input_path.string() << "\n";
    return std::nullopt;
  }

  if (args.verbose) {
    std::cerr << verb << ": " << input_path.string() << "\n";
  }

  return reactc::Compiler::compile_single_file(input_path, options);
}

bool read_input(const std::string & input_file, std::string & content)
{
  const fs::path input_path = fs::absolute(input_file);
  std::ifstream file(input_path, std::ios::binary);
  if (!file.is_open()) {
    std::cerr << "error: failed to open file: " << input_path.string() << "\n";
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  content = buffer.str();
  return true;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_build(const CommandArgs & args)
{
  const auto result = run_compiler(args, reactc::CompileMode::Build, "Building");
  if (!result) {
    return 1;
  }

  // A single file without an output directory goes to stdout.
  const bool to_stdout = result->generated_files.empty() && !args.use_project &&
                         !args.input_file.empty() && args.output_path.empty();

  if (args.format == "json") {
    std::cout << reactc::result_to_json(*result, to_stdout).dump(2) << "\n";
    return result->success ? 0 : 1;
  }

  print_diagnostics(*result);

  if (to_stdout) {
    for (const auto & file : result->files) {
      std::cout << file.output.code;
    }
  }

  if (!result->success) {
    return 1;
  }

  for (const auto & file : result->generated_files) {
    std::cerr << "Generated: " << file.string() << "\n";
  }

  return 0;
}

int cmd_check(const CommandArgs & args)
{
  const auto result = run_compiler(args, reactc::CompileMode::Check, "Checking");
  if (!result) {
    return 1;
  }

  if (args.format == "json") {
    std::cout << reactc::result_to_json(*result, false).dump(2) << "\n";
    return result->success ? 0 : 1;
  }

  print_diagnostics(*result);

  if (result->success) {
    std::cout << (args.input_file.empty() ? "project" : args.input_file) << ": OK\n";
    return 0;
  }

  return 1;
}

int cmd_analyze(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: input file required\n";
    std::cerr << "usage: reactc analyze <file.tsx>\n";
    return 1;
  }

  const auto result = run_compiler(args, reactc::CompileMode::Check, "Analyzing");
  if (!result) {
    return 1;
  }

  std::cout << reactc::result_to_json(*result, false).dump(2) << "\n";
  return result->success ? 0 : 1;
}

int cmd_dump_ast(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: input file required\n";
    std::cerr << "usage: reactc dump-ast <file.tsx>\n";
    return 1;
  }

  std::string content;
  if (!read_input(args.input_file, content)) {
    return 1;
  }

  const auto unit = reactc::parse_source(args.input_file, std::move(content));
  if (!unit->diags.empty()) {
    const bool use_color = isatty(fileno(stderr)) != 0;
    reactc::DiagnosticPrinter printer(std::cerr, use_color);
    printer.print_all(unit->diags, unit->source);
  }

  std::cout << reactc::to_json(unit->program).dump(2) << "\n";
  return unit->diags.has_errors() ? 1 : 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command == "build") {
    return cmd_build(args);
  }

  if (args.command == "check") {
    return cmd_check(args);
  }

  if (args.command == "analyze") {
    return cmd_analyze(args);
  }

  if (args.command == "dump-ast") {
    return cmd_dump_ast(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
