// reactc/driver/compiler.cpp - Compiler driver implementation
//
#include "reactc/driver/compiler.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <fstream>
#include <sstream>
#include <utility>

#include "reactc/analysis/component_detector.hpp"
#include "reactc/analysis/jsx_analyzer.hpp"
#include "reactc/analysis/variable_classifier.hpp"
#include "reactc/diagnostics/mutation_diagnostics.hpp"
#include "reactc/diagnostics/props_destructuring.hpp"
#include "reactc/syntax/frontend.hpp"
#include "reactc/transform/computed_transformer.hpp"
#include "reactc/transform/edit_buffer.hpp"
#include "reactc/transform/jsx_transformer.hpp"
#include "reactc/transform/mutation_transformer.hpp"
#include "reactc/transform/signal_transformer.hpp"

namespace reactc
{

namespace
{

/// Names the module already imports from `module`; generated imports skip them.
NameSet imported_from(const Program & program, std::string_view module)
{
  NameSet names;
  for (const Stmt * stmt : program.body) {
    const auto * imp = dyn_cast<ImportDecl>(stmt);
    if (imp == nullptr || imp->module != module || imp->type_only) {
      continue;
    }
    for (const ImportSpecifier * spec : imp->specifiers) {
      if (spec->import_kind == ImportKind::Named && spec->imported == spec->local) {
        names.emplace(spec->local);
      }
    }
  }
  return names;
}

std::string import_line(const NameSet & used, const NameSet & existing, std::string_view module)
{
  std::vector<std::string_view> names;
  for (const auto & n : used) {
    if (existing.count(n) == 0) {
      names.push_back(n);
    }
  }
  if (names.empty()) {
    return {};
  }
  return fmt::format("import {{ {} }} from '{}';\n", fmt::join(names, ", "), module);
}

void finish(CompileOutput & out, const CompileOptions & options)
{
  out.diagnostics.attach_source(nullptr);
  out.success = !out.diagnostics.has_errors() &&
                !(options.warnings_as_errors && out.diagnostics.has_warnings());
}

bool read_file(const std::filesystem::path & file, std::string & content)
{
  std::ifstream in(file, std::ios::binary);
  if (!in) {
    return false;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  content = ss.str();
  return !in.bad();
}

}  // namespace

CompileOptions CompileOptions::from_config(const ProjectConfig & config)
{
  CompileOptions options;
  options.output_dir = config.project_root / config.compiler.output_dir;
  options.runtime_module = config.compiler.runtime_module;
  options.internals_module = config.compiler.internals_module;
  options.mutation_scope = config.compiler.mutation_scope;
  options.warnings_as_errors = config.compiler.warnings_as_errors;
  options.registry = config.make_registry();
  return options;
}

CompileOutput Compiler::compile(
  std::string source, const std::filesystem::path & filename, const CompileOptions & options)
{
  CompileOutput out;
  const auto unit = parse_source(filename, std::move(source));
  out.code = std::string(unit->source.content());
  out.diagnostics.attach_source(&unit->source);
  out.diagnostics.merge(unit->diags);

  if (unit->diags.has_errors() || unit->program == nullptr) {
    finish(out, options);
    return out;
  }

  const std::vector<ComponentInfo> components = ComponentDetector().detect(*unit->program);
  if (components.empty()) {
    finish(out, options);
    return out;
  }

  const RuntimeImports imports =
    resolve_runtime_imports(*unit->program, options.registry, options.runtime_module);
  const VariableClassifier classifier(imports);
  const MutationDetector detector(options.mutation_scope);

  EditBuffer buffer(unit->source.content());
  HelperUsage helpers;

  for (const auto & component : components) {
    ComponentReport report;
    report.name = component.name;
    report.location = unit->source.get_line_column(component.name_range.is_valid()
                                                     ? component.name_range.start
                                                     : component.body.start);
    report.has_destructured_props = component.params.has_destructured_props;
    report.variables = classifier.classify(component);
    report.mutations = detector.detect(component, report.variables);

    // Reads are rewritten before declarations are wrapped, and everything
    // before JSX generation reads expression text back.
    SignalTransformer().transform(buffer, component, report.variables, report.mutations, helpers);
    ComputedTransformer().transform(buffer, component, report.variables, helpers);
    MutationTransformer().transform(buffer, report.mutations);

    report.jsx_expressions = JsxAnalyzer().analyze(component, report.variables);
    JsxTransformer().transform(buffer, component, report.jsx_expressions, helpers);

    MutationDiagnostics().analyze(component, report.variables, out.diagnostics);
    out.components.push_back(std::move(report));
  }

  PropsDestructuringCheck().analyze(components, out.diagnostics);

  const std::string header =
    import_line(
      helpers.runtime, imported_from(*unit->program, options.runtime_module),
      options.runtime_module) +
    import_line(
      helpers.internals, imported_from(*unit->program, options.internals_module),
      options.internals_module);
  if (!header.empty()) {
    buffer.prepend(header);
  }

  if (buffer.rejected_edits() != 0) {
    out.diagnostics.report_info(
      SourceRange{},
      fmt::format(
        "{} rewrite(s) overlapped code that was already replaced and were skipped",
        buffer.rejected_edits()));
  }

  out.code = buffer.to_string();
  finish(out, options);
  return out;
}

void Compiler::compile_file_into(
  const std::filesystem::path & file, const std::optional<std::filesystem::path> & output_dir,
  const CompileOptions & options, CompileResult & result)
{
  namespace fs = std::filesystem;

  std::string content;
  if (!fs::exists(file) || !read_file(file, content)) {
    result.diagnostics.report_error(SourceRange{}, "cannot read file: " + file.string())
      .with_code(diag_codes::k_io_error);
    return;
  }

  CompiledFile compiled;
  compiled.source = SourceFile(file, content);
  compiled.output = compile(std::move(content), file, options);

  if (options.mode == CompileMode::Build && output_dir) {
    std::error_code ec;
    fs::create_directories(*output_dir, ec);
    const fs::path output_path = *output_dir / file.filename();
    std::ofstream os(output_path, std::ios::binary);
    if (ec || !os) {
      result.diagnostics
        .report_error(SourceRange{}, "cannot write output file: " + output_path.string())
        .with_code(diag_codes::k_io_error);
    } else {
      os << compiled.output.code;
      compiled.output_path = output_path;
      result.generated_files.push_back(output_path);
    }
  }

  result.files.push_back(std::move(compiled));
}

CompileResult Compiler::compile_single_file(
  const std::filesystem::path & file, const CompileOptions & options)
{
  CompileResult result;
  compile_file_into(file, options.output_dir, options, result);

  result.success = !result.diagnostics.has_errors();
  for (const auto & f : result.files) {
    result.success = result.success && f.output.success;
  }
  return result;
}

CompileResult Compiler::compile_project(
  const ProjectConfig & config, const CompileOptions & options)
{
  CompileResult result;

  if (config.compiler.entry_points.empty()) {
    result.diagnostics.report_error(
      SourceRange{}, "no entry points defined in project configuration");
    return result;
  }

  const std::filesystem::path output_dir =
    options.output_dir.value_or(config.project_root / config.compiler.output_dir);
  for (const auto & entry_rel : config.compiler.entry_points) {
    compile_file_into(config.project_root / entry_rel, output_dir, options, result);
  }

  result.success = !result.diagnostics.has_errors();
  for (const auto & f : result.files) {
    result.success = result.success && f.output.success;
  }
  return result;
}

}  // namespace reactc
