// reactc/test_support/parse_helpers.hpp - helpers for unit/integration tests
//
// A single-file parse plus the analysis front half of the driver, so tests
// can inspect classification and mutation results without going through
// Compiler::compile.
//
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "reactc/analysis/component_detector.hpp"
#include "reactc/analysis/mutation_detector.hpp"
#include "reactc/analysis/signal_api_registry.hpp"
#include "reactc/analysis/variable_classifier.hpp"
#include "reactc/syntax/frontend.hpp"

namespace reactc::test_support
{

[[nodiscard]] inline std::unique_ptr<ParsedUnit> parse(
  std::string src, const std::filesystem::path & virtual_path = "<test>.tsx")
{
  return parse_source(virtual_path, std::move(src));
}

/**
 * A parsed module with its components and runtime imports resolved.
 *
 * Components borrow the AST, so the unit is kept alive alongside them.
 */
struct TestModule
{
  std::unique_ptr<ParsedUnit> unit;
  SignalApiRegistry registry = SignalApiRegistry::with_defaults();
  RuntimeImports imports;
  std::vector<ComponentInfo> components;

  [[nodiscard]] bool ok() const noexcept
  {
    return unit != nullptr && unit->program != nullptr && !unit->diags.has_errors();
  }

  [[nodiscard]] std::vector<VariableInfo> classify(size_t component = 0) const
  {
    return VariableClassifier(imports).classify(components.at(component));
  }

  [[nodiscard]] std::vector<MutationInfo> mutations(
    MutationScope scope = MutationScope::All, size_t component = 0) const
  {
    return MutationDetector(scope).detect(components.at(component), classify(component));
  }

  [[nodiscard]] std::string_view slice(SourceRange r) const noexcept { return unit->slice(r); }
};

[[nodiscard]] inline TestModule analyze(
  std::string src, SignalApiRegistry registry = SignalApiRegistry::with_defaults())
{
  TestModule out;
  out.registry = std::move(registry);
  out.unit = parse(std::move(src));
  if (out.unit->program != nullptr) {
    out.imports =
      resolve_runtime_imports(*out.unit->program, out.registry, k_default_runtime_module);
    out.components = ComponentDetector().detect(*out.unit->program);
  }
  return out;
}

}  // namespace reactc::test_support
