// reactc/analysis/signal_api_registry.cpp - Built-in signal APIs and import resolution
#include "reactc/analysis/signal_api_registry.hpp"

#include <utility>

namespace reactc
{

namespace
{

/// Callee name of `name(...)`, or empty.
std::string_view called_name(const Expr * init)
{
  const auto * call = dyn_cast<CallExpr>(skip_parens(init));
  if (call == nullptr) {
    return {};
  }
  const auto * callee = dyn_cast<Identifier>(skip_parens(call->callee));
  return callee != nullptr ? callee->name : std::string_view{};
}

}  // namespace

SignalApiRegistry SignalApiRegistry::with_defaults()
{
  SignalApiRegistry registry;
  registry.register_api({"query", {"data", "loading", "error"}, {"refetch"}, {}});
  registry.register_api({"createLoader", {"data", "loading", "error"}, {"refetch"}, {}});
  registry.register_api(
    {"form",
     {"submitting", "dirty", "valid"},
     {"action", "method", "onSubmit", "reset", "setFieldError", "submit"},
     {"error", "dirty", "touched", "value"}});
  registry.register_reactive_source("useContext");
  return registry;
}

void SignalApiRegistry::register_api(SignalApiConfig config)
{
  std::string key = config.name;
  apis_[std::move(key)] = std::move(config);
}

void SignalApiRegistry::register_reactive_source(std::string name)
{
  reactive_sources_.insert(std::move(name));
}

const SignalApiConfig * SignalApiRegistry::find_api(std::string_view name) const
{
  auto it = apis_.find(name);
  return it != apis_.end() ? &it->second : nullptr;
}

bool SignalApiRegistry::is_reactive_source(std::string_view name) const
{
  return reactive_sources_.count(name) != 0;
}

// ============================================================================
// RuntimeImports
// ============================================================================

const SignalApiConfig * RuntimeImports::api_for_call(const Expr * init) const
{
  const std::string_view name = called_name(init);
  if (name.empty()) {
    return nullptr;
  }
  auto it = signal_apis.find(name);
  return it != signal_apis.end() ? it->second : nullptr;
}

bool RuntimeImports::is_reactive_source_call(const Expr * init) const
{
  const std::string_view name = called_name(init);
  return !name.empty() && reactive_sources.count(name) != 0;
}

RuntimeImports resolve_runtime_imports(
  const Program & program, const SignalApiRegistry & registry, std::string_view runtime_module)
{
  RuntimeImports imports;
  for (const Stmt * stmt : program.body) {
    const auto * decl = dyn_cast<ImportDecl>(stmt);
    if (decl == nullptr || decl->type_only || decl->module != runtime_module) {
      continue;
    }
    for (const ImportSpecifier * spec : decl->specifiers) {
      if (spec->import_kind != ImportKind::Named) {
        continue;
      }
      if (const SignalApiConfig * api = registry.find_api(spec->imported)) {
        imports.signal_apis.emplace(std::string(spec->local), api);
      } else if (registry.is_reactive_source(spec->imported)) {
        imports.reactive_sources.emplace(spec->local);
      }
    }
  }
  return imports;
}

}  // namespace reactc
