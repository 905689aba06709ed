// reactc/analysis/signal_api_registry.hpp - Framework APIs that return reactive bags
//
// A signal API returns an object whose fields are partly signals
// (`query().data`) and partly plain values (`query().refetch`). A reactive
// source returns a value that is reactive as a whole (`useContext`).
//
#pragma once

#include <map>
#include <string>
#include <string_view>

#include "reactc/analysis/reactivity_types.hpp"
#include "reactc/ast/ast.hpp"

namespace reactc
{

/// Default module the signal APIs and the `signal`/`computed` runtime come from.
inline constexpr const char * k_default_runtime_module = "@vertz/ui";

struct SignalApiConfig
{
  std::string name;
  NameSet signal_properties;
  NameSet plain_properties;
  NameSet field_signal_properties;  ///< Signals on every dynamic field (`form.title.error`)
};

class SignalApiRegistry
{
public:
  SignalApiRegistry() = default;

  /// Registry with the built-in `query`, `createLoader`, `form` and `useContext`.
  [[nodiscard]] static SignalApiRegistry with_defaults();

  /// Adds or replaces an API by name.
  void register_api(SignalApiConfig config);
  void register_reactive_source(std::string name);

  [[nodiscard]] const SignalApiConfig * find_api(std::string_view name) const;
  [[nodiscard]] bool is_reactive_source(std::string_view name) const;

  [[nodiscard]] const std::map<std::string, SignalApiConfig, std::less<>> & apis() const noexcept
  {
    return apis_;
  }

private:
  std::map<std::string, SignalApiConfig, std::less<>> apis_;
  NameSet reactive_sources_;
};

// ============================================================================
// Import resolution
// ============================================================================

/**
 * Local names that refer to registry entries in one module.
 *
 * Only named imports from the runtime module count, so a local function that
 * happens to be called `query` is not treated as the framework API.
 */
struct RuntimeImports
{
  /// local name -> API config (aliases honoured)
  std::map<std::string, const SignalApiConfig *, std::less<>> signal_apis;
  NameSet reactive_sources;

  [[nodiscard]] const SignalApiConfig * api_for_call(const Expr * init) const;
  [[nodiscard]] bool is_reactive_source_call(const Expr * init) const;
};

[[nodiscard]] RuntimeImports resolve_runtime_imports(
  const Program & program, const SignalApiRegistry & registry, std::string_view runtime_module);

}  // namespace reactc
