// reactc/analysis/mutation_detector.hpp - In-place mutation sites on reactive bindings
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "reactc/analysis/reactivity_types.hpp"

namespace reactc
{

/// Which signal mutations get rewritten.
enum class MutationScope : uint8_t {
  All,     ///< Every mutation of a signal binding
  Markup,  ///< Only signals that are also read inside markup
};

[[nodiscard]] constexpr std::string_view to_string(MutationScope s) noexcept
{
  return s == MutationScope::Markup ? "markup" : "all";
}

/// Array methods that mutate their receiver.
[[nodiscard]] bool is_mutation_method(std::string_view name) noexcept;

/**
 * Mutation Detector.
 *
 * Recognised sites, where `root` is reached by unwrapping property and
 * element accesses:
 *   root.push(x)          (any mutation method)
 *   root.a.b = v          (also compound operators)
 *   root[i] = v
 *   delete root.a
 *   Object.assign(root, patch)
 * Roots shadowed by a nested declaration are ignored.
 *
 * A site's result counts as unused only in statement position, as a
 * non-final operand of a comma sequence, under `void`, or as the body of an
 * expression-bodied arrow (event handlers). Everywhere else `value_used` is
 * set.
 */
class MutationDetector
{
public:
  explicit MutationDetector(MutationScope scope = MutationScope::All) : scope_(scope) {}

  /// Sites to rewrite: roots classified `signal`, filtered by the scope.
  [[nodiscard]] std::vector<MutationInfo> detect(
    const ComponentInfo & component, const std::vector<VariableInfo> & variables) const;

  /// Every recognised site whose root is in `roots`.
  [[nodiscard]] static std::vector<MutationInfo> find_sites(
    const ComponentInfo & component, const NameSet & roots);

private:
  MutationScope scope_;
};

}  // namespace reactc
