// reactc/transform/signal_transformer.hpp - Rewrites signal declarations and reads
#pragma once

#include <vector>

#include "reactc/analysis/reactivity_types.hpp"
#include "reactc/transform/edit_buffer.hpp"
#include "reactc/transform/transform_utils.hpp"

namespace reactc
{

/**
 * Signal Transformer.
 *
 * - `let x = init` becomes `const x = signal(init)` (`let x;` becomes
 *   `const x = signal(undefined)`); the keyword changes only when every
 *   declarator of the statement is rewritten.
 * - `let { a, b } = init` becomes a `__let_<n>` capture plus one
 *   `const a = signal(__let_<n>.a);` per binding.
 * - Every free read of a signal gets `.value`, except the root identifier
 *   of a mutation site (the mutation transformer adds `.peek()` there).
 * - Reads of a signal-API result's reactive properties get `.value`
 *   (`tasks.loading`, `form.title.error`).
 */
class SignalTransformer
{
public:
  void transform(
    EditBuffer & buffer, const ComponentInfo & component,
    const std::vector<VariableInfo> & variables, const std::vector<MutationInfo> & mutations,
    HelperUsage & helpers) const;
};

}  // namespace reactc
