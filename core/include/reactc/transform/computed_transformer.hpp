// reactc/transform/computed_transformer.hpp - Wraps derived bindings in computed()
#pragma once

#include <vector>

#include "reactc/analysis/reactivity_types.hpp"
#include "reactc/transform/edit_buffer.hpp"
#include "reactc/transform/transform_utils.hpp"

namespace reactc
{

/**
 * Computed Transformer.
 *
 * Runs after the signal transformer so the initializer text it reads back
 * already carries `.value` on signal reads.
 *
 * @code
 *   const total = price * qty;      // const total = computed(() => price.value * qty.value);
 *   const { a } = pair;              // const a = computed(() => pair.value.a);
 *   const { data } = query(f);       // const __query_0 = query(f);
 *                                    // const data = computed(() => __query_0.data.value);
 * @endcode
 */
class ComputedTransformer
{
public:
  void transform(
    EditBuffer & buffer, const ComponentInfo & component,
    const std::vector<VariableInfo> & variables, HelperUsage & helpers) const;
};

}  // namespace reactc
