// reactc/transform/mutation_transformer.hpp - peek/notify rewriting of in-place mutations
#pragma once

#include <vector>

#include "reactc/analysis/reactivity_types.hpp"
#include "reactc/transform/edit_buffer.hpp"

namespace reactc
{

/**
 * Mutation Transformer.
 *
 * Every site becomes a sequence expression that mutates the peeked value
 * and then notifies:
 *
 *   items.push(x)              -> (items.peek().push(x), items.notify())
 *   state.a = 1                -> (state.peek().a = 1, state.notify())
 *   delete state.a             -> (delete state.peek().a, state.notify())
 *   Object.assign(state, p)    -> (Object.assign(state.peek(), p), state.notify())
 *
 * A site whose result is read keeps that result by passing it through a
 * notifying arrow:
 *
 *   const last = items.pop()   -> const last = ((__v) => (items.notify(), __v))(items.peek().pop())
 *
 * Only insertions are made, so the original sub-expressions are evaluated
 * exactly once and in their original order.
 */
class MutationTransformer
{
public:
  void transform(EditBuffer & buffer, const std::vector<MutationInfo> & mutations) const;
};

}  // namespace reactc
