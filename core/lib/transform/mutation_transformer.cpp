// reactc/transform/mutation_transformer.cpp - peek/notify rewriting of in-place mutations
#include "reactc/transform/mutation_transformer.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace reactc
{

void MutationTransformer::transform(
  EditBuffer & buffer, const std::vector<MutationInfo> & mutations) const
{
  // Innermost first, so nested sites that end at the same offset close in order.
  std::vector<const MutationInfo *> ordered;
  ordered.reserve(mutations.size());
  for (const auto & m : mutations) {
    ordered.push_back(&m);
  }
  std::stable_sort(ordered.begin(), ordered.end(), [](const MutationInfo * a, const MutationInfo * b) {
    return a->range.start > b->range.start;
  });

  for (const MutationInfo * m : ordered) {
    if (m->value_used) {
      buffer.prepend_right(
        m->range.start, fmt::format("((__v) => ({}.notify(), __v))(", m->root));
      buffer.append_left(m->root_range.end, ".peek()");
      buffer.append_left(m->range.end, ")");
      continue;
    }
    buffer.prepend_right(m->range.start, "(");
    buffer.append_left(m->root_range.end, ".peek()");
    buffer.append_left(m->range.end, fmt::format(", {}.notify())", m->root));
  }
}

}  // namespace reactc
