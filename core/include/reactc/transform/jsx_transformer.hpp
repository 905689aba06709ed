// reactc/transform/jsx_transformer.hpp - JSX to DOM helper calls
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "reactc/analysis/reactivity_types.hpp"
#include "reactc/transform/edit_buffer.hpp"
#include "reactc/transform/transform_utils.hpp"

namespace reactc
{

/**
 * JSX Transformer.
 *
 * Replaces every JSX tree in a component body with DOM helper calls from the
 * internals module. Intrinsic elements and fragments become an IIFE that
 * builds the node:
 *
 * @code
 *   <div class="a">{count}</div>
 *   // (() => {
 *   //   const __el0 = __element("div");
 *   //   __el0.setAttribute("class", "a");
 *   //   __append(__el0, __child(() => count.value));
 *   //   return __el0;
 *   // })()
 * @endcode
 *
 * Components become a call with a props object in which reactive attribute
 * expressions are getters (`get value() { return x.value; }`), so the callee
 * re-reads them on every access.
 *
 * Reactivity of each `{...}` container comes from JsxAnalyzer. Expression
 * text is read back from the buffer, so it must run after the signal,
 * computed and mutation transformers.
 */
class JsxTransformer
{
public:
  void transform(
    EditBuffer & buffer, const ComponentInfo & component,
    const std::vector<JsxExpressionInfo> & expressions, HelperUsage & helpers) const;
};

/// Text of a JSX text child after JSX whitespace folding and entity
/// decoding; empty when the child renders nothing.
[[nodiscard]] std::string clean_jsx_text(std::string_view raw);

}  // namespace reactc
