// reactc/ast/ast_json.hpp - JSON serialization for AST nodes
//
// Used by `reactc dump-ast`. Every node becomes
// {"type", "range", <node attributes>..., "children": [...]}.
//
#pragma once

#include <nlohmann/json.hpp>

#include "reactc/ast/ast.hpp"

namespace reactc
{

/**
 * Serialize an AST node (and its subtree) to JSON.
 *
 * @param node Any AST node; nullptr yields JSON null
 */
[[nodiscard]] nlohmann::json to_json(const AstNode * node);

}  // namespace reactc
