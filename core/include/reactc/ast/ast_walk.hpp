// reactc/ast/ast_walk.hpp - Generic child enumeration and traversal
//
// for_each_child is one exhaustive match over NodeKind; every analysis in the
// compiler is written on top of it instead of per-pass visitors.
//
#pragma once

#include <functional>

#include "reactc/ast/ast.hpp"

namespace reactc
{

using ChildFn = std::function<void(const AstNode *)>;

/// Pre-order callback; return false to skip the node's children.
using WalkFn = std::function<bool(const AstNode * node, const AstNode * parent)>;

/// Invoke fn for every direct, non-null child of node in source order.
void for_each_child(const AstNode * node, const ChildFn & fn);

/// Depth-first pre-order walk starting at (and including) root.
void walk_preorder(const AstNode * root, const WalkFn & fn, const AstNode * parent = nullptr);

}  // namespace reactc
