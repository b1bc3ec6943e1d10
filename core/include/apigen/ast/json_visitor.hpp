// apigen/ast/json_visitor.hpp - JSON serialization for AST nodes
//
// Returns nlohmann::json objects for any code-model AST node. Used by
// `apigen generate --dump-json` and by tooling that inspects generated
// classes without rendering them.
//
#pragma once

#include <nlohmann/json.hpp>

#include "apigen/ast/ast.hpp"

namespace apigen
{

/**
 * Serialize an AST node (and its subtree) to JSON.
 *
 * Every object carries a "type" key naming the node class. A null node
 * serializes to JSON null.
 */
[[nodiscard]] nlohmann::json to_json(const AstNode * node);

}  // namespace apigen
