// swlint/ast/json_visitor.hpp - JSON serialization for AST nodes
//
// Provides a visitor-based JSON serialization for the AST,
// returning nlohmann::json objects for any AST node.
//
#pragma once

#include <nlohmann/json.hpp>

#include "swlint/ast/ast.hpp"

namespace swlint
{

/**
 * Serialize an AST node to JSON.
 *
 * Declarations carry their attributes, modifiers and children; ranges are
 * byte offsets `{start, end}`.
 *
 * @param node The AST node to serialize (can be any node type)
 * @return JSON representation of the node
 */
[[nodiscard]] nlohmann::json to_json(const AstNode * node);

/**
 * Serialize a SourceUnit including all its top-level items.
 *
 * @param unit The parsed file
 * @return JSON representation with all declarations
 */
[[nodiscard]] nlohmann::json to_json(const SourceUnit * unit);

}  // namespace swlint
