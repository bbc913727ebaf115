// mathedit/tree/json_visitor.hpp - JSON serialization for expression trees
//
// Used by the CLI `json` command; hosts that render the structural view can
// consume the same shape.
//
#pragma once

#include <nlohmann/json.hpp>

#include "mathedit/tree/expr.hpp"

namespace mathedit
{

/**
 * Serialize an expression tree to JSON.
 *
 * Every node becomes {"kind", "range", ...payload, "children"}; a null
 * node becomes JSON null.
 */
[[nodiscard]] nlohmann::json to_json(const Expr * node);

}  // namespace mathedit
