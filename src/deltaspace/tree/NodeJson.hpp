#pragma once

#include "core/Error.hpp"
#include "tree/Node.hpp"

#include <nlohmann/json.hpp>

namespace DS {

// Deep conversion to a mutable JSON document. Object keys come out sorted.
[[nodiscard]] auto toJson(NodePtr const& node) -> nlohmann::json;

// Build a fresh tree from a JSON document. Unsigned values that do not fit
// in int64 become Numbers; binary and discarded values are rejected.
[[nodiscard]] auto fromJson(nlohmann::json const& json) -> Expected<NodePtr>;

} // namespace DS
