#pragma once

#include "core/Error.hpp"
#include "tree/Node.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace DS {

// One step into a tree: an object key or an array index.
using PathKey = std::variant<std::string, std::size_t>;

// Location in a tree; the empty path is the root.
using Path = std::vector<PathKey>;

[[nodiscard]] inline auto isIndex(PathKey const& key) noexcept -> bool {
    return std::holds_alternative<std::size_t>(key);
}

[[nodiscard]] auto pathKeyToString(PathKey const& key) -> std::string;

// Render as an RFC 6901 JSON Pointer ("" for the root, "/a/0/b" otherwise).
[[nodiscard]] auto toPointer(Path const& path) -> std::string;

// Parse an RFC 6901 JSON Pointer. Tokens made only of decimal digits become
// array indices; everything else becomes an object key.
[[nodiscard]] auto parsePointer(std::string_view pointer) -> Expected<Path>;

[[nodiscard]] auto isPrefixOf(Path const& prefix, Path const& path) -> bool;

// Walk path from root. An index step on an object looks up the decimal key.
[[nodiscard]] auto resolve(NodePtr const& root, Path const& path) -> Expected<NodePtr>;

} // namespace DS
