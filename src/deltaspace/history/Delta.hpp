#pragma once

#include "tree/Node.hpp"
#include "tree/Path.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace DS::History {

enum class DeltaKind : std::uint8_t {
    Create = 0,
    Change = 1,
    Remove = 2,
};

/**
 * One structural change at one path.
 *
 * Create: path absent before, holds `value` after.
 * Change: path present on both sides; `oldValue` before, `value` after.
 * Remove: path held `oldValue` before and is absent after.
 *
 * Absent payloads are empty pointers.
 */
struct Delta {
    DeltaKind kind = DeltaKind::Change;
    Path      path;
    NodePtr   value;
    NodePtr   oldValue;
};

// Ordered batch of Deltas; replayed front to back, inverted back to front.
using Patch = std::vector<Delta>;

[[nodiscard]] auto deltaKindToString(DeltaKind kind) -> std::string_view;
[[nodiscard]] auto parseDeltaKind(std::string_view text) -> std::optional<DeltaKind>;

[[nodiscard]] auto isKnownDeltaKind(DeltaKind kind) noexcept -> bool;

// Patch that undoes `patch` when applied forward: reversed order, Create and
// Remove swapped, Change payloads swapped.
[[nodiscard]] auto invertPatch(Patch const& patch) -> Patch;

// Human readable listing, one Delta per line ("CHANGE /age 36 -> 37").
[[nodiscard]] auto describePatch(Patch const& patch) -> std::string;

} // namespace DS::History
