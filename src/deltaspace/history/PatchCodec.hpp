#pragma once

#include "core/Error.hpp"
#include "history/Delta.hpp"

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace DS::History::PatchCodec {

/*
 * Patch interchange format:
 *
 *   [
 *     { "kind": "CHANGE", "path": ["age"], "oldValue": 36, "value": 37 },
 *     { "kind": "CREATE", "path": ["items", 3], "value": {...} },
 *     { "kind": "REMOVE", "path": ["flags", "old"], "oldValue": true }
 *   ]
 *
 * Path elements are strings (object keys) or non-negative integers (array
 * indices). "value" is present for CREATE/CHANGE, "oldValue" for
 * CHANGE/REMOVE.
 */

[[nodiscard]] auto encodeDelta(Delta const& delta) -> nlohmann::json;
[[nodiscard]] auto decodeDelta(nlohmann::json const& json) -> Expected<Delta>;

[[nodiscard]] auto encodePatch(Patch const& patch) -> nlohmann::json;
[[nodiscard]] auto decodePatch(nlohmann::json const& json) -> Expected<Patch>;

// A history is an array of patches.
[[nodiscard]] auto encodeHistory(std::vector<Patch> const& patches) -> nlohmann::json;
[[nodiscard]] auto decodeHistory(nlohmann::json const& json) -> Expected<std::vector<Patch>>;

// Strings that are not valid UTF-8 are written with U+FFFD replacements.
[[nodiscard]] auto patchToString(Patch const& patch, int indent = -1) -> std::string;
[[nodiscard]] auto patchFromString(std::string_view text) -> Expected<Patch>;

[[nodiscard]] auto parseJsonText(std::string_view text) -> Expected<nlohmann::json>;

} // namespace DS::History::PatchCodec
