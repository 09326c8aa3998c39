#include "history/PatchCodec.hpp"

#include "tree/NodeJson.hpp"

#include <cstddef>
#include <cstdint>
#include <utility>

namespace DS::History::PatchCodec {

namespace {

auto malformed(std::string message) -> Error {
    return Error{Error::Code::MalformedDelta, std::move(message)};
}

auto encodePath(Path const& path) -> nlohmann::json {
    auto out = nlohmann::json::array();
    for (auto const& key : path) {
        if (auto const* index = std::get_if<std::size_t>(&key)) {
            out.push_back(static_cast<std::uint64_t>(*index));
        } else {
            out.push_back(std::get<std::string>(key));
        }
    }
    return out;
}

auto decodePath(nlohmann::json const& json) -> Expected<Path> {
    if (!json.is_array())
        return std::unexpected(malformed("Delta path must be an array"));

    Path path;
    path.reserve(json.size());
    for (auto const& element : json) {
        if (element.is_string()) {
            path.emplace_back(element.get<std::string>());
        } else if (element.is_number_unsigned()) {
            path.emplace_back(static_cast<std::size_t>(element.get<std::uint64_t>()));
        } else if (element.is_number_integer()) {
            auto value = element.get<std::int64_t>();
            if (value < 0)
                return std::unexpected(malformed("Delta path index must not be negative"));
            path.emplace_back(static_cast<std::size_t>(value));
        } else {
            return std::unexpected(malformed("Delta path elements must be strings or integers"));
        }
    }
    return path;
}

auto decodePayload(nlohmann::json const& record, char const* field, bool required) -> Expected<NodePtr> {
    auto it = record.find(field);
    if (it == record.end()) {
        if (required)
            return std::unexpected(malformed(std::string("Delta is missing '") + field + "'"));
        return NodePtr{};
    }
    auto node = fromJson(*it);
    if (!node)
        return std::unexpected(node.error());
    return std::move(*node);
}

} // namespace

auto encodeDelta(Delta const& delta) -> nlohmann::json {
    nlohmann::json record;
    record["kind"] = std::string(deltaKindToString(delta.kind));
    record["path"] = encodePath(delta.path);
    if (delta.value)
        record["value"] = toJson(delta.value);
    if (delta.oldValue)
        record["oldValue"] = toJson(delta.oldValue);
    return record;
}

auto decodeDelta(nlohmann::json const& json) -> Expected<Delta> {
    if (!json.is_object())
        return std::unexpected(malformed("Delta record must be an object"));

    auto kindIt = json.find("kind");
    if (kindIt == json.end() || !kindIt->is_string())
        return std::unexpected(malformed("Delta record is missing a string 'kind'"));
    auto kindText = kindIt->get<std::string>();
    auto kind     = parseDeltaKind(kindText);
    if (!kind)
        return std::unexpected(malformed("Unknown delta kind '" + kindText + "'"));

    auto pathIt = json.find("path");
    if (pathIt == json.end())
        return std::unexpected(malformed("Delta record is missing 'path'"));
    auto path = decodePath(*pathIt);
    if (!path)
        return std::unexpected(path.error());

    auto value = decodePayload(json, "value", *kind != DeltaKind::Remove);
    if (!value)
        return std::unexpected(value.error());
    auto oldValue = decodePayload(json, "oldValue", *kind != DeltaKind::Create);
    if (!oldValue)
        return std::unexpected(oldValue.error());

    Delta delta;
    delta.kind     = *kind;
    delta.path     = std::move(*path);
    delta.value    = std::move(*value);
    delta.oldValue = std::move(*oldValue);
    return delta;
}

auto encodePatch(Patch const& patch) -> nlohmann::json {
    auto out = nlohmann::json::array();
    for (auto const& delta : patch) {
        out.push_back(encodeDelta(delta));
    }
    return out;
}

auto decodePatch(nlohmann::json const& json) -> Expected<Patch> {
    if (!json.is_array())
        return std::unexpected(malformed("Patch must be an array of delta records"));

    Patch patch;
    patch.reserve(json.size());
    for (std::size_t i = 0; i < json.size(); ++i) {
        auto delta = decodeDelta(json[i]);
        if (!delta) {
            auto error = delta.error();
            error.message = "delta " + std::to_string(i) + ": " + error.message.value_or("");
            return std::unexpected(std::move(error));
        }
        patch.push_back(std::move(*delta));
    }
    return patch;
}

auto encodeHistory(std::vector<Patch> const& patches) -> nlohmann::json {
    auto out = nlohmann::json::array();
    for (auto const& patch : patches) {
        out.push_back(encodePatch(patch));
    }
    return out;
}

auto decodeHistory(nlohmann::json const& json) -> Expected<std::vector<Patch>> {
    if (!json.is_array())
        return std::unexpected(malformed("History must be an array of patches"));

    std::vector<Patch> patches;
    patches.reserve(json.size());
    for (std::size_t i = 0; i < json.size(); ++i) {
        auto patch = decodePatch(json[i]);
        if (!patch) {
            auto error = patch.error();
            error.message = "patch " + std::to_string(i) + ": " + error.message.value_or("");
            return std::unexpected(std::move(error));
        }
        patches.push_back(std::move(*patch));
    }
    return patches;
}

auto patchToString(Patch const& patch, int indent) -> std::string {
    return encodePatch(patch).dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

auto patchFromString(std::string_view text) -> Expected<Patch> {
    auto json = parseJsonText(text);
    if (!json)
        return std::unexpected(json.error());
    return decodePatch(*json);
}

auto parseJsonText(std::string_view text) -> Expected<nlohmann::json> {
    try {
        return nlohmann::json::parse(text);
    } catch (nlohmann::json::parse_error const& ex) {
        return std::unexpected(Error{Error::Code::MalformedInput, ex.what()});
    }
}

} // namespace DS::History::PatchCodec
