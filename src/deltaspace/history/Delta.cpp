#include "history/Delta.hpp"

#include "tree/NodeJson.hpp"

namespace DS::History {

namespace {

constexpr std::size_t kPreviewChars = 48;

auto preview(NodePtr const& node) -> std::string {
    if (!node)
        return "<absent>";
    // Invalid UTF-8 in strings is shown as U+FFFD.
    auto text = toJson(node).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    if (text.size() > kPreviewChars) {
        text.resize(kPreviewChars);
        text += "...";
    }
    return text;
}

} // namespace

auto deltaKindToString(DeltaKind kind) -> std::string_view {
    switch (kind) {
    case DeltaKind::Create:
        return "CREATE";
    case DeltaKind::Change:
        return "CHANGE";
    case DeltaKind::Remove:
        return "REMOVE";
    }
    return "UNKNOWN";
}

auto parseDeltaKind(std::string_view text) -> std::optional<DeltaKind> {
    if (text == "CREATE")
        return DeltaKind::Create;
    if (text == "CHANGE")
        return DeltaKind::Change;
    if (text == "REMOVE")
        return DeltaKind::Remove;
    return std::nullopt;
}

auto isKnownDeltaKind(DeltaKind kind) noexcept -> bool {
    switch (kind) {
    case DeltaKind::Create:
    case DeltaKind::Change:
    case DeltaKind::Remove:
        return true;
    }
    return false;
}

auto invertPatch(Patch const& patch) -> Patch {
    Patch inverted;
    inverted.reserve(patch.size());
    for (auto it = patch.rbegin(); it != patch.rend(); ++it) {
        Delta delta;
        delta.path     = it->path;
        delta.value    = it->oldValue;
        delta.oldValue = it->value;
        switch (it->kind) {
        case DeltaKind::Create:
            delta.kind = DeltaKind::Remove;
            break;
        case DeltaKind::Remove:
            delta.kind = DeltaKind::Create;
            break;
        default:
            delta.kind = it->kind;
            break;
        }
        inverted.push_back(std::move(delta));
    }
    return inverted;
}

auto describePatch(Patch const& patch) -> std::string {
    std::string out;
    for (auto const& delta : patch) {
        out += deltaKindToString(delta.kind);
        out.push_back(' ');
        auto pointer = toPointer(delta.path);
        out += pointer.empty() ? "/" : pointer;
        switch (delta.kind) {
        case DeltaKind::Create:
            out += " = " + preview(delta.value);
            break;
        case DeltaKind::Change:
            out += " " + preview(delta.oldValue) + " -> " + preview(delta.value);
            break;
        case DeltaKind::Remove:
            out += " (was " + preview(delta.oldValue) + ")";
            break;
        }
        out.push_back('\n');
    }
    return out;
}

} // namespace DS::History
