#include "history/TreeDiff.hpp"

#include <algorithm>

namespace DS::History {

namespace {

class TreeDiffer {
public:
    explicit TreeDiffer(Patch& out) : out(out) {}

    void compare(NodePtr const& before, NodePtr const& after) {
        if (before == after)
            return;
        if (!before) {
            emit(DeltaKind::Create, after, nullptr);
            return;
        }
        if (!after) {
            emit(DeltaKind::Remove, nullptr, before);
            return;
        }

        if (before->kind() == after->kind()) {
            if (auto const* left = before->asObject()) {
                compareObjects(*left, *after->asObject());
                return;
            }
            if (auto const* left = before->asArray()) {
                compareArrays(*left, *after->asArray());
                return;
            }
            if (scalarEquals(*before, *after))
                return;
        }

        emit(DeltaKind::Change, after, before);
    }

private:
    void compareObjects(Object const& before, Object const& after) {
        for (auto const& [key, oldChild] : before) {
            path.emplace_back(key);
            auto it = after.find(key);
            if (it == after.end()) {
                emit(DeltaKind::Remove, nullptr, oldChild);
            } else {
                compare(oldChild, it->second);
            }
            path.pop_back();
        }
        for (auto const& [key, newChild] : after) {
            if (before.contains(key))
                continue;
            path.emplace_back(key);
            emit(DeltaKind::Create, newChild, nullptr);
            path.pop_back();
        }
    }

    void compareArrays(Array const& before, Array const& after) {
        auto const shared = std::min(before.size(), after.size());
        for (std::size_t i = 0; i < shared; ++i) {
            path.emplace_back(i);
            compare(before[i], after[i]);
            path.pop_back();
        }
        for (std::size_t i = shared; i < before.size(); ++i) {
            path.emplace_back(i);
            emit(DeltaKind::Remove, nullptr, before[i]);
            path.pop_back();
        }
        for (std::size_t i = shared; i < after.size(); ++i) {
            path.emplace_back(i);
            emit(DeltaKind::Create, after[i], nullptr);
            path.pop_back();
        }
    }

    void emit(DeltaKind kind, NodePtr value, NodePtr oldValue) {
        out.push_back(Delta{.kind = kind, .path = path, .value = std::move(value), .oldValue = std::move(oldValue)});
    }

    Patch& out;
    Path   path;
};

} // namespace

auto diff(NodePtr const& before, NodePtr const& after) -> Patch {
    Patch patch;
    TreeDiffer differ(patch);
    differ.compare(before, after);
    return patch;
}

} // namespace DS::History
