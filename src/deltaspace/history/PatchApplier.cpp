#include "history/PatchApplier.hpp"

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace DS::History {

namespace {

// Compared by address; never escapes a finished application.
auto tombstone() -> NodePtr const& {
    static NodePtr const marker = std::make_shared<const Node>(Node{nullptr});
    return marker;
}

auto parentOf(Path const& path) -> Path {
    return Path(path.begin(), path.end() - 1);
}

auto kindMismatch(Node const& container, PathKey const& key, Path const& at) -> Error {
    return Error{Error::Code::TypeMismatch,
                 (isIndex(key) ? std::string("Index step into ") : std::string("Key step into "))
                     + std::string(nodeKindToString(container.kind())) + " at '" + toPointer(at) + "'"};
}

// Locate the child slot for key inside a mutable container.
auto childSlot(Node& container, PathKey const& key, Path const& at) -> Expected<NodePtr*> {
    if (auto const* index = std::get_if<std::size_t>(&key)) {
        auto* items = container.asArray();
        if (!items)
            return std::unexpected(kindMismatch(container, key, at));
        if (*index >= items->size() || (*items)[*index] == tombstone())
            return std::unexpected(Error{Error::Code::NoSuchPath, "No array element at '" + toPointer(at) + "'"});
        return &(*items)[*index];
    }

    auto* fields = container.asObject();
    if (!fields)
        return std::unexpected(kindMismatch(container, key, at));
    auto it = fields->find(std::get<std::string>(key));
    if (it == fields->end())
        return std::unexpected(Error{Error::Code::NoSuchPath, "No field at '" + toPointer(at) + "'"});
    return &it->second;
}

} // namespace

PatchApplier::PatchApplier(NodePtr base)
    : root_(std::move(base)) {}

auto PatchApplier::apply(Patch const& patch, ApplyDirection direction) -> Expected<NodePtr> {
    if (!root_)
        return std::unexpected(Error{Error::Code::MalformedInput, "Cannot apply a patch to an empty tree"});

    std::vector<Step> steps;
    steps.reserve(patch.size());
    std::set<Path> insertTargets;
    auto plan = [&](Delta const& delta) -> Expected<void> {
        auto step = planStep(delta, direction);
        if (!step)
            return std::unexpected(step.error());
        if (step->operation == Operation::Insert)
            insertTargets.insert(parentOf(delta.path));
        steps.push_back(std::move(*step));
        return {};
    };
    if (direction == ApplyDirection::Forward) {
        for (auto const& delta : patch) {
            if (auto planned = plan(delta); !planned)
                return std::unexpected(planned.error());
        }
    } else {
        for (auto it = patch.rbegin(); it != patch.rend(); ++it) {
            if (auto planned = plan(*it); !planned)
                return std::unexpected(planned.error());
        }
    }

    // Positions below an array that gains elements refer to the result, so
    // those Deltas wait for the insertions. Erasing a slot of such an array
    // still addresses the tree being patched.
    auto waitsForInsertions = [&](Step const& step) {
        auto const& path = step.delta->path;
        for (std::size_t length = 0; length < path.size(); ++length) {
            if (!insertTargets.contains(Path(path.begin(), path.begin() + static_cast<std::ptrdiff_t>(length))))
                continue;
            bool const ownSlot = length + 1 == path.size();
            if (!ownSlot || step.operation != Operation::Erase)
                return true;
        }
        return false;
    };

    std::vector<Step const*> insertions;
    std::vector<Step const*> deferred;
    for (auto const& step : steps) {
        if (step.operation == Operation::Insert) {
            insertions.push_back(&step);
        } else if (!insertTargets.empty() && waitsForInsertions(step)) {
            deferred.push_back(&step);
        } else if (auto done = runStep(step); !done) {
            return std::unexpected(done.error());
        }
    }
    compactArrays();

    if (insertions.empty())
        return root_;

    std::stable_sort(insertions.begin(), insertions.end(), [](Step const* lhs, Step const* rhs) {
        return lhs->delta->path < rhs->delta->path;
    });
    for (auto const* step : insertions) {
        if (auto done = runStep(*step); !done)
            return std::unexpected(done.error());
    }
    for (auto const* step : deferred) {
        if (auto done = runStep(*step); !done)
            return std::unexpected(done.error());
    }
    compactArrays();

    return root_;
}

auto PatchApplier::planStep(Delta const& delta, ApplyDirection direction) const -> Expected<Step> {
    Step step{.delta = &delta};

    switch (delta.kind) {
    case DeltaKind::Create:
        step.operation = direction == ApplyDirection::Forward ? Operation::Write : Operation::Erase;
        step.payload   = delta.value;
        break;
    case DeltaKind::Change:
        step.operation = Operation::Write;
        step.payload   = direction == ApplyDirection::Forward ? delta.value : delta.oldValue;
        break;
    case DeltaKind::Remove:
        step.operation = direction == ApplyDirection::Forward ? Operation::Erase : Operation::Write;
        step.payload   = delta.oldValue;
        break;
    default:
        return std::unexpected(Error{Error::Code::MalformedDelta,
                                     "Unknown delta kind " + std::to_string(static_cast<int>(delta.kind))});
    }

    if (step.operation == Operation::Erase)
        return step;

    if (!step.payload) {
        return std::unexpected(Error{Error::Code::MalformedDelta,
                                     std::string(deltaKindToString(delta.kind)) + " at '" + toPointer(delta.path)
                                         + "' carries no value to write"});
    }
    // CREATE forward and REMOVE inverse bring an array slot into existence.
    if (delta.kind != DeltaKind::Change && !delta.path.empty() && isIndex(delta.path.back()))
        step.operation = Operation::Insert;
    return step;
}

auto PatchApplier::runStep(Step const& step) -> Expected<void> {
    auto const& path = step.delta->path;
    Expected<void> done;
    switch (step.operation) {
    case Operation::Write:
        done = write(path, step.payload);
        break;
    case Operation::Erase:
        done = erase(path);
        break;
    case Operation::Insert:
        done = insert(path, step.payload);
        break;
    }
    if (!done) {
        ds_log("Patch rejected at '" + toPointer(path) + "': " + describeError(done.error()), "PatchApplier", "ERROR");
    }
    return done;
}

auto PatchApplier::mutableAt(Path const& prefix) -> Expected<Node*> {
    if (auto it = copied_.find(prefix); it != copied_.end())
        return it->second.get();

    if (prefix.empty()) {
        auto copy = std::make_shared<Node>(*root_);
        root_     = copy;
        copied_.emplace(prefix, copy);
        stats_.copiedNodes++;
        return copy.get();
    }

    auto parent = mutableAt(parentOf(prefix));
    if (!parent)
        return std::unexpected(parent.error());

    auto slot = childSlot(**parent, prefix.back(), prefix);
    if (!slot)
        return std::unexpected(slot.error());

    NodePtr const& child = **slot;
    if (!child->isComposite()) {
        return std::unexpected(Error{Error::Code::TypeMismatch,
                                     "Cannot descend into " + std::string(nodeKindToString(child->kind())) + " at '"
                                         + toPointer(prefix) + "'"});
    }

    auto copy = std::make_shared<Node>(*child);
    **slot    = copy;
    copied_.emplace(prefix, copy);
    stats_.copiedNodes++;
    return copy.get();
}

auto PatchApplier::write(Path const& path, NodePtr value) -> Expected<void> {
    stats_.writes++;
    if (path.empty()) {
        root_ = std::move(value);
        copied_.clear();
        pendingArrays_.clear();
        return {};
    }

    auto const parentPath = parentOf(path);
    auto       container  = mutableAt(parentPath);
    if (!container)
        return std::unexpected(container.error());

    forgetBelow(path);

    auto const& key = path.back();
    if (auto const* index = std::get_if<std::size_t>(&key)) {
        auto* items = (*container)->asArray();
        if (!items)
            return std::unexpected(kindMismatch(**container, key, path));
        if (*index >= items->size())
            return std::unexpected(Error{Error::Code::NoSuchPath, "No array element at '" + toPointer(path) + "'"});
        (*items)[*index] = std::move(value);
        return {};
    }

    auto* fields = (*container)->asObject();
    if (!fields)
        return std::unexpected(kindMismatch(**container, key, path));
    fields->insert_or_assign(std::get<std::string>(key), std::move(value));
    return {};
}

auto PatchApplier::erase(Path const& path) -> Expected<void> {
    stats_.removals++;
    if (path.empty()) {
        root_ = Node::null();
        copied_.clear();
        pendingArrays_.clear();
        return {};
    }

    auto const parentPath = parentOf(path);
    auto       container  = mutableAt(parentPath);
    if (!container)
        return std::unexpected(container.error());

    auto slot = childSlot(**container, path.back(), path);
    if (!slot)
        return std::unexpected(slot.error());

    forgetBelow(path);

    if ((*container)->isArray()) {
        **slot = tombstone();
        pendingArrays_.insert(parentPath);
    } else {
        (*container)->asObject()->erase(std::get<std::string>(path.back()));
    }
    return {};
}

auto PatchApplier::insert(Path const& path, NodePtr value) -> Expected<void> {
    stats_.insertions++;
    auto const parentPath = parentOf(path);
    auto       container  = mutableAt(parentPath);
    if (!container)
        return std::unexpected(container.error());

    auto* items = (*container)->asArray();
    if (!items)
        return std::unexpected(kindMismatch(**container, path.back(), path));
    auto const index = std::get<std::size_t>(path.back());
    if (index > items->size()) {
        return std::unexpected(Error{Error::Code::InvalidPath,
                                     "Insertion at '" + toPointer(path) + "' leaves a gap in an array of "
                                         + std::to_string(items->size()) + " elements"});
    }
    items->insert(items->begin() + static_cast<std::ptrdiff_t>(index), std::move(value));
    forgetElements(parentPath);
    return {};
}

void PatchApplier::compactArrays() {
    for (auto const& arrayPath : pendingArrays_) {
        auto it = copied_.find(arrayPath);
        if (it == copied_.end())
            continue;
        auto* items = it->second->asArray();
        if (!items)
            continue;
        if (std::erase(*items, tombstone()) > 0)
            forgetElements(arrayPath);
        stats_.compactedArrays++;
    }
    pendingArrays_.clear();
}

// Private copies under a replaced or deleted slot are detached from the new
// tree and must not receive later writes.
void PatchApplier::forgetBelow(Path const& path) {
    for (auto it = copied_.lower_bound(path); it != copied_.end() && isPrefixOf(path, it->first);) {
        it = copied_.erase(it);
    }
    for (auto it = pendingArrays_.lower_bound(path); it != pendingArrays_.end() && isPrefixOf(path, *it);) {
        it = pendingArrays_.erase(it);
    }
}

// Element positions shifted; copies below the array are looked up afresh.
void PatchApplier::forgetElements(Path const& arrayPath) {
    auto it = copied_.upper_bound(arrayPath);
    while (it != copied_.end() && isPrefixOf(arrayPath, it->first))
        it = copied_.erase(it);
}

auto applyPatch(NodePtr const& base, Patch const& patch, ApplyDirection direction) -> Expected<NodePtr> {
    PatchApplier applier(base);
    return applier.apply(patch, direction);
}

} // namespace DS::History
