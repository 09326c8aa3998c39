#include "history/VersionedStore.hpp"

#include "history/PatchApplier.hpp"
#include "history/TreeDiff.hpp"
#include "log/TaggedLogger.hpp"
#include "tree/NodeJson.hpp"

#include <string>
#include <utility>

namespace DS::History {

HistoryTransaction::HistoryTransaction(std::weak_ptr<VersionedStore*> owner, bool ownsPause)
    : owner_(std::move(owner))
    , ownsPause_(ownsPause) {}

HistoryTransaction::HistoryTransaction(HistoryTransaction&& other) noexcept
    : owner_(std::move(other.owner_))
    , ownsPause_(other.ownsPause_) {}

HistoryTransaction& HistoryTransaction::operator=(HistoryTransaction&& other) noexcept {
    if (this != &other) {
        release();
        owner_     = std::move(other.owner_);
        ownsPause_ = other.ownsPause_;
    }
    return *this;
}

HistoryTransaction::~HistoryTransaction() {
    release();
}

auto HistoryTransaction::commit() -> Expected<void> {
    if (owner_.expired())
        return std::unexpected(Error{Error::Code::NotSupported, "History transaction is no longer active"});
    release();
    return {};
}

void HistoryTransaction::release() {
    if (auto owner = owner_.lock(); owner && ownsPause_)
        (*owner)->resume();
    owner_.reset();
}

VersionedStore::VersionedStore(NodePtr initial, StoreOptions options)
    : current_(initial ? std::move(initial) : Node::null())
    , previous_(current_)
    , notifier_(Notifier::create())
    , options_(options) {}

VersionedStore::VersionedStore(VersionedStore&& other) noexcept
    : current_(std::move(other.current_))
    , previous_(std::move(other.previous_))
    , pauseBase_(std::move(other.pauseBase_))
    , isPaused_(other.isPaused_)
    , changedWhilePaused_(other.changedWhilePaused_)
    , generation_(other.generation_)
    , ledger_(std::move(other.ledger_))
    , notifier_(std::move(other.notifier_))
    , options_(other.options_)
    , anchor_(std::move(other.anchor_)) {
    if (anchor_)
        *anchor_ = this;
}

VersionedStore& VersionedStore::operator=(VersionedStore&& other) noexcept {
    if (this != &other) {
        current_            = std::move(other.current_);
        previous_           = std::move(other.previous_);
        pauseBase_          = std::move(other.pauseBase_);
        isPaused_           = other.isPaused_;
        changedWhilePaused_ = other.changedWhilePaused_;
        generation_         = other.generation_;
        ledger_             = std::move(other.ledger_);
        notifier_           = std::move(other.notifier_);
        options_            = other.options_;
        // Guards opened on the overwritten state go inactive.
        anchor_ = std::move(other.anchor_);
        if (anchor_)
            *anchor_ = this;
    }
    return *this;
}

auto VersionedStore::fromJson(nlohmann::json const& initial, StoreOptions options) -> Expected<VersionedStore> {
    auto root = DS::fromJson(initial);
    if (!root)
        return std::unexpected(root.error());
    return VersionedStore(std::move(*root), options);
}

auto VersionedStore::mutate(std::function<void(nlohmann::json&)> const& mutator) -> Expected<void> {
    auto draft = toJson(current_);
    mutator(draft);

    auto next = DS::fromJson(draft);
    if (!next)
        return std::unexpected(next.error());

    auto patch = diff(current_, *next);
    if (patch.empty())
        return transition(current_, std::move(patch));

    // Replaying onto the current tree keeps every untouched branch shared;
    // the draft itself was rebuilt from scratch.
    auto shared = History::applyPatch(current_, patch);
    if (!shared)
        return std::unexpected(shared.error());
    return transition(std::move(*shared), std::move(patch));
}

auto VersionedStore::setState(nlohmann::json const& partial) -> Expected<void> {
    auto const* fields = current_->asObject();
    if (!fields) {
        return std::unexpected(Error{Error::Code::TypeMismatch,
                                     "setState needs an Object root, found " + std::string(nodeKindToString(current_->kind()))});
    }
    if (!partial.is_object()) {
        return std::unexpected(Error{Error::Code::TypeMismatch,
                                     std::string("setState needs an object partial, got ") + partial.type_name()});
    }

    Object merged = *fields;
    for (auto it = partial.begin(); it != partial.end(); ++it) {
        auto child = DS::fromJson(it.value());
        if (!child)
            return std::unexpected(child.error());
        merged.insert_or_assign(it.key(), std::move(*child));
    }

    auto patch = diff(current_, Node::object(std::move(merged)));
    if (patch.empty())
        return transition(current_, std::move(patch));

    auto shared = History::applyPatch(current_, patch);
    if (!shared)
        return std::unexpected(shared.error());
    return transition(std::move(*shared), std::move(patch));
}

auto VersionedStore::setState(std::function<nlohmann::json(nlohmann::json const&)> const& producer) -> Expected<void> {
    return setState(producer(toJson(current_)));
}

auto VersionedStore::update(std::function<NodePtr(NodePtr const&)> const& step) -> Expected<void> {
    auto next = step(current_);
    if (!next)
        return std::unexpected(Error{Error::Code::MalformedInput, "update produced no tree"});
    auto patch = diff(current_, next);
    return transition(std::move(next), std::move(patch));
}

auto VersionedStore::applyPatch(Patch const& patch) -> Expected<void> {
    auto next = History::applyPatch(current_, patch);
    if (!next)
        return std::unexpected(next.error());

    // Record what actually changed so undo never depends on how the caller
    // ordered or phrased its Deltas.
    auto recorded = diff(current_, *next);
    return transition(std::move(*next), std::move(recorded));
}

auto VersionedStore::replaceState(NodePtr next) -> Expected<void> {
    if (!next)
        return std::unexpected(Error{Error::Code::MalformedInput, "replaceState needs a tree"});

    Patch patch;
    if (next != current_)
        patch.push_back(Delta{.kind = DeltaKind::Change, .path = {}, .value = next, .oldValue = current_});
    return transition(std::move(next), std::move(patch));
}

void VersionedStore::pause() {
    ds_log("Pausing history", "VersionedStore", "History");
    isPaused_ = true;
    notifier_->notifyAll();
}

void VersionedStore::resume() {
    if (auto pending = pendingPatch())
        commitPatch(std::move(*pending));
    clearPause();
    ds_log("Resumed history", "VersionedStore", "History");
    notifier_->notifyAll();
}

auto VersionedStore::undo() -> Expected<void> {
    // A dirty pause is folded into history first, so undo reverts the
    // in-pause edits as one step.
    auto pending = pendingPatch();

    Patch const* target = nullptr;
    if (pending) {
        target = &*pending;
    } else if (auto entry = ledger_.peekUndo()) {
        target = &entry->get();
    }

    NodePtr next;
    if (target) {
        auto reverted = History::applyPatch(current_, *target, ApplyDirection::Inverse);
        if (!reverted) {
            ds_log("Undo failed: " + describeError(reverted.error()), "VersionedStore", "ERROR");
            return std::unexpected(reverted.error());
        }
        next = std::move(*reverted);
    }

    bool const wasPaused = isPaused_;
    if (wasPaused)
        clearPause();
    if (pending)
        commitPatch(std::move(*pending));

    if (!next) {
        ds_log("Nothing to undo", "VersionedStore", "History");
        if (wasPaused)
            notifier_->notifyAll();
        else
            notifyNoop();
        return {};
    }

    (void)ledger_.undo();
    publish(std::move(next));
    return {};
}

auto VersionedStore::redo() -> Expected<void> {
    // Committing a dirty pause truncates the redo future, leaving nothing to
    // replay.
    if (isPaused_ && changedWhilePaused_) {
        auto pending = pendingPatch();
        clearPause();
        if (pending)
            commitPatch(std::move(*pending));
        notifier_->notifyAll();
        return {};
    }

    bool const wasPaused = isPaused_;
    auto       entry     = ledger_.peekRedo();
    if (!entry) {
        ds_log("Nothing to redo", "VersionedStore", "History");
        if (wasPaused) {
            clearPause();
            notifier_->notifyAll();
        } else {
            notifyNoop();
        }
        return {};
    }

    auto replayed = History::applyPatch(current_, entry->get(), ApplyDirection::Forward);
    if (!replayed) {
        ds_log("Redo failed: " + describeError(replayed.error()), "VersionedStore", "ERROR");
        return std::unexpected(replayed.error());
    }

    if (wasPaused)
        clearPause();
    (void)ledger_.redo();
    publish(std::move(*replayed));
    return {};
}

auto VersionedStore::beginTransaction() -> HistoryTransaction {
    if (!anchor_)
        anchor_ = std::make_shared<VersionedStore*>(this);
    bool const ownsPause = !isPaused_;
    if (ownsPause)
        pause();
    return HistoryTransaction(anchor_, ownsPause);
}

auto VersionedStore::getCanUndo() const -> bool {
    return ledger_.canUndo() || (isPaused_ && changedWhilePaused_);
}

auto VersionedStore::getCanRedo() const -> bool {
    if (isPaused_ && changedWhilePaused_)
        return false;
    return ledger_.canRedo();
}

auto VersionedStore::subscribe(Notifier::Listener listener) -> Notifier::Unsubscribe {
    return notifier_->subscribe(std::move(listener));
}

auto VersionedStore::transition(NodePtr next, Patch patch) -> Expected<void> {
    if (patch.empty() && !options_.recordEmptyPatches) {
        ds_log("Transition produced no changes", "VersionedStore");
        notifyNoop();
        return {};
    }

    if (isPaused_) {
        if (!changedWhilePaused_) {
            pauseBase_          = current_;
            changedWhilePaused_ = true;
        }
    } else {
        commitPatch(std::move(patch));
    }

    publish(std::move(next));
    return {};
}

auto VersionedStore::commitPatch(Patch patch) -> void {
    ds_log("Committing entry " + std::to_string(ledger_.cursor()) + " with " + std::to_string(patch.size())
               + " deltas",
           "VersionedStore", "History");
    ledger_.commit(std::move(patch));
}

auto VersionedStore::pendingPatch() const -> std::optional<Patch> {
    if (!isPaused_ || !changedWhilePaused_)
        return std::nullopt;
    auto patch = diff(pauseBase_, current_);
    if (patch.empty() && !options_.recordEmptyPatches)
        return std::nullopt;
    return patch;
}

auto VersionedStore::clearPause() -> void {
    isPaused_           = false;
    changedWhilePaused_ = false;
    pauseBase_.reset();
}

auto VersionedStore::publish(NodePtr next) -> void {
    previous_ = current_;
    current_  = std::move(next);
    ++generation_;
    notifier_->notifyAll();
}

auto VersionedStore::notifyNoop() const -> void {
    if (options_.notifyOnNoop)
        notifier_->notifyAll();
}

} // namespace DS::History
