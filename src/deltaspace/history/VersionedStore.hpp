#pragma once

#include "core/Error.hpp"
#include "history/Delta.hpp"
#include "history/HistoryLedger.hpp"
#include "history/Notifier.hpp"
#include "tree/Node.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>

namespace DS::History {

struct StoreOptions {
    // Commit Patches with no Deltas as history entries (they then count for
    // canUndo and undo to an identical tree).
    bool recordEmptyPatches = false;
    // Notify listeners for operations that leave the tree unchanged
    // (empty mutations, undo/redo with nothing to do).
    bool notifyOnNoop = true;
};

class VersionedStore;

/**
 * Scoped pause: edits made while the guard is alive become a single history
 * entry when it is committed or destroyed. A guard opened while the store is
 * already paused leaves the pause to its opener. The guard follows its store
 * across moves and goes inactive when the store is destroyed.
 */
class HistoryTransaction {
public:
    HistoryTransaction() = default;
    HistoryTransaction(HistoryTransaction&& other) noexcept;
    HistoryTransaction& operator=(HistoryTransaction&& other) noexcept;
    ~HistoryTransaction();

    HistoryTransaction(HistoryTransaction const&)            = delete;
    HistoryTransaction& operator=(HistoryTransaction const&) = delete;

    auto commit() -> Expected<void>;
    explicit operator bool() const noexcept { return !owner_.expired(); }

private:
    friend class VersionedStore;
    HistoryTransaction(std::weak_ptr<VersionedStore*> owner, bool ownsPause);

    void release();

    std::weak_ptr<VersionedStore*> owner_;
    bool                           ownsPause_ = false;
};

/**
 * Versioned state container.
 *
 * Holds the current tree, records the minimal Patch of every transition in a
 * linear HistoryLedger and replays those Patches for undo/redo. While paused,
 * transitions are published but not recorded; resuming commits everything
 * since the first in-pause change as one entry.
 *
 * Listeners are called synchronously after every operation that publishes a
 * tree or toggles the pause. Operations that fail return the Error and leave
 * state, history, pause flags and listeners untouched.
 *
 * Not thread safe; callers serialize access.
 */
class VersionedStore {
public:
    explicit VersionedStore(NodePtr initial, StoreOptions options = {});

    VersionedStore(VersionedStore&& other) noexcept;
    VersionedStore& operator=(VersionedStore&& other) noexcept;
    ~VersionedStore() = default;

    [[nodiscard]] static auto fromJson(nlohmann::json const& initial, StoreOptions options = {})
        -> Expected<VersionedStore>;

    // Edit a deep JSON copy of the current tree; the result is diffed
    // against the current tree and published with untouched branches shared.
    auto mutate(std::function<void(nlohmann::json&)> const& mutator) -> Expected<void>;

    // Shallow merge: top-level keys of `partial` replace those of the root.
    auto setState(nlohmann::json const& partial) -> Expected<void>;
    auto setState(std::function<nlohmann::json(nlohmann::json const&)> const& producer) -> Expected<void>;

    // `step` must return a tree that shares every untouched branch
    // with its argument.
    auto update(std::function<NodePtr(NodePtr const&)> const& step) -> Expected<void>;

    auto applyPatch(Patch const& patch) -> Expected<void>;

    // Records a single root-level CHANGE unless `next` is the current root.
    auto replaceState(NodePtr next) -> Expected<void>;

    void pause();
    void resume();

    auto undo() -> Expected<void>;
    auto redo() -> Expected<void>;

    [[nodiscard]] auto beginTransaction() -> HistoryTransaction;

    [[nodiscard]] auto getState() const noexcept -> NodePtr const& { return current_; }
    [[nodiscard]] auto getPrevious() const noexcept -> NodePtr const& { return previous_; }
    [[nodiscard]] auto getSnapshot() const -> Snapshot { return Snapshot{current_, generation_}; }
    [[nodiscard]] auto getIsPaused() const noexcept -> bool { return isPaused_; }
    [[nodiscard]] auto getCanUndo() const -> bool;
    [[nodiscard]] auto getCanRedo() const -> bool;

    [[nodiscard]] auto ledger() const noexcept -> HistoryLedger const& { return ledger_; }
    [[nodiscard]] auto stats() const -> HistoryLedger::Stats { return ledger_.stats(); }
    [[nodiscard]] auto options() const noexcept -> StoreOptions const& { return options_; }

    [[nodiscard]] auto subscribe(Notifier::Listener listener) -> Notifier::Unsubscribe;

private:
    auto transition(NodePtr next, Patch patch) -> Expected<void>;
    auto commitPatch(Patch patch) -> void;
    auto pendingPatch() const -> std::optional<Patch>;
    auto clearPause() -> void;
    auto publish(NodePtr next) -> void;
    auto notifyNoop() const -> void;

    NodePtr                   current_;
    NodePtr                   previous_;
    NodePtr                   pauseBase_;
    bool                      isPaused_           = false;
    bool                      changedWhilePaused_ = false;
    std::size_t               generation_         = 0;
    HistoryLedger             ledger_;
    std::shared_ptr<Notifier> notifier_;
    StoreOptions              options_;
    // Where open transactions find this store; repointed on move.
    std::shared_ptr<VersionedStore*> anchor_;
};

} // namespace DS::History
