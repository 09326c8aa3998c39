#pragma once

#include "history/Delta.hpp"

#include <cstddef>
#include <deque>
#include <functional>
#include <optional>

namespace DS::History {

/**
 * Linear undo log with a movable cursor.
 *
 * Entries [0, cursor) are applied to the live tree, entries [cursor, size)
 * are the redo future. Committing while the cursor sits before the end
 * discards the redo future first. `pointer()` reports the index of the most
 * recently applied entry, -1 when none is applied.
 */
class HistoryLedger {
public:
    struct Stats {
        std::size_t totalEntries = 0;
        std::size_t undoCount    = 0;
        std::size_t redoCount    = 0;
        std::size_t totalDeltas  = 0;
    };

    HistoryLedger() = default;

    void clear();

    void commit(Patch patch);

    [[nodiscard]] auto size() const -> std::size_t { return entries.size(); }
    [[nodiscard]] auto cursor() const -> std::size_t { return cursorIndex; }
    [[nodiscard]] auto pointer() const -> std::ptrdiff_t { return static_cast<std::ptrdiff_t>(cursorIndex) - 1; }

    [[nodiscard]] auto canUndo() const -> bool;
    [[nodiscard]] auto canRedo() const -> bool;

    [[nodiscard]] auto peekUndo() const
        -> std::optional<std::reference_wrapper<Patch const>>;
    [[nodiscard]] auto peekRedo() const
        -> std::optional<std::reference_wrapper<Patch const>>;

    // Move the cursor; the returned Patch is the one the caller must invert
    // (undo) or replay (redo) against the live tree.
    [[nodiscard]] auto undo()
        -> std::optional<std::reference_wrapper<Patch const>>;
    [[nodiscard]] auto redo()
        -> std::optional<std::reference_wrapper<Patch const>>;

    [[nodiscard]] auto entryAt(std::size_t index) const -> Patch const&;

    [[nodiscard]] auto stats() const -> Stats;

private:
    void dropRedoTail();

    std::deque<Patch> entries;
    std::size_t       cursorIndex = 0;
    std::size_t       deltaCount  = 0;
};

} // namespace DS::History
