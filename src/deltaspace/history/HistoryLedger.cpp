#include "history/HistoryLedger.hpp"

namespace DS::History {

void HistoryLedger::clear() {
    entries.clear();
    cursorIndex = 0;
    deltaCount  = 0;
}

void HistoryLedger::commit(Patch patch) {
    dropRedoTail();
    deltaCount += patch.size();
    entries.push_back(std::move(patch));
    cursorIndex = entries.size();
}

auto HistoryLedger::canUndo() const -> bool {
    return cursorIndex > 0;
}

auto HistoryLedger::canRedo() const -> bool {
    return cursorIndex < entries.size();
}

auto HistoryLedger::peekUndo() const
    -> std::optional<std::reference_wrapper<Patch const>> {
    if (!canUndo())
        return std::nullopt;
    return entries[cursorIndex - 1];
}

auto HistoryLedger::peekRedo() const
    -> std::optional<std::reference_wrapper<Patch const>> {
    if (!canRedo())
        return std::nullopt;
    return entries[cursorIndex];
}

auto HistoryLedger::undo()
    -> std::optional<std::reference_wrapper<Patch const>> {
    if (!canUndo())
        return std::nullopt;
    cursorIndex -= 1;
    return entries[cursorIndex];
}

auto HistoryLedger::redo()
    -> std::optional<std::reference_wrapper<Patch const>> {
    if (!canRedo())
        return std::nullopt;
    auto& entry = entries[cursorIndex];
    cursorIndex += 1;
    return entry;
}

auto HistoryLedger::entryAt(std::size_t index) const -> Patch const& {
    return entries.at(index);
}

auto HistoryLedger::stats() const -> Stats {
    Stats s;
    s.totalEntries = entries.size();
    s.undoCount    = cursorIndex;
    s.redoCount    = entries.size() - cursorIndex;
    s.totalDeltas  = deltaCount;
    return s;
}

void HistoryLedger::dropRedoTail() {
    while (entries.size() > cursorIndex) {
        deltaCount -= entries.back().size();
        entries.pop_back();
    }
}

} // namespace DS::History
