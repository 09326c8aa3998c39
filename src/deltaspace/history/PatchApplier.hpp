#pragma once

#include "core/Error.hpp"
#include "history/Delta.hpp"
#include "tree/Node.hpp"
#include "tree/Path.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <vector>

namespace DS::History {

enum class ApplyDirection : std::uint8_t {
    Forward = 0,
    Inverse = 1,
};

/**
 * Copy-on-write patch replay.
 *
 * The base tree is never modified. Every node on a Delta's path is shallow
 * copied the first time a Delta reaches it and the private copy is reused by
 * later Deltas sharing the prefix; branches no Delta touches stay shared with
 * the base.
 *
 * Forward: CREATE/CHANGE write `value`, REMOVE deletes.
 * Inverse: the Patch is walked back to front; CREATE deletes, CHANGE/REMOVE
 * write `oldValue`.
 *
 * Array deletions leave a tombstone in the slot so later Deltas keep
 * addressing the positions of the tree being patched; each mutated array is
 * compacted before any insertion. Writes that create an array slot (forward
 * CREATE, inverse REMOVE) insert at their index once the walk is done, in
 * ascending index order, so they address positions of the result. Other
 * Deltas reaching through an array that receives insertions run after the
 * insertions. A slot that would leave a gap is an InvalidPath error.
 *
 * Any error aborts the whole application and the base stays authoritative.
 */
class PatchApplier {
public:
    struct Stats {
        std::size_t copiedNodes     = 0;
        std::size_t writes          = 0;
        std::size_t removals        = 0;
        std::size_t insertions      = 0;
        std::size_t compactedArrays = 0;
    };

    explicit PatchApplier(NodePtr base);

    [[nodiscard]] auto apply(Patch const& patch, ApplyDirection direction) -> Expected<NodePtr>;

    [[nodiscard]] auto stats() const noexcept -> Stats const& { return stats_; }

private:
    enum class Operation : std::uint8_t {
        Write,
        Erase,
        Insert,
    };

    struct Step {
        Delta const* delta = nullptr;
        Operation    operation = Operation::Write;
        NodePtr      payload;
    };

    auto planStep(Delta const& delta, ApplyDirection direction) const -> Expected<Step>;
    auto runStep(Step const& step) -> Expected<void>;
    auto mutableAt(Path const& prefix) -> Expected<Node*>;
    auto write(Path const& path, NodePtr value) -> Expected<void>;
    auto erase(Path const& path) -> Expected<void>;
    auto insert(Path const& path, NodePtr value) -> Expected<void>;
    void compactArrays();
    void forgetBelow(Path const& path);
    void forgetElements(Path const& arrayPath);

    NodePtr                                root_;
    std::map<Path, std::shared_ptr<Node>>  copied_;
    std::set<Path>                         pendingArrays_;
    Stats                                  stats_;
};

[[nodiscard]] auto applyPatch(NodePtr const& base,
                              Patch const& patch,
                              ApplyDirection direction = ApplyDirection::Forward) -> Expected<NodePtr>;

} // namespace DS::History
