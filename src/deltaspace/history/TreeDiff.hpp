#pragma once

#include "history/Delta.hpp"
#include "tree/Node.hpp"

namespace DS::History {

/**
 * Minimal ordered difference between two trees.
 *
 * Both trees are walked in lock-step from the root. Identical pointers are
 * skipped without descending, so unchanged shared branches cost O(1).
 * Composite values of the same kind are recursed into; anything else that
 * differs becomes a single CHANGE at that path. Arrays are compared by index
 * position. Object keys are visited in key order: removals and changes over
 * the `before` keys first, then creations for keys only in `after`.
 *
 * The result replays forward to turn `before` into `after`.
 */
[[nodiscard]] auto diff(NodePtr const& before, NodePtr const& after) -> Patch;

} // namespace DS::History
