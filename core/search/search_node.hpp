#pragma once

#include "grid/action.hpp"
#include "grid/position.hpp"

#include <cstddef>
#include <limits>
#include <optional>

namespace mazepath {

// ─── Search Node ───────────────────────────────────────────────
// One node of the search tree. Nodes live in a per-phase arena
// (std::vector<SearchNode>) and point at their parent by arena index,
// so the tree only has parent-ward links and cannot form a cycle.

struct SearchNode {
    static constexpr size_t kNoParent = std::numeric_limits<size_t>::max();

    Position state;
    std::optional<Action> action;   // action that led here; none at the root
    size_t parent = kNoParent;      // arena index of the parent
    int cost_so_far = 0;
    int priority = 0;               // cost_so_far + heuristic(state)

    bool isRoot() const { return parent == kNoParent; }
};

} // namespace mazepath
