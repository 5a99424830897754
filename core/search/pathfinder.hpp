#pragma once

#include "maze/maze_problem.hpp"
#include "search/budget_manager.hpp"
#include "search/frontier.hpp"
#include "search/heuristics.hpp"
#include "search/search_node.hpp"
#include "search/search_result.hpp"

#include <functional>
#include <optional>
#include <unordered_set>
#include <vector>

namespace mazepath {

// ─── Pathfinder ────────────────────────────────────────────────
// Two-phase best-first tree search over a MazeProblem:
//   1. initial -> key (skipped when the maze has no key),
//      guided by Manhattan distance to the key;
//   2. key (or initial) -> any goal, guided by the Manhattan distance
//      to the nearest goal.
// A successor s of expanded node e is scored
//   priority(s) = e.cost_so_far + cost(s) + h(s)
// and the phase ends as soon as a generated successor meets the phase
// target. The expanded node's state is marked visited when its first
// unvisited successor is generated, not when it is discovered.
// Frontier, visited set and node arena are reset between phases.

class Pathfinder {
public:
    explicit Pathfinder(PathfinderConfig config = {});

    /// Action sequence that picks up the key and ends on a goal,
    /// or nullopt if there is none.
    std::optional<std::vector<Action>> solve(const MazeProblem& problem);

    /// Same search, with cost and per-phase statistics.
    SearchResult search(const MazeProblem& problem);

    const PathfinderConfig& config() const { return config_; }
    void setConfig(const PathfinderConfig& config) { config_ = config; }

private:
    using TargetTest = std::function<bool(const Position&)>;

    PathfinderConfig config_;

    // Per-phase working state.
    std::vector<SearchNode> nodes_;
    std::unordered_set<Position> visited_;
    Frontier frontier_;

    void resetPhase();

    /// Run one phase from start. Returns the arena index of the node that
    /// reached the target, or nullopt if the frontier ran dry or the
    /// budget ran out.
    std::optional<size_t> runPhase(const MazeProblem& problem,
                                   const Position& start,
                                   int start_cost,
                                   const TargetTest& is_target,
                                   const HeuristicFn& heuristic,
                                   BudgetManager& budget,
                                   PhaseStats& stats);

    /// Actions from the phase root to the given node, in order.
    std::vector<Action> reconstructPath(size_t terminal) const;
};

} // namespace mazepath
