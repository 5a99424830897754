#pragma once

#include "grid/position.hpp"

#include <functional>
#include <unordered_set>

namespace mazepath {

/// Estimate of the remaining cost from a position to a phase's target.
using HeuristicFn = std::function<int(const Position&)>;

/// |dcol| + |drow|
int manhattanDistance(const Position& a, const Position& b);

/// Minimum Manhattan distance from p to any of the targets; 0 if there are none.
int nearestGoalDistance(const Position& p, const std::unordered_set<Position>& targets);

/// Heuristic toward a single target cell.
HeuristicFn singleTargetHeuristic(Position target);

/// Heuristic toward the nearest of several target cells.
/// The returned function keeps its own copy of the targets.
HeuristicFn multiTargetHeuristic(std::unordered_set<Position> targets);

} // namespace mazepath
