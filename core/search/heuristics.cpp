#include "search/heuristics.hpp"

#include <algorithm>
#include <cstdlib>
#include <limits>
#include <utility>

namespace mazepath {

int manhattanDistance(const Position& a, const Position& b) {
    return std::abs(a.col - b.col) + std::abs(a.row - b.row);
}

int nearestGoalDistance(const Position& p, const std::unordered_set<Position>& targets) {
    if (targets.empty()) return 0;
    int best = std::numeric_limits<int>::max();
    for (const auto& t : targets) {
        best = std::min(best, manhattanDistance(p, t));
    }
    return best;
}

HeuristicFn singleTargetHeuristic(Position target) {
    return [target](const Position& p) { return manhattanDistance(p, target); };
}

HeuristicFn multiTargetHeuristic(std::unordered_set<Position> targets) {
    return [targets = std::move(targets)](const Position& p) {
        return nearestGoalDistance(p, targets);
    };
}

} // namespace mazepath
