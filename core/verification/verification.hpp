#pragma once

#include "maze/maze_problem.hpp"
#include "search/search_result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace mazepath {

/// Verification result for a single check.
struct VerificationResult {
    bool passed = false;
    std::string check_name;
    std::string message;
};

/// Maze Checker: flags mazes that construct fine but cannot be solved
/// for structural reasons (no goals, a boxed-in initial or key cell).
class MazeChecker {
public:
    std::vector<VerificationResult> check(const MazeProblem& problem) const;

    /// True if every check passed.
    bool isWellFormed(const MazeProblem& problem) const;
};

/// Solution Checker: replays solver output against the maze.
class SolutionChecker {
public:
    /// Replay an action sequence (absent = no solution).
    VerificationResult checkSolution(const MazeProblem& problem,
                                     const std::optional<std::vector<Action>>& actions) const;

    /// Replay a search result and require the replayed cost to match
    /// the cost the search accumulated.
    VerificationResult checkResult(const MazeProblem& problem,
                                   const SearchResult& result) const;
};

} // namespace mazepath
