#include "verification/verification.hpp"

namespace mazepath {

// ─── Maze Checker ──────────────────────────────────────────────

std::vector<VerificationResult> MazeChecker::check(const MazeProblem& problem) const {
    std::vector<VerificationResult> results;

    if (problem.goalStates().empty()) {
        results.push_back({false, "has_goal", "Maze has no goal cells"});
    }

    const Position& initial = problem.initialState();
    if (problem.getTransitions(initial).empty()) {
        results.push_back({false, "initial_has_exit",
            "Initial cell " + initial.toString() + " has no legal moves"});
    }

    if (const auto& key = problem.keyState()) {
        if (problem.getTransitions(*key).empty()) {
            results.push_back({false, "key_has_exit",
                "Key cell " + key->toString() + " has no legal moves"});
        }
    }

    // If no failures, add a passing result
    if (results.empty()) {
        results.push_back({true, "maze_check", "All maze checks passed"});
    }

    return results;
}

bool MazeChecker::isWellFormed(const MazeProblem& problem) const {
    for (const auto& r : check(problem)) {
        if (!r.passed) return false;
    }
    return true;
}

// ─── Solution Checker ──────────────────────────────────────────

VerificationResult SolutionChecker::checkSolution(
    const MazeProblem& problem,
    const std::optional<std::vector<Action>>& actions) const {
    if (!actions) {
        return {false, "solution_present", "No solution to check"};
    }

    ValidationResult v = problem.validate(*actions);
    if (!v.is_solution) {
        return {false, "solution_valid",
            "Sequence " + formatActions(*actions) + " does not solve the maze"};
    }
    return {true, "solution_valid",
        "Sequence " + formatActions(*actions) + " solves the maze with cost " +
        std::to_string(v.cost)};
}

VerificationResult SolutionChecker::checkResult(const MazeProblem& problem,
                                                const SearchResult& result) const {
    VerificationResult r = checkSolution(problem, result.solution);
    if (!r.passed) return r;

    ValidationResult v = problem.validate(*result.solution);
    if (v.cost != result.cost) {
        return {false, "solution_cost",
            "Search reported cost " + std::to_string(result.cost) +
            " but replay costs " + std::to_string(v.cost)};
    }
    return {true, "solution_cost", r.message};
}

} // namespace mazepath
