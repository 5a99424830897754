#pragma once

#include "grid/action.hpp"

#include <cstdint>
#include <limits>
#include <optional>
#include <vector>

namespace mazepath {

/// Pathfinder configuration.
/// The budget fields are an external guard only; with the defaults the
/// search runs until it succeeds or a frontier is exhausted.
struct PathfinderConfig {
    int64_t max_expansions = std::numeric_limits<int64_t>::max();  // across both phases
    double budget_seconds = std::numeric_limits<double>::infinity();
};

/// Which sub-search a phase performs.
enum class PhaseKind {
    TO_KEY,    // initial -> key
    TO_GOAL    // key (or initial) -> nearest goal
};

/// Bookkeeping for one phase.
struct PhaseStats {
    PhaseKind kind = PhaseKind::TO_GOAL;
    bool succeeded = false;
    int64_t expansions = 0;     // nodes popped from the frontier
    int nodes_generated = 0;    // arena size at the end of the phase
    int visited = 0;            // size of the visited set at the end
    int path_length = 0;        // actions contributed by this phase
};

/// Result of a full two-phase search.
struct SearchResult {
    std::optional<std::vector<Action>> solution;  // nullopt = no solution
    int cost = -1;                                // accumulated path cost, -1 without a solution
    std::vector<PhaseStats> phases;
    int64_t total_expansions = 0;
    double elapsed_seconds = 0.0;
    bool budget_exhausted = false;

    bool solved() const { return solution.has_value(); }
};

} // namespace mazepath
