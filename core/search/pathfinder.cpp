#include "search/pathfinder.hpp"
#include "util/log.hpp"

#include <algorithm>

namespace mazepath {

namespace {

const char* phaseName(PhaseKind kind) {
    return kind == PhaseKind::TO_KEY ? "key" : "goal";
}

} // namespace

Pathfinder::Pathfinder(PathfinderConfig config)
    : config_(config) {}

std::optional<std::vector<Action>> Pathfinder::solve(const MazeProblem& problem) {
    return search(problem).solution;
}

SearchResult Pathfinder::search(const MazeProblem& problem) {
    BudgetManager budget(config_.max_expansions, config_.budget_seconds);
    budget.start();

    SearchResult result;
    auto finish = [&]() {
        result.total_expansions = budget.expansions();
        result.elapsed_seconds = budget.elapsedSeconds();
        resetPhase();
        if (result.solution) {
            log::get()->info("Solved in {} actions, cost {}, {} expansions",
                             result.solution->size(), result.cost,
                             result.total_expansions);
        } else {
            log::get()->info("No solution after {} expansions", result.total_expansions);
        }
        return result;
    };

    if (problem.goalStates().empty()) {
        log::get()->warn("Maze has no goal cells; nothing to search for");
        return finish();
    }

    Position start = problem.initialState();
    int start_cost = 0;
    std::vector<Action> path;

    // ── Phase 1: initial -> key ──
    if (const auto& key = problem.keyState()) {
        PhaseStats stats;
        stats.kind = PhaseKind::TO_KEY;
        Position key_pos = *key;

        auto terminal = runPhase(problem, start, start_cost,
                                 [key_pos](const Position& p) { return p == key_pos; },
                                 singleTargetHeuristic(key_pos), budget, stats);
        result.phases.push_back(stats);
        if (!terminal) {
            result.budget_exhausted = !frontier_.empty();
            return finish();
        }

        std::vector<Action> to_key = reconstructPath(*terminal);
        result.phases.back().path_length = static_cast<int>(to_key.size());
        path.insert(path.end(), to_key.begin(), to_key.end());
        start = key_pos;
        start_cost = nodes_[*terminal].cost_so_far;
    }

    // ── Phase 2: key (or initial) -> nearest goal ──
    PhaseStats stats;
    stats.kind = PhaseKind::TO_GOAL;
    auto terminal = runPhase(problem, start, start_cost,
                             [&problem](const Position& p) { return problem.isGoalState(p); },
                             multiTargetHeuristic(problem.goalStates()), budget, stats);
    result.phases.push_back(stats);
    if (!terminal) {
        result.budget_exhausted = !frontier_.empty();
        return finish();
    }

    std::vector<Action> to_goal = reconstructPath(*terminal);
    result.phases.back().path_length = static_cast<int>(to_goal.size());
    path.insert(path.end(), to_goal.begin(), to_goal.end());

    result.cost = nodes_[*terminal].cost_so_far;
    result.solution = std::move(path);
    return finish();
}

void Pathfinder::resetPhase() {
    nodes_.clear();
    visited_.clear();
    frontier_.clear();
}

std::optional<size_t> Pathfinder::runPhase(const MazeProblem& problem,
                                           const Position& start,
                                           int start_cost,
                                           const TargetTest& is_target,
                                           const HeuristicFn& heuristic,
                                           BudgetManager& budget,
                                           PhaseStats& stats) {
    resetPhase();
    log::get()->debug("Phase '{}' starting at {} with cost {}",
                      phaseName(stats.kind), start.toString(), start_cost);

    SearchNode root;
    root.state = start;
    root.cost_so_far = start_cost;
    root.priority = start_cost + heuristic(start);
    nodes_.push_back(root);
    frontier_.push(0, root.priority);

    auto record = [&](bool succeeded) {
        stats.succeeded = succeeded;
        stats.nodes_generated = static_cast<int>(nodes_.size());
        stats.visited = static_cast<int>(visited_.size());
    };

    while (!frontier_.empty()) {
        if (!budget.canContinue()) {
            log::get()->warn("Search budget exhausted during phase '{}' after {} expansions",
                             phaseName(stats.kind), budget.expansions());
            record(false);
            return std::nullopt;
        }

        size_t expanding = frontier_.pop();
        budget.recordExpansion();
        stats.expansions++;

        // Copied out: nodes_ may reallocate while children are appended.
        const Position state = nodes_[expanding].state;
        const int cost_so_far = nodes_[expanding].cost_so_far;

        for (const Transition& t : problem.getTransitions(state)) {
            if (visited_.count(t.state)) continue;
            visited_.insert(state);

            int child_cost = cost_so_far + problem.getCost(t.state);

            SearchNode child;
            child.state = t.state;
            child.action = t.action;
            child.parent = expanding;
            child.cost_so_far = child_cost;
            child.priority = child_cost + heuristic(t.state);
            nodes_.push_back(child);
            size_t child_index = nodes_.size() - 1;

            if (is_target(t.state)) {
                record(true);
                log::get()->debug("Phase '{}' reached {} with cost {} after {} expansions",
                                  phaseName(stats.kind), t.state.toString(),
                                  child_cost, stats.expansions);
                return child_index;
            }
            frontier_.push(child_index, child.priority);
        }
    }

    record(false);
    log::get()->debug("Phase '{}' exhausted its frontier after {} expansions",
                      phaseName(stats.kind), stats.expansions);
    return std::nullopt;
}

std::vector<Action> Pathfinder::reconstructPath(size_t terminal) const {
    std::vector<Action> actions;
    size_t current = terminal;
    while (!nodes_[current].isRoot()) {
        actions.push_back(*nodes_[current].action);
        current = nodes_[current].parent;
    }
    std::reverse(actions.begin(), actions.end());
    return actions;
}

} // namespace mazepath
