#pragma once

#include "grid/action.hpp"
#include "grid/position.hpp"
#include "maze/cell.hpp"

#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace mazepath {

/// A legal move out of a cell and the cell it lands on.
struct Transition {
    Action action;
    Position state;
};

/// Outcome of replaying a candidate action sequence.
struct ValidationResult {
    bool is_solution = false;
    int cost = -1;     // total entry cost if is_solution, -1 otherwise
};

// ─── MazeProblem ───────────────────────────────────────────────
// The key-then-goal maze problem: grid, initial/key/goal cells,
// transition model and per-cell entry costs. Read-only after
// construction, so one instance can back any number of searches.
//
// Rows are strings over the alphabet:
//   'X' wall, '.' open, 'M' mud (cost 3), 'I' initial, 'K' key, 'G' goal
// For example:
//   XXXXXXX
//   XK.I.GX
//   XXXXXXX

class MazeProblem {
public:
    /// Build the problem from grid rows.
    /// Throws std::invalid_argument on an unrecognized symbol, ragged rows,
    /// a missing or repeated initial marker, or more than one key.
    explicit MazeProblem(std::vector<std::string> rows);

    int rows() const { return rows_; }
    int cols() const { return cols_; }
    const std::vector<std::string>& grid() const { return maze_; }

    bool inBounds(const Position& p) const;

    /// Cell classification at p. p must be in bounds.
    CellType cellAt(const Position& p) const;

    const Position& initialState() const { return initial_; }
    const std::optional<Position>& keyState() const { return key_; }
    const std::unordered_set<Position>& goalStates() const { return goals_; }

    bool isGoalState(const Position& p) const { return goals_.count(p) > 0; }

    /// Cost of moving into p: 3 for mud, 1 otherwise.
    int getCost(const Position& p) const;

    /// Legal moves from p, in kActions order. A move is legal when the
    /// target cell is inside the grid and is not a wall.
    std::vector<Transition> getTransitions(const Position& p) const;

    /// Replay a candidate solution from the initial cell.
    /// Total over all inputs: failures are reported as {false, -1}.
    ValidationResult validate(const std::vector<Action>& actions) const;
    ValidationResult validate(const std::optional<std::vector<Action>>& actions) const;
    ValidationResult validate(const std::vector<std::string>& symbols) const;

private:
    std::vector<std::string> maze_;
    int rows_ = 0;
    int cols_ = 0;

    Position initial_;
    std::optional<Position> key_;
    std::unordered_set<Position> goals_;
};

} // namespace mazepath
