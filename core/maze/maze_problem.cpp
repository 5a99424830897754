#include "maze/maze_problem.hpp"
#include "util/log.hpp"

#include <stdexcept>

namespace mazepath {

MazeProblem::MazeProblem(std::vector<std::string> rows)
    : maze_(std::move(rows)) {
    rows_ = static_cast<int>(maze_.size());
    cols_ = rows_ == 0 ? 0 : static_cast<int>(maze_[0].size());

    std::optional<Position> found_initial;

    for (int row = 0; row < rows_; row++) {
        if (static_cast<int>(maze_[row].size()) != cols_) {
            throw std::invalid_argument(
                "Maze row " + std::to_string(row) + " has length " +
                std::to_string(maze_[row].size()) + ", expected " +
                std::to_string(cols_));
        }
        for (int col = 0; col < cols_; col++) {
            Position here(col, row);
            switch (classifyCell(maze_[row][col])) {
                case CellType::INITIAL:
                    if (found_initial) {
                        throw std::invalid_argument(
                            "Maze has more than one initial cell: " +
                            found_initial->toString() + " and " + here.toString());
                    }
                    found_initial = here;
                    break;
                case CellType::KEY:
                    if (key_) {
                        throw std::invalid_argument(
                            "Maze has more than one key cell: " +
                            key_->toString() + " and " + here.toString());
                    }
                    key_ = here;
                    break;
                case CellType::GOAL:
                    goals_.insert(here);
                    break;
                default:
                    break;
            }
        }
    }

    if (!found_initial) {
        throw std::invalid_argument("Maze has no initial cell ('I')");
    }
    initial_ = *found_initial;

    log::get()->debug("Loaded {}x{} maze: initial {}, key {}, {} goal(s)",
                      cols_, rows_, initial_.toString(),
                      key_ ? key_->toString() : "none", goals_.size());
}

bool MazeProblem::inBounds(const Position& p) const {
    return p.row >= 0 && p.row < rows_ && p.col >= 0 && p.col < cols_;
}

CellType MazeProblem::cellAt(const Position& p) const {
    return classifyCell(maze_[p.row][p.col]);
}

int MazeProblem::getCost(const Position& p) const {
    return entryCost(cellAt(p));
}

std::vector<Transition> MazeProblem::getTransitions(const Position& p) const {
    std::vector<Transition> result;
    result.reserve(kActions.size());
    for (Action a : kActions) {
        Position next = p + actionOffset(a);
        if (inBounds(next) && isPassable(cellAt(next))) {
            result.push_back({a, next});
        }
    }
    return result;
}

ValidationResult MazeProblem::validate(const std::vector<Action>& actions) const {
    if (actions.empty()) return {false, -1};

    Position moving = initial_;
    int cost = 0;
    bool has_key = false;

    for (Action a : actions) {
        moving = moving + actionOffset(a);
        if (!inBounds(moving)) return {false, -1};

        CellType cell = cellAt(moving);
        if (cell == CellType::WALL) return {false, -1};
        if (cell == CellType::KEY) has_key = true;
        cost += entryCost(cell);
    }

    if (!isGoalState(moving)) return {false, -1};
    if (key_ && !has_key) return {false, -1};
    return {true, cost};
}

ValidationResult MazeProblem::validate(const std::optional<std::vector<Action>>& actions) const {
    if (!actions) return {false, -1};
    return validate(*actions);
}

ValidationResult MazeProblem::validate(const std::vector<std::string>& symbols) const {
    return validate(parseActions(symbols));
}

} // namespace mazepath
