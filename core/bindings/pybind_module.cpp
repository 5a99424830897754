// PyBind11 bindings for the mazepath C++ core.
// Exposes Position, actions, MazeProblem, Pathfinder and verification to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DMAZEPATH_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/operators.h>

#include "grid/position.hpp"
#include "grid/action.hpp"
#include "maze/cell.hpp"
#include "maze/maze_problem.hpp"
#include "search/search_result.hpp"
#include "search/pathfinder.hpp"
#include "verification/verification.hpp"
#include "util/log.hpp"

namespace py = pybind11;

PYBIND11_MODULE(mazepath_bindings, m) {
    m.doc() = "mazepath C++ Core Bindings";

    // ── Position ──
    py::class_<mazepath::Position>(m, "Position")
        .def(py::init<>())
        .def(py::init<int, int>(), py::arg("col"), py::arg("row"))
        .def_readwrite("col", &mazepath::Position::col)
        .def_readwrite("row", &mazepath::Position::row)
        .def(py::self + py::self)
        .def(py::self == py::self)
        .def(py::self != py::self)
        .def("__hash__", [](const mazepath::Position& p) {
            return std::hash<mazepath::Position>{}(p);
        })
        .def("__repr__", &mazepath::Position::toString);

    // ── Action ──
    py::enum_<mazepath::Action>(m, "Action")
        .value("UP", mazepath::Action::UP)
        .value("DOWN", mazepath::Action::DOWN)
        .value("LEFT", mazepath::Action::LEFT)
        .value("RIGHT", mazepath::Action::RIGHT);

    m.def("action_offset", &mazepath::actionOffset);
    m.def("action_symbol", &mazepath::actionSymbol);
    m.def("parse_actions", &mazepath::parseActions);
    m.def("format_actions", &mazepath::formatActions);

    // ── CellType ──
    py::enum_<mazepath::CellType>(m, "CellType")
        .value("WALL", mazepath::CellType::WALL)
        .value("OPEN", mazepath::CellType::OPEN)
        .value("MUD", mazepath::CellType::MUD)
        .value("INITIAL", mazepath::CellType::INITIAL)
        .value("KEY", mazepath::CellType::KEY)
        .value("GOAL", mazepath::CellType::GOAL);

    // ── ValidationResult ──
    py::class_<mazepath::ValidationResult>(m, "ValidationResult")
        .def(py::init<>())
        .def_readwrite("is_solution", &mazepath::ValidationResult::is_solution)
        .def_readwrite("cost", &mazepath::ValidationResult::cost);

    // ── Transition ──
    py::class_<mazepath::Transition>(m, "Transition")
        .def_readonly("action", &mazepath::Transition::action)
        .def_readonly("state", &mazepath::Transition::state);

    // ── MazeProblem ──
    // std::invalid_argument from the constructor surfaces as ValueError.
    py::class_<mazepath::MazeProblem>(m, "MazeProblem")
        .def(py::init<std::vector<std::string>>(), py::arg("rows"))
        .def("rows", &mazepath::MazeProblem::rows)
        .def("cols", &mazepath::MazeProblem::cols)
        .def("cell_at", &mazepath::MazeProblem::cellAt)
        .def("initial_state", &mazepath::MazeProblem::initialState)
        .def("key_state", &mazepath::MazeProblem::keyState)
        .def("goal_states", &mazepath::MazeProblem::goalStates)
        .def("is_goal_state", &mazepath::MazeProblem::isGoalState)
        .def("get_cost", &mazepath::MazeProblem::getCost)
        .def("get_transitions", &mazepath::MazeProblem::getTransitions)
        .def("validate", [](const mazepath::MazeProblem& self,
                            const std::optional<std::vector<std::string>>& symbols) {
            if (!symbols) return self.validate(std::optional<std::vector<mazepath::Action>>());
            return self.validate(*symbols);
        }, py::arg("actions"));

    // ── PathfinderConfig ──
    py::class_<mazepath::PathfinderConfig>(m, "PathfinderConfig")
        .def(py::init<>())
        .def_readwrite("max_expansions", &mazepath::PathfinderConfig::max_expansions)
        .def_readwrite("budget_seconds", &mazepath::PathfinderConfig::budget_seconds);

    // ── PhaseStats / SearchResult ──
    py::enum_<mazepath::PhaseKind>(m, "PhaseKind")
        .value("TO_KEY", mazepath::PhaseKind::TO_KEY)
        .value("TO_GOAL", mazepath::PhaseKind::TO_GOAL);

    py::class_<mazepath::PhaseStats>(m, "PhaseStats")
        .def(py::init<>())
        .def_readwrite("kind", &mazepath::PhaseStats::kind)
        .def_readwrite("succeeded", &mazepath::PhaseStats::succeeded)
        .def_readwrite("expansions", &mazepath::PhaseStats::expansions)
        .def_readwrite("nodes_generated", &mazepath::PhaseStats::nodes_generated)
        .def_readwrite("visited", &mazepath::PhaseStats::visited)
        .def_readwrite("path_length", &mazepath::PhaseStats::path_length);

    py::class_<mazepath::SearchResult>(m, "SearchResult")
        .def(py::init<>())
        .def_readwrite("solution", &mazepath::SearchResult::solution)
        .def_readwrite("cost", &mazepath::SearchResult::cost)
        .def_readwrite("phases", &mazepath::SearchResult::phases)
        .def_readwrite("total_expansions", &mazepath::SearchResult::total_expansions)
        .def_readwrite("elapsed_seconds", &mazepath::SearchResult::elapsed_seconds)
        .def_readwrite("budget_exhausted", &mazepath::SearchResult::budget_exhausted)
        .def("solved", &mazepath::SearchResult::solved);

    // ── Pathfinder ──
    py::class_<mazepath::Pathfinder>(m, "Pathfinder")
        .def(py::init<mazepath::PathfinderConfig>(),
             py::arg("config") = mazepath::PathfinderConfig{})
        .def("solve", &mazepath::Pathfinder::solve, py::arg("problem"))
        .def("search", &mazepath::Pathfinder::search, py::arg("problem"))
        .def_property("config", &mazepath::Pathfinder::config,
                      &mazepath::Pathfinder::setConfig);

    // ── VerificationResult ──
    py::class_<mazepath::VerificationResult>(m, "VerificationResult")
        .def(py::init<>())
        .def_readwrite("passed", &mazepath::VerificationResult::passed)
        .def_readwrite("check_name", &mazepath::VerificationResult::check_name)
        .def_readwrite("message", &mazepath::VerificationResult::message);

    // ── MazeChecker / SolutionChecker ──
    py::class_<mazepath::MazeChecker>(m, "MazeChecker")
        .def(py::init<>())
        .def("check", &mazepath::MazeChecker::check)
        .def("is_well_formed", &mazepath::MazeChecker::isWellFormed);

    py::class_<mazepath::SolutionChecker>(m, "SolutionChecker")
        .def(py::init<>())
        .def("check_solution", &mazepath::SolutionChecker::checkSolution)
        .def("check_result", &mazepath::SolutionChecker::checkResult);

    // ── Convenience ──
    m.def("solve", [](const std::vector<std::string>& rows) {
        mazepath::MazeProblem problem(rows);
        mazepath::Pathfinder pathfinder;
        return pathfinder.solve(problem);
    }, py::arg("rows"));

    m.def("set_log_level", [](const std::string& level) {
        mazepath::log::setLevel(spdlog::level::from_str(level));
    }, py::arg("level"));
}
