#pragma once

#include "grid/position.hpp"

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace mazepath {

/// One step in one of the four cardinal directions.
enum class Action {
    UP,
    DOWN,
    LEFT,
    RIGHT
};

// ─── Action Table ──────────────────────────────────────────────
// Fixed iteration order for successor generation. Search results
// depend on this order when priorities tie, so it never changes.

inline constexpr std::array<Action, 4> kActions = {
    Action::UP, Action::DOWN, Action::LEFT, Action::RIGHT
};

/// Direction vector for an action: U (0,-1), D (0,1), L (-1,0), R (1,0).
Position actionOffset(Action action);

/// Single-letter symbol: "U", "D", "L" or "R".
std::string actionSymbol(Action action);

/// Parse a single-letter symbol. Returns nullopt for anything else.
std::optional<Action> parseAction(const std::string& symbol);

/// Parse a whole sequence; nullopt if any symbol is unrecognized.
std::optional<std::vector<Action>> parseActions(const std::vector<std::string>& symbols);

/// Symbols of a sequence joined without separators, e.g. "DDR".
std::string formatActions(const std::vector<Action>& actions);

} // namespace mazepath
