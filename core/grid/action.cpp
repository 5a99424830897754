#include "grid/action.hpp"

namespace mazepath {

Position actionOffset(Action action) {
    switch (action) {
        case Action::UP:    return {0, -1};
        case Action::DOWN:  return {0, 1};
        case Action::LEFT:  return {-1, 0};
        case Action::RIGHT: return {1, 0};
    }
    return {0, 0};
}

std::string actionSymbol(Action action) {
    switch (action) {
        case Action::UP:    return "U";
        case Action::DOWN:  return "D";
        case Action::LEFT:  return "L";
        case Action::RIGHT: return "R";
    }
    return "?";
}

std::optional<Action> parseAction(const std::string& symbol) {
    for (Action a : kActions) {
        if (actionSymbol(a) == symbol) return a;
    }
    return std::nullopt;
}

std::optional<std::vector<Action>> parseActions(const std::vector<std::string>& symbols) {
    std::vector<Action> actions;
    actions.reserve(symbols.size());
    for (const auto& s : symbols) {
        auto a = parseAction(s);
        if (!a) return std::nullopt;
        actions.push_back(*a);
    }
    return actions;
}

std::string formatActions(const std::vector<Action>& actions) {
    std::string out;
    out.reserve(actions.size());
    for (Action a : actions) {
        out += actionSymbol(a);
    }
    return out;
}

} // namespace mazepath
