#pragma once

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>

namespace mazepath {

/// A cell coordinate in the maze grid.
/// (0, 0) is the upper-left corner; col grows rightward, row grows downward.
struct Position {
    int col = 0;
    int row = 0;

    Position() = default;
    Position(int col, int row) : col(col), row(row) {}

    /// Translate by an offset (e.g. an action's direction vector).
    Position operator+(const Position& offset) const {
        return {col + offset.col, row + offset.row};
    }

    bool operator==(const Position& other) const {
        return col == other.col && row == other.row;
    }

    bool operator!=(const Position& other) const { return !(*this == other); }

    std::string toString() const {
        return "(" + std::to_string(col) + ", " + std::to_string(row) + ")";
    }
};

inline std::ostream& operator<<(std::ostream& os, const Position& p) {
    return os << p.toString();
}

} // namespace mazepath

namespace std {

template <>
struct hash<mazepath::Position> {
    size_t operator()(const mazepath::Position& p) const noexcept {
        size_t h = std::hash<int>{}(p.col);
        h ^= std::hash<int>{}(p.row) + static_cast<size_t>(0x9e3779b9) + (h << 6) + (h >> 2);
        return h;
    }
};

} // namespace std
