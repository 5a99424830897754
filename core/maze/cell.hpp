#pragma once

namespace mazepath {

/// Classification of a single maze cell.
enum class CellType {
    WALL,      // 'X'
    OPEN,      // '.'
    MUD,       // 'M', difficult terrain
    INITIAL,   // 'I'
    KEY,       // 'K'
    GOAL       // 'G'
};

/// Map a maze character to its cell type.
/// Throws std::invalid_argument for unrecognized symbols.
CellType classifyCell(char symbol);

/// Cost of entering a cell of the given type. Walls are never entered.
int entryCost(CellType type);

inline bool isPassable(CellType type) { return type != CellType::WALL; }

} // namespace mazepath
