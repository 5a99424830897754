#include "maze/cell.hpp"

#include <stdexcept>
#include <string>

namespace mazepath {

CellType classifyCell(char symbol) {
    switch (symbol) {
        case 'X': return CellType::WALL;
        case '.': return CellType::OPEN;
        case 'M': return CellType::MUD;
        case 'I': return CellType::INITIAL;
        case 'K': return CellType::KEY;
        case 'G': return CellType::GOAL;
        default:
            throw std::invalid_argument(
                std::string("Unrecognized maze symbol: '") + symbol + "'");
    }
}

int entryCost(CellType type) {
    return type == CellType::MUD ? 3 : 1;
}

} // namespace mazepath
