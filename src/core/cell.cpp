#include "tango_logic/cell.hpp"

namespace tango_logic {

Cell opposite(Cell cell) {
    switch (cell) {
        case Cell::Sun:
            return Cell::Moon;
        case Cell::Moon:
            return Cell::Sun;
        case Cell::Empty:
            break;
    }
    return Cell::Empty;
}

std::string symbol_name(Cell cell) {
    switch (cell) {
        case Cell::Sun:
            return "Sun";
        case Cell::Moon:
            return "Moon";
        case Cell::Empty:
            break;
    }
    return "Empty";
}

std::string symbol_plural(Cell cell) {
    switch (cell) {
        case Cell::Sun:
            return "suns";
        case Cell::Moon:
            return "moons";
        case Cell::Empty:
            break;
    }
    return "empty cells";
}

char symbol_char(Cell cell) {
    switch (cell) {
        case Cell::Sun:
            return 'S';
        case Cell::Moon:
            return 'M';
        case Cell::Empty:
            break;
    }
    return '.';
}

std::string to_display(const Coord& coord) {
    return "(" + std::to_string(coord.row + 1) + "," + std::to_string(coord.col + 1) + ")";
}

} // namespace tango_logic
