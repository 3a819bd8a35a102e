#include "tango_logic/grid.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace tango_logic {

std::string Line::label() const {
    return (kind == LineKind::Row ? "Row " : "Column ") + std::to_string(index + 1);
}

std::string Line::kind_name() const {
    return kind == LineKind::Row ? "row" : "column";
}

bool Grid::is_valid_size(size_t size) {
    return size >= 4 && size % 2 == 0 && size <= std::numeric_limits<size_t>::max() / size;
}

Grid::Grid(size_t size)
    : size_(size) {
    if (size < 4 || size % 2 != 0) {
        throw std::invalid_argument("Grid size must be an even number >= 4, got " +
                                    std::to_string(size));
    }
    if (!is_valid_size(size)) {
        throw std::invalid_argument("Grid size " + std::to_string(size) + " is too large");
    }
    cells_.assign(size * size, Cell::Empty);
}

Grid Grid::from_rows(const std::vector<std::vector<Cell>>& rows) {
    Grid grid(rows.size());
    for (size_t r = 0; r < rows.size(); ++r) {
        if (rows[r].size() != rows.size()) {
            throw std::invalid_argument("Row " + std::to_string(r + 1) + " has " +
                                        std::to_string(rows[r].size()) + " cells, expected " +
                                        std::to_string(rows.size()));
        }
        for (size_t c = 0; c < rows[r].size(); ++c) {
            grid.cells_[r * grid.size_ + c] = rows[r][c];
        }
    }
    return grid;
}

size_t Grid::index_of(const Coord& coord) const {
    if (!contains(coord)) {
        throw std::out_of_range("Cell " + to_display(coord) + " is outside a " +
                                std::to_string(size_) + "x" + std::to_string(size_) + " grid");
    }
    return coord.row * size_ + coord.col;
}

Cell Grid::at(const Coord& coord) const {
    return cells_[index_of(coord)];
}

void Grid::set(const Coord& coord, Cell value) {
    cells_[index_of(coord)] = value;
}

std::vector<Line> Grid::lines() const {
    std::vector<Line> result;
    result.reserve(2 * size_);
    for (size_t i = 0; i < size_; ++i) {
        result.push_back(row(i));
    }
    for (size_t i = 0; i < size_; ++i) {
        result.push_back(column(i));
    }
    return result;
}

std::vector<Cell> Grid::values(const Line& line) const {
    std::vector<Cell> result;
    result.reserve(line.length);
    for (size_t pos = 0; pos < line.length; ++pos) {
        result.push_back(at(line.at(pos)));
    }
    return result;
}

size_t Grid::count(const Line& line, Cell value) const {
    size_t n = 0;
    for (size_t pos = 0; pos < line.length; ++pos) {
        if (at(line.at(pos)) == value) {
            ++n;
        }
    }
    return n;
}

size_t Grid::count(Cell value) const {
    return static_cast<size_t>(std::count(cells_.begin(), cells_.end(), value));
}

std::string Grid::to_string() const {
    std::string out;
    for (size_t r = 0; r < size_; ++r) {
        for (size_t c = 0; c < size_; ++c) {
            if (c > 0) out += ' ';
            out += symbol_char(cells_[r * size_ + c]);
        }
        out += '\n';
    }
    return out;
}

} // namespace tango_logic
