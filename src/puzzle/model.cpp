#include "tango_logic/puzzle/model.hpp"
#include <stdexcept>

namespace tango_logic {
namespace puzzle {

namespace {

std::string at_line(int line) {
    return "line " + std::to_string(line) + ": ";
}

} // namespace

void Model::set_size(long long size, int line) {
    size_ = size;
    size_line_ = line;
}

void Model::add_row(RowDecl decl) {
    rows_.push_back(std::move(decl));
}

void Model::add_constraint_decl(ConstraintDecl decl) {
    constraint_decls_.push_back(std::move(decl));
}

size_t Model::checked_size() const {
    if (!size_) {
        throw std::runtime_error("Missing size declaration");
    }
    if (*size_ < 4 || *size_ % 2 != 0) {
        throw std::runtime_error(at_line(size_line_) + "size must be an even number >= 4, got " +
                                 std::to_string(*size_));
    }
    if (!Grid::is_valid_size(static_cast<size_t>(*size_))) {
        throw std::runtime_error(at_line(size_line_) + "size " + std::to_string(*size_) +
                                 " is too large");
    }
    return static_cast<size_t>(*size_);
}

Grid Model::to_grid() const {
    const size_t n = checked_size();
    Grid grid(n);
    if (rows_.empty()) {
        return grid;
    }
    if (rows_.size() != n) {
        throw std::runtime_error(at_line(rows_.back().line) + "expected " + std::to_string(n) +
                                 " rows, got " + std::to_string(rows_.size()));
    }
    for (size_t r = 0; r < n; ++r) {
        const auto& decl = rows_[r];
        if (decl.cells.size() != n) {
            throw std::runtime_error(at_line(decl.line) + "row has " + std::to_string(decl.cells.size()) +
                                     " cells, expected " + std::to_string(n));
        }
        for (size_t c = 0; c < n; ++c) {
            grid.set(Coord{r, c}, decl.cells[c]);
        }
    }
    return grid;
}

ConstraintSet Model::to_constraints() const {
    const auto n = static_cast<long long>(checked_size());
    ConstraintSet constraints;

    for (const auto& decl : constraint_decls_) {
        Coord endpoints[2];
        const CoordDecl* coords[2] = {&decl.first, &decl.second};
        for (size_t i = 0; i < 2; ++i) {
            const auto& c = *coords[i];
            if (c.row < 1 || c.row > n || c.col < 1 || c.col > n) {
                throw std::runtime_error(at_line(decl.line) + "cell (" + std::to_string(c.row) + "," +
                                         std::to_string(c.col) + ") is outside the " +
                                         std::to_string(n) + "x" + std::to_string(n) + " grid");
            }
            endpoints[i] = Coord{static_cast<size_t>(c.row - 1), static_cast<size_t>(c.col - 1)};
        }
        if (endpoints[0] == endpoints[1]) {
            throw std::runtime_error(at_line(decl.line) + "constraint endpoints must be distinct, got " +
                                     to_display(endpoints[0]) + " twice");
        }
        constraints.add(Constraint(decl.kind, endpoints[0], endpoints[1]));
    }
    return constraints;
}

std::string format(const Grid& grid, const ConstraintSet& constraints) {
    std::string out = "size " + std::to_string(grid.size()) + ";\n";
    for (size_t r = 0; r < grid.size(); ++r) {
        out += "row";
        for (size_t c = 0; c < grid.size(); ++c) {
            out += ' ';
            out += symbol_char(grid.at(r, c));
        }
        out += " ;\n";
    }
    for (const auto& c : constraints.all()) {
        out += c.name() + " " + to_display(c.a()) + " " + to_display(c.b()) + ";\n";
    }
    return out;
}

} // namespace puzzle
} // namespace tango_logic
