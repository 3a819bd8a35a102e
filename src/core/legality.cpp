/**
 * @file legality.cpp
 * @brief 合法性検査の実装
 */
#include "tango_logic/legality.hpp"

namespace tango_logic {

namespace {

bool line_is_legal(const Grid& grid, const Line& line) {
    if (grid.count(line, Cell::Sun) > grid.cap() || grid.count(line, Cell::Moon) > grid.cap()) {
        return false;
    }
    return !find_run_of_three(grid.values(line)).has_value();
}

bool constraints_are_legal(const Grid& grid, const ConstraintSet& constraints) {
    for (const auto& c : constraints.all()) {
        if (!c.is_satisfied(grid).value_or(true)) {
            return false;
        }
    }
    return true;
}

// 連続数を数える（coord を含む、同じ値の最長ラン）
size_t run_length_through(const Grid& grid, const Line& line, size_t pos) {
    Cell value = grid.at(line.at(pos));
    if (value == Cell::Empty) {
        return 0;
    }
    size_t count = 1;
    for (size_t i = pos; i > 0 && grid.at(line.at(i - 1)) == value; --i) {
        ++count;
    }
    for (size_t i = pos + 1; i < line.length && grid.at(line.at(i)) == value; ++i) {
        ++count;
    }
    return count;
}

} // namespace

void require_well_formed(const Grid& grid, const ConstraintSet& constraints) {
    constraints.check_bounds(grid.size());
}

std::optional<size_t> find_run_of_three(const std::vector<Cell>& values) {
    for (size_t i = 0; i + 2 < values.size(); ++i) {
        if (values[i] != Cell::Empty && values[i] == values[i + 1] && values[i + 1] == values[i + 2]) {
            return i;
        }
    }
    return std::nullopt;
}

ValidationResult validate_start(const Grid& grid, const ConstraintSet& constraints) {
    require_well_formed(grid, constraints);

    ValidationResult result;
    auto& errors = result.violations;
    const size_t cap = grid.cap();

    if (grid.empty_count() == grid.size() * grid.size()) {
        errors.push_back("Grid cannot be completely empty");
    }

    for (const auto& line : grid.lines()) {
        for (Cell symbol : {Cell::Sun, Cell::Moon}) {
            size_t n = grid.count(line, symbol);
            if (n > cap) {
                errors.push_back(line.label() + " has too many " + symbol_plural(symbol) +
                                 " (" + std::to_string(n) + " > " + std::to_string(cap) + ")");
            }
        }

        // 4連続以上は開始位置ごとに報告される
        auto values = grid.values(line);
        const char* across = line.kind == LineKind::Row ? " starting at column " : " starting at row ";
        for (size_t i = 0; i + 2 < values.size(); ++i) {
            if (values[i] != Cell::Empty && values[i] == values[i + 1] && values[i + 1] == values[i + 2]) {
                errors.push_back(line.label() + " has 3+ consecutive " + symbol_plural(values[i]) +
                                 across + std::to_string(i + 1));
            }
        }
    }

    for (const auto& c : constraints.equals()) {
        if (!c.is_satisfied(grid).value_or(true)) {
            errors.push_back("Constraint violation: Cells " + to_display(c.a()) + " and " +
                             to_display(c.b()) + " must be equal but have different values");
        }
    }
    for (const auto& c : constraints.not_equals()) {
        if (!c.is_satisfied(grid).value_or(true)) {
            errors.push_back("Constraint violation: Cells " + to_display(c.a()) + " and " +
                             to_display(c.b()) + " must be different but have the same value");
        }
    }

    for (const auto& eq : constraints.equals()) {
        for (const auto& ne : constraints.not_equals()) {
            if (eq.same_endpoints(ne)) {
                errors.push_back("Cells " + to_display(eq.a()) + " and " + to_display(eq.b()) +
                                 " cannot be both equal and different");
            }
        }
    }

    result.valid = errors.empty();
    return result;
}

bool is_legal_partial(const Grid& grid, const ConstraintSet& constraints) {
    require_well_formed(grid, constraints);
    for (const auto& line : grid.lines()) {
        if (!line_is_legal(grid, line)) {
            return false;
        }
    }
    return constraints_are_legal(grid, constraints);
}

bool is_complete(const Grid& grid) {
    return grid.empty_count() == 0;
}

bool is_solved(const Grid& grid, const ConstraintSet& constraints) {
    if (!is_complete(grid)) {
        return false;
    }
    for (const auto& line : grid.lines()) {
        if (grid.count(line, Cell::Sun) != grid.count(line, Cell::Moon)) {
            return false;
        }
    }
    return is_legal_partial(grid, constraints);
}

bool is_legal_move(const Grid& grid, const ConstraintSet& constraints, const Coord& coord) {
    require_well_formed(grid, constraints);
    for (const auto& line : {grid.row(coord.row), grid.column(coord.col)}) {
        if (grid.count(line, Cell::Sun) > grid.cap() || grid.count(line, Cell::Moon) > grid.cap()) {
            return false;
        }
        if (run_length_through(grid, line, line.position_of(coord)) > 2) {
            return false;
        }
    }
    for (const auto& c : constraints.all()) {
        if (c.touches(coord) && !c.is_satisfied(grid).value_or(true)) {
            return false;
        }
    }
    return true;
}

} // namespace tango_logic
