/**
 * @file constraint_rules.cpp
 * @brief 制約を使うルールの実装
 */
#include "tango_logic/rules/constraint_rules.hpp"

namespace tango_logic {

namespace {

std::string marker(ConstraintKind kind) {
    return kind == ConstraintKind::Equals ? "'='" : "'x'";
}

// 両端点を含む Line（同じ行または同じ列でなければ nullopt）
std::optional<Line> line_of(const Grid& grid, const Constraint& c) {
    if (c.a().row == c.b().row) {
        return grid.row(c.a().row);
    }
    if (c.a().col == c.b().col) {
        return grid.column(c.a().col);
    }
    return std::nullopt;
}

} // namespace

// ============================================================================
// ConstraintPropagationRule
// ============================================================================

std::string ConstraintPropagationRule::name() const {
    return "Constraint Propagation Rule";
}

StepResult ConstraintPropagationRule::apply(const Grid& grid,
                                            const ConstraintSet& constraints) const {
    for (const auto& c : constraints.all()) {
        Cell va = grid.at(c.a());
        Cell vb = grid.at(c.b());
        if ((va == Cell::Empty) == (vb == Cell::Empty)) {
            continue;  // 両方埋まっている、または両方 Empty
        }
        const Coord& known = va != Cell::Empty ? c.a() : c.b();
        const Coord& target = c.other(known);
        Cell known_value = grid.at(known);
        Cell forced = c.implied_value(known_value);
        if (!can_place(grid, target, forced)) {
            continue;
        }

        std::string text = "Cells " + to_display(c.a()) + " and " + to_display(c.b()) +
                           " are linked by an " + marker(c.kind()) + " constraint. " +
                           to_display(known) + " is " + symbol_name(known_value) + ", so " +
                           to_display(target) + " must " +
                           (c.kind() == ConstraintKind::Equals ? "also " : "") + "be " +
                           symbol_name(forced) + ".";
        return found(grid, std::move(text), {known}, target, forced);
    }
    return NoForcedMove{};
}

// ============================================================================
// ModifierBalanceRule
// ============================================================================

std::string ModifierBalanceRule::name() const {
    return "Modifier Balance Rule";
}

StepResult ModifierBalanceRule::apply(const Grid& grid, const ConstraintSet& constraints) const {
    auto result = apply_cross_line(grid, constraints);
    if (has_step(result)) {
        return result;
    }
    return apply_in_line(grid, constraints);
}

StepResult ModifierBalanceRule::apply_cross_line(const Grid& grid,
                                                 const ConstraintSet& constraints) const {
    for (const auto& line : grid.lines()) {
        for (Cell symbol : {Cell::Sun, Cell::Moon}) {
            if (grid.count(line, symbol) + 1 != grid.cap()) {
                continue;
            }
            Cell forced = opposite(symbol);

            for (const auto& c : constraints.not_equals()) {
                auto other_line = line_of(grid, c);
                if (!other_line || *other_line == line) {
                    continue;
                }
                if (grid.count(*other_line, symbol) != grid.cap()) {
                    continue;
                }
                for (const Coord& endpoint : {c.a(), c.b()}) {
                    const Coord& partner = c.other(endpoint);
                    if (!line.contains(endpoint) || !grid.is_empty(endpoint) ||
                        grid.at(partner) != symbol || !can_place(grid, endpoint, forced)) {
                        continue;
                    }
                    std::string text = line.label() + " needs one more " + symbol_name(symbol) +
                                       ", but " + to_display(endpoint) + " cannot supply it: it is linked by an " +
                                       marker(c.kind()) + " constraint to the " + symbol_name(symbol) +
                                       " at " + to_display(partner) + ", and " + other_line->label() +
                                       " already has " + std::to_string(grid.cap()) + " " +
                                       symbol_plural(symbol) + ". So " + to_display(endpoint) +
                                       " must be " + symbol_name(forced) + ".";
                    return found(grid, std::move(text), {partner}, endpoint, forced);
                }
            }
        }
    }
    return NoForcedMove{};
}

StepResult ModifierBalanceRule::apply_in_line(const Grid& grid,
                                              const ConstraintSet& constraints) const {
    for (const auto& line : grid.lines()) {
        for (Cell symbol : {Cell::Sun, Cell::Moon}) {
            if (grid.count(line, symbol) + 1 != grid.cap()) {
                continue;
            }
            Cell forced = opposite(symbol);

            for (const auto& c : constraints.not_equals()) {
                if (!c.lies_within(line) || !grid.is_empty(c.a()) || !grid.is_empty(c.b())) {
                    continue;
                }
                // 制約ペアがちょうど1個の symbol を供給する
                for (size_t pos = 0; pos < line.length; ++pos) {
                    Coord target = line.at(pos);
                    if (c.touches(target) || !grid.is_empty(target) ||
                        !can_place(grid, target, forced)) {
                        continue;
                    }
                    std::string text = line.label() + " has " + std::to_string(grid.cap() - 1) + " " +
                                       symbol_plural(symbol) + " and needs exactly one more. The " +
                                       marker(c.kind()) + " constraint between " + to_display(c.a()) +
                                       " and " + to_display(c.b()) + " will supply exactly one " +
                                       symbol_name(symbol) + ", so every other empty cell in the " +
                                       line.kind_name() + " must be " + symbol_name(forced) + ": " +
                                       to_display(target) + " is " + symbol_name(forced) + ".";
                    return found(grid, std::move(text), {c.a(), c.b()}, target, forced);
                }
            }
        }
    }
    return NoForcedMove{};
}

// ============================================================================
// EndWithEqualsConstraintRule
// ============================================================================

std::string EndWithEqualsConstraintRule::name() const {
    return "End-With-Equals-Constraint Rule";
}

StepResult EndWithEqualsConstraintRule::apply_line(const Grid& grid,
                                                   const ConstraintSet& constraints,
                                                   const Line& line) const {
    auto v = grid.values(line);
    const size_t last = line.length - 1;

    // {既知の端, 既知の端に近い方のペア端点, 遠い方のペア端点}
    struct Pattern {
        size_t end;
        size_t near;
        size_t far;
    };
    const Pattern patterns[] = {
        {0, last - 1, last},
        {last, 1, 0},
    };

    for (const auto& p : patterns) {
        Cell end_value = v[p.end];
        if (end_value == Cell::Empty || v[p.near] != Cell::Empty || v[p.far] != Cell::Empty) {
            continue;
        }
        Coord near = line.at(p.near);
        Coord far = line.at(p.far);
        if (!constraints.contains(ConstraintKind::Equals, near, far)) {
            continue;
        }
        Cell forced = opposite(end_value);
        if (!hypothesis_fails(grid, line, {p.near, p.far}, end_value) ||
            !can_place(grid, near, forced)) {
            continue;
        }
        std::string text = to_display(line.at(p.end)) + " is " + symbol_name(end_value) +
                           " and the " + marker(ConstraintKind::Equals) + " pair " + to_display(near) +
                           "-" + to_display(far) + " at the other end of " + line.label() +
                           " must match. Two more " + symbol_plural(end_value) +
                           " there would break the " + line.kind_name() +
                           ", so the pair must be " + symbol_name(forced) + ": " + to_display(near) +
                           " is " + symbol_name(forced) + ".";
        return found(grid, std::move(text), {line.at(p.end), far}, near, forced);
    }
    return NoForcedMove{};
}

// ============================================================================
// AdjacentEqualsConstraintRule
// ============================================================================

std::string AdjacentEqualsConstraintRule::name() const {
    return "Adjacent-Equals-Constraint Rule";
}

StepResult AdjacentEqualsConstraintRule::apply_line(const Grid& grid,
                                                    const ConstraintSet& constraints,
                                                    const Line& line) const {
    auto v = grid.values(line);

    for (size_t i = 0; i + 1 < line.length; ++i) {
        if (v[i] != Cell::Empty || v[i + 1] != Cell::Empty ||
            !constraints.contains(ConstraintKind::Equals, line.at(i), line.at(i + 1))) {
            continue;
        }

        // {既知の隣接セル, 隣接する側の端点, 相方}
        struct Side {
            bool exists;
            size_t neighbor;
            size_t near;
            size_t far;
        };
        const Side sides[] = {
            {i > 0, i > 0 ? i - 1 : 0, i, i + 1},
            {i + 2 < line.length, i + 2, i + 1, i},
        };

        for (const auto& s : sides) {
            if (!s.exists || v[s.neighbor] == Cell::Empty) {
                continue;
            }
            Cell known_value = v[s.neighbor];
            Cell forced = opposite(known_value);
            Coord target = line.at(s.near);
            if (!can_place(grid, target, forced)) {
                continue;
            }
            std::string text = to_display(line.at(s.neighbor)) + " is " + symbol_name(known_value) +
                               " and sits right next to the " + marker(ConstraintKind::Equals) +
                               " pair " + to_display(line.at(i)) + "-" + to_display(line.at(i + 1)) +
                               ". If the pair were " + symbol_name(known_value) +
                               " there would be three " + symbol_plural(known_value) +
                               " in a row, so " + to_display(target) + " must be " +
                               symbol_name(forced) + ".";
            return found(grid, std::move(text), {line.at(s.neighbor), line.at(s.far)}, target, forced);
        }
    }
    return NoForcedMove{};
}

} // namespace tango_logic
