/**
 * @file line_rules.cpp
 * @brief Line 内の並びによるルールの実装
 */
#include "tango_logic/rules/line_rules.hpp"

namespace tango_logic {

// ============================================================================
// NoThreeRule
// ============================================================================

std::string NoThreeRule::name() const {
    return "No-Three Rule";
}

StepResult NoThreeRule::apply_line(const Grid& grid, const ConstraintSet& /*constraints*/,
                                   const Line& line) const {
    auto v = grid.values(line);
    const size_t n = line.length;

    for (size_t i = 0; i + 1 < n; ++i) {
        if (v[i] == Cell::Empty || v[i] != v[i + 1]) {
            continue;
        }
        Cell forced = opposite(v[i]);

        // 前側、後側の順に確認
        std::vector<size_t> targets;
        if (i > 0) targets.push_back(i - 1);
        if (i + 2 < n) targets.push_back(i + 2);

        for (size_t t : targets) {
            Coord target = line.at(t);
            if (v[t] != Cell::Empty || !can_place(grid, target, forced)) {
                continue;
            }
            std::string text = "Cells " + to_display(line.at(i)) + " and " +
                               to_display(line.at(i + 1)) + " are both " + symbol_name(v[i]) +
                               ". A third " + symbol_name(v[i]) + " next to them is not allowed, so " +
                               to_display(target) + " must be " + symbol_name(forced) + ".";
            return found(grid, std::move(text), {line.at(i), line.at(i + 1)}, target, forced);
        }
    }
    return NoForcedMove{};
}

// ============================================================================
// ParityRule
// ============================================================================

std::string ParityRule::name() const {
    return "Parity Rule";
}

StepResult ParityRule::apply_line(const Grid& grid, const ConstraintSet& /*constraints*/,
                                  const Line& line) const {
    auto v = grid.values(line);

    for (Cell full : {Cell::Sun, Cell::Moon}) {
        if (grid.count(line, full) != grid.cap()) {
            continue;
        }
        Cell forced = opposite(full);

        std::vector<Coord> holders;
        for (size_t pos = 0; pos < line.length; ++pos) {
            if (v[pos] == full) holders.push_back(line.at(pos));
        }

        for (size_t pos = 0; pos < line.length; ++pos) {
            Coord target = line.at(pos);
            if (v[pos] != Cell::Empty || !can_place(grid, target, forced)) {
                continue;
            }
            std::string text = line.label() + " already has " + std::to_string(grid.cap()) + " " +
                               symbol_plural(full) + ", the most a " + line.kind_name() +
                               " of " + std::to_string(line.length) + " can hold. Its remaining cells must be " +
                               symbol_name(forced) + ", so " + to_display(target) + " is " +
                               symbol_name(forced) + ".";
            return found(grid, std::move(text), std::move(holders), target, forced);
        }
    }
    return NoForcedMove{};
}

// ============================================================================
// EdgeCaseRule
// ============================================================================

std::string EdgeCaseRule::name() const {
    return "Edge Case Rule";
}

StepResult EdgeCaseRule::apply_line(const Grid& grid, const ConstraintSet& /*constraints*/,
                                    const Line& line) const {
    auto v = grid.values(line);
    const size_t last = line.length - 1;

    if (v[0] == Cell::Empty || v[0] != v[last]) {
        return NoForcedMove{};
    }
    Cell end_value = v[0];
    Cell forced = opposite(end_value);

    for (size_t t : {size_t{1}, last - 1}) {
        Coord target = line.at(t);
        if (v[t] != Cell::Empty || !hypothesis_fails(grid, line, {t}, end_value) ||
            !can_place(grid, target, forced)) {
            continue;
        }
        std::string text = line.label() + " starts and ends with " + symbol_name(end_value) +
                           " (" + to_display(line.at(0)) + " and " + to_display(line.at(last)) +
                           "). Another " + symbol_name(end_value) + " at " + to_display(target) +
                           " would leave the " + symbol_plural(forced) +
                           " no room without three in a row, so " + to_display(target) +
                           " must be " + symbol_name(forced) + ".";
        return found(grid, std::move(text), {line.at(0), line.at(last)}, target, forced);
    }
    return NoForcedMove{};
}

// ============================================================================
// GapRule
// ============================================================================

std::string GapRule::name() const {
    return "Gap Rule";
}

StepResult GapRule::apply_line(const Grid& grid, const ConstraintSet& /*constraints*/,
                               const Line& line) const {
    auto v = grid.values(line);

    for (size_t i = 0; i + 2 < line.length; ++i) {
        if (v[i] == Cell::Empty || v[i] != v[i + 2] || v[i + 1] != Cell::Empty) {
            continue;
        }
        Cell forced = opposite(v[i]);
        Coord gap = line.at(i + 1);
        if (!can_place(grid, gap, forced)) {
            continue;
        }
        std::string text = "Cells " + to_display(line.at(i)) + " and " + to_display(line.at(i + 2)) +
                           " are both " + symbol_name(v[i]) + " with one cell between them. A " +
                           symbol_name(v[i]) + " in the gap would make three in a row, so " +
                           to_display(gap) + " must be " + symbol_name(forced) + ".";
        return found(grid, std::move(text), {line.at(i), line.at(i + 2)}, gap, forced);
    }
    return NoForcedMove{};
}

// ============================================================================
// TwoEqualsAtEndRule
// ============================================================================

std::string TwoEqualsAtEndRule::name() const {
    return "Two-Equals-At-End Rule";
}

StepResult TwoEqualsAtEndRule::apply_line(const Grid& grid, const ConstraintSet& /*constraints*/,
                                          const Line& line) const {
    auto v = grid.values(line);
    const size_t last = line.length - 1;

    struct Pattern {
        size_t first;
        size_t second;
        size_t target;
    };
    const Pattern patterns[] = {
        {0, 1, last},
        {last, last - 1, 0},
    };

    for (const auto& p : patterns) {
        Cell pair_value = v[p.first];
        if (pair_value == Cell::Empty || pair_value != v[p.second] || v[p.target] != Cell::Empty) {
            continue;
        }
        Cell forced = opposite(pair_value);
        Coord target = line.at(p.target);
        if (!hypothesis_fails(grid, line, {p.target}, pair_value) || !can_place(grid, target, forced)) {
            continue;
        }
        std::string text = line.label() + " has two " + symbol_plural(pair_value) + " at one end (" +
                           to_display(line.at(p.first)) + " and " + to_display(line.at(p.second)) +
                           "). A " + symbol_name(pair_value) + " at the other end would force three " +
                           symbol_plural(forced) + " in a row between them, so " + to_display(target) +
                           " must be " + symbol_name(forced) + ".";
        return found(grid, std::move(text), {line.at(p.first), line.at(p.second)}, target, forced);
    }
    return NoForcedMove{};
}

// ============================================================================
// SecondToLastEqualsFirstRule
// ============================================================================

std::string SecondToLastEqualsFirstRule::name() const {
    return "Second-To-Last-Equals-First Rule";
}

StepResult SecondToLastEqualsFirstRule::apply_line(const Grid& grid,
                                                   const ConstraintSet& /*constraints*/,
                                                   const Line& line) const {
    auto v = grid.values(line);
    const size_t last = line.length - 1;

    // {端, 反対側の端から2番目, 反対側の端}
    struct Pattern {
        size_t end;
        size_t second_to_last;
        size_t target;
    };
    const Pattern patterns[] = {
        {0, last - 1, last},
        {last, 1, 0},
    };

    for (const auto& p : patterns) {
        Cell end_value = v[p.end];
        if (end_value == Cell::Empty || end_value != v[p.second_to_last] ||
            v[p.target] != Cell::Empty) {
            continue;
        }
        Cell forced = opposite(end_value);
        Coord target = line.at(p.target);
        if (!hypothesis_fails(grid, line, {p.target}, end_value) || !can_place(grid, target, forced)) {
            continue;
        }
        std::string text = "In " + line.label() + ", " + to_display(line.at(p.end)) + " and " +
                           to_display(line.at(p.second_to_last)) + " are both " +
                           symbol_name(end_value) + ". A " + symbol_name(end_value) + " at " +
                           to_display(target) + " would force three " + symbol_plural(forced) +
                           " in a row between them, so " + to_display(target) + " must be " +
                           symbol_name(forced) + ".";
        return found(grid, std::move(text), {line.at(p.end), line.at(p.second_to_last)},
                     target, forced);
    }
    return NoForcedMove{};
}

} // namespace tango_logic
