/**
 * @file rule.cpp
 * @brief ルール基底クラスの実装
 *
 * 各ルールの実装は src/core/rules/ 以下の個別ファイルに配置:
 * - rules/line_rules.cpp: Line 内の並びによるルール
 * - rules/constraint_rules.cpp: 制約を使うルール
 */
#include "tango_logic/rule.hpp"
#include "tango_logic/legality.hpp"
#include <algorithm>

namespace tango_logic {

bool Rule::can_place(const Grid& grid, const Coord& coord, Cell value) {
    return grid.count(grid.row(coord.row), value) < grid.cap() &&
           grid.count(grid.column(coord.col), value) < grid.cap();
}

bool Rule::hypothesis_fails(const Grid& grid, const Line& line,
                            const std::vector<size_t>& positions, Cell value) {
    auto values = grid.values(line);
    for (size_t pos : positions) {
        if (values[pos] != Cell::Empty) {
            return false;
        }
        values[pos] = value;
    }

    auto n = static_cast<size_t>(std::count(values.begin(), values.end(), value));
    if (n > grid.cap()) {
        return true;
    }
    if (find_run_of_three(values)) {
        return true;
    }
    if (n < grid.cap()) {
        return false;
    }

    // value が上限に達した: 残りは全て反対記号になる
    std::replace(values.begin(), values.end(), Cell::Empty, opposite(value));
    return find_run_of_three(values).has_value();
}

Step Rule::found(const Grid& grid, std::string explanation, std::vector<Coord> affected_cells,
                 const Coord& result_cell, Cell result_value) const {
    return make_step(name(), std::move(explanation), std::move(affected_cells),
                     grid, result_cell, result_value);
}

StepResult LineRule::apply(const Grid& grid, const ConstraintSet& constraints) const {
    for (const auto& line : grid.lines()) {
        auto result = apply_line(grid, constraints, line);
        if (has_step(result)) {
            return result;
        }
    }
    return NoForcedMove{};
}

std::vector<RulePtr> default_rules() {
    return {
        std::make_shared<NoThreeRule>(),
        std::make_shared<ParityRule>(),
        std::make_shared<ConstraintPropagationRule>(),
        std::make_shared<EdgeCaseRule>(),
        std::make_shared<GapRule>(),
        std::make_shared<TwoEqualsAtEndRule>(),
        std::make_shared<SecondToLastEqualsFirstRule>(),
        std::make_shared<ModifierBalanceRule>(),
        std::make_shared<EndWithEqualsConstraintRule>(),
        std::make_shared<AdjacentEqualsConstraintRule>(),
    };
}

} // namespace tango_logic
