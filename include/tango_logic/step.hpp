/**
 * @file step.hpp
 * @brief 推論ステップ（1セル分の確定）とその適用
 */
#ifndef TANGO_LOGIC_STEP_HPP
#define TANGO_LOGIC_STEP_HPP

#include "tango_logic/grid.hpp"
#include <string>
#include <variant>
#include <vector>

namespace tango_logic {

/**
 * @brief ルール適用1回分の記録
 *
 * result_cell は grid_before で Empty、grid_after で result_value。
 * grid_before と grid_after の差分は result_cell の1セルのみ。
 */
struct Step {
    std::string rule_name;
    std::string explanation;
    std::vector<Coord> affected_cells;  // 推論の根拠となったセル
    Coord result_cell;
    Cell result_value = Cell::Empty;
    Grid grid_before;
    Grid grid_after;

    /**
     * @brief "<rule>: <explanation>" 形式の1行
     */
    std::string describe() const;
};

/**
 * @brief 強制手が存在しないことを表すタグ
 */
struct NoForcedMove {};

/**
 * @brief ルール・ディスパッチの結果（Found(Step) または NoForcedMove）
 */
using StepResult = std::variant<NoForcedMove, Step>;

inline bool has_step(const StepResult& result) {
    return std::holds_alternative<Step>(result);
}

/**
 * @pre has_step(result)
 */
inline const Step& get_step(const StepResult& result) {
    return std::get<Step>(result);
}

/**
 * @brief ステップを作成（grid_after は grid_before のコピーに1セル設定したもの）
 */
Step make_step(std::string rule_name, std::string explanation,
               std::vector<Coord> affected_cells,
               const Grid& grid_before, Coord result_cell, Cell result_value);

/**
 * @brief ステップをグリッドに適用した新しいグリッドを返す
 * @throws std::invalid_argument グリッドサイズが異なる
 */
Grid apply_step(const Grid& grid, const Step& step);

} // namespace tango_logic

#endif // TANGO_LOGIC_STEP_HPP
