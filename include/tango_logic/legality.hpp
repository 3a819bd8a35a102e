/**
 * @file legality.hpp
 * @brief 盤面の合法性検査（開始局面の全違反列挙、部分・完成盤面の高速判定）
 *
 * 検査する構造規則（行・列それぞれ独立に）:
 * - Sun, Moon の個数はそれぞれ N/2 以下
 * - 同じ記号が3つ以上連続しない
 * - 両端点が埋まった Equals 制約は同値、NotEquals 制約は異なる値
 */
#ifndef TANGO_LOGIC_LEGALITY_HPP
#define TANGO_LOGIC_LEGALITY_HPP

#include "tango_logic/constraint.hpp"
#include <optional>
#include <string>
#include <vector>

namespace tango_logic {

/**
 * @brief 開始局面検証の結果
 */
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> violations;  // 表示用（1-indexed）
};

/**
 * @brief 入力の整形式を検査
 * @throws std::invalid_argument 制約端点がグリッド外
 */
void require_well_formed(const Grid& grid, const ConstraintSet& constraints);

/**
 * @brief 開始局面を検証し、全ての違反を列挙する
 *
 * 上記の構造規則に加え、グリッドが全て Empty でないこと、
 * 同じセル対に Equals と NotEquals が両方付いていないことを検査する。
 */
ValidationResult validate_start(const Grid& grid, const ConstraintSet& constraints);

/**
 * @brief 部分盤面が構造規則を満たすか（最初の違反で打ち切る）
 */
bool is_legal_partial(const Grid& grid, const ConstraintSet& constraints);

/**
 * @brief Empty セルが残っていないか（合法性は検査しない）
 */
bool is_complete(const Grid& grid);

/**
 * @brief 完成かつ正解か
 *
 * 全セルが埋まり、各行・列で Sun と Moon が同数（N/2 ずつ）、
 * 3連続がなく、全制約を満たす。
 */
bool is_solved(const Grid& grid, const ConstraintSet& constraints);

/**
 * @brief 直前に置いた1セルについて、その行・列と関係する制約のみを検査
 */
bool is_legal_move(const Grid& grid, const ConstraintSet& constraints, const Coord& coord);

/**
 * @brief 同じ記号の3連続の開始位置を探す
 * @return 見つかればその位置、なければstd::nullopt
 */
std::optional<size_t> find_run_of_three(const std::vector<Cell>& values);

} // namespace tango_logic

#endif // TANGO_LOGIC_LEGALITY_HPP
