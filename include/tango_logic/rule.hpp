/**
 * @file rule.hpp
 * @brief 推論ルールの基底クラスと全ルールヘッダのインクルード
 */
#ifndef TANGO_LOGIC_RULE_HPP
#define TANGO_LOGIC_RULE_HPP

#include "tango_logic/constraint.hpp"
#include "tango_logic/step.hpp"
#include <memory>
#include <string>
#include <vector>

namespace tango_logic {

/**
 * @brief 推論ルールの基底クラス
 *
 * ルールはグリッドのスナップショットと制約集合だけを見る純粋関数で、
 * 適用可能なら Empty セル1つを確定する Step を返す。
 * 入力のグリッドは変更しない。
 *
 * 全ルール共通の容量ガード: 行または列に既に N/2 個ある記号は提案しない。
 * 該当する候補は読み飛ばして走査を続ける。
 */
class Rule {
public:
    virtual ~Rule() = default;

    /**
     * @brief ルールの表示名を取得
     */
    virtual std::string name() const = 0;

    /**
     * @brief ルールを適用
     * @return 強制手が見つかれば Step、なければ NoForcedMove
     */
    virtual StepResult apply(const Grid& grid, const ConstraintSet& constraints) const = 0;

protected:
    /**
     * @brief 容量ガード: coord の行・列とも value が N/2 未満か
     */
    static bool can_place(const Grid& grid, const Coord& coord, Cell value);

    /**
     * @brief 仮定「positions に value を置く」が矛盾するか
     *
     * 以下のいずれかなら矛盾とみなす:
     * - value の個数が N/2 を超える
     * - 仮定だけで3連続ができる
     * - value がちょうど N/2 に達し、残りの Empty を反対記号で埋めると3連続ができる
     *
     * positions のいずれかが Empty でなければ false。
     */
    static bool hypothesis_fails(const Grid& grid, const Line& line,
                                 const std::vector<size_t>& positions, Cell value);

    /**
     * @brief このルール名で Step を作成
     */
    Step found(const Grid& grid, std::string explanation, std::vector<Coord> affected_cells,
               const Coord& result_cell, Cell result_value) const;
};

using RulePtr = std::shared_ptr<Rule>;

/**
 * @brief 1本の Line ごとに判定するルールの基底クラス
 *
 * Grid::lines() の順（全行、その後全列）に apply_line() を呼び、
 * 最初に見つかった強制手を返す。
 */
class LineRule : public Rule {
public:
    StepResult apply(const Grid& grid, const ConstraintSet& constraints) const override;

protected:
    virtual StepResult apply_line(const Grid& grid, const ConstraintSet& constraints,
                                  const Line& line) const = 0;
};

/**
 * @brief 既定の10ルールを優先順に取得
 */
std::vector<RulePtr> default_rules();

} // namespace tango_logic

// 各ルールグループのヘッダをインクルード
#include "tango_logic/rules/line_rules.hpp"
#include "tango_logic/rules/constraint_rules.hpp"

#endif // TANGO_LOGIC_RULE_HPP
