/**
 * @file constraint_rules.hpp
 * @brief Equals / NotEquals 制約を使うルール
 *
 * Constraint Propagation, Modifier Balance, End-With-Equals-Constraint,
 * Adjacent-Equals-Constraint
 */
#ifndef TANGO_LOGIC_RULES_CONSTRAINT_RULES_HPP
#define TANGO_LOGIC_RULES_CONSTRAINT_RULES_HPP

#include "tango_logic/rule.hpp"

namespace tango_logic {

/**
 * @brief Constraint Propagation: 片方の端点だけ埋まった制約はもう一方を確定する
 *
 * Equals なら同値、NotEquals なら反対記号。Equals 制約を先に走査する。
 */
class ConstraintPropagationRule : public Rule {
public:
    std::string name() const override;
    StepResult apply(const Grid& grid, const ConstraintSet& constraints) const override;
};

/**
 * @brief Modifier Balance: Line の残り容量と NotEquals 制約の組み合わせ
 *
 * (A) Line L で記号 S が残り1個のとき、L 上の Empty 端点 e を持ち、
 *     別の Line L2 に収まる NotEquals 制約の相手が S で、L2 が既に S を N/2 個
 *     持つなら e は反対記号。
 * (B) Line で S が N/2 - 1 個のとき、その Line 内に両端点 Empty の NotEquals
 *     制約があれば、それがちょうど1個の S を供給するので、
 *     他の Empty セルは全て反対記号。
 */
class ModifierBalanceRule : public Rule {
public:
    std::string name() const override;
    StepResult apply(const Grid& grid, const ConstraintSet& constraints) const override;

private:
    StepResult apply_cross_line(const Grid& grid, const ConstraintSet& constraints) const;
    StepResult apply_in_line(const Grid& grid, const ConstraintSet& constraints) const;
};

/**
 * @brief End-With-Equals-Constraint: 一方の端の既知値と、反対の端2セルの Equals 制約
 *
 * X ... [_ = _] の Equals ペアは反対記号。既知の端に近い方の端点だけを確定し、
 * 相方は次回以降 Constraint Propagation で確定する。
 */
class EndWithEqualsConstraintRule : public LineRule {
public:
    std::string name() const override;

protected:
    StepResult apply_line(const Grid& grid, const ConstraintSet& constraints,
                          const Line& line) const override;
};

/**
 * @brief Adjacent-Equals-Constraint: 既知セルに隣接する Empty の Equals ペアは反対記号
 *
 * X [_ = _] / [_ = _] X。既知セル側の端点だけを確定する。
 */
class AdjacentEqualsConstraintRule : public LineRule {
public:
    std::string name() const override;

protected:
    StepResult apply_line(const Grid& grid, const ConstraintSet& constraints,
                          const Line& line) const override;
};

} // namespace tango_logic

#endif // TANGO_LOGIC_RULES_CONSTRAINT_RULES_HPP
