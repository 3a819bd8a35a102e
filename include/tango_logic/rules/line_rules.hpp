/**
 * @file line_rules.hpp
 * @brief 1本の Line 内の並びだけで決まるルール
 *
 * No-Three, Parity, Edge Case, Gap, Two-Equals-At-End, Second-To-Last-Equals-First
 */
#ifndef TANGO_LOGIC_RULES_LINE_RULES_HPP
#define TANGO_LOGIC_RULES_LINE_RULES_HPP

#include "tango_logic/rule.hpp"

namespace tango_logic {

/**
 * @brief No-Three: 隣接する同値2セルの両隣は反対記号
 *
 * X X _ / _ X X
 */
class NoThreeRule : public LineRule {
public:
    std::string name() const override;

protected:
    StepResult apply_line(const Grid& grid, const ConstraintSet& constraints,
                          const Line& line) const override;
};

/**
 * @brief Parity: ある記号が N/2 個に達した Line の残りは反対記号
 */
class ParityRule : public LineRule {
public:
    std::string name() const override;

protected:
    StepResult apply_line(const Grid& grid, const ConstraintSet& constraints,
                          const Line& line) const override;
};

/**
 * @brief Edge Case: 両端が同値なら、端の隣（位置 2 / N-1）は反対記号
 *
 * X _ ... _ X
 */
class EdgeCaseRule : public LineRule {
public:
    std::string name() const override;

protected:
    StepResult apply_line(const Grid& grid, const ConstraintSet& constraints,
                          const Line& line) const override;
};

/**
 * @brief Gap: X _ X の間は反対記号
 */
class GapRule : public LineRule {
public:
    std::string name() const override;

protected:
    StepResult apply_line(const Grid& grid, const ConstraintSet& constraints,
                          const Line& line) const override;
};

/**
 * @brief Two-Equals-At-End: 一方の端に同値2セルがあれば、反対の端は反対記号
 *
 * X X ... _
 */
class TwoEqualsAtEndRule : public LineRule {
public:
    std::string name() const override;

protected:
    StepResult apply_line(const Grid& grid, const ConstraintSet& constraints,
                          const Line& line) const override;
};

/**
 * @brief Second-To-Last-Equals-First: 先頭と末尾から2番目が同値なら末尾は反対記号
 *
 * X ... X _
 */
class SecondToLastEqualsFirstRule : public LineRule {
public:
    std::string name() const override;

protected:
    StepResult apply_line(const Grid& grid, const ConstraintSet& constraints,
                          const Line& line) const override;
};

} // namespace tango_logic

#endif // TANGO_LOGIC_RULES_LINE_RULES_HPP
