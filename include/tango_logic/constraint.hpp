/**
 * @file constraint.hpp
 * @brief 2セル間の関係制約（Equals / NotEquals）と制約集合
 */
#ifndef TANGO_LOGIC_CONSTRAINT_HPP
#define TANGO_LOGIC_CONSTRAINT_HPP

#include "tango_logic/grid.hpp"
#include <optional>
#include <string>
#include <vector>

namespace tango_logic {

/**
 * @brief 制約の種類
 */
enum class ConstraintKind {
    Equals,     // 2セルは同じ記号
    NotEquals   // 2セルは異なる記号
};

/**
 * @brief 2セル間の関係制約
 *
 * 対称な関係なので、端点は行優先で小さい方を a に正規化して保持する。
 * これにより (p, q) と (q, p) は同一の制約として扱われる。
 */
class Constraint {
public:
    /**
     * @brief 制約を作成
     * @throws std::invalid_argument 端点が同じセル
     */
    Constraint(ConstraintKind kind, Coord p, Coord q);

    ConstraintKind kind() const { return kind_; }

    /**
     * @brief 正規化後の第1端点
     */
    const Coord& a() const { return a_; }

    /**
     * @brief 正規化後の第2端点
     */
    const Coord& b() const { return b_; }

    /**
     * @brief 制約の名前を取得（"equals" / "not_equals"）
     */
    std::string name() const;

    /**
     * @brief 制約が満たされているか確認
     * @return 満たされていればtrue、違反していればfalse、
     *         端点のどちらかが Empty ならstd::nullopt
     */
    std::optional<bool> is_satisfied(const Grid& grid) const;

    /**
     * @brief 指定セルが端点か
     */
    bool touches(const Coord& coord) const { return a_ == coord || b_ == coord; }

    /**
     * @brief もう一方の端点を取得
     * @pre touches(coord)
     */
    const Coord& other(const Coord& coord) const { return a_ == coord ? b_ : a_; }

    /**
     * @brief 両端点が同じ Line 上にあるか
     */
    bool lies_within(const Line& line) const {
        return line.contains(a_) && line.contains(b_);
    }

    /**
     * @brief 端点 v の値が与えられたとき、もう一方の端点が取るべき値
     */
    Cell implied_value(Cell endpoint_value) const {
        return kind_ == ConstraintKind::Equals ? endpoint_value : opposite(endpoint_value);
    }

    bool same_endpoints(const Constraint& other) const {
        return a_ == other.a_ && b_ == other.b_;
    }

    bool operator==(const Constraint& other) const {
        return kind_ == other.kind_ && same_endpoints(other);
    }

private:
    ConstraintKind kind_;
    Coord a_;
    Coord b_;
};

/**
 * @brief 制約集合（Equals と NotEquals の2つのコレクション）
 */
class ConstraintSet {
public:
    ConstraintSet() = default;

    /**
     * @brief 制約を追加
     * @return 追加されればtrue、同じ制約が既にあればfalse
     */
    bool add(const Constraint& constraint);

    bool add_equals(Coord p, Coord q) {
        return add(Constraint(ConstraintKind::Equals, p, q));
    }

    bool add_not_equals(Coord p, Coord q) {
        return add(Constraint(ConstraintKind::NotEquals, p, q));
    }

    /**
     * @brief 指定した2セル間に指定種類の制約があるか（端点の順序は問わない）
     */
    bool contains(ConstraintKind kind, const Coord& p, const Coord& q) const;

    const std::vector<Constraint>& equals() const { return equals_; }
    const std::vector<Constraint>& not_equals() const { return not_equals_; }

    /**
     * @brief 全制約を取得（Equals, NotEquals の順）
     */
    std::vector<Constraint> all() const;

    size_t size() const { return equals_.size() + not_equals_.size(); }
    bool empty() const { return size() == 0; }

    /**
     * @brief 全端点がグリッド内にあるか検査
     * @throws std::invalid_argument 範囲外の端点がある
     */
    void check_bounds(size_t grid_size) const;

private:
    std::vector<Constraint> equals_;
    std::vector<Constraint> not_equals_;
};

} // namespace tango_logic

#endif // TANGO_LOGIC_CONSTRAINT_HPP
