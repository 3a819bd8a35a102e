/**
 * @file constraint.cpp
 * @brief 関係制約と制約集合の実装
 */
#include "tango_logic/constraint.hpp"
#include <algorithm>
#include <stdexcept>

namespace tango_logic {

Constraint::Constraint(ConstraintKind kind, Coord p, Coord q)
    : kind_(kind)
    , a_(p < q ? p : q)
    , b_(p < q ? q : p) {
    if (p == q) {
        throw std::invalid_argument("Constraint endpoints must be distinct cells, got " +
                                    to_display(p) + " twice");
    }
}

std::string Constraint::name() const {
    return kind_ == ConstraintKind::Equals ? "equals" : "not_equals";
}

std::optional<bool> Constraint::is_satisfied(const Grid& grid) const {
    Cell va = grid.at(a_);
    Cell vb = grid.at(b_);
    if (va == Cell::Empty || vb == Cell::Empty) {
        return std::nullopt;
    }
    if (kind_ == ConstraintKind::Equals) {
        return va == vb;
    }
    return va != vb;
}

bool ConstraintSet::add(const Constraint& constraint) {
    auto& target = constraint.kind() == ConstraintKind::Equals ? equals_ : not_equals_;
    if (std::find(target.begin(), target.end(), constraint) != target.end()) {
        return false;
    }
    target.push_back(constraint);
    return true;
}

bool ConstraintSet::contains(ConstraintKind kind, const Coord& p, const Coord& q) const {
    if (p == q) {
        return false;
    }
    Constraint probe(kind, p, q);
    const auto& target = kind == ConstraintKind::Equals ? equals_ : not_equals_;
    return std::find(target.begin(), target.end(), probe) != target.end();
}

std::vector<Constraint> ConstraintSet::all() const {
    std::vector<Constraint> result;
    result.reserve(size());
    result.insert(result.end(), equals_.begin(), equals_.end());
    result.insert(result.end(), not_equals_.begin(), not_equals_.end());
    return result;
}

void ConstraintSet::check_bounds(size_t grid_size) const {
    auto in_range = [grid_size](const Coord& c) {
        return c.row < grid_size && c.col < grid_size;
    };
    for (const auto& c : all()) {
        if (!in_range(c.a()) || !in_range(c.b())) {
            throw std::invalid_argument("Constraint " + c.name() + " " + to_display(c.a()) +
                                        " " + to_display(c.b()) + " lies outside a " +
                                        std::to_string(grid_size) + "x" +
                                        std::to_string(grid_size) + " grid");
        }
    }
}

} // namespace tango_logic
