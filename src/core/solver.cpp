#include "tango_logic/solver.hpp"
#include <iostream>
#include <stdexcept>

namespace tango_logic {

std::string to_string(SolveStatus status) {
    switch (status) {
        case SolveStatus::Solved:
            return "SOLVED";
        case SolveStatus::Stuck:
            return "STUCK";
        case SolveStatus::AlreadySolved:
            return "ALREADY SOLVED";
        case SolveStatus::IllegalStart:
            return "ILLEGAL";
        case SolveStatus::Contradiction:
            return "CONTRADICTION";
    }
    return "UNKNOWN";
}

Solver::Solver()
    : Solver(default_rules()) {}

Solver::Solver(std::vector<RulePtr> rules)
    : rules_(std::move(rules)) {
    reset_stats();
}

void Solver::reset_stats() {
    stats_ = SolverStats{};
    stats_.rule_fire_counts.assign(rules_.size(), 0);
}

StepResult Solver::dispatch(const Grid& grid, const ConstraintSet& constraints) {
    ++stats_.dispatch_count;
    for (size_t i = 0; i < rules_.size(); ++i) {
        auto result = rules_[i]->apply(grid, constraints);
        if (has_step(result)) {
            ++stats_.rule_fire_counts[i];
            if (verbose_) {
                const auto& step = get_step(result);
                std::cerr << "% [verbose] " << rules_[i]->name() << " -> "
                          << to_display(step.result_cell) << " = "
                          << symbol_name(step.result_value) << "\n";
            }
            return result;
        }
    }
    return NoForcedMove{};
}

StepResult Solver::next_step(const Grid& grid, const ConstraintSet& constraints) {
    require_well_formed(grid, constraints);
    reset_stats();

    auto result = dispatch(grid, constraints);
    if (has_step(result)) {
        stats_.step_count = 1;
    } else if (verbose_) {
        std::cerr << "% [verbose] no forced move\n";
    }
    return result;
}

std::vector<Step> Solver::solve_to_fixpoint(const Grid& grid, const ConstraintSet& constraints) {
    require_well_formed(grid, constraints);
    reset_stats();

    std::vector<Step> steps;
    Grid working = grid;
    const bool started_legal = is_legal_partial(working, constraints);

    // 1回の適用で Empty が必ず1つ減るので、上限には届かないはず
    const size_t iteration_limit = 2 * grid.size() * grid.size();

    if (verbose_) {
        std::cerr << "% [verbose] fixpoint start: " << working.empty_count() << " empty cells, "
                  << constraints.size() << " constraints, " << rules_.size() << " rules\n";
    }

    for (size_t iteration = 0; iteration < iteration_limit; ++iteration) {
        if (is_complete(working)) {
            if (verbose_) std::cerr << "% [verbose] fixpoint done: grid complete\n";
            return steps;
        }

        auto result = dispatch(working, constraints);
        if (!has_step(result)) {
            if (verbose_) {
                std::cerr << "% [verbose] fixpoint done: no forced move, "
                          << working.empty_count() << " empty cells left\n";
            }
            return steps;
        }

        const auto& step = get_step(result);
        Grid next = apply_step(working, step);
        if (started_legal && !is_legal_move(next, constraints, step.result_cell)) {
            stats_.contradiction = true;
            if (verbose_) {
                std::cerr << "% [verbose] contradiction: " << step.rule_name << " at "
                          << to_display(step.result_cell) << " breaks the grid\n";
            }
            return steps;
        }

        working = std::move(next);
        steps.push_back(step);
        ++stats_.step_count;
    }

    if (!is_complete(working)) {
        throw std::logic_error("Fixpoint iteration limit of " + std::to_string(iteration_limit) +
                               " reached with " + std::to_string(working.empty_count()) +
                               " empty cells left");
    }
    return steps;
}

SolveReport Solver::solve(const Grid& grid, const ConstraintSet& constraints) {
    require_well_formed(grid, constraints);
    reset_stats();

    if (is_solved(grid, constraints)) {
        return SolveReport{SolveStatus::AlreadySolved, {}, grid, {}};
    }

    auto validation = validate_start(grid, constraints);
    if (!validation.valid) {
        if (verbose_) {
            std::cerr << "% [verbose] illegal start: " << validation.violations.size()
                      << " violations\n";
        }
        return SolveReport{SolveStatus::IllegalStart, {}, grid, std::move(validation.violations)};
    }

    auto steps = solve_to_fixpoint(grid, constraints);
    Grid final_grid = steps.empty() ? grid : steps.back().grid_after;

    SolveStatus status = SolveStatus::Stuck;
    if (stats_.contradiction) {
        status = SolveStatus::Contradiction;
    } else if (is_solved(final_grid, constraints)) {
        status = SolveStatus::Solved;
    }
    return SolveReport{status, std::move(steps), std::move(final_grid), {}};
}

StepResult next_step(const Grid& grid, const ConstraintSet& constraints) {
    Solver solver;
    return solver.next_step(grid, constraints);
}

std::vector<Step> solve_to_fixpoint(const Grid& grid, const ConstraintSet& constraints) {
    Solver solver;
    return solver.solve_to_fixpoint(grid, constraints);
}

} // namespace tango_logic
