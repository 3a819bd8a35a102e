#include <catch2/catch_test_macros.hpp>
#include "tango_logic/solver.hpp"
#include "test_util.hpp"
#include <stdexcept>

using namespace tango_logic;
using tango_logic::test::make_grid;
using tango_logic::test::grid_with_first_row;
using tango_logic::test::solved_6x6;

namespace {

// Always re-sets (0,0) to Sun, so the grid never changes
class RepeatRule : public Rule {
public:
    std::string name() const override { return "Repeat Rule"; }

    StepResult apply(const Grid& grid, const ConstraintSet& /*constraints*/) const override {
        return found(grid, "(1,1) is Sun again.", {}, Coord{0, 0}, Cell::Sun);
    }
};

} // namespace

// ============================================================================
// next_step tests
// ============================================================================

TEST_CASE("next_step on an empty grid", "[solver]") {
    auto result = next_step(Grid(6), ConstraintSet());
    REQUIRE(!has_step(result));
    REQUIRE(std::holds_alternative<NoForcedMove>(result));
}

TEST_CASE("next_step picks the highest priority rule", "[solver]") {
    // No-Three and Two-Equals-At-End both apply; No-Three wins
    auto result = next_step(grid_with_first_row("SS...."), ConstraintSet());
    REQUIRE(has_step(result));
    REQUIRE(get_step(result).rule_name == "No-Three Rule");
    REQUIRE(get_step(result).result_cell == Coord{0, 2});
    REQUIRE(get_step(result).result_value == Cell::Moon);
}

TEST_CASE("next_step does not modify its input", "[solver]") {
    Grid grid = grid_with_first_row("SS....");
    Grid copy = grid;
    next_step(grid, ConstraintSet());
    REQUIRE(grid == copy);
}

TEST_CASE("next_step rejects out-of-range constraints", "[solver]") {
    ConstraintSet constraints;
    constraints.add_equals(Coord{0, 5}, Coord{0, 6});
    REQUIRE_THROWS_AS(next_step(grid_with_first_row("S....."), constraints),
                      std::invalid_argument);
}

TEST_CASE("Solver stats for next_step", "[solver]") {
    Solver solver;
    auto result = solver.next_step(grid_with_first_row("S.S..."), ConstraintSet());
    REQUIRE(has_step(result));
    REQUIRE(solver.stats().dispatch_count == 1);
    REQUIRE(solver.stats().step_count == 1);
    REQUIRE(solver.stats().rule_fire_counts.size() == 10);
    REQUIRE(solver.stats().rule_fire_counts[4] == 1);  // Gap Rule
}

// ============================================================================
// solve_to_fixpoint tests
// ============================================================================

TEST_CASE("solve_to_fixpoint completes a column-determined grid", "[solver][fixpoint]") {
    Grid grid = solved_6x6();
    for (size_t c = 0; c < 6; ++c) {
        grid.set(Coord{0, c}, Cell::Empty);
    }

    auto steps = solve_to_fixpoint(grid, ConstraintSet());
    REQUIRE(steps.size() == 6);
    REQUIRE(steps.front().grid_before == grid);
    REQUIRE(steps.back().grid_after == solved_6x6());
    for (size_t i = 1; i < steps.size(); ++i) {
        REQUIRE(steps[i].grid_before == steps[i - 1].grid_after);
    }
}

TEST_CASE("solve_to_fixpoint stops when no rule applies", "[solver][fixpoint]") {
    Grid grid = grid_with_first_row("S.....");
    auto steps = solve_to_fixpoint(grid, ConstraintSet());
    REQUIRE(steps.empty());
    REQUIRE(!has_step(next_step(grid, ConstraintSet())));
}

TEST_CASE("solve_to_fixpoint on a complete grid", "[solver][fixpoint]") {
    REQUIRE(solve_to_fixpoint(solved_6x6(), ConstraintSet()).empty());
}

TEST_CASE("solve_to_fixpoint result is a fixpoint", "[solver][fixpoint]") {
    Grid grid = grid_with_first_row("SS.M..");
    auto steps = solve_to_fixpoint(grid, ConstraintSet());
    REQUIRE(!steps.empty());
    REQUIRE(!has_step(next_step(steps.back().grid_after, ConstraintSet())));
}

TEST_CASE("solve_to_fixpoint iteration limit", "[solver][fixpoint]") {
    Solver solver({std::make_shared<RepeatRule>()});
    REQUIRE_THROWS_AS(solver.solve_to_fixpoint(grid_with_first_row("S....."), ConstraintSet()),
                      std::logic_error);
}

TEST_CASE("solve_to_fixpoint stops before a contradiction", "[solver][fixpoint]") {
    // Propagation forces (0,1) to Sun, which makes three suns in a row
    ConstraintSet constraints;
    constraints.add_equals(Coord{0, 0}, Coord{0, 1});

    Solver solver;
    auto steps = solver.solve_to_fixpoint(grid_with_first_row("S.S..."), constraints);
    REQUIRE(steps.empty());
    REQUIRE(solver.stats().contradiction);
}

// ============================================================================
// solve tests
// ============================================================================

TEST_CASE("solve reports Solved", "[solver][solve]") {
    Grid grid = solved_6x6();
    grid.set(Coord{0, 0}, Cell::Empty);

    Solver solver;
    auto report = solver.solve(grid, ConstraintSet());
    REQUIRE(report.status == SolveStatus::Solved);
    REQUIRE(report.steps.size() == 1);
    REQUIRE(report.steps[0].rule_name == "Parity Rule");
    REQUIRE(report.steps[0].result_cell == Coord{0, 0});
    REQUIRE(report.steps[0].result_value == Cell::Sun);
    REQUIRE(report.final_grid == solved_6x6());
    REQUIRE(report.violations.empty());
    REQUIRE(solver.stats().rule_fire_counts[1] == 1);
}

TEST_CASE("solve reports AlreadySolved", "[solver][solve]") {
    auto report = Solver().solve(solved_6x6(), ConstraintSet());
    REQUIRE(report.status == SolveStatus::AlreadySolved);
    REQUIRE(report.steps.empty());
    REQUIRE(report.final_grid == solved_6x6());
}

TEST_CASE("solve reports IllegalStart", "[solver][solve]") {
    SECTION("constraint violation") {
        ConstraintSet constraints;
        constraints.add_not_equals(Coord{0, 0}, Coord{0, 1});
        auto report = Solver().solve(grid_with_first_row("SS...."), constraints);
        REQUIRE(report.status == SolveStatus::IllegalStart);
        REQUIRE(report.steps.empty());
        REQUIRE(report.violations.size() == 1);
        REQUIRE(report.violations[0] ==
                "Constraint violation: Cells (1,1) and (1,2) must be different but have the same value");
    }

    SECTION("empty grid") {
        auto report = Solver().solve(Grid(6), ConstraintSet());
        REQUIRE(report.status == SolveStatus::IllegalStart);
        REQUIRE(report.violations[0] == "Grid cannot be completely empty");
    }
}

TEST_CASE("solve reports Stuck", "[solver][solve]") {
    Grid grid = grid_with_first_row("S.....");
    auto report = Solver().solve(grid, ConstraintSet());
    REQUIRE(report.status == SolveStatus::Stuck);
    REQUIRE(report.steps.empty());
    REQUIRE(report.final_grid == grid);
}

TEST_CASE("solve reports Contradiction", "[solver][solve]") {
    ConstraintSet constraints;
    constraints.add_equals(Coord{0, 0}, Coord{0, 1});
    Grid grid = grid_with_first_row("S.S...");

    auto report = Solver().solve(grid, constraints);
    REQUIRE(report.status == SolveStatus::Contradiction);
    REQUIRE(report.steps.empty());
    REQUIRE(report.final_grid == grid);
}

TEST_CASE("SolveStatus names", "[solver]") {
    REQUIRE(to_string(SolveStatus::Solved) == "SOLVED");
    REQUIRE(to_string(SolveStatus::Stuck) == "STUCK");
    REQUIRE(to_string(SolveStatus::AlreadySolved) == "ALREADY SOLVED");
    REQUIRE(to_string(SolveStatus::IllegalStart) == "ILLEGAL");
    REQUIRE(to_string(SolveStatus::Contradiction) == "CONTRADICTION");
}
