#include <catch2/catch_test_macros.hpp>
#include "tango_logic/rule.hpp"
#include "tango_logic/solver.hpp"
#include "test_util.hpp"
#include <algorithm>

using namespace tango_logic;
using tango_logic::test::make_grid;
using tango_logic::test::grid_with_first_row;

namespace {

bool affected_contains(const Step& step, const Coord& coord) {
    return std::find(step.affected_cells.begin(), step.affected_cells.end(), coord) !=
           step.affected_cells.end();
}

} // namespace

// ============================================================================
// NoThreeRule tests
// ============================================================================

TEST_CASE("NoThreeRule basic", "[rule][no_three]") {
    NoThreeRule rule;
    ConstraintSet none;

    SECTION("pair followed by empty cell") {
        auto result = rule.apply(grid_with_first_row("SS...."), none);
        REQUIRE(has_step(result));
        const auto& step = get_step(result);
        REQUIRE(step.rule_name == "No-Three Rule");
        REQUIRE(step.result_cell == Coord{0, 2});
        REQUIRE(step.result_value == Cell::Moon);
        REQUIRE(affected_contains(step, Coord{0, 0}));
        REQUIRE(affected_contains(step, Coord{0, 1}));
    }

    SECTION("pair preceded by empty cell") {
        auto result = rule.apply(grid_with_first_row("...MM."), none);
        REQUIRE(has_step(result));
        REQUIRE(get_step(result).result_cell == Coord{0, 2});
        REQUIRE(get_step(result).result_value == Cell::Sun);
    }

    SECTION("vertical pair") {
        Grid grid = make_grid({
            "......",
            "......",
            "......",
            "......",
            "S.....",
            "S.....",
        });
        auto result = rule.apply(grid, none);
        REQUIRE(has_step(result));
        REQUIRE(get_step(result).result_cell == Coord{3, 0});
        REQUIRE(get_step(result).result_value == Cell::Moon);
    }

    SECTION("no pair") {
        REQUIRE(!has_step(rule.apply(grid_with_first_row("S.M.S."), none)));
    }
}

TEST_CASE("NoThreeRule skips a full column", "[rule][no_three]") {
    NoThreeRule rule;
    // (0,1) would be Moon, but column 1 already holds three moons
    Grid grid = make_grid({
        "..SS..",
        ".M....",
        "......",
        ".M....",
        "......",
        ".M....",
    });
    auto result = rule.apply(grid, ConstraintSet());
    REQUIRE(has_step(result));
    REQUIRE(get_step(result).result_cell == Coord{0, 4});
    REQUIRE(get_step(result).result_value == Cell::Moon);
}

// ============================================================================
// ParityRule tests
// ============================================================================

TEST_CASE("ParityRule fills a saturated row one cell per call", "[rule][parity]") {
    Grid grid = grid_with_first_row("SSSM..");
    ConstraintSet none;

    auto first = next_step(grid, none);
    REQUIRE(has_step(first));
    REQUIRE(get_step(first).rule_name == "Parity Rule");
    REQUIRE(get_step(first).result_cell == Coord{0, 4});
    REQUIRE(get_step(first).result_value == Cell::Moon);

    Grid after = get_step(first).grid_after;
    auto second = next_step(after, none);
    REQUIRE(has_step(second));
    REQUIRE(get_step(second).rule_name == "Parity Rule");
    REQUIRE(get_step(second).result_cell == Coord{0, 5});
    REQUIRE(get_step(second).result_value == Cell::Moon);
}

TEST_CASE("ParityRule on a column", "[rule][parity]") {
    ParityRule rule;
    Grid grid = make_grid({
        "..M...",
        "......",
        "..M...",
        "......",
        "..M...",
        "......",
    });
    auto result = rule.apply(grid, ConstraintSet());
    REQUIRE(has_step(result));
    const auto& step = get_step(result);
    REQUIRE(step.result_cell == Coord{1, 2});
    REQUIRE(step.result_value == Cell::Sun);
    REQUIRE(step.affected_cells.size() == 3);
}

TEST_CASE("ParityRule needs a full count", "[rule][parity]") {
    ParityRule rule;
    REQUIRE(!has_step(rule.apply(grid_with_first_row("SS.M.."), ConstraintSet())));
}

// ============================================================================
// EdgeCaseRule tests
// ============================================================================

TEST_CASE("EdgeCaseRule", "[rule][edge_case]") {
    EdgeCaseRule rule;
    ConstraintSet none;

    SECTION("next to the first end") {
        auto result = rule.apply(grid_with_first_row("S....S"), none);
        REQUIRE(has_step(result));
        REQUIRE(get_step(result).result_cell == Coord{0, 1});
        REQUIRE(get_step(result).result_value == Cell::Moon);
        REQUIRE(get_step(result).rule_name == "Edge Case Rule");
    }

    SECTION("next to the last end") {
        auto result = rule.apply(grid_with_first_row("SM...S"), none);
        REQUIRE(has_step(result));
        REQUIRE(get_step(result).result_cell == Coord{0, 4});
        REQUIRE(get_step(result).result_value == Cell::Moon);
    }

    SECTION("different ends") {
        REQUIRE(!has_step(rule.apply(grid_with_first_row("S....M"), none)));
    }

    SECTION("longer lines leave room") {
        REQUIRE(!has_step(rule.apply(grid_with_first_row("S......S"), none)));
    }
}

// ============================================================================
// GapRule tests
// ============================================================================

TEST_CASE("GapRule", "[rule][gap]") {
    GapRule rule;
    ConstraintSet none;

    SECTION("row gap") {
        auto result = rule.apply(grid_with_first_row("S.S..."), none);
        REQUIRE(has_step(result));
        REQUIRE(get_step(result).rule_name == "Gap Rule");
        REQUIRE(get_step(result).result_cell == Coord{0, 1});
        REQUIRE(get_step(result).result_value == Cell::Moon);
    }

    SECTION("column gap") {
        Grid grid = make_grid({
            "......",
            "...M..",
            "......",
            "...M..",
            "......",
            "......",
        });
        auto result = rule.apply(grid, none);
        REQUIRE(has_step(result));
        REQUIRE(get_step(result).result_cell == Coord{2, 3});
        REQUIRE(get_step(result).result_value == Cell::Sun);
    }

    SECTION("mixed ends") {
        REQUIRE(!has_step(rule.apply(grid_with_first_row("S.M..."), none)));
    }
}

// ============================================================================
// TwoEqualsAtEndRule tests
// ============================================================================

TEST_CASE("TwoEqualsAtEndRule", "[rule][two_equals_at_end]") {
    TwoEqualsAtEndRule rule;
    ConstraintSet none;

    SECTION("pair at the start") {
        auto result = rule.apply(grid_with_first_row("SS...."), none);
        REQUIRE(has_step(result));
        REQUIRE(get_step(result).rule_name == "Two-Equals-At-End Rule");
        REQUIRE(get_step(result).result_cell == Coord{0, 5});
        REQUIRE(get_step(result).result_value == Cell::Moon);
    }

    SECTION("pair at the end") {
        auto result = rule.apply(grid_with_first_row("....MM"), none);
        REQUIRE(has_step(result));
        REQUIRE(get_step(result).result_cell == Coord{0, 0});
        REQUIRE(get_step(result).result_value == Cell::Sun);
    }

    SECTION("longer lines leave room") {
        REQUIRE(!has_step(rule.apply(grid_with_first_row("SS......"), none)));
    }
}

// ============================================================================
// SecondToLastEqualsFirstRule tests
// ============================================================================

TEST_CASE("SecondToLastEqualsFirstRule", "[rule][second_to_last]") {
    SecondToLastEqualsFirstRule rule;
    ConstraintSet none;

    SECTION("first and second to last") {
        auto result = rule.apply(grid_with_first_row("S...S."), none);
        REQUIRE(has_step(result));
        REQUIRE(get_step(result).rule_name == "Second-To-Last-Equals-First Rule");
        REQUIRE(get_step(result).result_cell == Coord{0, 5});
        REQUIRE(get_step(result).result_value == Cell::Moon);
    }

    SECTION("mirrored") {
        auto result = rule.apply(grid_with_first_row(".M...M"), none);
        REQUIRE(has_step(result));
        REQUIRE(get_step(result).result_cell == Coord{0, 0});
        REQUIRE(get_step(result).result_value == Cell::Sun);
    }

    SECTION("longer lines leave room") {
        // S . . . . . S S is still completable: S M M S M M S S
        REQUIRE(!has_step(rule.apply(grid_with_first_row("S.....S."), none)));
        REQUIRE(!has_step(rule.apply(grid_with_first_row(".M.....M"), none)));
    }

    SECTION("longer line where a fourth sun is fatal") {
        // S . S . . . S S would leave three moons for the middle three cells
        auto result = rule.apply(grid_with_first_row("S.S...S."), none);
        REQUIRE(has_step(result));
        REQUIRE(get_step(result).result_cell == Coord{0, 7});
        REQUIRE(get_step(result).result_value == Cell::Moon);
    }
}

// ============================================================================
// Rule output tests
// ============================================================================

TEST_CASE("Rules do not modify their input", "[rule]") {
    Grid grid = grid_with_first_row("SS....");
    Grid copy = grid;
    for (const auto& rule : default_rules()) {
        rule->apply(grid, ConstraintSet());
    }
    REQUIRE(grid == copy);
}

TEST_CASE("Step snapshots differ in one cell", "[rule][step]") {
    auto result = NoThreeRule().apply(grid_with_first_row("SS...."), ConstraintSet());
    REQUIRE(has_step(result));
    const auto& step = get_step(result);
    REQUIRE(step.grid_before.is_empty(step.result_cell));
    REQUIRE(step.grid_after.at(step.result_cell) == Cell::Moon);
    REQUIRE(step.grid_before.empty_count() == step.grid_after.empty_count() + 1);
    REQUIRE(apply_step(step.grid_before, step) == step.grid_after);
    REQUIRE(!step.explanation.empty());
    REQUIRE(step.describe().rfind("No-Three Rule: ", 0) == 0);
}

TEST_CASE("default_rules priority order", "[rule]") {
    auto rules = default_rules();
    REQUIRE(rules.size() == 10);
    REQUIRE(rules[0]->name() == "No-Three Rule");
    REQUIRE(rules[1]->name() == "Parity Rule");
    REQUIRE(rules[2]->name() == "Constraint Propagation Rule");
    REQUIRE(rules[3]->name() == "Edge Case Rule");
    REQUIRE(rules[4]->name() == "Gap Rule");
    REQUIRE(rules[5]->name() == "Two-Equals-At-End Rule");
    REQUIRE(rules[6]->name() == "Second-To-Last-Equals-First Rule");
    REQUIRE(rules[7]->name() == "Modifier Balance Rule");
    REQUIRE(rules[8]->name() == "End-With-Equals-Constraint Rule");
    REQUIRE(rules[9]->name() == "Adjacent-Equals-Constraint Rule");
}
