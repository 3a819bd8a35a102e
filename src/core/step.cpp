#include "tango_logic/step.hpp"
#include <stdexcept>

namespace tango_logic {

std::string Step::describe() const {
    return rule_name + ": " + explanation;
}

Step make_step(std::string rule_name, std::string explanation,
               std::vector<Coord> affected_cells,
               const Grid& grid_before, Coord result_cell, Cell result_value) {
    Grid grid_after = grid_before;
    grid_after.set(result_cell, result_value);
    return Step{std::move(rule_name), std::move(explanation), std::move(affected_cells),
                result_cell, result_value, grid_before, std::move(grid_after)};
}

Grid apply_step(const Grid& grid, const Step& step) {
    if (grid.size() != step.grid_after.size()) {
        throw std::invalid_argument("Step for a " + std::to_string(step.grid_after.size()) +
                                    "x" + std::to_string(step.grid_after.size()) +
                                    " grid cannot be applied to a " +
                                    std::to_string(grid.size()) + "x" +
                                    std::to_string(grid.size()) + " grid");
    }
    Grid result = grid;
    result.set(step.result_cell, step.result_value);
    return result;
}

} // namespace tango_logic
