#include "tango_logic/puzzle/model.hpp"
#include "tango_logic/solver.hpp"
#include "puzzle_parser.hpp"
#include <cstring>
#include <iostream>
#include <string>

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [-1] [-q] [-s] [-v] <file.tango>\n";
    std::cerr << "  -1      Single step: print the next forced move and the resulting puzzle\n";
    std::cerr << "  -q      Quiet: do not list the steps, only the final grid\n";
    std::cerr << "  -s      Print solver statistics to stderr\n";
    std::cerr << "  -v      Verbose mode (print rule dispatch progress)\n";
}

bool g_print_stats = false;
bool g_verbose = false;
bool g_quiet = false;

void print_stats(const tango_logic::Solver& solver) {
    if (!g_print_stats) return;
    const auto& s = solver.stats();
    std::cerr << "% Stats: dispatches=" << s.dispatch_count
              << " steps=" << s.step_count;
    for (size_t i = 0; i < solver.rules().size(); ++i) {
        if (s.rule_fire_counts[i] > 0) {
            std::cerr << " [" << solver.rules()[i]->name() << "]=" << s.rule_fire_counts[i];
        }
    }
    std::cerr << "\n";
}

void print_step(size_t number, const tango_logic::Step& step) {
    std::cout << "Step " << number << ": " << step.rule_name << "\n";
    std::cout << "  " << step.explanation << "\n";
    std::cout << "  -> " << tango_logic::to_display(step.result_cell) << " = "
              << tango_logic::symbol_name(step.result_value) << "\n";
}

void print_status(tango_logic::SolveStatus status) {
    std::cout << "=====" << tango_logic::to_string(status) << "=====\n";
}

/**
 * @brief 固定点まで解いて全ステップを表示する
 */
void run_solve(const tango_logic::Grid& grid, const tango_logic::ConstraintSet& constraints) {
    tango_logic::Solver solver;
    solver.set_verbose(g_verbose);

    auto report = solver.solve(grid, constraints);
    print_stats(solver);

    if (report.status == tango_logic::SolveStatus::IllegalStart) {
        for (const auto& violation : report.violations) {
            std::cout << "% " << violation << "\n";
        }
        print_status(report.status);
        return;
    }

    if (!g_quiet) {
        for (size_t i = 0; i < report.steps.size(); ++i) {
            print_step(i + 1, report.steps[i]);
        }
    }
    std::cout << report.final_grid.to_string();
    print_status(report.status);
}

/**
 * @brief 次の1手だけを求め、適用後のパズルを .tango 形式で出力する
 */
void run_single_step(const tango_logic::Grid& grid, const tango_logic::ConstraintSet& constraints) {
    if (tango_logic::is_solved(grid, constraints)) {
        print_status(tango_logic::SolveStatus::AlreadySolved);
        return;
    }
    auto validation = tango_logic::validate_start(grid, constraints);
    if (!validation.valid) {
        for (const auto& violation : validation.violations) {
            std::cout << "% " << violation << "\n";
        }
        print_status(tango_logic::SolveStatus::IllegalStart);
        return;
    }

    tango_logic::Solver solver;
    solver.set_verbose(g_verbose);

    auto result = solver.next_step(grid, constraints);
    print_stats(solver);

    if (!tango_logic::has_step(result)) {
        std::cout << "=====NO FORCED MOVE=====\n";
        return;
    }
    const auto& step = tango_logic::get_step(result);
    if (!g_quiet) {
        // 解説はコメント行として出力し、出力全体をそのまま次の入力にできるようにする
        std::cout << "% " << step.describe() << "\n";
    }
    std::cout << tango_logic::puzzle::format(step.grid_after, constraints);
}

int main(int argc, char* argv[]) {
    bool single_step = false;
    const char* filename = nullptr;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-1") == 0) {
            single_step = true;
        } else if (std::strcmp(argv[i], "-q") == 0) {
            g_quiet = true;
        } else if (std::strcmp(argv[i], "-s") == 0) {
            g_print_stats = true;
        } else if (std::strcmp(argv[i], "-v") == 0) {
            g_verbose = true;
        } else if (std::strcmp(argv[i], "-h") == 0 ||
                   std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-') {
            filename = argv[i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (!filename) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        auto model = tango_logic::puzzle::parse_file(filename);
        auto grid = model->to_grid();
        auto constraints = model->to_constraints();

        if (single_step) {
            run_single_step(grid, constraints);
        } else {
            run_solve(grid, constraints);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
