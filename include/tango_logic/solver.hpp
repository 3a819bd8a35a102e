/**
 * @file solver.hpp
 * @brief ルール駆動の推論ソルバー（1手ずつ / 固定点まで）
 */
#ifndef TANGO_LOGIC_SOLVER_HPP
#define TANGO_LOGIC_SOLVER_HPP

#include "tango_logic/rule.hpp"
#include "tango_logic/legality.hpp"
#include <string>
#include <vector>

namespace tango_logic {

/**
 * @brief solve() の結果の種類
 */
enum class SolveStatus {
    Solved,         // 完成し正解
    Stuck,          // 強制手がなくなった（解なしの証明ではない）
    AlreadySolved,  // 開始時点で既に正解
    IllegalStart,   // 開始局面が不正
    Contradiction   // ルールの帰結が構造規則に反した（解なし）
};

/**
 * @brief 表示用の名前を取得
 */
std::string to_string(SolveStatus status);

/**
 * @brief solve() の結果
 */
struct SolveReport {
    SolveStatus status = SolveStatus::Stuck;
    std::vector<Step> steps;
    Grid final_grid;
    std::vector<std::string> violations;  // IllegalStart のときのみ
};

/**
 * @brief ソルバー統計情報（直前の呼び出し分）
 */
struct SolverStats {
    size_t dispatch_count = 0;             // ルールエンジンの呼び出し回数
    size_t step_count = 0;                 // 記録したステップ数
    std::vector<size_t> rule_fire_counts;  // ルール順のヒット数
    bool contradiction = false;
};

/**
 * @brief ルール駆動の推論ソルバー
 *
 * 探索やバックトラックは行わない。ルールを優先順に試し、
 * 最初に適用できたルールで Empty セルを1つ確定する。
 * 入力はコピーしてから変更し、呼び出し間で盤面を保持しない。
 */
class Solver {
public:
    /**
     * @brief 既定の10ルールで作成
     */
    Solver();

    /**
     * @brief 任意のルール列（優先順）で作成
     */
    explicit Solver(std::vector<RulePtr> rules);

    /**
     * @brief 次の強制手を1つ求める
     * @return 見つかれば Step、なければ NoForcedMove
     * @throws std::invalid_argument 入力が整形式でない
     */
    StepResult next_step(const Grid& grid, const ConstraintSet& constraints);

    /**
     * @brief 固定点までルールを繰り返し適用する
     *
     * 完成するか、強制手がなくなるまで続ける。
     * 開始時に合法だった盤面が、あるステップで不正になった場合は
     * そのステップを記録せずに停止する（stats().contradiction）。
     *
     * @return 適用順のステップ列（空の場合あり）
     * @throws std::invalid_argument 入力が整形式でない
     * @throws std::logic_error 反復上限 2N^2 に未完成のまま到達（内部不変条件の破れ）
     */
    std::vector<Step> solve_to_fixpoint(const Grid& grid, const ConstraintSet& constraints);

    /**
     * @brief 開始局面の検査から固定点までをまとめて実行
     *
     * 既に正解 → AlreadySolved、開始局面が不正 → IllegalStart（violations 付き）、
     * それ以外は solve_to_fixpoint() の結果から Solved / Stuck / Contradiction。
     */
    SolveReport solve(const Grid& grid, const ConstraintSet& constraints);

    /**
     * @brief ルール列を取得
     */
    const std::vector<RulePtr>& rules() const { return rules_; }

    /**
     * @brief 統計情報を取得
     */
    const SolverStats& stats() const { return stats_; }

    /**
     * @brief verbose モードを有効/無効にする
     */
    void set_verbose(bool enabled) { verbose_ = enabled; }

private:
    /**
     * @brief ルールを優先順に1回ディスパッチ
     */
    StepResult dispatch(const Grid& grid, const ConstraintSet& constraints);

    void reset_stats();

    std::vector<RulePtr> rules_;
    bool verbose_ = false;
    SolverStats stats_;
};

/**
 * @brief 既定ルールで次の強制手を1つ求める
 */
StepResult next_step(const Grid& grid, const ConstraintSet& constraints);

/**
 * @brief 既定ルールで固定点まで適用する
 */
std::vector<Step> solve_to_fixpoint(const Grid& grid, const ConstraintSet& constraints);

} // namespace tango_logic

#endif // TANGO_LOGIC_SOLVER_HPP
