/**
 * @file model.hpp
 * @brief パズルファイル（.tango）の中間表現
 */
#ifndef TANGO_LOGIC_PUZZLE_MODEL_HPP
#define TANGO_LOGIC_PUZZLE_MODEL_HPP

#include "tango_logic/constraint.hpp"
#include <optional>
#include <string>
#include <vector>

namespace tango_logic {
namespace puzzle {

/**
 * @brief row 宣言（1行分のセル）
 */
struct RowDecl {
    std::vector<Cell> cells;
    int line = 0;  // ソース行番号
};

/**
 * @brief 座標（ファイル上の表記どおり 1-indexed）
 */
struct CoordDecl {
    long long row = 0;
    long long col = 0;
};

/**
 * @brief equals / not_equals 宣言
 */
struct ConstraintDecl {
    ConstraintKind kind = ConstraintKind::Equals;
    CoordDecl first;
    CoordDecl second;
    int line = 0;
};

/**
 * @brief パズルモデル
 *
 * パーサーは宣言をそのまま記録し、意味検査は to_grid() / to_constraints() で行う。
 */
class Model {
public:
    Model() = default;

    /**
     * @brief size 宣言を設定
     */
    void set_size(long long size, int line);

    /**
     * @brief row 宣言を追加
     */
    void add_row(RowDecl decl);

    /**
     * @brief 制約宣言を追加
     */
    void add_constraint_decl(ConstraintDecl decl);

    bool has_size() const { return size_.has_value(); }
    const std::vector<RowDecl>& rows() const { return rows_; }
    const std::vector<ConstraintDecl>& constraint_decls() const { return constraint_decls_; }

    /**
     * @brief グリッドに変換
     *
     * row 宣言が1つもなければ全セル Empty のグリッドになる。
     *
     * @throws std::runtime_error size 未宣言、サイズ不正、行数・行長の不一致
     */
    Grid to_grid() const;

    /**
     * @brief 制約集合に変換（0-indexed に直す）
     *
     * 重複する宣言は1つにまとめる。
     *
     * @throws std::runtime_error 座標がグリッド外、端点が同じセル
     */
    ConstraintSet to_constraints() const;

private:
    size_t checked_size() const;

    std::optional<long long> size_;
    int size_line_ = 0;
    std::vector<RowDecl> rows_;
    std::vector<ConstraintDecl> constraint_decls_;
};

/**
 * @brief グリッドと制約を .tango 形式で書き出す
 */
std::string format(const Grid& grid, const ConstraintSet& constraints);

} // namespace puzzle
} // namespace tango_logic

#endif // TANGO_LOGIC_PUZZLE_MODEL_HPP
