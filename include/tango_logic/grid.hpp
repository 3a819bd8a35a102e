/**
 * @file grid.hpp
 * @brief N×N グリッドと行・列（Line）の表現
 */
#ifndef TANGO_LOGIC_GRID_HPP
#define TANGO_LOGIC_GRID_HPP

#include "tango_logic/cell.hpp"
#include <vector>
#include <string>

namespace tango_logic {

/**
 * @brief Line の種類
 */
enum class LineKind {
    Row,
    Column
};

/**
 * @brief グリッドの1行または1列
 *
 * ルールは行と列を区別せずに Line 上の位置 (0..length-1) で記述する。
 */
struct Line {
    LineKind kind = LineKind::Row;
    size_t index = 0;
    size_t length = 0;

    /**
     * @brief Line 上の位置をグリッド座標に変換
     */
    Coord at(size_t pos) const {
        return kind == LineKind::Row ? Coord{index, pos} : Coord{pos, index};
    }

    /**
     * @brief 座標がこの Line 上にあるか
     */
    bool contains(const Coord& coord) const {
        return kind == LineKind::Row ? coord.row == index : coord.col == index;
    }

    /**
     * @brief 座標の Line 上の位置を取得
     * @pre contains(coord)
     */
    size_t position_of(const Coord& coord) const {
        return kind == LineKind::Row ? coord.col : coord.row;
    }

    bool operator==(const Line& other) const {
        return kind == other.kind && index == other.index;
    }

    bool operator!=(const Line& other) const {
        return !(*this == other);
    }

    /**
     * @brief 表示名（"Row 3" / "Column 2"、1-indexed）
     */
    std::string label() const;

    /**
     * @brief 小文字の表示名（"row" / "column"）
     */
    std::string kind_name() const;
};

/**
 * @brief N×N のパズルグリッド（値型）
 *
 * N は 4 以上の偶数。コピーして使うことを前提とし、内部状態は持たない。
 */
class Grid {
public:
    /**
     * @brief 全セル Empty のグリッドを作成
     * @throws std::invalid_argument N が奇数、4 未満、または N*N が size_t に収まらない
     */
    explicit Grid(size_t size);

    /**
     * @brief 行データからグリッドを作成
     * @throws std::invalid_argument 正方形でない、またはサイズが不正
     */
    static Grid from_rows(const std::vector<std::vector<Cell>>& rows);

    /**
     * @brief グリッドを作成できるサイズか（4 以上の偶数で、N*N がオーバーフローしない）
     */
    static bool is_valid_size(size_t size);

    size_t size() const { return size_; }

    /**
     * @brief 1 Line あたりの各記号の上限（N/2）
     */
    size_t cap() const { return size_ / 2; }

    /**
     * @brief セル値を取得
     * @throws std::out_of_range 範囲外
     */
    Cell at(const Coord& coord) const;
    Cell at(size_t row, size_t col) const { return at(Coord{row, col}); }

    /**
     * @brief セル値を設定
     * @throws std::out_of_range 範囲外
     */
    void set(const Coord& coord, Cell value);

    bool contains(const Coord& coord) const {
        return coord.row < size_ && coord.col < size_;
    }

    bool is_empty(const Coord& coord) const { return at(coord) == Cell::Empty; }

    Line row(size_t index) const { return Line{LineKind::Row, index, size_}; }
    Line column(size_t index) const { return Line{LineKind::Column, index, size_}; }

    /**
     * @brief 全 Line を取得（全行を上から、その後全列を左から）
     */
    std::vector<Line> lines() const;

    /**
     * @brief Line 上のセル値を位置順に取得
     */
    std::vector<Cell> values(const Line& line) const;

    /**
     * @brief Line 上の指定値の個数
     */
    size_t count(const Line& line, Cell value) const;

    /**
     * @brief グリッド全体の指定値の個数
     */
    size_t count(Cell value) const;

    size_t empty_count() const { return count(Cell::Empty); }

    /**
     * @brief 各行を "S M . ..." 形式で連結した文字列
     */
    std::string to_string() const;

    bool operator==(const Grid& other) const {
        return size_ == other.size_ && cells_ == other.cells_;
    }

    bool operator!=(const Grid& other) const {
        return !(*this == other);
    }

private:
    size_t index_of(const Coord& coord) const;

    size_t size_;
    std::vector<Cell> cells_;
};

} // namespace tango_logic

#endif // TANGO_LOGIC_GRID_HPP
