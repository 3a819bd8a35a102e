/**
 * @file cell.hpp
 * @brief セル値（Empty / Sun / Moon）と座標
 */
#ifndef TANGO_LOGIC_CELL_HPP
#define TANGO_LOGIC_CELL_HPP

#include <cstddef>
#include <string>

namespace tango_logic {

/**
 * @brief セルの状態
 */
enum class Cell {
    Empty,
    Sun,
    Moon
};

/**
 * @brief 反対の記号を取得（Sun <-> Moon）
 * @note Empty に対しては Empty を返す
 */
Cell opposite(Cell cell);

/**
 * @brief 表示名を取得（"Sun" / "Moon" / "Empty"）
 */
std::string symbol_name(Cell cell);

/**
 * @brief 複数形の表示名を取得（"suns" / "moons"）
 */
std::string symbol_plural(Cell cell);

/**
 * @brief 1文字表現を取得（'S' / 'M' / '.'）
 */
char symbol_char(Cell cell);

/**
 * @brief グリッド上の座標（0-indexed）
 */
struct Coord {
    size_t row = 0;
    size_t col = 0;

    bool operator==(const Coord& other) const {
        return row == other.row && col == other.col;
    }

    bool operator!=(const Coord& other) const {
        return !(*this == other);
    }

    // 行優先の順序（制約端点の正規化に使用）
    bool operator<(const Coord& other) const {
        return row < other.row || (row == other.row && col < other.col);
    }
};

/**
 * @brief 表示用の座標文字列 "(r,c)" を取得（1-indexed）
 */
std::string to_display(const Coord& coord);

} // namespace tango_logic

#endif // TANGO_LOGIC_CELL_HPP
