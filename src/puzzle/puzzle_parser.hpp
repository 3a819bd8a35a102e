/**
 * @file puzzle_parser.hpp
 * @brief .tango ファイル / 文字列の読み込み
 */
#ifndef TANGO_LOGIC_PUZZLE_PARSER_HPP
#define TANGO_LOGIC_PUZZLE_PARSER_HPP

#include "tango_logic/puzzle/model.hpp"
#include <memory>
#include <string>

namespace tango_logic {
namespace puzzle {

/**
 * @brief パズルファイルを読み込む
 *
 * 宣言を記録するだけで、グリッドへの変換は Model::to_grid() で行う。
 *
 * @throws std::runtime_error ファイルを開けない、または構文エラー（"Parse error: line N: ..."）
 */
std::unique_ptr<Model> parse_file(const std::string& filename);

/**
 * @brief 文字列からパズルを読み込む
 * @throws std::runtime_error 構文エラー
 */
std::unique_ptr<Model> parse_string(const std::string& input);

} // namespace puzzle
} // namespace tango_logic

#endif // TANGO_LOGIC_PUZZLE_PARSER_HPP
