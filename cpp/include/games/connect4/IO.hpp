#pragma once

#include "games/connect4/Board.hpp"
#include "games/connect4/Constants.hpp"

#include <boost/json.hpp>

#include <array>
#include <ostream>
#include <string>

namespace c4 {

/*
 * Textual and structured views of a Board. All of these are side-effect free.
 */
struct IO {
  using player_name_array_t = std::array<std::string, kNumPlayers>;

  static std::string color_name(color_t color);  // "Red" / "Yellow"
  static std::string piece_name(color_t color);  // "red" / "yellow" / ""
  static std::string column_name(column_t col) { return std::string(1, kColumnNames[col]); }

  /*
   * Maps "A".."G" (case-insensitive) to 0..6. Returns -1 for anything else, including strings that
   * are not exactly one character long.
   */
  static column_t parse_column(const std::string& s);

  /*
   * {
   *     "Column names": ["A", "B", "C", "D", "E", "F", "G"],
   *     "Row 6": ["", "", "", "", "", "", ""],
   *     ...
   *     "Row 1": ["", "", "", "red", "yellow", "", ""]
   * }
   *
   * Rows are listed top-down, so that row 1 is the bottom of the board.
   */
  static boost::json::value to_json(const Board& board);
  static std::string json_text(const Board& board);

  /*
   *  A B C D E F G
   *  _ _ _ _ _ _ _
   *  ...
   *  _ _ _ R Y _ _
   */
  static std::string alternative_text(const Board& board);

  /*
   * "Red to play", "Yellow wins", "Red wins after an illegal move by Yellow",
   * "The game is a draw".
   */
  static std::string status(const Board& board);

  /*
   * Human-readable rendering with a blinking last move and colored pieces when writing to a
   * terminal (see util::Rendering).
   */
  static void print_state(std::ostream&, const Board& board,
                          const player_name_array_t* player_names = nullptr);

 private:
  static std::string row_to_str(const Board& board, row_t row);
};

}  // namespace c4
