#pragma once

#include "games/connect4/Constants.hpp"

#include <string>
#include <vector>

namespace c4 {

/*
 * The 7x6 Connect-Four board, as a state machine:
 *
 * Active --apply_move()--> Active | Won(color) | Draw
 * Active --declare_forfeit()--> Won(opponent of the player to move)
 *
 * Won and Draw are terminal. A new game starts from a freshly constructed Board.
 *
 * Bit order encoding for the piece masks:
 *
 *  5 13 21 29 37 45 53
 *  4 12 20 28 36 44 52
 *  3 11 19 27 35 43 51
 *  2 10 18 26 34 42 50
 *  1  9 17 25 33 41 49
 *  0  8 16 24 32 40 48
 *
 * Based on https://github.com/PascalPons/connect4. Bits 6 and 7 of each column byte are always
 * zero, which lets the win check shift masks without wrapping between columns.
 *
 * Rows and columns are 0-indexed: row 0 is the bottom row, column 0 is column "A".
 */
class Board {
 public:
  struct Move {
    bool valid() const { return column >= 0; }
    bool operator==(const Move&) const = default;

    column_t column = -1;
    row_t row = -1;
  };

  bool operator==(const Board&) const = default;

  // Number of pieces in the column, 0-6
  int height(column_t col) const;
  int num_pieces() const;
  bool is_full() const { return num_pieces() == kNumCells; }

  // A column is legal iff it is in range and not full. This depends only on the cells, not on
  // whether the game is still active.
  bool is_legal(column_t col) const;
  std::vector<column_t> legal_columns() const;    // left-to-right
  std::vector<column_t> illegal_columns() const;  // left-to-right
  std::vector<std::string> legal_column_names() const;
  std::vector<std::string> illegal_column_names() const;

  /*
   * Drops the current player's piece into col, then checks for a win or a draw. The current
   * player switches only if the game is still active afterwards.
   *
   * The board must be active and col must be legal; violating this throws
   * util::ReleaseAssertionError. Callers validate the column first.
   */
  void apply_move(column_t col);

  /*
   * Ends the game in favor of the opponent of the current player, who forfeits. The board must be
   * active.
   */
  void declare_forfeit();

  color_t get(row_t row, column_t col) const;
  color_t current_player() const { return current_player_; }
  color_t winner() const { return winner_; }
  bool is_draw() const { return draw_; }
  bool is_forfeit() const { return forfeit_; }
  bool is_active() const { return winner_ == kEmpty && !draw_; }
  const Move& last_move() const { return last_move_; }

 private:
  static bool has_four_in_a_row(mask_t mask);
  static constexpr int to_bit_index(row_t row, column_t col) { return 8 * col + row; }
  static constexpr mask_t column_mask(column_t col) { return mask_t(63) << (8 * col); }

  mask_t masks_[kNumPlayers] = {};  // indexed by color
  color_t current_player_ = kRed;
  color_t winner_ = kEmpty;
  bool draw_ = false;
  bool forfeit_ = false;
  Move last_move_;
};

}  // namespace c4

#include "inline/games/connect4/Board.inl"
