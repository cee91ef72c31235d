#include "games/connect4/Board.hpp"

#include "util/Asserts.hpp"

namespace c4 {

std::vector<column_t> Board::legal_columns() const {
  std::vector<column_t> columns;
  for (column_t col = 0; col < kNumColumns; ++col) {
    if (is_legal(col)) columns.push_back(col);
  }
  return columns;
}

std::vector<column_t> Board::illegal_columns() const {
  std::vector<column_t> columns;
  for (column_t col = 0; col < kNumColumns; ++col) {
    if (!is_legal(col)) columns.push_back(col);
  }
  return columns;
}

std::vector<std::string> Board::legal_column_names() const {
  std::vector<std::string> names;
  for (column_t col : legal_columns()) names.emplace_back(1, kColumnNames[col]);
  return names;
}

std::vector<std::string> Board::illegal_column_names() const {
  std::vector<std::string> names;
  for (column_t col : illegal_columns()) names.emplace_back(1, kColumnNames[col]);
  return names;
}

void Board::apply_move(column_t col) {
  RELEASE_ASSERT(is_active(), "apply_move({}) on a finished game", col);
  RELEASE_ASSERT(is_legal(col), "Illegal column {}", col);

  row_t row = height(col);
  masks_[current_player_] |= mask_t(1) << to_bit_index(row, col);
  last_move_ = Move{col, row};

  if (has_four_in_a_row(masks_[current_player_])) {
    winner_ = current_player_;
  } else if (is_full()) {
    draw_ = true;
  } else {
    current_player_ = opponent(current_player_);
  }
}

void Board::declare_forfeit() {
  RELEASE_ASSERT(is_active(), "declare_forfeit() on a finished game");
  forfeit_ = true;
  winner_ = opponent(current_player_);
}

// Scans the whole mask, so the result depends only on the cells of one color and not on the
// order in which they were placed.
bool Board::has_four_in_a_row(mask_t mask) {
  constexpr int kShifts[] = {
    1,  // vertical
    8,  // horizontal
    7,  // nw-se diagonal
    9   // sw-ne diagonal
  };

  for (int shift : kShifts) {
    mask_t m = mask & (mask >> shift);
    if (m & (m >> (2 * shift))) return true;
  }
  return false;
}

}  // namespace c4
