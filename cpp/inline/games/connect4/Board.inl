#include "games/connect4/Board.hpp"

#include <bit>

namespace c4 {

inline int Board::height(column_t col) const {
  return std::popcount((masks_[kRed] | masks_[kYellow]) & column_mask(col));
}

inline int Board::num_pieces() const { return std::popcount(masks_[kRed] | masks_[kYellow]); }

inline bool Board::is_legal(column_t col) const {
  return col >= 0 && col < kNumColumns && height(col) < kNumRows;
}

inline color_t Board::get(row_t row, column_t col) const {
  mask_t bit = mask_t(1) << to_bit_index(row, col);
  if (masks_[kRed] & bit) return kRed;
  if (masks_[kYellow] & bit) return kYellow;
  return kEmpty;
}

}  // namespace c4
