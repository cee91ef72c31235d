#pragma once

#include <cstdint>

namespace c4 {

using column_t = int8_t;
using row_t = int8_t;
using mask_t = uint64_t;
using color_t = int8_t;

const int kNumColumns = 7;
const int kNumRows = 6;
const int kNumCells = kNumColumns * kNumRows;
const int kNumPlayers = 2;
const int kWinLength = 4;

const color_t kEmpty = -1;
const color_t kRed = 0;
const color_t kYellow = 1;

// Column i is named kColumnNames[i]
constexpr const char kColumnNames[] = "ABCDEFG";

inline constexpr color_t opponent(color_t color) { return 1 - color; }

}  // namespace c4
