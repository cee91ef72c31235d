#include "games/connect4/IO.hpp"

#include "util/AnsiCodes.hpp"
#include "util/BoostUtil.hpp"
#include "util/Rendering.hpp"

#include <fmt/format.h>

#include <cctype>

namespace c4 {

std::string IO::color_name(color_t color) {
  switch (color) {
    case kRed:
      return "Red";
    case kYellow:
      return "Yellow";
    default:
      return "Empty";
  }
}

std::string IO::piece_name(color_t color) {
  switch (color) {
    case kRed:
      return "red";
    case kYellow:
      return "yellow";
    default:
      return "";
  }
}

column_t IO::parse_column(const std::string& s) {
  if (s.size() != 1) return -1;
  char c = std::toupper(static_cast<unsigned char>(s[0]));
  for (column_t col = 0; col < kNumColumns; ++col) {
    if (kColumnNames[col] == c) return col;
  }
  return -1;
}

boost::json::value IO::to_json(const Board& board) {
  boost::json::object obj;

  boost::json::array names;
  for (column_t col = 0; col < kNumColumns; ++col) {
    names.emplace_back(column_name(col));
  }
  obj["Column names"] = std::move(names);

  for (row_t row = kNumRows - 1; row >= 0; --row) {
    boost::json::array cells;
    for (column_t col = 0; col < kNumColumns; ++col) {
      cells.emplace_back(piece_name(board.get(row, col)));
    }
    obj[fmt::format("Row {}", row + 1)] = std::move(cells);
  }
  return obj;
}

std::string IO::json_text(const Board& board) { return boost_util::pretty_print(to_json(board)); }

std::string IO::alternative_text(const Board& board) {
  std::string text = " A B C D E F G\n";
  for (row_t row = kNumRows - 1; row >= 0; --row) {
    for (column_t col = 0; col < kNumColumns; ++col) {
      color_t color = board.get(row, col);
      text += color == kRed ? " R" : color == kYellow ? " Y" : " _";
    }
    text += '\n';
  }
  return text;
}

std::string IO::status(const Board& board) {
  if (board.winner() != kEmpty && board.is_forfeit()) {
    return fmt::format("{} wins after an illegal move by {}", color_name(board.winner()),
                       color_name(opponent(board.winner())));
  } else if (board.winner() != kEmpty) {
    return fmt::format("{} wins", color_name(board.winner()));
  } else if (board.is_draw()) {
    return "The game is a draw";
  }
  return fmt::format("{} to play", color_name(board.current_player()));
}

void IO::print_state(std::ostream& ss, const Board& board,
                     const player_name_array_t* player_names) {
  const Board::Move& last_move = board.last_move();
  if (util::Rendering::mode() == util::Rendering::kText && last_move.valid()) {
    ss << std::string(2 * last_move.column + 1, ' ') << "x\n";
  }

  for (row_t row = kNumRows - 1; row >= 0; --row) {
    ss << row_to_str(board, row);
  }
  ss << "|A|B|C|D|E|F|G|\n\n";
  if (player_names) {
    ss << fmt::format("{}{}{}: {}\n", ansi::kRed(""), ansi::kCircle("R"), ansi::kReset(""),
                      (*player_names)[kRed]);
    ss << fmt::format("{}{}{}: {}\n\n", ansi::kYellow(""), ansi::kCircle("Y"), ansi::kReset(""),
                      (*player_names)[kYellow]);
  }
  ss << status(board) << std::endl;
}

std::string IO::row_to_str(const Board& board, row_t row) {
  const Board::Move& last_move = board.last_move();
  column_t blink_column = last_move.row == row ? last_move.column : -1;

  std::string s;
  for (column_t col = 0; col < kNumColumns; ++col) {
    color_t color = board.get(row, col);
    bool occupied = color != kEmpty;

    const char* color_code = "";
    if (color == kRed) color_code = ansi::kRed("R");
    if (color == kYellow) color_code = ansi::kYellow("Y");
    const char* c = occupied ? ansi::kCircle("") : " ";

    s += fmt::format("|{}{}{}{}", col == blink_column ? ansi::kBlink("") : "", color_code, c,
                     occupied ? ansi::kReset("") : "");
  }
  s += "|\n";
  return s;
}

}  // namespace c4
