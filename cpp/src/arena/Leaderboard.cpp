#include "arena/Leaderboard.hpp"

#include "util/StringUtil.hpp"

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <ctime>

namespace arena {

namespace {

std::string format_when(const GameResult::time_point_t& when) {
  std::time_t t = std::chrono::system_clock::to_time_t(when);
  return fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::gmtime(t));
}

void print_table(std::ostream& os, const std::vector<std::vector<std::string>>& rows) {
  std::vector<size_t> widths;
  for (const auto& row : rows) {
    widths.resize(std::max(widths.size(), row.size()), 0);
    for (size_t c = 0; c < row.size(); ++c) {
      widths[c] = std::max(widths[c], util::terminal_width(row[c]));
    }
  }

  for (const auto& row : rows) {
    std::string line;
    for (size_t c = 0; c < row.size(); ++c) {
      line += c + 1 < row.size() ? util::pad_right(row[c], widths[c] + 2) : row[c];
    }
    os << line << '\n';
  }
}

}  // namespace

Leaderboard::Leaderboard(const std::vector<GameResult>& games, bool include_self_play)
    : games_(games), ratings_(compute_ratings(games, !include_self_play)) {
  std::stable_sort(games_.begin(), games_.end(),
                   [](const GameResult& a, const GameResult& b) { return a.when < b.when; });
}

std::vector<Leaderboard::Standing> Leaderboard::standings(
  const std::vector<std::string>* offered) const {
  std::vector<Standing> out;
  for (const auto& [name, rating] : ratings_) {
    if (offered && std::find(offered->begin(), offered->end(), name) == offered->end()) continue;
    out.push_back(Standing{name, static_cast<int>(std::lround(rating))});
  }
  std::stable_sort(out.begin(), out.end(),
                   [](const Standing& a, const Standing& b) { return a.rating > b.rating; });
  return out;
}

std::vector<Leaderboard::HistoryRow> Leaderboard::history() const {
  std::vector<HistoryRow> out;
  for (auto it = games_.rbegin(); it != games_.rend(); ++it) {
    out.push_back(HistoryRow{format_when(it->when), it->red_agent, it->yellow_agent,
                             it->winner_str()});
  }
  return out;
}

void Leaderboard::print(std::ostream& os, const std::vector<std::string>* offered) const {
  std::vector<std::vector<std::string>> rating_rows{{"Player", "ELO"}};
  for (const Standing& s : standings(offered)) {
    rating_rows.push_back({s.name, std::to_string(s.rating)});
  }
  os << "Leaderboard\n\n";
  print_table(os, rating_rows);

  std::vector<std::vector<std::string>> history_rows{
    {"When", "Red Player", "Yellow Player", "Winner"}};
  for (const HistoryRow& row : history()) {
    history_rows.push_back({row.when, row.red_agent, row.yellow_agent, row.winner});
  }
  os << "\nGames\n\n";
  print_table(os, history_rows);
}

}  // namespace arena
