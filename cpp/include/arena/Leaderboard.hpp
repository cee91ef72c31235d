#pragma once

#include "arena/EloCalculator.hpp"
#include "arena/GameResult.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace arena {

/*
 * Display tables derived from the recorded games: ELO standings and the game history.
 */
class Leaderboard {
 public:
  struct Standing {
    bool operator==(const Standing&) const = default;

    std::string name;
    int rating;  // rounded
  };

  struct HistoryRow {
    bool operator==(const HistoryRow&) const = default;

    std::string when;  // "YYYY-mm-dd HH:MM:SS" (UTC)
    std::string red_agent;
    std::string yellow_agent;
    std::string winner;  // "Red" / "Yellow" / "Draw"
  };

  Leaderboard(const std::vector<GameResult>& games, bool include_self_play = false);

  /*
   * Sorted by rating, highest first (ties by name). If offered is non-null, only names in it are
   * listed.
   */
  std::vector<Standing> standings(const std::vector<std::string>* offered = nullptr) const;

  // Newest first
  std::vector<HistoryRow> history() const;

  void print(std::ostream& os, const std::vector<std::string>* offered = nullptr) const;

  const ratings_map_t& ratings() const { return ratings_; }

 private:
  std::vector<GameResult> games_;  // chronological
  ratings_map_t ratings_;
};

}  // namespace arena
