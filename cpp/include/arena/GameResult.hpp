#pragma once

#include <boost/json.hpp>

#include <chrono>
#include <string>

namespace arena {

/*
 * Historical record of one finished game. red_won and yellow_won are both false for a draw.
 *
 * JSON form (when is microseconds since the Unix epoch):
 *
 * {"red_agent": "gpt-5", "yellow_agent": "claude-haiku-4-5", "red_won": true, "yellow_won": false,
 *  "when": 1760781600000000}
 */
struct GameResult {
  using time_point_t = std::chrono::system_clock::time_point;

  bool operator==(const GameResult&) const = default;

  std::string winner_str() const;  // "Red" / "Yellow" / "Draw"

  std::string red_agent;
  std::string yellow_agent;
  bool red_won = false;
  bool yellow_won = false;
  time_point_t when;
};

void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const GameResult& result);

// Throws std::exception (from boost::json accessors) if jv does not have the expected shape
GameResult tag_invoke(boost::json::value_to_tag<GameResult>, const boost::json::value& jv);

}  // namespace arena
