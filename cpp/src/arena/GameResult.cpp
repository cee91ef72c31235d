#include "arena/GameResult.hpp"

#include "util/CppUtil.hpp"

namespace arena {

std::string GameResult::winner_str() const {
  if (red_won) return "Red";
  if (yellow_won) return "Yellow";
  return "Draw";
}

void tag_invoke(boost::json::value_from_tag, boost::json::value& jv, const GameResult& result) {
  jv = {{"red_agent", result.red_agent},
        {"yellow_agent", result.yellow_agent},
        {"red_won", result.red_won},
        {"yellow_won", result.yellow_won},
        {"when", util::us_since_epoch(result.when)}};
}

GameResult tag_invoke(boost::json::value_to_tag<GameResult>, const boost::json::value& jv) {
  const boost::json::object& obj = jv.as_object();

  GameResult result;
  result.red_agent = obj.at("red_agent").as_string();
  result.yellow_agent = obj.at("yellow_agent").as_string();
  result.red_won = obj.at("red_won").as_bool();
  result.yellow_won = obj.at("yellow_won").as_bool();
  result.when = util::from_us_since_epoch(obj.at("when").to_number<int64_t>());
  return result;
}

}  // namespace arena
