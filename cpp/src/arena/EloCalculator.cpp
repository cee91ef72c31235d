#include "arena/EloCalculator.hpp"

#include <algorithm>
#include <cmath>

namespace arena {

double EloCalculator::rating(const std::string& name) const {
  auto it = ratings_.find(name);
  return it == ratings_.end() ? default_rating_ : it->second;
}

double EloCalculator::expected_score(double rating_a, double rating_b) {
  return 1.0 / (1.0 + std::pow(10.0, (rating_b - rating_a) / 400.0));
}

void EloCalculator::update(const std::string& name_a, const std::string& name_b, double score_a,
                           double score_b) {
  double rating_a = rating(name_a);
  double rating_b = rating(name_b);

  double expected_a = expected_score(rating_a, rating_b);
  double expected_b = 1.0 - expected_a;

  ratings_[name_a] = rating_a + k_factor_ * (score_a - expected_a);
  ratings_[name_b] = rating_b + k_factor_ * (score_b - expected_b);
}

ratings_map_t compute_ratings(const std::vector<GameResult>& results, bool exclude_self_play) {
  std::vector<GameResult> ordered = results;
  std::stable_sort(ordered.begin(), ordered.end(),
                   [](const GameResult& a, const GameResult& b) { return a.when < b.when; });

  EloCalculator calculator;
  for (const GameResult& result : ordered) {
    if (exclude_self_play && result.red_agent == result.yellow_agent) continue;

    double red_score = 0.5;
    double yellow_score = 0.5;
    if (result.red_won && !result.yellow_won) {
      red_score = 1.0;
      yellow_score = 0.0;
    } else if (result.yellow_won && !result.red_won) {
      red_score = 0.0;
      yellow_score = 1.0;
    }
    calculator.update(result.red_agent, result.yellow_agent, red_score, yellow_score);
  }
  return calculator.ratings();
}

}  // namespace arena
