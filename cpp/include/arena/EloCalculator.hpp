#pragma once

#include "arena/GameResult.hpp"

#include <map>
#include <string>
#include <vector>

namespace arena {

using ratings_map_t = std::map<std::string, double>;

/*
 * Standard logistic ELO:
 *
 * expected_a = 1 / (1 + 10^((rating_b - rating_a) / 400))
 * new_rating_a = rating_a + k * (score_a - expected_a)
 */
class EloCalculator {
 public:
  static constexpr double kDefaultKFactor = 32;
  static constexpr double kDefaultRating = 1000;

  EloCalculator(double k_factor = kDefaultKFactor, double default_rating = kDefaultRating)
      : k_factor_(k_factor), default_rating_(default_rating) {}

  // default_rating for a name not seen yet
  double rating(const std::string& name) const;

  static double expected_score(double rating_a, double rating_b);

  /*
   * Scores are 1 for a win, 0.5 for a draw and 0 for a loss. Both new ratings are computed from
   * the ratings before this update.
   */
  void update(const std::string& name_a, const std::string& name_b, double score_a,
              double score_b);

  const ratings_map_t& ratings() const { return ratings_; }

 private:
  const double k_factor_;
  const double default_rating_;
  ratings_map_t ratings_;
};

/*
 * Replays results, in order of GameResult::when (ties keep their order in results), from default
 * ratings. A red-only win scores (1, 0), a yellow-only win (0, 1), anything else (0.5, 0.5).
 *
 * With exclude_self_play, games whose two agents are the same are skipped entirely.
 */
ratings_map_t compute_ratings(const std::vector<GameResult>& results,
                              bool exclude_self_play = true);

}  // namespace arena
