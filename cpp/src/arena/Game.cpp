#include "arena/Game.hpp"

#include "games/connect4/IO.hpp"
#include "util/Asserts.hpp"
#include "util/LoggingUtil.hpp"

#include <chrono>

namespace arena {

Game::Game(const AgentRegistry& registry, const std::string& red_agent,
           const std::string& yellow_agent, int max_tokens) {
  players_[c4::kRed] = std::make_unique<Player>(c4::kRed, registry, red_agent, max_tokens);
  players_[c4::kYellow] =
    std::make_unique<Player>(c4::kYellow, registry, yellow_agent, max_tokens);
}

void Game::move() {
  RELEASE_ASSERT(board_.is_active(), "move() on a finished game: {}", status());
  player(board_.current_player()).move(board_);
}

void Game::reset() { board_ = c4::Board(); }

std::string Game::status() const { return c4::IO::status(board_); }

void Game::switch_agent(c4::color_t color, const std::string& agent_name) {
  player(color).switch_agent(agent_name);
}

GameResult Game::make_result() const {
  GameResult result;
  result.red_agent = player(c4::kRed).agent_name();
  result.yellow_agent = player(c4::kYellow).agent_name();
  result.red_won = board_.winner() == c4::kRed;
  result.yellow_won = board_.winner() == c4::kYellow;
  result.when = std::chrono::system_clock::now();
  return result;
}

bool Game::record(ResultStore& store) const {
  GameResult result = make_result();
  bool recorded = store.record_game(result);
  if (recorded) {
    LOG_INFO("Recorded {} vs {}: {}", result.red_agent, result.yellow_agent, result.winner_str());
  } else {
    LOG_WARN("Game not recorded ({})", store.description());
  }
  return recorded;
}

Game::Run Game::run(ResultStore& store) { return Run(*this, store); }

Game::Snapshot Game::play(ResultStore& store) {
  Snapshot last;
  for (const Snapshot& snapshot : run(store)) {
    LOG_INFO("{}", snapshot.status);
    last = snapshot;
  }
  return last;
}

Game::Snapshot Game::snapshot(bool final, bool recorded) const {
  return Snapshot{board_, status(), final, recorded};
}

Game::Run::iterator& Game::Run::iterator::operator++() {
  run_->advance();
  return *this;
}

Game::Run::iterator Game::Run::begin() {
  game_.reset();
  current_ = game_.snapshot(false, false);
  done_ = false;
  return iterator(this);
}

void Game::Run::advance() {
  if (current_.final) {
    done_ = true;
  } else if (game_.is_active()) {
    game_.move();
    current_ = game_.snapshot(false, false);
  } else {
    bool recorded = game_.record(store_);
    current_ = game_.snapshot(true, recorded);
  }
}

}  // namespace arena
