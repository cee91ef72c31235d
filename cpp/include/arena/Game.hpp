#pragma once

#include "arena/AgentRegistry.hpp"
#include "arena/GameResult.hpp"
#include "arena/Player.hpp"
#include "arena/ResultStore.hpp"
#include "games/connect4/Board.hpp"
#include "games/connect4/Constants.hpp"

#include <cstddef>
#include <iterator>
#include <memory>
#include <string>

namespace arena {

/*
 * One Board and the two Players bound to it. reset() replaces the Board and keeps the Players (and
 * so their agents).
 *
 * Headless use:
 *
 * for (const Game::Snapshot& snapshot : game.run(store)) {
 *   c4::IO::print_state(std::cout, snapshot.board);
 * }
 *
 * The registry passed to the constructor must outlive the Game.
 */
class Game {
 public:
  struct Snapshot {
    c4::Board board;
    std::string status;
    bool final = false;     // true only for the element produced after the result was recorded
    bool recorded = false;  // whether the store accepted the result (final element only)
  };

  class Run;

  Game(const AgentRegistry& registry, const std::string& red_agent,
       const std::string& yellow_agent, int max_tokens = 3000);

  const c4::Board& board() const { return board_; }
  Player& player(c4::color_t color) { return *players_[color]; }
  const Player& player(c4::color_t color) const { return *players_[color]; }

  // The player to move takes one turn. The board must be active.
  void move();
  bool is_active() const { return board_.is_active(); }
  void reset();

  std::string status() const;
  std::string thoughts(c4::color_t color) const { return player(color).thoughts(); }

  // See Player::switch_agent()
  void switch_agent(c4::color_t color, const std::string& agent_name);

  // The result of the finished game, stamped with the current time
  GameResult make_result() const;

  // Hands make_result() to store. Never throws; returns whether the store accepted it.
  bool record(ResultStore& store) const;

  /*
   * A lazily evaluated, single-pass sequence of snapshots. Pulling the first element resets the
   * game; each further element is produced by exactly one move(). Once the board is terminal,
   * one last element (final == true) is produced after the result has been recorded in store.
   *
   * Abandoning the iteration leaves the game where it is, with nothing recorded.
   */
  Run run(ResultStore& store);

  // Drains run(store), logging each snapshot, and returns the final one
  Snapshot play(ResultStore& store);

 private:
  Snapshot snapshot(bool final, bool recorded) const;

  c4::Board board_;
  std::unique_ptr<Player> players_[c4::kNumPlayers];
};

class Game::Run {
 public:
  class iterator {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Snapshot;
    using difference_type = std::ptrdiff_t;
    using pointer = const Snapshot*;
    using reference = const Snapshot&;

    iterator() = default;

    reference operator*() const { return run_->current_; }
    pointer operator->() const { return &run_->current_; }
    iterator& operator++();
    void operator++(int) { ++*this; }

    bool operator==(std::default_sentinel_t) const { return !run_ || run_->done_; }

   private:
    friend class Run;
    explicit iterator(Run* run) : run_(run) {}

    Run* run_ = nullptr;
  };

  iterator begin();
  std::default_sentinel_t end() const { return std::default_sentinel; }

 private:
  friend class Game;
  Run(Game& game, ResultStore& store) : game_(game), store_(store) {}

  void advance();

  Game& game_;
  ResultStore& store_;
  Snapshot current_;
  bool done_ = false;
};

}  // namespace arena
