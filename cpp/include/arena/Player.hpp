#pragma once

#include "arena/AgentClient.hpp"
#include "arena/AgentRegistry.hpp"
#include "games/connect4/Board.hpp"
#include "games/connect4/Constants.hpp"

#include <boost/json.hpp>

#include <string>

namespace arena {

/*
 * The four free-text fields of the most recent successful reply. Display only: they never affect
 * legality or outcome.
 */
struct Rationale {
  bool operator==(const Rationale&) const = default;

  std::string evaluation;
  std::string threats;
  std::string opportunities;
  std::string strategy;
};

/*
 * Binds a color to an agent, and implements the per-turn protocol:
 *
 * 1. Build a system/user prompt pair describing the board and the legal columns.
 * 2. Ask the agent (AgentClient::send() already retries transient failures).
 * 3. Parse the reply and validate the chosen column.
 * 4. Apply the move, or forfeit the game if step 3 failed.
 *
 * The registry passed to the constructor must outlive the Player.
 */
class Player {
 public:
  static constexpr const char* kMissingColumn = "missing";

  Player(c4::color_t color, const AgentRegistry& registry, const std::string& agent_name,
         int max_tokens = 3000);

  c4::color_t color() const { return color_; }
  const std::string& agent_name() const { return agent_->name(); }
  AgentClient& agent() const { return *agent_; }

  /*
   * Replaces the bound agent. Throws arena::UnsupportedAgentException for a name the registry
   * does not offer, in which case the previous agent stays bound.
   */
  void switch_agent(const std::string& agent_name);

  /*
   * Plays one turn on board, which must be active with this player to move. Never throws for a
   * bad reply: the board ends up either one piece fuller or forfeited by this player.
   */
  void move(c4::Board& board);

  const Rationale& rationale() const { return rationale_; }
  std::string thoughts() const;

  std::string system_prompt(const c4::Board& board) const;
  std::string user_prompt(const c4::Board& board) const;

  /*
   * Validates reply and applies it to board. Throws arena::MalformedReplyException, leaving board
   * untouched, if the reply does not name a legal column.
   */
  void process_reply(const std::string& reply, c4::Board& board);

  /*
   * The substring from the first '{' through the last '}', or reply unchanged if it lacks either.
   */
  static std::string extract_json_object(const std::string& reply);

 private:
  static std::string reply_shape(const std::string& move_column_descr);
  static std::string illegal_instruction(const c4::Board& board);
  static std::string field_to_str(const boost::json::object& obj, const char* key);

  const c4::color_t color_;
  const AgentRegistry& registry_;
  const int max_tokens_;
  AgentClient_sptr agent_;
  Rationale rationale_;
};

}  // namespace arena
