#include "arena/Player.hpp"

#include "arena/Exceptions.hpp"
#include "games/connect4/IO.hpp"
#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"
#include "util/StringUtil.hpp"

#include <fmt/format.h>

#include <vector>

namespace arena {

Player::Player(c4::color_t color, const AgentRegistry& registry, const std::string& agent_name,
               int max_tokens)
    : color_(color),
      registry_(registry),
      max_tokens_(max_tokens),
      agent_(registry.create(agent_name)) {}

void Player::switch_agent(const std::string& agent_name) {
  agent_ = registry_.create(agent_name);
  LOG_INFO("{} is now played by {}", c4::IO::color_name(color_), agent_name);
}

void Player::move(c4::Board& board) {
  RELEASE_ASSERT(board.current_player() == color_, "{} asked to move on {}'s turn",
                 c4::IO::color_name(color_), c4::IO::color_name(board.current_player()));

  std::string reply = agent_->send(system_prompt(board), user_prompt(board), max_tokens_);
  LOG_DEBUG("{} ({}) replied:\n{}", c4::IO::color_name(color_), agent_name(), reply);

  try {
    process_reply(reply, board);
  } catch (const MalformedReplyException& e) {
    LOG_ERROR("{} ({}) forfeits: {}", c4::IO::color_name(color_), agent_name(), e.what());
    board.declare_forfeit();
  }
}

std::string Player::thoughts() const {
  return fmt::format(
    "Evaluation:\n{}\n\n"
    "Threats:\n{}\n\n"
    "Opportunities:\n{}\n\n"
    "Strategy:\n{}\n",
    rationale_.evaluation, rationale_.threats, rationale_.opportunities, rationale_.strategy);
}

std::string Player::system_prompt(const c4::Board& board) const {
  std::string legal = util::grammatically_join(board.legal_column_names(), "or");
  return fmt::format(
    "You are playing the board game Connect 4.\n"
    "Players take turns to drop counters into one of 7 columns A, B, C, D, E, F, G.\n"
    "The winner is the first player to get 4 counters in a row in any direction.\n"
    "You are {} and your opponent is {}.\n"
    "You must pick a column for your move. The legal moves are: {}.\n"
    "Respond in JSON with exactly this shape:\n\n"
    "{}\n\n"
    "Your move_column must be one of: {}.{}",
    c4::IO::piece_name(color_), c4::IO::piece_name(c4::opponent(color_)), legal,
    reply_shape("one letter from the legal moves: " + legal), legal, illegal_instruction(board));
}

std::string Player::user_prompt(const c4::Board& board) const {
  std::string legal = util::grammatically_join(board.legal_column_names(), "or");
  std::vector<std::string> legal_names = board.legal_column_names();

  boost::json::object example1{
    {"evaluation", "the position is balanced, with a slight edge for me in the center"},
    {"threats", "my opponent threatens three in a row, which I can block"},
    {"opportunities", "I have two promising diagonals"},
    {"strategy", "block first, then keep building in the center"},
    {"move_column", util::Random::choice(legal_names)}};
  boost::json::object example2{
    {"evaluation", "my opponent has more threats, but I can win right now"},
    {"threats", "several open threes"},
    {"opportunities", "a diagonal four is available immediately"},
    {"strategy", "take the winning move"},
    {"move_column", util::Random::choice(legal_names)}};

  return fmt::format(
    "It is your turn to move as {}.\n"
    "Here is the current board, with row 1 at the bottom:\n\n"
    "{}\n\n"
    "Here is the same board drawn with R for a red counter, Y for a yellow counter and _ for an "
    "empty square:\n\n"
    "{}\n"
    "Your final response must be only JSON, strictly in this shape:\n\n"
    "{}\n\n"
    "For example, this is a well formed response:\n\n"
    "{}\n\n"
    "And so is this:\n\n"
    "{}\n\n"
    "Now make your decision.\n"
    "Your move_column must be one of: {}.{}\n",
    c4::IO::piece_name(color_), c4::IO::json_text(board), c4::IO::alternative_text(board),
    reply_shape("one of " + legal + ", which are the legal moves"),
    boost_util::pretty_print(example1), boost_util::pretty_print(example2), legal,
    illegal_instruction(board));
}

void Player::process_reply(const std::string& reply, c4::Board& board) {
  std::string text = extract_json_object(reply);

  // A bare "{X}" names the column X
  if (text.size() == 3 && text[0] == '{' && text[2] == '}') {
    boost::json::object obj{{"move_column", std::string(1, text[1])}};
    text = boost::json::serialize(obj);
  }

  boost::system::error_code ec;
  boost::json::value parsed = boost::json::parse(text, ec);
  if (ec) {
    throw MalformedReplyException("unparsable reply ({})", ec.message());
  }
  if (!parsed.is_object()) {
    throw MalformedReplyException("reply is not a JSON object");
  }
  const boost::json::object& obj = parsed.as_object();

  std::string move_column = kMissingColumn;
  const boost::json::value* value = obj.if_contains("move_column");
  if (value && !value->is_null()) {
    if (!value->is_string()) {
      throw MalformedReplyException("move_column is not a string: {}",
                                    boost::json::serialize(*value));
    }
    if (!value->as_string().empty()) move_column = value->as_string();
  }

  c4::column_t col = c4::IO::parse_column(move_column);
  if (col < 0) {
    throw MalformedReplyException("unknown column \"{}\"", move_column);
  }
  if (!board.is_legal(col)) {
    throw MalformedReplyException("column {} is full", c4::IO::column_name(col));
  }

  board.apply_move(col);
  rationale_ = Rationale{field_to_str(obj, "evaluation"), field_to_str(obj, "threats"),
                         field_to_str(obj, "opportunities"), field_to_str(obj, "strategy")};
  LOG_INFO("{} ({}) plays {}", c4::IO::color_name(color_), agent_name(),
           c4::IO::column_name(col));
}

std::string Player::extract_json_object(const std::string& reply) {
  size_t left = reply.find('{');
  size_t right = reply.rfind('}');
  if (left == std::string::npos || right == std::string::npos || right < left) return reply;
  return reply.substr(left, right - left + 1);
}

std::string Player::reply_shape(const std::string& move_column_descr) {
  boost::json::object shape{{"evaluation", "my assessment of the board"},
                            {"threats", "any threats from my opponent that I should block"},
                            {"opportunities", "my best chances to win"},
                            {"strategy", "my thought process"},
                            {"move_column", move_column_descr}};
  return boost_util::pretty_print(shape);
}

std::string Player::illegal_instruction(const c4::Board& board) {
  std::vector<std::string> illegal = board.illegal_column_names();
  if (illegal.empty()) return "";
  return fmt::format("\nYou must NOT pick any of these columns, which are full and ILLEGAL: {}",
                     util::grammatically_join(illegal, "and"));
}

std::string Player::field_to_str(const boost::json::object& obj, const char* key) {
  const boost::json::value* value = obj.if_contains(key);
  if (!value || value->is_null()) return "";
  if (value->is_string()) return std::string(value->as_string());
  return boost::json::serialize(*value);
}

}  // namespace arena
