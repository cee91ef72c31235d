#include "arena/AgentClient.hpp"
#include "arena/AgentRegistry.hpp"
#include "arena/AnthropicClient.hpp"
#include "arena/ArenaConfig.hpp"
#include "arena/EloCalculator.hpp"
#include "arena/Exceptions.hpp"
#include "arena/Game.hpp"
#include "arena/GameResult.hpp"
#include "arena/HttpClient.hpp"
#include "arena/Leaderboard.hpp"
#include "arena/OpenAiClient.hpp"
#include "arena/Player.hpp"
#include "arena/ResultStore.hpp"
#include "games/connect4/Board.hpp"
#include "games/connect4/IO.hpp"
#include "util/Config.hpp"
#include "util/CppUtil.hpp"
#include "util/Exception.hpp"
#include "util/GTestUtil.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/filesystem.hpp>
#include <boost/json.hpp>
#include <boost/system/system_error.hpp>
#include <fmt/format.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <deque>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

constexpr const char* kFail = "!fail";

// Replies are consumed in order. kFail (or running out of replies) makes the attempt throw.
struct Script {
  std::deque<std::string> replies;
  int calls = 0;
  std::string last_system;
  std::string last_user;
};
using Script_sptr = std::shared_ptr<Script>;

class ScriptedAgentClient : public arena::AgentClient {
 public:
  ScriptedAgentClient(const std::string& name, Script_sptr script)
      : AgentClient(name), script_(script) {}

 protected:
  std::string send_once(const std::string& system, const std::string& user, int) override {
    script_->calls++;
    script_->last_system = system;
    script_->last_user = user;
    if (script_->replies.empty()) {
      throw arena::AgentException("{} has nothing left to say", name());
    }
    std::string reply = script_->replies.front();
    script_->replies.pop_front();
    if (reply == kFail) {
      throw arena::AgentException("{} is unreachable", name());
    }
    return reply;
  }

 private:
  Script_sptr script_;
};

void add_scripted(arena::AgentRegistry& registry, const std::string& name, Script_sptr script) {
  registry.add(name, [script](const std::string& n) {
    auto client = std::make_shared<ScriptedAgentClient>(n, script);
    client->set_waiter([](std::chrono::milliseconds) {});
    return client;
  });
}

Script_sptr make_script(std::initializer_list<std::string> replies) {
  auto script = std::make_shared<Script>();
  script->replies.assign(replies.begin(), replies.end());
  return script;
}

Script_sptr repeat(const std::string& reply, int n) {
  auto script = std::make_shared<Script>();
  script->replies.assign(n, reply);
  return script;
}

std::string column_reply(char c) { return std::string("{\"move_column\": \"") + c + "\"}"; }

c4::Board make_board(const std::string& moves) {
  c4::Board board;
  for (char c : moves) board.apply_move(c4::IO::parse_column(std::string(1, c)));
  return board;
}

arena::GameResult make_result(const std::string& red, const std::string& yellow, bool red_won,
                              bool yellow_won, int64_t when_us) {
  arena::GameResult result;
  result.red_agent = red;
  result.yellow_agent = yellow;
  result.red_won = red_won;
  result.yellow_won = yellow_won;
  result.when = util::from_us_since_epoch(when_us);
  return result;
}

constexpr int64_t kWhen = 1760781600000000;  // 2025-10-18 10:00:00 UTC

boost::filesystem::path make_temp_dir() {
  namespace bf = boost::filesystem;
  bf::path dir = bf::temp_directory_path() / bf::unique_path("c4arena-%%%%-%%%%");
  bf::create_directories(dir);
  return dir;
}

}  // namespace

TEST(AgentClient, api_model_name) {
  ScriptedAgentClient local("llama3.2 local", make_script({}));
  ScriptedAgentClient remote("gpt-5-mini", make_script({}));
  EXPECT_EQ(local.api_model_name(), "llama3.2");
  EXPECT_EQ(remote.api_model_name(), "gpt-5-mini");
}

TEST(AgentClient, retry_then_give_up) {
  auto script = make_script({kFail, kFail, kFail, "{\"move_column\": \"A\"}"});
  ScriptedAgentClient client("flaky", script);
  client.set_retry_params({3, std::chrono::milliseconds(5)});

  std::vector<std::chrono::milliseconds> waits;
  client.set_waiter([&](std::chrono::milliseconds delay) { waits.push_back(delay); });

  EXPECT_EQ(client.send("system", "user", 100), arena::AgentClient::kEmptyReply);
  EXPECT_EQ(script->calls, 3);
  ASSERT_EQ(waits.size(), 2u);
  EXPECT_EQ(waits[0], std::chrono::milliseconds(5));
}

TEST(AgentClient, retry_then_succeed) {
  auto script = make_script({kFail, "{\"move_column\": \"B\"}"});
  ScriptedAgentClient client("flaky", script);

  int waits = 0;
  client.set_waiter([&](std::chrono::milliseconds delay) {
    EXPECT_EQ(delay, std::chrono::milliseconds(2000));
    waits++;
  });

  EXPECT_EQ(client.send("system", "user", 100), "{\"move_column\": \"B\"}");
  EXPECT_EQ(script->calls, 2);
  EXPECT_EQ(waits, 1);
  EXPECT_EQ(script->last_system, "system");
  EXPECT_EQ(script->last_user, "user");
}

TEST(AgentRegistry, names_and_allow_list) {
  arena::AgentRegistry registry;
  add_scripted(registry, "alpha", make_script({}));
  add_scripted(registry, "beta", make_script({}));
  add_scripted(registry, "gamma", make_script({}));

  EXPECT_EQ(registry.all_names(), (std::vector<std::string>{"alpha", "beta", "gamma"}));
  EXPECT_THROW(add_scripted(registry, "beta", make_script({})), util::Exception);

  registry.set_allow_list({"gamma", "unknown", "alpha"});
  EXPECT_EQ(registry.all_names(), (std::vector<std::string>{"gamma", "alpha"}));
  EXPECT_EQ(registry.all_supported_names(),
            (std::vector<std::string>{"alpha", "beta", "gamma"}));
  EXPECT_TRUE(registry.is_supported("beta"));
  EXPECT_FALSE(registry.is_offered("beta"));
  EXPECT_FALSE(registry.is_offered("unknown"));

  EXPECT_EQ(registry.create("gamma")->name(), "gamma");
  EXPECT_THROW(registry.create("beta"), arena::UnsupportedAgentException);
  EXPECT_THROW(registry.create("unknown"), arena::UnsupportedAgentException);
}

TEST(AgentRegistry, make_default) {
  arena::ArenaConfig config;
  config.ollama_host = "box";
  arena::AgentRegistry registry = arena::AgentRegistry::make_default(config);

  std::vector<std::string> names = registry.all_names();
  EXPECT_NE(std::find(names.begin(), names.end(), "gpt-5-mini"), names.end());
  EXPECT_NE(std::find(names.begin(), names.end(), "claude-haiku-4-5"), names.end());

  arena::AgentClient_sptr local = registry.create("llama3.2 local");
  auto* openai = dynamic_cast<arena::OpenAiClient*>(local.get());
  ASSERT_NE(openai, nullptr);
  EXPECT_EQ(openai->params().base_url, "http://box:11434/v1");
  EXPECT_TRUE(openai->params().strip_think);

  EXPECT_EQ(openai->params().timeout, std::chrono::seconds(120));

  arena::AgentClient_sptr claude = registry.create("claude-haiku-4-5");
  EXPECT_NE(dynamic_cast<arena::AnthropicClient*>(claude.get()), nullptr);

  config.timeout_seconds = 7;
  arena::AgentRegistry impatient = arena::AgentRegistry::make_default(config);
  auto gpt = std::dynamic_pointer_cast<arena::OpenAiClient>(impatient.create("gpt-5-mini"));
  ASSERT_NE(gpt, nullptr);
  EXPECT_EQ(gpt->params().timeout, std::chrono::seconds(7));
  auto haiku =
    std::dynamic_pointer_cast<arena::AnthropicClient>(impatient.create("claude-haiku-4-5"));
  ASSERT_NE(haiku, nullptr);
  EXPECT_EQ(haiku->params().timeout, std::chrono::seconds(7));

  config.models = {"gpt-5", "bogus", "claude-haiku-4-5"};
  arena::AgentRegistry restricted = arena::AgentRegistry::make_default(config);
  EXPECT_EQ(restricted.all_names(), (std::vector<std::string>{"gpt-5", "claude-haiku-4-5"}));
  EXPECT_THROW(restricted.create("gemini-2.5-pro"), arena::UnsupportedAgentException);
}

class PlayerTest : public testing::Test {
 protected:
  arena::Player make_player(c4::color_t color, std::initializer_list<std::string> replies) {
    script_ = make_script(replies);
    registry_ = std::make_unique<arena::AgentRegistry>();
    add_scripted(*registry_, "scripted", script_);
    add_scripted(*registry_, "other", make_script({}));
    return arena::Player(color, *registry_, "scripted");
  }

  Script_sptr script_;
  std::unique_ptr<arena::AgentRegistry> registry_;
};

TEST_F(PlayerTest, bare_letter_reply) {
  arena::Player player = make_player(c4::kRed, {"{c}"});
  c4::Board board;
  player.move(board);
  EXPECT_EQ(board.height(2), 1);
  EXPECT_EQ(board.get(0, 2), c4::kRed);
  EXPECT_EQ(board.current_player(), c4::kYellow);
}

TEST_F(PlayerTest, unknown_column_forfeits) {
  arena::Player player = make_player(c4::kRed, {"{R}"});
  c4::Board board;
  player.move(board);
  EXPECT_TRUE(board.is_forfeit());
  EXPECT_EQ(board.winner(), c4::kYellow);
  EXPECT_EQ(board.num_pieces(), 0);
  EXPECT_EQ(c4::IO::status(board), "Yellow wins after an illegal move by Red");
}

TEST_F(PlayerTest, missing_column_forfeits) {
  arena::Player player = make_player(c4::kYellow, {"{\"evaluation\": \"hmm\"}"});
  c4::Board board = make_board("D");
  player.move(board);
  EXPECT_TRUE(board.is_forfeit());
  EXPECT_EQ(board.winner(), c4::kRed);
  EXPECT_EQ(board.num_pieces(), 1);
}

TEST_F(PlayerTest, full_column_forfeits) {
  arena::Player player = make_player(c4::kRed, {column_reply('A')});
  c4::Board board = make_board("AAAAAA");
  player.move(board);
  EXPECT_TRUE(board.is_forfeit());
  EXPECT_EQ(board.winner(), c4::kYellow);
}

TEST_F(PlayerTest, non_string_column_forfeits) {
  arena::Player player = make_player(c4::kRed, {"{\"move_column\": 3}"});
  c4::Board board;
  player.move(board);
  EXPECT_TRUE(board.is_forfeit());
}

TEST_F(PlayerTest, unparsable_reply_forfeits) {
  arena::Player player = make_player(c4::kRed, {"I choose D"});
  c4::Board board;
  player.move(board);
  EXPECT_TRUE(board.is_forfeit());
}

TEST_F(PlayerTest, exhausted_retries_forfeit) {
  arena::Player player = make_player(c4::kRed, {kFail, kFail, kFail});
  c4::Board board;
  player.move(board);
  EXPECT_EQ(script_->calls, 3);
  EXPECT_TRUE(board.is_forfeit());
  EXPECT_EQ(board.winner(), c4::kYellow);
}

TEST_F(PlayerTest, surrounding_commentary) {
  arena::Player player = make_player(c4::kRed, {"Sure!\n{\"move_column\": \"E\"}\nGood luck"});
  c4::Board board;
  player.move(board);
  EXPECT_EQ(board.height(4), 1);

  // Everything between the first '{' and the last '}' must parse
  EXPECT_THROW(player.process_reply("{\"move_column\": \"E\"} then :-}", board),
               arena::MalformedReplyException);
  EXPECT_EQ(board.num_pieces(), 1);
}

TEST_F(PlayerTest, rationale) {
  arena::Player player = make_player(c4::kRed, {});
  c4::Board board;
  player.process_reply(
    "{\"evaluation\": \"good\", \"threats\": [\"a\"], \"opportunities\": null, "
    "\"strategy\": 3, \"move_column\": \"d\"}",
    board);

  EXPECT_EQ(board.height(3), 1);
  EXPECT_EQ(player.rationale(), (arena::Rationale{"good", "[\"a\"]", "", "3"}));
  EXPECT_EQ(player.thoughts(),
            "Evaluation:\ngood\n\nThreats:\n[\"a\"]\n\nOpportunities:\n\n\nStrategy:\n3\n");

  // A rejected reply keeps the previous rationale
  EXPECT_THROW(player.process_reply("{\"evaluation\": \"bad\"}", board),
               arena::MalformedReplyException);
  EXPECT_EQ(player.rationale().evaluation, "good");
}

TEST_F(PlayerTest, extract_json_object) {
  EXPECT_EQ(arena::Player::extract_json_object("x {\"a\": {\"b\": 1}} y"), "{\"a\": {\"b\": 1}}");
  EXPECT_EQ(arena::Player::extract_json_object("no braces"), "no braces");
  EXPECT_EQ(arena::Player::extract_json_object("} backwards {"), "} backwards {");
}

TEST_F(PlayerTest, prompts) {
  arena::Player player = make_player(c4::kYellow, {column_reply('B')});
  c4::Board board = make_board("AAAAAGG");

  std::string system = player.system_prompt(board);
  EXPECT_NE(system.find("You are yellow and your opponent is red"), std::string::npos);
  EXPECT_NE(system.find("B, C, D, E, F, or G"), std::string::npos);
  EXPECT_NE(system.find("ILLEGAL: A"), std::string::npos);

  std::string user = player.user_prompt(board);
  EXPECT_NE(user.find("\"Row 1\""), std::string::npos);
  EXPECT_NE(user.find("\"move_column\""), std::string::npos);
  EXPECT_EQ(user.find("\"move_column\": \"A\""), std::string::npos);

  player.move(board);
  EXPECT_EQ(script_->last_system, system);
  EXPECT_EQ(board.height(1), 1);

  c4::Board empty;
  EXPECT_EQ(player.system_prompt(empty).find("ILLEGAL"), std::string::npos);
}

TEST_F(PlayerTest, switch_agent) {
  arena::Player player = make_player(c4::kRed, {});
  EXPECT_THROW(player.switch_agent("unknown"), arena::UnsupportedAgentException);
  EXPECT_EQ(player.agent_name(), "scripted");
  player.switch_agent("other");
  EXPECT_EQ(player.agent_name(), "other");
  EXPECT_EQ(player.color(), c4::kRed);
}

class GameTest : public testing::Test {
 protected:
  GameTest() {
    // Red stacks column A, Yellow stacks column B: Red wins on its 4th move
    add_scripted(registry_, "red", repeat(column_reply('A'), 10));
    add_scripted(registry_, "yellow", repeat(column_reply('B'), 10));
  }

  arena::AgentRegistry registry_;
};

TEST_F(GameTest, run) {
  arena::Game game(registry_, "red", "yellow");
  arena::InMemoryResultStore store;

  std::vector<arena::Game::Snapshot> snapshots;
  for (const arena::Game::Snapshot& snapshot : game.run(store)) {
    snapshots.push_back(snapshot);
  }

  // fresh board + 7 half-moves + final
  ASSERT_EQ(snapshots.size(), 9u);
  EXPECT_EQ(snapshots[0].board.num_pieces(), 0);
  EXPECT_EQ(snapshots[0].status, "Red to play");
  EXPECT_EQ(snapshots[1].board.num_pieces(), 1);
  EXPECT_EQ(snapshots[7].status, "Red wins");
  EXPECT_FALSE(snapshots[7].final);
  EXPECT_TRUE(snapshots[8].final);
  EXPECT_TRUE(snapshots[8].recorded);
  EXPECT_EQ(snapshots[8].board, snapshots[7].board);

  std::vector<arena::GameResult> games = store.get_games();
  ASSERT_EQ(games.size(), 1u);
  EXPECT_EQ(games[0].red_agent, "red");
  EXPECT_EQ(games[0].yellow_agent, "yellow");
  EXPECT_TRUE(games[0].red_won);
  EXPECT_FALSE(games[0].yellow_won);
}

TEST_F(GameTest, run_restarts) {
  arena::Game game(registry_, "red", "yellow");
  arena::InMemoryResultStore store;

  for (int pass = 0; pass < 2; ++pass) {
    std::vector<arena::Game::Snapshot> snapshots;
    for (const arena::Game::Snapshot& snapshot : game.run(store)) {
      snapshots.push_back(snapshot);
    }
    ASSERT_EQ(snapshots.size(), 9u) << pass;
    EXPECT_EQ(snapshots.front().board.num_pieces(), 0) << pass;
    EXPECT_EQ(snapshots.front().status, "Red to play") << pass;
    EXPECT_TRUE(snapshots.back().final) << pass;
    EXPECT_EQ(snapshots.back().status, "Red wins") << pass;
  }

  std::vector<arena::GameResult> games = store.get_games();
  ASSERT_EQ(games.size(), 2u);
  for (const arena::GameResult& result : games) {
    EXPECT_TRUE(result.red_won);
    EXPECT_FALSE(result.yellow_won);
  }
}

TEST_F(GameTest, unavailable_store) {
  arena::Game game(registry_, "red", "yellow");
  arena::UnavailableResultStore store;
  arena::Game::Snapshot last = game.play(store);
  EXPECT_TRUE(last.final);
  EXPECT_FALSE(last.recorded);
  EXPECT_EQ(last.status, "Red wins");
}

TEST_F(GameTest, abandoned_run) {
  arena::Game game(registry_, "red", "yellow");
  arena::InMemoryResultStore store;

  int n = 0;
  for (const arena::Game::Snapshot& snapshot : game.run(store)) {
    if (++n == 3) {
      EXPECT_EQ(snapshot.board.num_pieces(), 2);
      break;
    }
  }
  EXPECT_EQ(game.board().num_pieces(), 2);
  EXPECT_TRUE(store.get_games().empty());
}

TEST_F(GameTest, move_and_reset) {
  arena::Game game(registry_, "red", "yellow");
  game.move();
  game.move();
  EXPECT_EQ(game.board().num_pieces(), 2);
  EXPECT_EQ(game.status(), "Red to play");

  game.reset();
  EXPECT_EQ(game.board().num_pieces(), 0);
  EXPECT_EQ(game.player(c4::kRed).agent_name(), "red");
  EXPECT_EQ(game.player(c4::kYellow).agent_name(), "yellow");
}

TEST_F(GameTest, draw) {
  const std::string moves = "DBAABGCBGCFCBBDCFFDAGFBFGDCGGCFEDDAEEAEEAE";
  auto red = std::make_shared<Script>();
  auto yellow = std::make_shared<Script>();
  for (size_t i = 0; i < moves.size(); ++i) {
    (i % 2 == 0 ? red : yellow)->replies.push_back("{" + std::string(1, moves[i]) + "}");
  }
  add_scripted(registry_, "red drawer", red);
  add_scripted(registry_, "yellow drawer", yellow);

  arena::Game game(registry_, "red drawer", "yellow drawer");
  arena::InMemoryResultStore store;
  arena::Game::Snapshot last = game.play(store);

  EXPECT_EQ(last.status, "The game is a draw");
  EXPECT_TRUE(last.board.is_full());
  std::vector<arena::GameResult> games = store.get_games();
  ASSERT_EQ(games.size(), 1u);
  EXPECT_FALSE(games[0].red_won);
  EXPECT_FALSE(games[0].yellow_won);
  EXPECT_EQ(games[0].winner_str(), "Draw");
}

TEST_F(GameTest, forfeit_is_recorded) {
  add_scripted(registry_, "silent", make_script({kFail, kFail, kFail}));
  arena::Game game(registry_, "red", "silent");
  arena::InMemoryResultStore store;
  arena::Game::Snapshot last = game.play(store);

  EXPECT_EQ(last.status, "Red wins after an illegal move by Yellow");
  EXPECT_EQ(last.board.num_pieces(), 1);
  ASSERT_EQ(store.get_games().size(), 1u);
  EXPECT_TRUE(store.get_games()[0].red_won);
}

TEST_F(GameTest, switch_agent) {
  arena::Game game(registry_, "red", "yellow");
  game.switch_agent(c4::kYellow, "red");
  EXPECT_EQ(game.player(c4::kYellow).agent_name(), "red");
  EXPECT_THROW(game.switch_agent(c4::kRed, "nobody"), arena::UnsupportedAgentException);
  EXPECT_EQ(game.player(c4::kRed).agent_name(), "red");
}

TEST(EloCalculator, single_game) {
  arena::ratings_map_t ratings =
    arena::compute_ratings({make_result("a", "b", true, false, kWhen)});
  EXPECT_DOUBLE_EQ(ratings.at("a"), 1016);
  EXPECT_DOUBLE_EQ(ratings.at("b"), 984);
}

TEST(EloCalculator, draws) {
  arena::ratings_map_t ratings = arena::compute_ratings({
    make_result("a", "b", false, false, kWhen),
    make_result("c", "d", true, true, kWhen + 1),
  });
  for (const char* name : {"a", "b", "c", "d"}) {
    EXPECT_DOUBLE_EQ(ratings.at(name), 1000) << name;
  }
}

TEST(EloCalculator, self_play) {
  std::vector<arena::GameResult> games{make_result("a", "a", true, false, kWhen),
                                       make_result("a", "b", false, true, kWhen + 1)};
  arena::ratings_map_t ratings = arena::compute_ratings(games);
  EXPECT_DOUBLE_EQ(ratings.at("a"), 984);
  EXPECT_DOUBLE_EQ(ratings.at("b"), 1016);

  arena::ratings_map_t only_self = arena::compute_ratings({games[0]});
  EXPECT_TRUE(only_self.empty());
  EXPECT_FALSE(arena::compute_ratings({games[0]}, false).empty());
}

TEST(EloCalculator, chronological_order) {
  arena::GameResult first = make_result("a", "b", true, false, kWhen);
  arena::GameResult second = make_result("a", "c", true, false, kWhen + 1000);

  arena::ratings_map_t in_order = arena::compute_ratings({first, second});
  arena::ratings_map_t reversed = arena::compute_ratings({second, first});
  EXPECT_EQ(in_order, reversed);
  EXPECT_NEAR(in_order.at("a"), 1031.2637, 1e-3);
  EXPECT_NEAR(in_order.at("c"), 984.7363, 1e-3);
}

TEST(EloCalculator, equal_times_keep_input_order) {
  arena::GameResult x = make_result("a", "b", true, false, kWhen);
  arena::GameResult y = make_result("a", "c", false, true, kWhen);

  arena::ratings_map_t xy = arena::compute_ratings({x, y});
  EXPECT_NEAR(xy.at("a"), 999.2637, 1e-3);
  EXPECT_DOUBLE_EQ(xy.at("b"), 984);
  EXPECT_NEAR(xy.at("c"), 1016.7363, 1e-3);

  arena::ratings_map_t yx = arena::compute_ratings({y, x});
  EXPECT_NEAR(yx.at("a"), 1000.7363, 1e-3);
  EXPECT_NEAR(yx.at("b"), 983.2637, 1e-3);
  EXPECT_DOUBLE_EQ(yx.at("c"), 1016);
  EXPECT_NE(xy, yx);
}

TEST(EloCalculator, update) {
  arena::EloCalculator calculator;
  EXPECT_DOUBLE_EQ(arena::EloCalculator::expected_score(1000, 1000), 0.5);
  EXPECT_NEAR(arena::EloCalculator::expected_score(1400, 1000), 10.0 / 11, 1e-12);

  calculator.update("x", "y", 1, 0);
  double gain = calculator.rating("x") - 1000;
  EXPECT_GT(gain, 0);
  EXPECT_DOUBLE_EQ(1000 - calculator.rating("y"), gain);
  EXPECT_DOUBLE_EQ(calculator.rating("z"), 1000);
}

TEST(Leaderboard, tables) {
  std::vector<arena::GameResult> games{make_result("a", "c", true, false, kWhen + 1000000),
                                       make_result("a", "b", true, false, kWhen),
                                       make_result("b", "b", false, false, kWhen + 2000000)};
  arena::Leaderboard leaderboard(games);

  using Standing = arena::Leaderboard::Standing;
  EXPECT_EQ(leaderboard.standings(),
            (std::vector<Standing>{{"a", 1031}, {"c", 985}, {"b", 984}}));

  std::vector<std::string> offered{"b", "c"};
  EXPECT_EQ(leaderboard.standings(&offered), (std::vector<Standing>{{"c", 985}, {"b", 984}}));

  using HistoryRow = arena::Leaderboard::HistoryRow;
  EXPECT_EQ(leaderboard.history(),
            (std::vector<HistoryRow>{{"2025-10-18 10:00:02", "b", "b", "Draw"},
                                     {"2025-10-18 10:00:01", "a", "c", "Red"},
                                     {"2025-10-18 10:00:00", "a", "b", "Red"}}));

  std::ostringstream ss;
  leaderboard.print(ss);
  EXPECT_NE(ss.str().find("Player  ELO\na       1031\n"), std::string::npos);
}

TEST(GameResult, json) {
  arena::GameResult result = make_result("gpt-5", "llama3.2 local", false, true, kWhen);
  EXPECT_EQ(boost::json::serialize(boost::json::value_from(result)),
            "{\"red_agent\":\"gpt-5\",\"yellow_agent\":\"llama3.2 local\",\"red_won\":false,"
            "\"yellow_won\":true,\"when\":1760781600000000}");
  EXPECT_EQ(boost::json::value_to<arena::GameResult>(boost::json::value_from(result)), result);
  EXPECT_EQ(result.winner_str(), "Yellow");

  boost::json::value missing = boost::json::parse("{\"red_agent\": \"a\"}");
  EXPECT_ANY_THROW(boost::json::value_to<arena::GameResult>(missing));
}

TEST(ResultStore, json_lines) {
  boost::filesystem::path dir = make_temp_dir();
  arena::JsonLinesResultStore store(dir / "nested" / "results.jsonl");
  EXPECT_TRUE(store.get_games().empty());

  arena::GameResult later = make_result("a", "b", true, false, kWhen + 5);
  arena::GameResult earlier = make_result("c", "d", false, false, kWhen);
  EXPECT_TRUE(store.record_game(later));
  EXPECT_TRUE(store.record_game(earlier));

  {
    std::ofstream file((dir / "nested" / "results.jsonl").c_str(), std::ios::app);
    file << "not json\n\n{\"red_agent\": \"x\"}\n";
  }
  EXPECT_TRUE(store.record_game(later));

  std::vector<arena::GameResult> games = store.get_games();
  EXPECT_EQ(games, (std::vector<arena::GameResult>{earlier, later, later}));
  boost::filesystem::remove_all(dir);
}

TEST(ResultStore, unwritable) {
  boost::filesystem::path dir = make_temp_dir();
  { std::ofstream file((dir / "plain-file").c_str()); }

  arena::JsonLinesResultStore store(dir / "plain-file" / "results.jsonl");
  EXPECT_FALSE(store.record_game(make_result("a", "b", true, false, kWhen)));
  EXPECT_TRUE(store.get_games().empty());
  boost::filesystem::remove_all(dir);
}

TEST(ResultStore, make_result_store) {
  arena::ResultStore_uptr none = arena::make_result_store("");
  EXPECT_FALSE(none->record_game(make_result("a", "b", true, false, kWhen)));
  EXPECT_TRUE(none->get_games().empty());
  EXPECT_EQ(arena::make_result_store("x/results.jsonl")->description(), "x/results.jsonl");
}

TEST(OpenAiClient, request_body) {
  arena::OpenAiClient::Params params;
  params.base_url = "https://api.openai.com/v1";
  params.reasoning_effort = "low";
  arena::OpenAiClient client("gpt-5-mini", params);

  boost::json::object body = client.make_request_body("sys", "usr");
  EXPECT_EQ(body.at("model").as_string(), "gpt-5-mini");
  const boost::json::array& messages = body.at("messages").as_array();
  ASSERT_EQ(messages.size(), 2u);
  EXPECT_EQ(messages[0].as_object().at("role").as_string(), "system");
  EXPECT_EQ(messages[1].as_object().at("content").as_string(), "usr");
  EXPECT_EQ(body.at("response_format").as_object().at("type").as_string(), "json_object");
  EXPECT_EQ(body.at("reasoning_effort").as_string(), "low");
  EXPECT_FALSE(body.contains("temperature"));

  params.reasoning_effort = "";
  arena::OpenAiClient local("llama3.2 local", params);
  body = local.make_request_body("sys", "usr");
  EXPECT_EQ(body.at("model").as_string(), "llama3.2");
  const boost::json::array& local_messages = body.at("messages").as_array();
  ASSERT_EQ(local_messages.size(), 2u);
  EXPECT_EQ(local_messages[0].as_object().at("content").as_string(), "sys");
  EXPECT_EQ(local_messages[1].as_object().at("role").as_string(), "user");
  EXPECT_FALSE(body.contains("reasoning_effort"));
}

TEST(OpenAiClient, parse_response_body) {
  arena::OpenAiClient::Params params;
  params.base_url = "http://localhost:11434/v1";
  arena::OpenAiClient client("gemma2 local", params);

  EXPECT_EQ(client.parse_response_body(
              "{\"choices\": [{\"message\": {\"role\": \"assistant\", \"content\": \"{A}\"}}]}"),
            "{A}");
  EXPECT_THROW(client.parse_response_body("{\"choices\": []}"), arena::AgentException);
  EXPECT_THROW(client.parse_response_body("{\"error\": \"busy\"}"), arena::AgentException);
  EXPECT_THROW(client.parse_response_body("<html>"), arena::AgentException);

  params.strip_think = true;
  arena::OpenAiClient thinker("qwen2.5 local", params);
  EXPECT_EQ(thinker.parse_response_body(
              "{\"choices\": [{\"message\": {\"content\": \"<think>hmm</think>{B}\"}}]}"),
            "{B}");
  EXPECT_EQ(thinker.parse_response_body("{\"choices\": [{\"message\": {\"content\": \"{C}\"}}]}"),
            "{C}");
}

TEST(AnthropicClient, request_and_response) {
  arena::AnthropicClient::Params params;
  params.temperature = 0.25;
  arena::AnthropicClient client("claude-haiku-4-5", params);

  boost::json::object body = client.make_request_body("sys", "usr", 3000);
  EXPECT_EQ(body.at("model").as_string(), "claude-haiku-4-5");
  EXPECT_EQ(body.at("max_tokens").to_number<int>(), 3000);
  EXPECT_DOUBLE_EQ(body.at("temperature").as_double(), 0.25);
  EXPECT_EQ(body.at("system").as_string(), "sys");
  ASSERT_EQ(body.at("messages").as_array().size(), 1u);

  std::string response =
    "{\"content\": [{\"type\": \"text\", \"text\": \"{\\\"move_column\\\": \\\"G\\\"}\"}]}";
  EXPECT_EQ(client.parse_response_body(response), "{\"move_column\": \"G\"}");
  EXPECT_THROW(client.parse_response_body("{\"content\": []}"), arena::AgentException);
}

TEST(Url, parse) {
  arena::Url openai = arena::Url::parse("https://api.openai.com/v1");
  EXPECT_TRUE(openai.tls);
  EXPECT_EQ(openai.host, "api.openai.com");
  EXPECT_EQ(openai.port, "443");
  EXPECT_EQ(openai.join("/chat/completions"), "/v1/chat/completions");

  arena::Url ollama = arena::Url::parse("http://localhost:11434/v1");
  EXPECT_FALSE(ollama.tls);
  EXPECT_EQ(ollama.port, "11434");
  EXPECT_EQ(ollama.to_str(), "http://localhost:11434/v1");

  EXPECT_EQ(arena::Url::parse("https://generativelanguage.googleapis.com/v1beta/openai/").path,
            "/v1beta/openai");
  EXPECT_EQ(arena::Url::parse("https://api.deepseek.com").join("/chat/completions"),
            "/chat/completions");
  EXPECT_EQ(arena::Url::parse("http://example.com").port, "80");

  EXPECT_THROW(arena::Url::parse("ftp://example.com"), util::CleanException);
  EXPECT_THROW(arena::Url::parse("https://:443/v1"), util::CleanException);
}

TEST(HttpClient, silent_server_times_out) {
  namespace net = boost::asio;
  using tcp = net::ip::tcp;

  // Never accepted: the kernel completes the handshake and the request then goes unanswered
  net::io_context ioc;
  tcp::acceptor acceptor(ioc, tcp::endpoint(net::ip::address_v4::loopback(), 0));
  arena::Url url =
    arena::Url::parse(fmt::format("http://127.0.0.1:{}/v1", acceptor.local_endpoint().port()));

  auto start = std::chrono::steady_clock::now();
  EXPECT_THROW(arena::HttpClient::post_json(url, "/chat/completions", {}, "{}",
                                            std::chrono::milliseconds(200)),
               boost::system::system_error);
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}

TEST(HttpClient, agent_gives_up_on_silent_server) {
  namespace net = boost::asio;
  using tcp = net::ip::tcp;

  net::io_context ioc;
  tcp::acceptor acceptor(ioc, tcp::endpoint(net::ip::address_v4::loopback(), 0));

  arena::OpenAiClient::Params params;
  params.base_url = fmt::format("http://127.0.0.1:{}/v1", acceptor.local_endpoint().port());
  params.timeout = std::chrono::milliseconds(200);
  arena::OpenAiClient client("llama3.2 local", params);
  client.set_waiter([](std::chrono::milliseconds) {});

  auto start = std::chrono::steady_clock::now();
  EXPECT_EQ(client.send("sys", "usr", 100), arena::AgentClient::kEmptyReply);
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
}

TEST(ArenaConfig, from_config) {
  util::Config config = util::Config::parse(
    "models = gpt-5, llama3.2 local\n"
    "store.path = /tmp/results.jsonl\n"
    "openai.api_key = sk-file\n"
    "ollama.host = box\n"
    "ollama.port = 1234\n"
    "agent.temperature = 0.7\n"
    "agent.timeout_seconds = 30\n",
    "test.cfg");

  ::setenv("OPENAI_API_KEY", "sk-env", 1);
  ::setenv("GROQ_API_KEY", "gsk-env", 1);
  ::unsetenv("DEEPSEEK_API_KEY");

  arena::ArenaConfig arena_config = arena::ArenaConfig::from_config(config);
  EXPECT_EQ(arena_config.models, (std::vector<std::string>{"gpt-5", "llama3.2 local"}));
  EXPECT_EQ(arena_config.store_path, "/tmp/results.jsonl");
  EXPECT_EQ(arena_config.openai_api_key, "sk-file");
  EXPECT_EQ(arena_config.groq_api_key, "gsk-env");
  EXPECT_EQ(arena_config.deepseek_api_key, "");
  EXPECT_EQ(arena_config.ollama_base_url(), "http://box:1234/v1");
  EXPECT_DOUBLE_EQ(arena_config.temperature, 0.7);
  EXPECT_EQ(arena_config.max_tokens, 3000);
  EXPECT_EQ(arena_config.timeout(), std::chrono::seconds(30));

  arena::ArenaConfig defaults = arena::ArenaConfig::from_config(util::Config());
  EXPECT_TRUE(defaults.models.empty());
  EXPECT_TRUE(defaults.store_path.empty());
  EXPECT_EQ(defaults.ollama_base_url(), "http://localhost:11434/v1");
  EXPECT_EQ(defaults.timeout(), std::chrono::seconds(120));
}

TEST(ArenaConfig, bad_values) {
  for (const char* text : {"ollama.port = 0\n", "ollama.port = eleven\n",
                           "agent.max_tokens = 0\n", "agent.temperature = -1\n",
                           "agent.timeout_seconds = 0\n"}) {
    util::Config config = util::Config::parse(text, "test.cfg");
    EXPECT_THROW(arena::ArenaConfig::from_config(config), util::CleanException) << text;
  }
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
