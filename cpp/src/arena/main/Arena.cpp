#include "arena/AgentRegistry.hpp"
#include "arena/ArenaConfig.hpp"
#include "arena/Game.hpp"
#include "arena/Leaderboard.hpp"
#include "arena/ResultStore.hpp"
#include "games/connect4/IO.hpp"
#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"
#include "util/Config.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"
#include "util/StringUtil.hpp"

#include <boost/program_options.hpp>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

/*
 * Headless Connect-Four arena: plays one game between two agents and records the result, or
 * prints the leaderboard.
 *
 * c4_arena --red gpt-5-mini --yellow claude-haiku-4-5 --show-thoughts
 * c4_arena --leaderboard
 */
struct Args {
  std::string red;
  std::string yellow;
  std::string config_file;
  std::string models;
  std::string store_path;
  bool record = true;
  bool include_self_play = false;
  bool show_thoughts = false;

  auto make_options_description();
};

auto Args::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Arena options");

  return desc.template add_option<"red", 'r'>(po::value<std::string>(&red),
                                              "agent playing red (default: first offered agent)")
    .template add_option<"yellow", 'y'>(
      po::value<std::string>(&yellow), "agent playing yellow (default: second offered agent)")
    .template add_option<"config-file", 'c'>(
      po::value<std::string>(&config_file),
      "config file (default: arena.cfg in the current directory, if present)")
    .template add_option<"models">(po::value<std::string>(&models),
                                   "comma-separated allow-list of agents, overrides the config")
    .template add_option<"store-path">(po::value<std::string>(&store_path),
                                       "results store file, overrides the config")
    .template add_option<"list-models">("print the offered agents and exit")
    .template add_option<"leaderboard">("print ratings and game history and exit")
    .template add_flag<"record", "no-record">(&record, "record the result in the store",
                                              "do not record the result")
    .template add_flag<"include-self-play", "exclude-self-play">(
      &include_self_play, "rate games an agent played against itself",
      "skip games an agent played against itself when rating")
    .template add_flag<"show-thoughts", "hide-thoughts">(
      &show_thoughts, "print each agent's rationale after its move", "do not print rationales");
}

namespace {

void print_agents(const arena::AgentRegistry& registry) {
  for (const std::string& name : registry.all_names()) {
    std::cout << name << std::endl;
  }
}

void print_leaderboard(const arena::ArenaConfig& config, const arena::AgentRegistry& registry,
                       const Args& args) {
  arena::ResultStore_uptr store = arena::make_result_store(config.store_path);
  arena::Leaderboard leaderboard(store->get_games(), args.include_self_play);

  std::vector<std::string> offered = registry.all_names();
  leaderboard.print(std::cout, &offered);
}

void play(const arena::ArenaConfig& config, const arena::AgentRegistry& registry,
          const Args& args) {
  std::vector<std::string> names = registry.all_names();
  CLEAN_ASSERT(!names.empty(), "No agents offered, check the models list");

  std::string red = args.red.empty() ? names[0] : args.red;
  std::string yellow = args.yellow.empty() ? names[names.size() > 1 ? 1 : 0] : args.yellow;

  arena::ResultStore_uptr store = args.record
                                    ? arena::make_result_store(config.store_path)
                                    : std::make_unique<arena::UnavailableResultStore>();

  arena::Game game(registry, red, yellow, config.max_tokens);
  c4::IO::player_name_array_t player_names = {red, yellow};

  LOG_INFO("{} (red) vs {} (yellow), store: {}", red, yellow, store->description());
  for (const arena::Game::Snapshot& snapshot : game.run(*store)) {
    if (snapshot.final) {
      std::cout << (snapshot.recorded ? "Result recorded" : "Result not recorded") << std::endl;
      continue;
    }

    c4::IO::print_state(std::cout, snapshot.board, &player_names);

    const c4::Board::Move& last_move = snapshot.board.last_move();
    if (args.show_thoughts && last_move.valid() && !snapshot.board.is_forfeit()) {
      c4::color_t mover = snapshot.board.get(last_move.row, last_move.column);
      std::cout << game.thoughts(mover) << std::endl;
    }
  }
}

}  // namespace

int main(int ac, char* av[]) {
  try {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;

    Args args;
    util::Logging::Params log_params;
    util::Random::Params random_params;

    po2::options_description raw_desc("General options");
    auto desc = raw_desc.template add_option<"help", 'h'>("help (most used options)")
                  .template add_option<"help-full">("help (all options)")
                  .add(args.make_options_description())
                  .add(log_params.make_options_description())
                  .add(random_params.make_options_description());

    po::variables_map vm = po2::parse_args(desc, ac, av);

    bool help_full = vm.count("help-full");
    bool help = vm.count("help");
    if (help || help_full) {
      po2::Settings::help_full = help_full;
      std::cout << desc << std::endl;
      return 0;
    }

    util::Logging::init(log_params);
    util::Random::init(random_params);

    bool explicit_config = !args.config_file.empty();
    std::string config_path = explicit_config ? args.config_file : util::Config::kDefaultFilename;
    arena::ArenaConfig config =
      arena::ArenaConfig::from_config(util::Config::load(config_path, explicit_config));
    if (vm.count("models")) config.models = util::split_csv(args.models);
    if (vm.count("store-path")) config.store_path = args.store_path;

    arena::AgentRegistry registry = arena::AgentRegistry::make_default(config);

    if (vm.count("list-models")) {
      print_agents(registry);
    } else if (vm.count("leaderboard")) {
      print_leaderboard(config, registry, args);
    } else {
      play(config, registry, args);
    }
  } catch (const util::CleanException& e) {
    std::cerr << "Caught a CleanException: ";
    std::cerr << e.what() << std::endl;
    return 1;
  }

  return 0;
}
