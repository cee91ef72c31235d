#include "arena/ResultStore.hpp"

#include "util/LoggingUtil.hpp"

#include <algorithm>
#include <exception>
#include <fstream>

namespace arena {

namespace {

void sort_chronologically(std::vector<GameResult>& games) {
  std::stable_sort(games.begin(), games.end(),
                   [](const GameResult& a, const GameResult& b) { return a.when < b.when; });
}

}  // namespace

bool InMemoryResultStore::record_game(const GameResult& result) {
  games_.push_back(result);
  return true;
}

std::vector<GameResult> InMemoryResultStore::get_games() const {
  std::vector<GameResult> games = games_;
  sort_chronologically(games);
  return games;
}

bool JsonLinesResultStore::record_game(const GameResult& result) {
  std::string line = boost::json::serialize(boost::json::value_from(result));

  try {
    if (path_.has_parent_path()) {
      boost::filesystem::create_directories(path_.parent_path());
    }
  } catch (const boost::filesystem::filesystem_error& e) {
    LOG_ERROR("Failed to record a game in {}: {}", path_.string(), e.what());
    return false;
  }

  std::ofstream file(path_.c_str(), std::ios::app);
  file << line << '\n';
  file.flush();
  if (!file) {
    LOG_ERROR("Failed to record a game in {}", path_.string());
    return false;
  }
  return true;
}

std::vector<GameResult> JsonLinesResultStore::get_games() const {
  std::vector<GameResult> games;

  boost::system::error_code ec;
  if (!boost::filesystem::exists(path_, ec)) return games;

  std::ifstream file(path_.c_str());
  if (!file) {
    LOG_ERROR("Error getting games: cannot read {}", path_.string());
    return games;
  }

  std::string line;
  int line_number = 0;
  while (std::getline(file, line)) {
    ++line_number;
    if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

    boost::json::value jv = boost::json::parse(line, ec);
    if (ec) {
      LOG_WARN("Skipping line {} of {}: {}", line_number, path_.string(), ec.message());
      continue;
    }
    try {
      games.push_back(boost::json::value_to<GameResult>(jv));
    } catch (const std::exception& e) {
      LOG_WARN("Skipping line {} of {}: {}", line_number, path_.string(), e.what());
    }
  }
  if (file.bad()) {
    LOG_ERROR("Error getting games: read failure on {}", path_.string());
    return {};
  }

  sort_chronologically(games);
  return games;
}

ResultStore_uptr make_result_store(const std::string& path) {
  if (path.empty()) return std::make_unique<UnavailableResultStore>();
  return std::make_unique<JsonLinesResultStore>(path);
}

}  // namespace arena
