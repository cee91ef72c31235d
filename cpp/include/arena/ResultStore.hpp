#pragma once

#include "arena/GameResult.hpp"

#include <boost/filesystem.hpp>

#include <memory>
#include <string>
#include <vector>

namespace arena {

/*
 * Append-only store of finished games. Implementations never throw: an unavailable backend makes
 * record_game() return false and get_games() return an empty list.
 */
class ResultStore {
 public:
  virtual ~ResultStore() = default;

  virtual bool record_game(const GameResult& result) = 0;

  // All recorded games, in chronological order (ties keep insertion order)
  virtual std::vector<GameResult> get_games() const = 0;

  virtual std::string description() const = 0;
};

using ResultStore_uptr = std::unique_ptr<ResultStore>;

// No backend configured
class UnavailableResultStore : public ResultStore {
 public:
  bool record_game(const GameResult&) override { return false; }
  std::vector<GameResult> get_games() const override { return {}; }
  std::string description() const override { return "no store"; }
};

// Process-local store
class InMemoryResultStore : public ResultStore {
 public:
  bool record_game(const GameResult& result) override;
  std::vector<GameResult> get_games() const override;
  std::string description() const override { return "in-memory store"; }

 private:
  std::vector<GameResult> games_;
};

/*
 * A file holding one JSON object per line (see GameResult). Lines that fail to parse are skipped
 * with a warning.
 */
class JsonLinesResultStore : public ResultStore {
 public:
  JsonLinesResultStore(const boost::filesystem::path& path) : path_(path) {}

  bool record_game(const GameResult& result) override;
  std::vector<GameResult> get_games() const override;
  std::string description() const override { return path_.string(); }

 private:
  const boost::filesystem::path path_;
};

// Empty path -> UnavailableResultStore, else JsonLinesResultStore
ResultStore_uptr make_result_store(const std::string& path);

}  // namespace arena
