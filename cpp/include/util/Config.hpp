#pragma once

#include <boost/filesystem.hpp>

#include <map>
#include <string>

namespace util {

/*
 * Key-value pairs read from a config file made of "key = value" lines. Text after a '#' is a
 * comment, blank lines are ignored, and a duplicate key or a line without '=' is an error.
 *
 * Config config = Config::load("arena.cfg", false);
 * std::string models = config.get("models", "");
 */
class Config {
 public:
  static constexpr const char* kDefaultFilename = "arena.cfg";

  Config() = default;

  /*
   * Reads the file at path. If the file does not exist, returns an empty Config when required is
   * false, and throws util::CleanException when required is true. A path that cannot be inspected
   * at all (for instance a component name that is too long) also throws util::CleanException.
   */
  static Config load(const boost::filesystem::path& path, bool required);

  /*
   * Parses config text directly. source is only used in error messages.
   */
  static Config parse(const std::string& text, const std::string& source);

  bool contains(const std::string& key) const { return map_.contains(key); }
  std::string get(const std::string& key) const;  // throws util::CleanException if key not found
  std::string get(const std::string& key, const std::string& default_value) const;
  void set(const std::string& key, const std::string& value) { map_[key] = value; }

  const std::string& source() const { return source_; }

 private:
  using map_t = std::map<std::string, std::string>;

  std::string source_;
  map_t map_;
};

}  // namespace util

#include "inline/util/Config.inl"
