#include "util/Config.hpp"

#include "util/Exception.hpp"
#include "util/StringUtil.hpp"

#include <boost/algorithm/string.hpp>

#include <fstream>
#include <sstream>

namespace util {

inline Config Config::load(const boost::filesystem::path& path, bool required) {
  // A missing file is not an error here; anything else that stops us from inspecting path is
  boost::system::error_code ec;
  bool is_file = boost::filesystem::is_regular_file(path, ec);
  if (ec) {
    throw CleanException("Cannot access config file {}: {}", path.string(), ec.message());
  }
  if (!is_file) {
    if (required) {
      throw CleanException("Config file not found: {}", path.string());
    }
    Config config;
    config.source_ = path.string();
    return config;
  }

  std::ifstream file(path.c_str());
  if (!file) {
    throw CleanException("Could not open config file {}", path.string());
  }
  std::stringstream ss;
  ss << file.rdbuf();
  return parse(ss.str(), path.string());
}

inline Config Config::parse(const std::string& text, const std::string& source) {
  Config config;
  config.source_ = source;

  for (const std::string& raw_line : splitlines(text)) {
    std::string line = raw_line.substr(0, raw_line.find('#'));  // strip comment
    boost::algorithm::trim(line);
    if (line.empty()) continue;

    size_t eq = line.find('=');
    if (eq == std::string::npos) {
      throw CleanException("Bad line in config file {}: {}", source, raw_line);
    }
    std::string key = line.substr(0, eq);
    std::string value = line.substr(eq + 1);

    boost::algorithm::trim(key);
    boost::algorithm::trim(value);

    if (key.empty()) {
      throw CleanException("Bad line in config file {}: {}", source, raw_line);
    }
    if (config.contains(key)) {
      throw CleanException("Duplicate key \"{}\" in config file {}", key, source);
    }
    config.map_[key] = value;
  }
  return config;
}

inline std::string Config::get(const std::string& key) const {
  auto it = map_.find(key);
  if (it == map_.end()) {
    throw CleanException("Mapping for key \"{}\" required in config file {}", key, source_);
  }
  return it->second;
}

inline std::string Config::get(const std::string& key, const std::string& default_value) const {
  auto it = map_.find(key);
  if (it == map_.end()) return default_value;
  return it->second;
}

}  // namespace util
