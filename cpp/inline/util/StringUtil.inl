#include "util/StringUtil.hpp"

#include "util/Exception.hpp"

#include <boost/algorithm/string.hpp>

#include <cctype>
#include <regex>
#include <stdexcept>
#include <string_view>

namespace util {

inline double atof_safe(const std::string& s) {
  size_t read = 0;
  double d = 0;
  try {
    d = std::stod(s, &read);
  } catch (const std::logic_error&) {
    throw CleanException("atof failure {}(\"{}\")", __func__, s);
  }
  if (read != s.size()) {
    throw CleanException("atof failure {}(\"{}\")", __func__, s);
  }
  return d;
}

inline int atoi_safe(const std::string& s) {
  size_t read = 0;
  int i = 0;
  try {
    i = std::stoi(s, &read);
  } catch (const std::logic_error&) {
    throw CleanException("atoi failure {}(\"{}\")", __func__, s);
  }
  if (read != s.size()) {
    throw CleanException("atoi failure {}(\"{}\")", __func__, s);
  }
  return i;
}

inline std::vector<std::string> split(const std::string& s, const char* t) {
  std::vector<std::string> result;
  std::string_view sep(t);

  if (sep.empty()) {
    std::string_view sv(s);
    std::size_t pos = 0, n = sv.size();
    while (pos < n) {
      while (pos < n && std::isspace(static_cast<unsigned char>(sv[pos]))) ++pos;
      if (pos >= n) break;
      std::size_t start = pos;
      while (pos < n && !std::isspace(static_cast<unsigned char>(sv[pos]))) ++pos;
      result.emplace_back(sv.substr(start, pos - start));
    }
    return result;
  }

  std::size_t start = 0, end;
  while ((end = s.find(sep, start)) != std::string::npos) {
    result.emplace_back(s, start, end - start);
    start = end + sep.size();
  }
  result.emplace_back(s, start);
  return result;
}

inline std::vector<std::string> split_csv(const std::string& s) {
  std::vector<std::string> result;
  for (std::string token : split(s, ",")) {
    boost::algorithm::trim(token);
    if (!token.empty()) result.push_back(token);
  }
  return result;
}

inline std::vector<std::string> splitlines(const std::string& s) {
  std::vector<std::string> result;
  std::string::size_type start = 0;
  std::string::size_type end;

  while ((end = s.find('\n', start)) != std::string::npos) {
    result.push_back(s.substr(start, end - start));
    start = end + 1;
  }

  if (start < s.size()) {
    result.push_back(s.substr(start));
  }

  return result;
}

inline size_t terminal_width(const std::string& str) {
  // Ignore ANSI escape sequences for coloring and such
  static const std::regex ansi_regex("\033\\[[0-9;]*m");
  std::string cleaned_str = std::regex_replace(str, ansi_regex, "");

  // Multi-byte sequences (the board's circle glyphs) count as one column each
  size_t width = 0;
  for (unsigned char c : cleaned_str) {
    if ((c & 0xC0) != 0x80) ++width;
  }
  return width;
}

inline std::string pad_right(const std::string& str, size_t width) {
  size_t w = terminal_width(str);
  if (w >= width) return str;
  return str + make_whitespace(width - w);
}

inline std::string grammatically_join(const std::vector<std::string>& items,
                                      const std::string& conjunction, bool oxford_comma) {
  if (items.empty()) return "";
  if (items.size() == 1) return items[0];
  if (items.size() == 2) {
    return items[0] + " " + conjunction + " " + items[1];
  }

  std::string result;
  for (size_t i = 0; i < items.size(); ++i) {
    result += items[i];
    if (i == items.size() - 2) {
      result += (oxford_comma ? ", " : " ") + conjunction + " ";
    } else if (i < items.size() - 1) {
      result += ", ";
    }
  }
  return result;
}

}  // namespace util
