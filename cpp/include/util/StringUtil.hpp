#pragma once

/*
 * Various string utilities
 */
#include <string>
#include <vector>

namespace util {

inline std::string make_whitespace(size_t n) { return std::string(n, ' '); }

/*
 * Raises util::CleanException if parse fails. Used for user-supplied numbers (config values).
 */
double atof_safe(const std::string& s);
int atoi_safe(const std::string& s);

/*
 * split(s) and split(s, t) behave just like s.split() and s.split(t), respectively, in python.
 */
std::vector<std::string> split(const std::string& s, const char* t = "");

/*
 * Like split(s, ","), except that each token is stripped of surrounding whitespace and empty
 * tokens are dropped. "a, b,,c " -> {"a", "b", "c"}
 */
std::vector<std::string> split_csv(const std::string& s);

/*
 * splitlines(s) behaves just like s.splitlines() in python.
 */
std::vector<std::string> splitlines(const std::string& s);

/*
 * Returns the width of the string when printed to the terminal. This is essentially the number of
 * characters in the string, except that ANSI escape sequences are treated as having zero width.
 */
size_t terminal_width(const std::string& str);

/*
 * Pads str on the right with spaces up to the given terminal width.
 */
std::string pad_right(const std::string& str, size_t width);

// "x and y"
// "x, y, and z"  (oxford_comma = true)
// "x, y and z" (oxford_comma = false)
std::string grammatically_join(const std::vector<std::string>& items,
                               const std::string& conjunction, bool oxford_comma = true);

}  // namespace util

#include "inline/util/StringUtil.inl"
