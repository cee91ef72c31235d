#pragma once

#include "util/CppUtil.hpp"

#include <boost/json.hpp>
#include <boost/program_options.hpp>

#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace boost_util {

/*
 * Pretty-prints jv to os. Objects keep their insertion order and get one member per line, nested
 * indent_width spaces deeper per level. Arrays of scalars are printed on a single line:
 *
 * {
 *     "Column names": ["A", "B", "C", "D", "E", "F", "G"],
 *     "Row 6": ["", "", "", "", "", "", ""],
 *     ...
 * }
 */
void pretty_print(std::ostream& os, const boost::json::value& jv, int indent_width = 4);

std::string pretty_print(const boost::json::value& jv, int indent_width = 4);

namespace program_options {

struct Settings {
  static inline bool help_full = false;
};

namespace detail {

// boost's options_description::add() stores a raw pointer to the added group, so added groups
// are kept alive here for as long as the description that contains them.
struct DescriptionState {
  DescriptionState(const char* name);

  boost::program_options::options_description full;     // includes hidden options
  boost::program_options::options_description visible;  // excludes hidden options
  std::vector<std::shared_ptr<DescriptionState>> children;
};

}  // namespace detail

/*
 * This class is a thin wrapper around boost::program_options::options_description. It aims to
 * provide a similar interface, with the added benefit that option-naming clashes are detected at
 * compile-time, rather than at runtime.
 *
 * Before:
 *
 * using namespace po = boost::program_options;
 * po::options_description desc("descr");
 * desc.add_options()
 *     ("foo,f", ...)
 *     ("bar", ...)
 *     ;
 * return desc;
 *
 * After:
 *
 * using namespace po2 = boost_util::program_options;
 * po2::options_description desc("descr");
 * return desc
 *     .add_option<"foo", 'f'>(...)
 *     .add_option<"bar">(...)
 *     ;
 *
 * Each add_*() call returns a new options_description whose template parameters record the names
 * used so far. All of the returned objects share the same underlying boost descriptions.
 */
template <typename StrSeq_ = util::StringLiteralSequence<>,
          util::concepts::IntSequence CharSeq_ = util::int_sequence<>>
class options_description {
 public:
  using StrSeq = StrSeq_;
  using CharSeq = CharSeq_;

  using base_t = boost::program_options::options_description;

  options_description(const char* name);

  /*
   * Similar to boost::program_options::options_description::add_options()(...), except that the
   * option name(s) is passed as a template argument, rather than as a function argument.
   */
  template <util::StringLiteral StrLit, char Char = ' ', typename... Ts>
  auto add_option(Ts&&... ts);

  /*
   * Similar to add_option(), but keeps the option hidden from the --help output to avoid clutter.
   *
   * To actually see the hidden options, use --help-full instead of --help/-h.
   */
  template <util::StringLiteral StrLit, typename... Ts>
  auto add_hidden_option(Ts&&... ts);

  /*
   * Adds both --foo and --no-foo options. One of the two will be suppressed from the --help output,
   * depending on the value of *flag.
   *
   * Using --help-full instead of --help/-h will show both options.
   */
  template <util::StringLiteral TrueStrLit, util::StringLiteral FalseStrLit>
  auto add_flag(bool* flag, const char* true_help, const char* false_help);

  /*
   * Adds all options from desc to this.
   */
  template <typename StrSeq2, util::concepts::IntSequence CharSeq2>
  auto add(const options_description<StrSeq2, CharSeq2>& desc);

  void print(std::ostream& s) const;

  friend std::ostream& operator<<(std::ostream& s, const options_description& desc) {
    desc.print(s);
    return s;
  }

  const base_t& get() const { return state_->full; }

 private:
  using State = detail::DescriptionState;

  options_description(std::shared_ptr<State> state) : state_(std::move(state)) {}

  template <util::StringLiteral StrLit, char Char = ' '>
  auto augment() const;

  template <util::StringLiteral StrLit, char Char>
  static std::string full_name();

  template <typename, util::concepts::IntSequence>
  friend class boost_util::program_options::options_description;

  std::shared_ptr<State> state_;
};

/*
 * Constructs a boost::program_options::command_line_parser out of ts, which is expected to be
 * a collection of strings from the command line. Uses this to store to the passed-in desc, which
 * should be a {boost, boost_util}::program_options::options_description. Returns the parsed
 * variables_map.
 *
 * Parse errors are rethrown as util::CleanException.
 */
template <typename T, typename... Ts>
boost::program_options::variables_map parse_args(const T& desc, Ts&&... ts);

}  // namespace program_options

}  // namespace boost_util

#include "inline/util/BoostUtil.inl"
