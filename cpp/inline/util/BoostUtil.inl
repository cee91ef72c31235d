#include "util/BoostUtil.hpp"

#include "util/Exception.hpp"

#include <boost/make_shared.hpp>
#include <fmt/format.h>
#include <sys/ioctl.h>

#include <unistd.h>

namespace boost_util {

namespace program_options {

namespace detail {

inline unsigned line_length() {
  struct winsize w {};
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 1) return w.ws_col - 1;
  return boost::program_options::options_description::m_default_line_length;
}

inline DescriptionState::DescriptionState(const char* name)
    : full(name, line_length()), visible(name, line_length()) {}

// The same option_description is shared by the full and visible descriptions, so that its
// value_semantic has a single owner.
inline auto make_option(const std::string& name, const char* descr) {
  namespace po = boost::program_options;
  return boost::make_shared<po::option_description>(name.c_str(), new po::untyped_value(true),
                                                    descr);
}

inline auto make_option(const std::string& name, const boost::program_options::value_semantic* s) {
  return boost::make_shared<boost::program_options::option_description>(name.c_str(), s);
}

inline auto make_option(const std::string& name, const boost::program_options::value_semantic* s,
                        const char* descr) {
  return boost::make_shared<boost::program_options::option_description>(name.c_str(), s, descr);
}

template <typename T>
struct Wrap {
  const T& operator()(const T& t) const { return t; }
};

template <typename S, util::concepts::IntSequence C>
struct Wrap<options_description<S, C>> {
  const auto& operator()(const options_description<S, C>& t) const { return t.get(); }
};

template <typename T>
const auto& wrap(const T& t) {
  return Wrap<T>()(t);
}

}  // namespace detail

template <typename StrSeq, util::concepts::IntSequence CharSeq>
options_description<StrSeq, CharSeq>::options_description(const char* name)
    : state_(std::make_shared<State>(name)) {}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <util::StringLiteral StrLit, char Char, typename... Ts>
auto options_description<StrSeq, CharSeq>::add_option(Ts&&... ts) {
  auto out = augment<StrLit, Char>();
  auto option = detail::make_option(full_name<StrLit, Char>(), std::forward<Ts>(ts)...);

  out.state_->full.add(option);
  out.state_->visible.add(option);
  return out;
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <util::StringLiteral StrLit, typename... Ts>
auto options_description<StrSeq, CharSeq>::add_hidden_option(Ts&&... ts) {
  auto out = augment<StrLit>();
  out.state_->full.add(detail::make_option(full_name<StrLit, ' '>(), std::forward<Ts>(ts)...));
  return out;
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <util::StringLiteral TrueStrLit, util::StringLiteral FalseStrLit>
auto options_description<StrSeq, CharSeq>::add_flag(bool* flag, const char* true_help,
                                                    const char* false_help) {
  namespace po = boost::program_options;

  auto out = augment<TrueStrLit>().template augment<FalseStrLit>();

  std::string full_true_help = true_help;
  std::string full_false_help = false_help;
  if (*flag) {
    full_true_help += " (no-op)";
  } else {
    full_false_help += " (no-op)";
  }

  const char* true_name = TrueStrLit.value;
  const char* false_name = FalseStrLit.value;

  out.state_->full.add_options()(true_name, po::value(flag)->implicit_value(true)->zero_tokens(),
                                 full_true_help.c_str())(
    false_name, po::value(flag)->implicit_value(false)->zero_tokens(), full_false_help.c_str());

  if (*flag) {
    out.state_->visible.add_options()(
      false_name, po::value(flag)->implicit_value(false)->zero_tokens(), full_false_help.c_str());
  } else {
    out.state_->visible.add_options()(
      true_name, po::value(flag)->implicit_value(true)->zero_tokens(), full_true_help.c_str());
  }
  return out;
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <typename StrSeq2, util::concepts::IntSequence CharSeq2>
auto options_description<StrSeq, CharSeq>::add(
  const options_description<StrSeq2, CharSeq2>& desc) {
  static_assert(util::no_overlap_v<StrSeq, StrSeq2>, "Options name clash!");
  static_assert(util::no_overlap_v<CharSeq, CharSeq2>, "Options abbreviation clash!");

  using OutT =
    options_description<util::concat_t<StrSeq, StrSeq2>, util::concat_t<CharSeq, CharSeq2>>;

  state_->full.add(desc.state_->full);
  state_->visible.add(desc.state_->visible);
  state_->children.push_back(desc.state_);

  return OutT(state_);
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
void options_description<StrSeq, CharSeq>::print(std::ostream& s) const {
  if (Settings::help_full) {
    state_->full.print(s);
  } else {
    state_->visible.print(s);
  }
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <util::StringLiteral StrLit, char Char>
auto options_description<StrSeq, CharSeq>::augment() const {
  static_assert(!util::contains_v<StrSeq, StrLit>, "Options name clash!");
  constexpr bool kUsingAbbrev = Char != ' ';
  static_assert(!kUsingAbbrev || !util::contains_v<CharSeq, int(Char)>,
                "Options abbreviation clash!");

  using StrSeq2 = util::concat_t<StrSeq, util::StringLiteralSequence<StrLit>>;
  using CharSeq2 =
    std::conditional_t<kUsingAbbrev, util::concat_t<CharSeq, util::int_sequence<int(Char)>>,
                       CharSeq>;
  return options_description<StrSeq2, CharSeq2>(state_);
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <util::StringLiteral StrLit, char Char>
std::string options_description<StrSeq, CharSeq>::full_name() {
  std::string name(StrLit.value);
  if (Char != ' ') {
    name = fmt::format("{},{}", name, Char);
  }
  return name;
}

template <typename T, typename... Ts>
boost::program_options::variables_map parse_args(const T& desc, Ts&&... ts) {
  namespace po = boost::program_options;
  po::variables_map vm;
  try {
    po::store(po::command_line_parser(std::forward<Ts>(ts)...).options(detail::wrap(desc)).run(),
              vm);
    po::notify(vm);
  } catch (const po::error& e) {
    throw util::CleanException("{}", e.what());
  }
  return vm;
}

}  // namespace program_options

}  // namespace boost_util
