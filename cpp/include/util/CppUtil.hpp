#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <type_traits>
#include <utility>

/*
 * Marks the arguments of a macro as used without evaluating them. The logging macros rely on this
 * so that arguments of compiled-out log statements do not trigger unused-variable warnings.
 */
#define USE_UNEVALUATED(...) ((void)sizeof((util::detail::unevaluated(__VA_ARGS__), 0)))

namespace util {

namespace detail {

template <typename... Ts>
void unevaluated(Ts&&...);

}  // namespace detail

/*
 * Usage:
 *
 * int64_t us = util::us_since_epoch(std::chrono::system_clock::now());
 */
template <typename TimePoint>
int64_t us_since_epoch(const TimePoint& t) {
  return std::chrono::duration_cast<std::chrono::microseconds>(t.time_since_epoch()).count();
}

inline std::chrono::system_clock::time_point from_us_since_epoch(int64_t us) {
  return std::chrono::system_clock::time_point(
    std::chrono::duration_cast<std::chrono::system_clock::duration>(
      std::chrono::microseconds(us)));
}

template <size_t N>
struct StringLiteral {
  constexpr StringLiteral(const char (&str)[N]) { std::copy_n(str, N, value); }
  template <size_t M>
  constexpr bool operator==(const StringLiteral<M>& other) const {
    // strcmp() is not required to be constexpr
    if (N != M) return false;
    for (size_t i = 0; i < N; ++i) {
      if (value[i] != other.value[i]) return false;
    }
    return true;
  }
  char value[N];
};

template <StringLiteral...>
struct StringLiteralSequence {};

template <int... Ints>
using int_sequence = std::integer_sequence<int, Ints...>;

template <typename T>
struct is_int_sequence : std::false_type {};
template <int... Ints>
struct is_int_sequence<int_sequence<Ints...>> : std::true_type {};
template <typename T>
inline constexpr bool is_int_sequence_v = is_int_sequence<T>::value;

namespace concepts {

template <typename T>
concept IntSequence = is_int_sequence_v<T>;

}  // namespace concepts

/*
 * Compile-time set operations on StringLiteralSequence / int_sequence. These back the option-name
 * clash detection in boost_util::program_options.
 *
 * contains_v<util::int_sequence<1, 3>, 3> == true
 * contains_v<util::StringLiteralSequence<"foo">, "bar"> == false
 */
template <typename Seq, auto K>
struct contains : std::false_type {};
template <int... Is, int K>
struct contains<int_sequence<Is...>, K> : std::bool_constant<((Is == K) || ...)> {};
template <StringLiteral... Ss, StringLiteral S>
struct contains<StringLiteralSequence<Ss...>, S> : std::bool_constant<((Ss == S) || ...)> {};
template <typename Seq, auto K>
inline constexpr bool contains_v = contains<Seq, K>::value;

template <typename T, typename U>
struct concat {};
template <int... Is, int... Js>
struct concat<int_sequence<Is...>, int_sequence<Js...>> {
  using type = int_sequence<Is..., Js...>;
};
template <StringLiteral... Ss, StringLiteral... Ts>
struct concat<StringLiteralSequence<Ss...>, StringLiteralSequence<Ts...>> {
  using type = StringLiteralSequence<Ss..., Ts...>;
};
template <typename T, typename U>
using concat_t = concat<T, U>::type;

template <typename T, typename U>
struct no_overlap : std::true_type {};
template <typename T, int... Is>
struct no_overlap<T, int_sequence<Is...>> : std::bool_constant<(!contains_v<T, Is> && ...)> {};
template <typename T, StringLiteral... Ss>
struct no_overlap<T, StringLiteralSequence<Ss...>>
    : std::bool_constant<(!contains_v<T, Ss> && ...)> {};
template <typename T, typename U>
inline constexpr bool no_overlap_v = no_overlap<T, U>::value;

}  // namespace util
