#pragma once

#include <algorithm>
#include <cstddef>
#include <tuple>
#include <type_traits>
#include <utility>

#define XSTR(a) STR(a)
#define STR(a) #a

/*
 * True iff the macro is defined to 1. CMakeLists.txt passes build switches as -DFOO=0 / -DFOO=1;
 * an undefined macro stringizes to its own name and so also counts as disabled.
 *
 * if (IS_MACRO_ENABLED(DEBUG_BUILD)) { ... }
 */
#define IS_MACRO_ENABLED(macro) (XSTR(macro)[0] == '1')

/*
 * Type-checks the expressions without evaluating them. Compiled-out macros such as LOG_DEBUG()
 * use this so that their arguments still count as used.
 */
#define USE_UNEVALUATED(...) static_cast<void>(sizeof(decltype(std::make_tuple(__VA_ARGS__))))

namespace util {

/*
 * A string literal usable as a template argument:
 *
 * template <util::StringLiteral S> void f();
 * f<"board-size">();
 */
template <size_t N>
struct StringLiteral {
  constexpr StringLiteral(const char (&str)[N]) { std::copy_n(str, N, value); }

  // std::strcmp() is not constexpr
  template <size_t M>
  constexpr bool operator==(const StringLiteral<M>& other) const {
    if constexpr (N != M) {
      return false;
    } else {
      return std::equal(value, value + N, other.value);
    }
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

namespace concepts {

template <typename T>
concept IntSequence = is_int_sequence<T>::value;

}  // namespace concepts

template <typename Seq, int K>
struct int_sequence_contains : std::false_type {};
template <int... Ints, int K>
struct int_sequence_contains<int_sequence<Ints...>, K>
    : std::bool_constant<((Ints == K) || ...)> {};
template <typename Seq, int K>
constexpr bool int_sequence_contains_v = int_sequence_contains<Seq, K>::value;

template <typename Seq, StringLiteral S>
struct string_literal_sequence_contains : std::false_type {};
template <StringLiteral... Strs, StringLiteral S>
struct string_literal_sequence_contains<StringLiteralSequence<Strs...>, S>
    : std::bool_constant<((Strs == S) || ...)> {};
template <typename Seq, StringLiteral S>
constexpr bool string_literal_sequence_contains_v = string_literal_sequence_contains<Seq, S>::value;

// concat_int_sequence_t<int_sequence<1, 2>, int_sequence<3>> is int_sequence<1, 2, 3>
template <typename T, typename U>
struct concat_int_sequence {};
template <int... Ints1, int... Ints2>
struct concat_int_sequence<int_sequence<Ints1...>, int_sequence<Ints2...>> {
  using type = int_sequence<Ints1..., Ints2...>;
};
template <typename T, typename U>
using concat_int_sequence_t = typename concat_int_sequence<T, U>::type;

// Same as concat_int_sequence_t, for StringLiteralSequence
template <typename T, typename U>
struct concat_string_literal_sequence {};
template <StringLiteral... Strs1, StringLiteral... Strs2>
struct concat_string_literal_sequence<StringLiteralSequence<Strs1...>,
                                      StringLiteralSequence<Strs2...>> {
  using type = StringLiteralSequence<Strs1..., Strs2...>;
};
template <typename T, typename U>
using concat_string_literal_sequence_t = typename concat_string_literal_sequence<T, U>::type;

/*
 * no_overlap_v<T, U> is true iff the two sequences (both int_sequence or both
 * StringLiteralSequence) share no element.
 */
template <typename T, typename U>
struct no_overlap : std::true_type {};
template <typename T, StringLiteral... Strs>
struct no_overlap<T, StringLiteralSequence<Strs...>>
    : std::bool_constant<(!string_literal_sequence_contains_v<T, Strs> && ...)> {};
template <typename T, int... Ints>
struct no_overlap<T, int_sequence<Ints...>>
    : std::bool_constant<(!int_sequence_contains_v<T, Ints> && ...)> {};
template <typename T, typename U>
constexpr bool no_overlap_v = no_overlap<T, U>::value;

}  // namespace util
