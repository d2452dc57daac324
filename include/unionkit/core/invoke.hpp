// ============================================================================
// unionkit/core/invoke.hpp - Payload Invocation with Tuple Destructuring
// ============================================================================
//
// Invoke() calls a user function with the payload of an Option or Result.
// When the payload is a std::tuple / std::pair and the function does not
// accept the tuple itself, the tuple is unpacked into the parameters.
//
// THE PROBLEM:
// ------------
//   auto both = Zip(Some(2), Some(3));            // Option<tuple<int, int>>
//   both.Map([](const std::tuple<int, int>& t) {  // verbose
//       return std::get<0>(t) * std::get<1>(t);
//   });
//
// THE SOLUTION:
// -------------
//   both.Map([](int a, int b) { return a * b; }); // Some(6)
//
// Every combinator that hands the payload to a function goes through
// Invoke(), so the destructuring form works for Map, Bind, Match, Filter,
// Ensure and the observers alike, for tuples of any arity.
//
// ============================================================================

#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <ostream>
#include <tuple>
#include <type_traits>
#include <utility>

namespace unionkit {

namespace detail {

template <typename T>
struct IsTupleLike : std::false_type {};

template <typename... Ts>
struct IsTupleLike<std::tuple<Ts...>> : std::true_type {};

template <typename A, typename B>
struct IsTupleLike<std::pair<A, B>> : std::true_type {};

template <typename F, typename Tuple, size_t... I>
constexpr bool ApplicableImpl(std::index_sequence<I...>) {
    return std::is_invocable_v<F, decltype(std::get<I>(std::declval<Tuple>()))...>;
}

template <typename F, typename Tuple>
concept Applicable =
    IsTupleLike<std::remove_cvref_t<Tuple>>::value &&
    ApplicableImpl<F, Tuple>(std::make_index_sequence<std::tuple_size_v<std::remove_cvref_t<Tuple>>>{});

// Wraps a payload in a tuple so payloads can be concatenated: tuples and
// pairs contribute their elements, anything else contributes itself.
template <typename V>
auto AsTuple(V&& value) {
    using Plain = std::remove_cvref_t<V>;
    if constexpr (IsTupleLike<Plain>::value) {
        return std::apply(
            [](auto&&... elements) {
                return std::tuple<std::remove_cvref_t<decltype(elements)>...>(
                    std::forward<decltype(elements)>(elements)...);
            },
            std::forward<V>(value));
    } else {
        return std::tuple<Plain>(std::forward<V>(value));
    }
}

template <typename T>
concept Streamable = requires(std::ostream& os, const T& value) { os << value; };

template <typename A, typename B>
using ConcatTuple = decltype(std::tuple_cat(AsTuple(std::declval<A>()), AsTuple(std::declval<B>())));

}  // namespace detail

// F can be called with V, either directly or by unpacking a tuple V.
template <typename F, typename V>
concept InvocableWith = std::invocable<F, V> || detail::Applicable<F, V>;

template <typename F, typename V>
    requires InvocableWith<F, V>
constexpr decltype(auto) Invoke(F&& func, V&& value) {
    if constexpr (std::invocable<F, V>) {
        return std::invoke(std::forward<F>(func), std::forward<V>(value));
    } else {
        return std::apply(std::forward<F>(func), std::forward<V>(value));
    }
}

template <typename F, typename V>
using InvokeResultT = decltype(Invoke(std::declval<F>(), std::declval<V>()));

}  // namespace unionkit
