// ============================================================================
// unionkit/core/checks.hpp - Named Checks for Filter and Ensure Chains
// ============================================================================
//
// A NamedCheck bundles a predicate with the error that describes its
// violation. The same check serves both deferred-validation builders:
//
//   FilterBuilder (Option path) uses only the predicate.
//   EnsureBuilder (Result path) reports the check's error unless the call
//   site supplies its own.
//
// USAGE:
// ------
//   using namespace unionkit::checks;
//
//   Option<std::string> name = ReadName();
//   Option<std::string> valid = name.Filter()
//       .Check(NotEmpty())
//       .Check(ShorterThanOrEqualTo(64));
//
//   Result<int> age = ParseAge(text).EnsureThat()
//       .Check(NonNegative())
//       .Check(LessThan(150), ValidationError("Age.TooLarge", "Unrealistic age"));
//
// The default errors are Validation errors with stable codes
// ("StringError.Empty", "NumericError.TooSmall", ...).
//
// ============================================================================

#pragma once

#include "unionkit/core/error.hpp"
#include "unionkit/core/invoke.hpp"

#include <algorithm>
#include <chrono>
#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <memory>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace unionkit {

// ============================================================================
// NamedCheck - predicate plus the error reported when it fails
// ============================================================================
template <typename P>
struct NamedCheck {
    P predicate;
    unionkit::Error error;
};

template <typename P>
NamedCheck(P, unionkit::Error) -> NamedCheck<P>;

namespace detail {

template <typename C>
struct IsNamedCheck : std::false_type {};

template <typename P>
struct IsNamedCheck<NamedCheck<P>> : std::true_type {};

}  // namespace detail

template <typename C, typename T>
concept NamedCheckFor = detail::IsNamedCheck<std::remove_cvref_t<C>>::value &&
                        InvocableWith<const decltype(std::declval<C>().predicate)&, const T&>;

namespace checks {

// ============================================================================
// Default errors
// ============================================================================
namespace errors {

namespace detail {

template <typename T>
std::string Describe(const T& value) {
    if constexpr (unionkit::detail::Streamable<T>) {
        std::ostringstream oss;
        oss << value;
        return oss.str();
    } else {
        return "the limit";
    }
}

inline const char* OrEqualTo(bool inclusive) { return inclusive ? "or equal to " : ""; }

}  // namespace detail

// Strings
const Error& StringNotEmpty();
const Error& StringEmpty();
Error StringInvalidLength(size_t length);
Error StringTooShort(size_t length, bool inclusive);
Error StringTooLong(size_t length, bool inclusive);
Error StringNotMatch(std::string_view pattern);
Error StringMatch(std::string_view pattern);
Error StringNotContain(std::string_view value);
Error StringContain(std::string_view value);
Error StringNotStartWith(std::string_view value);
Error StringStartWith(std::string_view value);
Error StringNotEndWith(std::string_view value);
Error StringEndWith(std::string_view value);

// Ordering
template <typename T>
Error TooSmall(const T& min, bool inclusive) {
    return ValidationError("NumericError.TooSmall", "Value must be greater than " +
                                                        std::string(detail::OrEqualTo(inclusive)) +
                                                        detail::Describe(min) + ".");
}

template <typename T>
Error TooLarge(const T& max, bool inclusive) {
    return ValidationError("NumericError.TooLarge", "Value must be less than " +
                                                        std::string(detail::OrEqualTo(inclusive)) +
                                                        detail::Describe(max) + ".");
}

template <typename T>
Error OutOfRange(const T& min, bool min_inclusive, const T& max, bool max_inclusive) {
    return ValidationError("NumericError.OutOfRange",
                           "Value must be greater than " + std::string(detail::OrEqualTo(min_inclusive)) +
                               detail::Describe(min) + " and less than " +
                               std::string(detail::OrEqualTo(max_inclusive)) + detail::Describe(max) + ".");
}

// Sign
const Error& NotPositive();
const Error& NotNegative();
const Error& NotZero();
const Error& Zero();
const Error& Positive();
const Error& Negative();

// Booleans
const Error& NotTrue();
const Error& NotFalse();

// Equality
const Error& NotEqual();
const Error& Equal();

// Time points
Error NotInPast(std::string_view subject);
Error NotInFuture(std::string_view subject);
const Error& DateInPast();
const Error& DateInFuture();

// GUIDs
const Error& GuidNotEmpty();
const Error& GuidEmpty();

// Enums
const Error& EnumNotDefined();

}  // namespace errors

namespace detail {

template <typename V>
concept ZeroComparable = std::totally_ordered<V> && std::default_initializable<V>;

// Integer types std::cmp_less and friends accept.
template <typename T>
concept ComparableInteger = std::integral<T> && !std::same_as<T, bool> && !std::same_as<T, char> &&
                            !std::same_as<T, wchar_t> && !std::same_as<T, char8_t> &&
                            !std::same_as<T, char16_t> && !std::same_as<T, char32_t>;

// Mixed signed/unsigned integers compare by value rather than after the
// usual arithmetic conversions.
template <typename A, typename B>
constexpr bool Less(const A& a, const B& b) {
    if constexpr (ComparableInteger<A> && ComparableInteger<B>) {
        return std::cmp_less(a, b);
    } else {
        return a < b;
    }
}

template <typename A, typename B>
constexpr bool LessOrEqual(const A& a, const B& b) {
    if constexpr (ComparableInteger<A> && ComparableInteger<B>) {
        return std::cmp_less_equal(a, b);
    } else {
        return a <= b;
    }
}

template <typename A, typename B>
constexpr bool Equal(const A& a, const B& b) {
    if constexpr (ComparableInteger<A> && ComparableInteger<B>) {
        return std::cmp_equal(a, b);
    } else {
        return a == b;
    }
}

template <typename G>
concept NilTestable = requires(const G& g) {
    { g.IsNil() } -> std::convertible_to<bool>;
};

template <typename Duration>
constexpr std::string_view TimeSubject() {
    return std::ratio_greater_equal_v<typename Duration::period, std::chrono::days::period> ? "Date" : "DateTime";
}

}  // namespace detail

// ============================================================================
// Strings
// ============================================================================

inline auto Empty() {
    return NamedCheck{[](std::string_view s) { return s.empty(); }, errors::StringNotEmpty()};
}

inline auto NotEmpty() {
    return NamedCheck{[](std::string_view s) { return !s.empty(); }, errors::StringEmpty()};
}

// Non-blank: at least one character that is not whitespace.
inline auto NotBlank() {
    return NamedCheck{[](std::string_view s) { return s.find_first_not_of(" \t\r\n\f\v") != std::string_view::npos; },
                      errors::StringEmpty()};
}

inline auto HasLength(size_t length) {
    return NamedCheck{[length](std::string_view s) { return s.size() == length; },
                      errors::StringInvalidLength(length)};
}

inline auto LongerThan(size_t length) {
    return NamedCheck{[length](std::string_view s) { return s.size() > length; },
                      errors::StringTooShort(length, false)};
}

inline auto LongerThanOrEqualTo(size_t length) {
    return NamedCheck{[length](std::string_view s) { return s.size() >= length; },
                      errors::StringTooShort(length, true)};
}

inline auto ShorterThan(size_t length) {
    return NamedCheck{[length](std::string_view s) { return s.size() < length; },
                      errors::StringTooLong(length, false)};
}

inline auto ShorterThanOrEqualTo(size_t length) {
    return NamedCheck{[length](std::string_view s) { return s.size() <= length; },
                      errors::StringTooLong(length, true)};
}

// ECMAScript syntax; the check passes when the pattern is found anywhere.
// An invalid pattern throws std::regex_error here, at construction.
inline auto Matches(const std::string& pattern) {
    auto regex = std::make_shared<const std::regex>(pattern);
    return NamedCheck{[regex](const std::string& s) { return std::regex_search(s, *regex); },
                      errors::StringNotMatch(pattern)};
}

inline auto NotMatch(const std::string& pattern) {
    auto regex = std::make_shared<const std::regex>(pattern);
    return NamedCheck{[regex](const std::string& s) { return !std::regex_search(s, *regex); },
                      errors::StringMatch(pattern)};
}

inline auto Contains(std::string substring) {
    auto error = errors::StringNotContain(substring);
    return NamedCheck{[substring = std::move(substring)](std::string_view s) {
                          return s.find(substring) != std::string_view::npos;
                      },
                      std::move(error)};
}

inline auto NotContain(std::string substring) {
    auto error = errors::StringContain(substring);
    return NamedCheck{[substring = std::move(substring)](std::string_view s) {
                          return s.find(substring) == std::string_view::npos;
                      },
                      std::move(error)};
}

inline auto StartsWith(std::string prefix) {
    auto error = errors::StringNotStartWith(prefix);
    return NamedCheck{[prefix = std::move(prefix)](std::string_view s) { return s.starts_with(prefix); },
                      std::move(error)};
}

inline auto NotStartWith(std::string prefix) {
    auto error = errors::StringStartWith(prefix);
    return NamedCheck{[prefix = std::move(prefix)](std::string_view s) { return !s.starts_with(prefix); },
                      std::move(error)};
}

inline auto EndsWith(std::string suffix) {
    auto error = errors::StringNotEndWith(suffix);
    return NamedCheck{[suffix = std::move(suffix)](std::string_view s) { return s.ends_with(suffix); },
                      std::move(error)};
}

inline auto NotEndWith(std::string suffix) {
    auto error = errors::StringEndWith(suffix);
    return NamedCheck{[suffix = std::move(suffix)](std::string_view s) { return !s.ends_with(suffix); },
                      std::move(error)};
}

// ============================================================================
// Ordering
// ============================================================================
//
// The limit fixes only the bound. The checked value may be any type ordered
// against it, so GreaterThan(0) accepts 0.5 and int64_t{4294967295}.

template <std::totally_ordered T>
auto GreaterThan(T min) {
    auto error = errors::TooSmall(min, false);
    return NamedCheck{[min = std::move(min)]<std::totally_ordered_with<T> V>(const V& v) { return detail::Less(min, v); },
                      std::move(error)};
}

template <std::totally_ordered T>
auto GreaterThanOrEqualTo(T min) {
    auto error = errors::TooSmall(min, true);
    return NamedCheck{
        [min = std::move(min)]<std::totally_ordered_with<T> V>(const V& v) { return detail::LessOrEqual(min, v); },
        std::move(error)};
}

template <std::totally_ordered T>
auto LessThan(T max) {
    auto error = errors::TooLarge(max, false);
    return NamedCheck{[max = std::move(max)]<std::totally_ordered_with<T> V>(const V& v) { return detail::Less(v, max); },
                      std::move(error)};
}

template <std::totally_ordered T>
auto LessThanOrEqualTo(T max) {
    auto error = errors::TooLarge(max, true);
    return NamedCheck{
        [max = std::move(max)]<std::totally_ordered_with<T> V>(const V& v) { return detail::LessOrEqual(v, max); },
        std::move(error)};
}

template <std::totally_ordered T>
auto InRange(T min, bool min_inclusive, T max, bool max_inclusive) {
    auto error = errors::OutOfRange(min, min_inclusive, max, max_inclusive);
    return NamedCheck{[min = std::move(min), min_inclusive, max = std::move(max),
                       max_inclusive]<std::totally_ordered_with<T> V>(const V& v) {
                          bool above = min_inclusive ? detail::LessOrEqual(min, v) : detail::Less(min, v);
                          bool below = max_inclusive ? detail::LessOrEqual(v, max) : detail::Less(v, max);
                          return above && below;
                      },
                      std::move(error)};
}

// ============================================================================
// Sign - anything ordered whose value-initialized state is zero
// ============================================================================

inline auto Positive() {
    return NamedCheck{[]<detail::ZeroComparable V>(const V& v) { return v > V{}; }, errors::NotPositive()};
}

inline auto Negative() {
    return NamedCheck{[]<detail::ZeroComparable V>(const V& v) { return v < V{}; }, errors::NotNegative()};
}

inline auto Zero() {
    return NamedCheck{[]<detail::ZeroComparable V>(const V& v) { return v == V{}; }, errors::NotZero()};
}

inline auto NonZero() {
    return NamedCheck{[]<detail::ZeroComparable V>(const V& v) { return !(v == V{}); }, errors::Zero()};
}

inline auto NonPositive() {
    return NamedCheck{[]<detail::ZeroComparable V>(const V& v) { return !(v > V{}); }, errors::Positive()};
}

inline auto NonNegative() {
    return NamedCheck{[]<detail::ZeroComparable V>(const V& v) { return !(v < V{}); }, errors::Negative()};
}

// ============================================================================
// Booleans and equality
// ============================================================================

inline auto True() {
    return NamedCheck{[](bool v) { return v; }, errors::NotTrue()};
}

inline auto False() {
    return NamedCheck{[](bool v) { return !v; }, errors::NotFalse()};
}

template <std::equality_comparable T>
auto EqualTo(T expected) {
    return NamedCheck{[expected = std::move(expected)]<std::equality_comparable_with<T> V>(const V& v) {
                          return detail::Equal(v, expected);
                      },
                      errors::NotEqual()};
}

template <std::equality_comparable T>
auto NotEqualTo(T unexpected) {
    return NamedCheck{[unexpected = std::move(unexpected)]<std::equality_comparable_with<T> V>(const V& v) {
                          return !detail::Equal(v, unexpected);
                      },
                      errors::Equal()};
}

// ============================================================================
// Time points
// ============================================================================
//
// "Now" is read from std::chrono::system_clock when the check runs and
// truncated to the check's precision, so InPast<std::chrono::days>() rejects
// today's date while the default precision accepts any earlier instant of
// today. system_clock counts UTC, so "today" is the UTC date: pass local
// dates converted to sys_days, not local_days.

template <typename Duration = std::chrono::system_clock::duration>
auto InPast() {
    using TimePoint = std::chrono::time_point<std::chrono::system_clock, Duration>;
    return NamedCheck{[](const TimePoint& t) { return t < std::chrono::floor<Duration>(std::chrono::system_clock::now()); },
                      errors::NotInPast(detail::TimeSubject<Duration>())};
}

template <typename Duration = std::chrono::system_clock::duration>
auto InFuture() {
    using TimePoint = std::chrono::time_point<std::chrono::system_clock, Duration>;
    return NamedCheck{[](const TimePoint& t) { return t > std::chrono::floor<Duration>(std::chrono::system_clock::now()); },
                      errors::NotInFuture(detail::TimeSubject<Duration>())};
}

template <typename Duration = std::chrono::days>
auto InPastOrPresent() {
    using TimePoint = std::chrono::time_point<std::chrono::system_clock, Duration>;
    return NamedCheck{
        [](const TimePoint& t) { return t <= std::chrono::floor<Duration>(std::chrono::system_clock::now()); },
        errors::DateInFuture()};
}

template <typename Duration = std::chrono::days>
auto InFutureOrPresent() {
    using TimePoint = std::chrono::time_point<std::chrono::system_clock, Duration>;
    return NamedCheck{
        [](const TimePoint& t) { return t >= std::chrono::floor<Duration>(std::chrono::system_clock::now()); },
        errors::DateInPast()};
}

// ============================================================================
// GUIDs - any type with IsNil(), see guid.hpp
// ============================================================================

inline auto Nil() {
    return NamedCheck{[]<detail::NilTestable G>(const G& g) -> bool { return g.IsNil(); }, errors::GuidNotEmpty()};
}

inline auto NotNil() {
    return NamedCheck{[]<detail::NilTestable G>(const G& g) -> bool { return !g.IsNil(); }, errors::GuidEmpty()};
}

// ============================================================================
// Enums
// ============================================================================

// Passes for values whose underlying integer lies in [first, last].
template <typename E>
    requires std::is_enum_v<E>
auto Defined(E first, E last) {
    using Underlying = std::underlying_type_t<E>;
    return NamedCheck{[lo = static_cast<Underlying>(first), hi = static_cast<Underlying>(last)](E v) {
                          auto raw = static_cast<Underlying>(v);
                          return raw >= lo && raw <= hi;
                      },
                      errors::EnumNotDefined()};
}

template <std::equality_comparable T>
auto OneOf(std::initializer_list<T> allowed) {
    return NamedCheck{[allowed = std::vector<T>(allowed)](const T& v) {
                          return std::find(allowed.begin(), allowed.end(), v) != allowed.end();
                      },
                      errors::EnumNotDefined()};
}

}  // namespace checks

}  // namespace unionkit
