// ============================================================================
// unionkit/core/option.hpp - Option Type for Optional Values
// ============================================================================
//
// Option<T> holds either a value (Some) or nothing (None). It replaces
// nullable pointers and sentinel values with a type that states the absence
// in the signature and forces the caller to deal with it.
//
// DESIGN PHILOSOPHY:
// ------------------
// 1. ONE STATE AT A TIME: the value is only reachable while the option is
//    Some. Value() on None is a checked programming error.
// 2. NEVER MUTATED BY COMBINATORS: Map(), Bind(), Filter() and OrElse()
//    each produce a new Option.
// 3. NO NULLABLE PAYLOADS: T must be a non-pointer object type. Lift a
//    nullable value with Option<T>::From().
//
// USAGE:
// ------
//   Option<int> port = ParsePort(text);
//
//   int effective = port
//       .Filter([](int p) { return p > 1024; })
//       .Map([](int p) { return p + 1; })
//       .ValueOr(8080);
//
//   port.Match(
//       [](int p) { std::cout << "port " << p; },
//       [] { std::cout << "no port"; });
//
// ============================================================================

#pragma once

#include "unionkit/core/check.hpp"
#include "unionkit/core/error.hpp"
#include "unionkit/core/invoke.hpp"

#include <compare>
#include <concepts>
#include <functional>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

namespace unionkit {

template <typename T>
class Option;

template <typename T>
class Result;

template <typename T>
class FilterBuilder;

// Types an Option may hold: object types that cannot themselves be null.
template <typename T>
concept OptionValue = std::is_object_v<T> && !std::is_pointer_v<T> && !std::is_null_pointer_v<T> &&
                      !std::is_array_v<T> && std::same_as<T, std::remove_cv_t<T>>;

namespace detail {

template <typename T>
struct IsOption : std::false_type {};

template <typename T>
struct IsOption<Option<T>> : std::true_type {};

}  // namespace detail

// ============================================================================
// None - the absent value of every Option<T>
// ============================================================================
struct NoneType {
    explicit constexpr NoneType(int) noexcept {}
};

inline constexpr NoneType None{0};

// ============================================================================
// Option<T> - Some(value) or None
// ============================================================================
template <typename T>
class Option {
    static_assert(OptionValue<T>, "Option<T> requires a non-pointer, non-reference object type");

   public:
    using value_type = T;

    // ========================================================================
    // Construction
    // ========================================================================

    constexpr Option() noexcept = default;
    constexpr Option(NoneType) noexcept {}

    template <typename U = T>
        requires(std::constructible_from<T, U> && !std::same_as<std::remove_cvref_t<U>, Option> &&
                 !std::same_as<std::remove_cvref_t<U>, NoneType> &&
                 !std::same_as<std::remove_cvref_t<U>, FilterBuilder<T>>)
    constexpr explicit(!std::is_convertible_v<U, T>) Option(U&& value)
        : value_(std::in_place, std::forward<U>(value)) {}

    Option(const Option&) = default;
    Option(Option&&) = default;
    Option& operator=(const Option&) = default;
    Option& operator=(Option&&) = default;

    // Lifts a nullable pointer: null -> None, otherwise Some(copy of *value).
    static Option From(const T* value) { return value != nullptr ? Option(*value) : Option(); }

    static Option From(const std::optional<T>& value) { return value.has_value() ? Option(*value) : Option(); }

    // ========================================================================
    // Observers
    // ========================================================================

    bool IsSome() const noexcept { return value_.has_value(); }
    bool IsNone() const noexcept { return !value_.has_value(); }

    explicit operator bool() const noexcept { return IsSome(); }

    // ========================================================================
    // Accessors
    // ========================================================================

    // Unchecked in spirit: calling these on None aborts the process.
    const T& Value() const& {
        UNIONKIT_CHECK(IsSome(), "Option is None");
        return *value_;
    }
    T& Value() & {
        UNIONKIT_CHECK(IsSome(), "Option is None");
        return *value_;
    }
    T&& Value() && {
        UNIONKIT_CHECK(IsSome(), "Option is None");
        return std::move(*value_);
    }

    T ValueOr(T default_value) const& {
        if (IsSome()) return *value_;
        return default_value;
    }

    T ValueOr(T default_value) && {
        if (IsSome()) return std::move(*value_);
        return default_value;
    }

    template <typename F>
        requires std::invocable<F> && std::convertible_to<std::invoke_result_t<F>, T>
    T ValueOrElse(F&& factory) const& {
        if (IsSome()) return *value_;
        return std::invoke(std::forward<F>(factory));
    }

    bool TryGetValue(T& out) const {
        if (IsNone()) return false;
        out = *value_;
        return true;
    }

    // ========================================================================
    // Combinators
    // ========================================================================

    // Map: Transform the value, None propagates
    template <typename F>
        requires InvocableWith<F, const T&>
    auto Map(F&& func) const& -> Option<std::remove_cvref_t<InvokeResultT<F, const T&>>> {
        if (IsSome()) return Invoke(std::forward<F>(func), *value_);
        return None;
    }

    template <typename F>
        requires InvocableWith<F, T&&>
    auto Map(F&& func) && -> Option<std::remove_cvref_t<InvokeResultT<F, T&&>>> {
        if (IsSome()) return Invoke(std::forward<F>(func), std::move(*value_));
        return None;
    }

    // Bind: Chain an operation that itself returns an Option
    template <typename F>
        requires InvocableWith<F, const T&>
    auto Bind(F&& func) const& -> std::remove_cvref_t<InvokeResultT<F, const T&>> {
        using Next = std::remove_cvref_t<InvokeResultT<F, const T&>>;
        static_assert(detail::IsOption<Next>::value, "Bind() requires a function returning an Option");
        if (IsSome()) return Invoke(std::forward<F>(func), *value_);
        return Next();
    }

    template <typename F>
        requires InvocableWith<F, T&&>
    auto Bind(F&& func) && -> std::remove_cvref_t<InvokeResultT<F, T&&>> {
        using Next = std::remove_cvref_t<InvokeResultT<F, T&&>>;
        static_assert(detail::IsOption<Next>::value, "Bind() requires a function returning an Option");
        if (IsSome()) return Invoke(std::forward<F>(func), std::move(*value_));
        return Next();
    }

    // Match: Exactly one branch runs
    template <typename S, typename N>
        requires InvocableWith<S, const T&> && std::invocable<N>
    auto Match(S&& on_some, N&& on_none) const
        -> std::common_type_t<InvokeResultT<S, const T&>, std::invoke_result_t<N>> {
        if (IsSome()) return Invoke(std::forward<S>(on_some), *value_);
        return std::invoke(std::forward<N>(on_none));
    }

    // Filter: Keep the value only if the predicate holds
    template <typename P>
        requires InvocableWith<P, const T&>
    Option Filter(P&& predicate) const& {
        if (IsNone() || Invoke(std::forward<P>(predicate), *value_)) return *this;
        return None;
    }

    // Filter: Start a chain of checks, see filter_builder.hpp
    FilterBuilder<T> Filter() const& { return FilterBuilder<T>(value_); }
    FilterBuilder<T> Filter() && { return FilterBuilder<T>(std::move(value_)); }

    // OrElse: Fall back to another Option when None
    Option OrElse(const Option& fallback) const& {
        if (IsSome()) return *this;
        return fallback;
    }

    template <typename F>
        requires std::invocable<F> && std::convertible_to<std::invoke_result_t<F>, Option>
    Option OrElse(F&& fallback_factory) const& {
        if (IsSome()) return *this;
        return std::invoke(std::forward<F>(fallback_factory));
    }

    // Flatten: Option<Option<U>> -> Option<U>
    auto Flatten() const&
        requires detail::IsOption<T>::value
    {
        if (IsSome()) return *value_;
        return T();
    }

    // ========================================================================
    // Observers with side effects, the option is returned unchanged
    // ========================================================================

    template <typename F>
        requires InvocableWith<F, const T&>
    Option OnSome(F&& action) const& {
        if (IsSome()) Invoke(std::forward<F>(action), *value_);
        return *this;
    }

    template <typename F>
        requires std::invocable<F>
    Option OnNone(F&& action) const& {
        if (IsNone()) std::invoke(std::forward<F>(action));
        return *this;
    }

    template <typename S, typename N>
        requires InvocableWith<S, const T&> && std::invocable<N>
    Option OnEither(S&& on_some, N&& on_none) const& {
        if (IsSome()) {
            Invoke(std::forward<S>(on_some), *value_);
        } else {
            std::invoke(std::forward<N>(on_none));
        }
        return *this;
    }

    // ========================================================================
    // Conversions to Result, defined in result.hpp
    // ========================================================================

    // Some(v) -> success(v), None -> failure(error)
    Result<T> ToResult(const unionkit::Error& error = OptionNoneError()) const&;
    Result<T> ToResult(const unionkit::Error& error = OptionNoneError()) &&;

    Result<T> EnsureSome(const unionkit::Error& error = OptionNoneError()) const&;

    // None -> success, Some(v) -> failure(error)
    Result<void> EnsureNone(const unionkit::Error& error = OptionSomeError()) const;

    std::string ToString() const
        requires detail::Streamable<T>
    {
        if (IsNone()) return "None";
        std::ostringstream oss;
        oss << "Some(" << *value_ << ")";
        return oss.str();
    }

   private:
    template <typename U>
    friend class FilterBuilder;

    explicit Option(std::optional<T>&& value) : value_(std::move(value)) {}

    std::optional<T> value_;
};

// ============================================================================
// Factories
// ============================================================================

template <typename T>
Option<std::decay_t<T>> Some(T&& value) {
    return Option<std::decay_t<T>>(std::forward<T>(value));
}

// Zip: Some(tuple) only when every input is Some
template <typename T1, typename T2, typename... Ts>
Option<std::tuple<T1, T2, Ts...>> Zip(const Option<T1>& first, const Option<T2>& second, const Option<Ts>&... rest) {
    if (first.IsNone() || second.IsNone() || (rest.IsNone() || ...)) return None;
    return std::tuple<T1, T2, Ts...>(first.Value(), second.Value(), rest.Value()...);
}

// ============================================================================
// Comparison Operators
// ============================================================================

template <typename T>
bool operator==(const Option<T>& lhs, const Option<T>& rhs) {
    if (lhs.IsSome() && rhs.IsSome()) return lhs.Value() == rhs.Value();
    return lhs.IsNone() && rhs.IsNone();
}

template <typename T>
bool operator==(const Option<T>& lhs, const std::type_identity_t<T>& rhs) {
    return lhs.IsSome() && lhs.Value() == rhs;
}

template <typename T>
bool operator==(const Option<T>& lhs, NoneType) {
    return lhs.IsNone();
}

// None orders before every Some.
template <typename T>
    requires std::three_way_comparable<T>
std::compare_three_way_result_t<T> operator<=>(const Option<T>& lhs, const Option<T>& rhs) {
    if (lhs.IsSome() && rhs.IsSome()) return lhs.Value() <=> rhs.Value();
    return lhs.IsSome() <=> rhs.IsSome();
}

template <typename T>
    requires detail::Streamable<T>
std::ostream& operator<<(std::ostream& os, const Option<T>& option) {
    return os << option.ToString();
}

}  // namespace unionkit

#include "unionkit/core/filter_builder.hpp"

// Option <-> Result conversions live with Result.
#include "unionkit/core/result.hpp"
