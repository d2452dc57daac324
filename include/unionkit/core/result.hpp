// ============================================================================
// unionkit/core/result.hpp - Result Type for Error Handling
// ============================================================================
//
// Result<T> is a discriminated union that holds either a success value (T)
// or an Error. Result<void> is the valueless variant: success carries no
// payload at all.
//
// DESIGN PHILOSOPHY:
// ------------------
// 1. EXPLICIT ERRORS: failures are part of the return type, not exceptions
// 2. FORCE HANDLING: Value() and Error() are checked; use Match(),
//    ValueOr() or TryGetValue() when the state is not known
// 3. TWO COMPOSITION FAMILIES:
//      short-circuit - Map, Bind, Ensure, Combine, Sequence
//                      (the first failure wins, nothing after it runs)
//      accumulate    - BindAll, EnsureAll, CollectAll
//                      (every operand is evaluated, failures are merged
//                       by ErrorBuilder into one aggregate)
//
// USAGE:
// ------
//   Result<int> Divide(int a, int b) {
//       if (b == 0) return ValidationError("Math.DivideByZero", "division by zero");
//       return a / b;
//   }
//
//   auto text = Divide(10, 2)
//       .Ensure([](int v) { return v < 100; }, ValidationError("too large"))
//       .Map([](int v) { return std::to_string(v); })
//       .Match([](const std::string& s) { return s; },
//              [](const Error& e) { return e.Message(); });
//
// THE ESCAPE HATCH:
// -----------------
// GetValueOrThrow() and ThrowIfFailure() are the only members that throw.
// They exist for the boundary where a failure really is fatal to the
// caller; nothing else in the library raises.
//
// ============================================================================

#pragma once

#include "unionkit/core/check.hpp"
#include "unionkit/core/checks.hpp"
#include "unionkit/core/error.hpp"
#include "unionkit/core/error_builder.hpp"
#include "unionkit/core/invoke.hpp"
#include "unionkit/core/option.hpp"

#include <concepts>
#include <functional>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

namespace unionkit {

template <typename T>
class Result;

template <typename T>
class EnsureBuilder;

namespace detail {

template <typename T>
struct IsResult : std::false_type {};

template <typename T>
struct IsResult<Result<T>> : std::true_type {};

// Bind() with a valueless continuation keeps the original value.
template <typename Next, typename T>
using BindResultT = std::conditional_t<std::is_same_v<Next, Result<void>>, Result<T>, Next>;

// A valueless continuation on an rvalue result sees the value as const&, since
// the value is kept; one that only takes T&& cannot bind.
template <typename F, typename T>
concept RvalueBindable =
    InvocableWith<F, T&&> &&
    (!std::is_same_v<std::remove_cvref_t<InvokeResultT<F, T&&>>, Result<void>> || InvocableWith<F, const T&>);

template <typename T, typename Next>
using AppendResultT = Result<ConcatTuple<T, typename Next::value_type>>;

}  // namespace detail

// ============================================================================
// Ok and Err Tag Types
// ============================================================================
// These allow type deduction in factory functions

template <typename T>
struct OkTag {
    T value;

    template <typename U>
    explicit OkTag(U&& v) : value(std::forward<U>(v)) {}
};

struct ErrTag {
    Error error;

    explicit ErrTag(Error e) : error(std::move(e)) {}
};

template <typename T>
OkTag<std::decay_t<T>> Ok(T&& value) {
    return OkTag<std::decay_t<T>>(std::forward<T>(value));
}

// Unit type for Result<void>
struct Unit {};

inline OkTag<Unit> Ok() {
    return OkTag<Unit>(Unit{});
}

inline ErrTag Err(Error error) {
    return ErrTag(std::move(error));
}

// ============================================================================
// Result<void> - Success without a value, or an Error
// ============================================================================
// Defined ahead of the primary template, whose members refer to it.

template <>
class Result<void> {
   public:
    using value_type = void;

    Result(OkTag<Unit>&&) noexcept {}
    Result(ErrTag&& err) : error_(std::move(err.error)) {}

    Result(const unionkit::Error& error) : error_(error) {}
    Result(unionkit::Error&& error) : error_(std::move(error)) {}

    // Drops the value of a value-carrying result, keeping the state.
    template <typename U>
        requires(!std::is_void_v<U>)
    explicit Result(const Result<U>& other) {
        if (other.IsFailure()) error_ = other.Error();
    }

    Result(const Result&) = default;
    Result(Result&&) = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) = default;

    // ========================================================================
    // Observers
    // ========================================================================

    bool IsSuccess() const noexcept { return !error_.has_value(); }
    bool IsFailure() const noexcept { return error_.has_value(); }

    explicit operator bool() const noexcept { return IsSuccess(); }

    const unionkit::Error& Error() const& {
        UNIONKIT_CHECK(IsFailure(), "Result is not in a failure state");
        return *error_;
    }
    unionkit::Error&& Error() && {
        UNIONKIT_CHECK(IsFailure(), "Result is not in a failure state");
        return std::move(*error_);
    }

    bool TryGetError(unionkit::Error& out) const {
        if (IsSuccess()) return false;
        out = *error_;
        return true;
    }

    // ========================================================================
    // Combinators
    // ========================================================================

    // Map: Produce a value on success
    template <typename F>
        requires std::invocable<F>
    auto Map(F&& func) const -> Result<std::remove_cvref_t<std::invoke_result_t<F>>> {
        using U = std::remove_cvref_t<std::invoke_result_t<F>>;
        if (IsFailure()) return Err(*error_);
        if constexpr (std::is_void_v<U>) {
            std::invoke(std::forward<F>(func));
            return Ok();
        } else {
            return Ok(std::invoke(std::forward<F>(func)));
        }
    }

    // Bind: Chain an operation that returns a Result
    template <typename F>
        requires std::invocable<F>
    auto Bind(F&& func) const -> std::remove_cvref_t<std::invoke_result_t<F>> {
        using Next = std::remove_cvref_t<std::invoke_result_t<F>>;
        static_assert(detail::IsResult<Next>::value, "Bind() requires a function returning a Result");
        if (IsFailure()) return Err(*error_);
        return std::invoke(std::forward<F>(func));
    }

    template <typename S, typename E>
        requires std::invocable<S> && std::invocable<E, const unionkit::Error&>
    auto Match(S&& on_success, E&& on_failure) const
        -> std::common_type_t<std::invoke_result_t<S>, std::invoke_result_t<E, const unionkit::Error&>> {
        if (IsSuccess()) return std::invoke(std::forward<S>(on_success));
        return std::invoke(std::forward<E>(on_failure), *error_);
    }

    template <typename F>
        requires std::invocable<F, const unionkit::Error&>
    Result MapError(F&& func) const {
        if (IsSuccess()) return *this;
        return unionkit::Error(std::invoke(std::forward<F>(func), *error_));
    }

    // Ensure: Fail with error unless predicate() holds. Failures pass through.
    template <typename P>
        requires std::invocable<P>
    Result Ensure(P&& predicate, const unionkit::Error& error) const {
        if (IsFailure()) return *this;
        if (std::invoke(std::forward<P>(predicate))) return *this;
        return error;
    }

    // EnsureAll: Like Ensure, but the new error joins an existing failure.
    Result EnsureAll(bool condition, const unionkit::Error& error) const {
        if (condition) return *this;
        ErrorBuilder errors;
        errors.AppendOnFailure(*this).Append(error);
        return errors.Build();
    }

    // BindAll: Accumulate the failures of both results.
    template <typename U>
    Result<U> BindAll(const Result<U>& next) const {
        if (IsSuccess()) return next;
        ErrorBuilder errors;
        errors.Append(*error_).AppendOnFailure(next);
        return errors.Build();
    }

    // WithValue: Promote a success into a value-carrying result
    template <typename V>
        requires(!std::invocable<V>)
    Result<std::decay_t<V>> WithValue(V&& value) const {
        if (IsFailure()) return Err(*error_);
        return Ok(std::forward<V>(value));
    }

    template <typename F>
        requires std::invocable<F>
    auto WithValue(F&& factory) const -> Result<std::remove_cvref_t<std::invoke_result_t<F>>> {
        if (IsFailure()) return Err(*error_);
        return Ok(std::invoke(std::forward<F>(factory)));
    }

    // OrElse: Recover from a failure
    template <typename F>
        requires std::invocable<F, const unionkit::Error&>
    Result OrElse(F&& recover) const {
        if (IsSuccess()) return *this;
        return std::invoke(std::forward<F>(recover), *error_);
    }

    // ========================================================================
    // Observers with side effects, the result is returned unchanged
    // ========================================================================

    template <typename F>
        requires std::invocable<F>
    Result OnSuccess(F&& action) const {
        if (IsSuccess()) std::invoke(std::forward<F>(action));
        return *this;
    }

    template <typename F>
        requires std::invocable<F, const unionkit::Error&>
    Result OnFailure(F&& action) const {
        if (IsFailure()) std::invoke(std::forward<F>(action), *error_);
        return *this;
    }

    template <typename S, typename E>
        requires std::invocable<S> && std::invocable<E, const unionkit::Error&>
    Result OnEither(S&& on_success, E&& on_failure) const {
        if (IsSuccess()) {
            std::invoke(std::forward<S>(on_success));
        } else {
            std::invoke(std::forward<E>(on_failure), *error_);
        }
        return *this;
    }

    // Tap: Observe the whole result
    template <typename F>
        requires std::invocable<F, const Result&>
    Result Tap(F&& action) const {
        std::invoke(std::forward<F>(action), *this);
        return *this;
    }

    // ========================================================================
    // Escape hatch
    // ========================================================================

    // Throws std::runtime_error(message) on failure.
    void ThrowIfFailure() const {
        if (IsFailure()) throw std::runtime_error(error_->Message());
    }

    // Throws selector(error) on failure.
    template <typename S>
        requires std::invocable<S, const unionkit::Error&>
    void ThrowIfFailure(S&& selector) const {
        if (IsFailure()) throw std::invoke(std::forward<S>(selector), *error_);
    }

    std::string ToString() const {
        if (IsSuccess()) return "Success";
        return "Failure: " + error_->ToString();
    }

   private:
    std::optional<unionkit::Error> error_;
};

// ============================================================================
// Result<T> - Success or Error
// ============================================================================
template <typename T>
class Result {
    static_assert(std::is_object_v<T> && !std::is_array_v<T>, "Result<T> requires an object type");
    static_assert(!std::is_same_v<std::remove_cv_t<T>, unionkit::Error>, "Result<Error> is ambiguous");

   public:
    using value_type = T;

    // ========================================================================
    // Construction
    // ========================================================================

    template <typename U>
        requires std::constructible_from<T, U&&>
    Result(OkTag<U>&& ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}

    Result(ErrTag&& err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    // A value converts to success, an Error to failure.
    template <typename U = T>
        requires(std::constructible_from<T, U> && !std::same_as<std::remove_cvref_t<U>, Result> &&
                 !std::same_as<std::remove_cvref_t<U>, unionkit::Error> &&
                 !std::same_as<std::remove_cvref_t<U>, ErrTag> &&
                 !std::same_as<std::remove_cvref_t<U>, EnsureBuilder<T>>)
    explicit(!std::is_convertible_v<U, T>) Result(U&& value) : data_(std::in_place_index<0>, std::forward<U>(value)) {}

    Result(const unionkit::Error& error) : data_(std::in_place_index<1>, error) {}
    Result(unionkit::Error&& error) : data_(std::in_place_index<1>, std::move(error)) {}

    Result(const Result&) = default;
    Result(Result&&) = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) = default;

    // ========================================================================
    // Observers
    // ========================================================================

    bool IsSuccess() const noexcept { return data_.index() == 0; }
    bool IsFailure() const noexcept { return data_.index() == 1; }

    explicit operator bool() const noexcept { return IsSuccess(); }

    // ========================================================================
    // Accessors
    // ========================================================================

    // Calling these in the wrong state aborts the process.
    T& Value() & {
        UNIONKIT_CHECK(IsSuccess(), "Result is not in a success state");
        return std::get<0>(data_);
    }
    const T& Value() const& {
        UNIONKIT_CHECK(IsSuccess(), "Result is not in a success state");
        return std::get<0>(data_);
    }
    T&& Value() && {
        UNIONKIT_CHECK(IsSuccess(), "Result is not in a success state");
        return std::get<0>(std::move(data_));
    }

    const unionkit::Error& Error() const& {
        UNIONKIT_CHECK(IsFailure(), "Result is not in a failure state");
        return std::get<1>(data_);
    }
    unionkit::Error&& Error() && {
        UNIONKIT_CHECK(IsFailure(), "Result is not in a failure state");
        return std::get<1>(std::move(data_));
    }

    // Safe accessors
    T ValueOr(T default_value) const& {
        if (IsSuccess()) return std::get<0>(data_);
        return default_value;
    }

    T ValueOr(T default_value) && {
        if (IsSuccess()) return std::get<0>(std::move(data_));
        return default_value;
    }

    bool TryGetValue(T& out) const {
        if (IsFailure()) return false;
        out = std::get<0>(data_);
        return true;
    }

    bool TryGetError(unionkit::Error& out) const {
        if (IsSuccess()) return false;
        out = std::get<1>(data_);
        return true;
    }

    // ========================================================================
    // Combinators
    // ========================================================================

    // Map: Transform success value. A void function yields Result<void>.
    template <typename F>
        requires InvocableWith<F, const T&>
    auto Map(F&& func) const& -> Result<std::remove_cvref_t<InvokeResultT<F, const T&>>> {
        using U = std::remove_cvref_t<InvokeResultT<F, const T&>>;
        if (IsFailure()) return Err(std::get<1>(data_));
        if constexpr (std::is_void_v<U>) {
            Invoke(std::forward<F>(func), std::get<0>(data_));
            return Ok();
        } else {
            return Ok(Invoke(std::forward<F>(func), std::get<0>(data_)));
        }
    }

    template <typename F>
        requires InvocableWith<F, T&&>
    auto Map(F&& func) && -> Result<std::remove_cvref_t<InvokeResultT<F, T&&>>> {
        using U = std::remove_cvref_t<InvokeResultT<F, T&&>>;
        if (IsFailure()) return Err(std::get<1>(std::move(data_)));
        if constexpr (std::is_void_v<U>) {
            Invoke(std::forward<F>(func), std::get<0>(std::move(data_)));
            return Ok();
        } else {
            return Ok(Invoke(std::forward<F>(func), std::get<0>(std::move(data_))));
        }
    }

    // MapError: Transform the error
    template <typename F>
        requires std::invocable<F, const unionkit::Error&>
    Result MapError(F&& func) const& {
        if (IsSuccess()) return *this;
        return unionkit::Error(std::invoke(std::forward<F>(func), std::get<1>(data_)));
    }

    // Bind: Chain an operation that returns a Result. When it returns
    // Result<void>, its success keeps this result's value.
    template <typename F>
        requires InvocableWith<F, const T&>
    auto Bind(F&& func) const& -> detail::BindResultT<std::remove_cvref_t<InvokeResultT<F, const T&>>, T> {
        using Next = std::remove_cvref_t<InvokeResultT<F, const T&>>;
        static_assert(detail::IsResult<Next>::value, "Bind() requires a function returning a Result");
        if (IsFailure()) return Err(std::get<1>(data_));
        if constexpr (std::is_same_v<Next, Result<void>>) {
            Result<void> next = Invoke(std::forward<F>(func), std::get<0>(data_));
            if (next.IsFailure()) return Err(std::move(next).Error());
            return *this;
        } else {
            return Invoke(std::forward<F>(func), std::get<0>(data_));
        }
    }

    template <typename F>
        requires detail::RvalueBindable<F, T>
    auto Bind(F&& func) && -> detail::BindResultT<std::remove_cvref_t<InvokeResultT<F, T&&>>, T> {
        using Next = std::remove_cvref_t<InvokeResultT<F, T&&>>;
        static_assert(detail::IsResult<Next>::value, "Bind() requires a function returning a Result");
        if (IsFailure()) return Err(std::get<1>(std::move(data_)));
        if constexpr (std::is_same_v<Next, Result<void>>) {
            Result<void> next = Invoke(std::forward<F>(func), std::as_const(std::get<0>(data_)));
            if (next.IsFailure()) return Err(std::move(next).Error());
            return std::move(*this);
        } else {
            return Invoke(std::forward<F>(func), std::get<0>(std::move(data_)));
        }
    }

    // Match: Exactly one branch runs
    template <typename S, typename E>
        requires InvocableWith<S, const T&> && std::invocable<E, const unionkit::Error&>
    auto Match(S&& on_success, E&& on_failure) const
        -> std::common_type_t<InvokeResultT<S, const T&>, std::invoke_result_t<E, const unionkit::Error&>> {
        if (IsSuccess()) return Invoke(std::forward<S>(on_success), std::get<0>(data_));
        return std::invoke(std::forward<E>(on_failure), std::get<1>(data_));
    }

    // Ensure: Keep a success only if predicate holds, else fail with error.
    // A failure passes through untouched and the predicate does not run.
    template <typename P>
        requires InvocableWith<P, const T&>
    Result Ensure(P&& predicate, const unionkit::Error& error) const& {
        if (IsFailure()) return *this;
        if (Invoke(std::forward<P>(predicate), std::get<0>(data_))) return *this;
        return error;
    }

    template <typename C>
        requires NamedCheckFor<C, T>
    Result Ensure(const C& check) const& {
        return Ensure(check.predicate, check.error);
    }

    template <typename C>
        requires NamedCheckFor<C, T>
    Result Ensure(const C& check, const unionkit::Error& error) const& {
        return Ensure(check.predicate, error);
    }

    // EnsureAll: On a false condition, fail with error joined to any
    // failure already present.
    Result EnsureAll(bool condition, const unionkit::Error& error) const& {
        if (condition) return *this;
        ErrorBuilder errors;
        errors.AppendOnFailure(*this).Append(error);
        return errors.Build();
    }

    // EnsureThat: Start a chain of checks, see ensure_builder.hpp
    EnsureBuilder<T> EnsureThat() const& { return EnsureBuilder<T>(*this); }
    EnsureBuilder<T> EnsureThat() && { return EnsureBuilder<T>(std::move(*this)); }

    // BindAll: Accumulate the failures of this result and next. With a
    // Result<void>, success keeps this value; otherwise next's value wins.
    template <typename U>
    auto BindAll(const Result<U>& next) const& -> std::conditional_t<std::is_void_v<U>, Result, Result<U>> {
        if constexpr (std::is_void_v<U>) {
            if (next.IsSuccess()) return *this;
            ErrorBuilder errors;
            errors.AppendOnFailure(*this).Append(next.Error());
            return errors.Build();
        } else {
            if (IsSuccess()) return next;
            ErrorBuilder errors;
            errors.Append(std::get<1>(data_)).AppendOnFailure(next);
            return errors.Build();
        }
    }

    // BindAppend: Chain an operation and keep both values as one tuple.
    //   Result<int>  + (int -> Result<std::string>)  -> Result<tuple<int, std::string>>
    //   Result<tuple<int, bool>> + ... -> Result<tuple<int, bool, ...>>
    template <typename F>
        requires InvocableWith<F, const T&>
    auto BindAppend(F&& func) const& -> detail::AppendResultT<T, std::remove_cvref_t<InvokeResultT<F, const T&>>> {
        using Next = std::remove_cvref_t<InvokeResultT<F, const T&>>;
        static_assert(detail::IsResult<Next>::value && !std::is_same_v<Next, Result<void>>,
                      "BindAppend() requires a function returning a value-carrying Result");
        if (IsFailure()) return Err(std::get<1>(data_));
        Next next = Invoke(std::forward<F>(func), std::get<0>(data_));
        if (next.IsFailure()) return Err(std::move(next).Error());
        return std::tuple_cat(detail::AsTuple(std::get<0>(data_)), detail::AsTuple(std::move(next).Value()));
    }

    // BindAllAppend: Like BindAppend over a ready result, accumulating
    // the failures of both.
    template <typename U>
        requires(!std::is_void_v<U>)
    auto BindAllAppend(const Result<U>& next) const& -> Result<detail::ConcatTuple<T, U>> {
        if (IsSuccess() && next.IsSuccess()) {
            return std::tuple_cat(detail::AsTuple(std::get<0>(data_)), detail::AsTuple(next.Value()));
        }
        ErrorBuilder errors;
        errors.AppendOnFailure(*this).AppendOnFailure(next);
        return errors.Build();
    }

    // OrElse: Recover from a failure
    Result OrElse(const Result& fallback) const& {
        if (IsSuccess()) return *this;
        return fallback;
    }

    template <typename F>
        requires std::invocable<F, const unionkit::Error&>
    Result OrElse(F&& recover) const& {
        if (IsSuccess()) return *this;
        return std::invoke(std::forward<F>(recover), std::get<1>(data_));
    }

    // ========================================================================
    // Observers with side effects, the result is returned unchanged
    // ========================================================================

    template <typename F>
        requires InvocableWith<F, const T&>
    Result OnSuccess(F&& action) const& {
        if (IsSuccess()) Invoke(std::forward<F>(action), std::get<0>(data_));
        return *this;
    }

    template <typename F>
        requires std::invocable<F, const unionkit::Error&>
    Result OnFailure(F&& action) const& {
        if (IsFailure()) std::invoke(std::forward<F>(action), std::get<1>(data_));
        return *this;
    }

    template <typename S, typename E>
        requires InvocableWith<S, const T&> && std::invocable<E, const unionkit::Error&>
    Result OnEither(S&& on_success, E&& on_failure) const& {
        if (IsSuccess()) {
            Invoke(std::forward<S>(on_success), std::get<0>(data_));
        } else {
            std::invoke(std::forward<E>(on_failure), std::get<1>(data_));
        }
        return *this;
    }

    // Tap: Observe the whole result
    template <typename F>
        requires std::invocable<F, const Result&>
    Result Tap(F&& action) const& {
        std::invoke(std::forward<F>(action), *this);
        return *this;
    }

    // ========================================================================
    // Conversions
    // ========================================================================

    Result<void> DiscardValue() const { return Result<void>(*this); }

    // Success -> Some(value), failure -> None. The error is dropped.
    Option<T> ToOption() const& {
        if (IsSuccess()) return std::get<0>(data_);
        return None;
    }

    Option<T> ToOption() && {
        if (IsSuccess()) return std::get<0>(std::move(data_));
        return None;
    }

    // Result<Option<U>>: a None payload becomes a failure.
    template <typename O = T>
        requires detail::IsOption<O>::value
    Result<typename O::value_type> EnsureSome(const unionkit::Error& error = OptionNoneError()) const& {
        if (IsFailure()) return Err(std::get<1>(data_));
        return std::get<0>(data_).EnsureSome(error);
    }

    // Result<Option<U>>: a Some payload becomes a failure.
    template <typename O = T>
        requires detail::IsOption<O>::value
    Result<void> EnsureNone(const unionkit::Error& error = OptionSomeError()) const& {
        if (IsFailure()) return Err(std::get<1>(data_));
        return std::get<0>(data_).EnsureNone(error);
    }

    // ========================================================================
    // Escape hatch
    // ========================================================================

    // Throws std::runtime_error(message) on failure.
    const T& GetValueOrThrow() const& {
        ThrowIfFailure();
        return std::get<0>(data_);
    }

    template <typename S>
        requires std::invocable<S, const unionkit::Error&>
    const T& GetValueOrThrow(S&& selector) const& {
        ThrowIfFailure(std::forward<S>(selector));
        return std::get<0>(data_);
    }

    void ThrowIfFailure() const {
        if (IsFailure()) throw std::runtime_error(std::get<1>(data_).Message());
    }

    template <typename S>
        requires std::invocable<S, const unionkit::Error&>
    void ThrowIfFailure(S&& selector) const {
        if (IsFailure()) throw std::invoke(std::forward<S>(selector), std::get<1>(data_));
    }

    std::string ToString() const
        requires detail::Streamable<T>
    {
        std::ostringstream oss;
        if (IsSuccess()) {
            oss << "Success: " << std::get<0>(data_);
        } else {
            oss << "Failure: " << std::get<1>(data_);
        }
        return oss.str();
    }

   private:
    std::variant<T, unionkit::Error> data_;
};

// ============================================================================
// Comparison Operators
// ============================================================================

template <typename T>
bool operator==(const Result<T>& lhs, const Result<T>& rhs) {
    if (lhs.IsSuccess() != rhs.IsSuccess()) return false;
    if constexpr (std::is_void_v<T>) {
        return lhs.IsSuccess() || lhs.Error() == rhs.Error();
    } else {
        if (lhs.IsSuccess()) return lhs.Value() == rhs.Value();
        return lhs.Error() == rhs.Error();
    }
}

template <typename T>
bool operator!=(const Result<T>& lhs, const Result<T>& rhs) {
    return !(lhs == rhs);
}

inline std::ostream& operator<<(std::ostream& os, const Result<void>& result) {
    return os << result.ToString();
}

template <typename T>
    requires detail::Streamable<T>
std::ostream& operator<<(std::ostream& os, const Result<T>& result) {
    return os << result.ToString();
}

// ============================================================================
// Option -> Result conversions (declared in option.hpp)
// ============================================================================

template <typename T>
Result<T> Option<T>::ToResult(const unionkit::Error& error) const& {
    if (IsSome()) return Ok(*value_);
    return Err(error);
}

template <typename T>
Result<T> Option<T>::ToResult(const unionkit::Error& error) && {
    if (IsSome()) return Ok(std::move(*value_));
    return Err(error);
}

template <typename T>
Result<T> Option<T>::EnsureSome(const unionkit::Error& error) const& {
    return ToResult(error);
}

template <typename T>
Result<void> Option<T>::EnsureNone(const unionkit::Error& error) const {
    if (IsNone()) return Ok();
    return Err(error);
}

}  // namespace unionkit

#include "unionkit/core/ensure_builder.hpp"
