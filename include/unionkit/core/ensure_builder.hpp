// ============================================================================
// unionkit/core/ensure_builder.hpp - Deferred Validation for Result
// ============================================================================
//
// EnsureBuilder<T> is the transient value produced by Result<T>::EnsureThat().
// Each Check() either keeps the success or replaces it with the check's
// error. After the first failure (or when the source was already a
// failure) further checks are skipped and their predicates never run, so
// the collapsed Result reports the first violated check.
//
// USAGE:
// ------
//   Result<std::string> email = ReadEmail()
//       .EnsureThat()
//       .Check(checks::NotEmpty())
//       .Check(checks::Contains("@"), ValidationError("Email.Invalid", "Not an email"))
//       .Check([](const std::string& s) { return s.size() < 255; },
//              ValidationError("Email.TooLong", "Too long"));
//
// A named check reports its default error unless the call site passes
// one. Like FilterBuilder, the builder is rvalue-only and must collapse
// (Build(), conversion, Map() or Bind()) in the expression that made it.
//
// ============================================================================

#pragma once

#include "unionkit/core/checks.hpp"
#include "unionkit/core/error.hpp"
#include "unionkit/core/invoke.hpp"
#include "unionkit/core/result.hpp"

#include <utility>

namespace unionkit {

template <typename T>
class EnsureBuilder {
   public:
    EnsureBuilder(const EnsureBuilder&) = delete;
    EnsureBuilder(EnsureBuilder&&) = delete;
    EnsureBuilder& operator=(const EnsureBuilder&) = delete;
    EnsureBuilder& operator=(EnsureBuilder&&) = delete;

    template <typename P>
        requires InvocableWith<P, const T&>
    EnsureBuilder&& Check(P&& predicate, const Error& error) && {
        if (state_.IsSuccess() && !Invoke(std::forward<P>(predicate), std::as_const(state_).Value())) {
            state_ = error;
        }
        return std::move(*this);
    }

    template <typename C>
        requires NamedCheckFor<C, T>
    EnsureBuilder&& Check(const C& check) && {
        return std::move(*this).Check(check.predicate, check.error);
    }

    template <typename C>
        requires NamedCheckFor<C, T>
    EnsureBuilder&& Check(const C& check, const Error& error) && {
        return std::move(*this).Check(check.predicate, error);
    }

    // ========================================================================
    // Terminals
    // ========================================================================

    Result<T> Build() && { return std::move(state_); }

    operator Result<T>() && { return std::move(*this).Build(); }

    template <typename F>
        requires InvocableWith<F, T&&>
    auto Map(F&& func) && {
        return std::move(*this).Build().Map(std::forward<F>(func));
    }

    template <typename F>
        requires InvocableWith<F, T&&>
    auto Bind(F&& func) && {
        return std::move(*this).Build().Bind(std::forward<F>(func));
    }

   private:
    friend class Result<T>;

    explicit EnsureBuilder(const Result<T>& state) : state_(state) {}
    explicit EnsureBuilder(Result<T>&& state) : state_(std::move(state)) {}

    Result<T> state_;
};

}  // namespace unionkit
