// ============================================================================
// unionkit/core/filter_builder.hpp - Deferred Validation for Option
// ============================================================================
//
// FilterBuilder<T> is the transient value produced by Option<T>::Filter().
// It runs a chain of checks against the option's value and collapses back
// into an Option at the end of the same expression.
//
// STATES:
// -------
//   Eligible(value)  - entered from Some; every check so far has passed
//   Disqualified     - entered from None, or the moment a check fails
//
// Once disqualified, later checks are no-ops: their predicates never run.
//
// USAGE:
// ------
//   Option<std::string> user = ReadUser();
//
//   Option<std::string> valid = user.Filter()
//       .Check(checks::NotEmpty())
//       .Check([](const std::string& s) { return s.front() != '_'; });
//
//   auto upper = user.Filter()
//       .Check(checks::ShorterThan(32))
//       .Map(ToUpper);                     // collapses, then maps
//
// A builder cannot be copied, moved or used as an lvalue. Every member is
// rvalue-qualified, so it must be consumed in the expression that made it:
//
//   auto b = user.Filter();                // ok (prvalue elision) ...
//   b.Check(checks::NotEmpty());           // ... but this does not compile
//
// ============================================================================

#pragma once

#include "unionkit/core/checks.hpp"
#include "unionkit/core/invoke.hpp"
#include "unionkit/core/option.hpp"

#include <optional>
#include <utility>

namespace unionkit {

template <typename T>
class FilterBuilder {
   public:
    FilterBuilder(const FilterBuilder&) = delete;
    FilterBuilder(FilterBuilder&&) = delete;
    FilterBuilder& operator=(const FilterBuilder&) = delete;
    FilterBuilder& operator=(FilterBuilder&&) = delete;

    // Disqualifies the value unless predicate(value) holds.
    template <typename P>
        requires InvocableWith<P, const T&>
    FilterBuilder&& Check(P&& predicate) && {
        if (state_.has_value() && !Invoke(std::forward<P>(predicate), std::as_const(*state_))) {
            state_.reset();
        }
        return std::move(*this);
    }

    // Named checks only contribute their predicate; an Option has no room
    // for the error.
    template <typename C>
        requires NamedCheckFor<C, T>
    FilterBuilder&& Check(const C& check) && {
        return std::move(*this).Check(check.predicate);
    }

    // ========================================================================
    // Terminals
    // ========================================================================

    Option<T> Build() && { return Option<T>(std::move(state_)); }

    operator Option<T>() && { return std::move(*this).Build(); }

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
    friend class Option<T>;

    explicit FilterBuilder(const std::optional<T>& state) : state_(state) {}
    explicit FilterBuilder(std::optional<T>&& state) : state_(std::move(state)) {}

    std::optional<T> state_;
};

}  // namespace unionkit
