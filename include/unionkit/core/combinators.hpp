// ============================================================================
// unionkit/core/combinators.hpp - Combining Independent Results
// ============================================================================
//
// Free functions that join several results into one. Each comes in one of
// two flavors:
//
//   FAIL-FAST   Combine, BindAppend, Ensure
//               The first failure is returned. Lazy operands after it are
//               never evaluated.
//
//   ACCUMULATE  BindAll, EnsureAll
//               Every operand is inspected, and all failures are merged by
//               ErrorBuilder (one failure stays as is, more become an
//               aggregate in argument order).
//
// USAGE:
// ------
//   // Dependent pipeline: stop at the first problem
//   Result<std::tuple<User, Order>> both = Combine(FindUser(id), FindOrder(oid));
//
//   // Form validation: report every problem at once
//   Result<void> form = EnsureAll({
//       {!name.empty(), ValidationError("Name required")},
//       {age >= 0,      ValidationError("Age invalid")},
//   });
//
//   Result<std::tuple<int, int>> pair = BindAll(ParseInt(a), ParseInt(b));
//   pair.Map([](int x, int y) { return x + y; });
//
// ============================================================================

#pragma once

#include "unionkit/core/error.hpp"
#include "unionkit/core/error_builder.hpp"
#include "unionkit/core/result.hpp"

#include <concepts>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>

namespace unionkit {

namespace detail {

// Value type of the Result a nullary producer returns.
template <typename F>
using ProducedT = typename std::remove_cvref_t<std::invoke_result_t<F>>::value_type;

template <typename Values, typename Producers, size_t... I>
std::optional<Error> RunProducers(Values& values, Producers& producers, std::index_sequence<I...>) {
    std::optional<Error> failure;
    auto step = [&failure](auto& slot, auto& producer) {
        auto result = std::invoke(producer);
        if (result.IsFailure()) {
            failure.emplace(std::move(result).Error());
            return false;
        }
        slot.emplace(std::move(result).Value());
        return true;
    };
    (void)(step(std::get<I>(values), std::get<I>(producers)) && ...);
    return failure;
}

}  // namespace detail

// ============================================================================
// Combine - fail-fast join of ready results
// ============================================================================

template <typename... Ts>
    requires(sizeof...(Ts) >= 2 && (!std::is_void_v<Ts> && ...))
Result<std::tuple<Ts...>> Combine(const Result<Ts>&... results) {
    std::optional<Error> failure;
    (void)((results.IsFailure() ? (failure.emplace(results.Error()), true) : false) || ...);
    if (failure) return Err(std::move(*failure));
    return Ok(std::tuple<Ts...>(results.Value()...));
}

template <typename... Rs>
    requires(sizeof...(Rs) >= 2 && (std::same_as<Rs, Result<void>> && ...))
Result<void> Combine(const Rs&... results) {
    std::optional<Error> failure;
    (void)((results.IsFailure() ? (failure.emplace(results.Error()), true) : false) || ...);
    if (failure) return Err(std::move(*failure));
    return Ok();
}

// ============================================================================
// BindAll - accumulating join of ready results
// ============================================================================

template <typename... Ts>
    requires(sizeof...(Ts) >= 2 && (!std::is_void_v<Ts> && ...))
Result<std::tuple<Ts...>> BindAll(const Result<Ts>&... results) {
    ErrorBuilder errors;
    (errors.AppendOnFailure(results), ...);
    if (auto error = errors.TryBuild()) return Err(std::move(*error));
    return Ok(std::tuple<Ts...>(results.Value()...));
}

template <typename... Rs>
    requires(sizeof...(Rs) >= 2 && (std::same_as<Rs, Result<void>> && ...))
Result<void> BindAll(const Rs&... results) {
    ErrorBuilder errors;
    (errors.AppendOnFailure(results), ...);
    if (auto error = errors.TryBuild()) return Err(std::move(*error));
    return Ok();
}

// ============================================================================
// BindAppend - fail-fast join of lazy producers
// ============================================================================
//
// Runs the producers left to right and stops at the first failure; the
// producers after it are never called.
//
//   auto both = BindAppend([&] { return LoadConfig(path); },
//                          [&] { return OpenDatabase(url); });
//

template <typename... Fs>
    requires(sizeof...(Fs) >= 2 && (std::invocable<Fs&> && ...))
Result<std::tuple<detail::ProducedT<Fs&>...>> BindAppend(Fs&&... producers) {
    std::tuple<std::optional<detail::ProducedT<Fs&>>...> values;
    auto refs = std::forward_as_tuple(producers...);
    if (auto failure = detail::RunProducers(values, refs, std::index_sequence_for<Fs...>{})) {
        return Err(std::move(*failure));
    }
    return std::apply(
        [](auto&... slots) { return Ok(std::tuple<detail::ProducedT<Fs&>...>(std::move(*slots)...)); },
        values);
}

// ============================================================================
// Ensure / EnsureAll - conditions as results
// ============================================================================

// A lazily evaluated condition with the error that reports its failure.
struct Requirement {
    std::function<bool()> predicate;
    Error error;
};

// A condition already evaluated by the caller.
struct Condition {
    bool holds;
    Error error;
};

// Success if condition holds, otherwise failure with error.
Result<void> Ensure(bool condition, const Error& error);

// Evaluates the requirements in order and fails with the first one that
// does not hold. Later predicates are not called.
Result<void> Ensure(std::initializer_list<Requirement> requirements);

// Fails with every condition that does not hold.
Result<void> EnsureAll(std::initializer_list<Condition> conditions);

}  // namespace unionkit
