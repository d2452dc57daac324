// ============================================================================
// unionkit/core/collections.hpp - Options and Results over Ranges
// ============================================================================
//
// Range-level counterparts of the single-value combinators. The
// short-circuit / accumulate split carries over:
//
//   Sequence, Traverse   stop at the first None or failure
//   CollectAll           visit everything, merge all failures
//   Partition, Choose*   keep every element, split by state
//
// Any std::ranges::input_range works as input; collected values come back
// in a std::vector in input order.
//
// USAGE:
// ------
//   std::vector<Result<int>> parsed = ParseAll(lines);
//
//   Result<std::vector<int>> first_error = Sequence(parsed);
//   Result<std::vector<int>> all_errors  = CollectAll(parsed);
//
//   auto [values, errors] = Partition(parsed);
//
//   Option<User> admin = FirstOrNone(users, [](const User& u) { return u.admin; });
//
// ============================================================================

#pragma once

#include "unionkit/core/error.hpp"
#include "unionkit/core/error_builder.hpp"
#include "unionkit/core/invoke.hpp"
#include "unionkit/core/option.hpp"
#include "unionkit/core/result.hpp"

#include <concepts>
#include <cstddef>
#include <iterator>
#include <optional>
#include <ranges>
#include <type_traits>
#include <utility>
#include <vector>

namespace unionkit {

namespace detail {

template <typename R>
using RangeValueT = std::ranges::range_value_t<R>;

template <typename R>
concept OptionRange = std::ranges::input_range<R> && IsOption<RangeValueT<R>>::value;

template <typename R>
concept ResultRange = std::ranges::input_range<R> && IsResult<RangeValueT<R>>::value;

template <typename R>
concept ValueResultRange = ResultRange<R> && !std::is_void_v<typename RangeValueT<R>::value_type>;

template <typename R>
concept VoidResultRange = ResultRange<R> && std::is_void_v<typename RangeValueT<R>::value_type>;

template <typename R>
using PayloadT = typename RangeValueT<R>::value_type;

template <typename F, typename R>
using MappedT = std::remove_cvref_t<InvokeResultT<F, std::ranges::range_reference_t<R>>>;

}  // namespace detail

// ============================================================================
// Partition results
// ============================================================================

template <typename T>
struct OptionPartition {
    std::vector<T> values;
    size_t none_count = 0;
};

template <typename T>
struct ResultPartition {
    std::vector<T> successes;
    std::vector<Error> errors;
};

template <>
struct ResultPartition<void> {
    size_t success_count = 0;
    std::vector<Error> errors;
};

// ============================================================================
// Option ranges
// ============================================================================

// Some(all values) if every option is Some, otherwise None.
template <detail::OptionRange R>
Option<std::vector<detail::PayloadT<R>>> Sequence(const R& options) {
    std::vector<detail::PayloadT<R>> values;
    for (const auto& option : options) {
        if (option.IsNone()) return None;
        values.push_back(option.Value());
    }
    return values;
}

// Maps each element to an Option and sequences the results. func is not
// called again after the first None.
template <std::ranges::input_range R, typename F>
    requires InvocableWith<F, std::ranges::range_reference_t<R>> &&
             detail::IsOption<detail::MappedT<F, R>>::value
Option<std::vector<typename detail::MappedT<F, R>::value_type>> Traverse(R&& range, F&& func) {
    std::vector<typename detail::MappedT<F, R>::value_type> values;
    for (auto&& element : range) {
        auto mapped = Invoke(func, std::forward<decltype(element)>(element));
        if (mapped.IsNone()) return None;
        values.push_back(std::move(mapped).Value());
    }
    return values;
}

template <detail::OptionRange R>
OptionPartition<detail::PayloadT<R>> Partition(const R& options) {
    OptionPartition<detail::PayloadT<R>> partition;
    for (const auto& option : options) {
        if (option.IsSome()) {
            partition.values.push_back(option.Value());
        } else {
            ++partition.none_count;
        }
    }
    return partition;
}

// The values of the Some elements, None elements are skipped.
template <detail::OptionRange R>
std::vector<detail::PayloadT<R>> Choose(const R& options) {
    std::vector<detail::PayloadT<R>> values;
    for (const auto& option : options) {
        if (option.IsSome()) values.push_back(option.Value());
    }
    return values;
}

template <std::ranges::input_range R, typename F>
    requires InvocableWith<F, std::ranges::range_reference_t<R>> &&
             detail::IsOption<detail::MappedT<F, R>>::value
std::vector<typename detail::MappedT<F, R>::value_type> ChooseMap(R&& range, F&& func) {
    std::vector<typename detail::MappedT<F, R>::value_type> values;
    for (auto&& element : range) {
        auto mapped = Invoke(func, std::forward<decltype(element)>(element));
        if (mapped.IsSome()) values.push_back(std::move(mapped).Value());
    }
    return values;
}

// ============================================================================
// First / last element as an Option
// ============================================================================

template <std::ranges::input_range R>
    requires OptionValue<detail::RangeValueT<R>>
Option<detail::RangeValueT<R>> FirstOrNone(const R& range) {
    auto it = std::ranges::begin(range);
    if (it == std::ranges::end(range)) return None;
    return *it;
}

template <std::ranges::input_range R, typename P>
    requires OptionValue<detail::RangeValueT<R>> && InvocableWith<P, const detail::RangeValueT<R>&>
Option<detail::RangeValueT<R>> FirstOrNone(const R& range, P&& predicate) {
    for (const auto& element : range) {
        if (Invoke(predicate, element)) return element;
    }
    return None;
}

template <std::ranges::input_range R>
    requires OptionValue<detail::RangeValueT<R>>
Option<detail::RangeValueT<R>> LastOrNone(const R& range) {
    Option<detail::RangeValueT<R>> last;
    for (const auto& element : range) last = element;
    return last;
}

template <std::ranges::input_range R, typename P>
    requires OptionValue<detail::RangeValueT<R>> && InvocableWith<P, const detail::RangeValueT<R>&>
Option<detail::RangeValueT<R>> LastOrNone(const R& range, P&& predicate) {
    Option<detail::RangeValueT<R>> last;
    for (const auto& element : range) {
        if (Invoke(predicate, element)) last = element;
    }
    return last;
}

// ============================================================================
// Result ranges - fail-fast
// ============================================================================

// Success(all values), or the first failure.
template <detail::ValueResultRange R>
Result<std::vector<detail::PayloadT<R>>> Sequence(const R& results) {
    std::vector<detail::PayloadT<R>> values;
    for (const auto& result : results) {
        if (result.IsFailure()) return Err(result.Error());
        values.push_back(result.Value());
    }
    return Ok(std::move(values));
}

template <detail::VoidResultRange R>
Result<void> Sequence(const R& results) {
    for (const auto& result : results) {
        if (result.IsFailure()) return result;
    }
    return Ok();
}

// Maps each element to a Result and sequences them. func is not called
// again after the first failure.
template <std::ranges::input_range R, typename F>
    requires InvocableWith<F, std::ranges::range_reference_t<R>> &&
             detail::IsResult<detail::MappedT<F, R>>::value
auto Traverse(R&& range, F&& func) {
    using Mapped = detail::MappedT<F, R>;
    using U = typename Mapped::value_type;
    if constexpr (std::is_void_v<U>) {
        for (auto&& element : range) {
            Result<void> mapped = Invoke(func, std::forward<decltype(element)>(element));
            if (mapped.IsFailure()) return mapped;
        }
        return Result<void>(Ok());
    } else {
        std::vector<U> values;
        for (auto&& element : range) {
            Mapped mapped = Invoke(func, std::forward<decltype(element)>(element));
            if (mapped.IsFailure()) return Result<std::vector<U>>(Err(std::move(mapped).Error()));
            values.push_back(std::move(mapped).Value());
        }
        return Result<std::vector<U>>(Ok(std::move(values)));
    }
}

// ============================================================================
// Result ranges - accumulating
// ============================================================================

// Success(all values), or every failure merged by ErrorBuilder.
template <detail::ValueResultRange R>
Result<std::vector<detail::PayloadT<R>>> CollectAll(const R& results) {
    ErrorBuilder errors;
    std::vector<detail::PayloadT<R>> values;
    for (const auto& result : results) {
        if (result.IsFailure()) {
            errors.Append(result.Error());
        } else if (!errors.HasErrors()) {
            values.push_back(result.Value());
        }
    }
    if (auto error = errors.TryBuild()) return Err(std::move(*error));
    return Ok(std::move(values));
}

template <detail::VoidResultRange R>
Result<void> CollectAll(const R& results) {
    ErrorBuilder errors;
    for (const auto& result : results) errors.AppendOnFailure(result);
    if (auto error = errors.TryBuild()) return Err(std::move(*error));
    return Ok();
}

template <detail::ValueResultRange R>
ResultPartition<detail::PayloadT<R>> Partition(const R& results) {
    ResultPartition<detail::PayloadT<R>> partition;
    for (const auto& result : results) {
        if (result.IsSuccess()) {
            partition.successes.push_back(result.Value());
        } else {
            partition.errors.push_back(result.Error());
        }
    }
    return partition;
}

template <detail::VoidResultRange R>
ResultPartition<void> Partition(const R& results) {
    ResultPartition<void> partition;
    for (const auto& result : results) {
        if (result.IsSuccess()) {
            ++partition.success_count;
        } else {
            partition.errors.push_back(result.Error());
        }
    }
    return partition;
}

template <detail::ValueResultRange R>
std::vector<detail::PayloadT<R>> ChooseSuccesses(const R& results) {
    std::vector<detail::PayloadT<R>> values;
    for (const auto& result : results) {
        if (result.IsSuccess()) values.push_back(result.Value());
    }
    return values;
}

template <detail::ResultRange R>
std::vector<Error> ChooseFailures(const R& results) {
    std::vector<Error> errors;
    for (const auto& result : results) {
        if (result.IsFailure()) errors.push_back(result.Error());
    }
    return errors;
}

template <detail::ResultRange R>
size_t CountSuccesses(const R& results) {
    size_t count = 0;
    for (const auto& result : results) {
        if (result.IsSuccess()) ++count;
    }
    return count;
}

template <detail::ResultRange R>
size_t CountFailures(const R& results) {
    size_t count = 0;
    for (const auto& result : results) {
        if (result.IsFailure()) ++count;
    }
    return count;
}

}  // namespace unionkit
