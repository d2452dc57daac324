// ============================================================================
// unionkit/core/error_builder.hpp - Error Accumulation
// ============================================================================
//
// ErrorBuilder collects the failures of a validation episode so they can be
// reported together instead of stopping at the first one.
//
// RULES:
// ------
// 1. FLATTENING: appending an aggregate splices its children in, so the
//    built error never contains a nested aggregate.
// 2. BUILD SHAPE: zero errors -> nothing, one error -> that error,
//    two or more -> an aggregate over all of them in append order.
// 3. SINGLE USE: a builder belongs to one call chain on one thread.
//
// USAGE:
// ------
//   ErrorBuilder errors;
//   errors.AppendOnFailure(ValidateName(name))
//         .AppendOnFailure(ValidateAge(age));
//
//   if (auto error = errors.TryBuild()) {
//       return *error;
//   }
//
// ============================================================================

#pragma once

#include "unionkit/core/error.hpp"

#include <concepts>
#include <cstddef>
#include <optional>
#include <vector>

namespace unionkit {

// Anything that can report "did I fail, and with what" - every Result.
template <typename R>
concept FailureCarrier = requires(const R& r) {
    { r.IsFailure() } -> std::convertible_to<bool>;
    { r.Error() } -> std::convertible_to<const Error&>;
};

class ErrorBuilder {
   public:
    ErrorBuilder() = default;

    ErrorBuilder(const ErrorBuilder&) = delete;
    ErrorBuilder& operator=(const ErrorBuilder&) = delete;

    // Appends error, splicing in the children of an aggregate.
    ErrorBuilder& Append(const Error& error);

    template <FailureCarrier R>
    ErrorBuilder& AppendOnFailure(const R& result) {
        if (result.IsFailure()) Append(result.Error());
        return *this;
    }

    bool HasErrors() const noexcept { return !errors_.empty(); }
    size_t Count() const noexcept { return errors_.size(); }

    // Empty when nothing was appended.
    std::optional<Error> TryBuild() const;

    // Like TryBuild(), but an empty builder is a programming error.
    Error Build() const;

   private:
    std::vector<Error> errors_;
};

}  // namespace unionkit
