// ============================================================================
// unionkit/core/combinators.cpp - Condition Combinators
// ============================================================================

#include "unionkit/core/combinators.hpp"

namespace unionkit {

Result<void> Ensure(bool condition, const Error& error) {
    if (condition) return Ok();
    return Err(error);
}

Result<void> Ensure(std::initializer_list<Requirement> requirements) {
    for (const auto& requirement : requirements) {
        if (!requirement.predicate()) return Err(requirement.error);
    }
    return Ok();
}

Result<void> EnsureAll(std::initializer_list<Condition> conditions) {
    ErrorBuilder errors;
    for (const auto& condition : conditions) {
        if (!condition.holds) errors.Append(condition.error);
    }
    if (auto error = errors.TryBuild()) return Err(std::move(*error));
    return Ok();
}

}  // namespace unionkit
