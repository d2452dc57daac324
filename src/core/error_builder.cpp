// ============================================================================
// unionkit/core/error_builder.cpp - Error Accumulation
// ============================================================================

#include "unionkit/core/error_builder.hpp"

#include "unionkit/core/check.hpp"

namespace unionkit {

ErrorBuilder& ErrorBuilder::Append(const Error& error) {
    if (error.IsAggregate()) {
        const auto& children = error.Children();
        errors_.insert(errors_.end(), children.begin(), children.end());
    } else {
        errors_.push_back(error);
    }
    return *this;
}

std::optional<Error> ErrorBuilder::TryBuild() const {
    switch (errors_.size()) {
        case 0:
            return std::nullopt;
        case 1:
            return errors_.front();
        default:
            return Error::Aggregate(errors_);
    }
}

Error ErrorBuilder::Build() const {
    auto error = TryBuild();
    UNIONKIT_CHECK(error.has_value(), "No errors to build");
    return *std::move(error);
}

}  // namespace unionkit
