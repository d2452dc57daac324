// ============================================================================
// unionkit/core/error.hpp - Error Values
// ============================================================================
//
// Error is the failure payload carried by Result<T>. It is a plain,
// immutable value: a kind, a machine-readable code, a human-readable
// message, and (for the metadata-carrying kinds) a key/value map.
//
// KINDS:
// ------
//   Base            - anything not fitting a more specific kind
//   Validation      - input or business-rule violation
//   NotFound        - requested entity is absent
//   Conflict        - operation contradicts current state
//   Authentication  - identity could not be established
//   Authorization   - identity established, privilege insufficient
//   Aggregate       - two or more errors reported together (never nested)
//
// Aggregates are only produced by ErrorBuilder, which flattens any
// aggregate it is handed, so an aggregate's children are never aggregates.
//
// USAGE:
// ------
//   Error plain = "disk full";                      // Base, empty code
//   Error missing = NotFoundError("User.NotFound", "No such user",
//                                 {{"id", std::int64_t{42}}});
//
//   missing.ToString();
//   // "NotFoundError: User.NotFound - No such user - Metadata: id: 42"
//
// ============================================================================

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace unionkit {

enum class ErrorKind {
    Base,
    Validation,
    NotFound,
    Conflict,
    Authentication,
    Authorization,
    Aggregate,
};

// Display and discriminator name of a kind ("ValidationError", ...).
std::string_view ErrorKindName(ErrorKind kind) noexcept;

// Inverse of ErrorKindName(). Empty for an unknown name.
std::optional<ErrorKind> ParseErrorKind(std::string_view name) noexcept;

using MetadataValue = std::variant<bool, std::int64_t, double, std::string>;
using ErrorMetadata = std::map<std::string, MetadataValue, std::less<>>;

class ErrorBuilder;

// ============================================================================
// Error
// ============================================================================
class Error {
   public:
    static constexpr std::string_view kAggregateCode = "Errors.Aggregate";
    static constexpr std::string_view kAggregateMessage = "Multiple errors occurred.";

    // A bare message lifts to a Base error with an empty code.
    Error(const char* message) : Error(std::string(message)) {}
    Error(std::string message) : Error(ErrorKind::Base, std::string(), std::move(message), {}) {}

    Error(std::string code, std::string message)
        : Error(ErrorKind::Base, std::move(code), std::move(message), {}) {}

    ErrorKind Kind() const noexcept { return kind_; }
    const std::string& Code() const noexcept { return code_; }
    const std::string& Message() const noexcept { return message_; }

    // Empty for Base and Aggregate errors.
    const ErrorMetadata& Metadata() const noexcept;

    // The flattened children of an aggregate; empty for every other kind.
    const std::vector<Error>& Children() const noexcept;

    bool IsAggregate() const noexcept { return kind_ == ErrorKind::Aggregate; }

    std::string ToString() const;

    friend bool operator==(const Error& lhs, const Error& rhs);
    friend bool operator!=(const Error& lhs, const Error& rhs) { return !(lhs == rhs); }

   private:
    friend class ErrorBuilder;
    friend Error MakeMetadataError(ErrorKind, std::string, std::string, ErrorMetadata);

    Error(ErrorKind kind, std::string code, std::string message, ErrorMetadata metadata);

    // Only ErrorBuilder creates aggregates, and only from two or more errors.
    static Error Aggregate(std::vector<Error> children);

    ErrorKind kind_;
    std::string code_;
    std::string message_;
    std::shared_ptr<const ErrorMetadata> metadata_;
    std::shared_ptr<const std::vector<Error>> children_;
};

std::ostream& operator<<(std::ostream& os, const Error& error);
std::ostream& operator<<(std::ostream& os, const MetadataValue& value);

// ============================================================================
// Kind factories
// ============================================================================

// Builds a metadata-carrying error of the given kind. Used by the factories
// below; kind must be one of Validation..Authorization.
Error MakeMetadataError(ErrorKind kind, std::string code, std::string message, ErrorMetadata metadata);

Error ValidationError(std::string message);
Error ValidationError(std::string code, std::string message);
Error ValidationError(std::string code, std::string message, ErrorMetadata metadata);

Error NotFoundError(std::string message);
Error NotFoundError(std::string code, std::string message);
Error NotFoundError(std::string code, std::string message, ErrorMetadata metadata);

Error ConflictError(std::string message);
Error ConflictError(std::string code, std::string message);
Error ConflictError(std::string code, std::string message, ErrorMetadata metadata);

Error AuthenticationError(std::string message);
Error AuthenticationError(std::string code, std::string message);
Error AuthenticationError(std::string code, std::string message, ErrorMetadata metadata);

Error AuthorizationError(std::string message);
Error AuthorizationError(std::string code, std::string message);
Error AuthorizationError(std::string code, std::string message, ErrorMetadata metadata);

// Rebuilds a non-aggregate error from its serialized parts. Empty when
// kind is Aggregate (rebuild those by appending children to an
// ErrorBuilder) or when a Base error is given metadata.
std::optional<Error> MakeError(ErrorKind kind, std::string code, std::string message, ErrorMetadata metadata = {});

// ============================================================================
// Option conversion defaults
// ============================================================================

// "OptionError.None": an Option was None where a value was required.
const Error& OptionNoneError();

// "OptionError.Some": an Option held a value where none was expected.
const Error& OptionSomeError();

}  // namespace unionkit
