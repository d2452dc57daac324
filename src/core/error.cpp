// ============================================================================
// unionkit/core/error.cpp - Error Value Implementation
// ============================================================================

#include "unionkit/core/error.hpp"

#include <array>
#include <sstream>
#include <type_traits>
#include <utility>

namespace unionkit {

namespace {

constexpr std::array<std::string_view, 7> kKindNames = {
    "Error",
    "ValidationError",
    "NotFoundError",
    "ConflictError",
    "AuthenticationError",
    "AuthorizationError",
    "AggregateError",
};

bool CarriesMetadata(ErrorKind kind) noexcept {
    return kind != ErrorKind::Base && kind != ErrorKind::Aggregate;
}

const ErrorMetadata& EmptyMetadata() {
    static const ErrorMetadata instance;
    return instance;
}

const std::vector<Error>& NoChildren() {
    static const std::vector<Error> instance;
    return instance;
}

}  // namespace

std::string_view ErrorKindName(ErrorKind kind) noexcept {
    auto index = static_cast<size_t>(kind);
    if (index >= kKindNames.size()) return "Error";
    return kKindNames[index];
}

std::optional<ErrorKind> ParseErrorKind(std::string_view name) noexcept {
    for (size_t i = 0; i < kKindNames.size(); ++i) {
        if (kKindNames[i] == name) return static_cast<ErrorKind>(i);
    }
    return std::nullopt;
}

// ============================================================================
// Error
// ============================================================================

Error::Error(ErrorKind kind, std::string code, std::string message, ErrorMetadata metadata)
    : kind_(kind), code_(std::move(code)), message_(std::move(message)) {
    if (!metadata.empty()) {
        metadata_ = std::make_shared<const ErrorMetadata>(std::move(metadata));
    }
}

Error Error::Aggregate(std::vector<Error> children) {
    Error error(ErrorKind::Aggregate, std::string(kAggregateCode), std::string(kAggregateMessage), {});
    error.children_ = std::make_shared<const std::vector<Error>>(std::move(children));
    return error;
}

const ErrorMetadata& Error::Metadata() const noexcept {
    return metadata_ ? *metadata_ : EmptyMetadata();
}

const std::vector<Error>& Error::Children() const noexcept {
    return children_ ? *children_ : NoChildren();
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << ErrorKindName(kind_) << ": ";
    if (!code_.empty()) {
        oss << code_ << " - ";
    }
    oss << message_;

    const auto& metadata = Metadata();
    if (!metadata.empty()) {
        oss << " - Metadata: ";
        bool first = true;
        for (const auto& [key, value] : metadata) {
            if (!first) oss << ", ";
            oss << key << ": " << value;
            first = false;
        }
    }

    if (IsAggregate()) {
        oss << " ( ";
        bool first = true;
        for (const auto& child : Children()) {
            if (!first) oss << ", ";
            oss << child.ToString();
            first = false;
        }
        oss << " )";
    }
    return oss.str();
}

bool operator==(const Error& lhs, const Error& rhs) {
    if (lhs.kind_ != rhs.kind_) return false;
    if (lhs.code_ != rhs.code_ || lhs.message_ != rhs.message_) return false;
    if (lhs.Metadata() != rhs.Metadata()) return false;
    return lhs.Children() == rhs.Children();
}

std::ostream& operator<<(std::ostream& os, const Error& error) {
    return os << error.ToString();
}

std::ostream& operator<<(std::ostream& os, const MetadataValue& value) {
    std::visit(
        [&os](const auto& v) {
            if constexpr (std::is_same_v<std::decay_t<decltype(v)>, bool>) {
                os << (v ? "true" : "false");
            } else {
                os << v;
            }
        },
        value);
    return os;
}

// ============================================================================
// Kind factories
// ============================================================================

Error MakeMetadataError(ErrorKind kind, std::string code, std::string message, ErrorMetadata metadata) {
    return Error(kind, std::move(code), std::move(message), std::move(metadata));
}

Error ValidationError(std::string message) {
    return MakeMetadataError(ErrorKind::Validation, std::string(), std::move(message), {});
}

Error ValidationError(std::string code, std::string message) {
    return MakeMetadataError(ErrorKind::Validation, std::move(code), std::move(message), {});
}

Error ValidationError(std::string code, std::string message, ErrorMetadata metadata) {
    return MakeMetadataError(ErrorKind::Validation, std::move(code), std::move(message), std::move(metadata));
}

Error NotFoundError(std::string message) {
    return MakeMetadataError(ErrorKind::NotFound, std::string(), std::move(message), {});
}

Error NotFoundError(std::string code, std::string message) {
    return MakeMetadataError(ErrorKind::NotFound, std::move(code), std::move(message), {});
}

Error NotFoundError(std::string code, std::string message, ErrorMetadata metadata) {
    return MakeMetadataError(ErrorKind::NotFound, std::move(code), std::move(message), std::move(metadata));
}

Error ConflictError(std::string message) {
    return MakeMetadataError(ErrorKind::Conflict, std::string(), std::move(message), {});
}

Error ConflictError(std::string code, std::string message) {
    return MakeMetadataError(ErrorKind::Conflict, std::move(code), std::move(message), {});
}

Error ConflictError(std::string code, std::string message, ErrorMetadata metadata) {
    return MakeMetadataError(ErrorKind::Conflict, std::move(code), std::move(message), std::move(metadata));
}

Error AuthenticationError(std::string message) {
    return MakeMetadataError(ErrorKind::Authentication, std::string(), std::move(message), {});
}

Error AuthenticationError(std::string code, std::string message) {
    return MakeMetadataError(ErrorKind::Authentication, std::move(code), std::move(message), {});
}

Error AuthenticationError(std::string code, std::string message, ErrorMetadata metadata) {
    return MakeMetadataError(ErrorKind::Authentication, std::move(code), std::move(message), std::move(metadata));
}

Error AuthorizationError(std::string message) {
    return MakeMetadataError(ErrorKind::Authorization, std::string(), std::move(message), {});
}

Error AuthorizationError(std::string code, std::string message) {
    return MakeMetadataError(ErrorKind::Authorization, std::move(code), std::move(message), {});
}

Error AuthorizationError(std::string code, std::string message, ErrorMetadata metadata) {
    return MakeMetadataError(ErrorKind::Authorization, std::move(code), std::move(message), std::move(metadata));
}

std::optional<Error> MakeError(ErrorKind kind, std::string code, std::string message, ErrorMetadata metadata) {
    if (kind == ErrorKind::Aggregate) return std::nullopt;
    if (kind == ErrorKind::Base) {
        if (!metadata.empty()) return std::nullopt;
        return Error(std::move(code), std::move(message));
    }
    if (!CarriesMetadata(kind)) return std::nullopt;
    return MakeMetadataError(kind, std::move(code), std::move(message), std::move(metadata));
}

// ============================================================================
// Option conversion defaults
// ============================================================================

const Error& OptionNoneError() {
    static const Error instance = ValidationError("OptionError.None", "The value cannot be none.");
    return instance;
}

const Error& OptionSomeError() {
    static const Error instance = ValidationError("OptionError.Some", "The value cannot be some.");
    return instance;
}

}  // namespace unionkit
