// ============================================================================
// unionkit/core/checks.cpp - Default Errors of the Named Checks
// ============================================================================

#include "unionkit/core/checks.hpp"

namespace unionkit::checks::errors {

namespace {

std::string Quoted(std::string_view value) {
    std::string out;
    out.reserve(value.size() + 2);
    out += '\'';
    out += value;
    out += '\'';
    return out;
}

}  // namespace

// ============================================================================
// Strings
// ============================================================================

const Error& StringNotEmpty() {
    static const Error instance = ValidationError("StringError.NotEmpty", "String must be empty.");
    return instance;
}

const Error& StringEmpty() {
    static const Error instance = ValidationError("StringError.Empty", "String cannot be empty.");
    return instance;
}

Error StringInvalidLength(size_t length) {
    return ValidationError("StringError.InvalidLength",
                           "String must have exactly " + std::to_string(length) + " characters.");
}

Error StringTooShort(size_t length, bool inclusive) {
    if (inclusive) {
        return ValidationError("StringError.TooShort",
                               "String must be at least " + std::to_string(length) + " characters.");
    }
    return ValidationError("StringError.TooShort",
                           "String must be longer than " + std::to_string(length) + " characters.");
}

Error StringTooLong(size_t length, bool inclusive) {
    if (inclusive) {
        return ValidationError("StringError.TooLong",
                               "String must be at most " + std::to_string(length) + " characters.");
    }
    return ValidationError("StringError.TooLong",
                           "String must be shorter than " + std::to_string(length) + " characters.");
}

Error StringNotMatch(std::string_view pattern) {
    return ValidationError("StringError.NotMatch", "String must match the pattern " + Quoted(pattern) + ".");
}

Error StringMatch(std::string_view pattern) {
    return ValidationError("StringError.Match", "String must not match the pattern " + Quoted(pattern) + ".");
}

Error StringNotContain(std::string_view value) {
    return ValidationError("StringError.NotContain", "String must contain " + Quoted(value) + ".");
}

Error StringContain(std::string_view value) {
    return ValidationError("StringError.Contain", "String must not contain " + Quoted(value) + ".");
}

Error StringNotStartWith(std::string_view value) {
    return ValidationError("StringError.NotStartWith", "String must start with " + Quoted(value) + ".");
}

Error StringStartWith(std::string_view value) {
    return ValidationError("StringError.StartWith", "String must not start with " + Quoted(value) + ".");
}

Error StringNotEndWith(std::string_view value) {
    return ValidationError("StringError.NotEndWith", "String must end with " + Quoted(value) + ".");
}

Error StringEndWith(std::string_view value) {
    return ValidationError("StringError.EndWith", "String must not end with " + Quoted(value) + ".");
}

// ============================================================================
// Sign
// ============================================================================

const Error& NotPositive() {
    static const Error instance = ValidationError("NumericError.NotPositive", "Value must be positive.");
    return instance;
}

const Error& NotNegative() {
    static const Error instance = ValidationError("NumericError.NotNegative", "Value must be negative.");
    return instance;
}

const Error& NotZero() {
    static const Error instance = ValidationError("NumericError.NotZero", "Value must be zero.");
    return instance;
}

const Error& Zero() {
    static const Error instance = ValidationError("NumericError.Zero", "Value cannot be zero.");
    return instance;
}

const Error& Positive() {
    static const Error instance = ValidationError("NumericError.Positive", "Value cannot be positive.");
    return instance;
}

const Error& Negative() {
    static const Error instance = ValidationError("NumericError.Negative", "Value cannot be negative.");
    return instance;
}

// ============================================================================
// Booleans and equality
// ============================================================================

const Error& NotTrue() {
    static const Error instance = ValidationError("BooleanError.NotTrue", "Value must be true.");
    return instance;
}

const Error& NotFalse() {
    static const Error instance = ValidationError("BooleanError.NotFalse", "Value must be false.");
    return instance;
}

const Error& NotEqual() {
    static const Error instance = ValidationError("Error.NotEqual", "Value must be equal to the expected value.");
    return instance;
}

const Error& Equal() {
    static const Error instance = ValidationError("Error.Equal", "Value must not be equal to the given value.");
    return instance;
}

// ============================================================================
// Time points
// ============================================================================

Error NotInPast(std::string_view subject) {
    return ValidationError("DateTimeError.NotInPast", std::string(subject) + " should be in the past.");
}

Error NotInFuture(std::string_view subject) {
    return ValidationError("DateTimeError.NotInFuture", std::string(subject) + " should be in the future.");
}

const Error& DateInPast() {
    static const Error instance = ValidationError("DateTimeError.InPast", "Date cannot be in the past.");
    return instance;
}

const Error& DateInFuture() {
    static const Error instance = ValidationError("DateTimeError.InFuture", "Date cannot be in the future.");
    return instance;
}

// ============================================================================
// GUIDs and enums
// ============================================================================

const Error& GuidNotEmpty() {
    static const Error instance = ValidationError("GuidError.NotEmpty", "GUID must be empty.");
    return instance;
}

const Error& GuidEmpty() {
    static const Error instance = ValidationError("GuidError.Empty", "GUID cannot be empty.");
    return instance;
}

const Error& EnumNotDefined() {
    static const Error instance = ValidationError("EnumError.NotDefined", "The value is not defined.");
    return instance;
}

}  // namespace unionkit::checks::errors
