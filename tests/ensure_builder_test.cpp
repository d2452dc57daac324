// ============================================================================
// EnsureBuilder Tests
// ============================================================================

#include "unionkit/core/ensure_builder.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace unionkit;

namespace {

Result<std::string> ValidateEmail(Result<std::string> input) {
    return std::move(input)
        .EnsureThat()
        .Check(checks::NotEmpty())
        .Check(checks::Contains("@"), ValidationError("Email.Invalid", "Not an email"))
        .Check([](const std::string& s) { return s.size() < 32; }, ValidationError("Email.TooLong", "Too long"));
}

}  // namespace

// ============================================================================
// Success path
// ============================================================================

TEST(EnsureBuilderTest, AllChecksPassKeepsValue) {
    auto email = ValidateEmail(std::string("a@b.c"));
    ASSERT_TRUE(email.IsSuccess());
    EXPECT_EQ(email.Value(), "a@b.c");
}

TEST(EnsureBuilderTest, NoChecksIsIdentity) {
    Result<int> ok = 4;
    Result<int> failed = Error("e");

    EXPECT_EQ(ok.EnsureThat().Build(), ok);
    EXPECT_EQ(failed.EnsureThat().Build(), failed);
}

// ============================================================================
// Error selection
// ============================================================================

TEST(EnsureBuilderTest, NamedCheckReportsItsDefaultError) {
    auto email = ValidateEmail(std::string(""));
    ASSERT_TRUE(email.IsFailure());
    EXPECT_EQ(email.Error().Code(), "StringError.Empty");
    EXPECT_EQ(email.Error().Kind(), ErrorKind::Validation);
}

TEST(EnsureBuilderTest, CallSiteErrorOverridesDefault) {
    auto email = ValidateEmail(std::string("nobody"));
    EXPECT_EQ(email.Error(), ValidationError("Email.Invalid", "Not an email"));
}

TEST(EnsureBuilderTest, PlainPredicateUsesGivenError) {
    auto email = ValidateEmail(std::string("someone@an-unreasonably-long-domain.example"));
    EXPECT_EQ(email.Error().Code(), "Email.TooLong");
}

TEST(EnsureBuilderTest, FirstViolationWins) {
    int calls = 0;
    Result<int> age = Result<int>(-5)
                          .EnsureThat()
                          .Check(checks::NonNegative())
                          .Check(checks::LessThan(150))
                          .Check(
                              [&calls](int) {
                                  ++calls;
                                  return false;
                              },
                              Error("never reported"));

    EXPECT_EQ(age.Error().Code(), "NumericError.Negative");
    EXPECT_EQ(calls, 0);
}

TEST(EnsureBuilderTest, FailedSourceSkipsEveryCheck) {
    int calls = 0;
    Result<int> source = NotFoundError("User.NotFound", "missing");
    Result<int> checked = source.EnsureThat().Check(
        [&calls](int) {
            ++calls;
            return true;
        },
        Error("unused"));

    EXPECT_EQ(checked.Error(), NotFoundError("User.NotFound", "missing"));
    EXPECT_EQ(calls, 0);
}

// ============================================================================
// Terminals
// ============================================================================

TEST(EnsureBuilderTest, MapAndBindCollapseFirst) {
    auto doubled = Result<int>(21).EnsureThat().Check(checks::Positive()).Map([](int x) { return x * 2; });
    EXPECT_EQ(doubled.Value(), 42);

    auto rejected = Result<int>(0).EnsureThat().Check(checks::Positive()).Bind([](int x) -> Result<int> {
        return x + 1;
    });
    EXPECT_EQ(rejected.Error().Code(), "NumericError.NotPositive");
}

TEST(EnsureBuilderTest, SourceIsUnchanged) {
    Result<int> source = 7;
    Result<int> checked = source.EnsureThat().Check(checks::Zero());

    EXPECT_TRUE(checked.IsFailure());
    EXPECT_EQ(source.Value(), 7);
}
