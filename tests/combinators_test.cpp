// ============================================================================
// Result Combinator Tests
// ============================================================================

#include "unionkit/core/combinators.hpp"

#include <gtest/gtest.h>

#include <string>
#include <tuple>

using namespace unionkit;

// ============================================================================
// Combine (fail-fast)
// ============================================================================

TEST(CombineTest, AllSuccessesBuildTuple) {
    auto combined = Combine(Result<int>(1), Result<std::string>(std::string("a")), Result<bool>(true));

    ASSERT_TRUE(combined.IsSuccess());
    EXPECT_EQ(combined.Value(), std::make_tuple(1, std::string("a"), true));
}

TEST(CombineTest, ReturnsFirstFailure) {
    auto combined = Combine(Result<int>(1), Result<int>(Error("second")), Result<int>(Error("third")));

    ASSERT_TRUE(combined.IsFailure());
    EXPECT_EQ(combined.Error(), Error("second"));
}

TEST(CombineTest, Valueless) {
    Result<void> ok = Ok();
    Result<void> bad = Error("bad");
    Result<void> worse = Error("worse");

    EXPECT_TRUE(Combine(ok, ok).IsSuccess());
    EXPECT_EQ(Combine(ok, bad, worse).Error(), Error("bad"));
}

TEST(CombineTest, DestructuresIntoMap) {
    auto sum = Combine(Result<int>(2), Result<int>(3)).Map([](int a, int b) { return a + b; });
    EXPECT_EQ(sum.Value(), 5);
}

// ============================================================================
// BindAll (accumulating)
// ============================================================================

TEST(BindAllTest, AllSuccessesBuildTuple) {
    auto all = BindAll(Result<int>(1), Result<double>(2.0));
    EXPECT_EQ(all.Value(), std::make_tuple(1, 2.0));
}

TEST(BindAllTest, CollectsEveryFailureInOrder) {
    auto all = BindAll(Result<int>(Error("a")), Result<int>(1), Result<int>(Error("b")));

    ASSERT_TRUE(all.IsFailure());
    ASSERT_TRUE(all.Error().IsAggregate());
    ASSERT_EQ(all.Error().Children().size(), 2u);
    EXPECT_EQ(all.Error().Children()[0], Error("a"));
    EXPECT_EQ(all.Error().Children()[1], Error("b"));
}

TEST(BindAllTest, SingleFailureIsNotWrapped) {
    auto all = BindAll(Result<int>(1), Result<int>(NotFoundError("only")));
    EXPECT_EQ(all.Error(), NotFoundError("only"));
}

TEST(BindAllTest, FailureCountMatchesFailingOperands) {
    Result<void> ok = Ok();
    Result<void> a = Error("a");
    Result<void> b = Error("b");
    Result<void> c = Error("c");

    EXPECT_EQ(BindAll(a, ok, b, c).Error().Children().size(), 3u);
    EXPECT_EQ(BindAll(c, b, ok, a).Error().Children().size(), 3u);
    EXPECT_TRUE(BindAll(ok, ok, ok).IsSuccess());
}

// ============================================================================
// BindAppend (lazy, fail-fast)
// ============================================================================

TEST(BindAppendTest, RunsProducersInOrder) {
    std::string order;
    auto both = BindAppend(
        [&] {
            order += "a";
            return Result<int>(1);
        },
        [&] {
            order += "b";
            return Result<std::string>(std::string("two"));
        });

    EXPECT_EQ(both.Value(), std::make_tuple(1, std::string("two")));
    EXPECT_EQ(order, "ab");
}

TEST(BindAppendTest, LaterProducersNeverRunAfterFailure) {
    int third_calls = 0;
    auto result = BindAppend([] { return Result<int>(1); }, [] { return Result<int>(Error("second")); },
                             [&third_calls] {
                                 ++third_calls;
                                 return Result<int>(3);
                             });

    EXPECT_EQ(result.Error(), Error("second"));
    EXPECT_EQ(third_calls, 0);
}

// ============================================================================
// Ensure / EnsureAll
// ============================================================================

TEST(EnsureTest, SingleCondition) {
    EXPECT_TRUE(Ensure(1 < 2, Error("never")).IsSuccess());
    EXPECT_EQ(Ensure(2 < 1, Error("order")).Error(), Error("order"));
}

TEST(EnsureTest, RequirementsStopAtFirstFailure) {
    int calls = 0;
    auto result = Ensure({
        {[] { return true; }, Error("one")},
        {[] { return false; }, Error("two")},
        {[&calls] {
             ++calls;
             return false;
         },
         Error("three")},
    });

    EXPECT_EQ(result.Error(), Error("two"));
    EXPECT_EQ(calls, 0);
}

TEST(EnsureAllTest, ReportsEveryViolatedCondition) {
    std::string name;
    int age = -1;
    std::string email = "a@b.c";

    auto result = EnsureAll({
        {!name.empty(), ValidationError("Name required")},
        {age >= 0, ValidationError("Age invalid")},
        {email.find('@') != std::string::npos, ValidationError("Email invalid")},
    });

    ASSERT_TRUE(result.IsFailure());
    ASSERT_TRUE(result.Error().IsAggregate());
    ASSERT_EQ(result.Error().Children().size(), 2u);
    EXPECT_EQ(result.Error().Children()[0].Message(), "Name required");
    EXPECT_EQ(result.Error().Children()[1].Message(), "Age invalid");
}

TEST(EnsureAllTest, SucceedsWhenAllHold) {
    EXPECT_TRUE(EnsureAll({{true, Error("a")}, {true, Error("b")}}).IsSuccess());
}
