// ============================================================================
// Option Type Tests
// ============================================================================

#include "unionkit/core/option.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <tuple>
#include <vector>

using namespace unionkit;

// ============================================================================
// Construction and Observers
// ============================================================================

TEST(OptionTest, SomeAndNone) {
    Option<int> some = Some(5);
    Option<int> none = None;

    EXPECT_TRUE(some.IsSome());
    EXPECT_FALSE(some.IsNone());
    EXPECT_TRUE(none.IsNone());
    EXPECT_FALSE(none.IsSome());
    EXPECT_EQ(some.Value(), 5);
}

TEST(OptionTest, DefaultIsNone) {
    Option<std::string> option;
    EXPECT_TRUE(option.IsNone());
}

TEST(OptionTest, ImplicitFromValue) {
    Option<std::string> option = std::string("hello");
    ASSERT_TRUE(option.IsSome());
    EXPECT_EQ(option.Value(), "hello");
}

TEST(OptionTest, BoolConversion) {
    EXPECT_TRUE(static_cast<bool>(Some(1)));
    EXPECT_FALSE(static_cast<bool>(Option<int>()));
}

TEST(OptionTest, FromPointer) {
    int value = 7;
    const int* null = nullptr;

    EXPECT_EQ(Option<int>::From(&value), Some(7));
    EXPECT_TRUE(Option<int>::From(null).IsNone());
}

TEST(OptionTest, FromStdOptional) {
    EXPECT_EQ(Option<int>::From(std::optional<int>(3)), Some(3));
    EXPECT_TRUE(Option<int>::From(std::optional<int>()).IsNone());
}

// ============================================================================
// Accessors
// ============================================================================

TEST(OptionTest, ValueOr) {
    EXPECT_EQ(Some(5).ValueOr(0), 5);
    EXPECT_EQ(Option<int>().ValueOr(0), 0);
}

TEST(OptionTest, ValueOrElseIsLazy) {
    int calls = 0;
    auto factory = [&calls] {
        ++calls;
        return 9;
    };

    EXPECT_EQ(Some(5).ValueOrElse(factory), 5);
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(Option<int>().ValueOrElse(factory), 9);
    EXPECT_EQ(calls, 1);
}

TEST(OptionTest, TryGetValue) {
    int out = 0;
    EXPECT_TRUE(Some(5).TryGetValue(out));
    EXPECT_EQ(out, 5);

    out = 0;
    EXPECT_FALSE(Option<int>().TryGetValue(out));
    EXPECT_EQ(out, 0);
}

TEST(OptionTest, MoveOnlyValue) {
    Option<std::unique_ptr<int>> option = std::make_unique<int>(4);
    auto mapped = std::move(option).Map([](std::unique_ptr<int> p) { return *p * 2; });
    EXPECT_EQ(mapped, Some(8));
}

// ============================================================================
// Map / Bind / Match
// ============================================================================

TEST(OptionTest, MapSome) {
    EXPECT_EQ(Some(5).Map([](int x) { return x * 2; }), Some(10));
}

TEST(OptionTest, MapNeverChangesPresence) {
    Option<int> none;
    int calls = 0;
    auto mapped = none.Map([&calls](int x) {
        ++calls;
        return std::to_string(x);
    });

    EXPECT_TRUE(mapped.IsNone());
    EXPECT_EQ(calls, 0);
}

TEST(OptionTest, MapChangesType) {
    Option<std::string> mapped = Some(42).Map([](int x) { return std::to_string(x); });
    EXPECT_EQ(mapped, Some(std::string("42")));
}

TEST(OptionTest, BindSomeDelegates) {
    auto half = [](int x) -> Option<int> {
        if (x % 2 != 0) return None;
        return x / 2;
    };

    EXPECT_EQ(Some(8).Bind(half), Some(4));
    EXPECT_TRUE(Some(7).Bind(half).IsNone());
}

TEST(OptionTest, BindOnNoneNeverCallsFunction) {
    int calls = 0;
    auto result = Option<int>().Bind([&calls](int x) {
        ++calls;
        return Some(x * 2);
    });

    EXPECT_TRUE(result.IsNone());
    EXPECT_EQ(calls, 0);
}

TEST(OptionTest, MatchRunsExactlyOneBranch) {
    int some_calls = 0;
    int none_calls = 0;

    auto on_some = [&](int x) {
        ++some_calls;
        return x;
    };
    auto on_none = [&] {
        ++none_calls;
        return -1;
    };

    EXPECT_EQ(Some(3).Match(on_some, on_none), 3);
    EXPECT_EQ(Option<int>().Match(on_some, on_none), -1);
    EXPECT_EQ(some_calls, 1);
    EXPECT_EQ(none_calls, 1);
}

// ============================================================================
// Filter / OrElse / Flatten
// ============================================================================

TEST(OptionTest, FilterKeepsOrDrops) {
    auto even = [](int x) { return x % 2 == 0; };

    EXPECT_EQ(Some(4).Filter(even), Some(4));
    EXPECT_TRUE(Some(3).Filter(even).IsNone());
    EXPECT_TRUE(Option<int>().Filter(even).IsNone());
}

TEST(OptionTest, OrElseValue) {
    EXPECT_EQ(Some(1).OrElse(Some(2)), Some(1));
    EXPECT_EQ(Option<int>().OrElse(Some(2)), Some(2));
}

TEST(OptionTest, OrElseFactoryIsLazy) {
    int calls = 0;
    auto fallback = [&calls] {
        ++calls;
        return Some(2);
    };

    EXPECT_EQ(Some(1).OrElse(fallback), Some(1));
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(Option<int>().OrElse(fallback), Some(2));
    EXPECT_EQ(calls, 1);
}

TEST(OptionTest, Flatten) {
    Option<Option<int>> nested = Some(Some(3));
    Option<Option<int>> inner_none = Some(Option<int>());
    Option<Option<int>> outer_none;

    EXPECT_EQ(nested.Flatten(), Some(3));
    EXPECT_TRUE(inner_none.Flatten().IsNone());
    EXPECT_TRUE(outer_none.Flatten().IsNone());
}

// ============================================================================
// Side effects
// ============================================================================

TEST(OptionTest, ObserversReturnOptionUnchanged) {
    std::vector<std::string> log;

    auto some = Some(1)
                    .OnSome([&](int x) { log.push_back("some " + std::to_string(x)); })
                    .OnNone([&] { log.push_back("none"); });
    auto none = Option<int>()
                    .OnSome([&](int) { log.push_back("unexpected"); })
                    .OnEither([&](int) { log.push_back("unexpected"); }, [&] { log.push_back("either none"); });

    EXPECT_EQ(some, Some(1));
    EXPECT_TRUE(none.IsNone());
    EXPECT_EQ(log, (std::vector<std::string>{"some 1", "either none"}));
}

// ============================================================================
// Zip and tuple destructuring
// ============================================================================

TEST(OptionTest, ZipTwo) {
    auto zipped = Zip(Some(2), Some(std::string("x")));
    ASSERT_TRUE(zipped.IsSome());
    EXPECT_EQ(zipped.Value(), std::make_tuple(2, std::string("x")));
}

TEST(OptionTest, ZipShortCircuitsOnNone) {
    EXPECT_TRUE(Zip(Some(1), Option<int>()).IsNone());
    EXPECT_TRUE(Zip(Some(1), Some(2), Option<double>()).IsNone());
}

TEST(OptionTest, MapDestructuresTuple) {
    auto product = Zip(Some(2), Some(3), Some(4)).Map([](int a, int b, int c) { return a * b * c; });
    EXPECT_EQ(product, Some(24));
}

TEST(OptionTest, FunctionTakingTupleGetsTuple) {
    auto first = Zip(Some(2), Some(3)).Map([](const std::tuple<int, int>& t) { return std::get<0>(t); });
    EXPECT_EQ(first, Some(2));
}

// ============================================================================
// Comparison and printing
// ============================================================================

TEST(OptionTest, Equality) {
    EXPECT_EQ(Some(1), Some(1));
    EXPECT_NE(Some(1), Some(2));
    EXPECT_NE(Some(1), Option<int>());
    EXPECT_EQ(Option<int>(), Option<int>());
    EXPECT_TRUE(Some(1) == 1);
    EXPECT_TRUE(Option<int>() == None);
    EXPECT_FALSE(Some(1) == None);
}

TEST(OptionTest, NoneOrdersFirst) {
    EXPECT_LT(Option<int>(), Some(-100));
    EXPECT_LT(Some(1), Some(2));
    EXPECT_GT(Some(2), Some(1));
    EXPECT_LE(Option<int>(), Option<int>());
}

TEST(OptionTest, ToString) {
    EXPECT_EQ(Some(5).ToString(), "Some(5)");
    EXPECT_EQ(Option<int>().ToString(), "None");

    std::ostringstream oss;
    oss << Some(std::string("hi"));
    EXPECT_EQ(oss.str(), "Some(hi)");
}

// ============================================================================
// Misuse
// ============================================================================

TEST(OptionDeathTest, ValueOnNoneAborts) {
    Option<int> none;
    EXPECT_DEATH((void)none.Value(), "Option is None");
}
