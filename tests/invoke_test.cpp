// ============================================================================
// Invoke Tests
// ============================================================================

#include "unionkit/core/invoke.hpp"

#include "unionkit/core/option.hpp"
#include "unionkit/core/result.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

using namespace unionkit;

// ============================================================================
// Direct calls
// ============================================================================

TEST(InvokeTest, CallsWithValue) {
    int result = Invoke([](int x) { return x * 2; }, 21);
    EXPECT_EQ(result, 42);
}

TEST(InvokeTest, FunctionTakingTupleGetsTuple) {
    auto t = std::make_tuple(1, 2);
    int second = Invoke([](const std::tuple<int, int>& whole) { return std::get<1>(whole); }, t);
    EXPECT_EQ(second, 2);
}

TEST(InvokeTest, ReturnsReferences) {
    std::string text = "ref";
    std::string& same = Invoke([](std::string& s) -> std::string& { return s; }, text);
    EXPECT_EQ(&same, &text);
}

// ============================================================================
// Tuple destructuring
// ============================================================================

TEST(InvokeTest, UnpacksTuple) {
    auto joined = Invoke([](int n, const std::string& s, char c) { return std::to_string(n) + s + c; },
                         std::make_tuple(1, std::string("-"), 'x'));
    EXPECT_EQ(joined, "1-x");
}

TEST(InvokeTest, UnpacksPair) {
    auto sum = Invoke([](int a, double b) { return a + b; }, std::make_pair(1, 0.5));
    EXPECT_DOUBLE_EQ(sum, 1.5);
}

TEST(InvokeTest, UnpackedMoveOnlyElements) {
    auto pair = std::make_tuple(std::make_unique<int>(3), std::make_unique<int>(4));
    int product = Invoke([](std::unique_ptr<int> a, std::unique_ptr<int> b) { return *a * *b; }, std::move(pair));
    EXPECT_EQ(product, 12);
}

TEST(InvokeTest, Concepts) {
    using Pair = std::tuple<int, int>;
    auto two_args = [](int, int) {};
    auto one_arg = [](int) {};

    static_assert(InvocableWith<decltype(two_args), Pair>);
    static_assert(InvocableWith<decltype(one_arg), int>);
    static_assert(!InvocableWith<decltype(one_arg), Pair>);
    static_assert(!InvocableWith<decltype(two_args), int>);
    static_assert(std::is_same_v<InvokeResultT<int (*)(int, int), Pair>, int>);
}

// ============================================================================
// Payload helpers
// ============================================================================

TEST(InvokeTest, AsTupleFlattensOneLevel) {
    EXPECT_EQ(detail::AsTuple(5), std::make_tuple(5));
    EXPECT_EQ(detail::AsTuple(std::make_pair(1, 'a')), std::make_tuple(1, 'a'));

    using Concat = detail::ConcatTuple<std::tuple<int, char>, double>;
    static_assert(std::is_same_v<Concat, std::tuple<int, char, double>>);
}

TEST(InvokeTest, DestructuringThroughCombinators) {
    Result<std::tuple<int, int>> pair = std::make_tuple(6, 7);

    EXPECT_EQ(pair.Map([](int a, int b) { return a * b; }).Value(), 42);
    EXPECT_TRUE(pair.Ensure([](int a, int b) { return a < b; }, Error("order")).IsSuccess());
    EXPECT_EQ(pair.Match([](int a, int) { return a; }, [](const Error&) { return -1; }), 6);

    auto option = Zip(Some(1), Some(2), Some(3));
    int visits = 0;
    option.OnSome([&visits](int, int, int) { ++visits; });
    EXPECT_EQ(visits, 1);
}
