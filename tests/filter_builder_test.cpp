// ============================================================================
// FilterBuilder Tests
// ============================================================================

#include "unionkit/core/filter_builder.hpp"

#include <gtest/gtest.h>

#include <string>
#include <tuple>

using namespace unionkit;

// ============================================================================
// Eligible / Disqualified
// ============================================================================

TEST(FilterBuilderTest, AllChecksPassKeepsValue) {
    Option<std::string> valid = Some(std::string("alice"))
                                    .Filter()
                                    .Check(checks::NotEmpty())
                                    .Check(checks::ShorterThan(10))
                                    .Check([](const std::string& s) { return s.front() != '_'; });

    EXPECT_EQ(valid, Some(std::string("alice")));
}

TEST(FilterBuilderTest, FailingCheckDisqualifies) {
    Option<int> port = Some(80).Filter().Check(checks::GreaterThan(1024));
    EXPECT_TRUE(port.IsNone());
}

TEST(FilterBuilderTest, ChecksAfterDisqualificationNeverRun) {
    int calls = 0;
    Option<std::string> result = Some(std::string(""))
                                     .Filter()
                                     .Check(checks::NotEmpty())
                                     .Check([&calls](const std::string&) {
                                         ++calls;
                                         return true;
                                     });

    EXPECT_TRUE(result.IsNone());
    EXPECT_EQ(calls, 0);
}

TEST(FilterBuilderTest, NoneSourceNeverRunsPredicates) {
    int calls = 0;
    Option<int> none;
    Option<int> result = none.Filter().Check([&calls](int) {
        ++calls;
        return true;
    });

    EXPECT_TRUE(result.IsNone());
    EXPECT_EQ(calls, 0);
}

TEST(FilterBuilderTest, SourceIsUnchanged) {
    Option<int> source = Some(3);
    Option<int> filtered = source.Filter().Check(checks::Negative());

    EXPECT_TRUE(filtered.IsNone());
    EXPECT_EQ(source, Some(3));
}

TEST(FilterBuilderTest, NoChecksIsIdentity) {
    EXPECT_EQ(Some(5).Filter().Build(), Some(5));
    EXPECT_TRUE(Option<int>().Filter().Build().IsNone());
}

// ============================================================================
// Terminals
// ============================================================================

TEST(FilterBuilderTest, MapCollapsesFirst) {
    auto length = Some(std::string("hello")).Filter().Check(checks::StartsWith("he")).Map([](std::string s) {
        return s.size();
    });
    EXPECT_EQ(length, Some(size_t{5}));

    auto rejected = Some(std::string("world")).Filter().Check(checks::StartsWith("he")).Map([](std::string s) {
        return s.size();
    });
    EXPECT_TRUE(rejected.IsNone());
}

TEST(FilterBuilderTest, BindCollapsesFirst) {
    auto half = [](int x) -> Option<int> {
        if (x % 2 != 0) return None;
        return x / 2;
    };

    EXPECT_EQ(Some(8).Filter().Check(checks::Positive()).Bind(half), Some(4));
    EXPECT_TRUE(Some(-8).Filter().Check(checks::Positive()).Bind(half).IsNone());
}

TEST(FilterBuilderTest, DestructuresTuplePayload) {
    Option<std::tuple<int, int>> range = Zip(Some(1), Some(5)).Filter().Check([](int lo, int hi) { return lo < hi; });
    EXPECT_TRUE(range.IsSome());
}

TEST(FilterBuilderTest, PredicateFilterMatchesOneShotFilter) {
    auto even = [](int x) { return x % 2 == 0; };
    for (int x : {1, 2, 3, 4}) {
        Option<int> chained = Some(x).Filter().Check(even);
        EXPECT_EQ(chained, Some(x).Filter(even));
    }
}
