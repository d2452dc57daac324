// ============================================================================
// Guid Tests
// ============================================================================

#include "unionkit/core/guid.hpp"

#include <gtest/gtest.h>

#include <set>
#include <sstream>

using namespace unionkit;

namespace {

constexpr const char* kCanonical = "0f8fad5b-d9cb-469f-a165-70867728950e";

}  // namespace

TEST(GuidTest, DefaultIsNil) {
    Guid guid;
    EXPECT_TRUE(guid.IsNil());
    EXPECT_EQ(guid.ToString(), "00000000-0000-0000-0000-000000000000");
}

TEST(GuidTest, ParseCanonicalForm) {
    auto parsed = Guid::Parse(kCanonical);
    ASSERT_TRUE(parsed.IsSome());

    EXPECT_FALSE(parsed.Value().IsNil());
    EXPECT_EQ(parsed.Value().Data()[0], 0x0f);
    EXPECT_EQ(parsed.Value().Data()[15], 0x0e);
    EXPECT_EQ(parsed.Value().ToString(), kCanonical);
}

TEST(GuidTest, ParseAcceptsBracesAndUppercase) {
    auto braced = Guid::Parse("{0F8FAD5B-D9CB-469F-A165-70867728950E}");
    ASSERT_TRUE(braced.IsSome());
    EXPECT_EQ(braced, Guid::Parse(kCanonical));
}

TEST(GuidTest, ParseRejectsMalformedText) {
    EXPECT_TRUE(Guid::Parse("").IsNone());
    EXPECT_TRUE(Guid::Parse("0f8fad5b-d9cb-469f-a165-70867728950").IsNone());
    EXPECT_TRUE(Guid::Parse("0f8fad5b-d9cb-469f-a165-70867728950g").IsNone());
    EXPECT_TRUE(Guid::Parse("0f8fad5bd-9cb-469f-a165-70867728950e").IsNone());
    EXPECT_TRUE(Guid::Parse("{0f8fad5b-d9cb-469f-a165-70867728950e)").IsNone());
    EXPECT_TRUE(Guid::Parse("0f8fad5b-d9cb-469f-a165-70867728950e00").IsNone());
}

TEST(GuidTest, RoundTripsThroughText) {
    Guid::Bytes bytes = {0xde, 0xad, 0xbe, 0xef, 0x00, 0x01, 0x02, 0x03,
                         0x04, 0x05, 0x06, 0x07, 0x08, 0x09, 0x0a, 0x0b};
    Guid guid(bytes);

    EXPECT_EQ(guid.ToString(), "deadbeef-0001-0203-0405-060708090a0b");
    EXPECT_EQ(Guid::Parse(guid.ToString()), Some(guid));
}

TEST(GuidTest, OrderingAndStreaming) {
    Guid nil;
    Guid one(Guid::Bytes{0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 1});

    EXPECT_LT(nil, one);
    EXPECT_EQ(std::set<Guid>({one, nil, one}).size(), 2u);

    std::ostringstream oss;
    oss << one;
    EXPECT_EQ(oss.str(), "00000000-0000-0000-0000-000000000001");
}

TEST(GuidTest, MissingIdBecomesFailure) {
    Result<Guid> id = Guid::Parse("not-a-guid").ToResult(NotFoundError("Order.MissingId", "No id"));
    EXPECT_EQ(id.Error().Code(), "Order.MissingId");
}
