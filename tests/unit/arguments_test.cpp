#include <gtest/gtest.h>
#include "contagion/core/arguments.hpp"

#include <cstdint>
#include <limits>

TEST(ArgumentsTest, ParsesSeedsAcrossTheFullRange) {
    EXPECT_EQ(Arguments::parseSeed("0"), 0u);
    EXPECT_EQ(Arguments::parseSeed("42"), 42u);
    EXPECT_EQ(Arguments::parseSeed("007"), 7u);
    EXPECT_EQ(Arguments::parseSeed("4294967295"), std::numeric_limits<uint32_t>::max());
}

TEST(ArgumentsTest, RejectsSeedsThatWouldWrap) {
    EXPECT_FALSE(Arguments::parseSeed("-1").has_value());
    EXPECT_FALSE(Arguments::parseSeed("4294967296").has_value());
    EXPECT_FALSE(Arguments::parseSeed("18446744073709551615").has_value());
    EXPECT_FALSE(Arguments::parseSeed("99999999999999999999999").has_value());
}

TEST(ArgumentsTest, RejectsMalformedText) {
    EXPECT_FALSE(Arguments::parseSeed("").has_value());
    EXPECT_FALSE(Arguments::parseSeed("+5").has_value());
    EXPECT_FALSE(Arguments::parseSeed(" 5").has_value());
    EXPECT_FALSE(Arguments::parseSeed("5 ").has_value());
    EXPECT_FALSE(Arguments::parseSeed("12abc").has_value());
    EXPECT_FALSE(Arguments::parseSeed("0x10").has_value());
}

TEST(ArgumentsTest, UnsignedRespectsItsLimit) {
    EXPECT_EQ(Arguments::parseUnsigned("100", 100), 100u);
    EXPECT_FALSE(Arguments::parseUnsigned("101", 100).has_value());
    EXPECT_FALSE(Arguments::parseUnsigned("1000", 100).has_value());
    EXPECT_FALSE(Arguments::parseUnsigned("5", 0).has_value());
    EXPECT_EQ(Arguments::parseUnsigned("0", 0), 0u);

    uint64_t const max = std::numeric_limits<uint64_t>::max();
    EXPECT_EQ(Arguments::parseUnsigned("18446744073709551615", max), max);
    EXPECT_FALSE(Arguments::parseUnsigned("18446744073709551616", max).has_value());
}
