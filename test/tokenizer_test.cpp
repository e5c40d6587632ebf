#include "gtest/gtest.h"
#include <climits>
#include <string>
#include <vector>

#include <uniqint/tokenizer.h>

using namespace std;
using UniqInt::Range;

static const Range DEFAULT_RANGE{UniqInt::DEFAULT_MIN_VALUE, UniqInt::DEFAULT_MAX_VALUE};

TEST(TokenizerTest, ParseValid) {
    long long v = 0;
    ASSERT_TRUE(UniqInt::parse_int("5", &v));
    ASSERT_EQ(5, v);
    ASSERT_TRUE(UniqInt::parse_int("+5", &v));
    ASSERT_EQ(5, v);
    ASSERT_TRUE(UniqInt::parse_int("-5", &v));
    ASSERT_EQ(-5, v);
    ASSERT_TRUE(UniqInt::parse_int("007", &v));
    ASSERT_EQ(7, v);
    ASSERT_TRUE(UniqInt::parse_int("-0", &v));
    ASSERT_EQ(0, v);
}

TEST(TokenizerTest, ParseInvalid) {
    long long v = 42;
    for (const char* token : {"", "+", "-", "5.0", "5a", "a5", "abc", "--5", "+-5", "1_000", "5-", "0x10", " 5"}) {
        ASSERT_FALSE(UniqInt::parse_int(token, &v)) << "token '" << token << "'";
    }
    ASSERT_EQ(42, v) << "value untouched on failure";
}

TEST(TokenizerTest, ParseSaturates) {
    long long v = 0;
    ASSERT_TRUE(UniqInt::parse_int("9223372036854775807", &v));
    ASSERT_EQ(LLONG_MAX, v);
    ASSERT_TRUE(UniqInt::parse_int("-9223372036854775808", &v));
    ASSERT_EQ(LLONG_MIN, v);
    ASSERT_TRUE(UniqInt::parse_int("99999999999999999999999", &v));
    ASSERT_EQ(LLONG_MAX, v);
    ASSERT_TRUE(UniqInt::parse_int("-99999999999999999999999", &v));
    ASSERT_EQ(LLONG_MIN, v);
    ASSERT_FALSE(DEFAULT_RANGE.contains(v));
}

TEST(TokenizerTest, Split) {
    vector<string> expected{"1", "two", "-3"};
    ASSERT_EQ(expected, UniqInt::split_tokens("  1\ttwo   -3\r"));
    ASSERT_TRUE(UniqInt::split_tokens("").empty());
    ASSERT_TRUE(UniqInt::split_tokens(" \t\v\f\r ").empty());
}

TEST(TokenizerTest, HandleLineScenario) {
    vector<int> expected{5, -10, -1023, 1023};
    ASSERT_EQ(expected, UniqInt::handle_line("5 -10 abc 2000 -1023 1023", DEFAULT_RANGE));
}

TEST(TokenizerTest, HandleLineBounds) {
    vector<int> expected{-1023, 1023, 0};
    ASSERT_EQ(expected, UniqInt::handle_line("-1024 -1023 1023 1024 +0 99999999999999999999", DEFAULT_RANGE));
}

TEST(TokenizerTest, HandleLineNothingValid) {
    ASSERT_TRUE(UniqInt::handle_line("abc 5.0 5a +", DEFAULT_RANGE).empty());
    ASSERT_TRUE(UniqInt::handle_line("", DEFAULT_RANGE).empty());
}

TEST(TokenizerTest, HandleLineCustomRange) {
    vector<int> expected{0, 10};
    ASSERT_EQ(expected, UniqInt::handle_line("-1 0 10 11", Range{0, 10}));
}
