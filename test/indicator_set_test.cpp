#include <gtest/gtest.h>

#include <stdexcept>

#include "indicator.hpp"
#include "indicator_set.hpp"

TEST(IndicatorSetTest, LookupSkipsUndefinedEntries) {
    IndicatorSet set(3);
    set.add("x", {indicator::undefined, 1.5, 2.5}, 2);

    EXPECT_TRUE(set.contains("x"));
    EXPECT_FALSE(set.contains("y"));
    EXPECT_FALSE(set.at("x", 0).has_value());
    ASSERT_TRUE(set.at("x", 1).has_value());
    EXPECT_DOUBLE_EQ(*set.at("x", 1), 1.5);
    EXPECT_FALSE(set.at("x", 3).has_value());
}

TEST(IndicatorSetTest, WarmupIsLargestRegistered) {
    IndicatorSet set(2);
    EXPECT_EQ(set.warmup(), 0u);

    set.add("fast", {1.0, 2.0}, 1);
    set.add("slow", {indicator::undefined, 2.0}, 2);
    EXPECT_EQ(set.warmup(), 2u);
    EXPECT_EQ(set.names(), (std::vector<std::string>{"fast", "slow"}));
}

TEST(IndicatorSetTest, RejectsMisalignedSeries) {
    IndicatorSet set(3);
    EXPECT_THROW(set.add("short", {1.0, 2.0}, 1), std::invalid_argument);
}

TEST(IndicatorSetTest, RejectsDuplicateName) {
    IndicatorSet set(1);
    set.add("rsi", {50.0}, 1);
    EXPECT_THROW(set.add("rsi", {40.0}, 1), std::invalid_argument);
}

TEST(IndicatorSetTest, UnknownNameThrows) {
    IndicatorSet set(1);
    EXPECT_THROW(static_cast<void>(set.series("missing")), std::out_of_range);
    EXPECT_THROW(static_cast<void>(set.at("missing", 0)), std::out_of_range);
}
