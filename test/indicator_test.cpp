#include <gtest/gtest.h>

#include <vector>

#include "indicator.hpp"
#include "test_helpers.hpp"

using indicator::isDefined;

TEST(IndicatorTest, ZeroWindowYieldsEmptySeries) {
    const std::vector<double> v = {1.0, 2.0, 3.0};
    EXPECT_TRUE(indicator::sma(v, 0).empty());
    EXPECT_TRUE(indicator::ema(v, 0).empty());
    EXPECT_TRUE(indicator::rsi(v, 0).empty());
    EXPECT_TRUE(indicator::atr(v, v, v, 0).empty());
}

TEST(IndicatorTest, SmaUndefinedUntilWindowFilled) {
    const auto s = indicator::sma({1.0, 2.0, 3.0, 4.0, 5.0}, 3);
    ASSERT_EQ(s.size(), 5u);
    EXPECT_FALSE(isDefined(s[0]));
    EXPECT_FALSE(isDefined(s[1]));
    EXPECT_DOUBLE_EQ(s[2], 2.0);
    EXPECT_DOUBLE_EQ(s[3], 3.0);
    EXPECT_DOUBLE_EQ(s[4], 4.0);
}

TEST(IndicatorTest, EmaWithWindowOneIsIdentity) {
    const std::vector<double> v = {10.0, 12.5, 11.0, 15.25, 9.0};
    const auto                e = indicator::ema(v, 1);
    ASSERT_EQ(e.size(), v.size());
    for (std::size_t i = 0; i < v.size(); ++i) {
        EXPECT_DOUBLE_EQ(e[i], v[i]) << "at " << i;
    }
}

TEST(IndicatorTest, EmaSeededWithFirstValue) {
    const auto e = indicator::ema({10.0, 20.0}, 3);  // alpha = 0.5
    EXPECT_DOUBLE_EQ(e[0], 10.0);
    EXPECT_DOUBLE_EQ(e[1], 15.0);
}

TEST(IndicatorTest, ConstantSeriesEmaAndAtrEqualConstant) {
    const std::size_t   n = 60;
    std::vector<double> close(n, 42.0);
    std::vector<double> high(n, 43.0);
    std::vector<double> low(n, 41.0);

    for (const double v : indicator::ema(close, 20)) {
        EXPECT_NEAR(v, 42.0, 1e-9);
    }

    const auto a = indicator::atr(high, low, close, 14);
    ASSERT_EQ(a.size(), n);
    for (std::size_t i = 0; i < 13; ++i) {
        EXPECT_FALSE(isDefined(a[i]));
    }
    for (std::size_t i = 13; i < n; ++i) {
        EXPECT_NEAR(a[i], 2.0, 1e-9);
    }
}

TEST(IndicatorTest, ConstantSeriesRsiIsUndefinedEverywhere) {
    const std::vector<double> close(50, 100.0);
    std::vector<double>       r;
    ASSERT_NO_THROW(r = indicator::rsi(close, 14));
    ASSERT_EQ(r.size(), close.size());
    for (const double v : r) {
        EXPECT_FALSE(isDefined(v));
    }
}

TEST(IndicatorTest, RisingSeriesRsiIsHundred) {
    const auto r = indicator::rsi(test_helpers::linear(30, 100.0, 1.0), 14);
    EXPECT_FALSE(isDefined(r[12]));
    for (std::size_t i = 13; i < r.size(); ++i) {
        EXPECT_DOUBLE_EQ(r[i], 100.0);
    }
}

TEST(IndicatorTest, FallingSeriesRsiIsZero) {
    const auto r = indicator::rsi(test_helpers::linear(30, 100.0, -1.0), 14);
    for (std::size_t i = 13; i < r.size(); ++i) {
        EXPECT_DOUBLE_EQ(r[i], 0.0);
    }
}

TEST(IndicatorTest, RsiBalancedMovesIsFifty) {
    const auto r = indicator::rsi({1.0, 2.0, 1.0}, 2);
    EXPECT_DOUBLE_EQ(r[1], 100.0);  // window {0, +1}
    EXPECT_DOUBLE_EQ(r[2], 50.0);   // window {+1, -1}
}

TEST(IndicatorTest, TrueRangeIncludesGapFromPreviousClose) {
    const auto tr = indicator::trueRange({10.0, 20.0}, {9.0, 19.0}, {9.5, 19.5});
    ASSERT_EQ(tr.size(), 2u);
    EXPECT_DOUBLE_EQ(tr[0], 1.0);
    EXPECT_DOUBLE_EQ(tr[1], 10.5);
}

TEST(IndicatorTest, TrueRangeRejectsMismatchedColumns) {
    EXPECT_TRUE(indicator::trueRange({1.0, 2.0}, {1.0}, {1.0, 2.0}).empty());
}

TEST(IndicatorTest, MacdOfConstantSeriesIsFlat) {
    const auto m = indicator::macd(std::vector<double>(40, 7.0), 12, 26, 9);
    ASSERT_EQ(m.line.size(), 40u);
    ASSERT_EQ(m.signal.size(), 40u);
    ASSERT_EQ(m.histogram.size(), 40u);
    for (std::size_t i = 0; i < 40; ++i) {
        EXPECT_NEAR(m.line[i], 0.0, 1e-12);
        EXPECT_NEAR(m.histogram[i], 0.0, 1e-12);
    }
}

TEST(IndicatorTest, CrossoverRequiresStrictCross) {
    const std::vector<double> a = {1.0, 3.0, 4.0};
    const std::vector<double> b = {2.0, 2.0, 5.0};

    EXPECT_FALSE(indicator::crossover(a, b, 0));
    EXPECT_TRUE(indicator::crossover(a, b, 1));
    EXPECT_FALSE(indicator::crossover(b, a, 1));
    EXPECT_TRUE(indicator::crossover(b, a, 2));
    EXPECT_FALSE(indicator::crossover(a, b, 3));  // out of range

    // Touching is not crossing.
    EXPECT_FALSE(indicator::crossover({2.0, 3.0}, {2.0, 2.0}, 1));
}

TEST(IndicatorTest, CrossoverIgnoresUndefinedValues) {
    const std::vector<double> a = {indicator::undefined, 3.0};
    const std::vector<double> b = {2.0, 2.0};
    EXPECT_FALSE(indicator::crossover(a, b, 1));
    EXPECT_FALSE(indicator::crossover(a, 2.5, 1));
}

TEST(IndicatorTest, CrossoverAgainstLevel) {
    const std::vector<double> up   = {45.0, 55.0};
    const std::vector<double> down = {55.0, 45.0};

    EXPECT_TRUE(indicator::crossover(up, 50.0, 1));
    EXPECT_FALSE(indicator::crossover(50.0, up, 1));
    EXPECT_TRUE(indicator::crossover(50.0, down, 1));
    EXPECT_FALSE(indicator::crossover(down, 50.0, 1));
}
