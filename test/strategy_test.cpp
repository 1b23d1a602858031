#include <gtest/gtest.h>

#include <stdexcept>
#include <utility>
#include <vector>

#include "backtest/backtest_engine.hpp"
#include "indicator.hpp"
#include "macd_crossover.hpp"
#include "rsi_strategy.hpp"
#include "test_helpers.hpp"
#include "trend_filtered_rsi.hpp"

using test_helpers::linear;
using test_helpers::makeSeries;

namespace {

Position positioned(Direction direction) {
    Position p;
    p.direction  = direction;
    p.entryPrice = 100.0;
    p.size       = 1.0;
    return p;
}

/**
 * @brief MACD crossover driven by fixed line/signal series instead of prices.
 */
class FixedMacd: public MacdCrossover {
   public:
    FixedMacd(std::vector<double> line, std::vector<double> signal)
        : line_(std::move(line))
        , signal_(std::move(signal)) {}

    void init(const BarSeries& /* data */, IndicatorSet& indicators) const override {
        indicators.add("macd", line_, 1);
        indicators.add("macd_signal", signal_, 1);
    }

   private:
    std::vector<double> line_;
    std::vector<double> signal_;
};

/**
 * @brief Trend-filtered RSI driven by fixed indicator series.
 */
class FixedTrendRsi: public TrendFilteredRsi {
   public:
    FixedTrendRsi(TrendFilteredRsiParams params, std::vector<double> rsi, std::vector<double> ema,
                  std::vector<double> atr)
        : TrendFilteredRsi(params)
        , rsi_(std::move(rsi))
        , ema_(std::move(ema))
        , atr_(std::move(atr)) {}

    void init(const BarSeries& /* data */, IndicatorSet& indicators) const override {
        indicators.add("rsi", rsi_, 1);
        indicators.add("ema_trend", ema_, 1);
        indicators.add("atr", atr_, 1);
    }

   private:
    std::vector<double> rsi_;
    std::vector<double> ema_;
    std::vector<double> atr_;
};

IndicatorSet trendIndicators(double rsiPrev, double rsi, double ema, double atr) {
    IndicatorSet set(2);
    set.add("rsi", {rsiPrev, rsi}, 1);
    set.add("ema_trend", {ema, ema}, 1);
    set.add("atr", {atr, atr}, 1);
    return set;
}

}  // namespace

/* ---- Construction ---- */

TEST(StrategyTest, InvalidParametersAreRejected) {
    EXPECT_THROW(MacdCrossover(26, 12, 9), std::invalid_argument);
    EXPECT_THROW(MacdCrossover(12, 12, 9), std::invalid_argument);
    EXPECT_THROW(MacdCrossover(12, 26, 0), std::invalid_argument);

    EXPECT_THROW(RsiStrategy(0), std::invalid_argument);
    EXPECT_THROW(RsiStrategy(14, 70.0, 30.0), std::invalid_argument);
    EXPECT_THROW(RsiStrategy(14, 30.0, 170.0), std::invalid_argument);
    EXPECT_THROW(RsiStrategy(14, 30.0, 70.0, -1.0), std::invalid_argument);

    TrendFilteredRsiParams negative;
    negative.stopMultiplier = -0.5;
    EXPECT_THROW(TrendFilteredRsi{negative}, std::invalid_argument);

    TrendFilteredRsiParams noEma;
    noEma.emaPeriod = 0;
    EXPECT_THROW(TrendFilteredRsi{noEma}, std::invalid_argument);
}

TEST(StrategyTest, WarmupPeriods) {
    EXPECT_EQ(MacdCrossover().warmupPeriod(), 2u);
    EXPECT_EQ(RsiStrategy().warmupPeriod(), 14u);
    EXPECT_EQ(TrendFilteredRsi().warmupPeriod(), 200u);

    TrendFilteredRsiParams params;
    params.rsiPeriod = 30;
    params.emaPeriod = 20;
    params.atrPeriod = 10;
    EXPECT_EQ(TrendFilteredRsi(params).warmupPeriod(), 30u);
}

TEST(StrategyTest, InitRegistersIndicators) {
    const auto data = makeSeries(linear(40, 100.0, 0.5), 0.25);

    IndicatorSet macdSet(data.size());
    MacdCrossover().init(data, macdSet);
    EXPECT_TRUE(macdSet.contains("macd"));
    EXPECT_TRUE(macdSet.contains("macd_signal"));

    IndicatorSet rsiSet(data.size());
    RsiStrategy().init(data, rsiSet);
    EXPECT_EQ(rsiSet.warmup(), 14u);

    TrendFilteredRsiParams params;
    params.emaPeriod = 20;
    IndicatorSet trendSet(data.size());
    TrendFilteredRsi(params).init(data, trendSet);
    EXPECT_EQ(trendSet.names(), (std::vector<std::string>{"atr", "ema_trend", "rsi"}));
    EXPECT_EQ(trendSet.warmup(), 14u);
}

/* ---- MACD Crossover ---- */

TEST(StrategyTest, MacdEntersAndClosesOnCrosses) {
    const auto   data = makeSeries(linear(5, 100.0, 1.0));
    IndicatorSet set(5);
    set.add("macd", {-1.0, 1.0, 2.0, 0.5, 0.8}, 1);
    set.add("macd_signal", {0.0, 0.0, 0.0, 1.0, 0.6}, 1);

    const MacdCrossover strategy;
    const auto          flat      = Position{};
    const auto          longSide  = positioned(Direction::Long);
    const auto          shortSide = positioned(Direction::Short);

    EXPECT_EQ(strategy.decide(data, 0, set, flat).action, Action::None);
    EXPECT_EQ(strategy.decide(data, 1, set, flat).action, Action::EnterLong);
    EXPECT_EQ(strategy.decide(data, 2, set, flat).action, Action::None);
    EXPECT_EQ(strategy.decide(data, 3, set, flat).action, Action::EnterShort);
    EXPECT_EQ(strategy.decide(data, 3, set, longSide).action, Action::Close);
    EXPECT_EQ(strategy.decide(data, 3, set, shortSide).action, Action::None);
    EXPECT_EQ(strategy.decide(data, 4, set, shortSide).action, Action::Close);
}

TEST(StrategyTest, MacdAboveThenBelowYieldsExactlyOneLongClose) {
    const std::vector<double> line   = {-1.0, 1.0, 2.0, 3.0, 0.5, -1.0, -2.0, -3.0};
    const std::vector<double> signal = {0.0, 0.0, 0.0, 1.0, 1.0, 0.0, -1.0, -2.0};

    const auto     data = makeSeries(linear(line.size(), 100.0, 1.0));
    BacktestEngine engine;
    const auto     result = engine.run(FixedMacd(line, signal), data);

    ASSERT_EQ(result.trades.size(), 1u);
    const auto& trade = result.trades.front();
    EXPECT_EQ(trade.direction, Direction::Long);
    EXPECT_EQ(trade.exitReason, ExitReason::Signal);
    EXPECT_EQ(trade.entryIndex, 2u);
    EXPECT_EQ(trade.exitIndex, 5u);
    EXPECT_FALSE(result.openPosition.has_value());
}

/* ---- RSI Mean-Reversion ---- */

TEST(StrategyTest, RsiThresholds) {
    const auto   data = makeSeries(linear(6, 100.0, 1.0));
    IndicatorSet set(6);
    set.add("rsi", {indicator::undefined, 25.0, 75.0, 55.0, 45.0, 50.0}, 1);

    const RsiStrategy strategy;
    const auto        flat = Position{};

    EXPECT_EQ(strategy.decide(data, 0, set, flat).action, Action::None);
    EXPECT_EQ(strategy.decide(data, 1, set, flat).action, Action::EnterLong);
    EXPECT_EQ(strategy.decide(data, 2, set, flat).action, Action::EnterShort);
    EXPECT_EQ(strategy.decide(data, 3, set, flat).action, Action::None);

    EXPECT_EQ(strategy.decide(data, 3, set, positioned(Direction::Long)).action, Action::Close);
    EXPECT_EQ(strategy.decide(data, 4, set, positioned(Direction::Long)).action, Action::None);
    EXPECT_EQ(strategy.decide(data, 4, set, positioned(Direction::Short)).action, Action::Close);
    EXPECT_EQ(strategy.decide(data, 5, set, positioned(Direction::Short)).action, Action::None);

    // Entry signals while positioned are not emitted.
    EXPECT_EQ(strategy.decide(data, 1, set, positioned(Direction::Short)).action, Action::Close);
    EXPECT_EQ(strategy.decide(data, 2, set, positioned(Direction::Short)).action, Action::None);
}

/* ---- Trend-Filtered RSI ---- */

TEST(StrategyTest, TrendRsiLongCarriesAtrStop) {
    const auto data = makeSeries({100.0, 100.0});
    const auto set  = trendIndicators(25.0, 20.0, 90.0, 2.0);

    const auto decision = TrendFilteredRsi().decide(data, 1, set, Position{});
    EXPECT_EQ(decision.action, Action::EnterLong);
    ASSERT_TRUE(decision.stopLoss.has_value());
    EXPECT_DOUBLE_EQ(*decision.stopLoss, 96.0);
    EXPECT_TRUE(decision.diagnostic.empty());
}

TEST(StrategyTest, TrendRsiShortCarriesAtrStop) {
    const auto data = makeSeries({100.0, 100.0});
    const auto set  = trendIndicators(75.0, 80.0, 110.0, 2.0);

    const auto decision = TrendFilteredRsi().decide(data, 1, set, Position{});
    EXPECT_EQ(decision.action, Action::EnterShort);
    ASSERT_TRUE(decision.stopLoss.has_value());
    EXPECT_DOUBLE_EQ(*decision.stopLoss, 104.0);
}

TEST(StrategyTest, TrendRsiIgnoresSignalsAgainstTrend) {
    const auto data = makeSeries({100.0, 100.0});

    // Oversold but below the trend EMA.
    EXPECT_EQ(TrendFilteredRsi().decide(data, 1, trendIndicators(25.0, 20.0, 110.0, 2.0), Position{}).action,
              Action::None);
    // Overbought but above the trend EMA.
    EXPECT_EQ(TrendFilteredRsi().decide(data, 1, trendIndicators(75.0, 80.0, 90.0, 2.0), Position{}).action,
              Action::None);
}

TEST(StrategyTest, TrendRsiSkipsBarsWithoutRange) {
    const auto data = makeSeries({100.0, 100.0});
    const auto set  = trendIndicators(25.0, 20.0, 90.0, 0.0);
    EXPECT_EQ(TrendFilteredRsi().decide(data, 1, set, Position{}).action, Action::None);
}

TEST(StrategyTest, TrendRsiRejectsNonProtectiveStop) {
    TrendFilteredRsiParams params;
    params.stopMultiplier = 0.0;

    const auto data = makeSeries({100.0, 100.0});
    const auto set  = trendIndicators(25.0, 20.0, 90.0, 2.0);

    const auto decision = TrendFilteredRsi(params).decide(data, 1, set, Position{});
    EXPECT_EQ(decision.action, Action::None);
    EXPECT_FALSE(decision.stopLoss.has_value());
    EXPECT_NE(decision.diagnostic.find("illogical stop"), std::string::npos);
}

TEST(StrategyTest, TrendRsiExitsOnlyWhenRsiCrossesExitLevel) {
    const auto data     = makeSeries({100.0, 100.0});
    const auto strategy = TrendFilteredRsi();

    EXPECT_EQ(strategy.decide(data, 1, trendIndicators(45.0, 55.0, 90.0, 2.0), positioned(Direction::Long)).action,
              Action::Close);
    EXPECT_EQ(strategy.decide(data, 1, trendIndicators(55.0, 60.0, 90.0, 2.0), positioned(Direction::Long)).action,
              Action::None);
    EXPECT_EQ(strategy.decide(data, 1, trendIndicators(55.0, 45.0, 90.0, 2.0), positioned(Direction::Short)).action,
              Action::Close);
    EXPECT_EQ(strategy.decide(data, 1, trendIndicators(45.0, 40.0, 90.0, 2.0), positioned(Direction::Short)).action,
              Action::None);
}

TEST(StrategyTest, RejectedStopLeavesRunFlatAndRecordsDiagnostic) {
    TrendFilteredRsiParams params;
    params.rsiPeriod      = 1;
    params.emaPeriod      = 1;
    params.atrPeriod      = 1;
    params.stopMultiplier = 0.0;

    const std::size_t n = 6;
    FixedTrendRsi     strategy(params, std::vector<double>(n, 20.0), std::vector<double>(n, 50.0),
                               std::vector<double>(n, 1.0));

    const auto     data = makeSeries(linear(n, 100.0, 1.0), 0.5);
    BacktestEngine engine;

    BacktestResult result;
    ASSERT_NO_THROW(result = engine.run(strategy, data));
    EXPECT_TRUE(result.trades.empty());
    EXPECT_FALSE(result.openPosition.has_value());
    EXPECT_EQ(result.diagnostics.size(), n);
    EXPECT_NEAR(result.finalCapital, result.initialCapital, 1e-9);
}
