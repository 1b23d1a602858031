#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "backtest/backtest_config.hpp"
#include "backtest/metrics.hpp"
#include "backtest/position.hpp"
#include "bar_series.hpp"
#include "strategy/istrategy.hpp"

/**
 * @brief Thrown before any simulation when the series is shorter than the
 *        warm-up window of the strategy and its indicators.
 */
class DataInsufficientError: public std::runtime_error {
   public:
    DataInsufficientError(std::size_t available, std::size_t required);

    [[nodiscard]] std::size_t available() const {
        return available_;
    }

    [[nodiscard]] std::size_t required() const {
        return required_;
    }

   private:
    std::size_t available_;
    std::size_t required_;
};

struct BacktestResult {
    std::string ticker;
    std::string strategyName;

    double initialCapital = 0.0;
    double finalCapital   = 0.0;  // equity at the last bar, open position marked to market
    double finalCash      = 0.0;
    double commissionPaid = 0.0;

    std::size_t warmup = 0;  // bars skipped before the first decision

    PerformanceMetrics metrics;

    /* ----- Trade History ----- */
    std::vector<Trade>       trades;
    std::vector<EquityPoint> equityCurve;

    /* ----- Position left open after the last bar (MarkToMarket only) ----- */
    std::optional<Position> openPosition;

    /* ----- Non-fatal messages, e.g. rejected stops ----- */
    std::vector<std::string> diagnostics;
};

/**
 * @brief Backtesting engine that simulates a strategy over historical data.
 *
 * For every bar, in order:
 *   1. fill the order decided on the previous bar at this bar's open
 *   2. check the stop-loss against this bar's high/low
 *   3. once warmed up, ask the strategy for a decision at this bar's close
 *   4. mark equity at this bar's close
 *
 * run() keeps all mutable state local, so one engine may run concurrently
 * on several threads.
 */
class BacktestEngine {
   public:
    /**
     * @throws std::invalid_argument if the config does not validate.
     */
    explicit BacktestEngine(BacktestConfig config = {});

    /**
     * @brief Run the backtest.
     * @param strategy The strategy to evaluate.
     * @param data     Historical bar data.
     * @return BacktestResult with all performance metrics, trades and the equity curve.
     * @throws DataInsufficientError if data has fewer bars than the warm-up window.
     * @throws std::invalid_argument if the columns of data differ in length.
     */
    [[nodiscard]] BacktestResult run(const IStrategy& strategy, const BarSeries& data) const;

    [[nodiscard]] const BacktestConfig& config() const {
        return config_;
    }

   private:
    BacktestConfig config_;
};
