#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "backtest/position.hpp"

/**
 * @brief Equity marked at the close of one bar.
 */
struct EquityPoint {
    int64_t timestamp = 0;
    double  equity    = 0.0;
    bool    inMarket  = false;  // a position was open at the close
};

struct PerformanceMetrics {
    /* ----- Headline figures ----- */
    double winRatePct     = 0.0;  // winning trades / closed trades * 100, 0 without trades
    double totalReturnPct = 0.0;  // (final equity / initial cash - 1) * 100
    double sharpeRatio    = 0.0;  // annualized, 0 when returns have no variance
    double sortinoRatio   = 0.0;  // annualized, 0 when there is no downside
    double maxDrawdownPct = 0.0;  // maximum peak-to-trough decline, <= 0
    double calmarRatio    = 0.0;  // annualized return / |max drawdown|, 0 without drawdown

    /* ----- Supplementary ----- */
    double      annualizedReturnPct     = 0.0;
    double      annualizedVolatilityPct = 0.0;
    double      exposureTimePct         = 0.0;  // bars with an open position / bars * 100
    std::size_t tradeCount              = 0;
    double      bestTradePct            = 0.0;
    double      worstTradePct           = 0.0;
    double      avgTradePct             = 0.0;
    double      profitFactor            = 0.0;  // gross wins / |gross losses|, 0 without losses
    double      equityFinal             = 0.0;
    double      equityPeak              = 0.0;
    std::size_t maxDrawdownDuration     = 0;  // longest stretch of bars below a previous peak
};

/**
 * @brief Turns a trade log and an equity curve into performance statistics.
 *
 * Every figure that is mathematically undefined (no trades, zero variance,
 * no drawdown) is reported as 0 rather than NaN or infinity.
 */
class MetricsAggregator {
   public:
    MetricsAggregator() = delete;

    /**
     * @param trades          Closed trades of the run.
     * @param equityCurve     One point per bar.
     * @param initialCash     Starting capital.
     * @param periodsPerYear  Bars per year used to annualize (252 for daily bars).
     */
    [[nodiscard]] static PerformanceMetrics compute(const std::vector<Trade>&       trades,
                                                    const std::vector<EquityPoint>& equityCurve, double initialCash,
                                                    double periodsPerYear);

    [[nodiscard]] static double winRate(const std::vector<Trade>& trades);

    /**
     * @brief Simple per-bar returns e[i] / e[i-1] - 1. Bars following a
     *        non-positive equity are skipped.
     */
    [[nodiscard]] static std::vector<double> barReturns(const std::vector<double>& equity);

    [[nodiscard]] static double sharpeRatio(const std::vector<double>& returns, double periodsPerYear);

    [[nodiscard]] static double sortinoRatio(const std::vector<double>& returns, double periodsPerYear);

    /**
     * @return Maximum drawdown in percent, always <= 0.
     */
    [[nodiscard]] static double maxDrawdown(const std::vector<double>& equity);

    [[nodiscard]] static std::size_t maxDrawdownDuration(const std::vector<double>& equity);

    /**
     * @brief Geometric annualized return in percent over `bars` periods.
     */
    [[nodiscard]] static double annualizedReturn(double initialEquity, double finalEquity, std::size_t bars,
                                                 double periodsPerYear);

    [[nodiscard]] static double calmarRatio(double annualizedReturnPct, double maxDrawdownPct);

   private:
    [[nodiscard]] static double mean(const std::vector<double>& values);

    [[nodiscard]] static double stdDev(const std::vector<double>& values);
};
