#pragma once

#include <cstddef>
#include <string>

#include "strategy/istrategy.hpp"

/**
 * @brief RSI (Relative Strength Index) mean-reversion strategy.
 *
 * While flat, enters long when RSI drops below the oversold threshold
 * (default: 30) and short when it rises above the overbought threshold
 * (default: 70). A long is closed once RSI is above the exit level
 * (default: 50), a short once it is below.
 */
class RsiStrategy: public IStrategy {
   public:
    /**
     * @param period     RSI lookback period (default: 14 bars).
     * @param oversold   RSI threshold for a long entry (default: 30).
     * @param overbought RSI threshold for a short entry (default: 70).
     * @param exitLevel  RSI level that flattens the position (default: 50).
     * @throws std::invalid_argument if period is 0 or the thresholds are not
     *         ordered 0 <= oversold < overbought <= 100.
     */
    explicit RsiStrategy(std::size_t period = 14, double oversold = 30.0, double overbought = 70.0,
                         double exitLevel = 50.0);

    [[nodiscard]] std::string name() const override;

    void init(const BarSeries& data, IndicatorSet& indicators) const override;

    [[nodiscard]] std::size_t warmupPeriod() const override;

    [[nodiscard]] Decision decide(const BarSeries& data, std::size_t index, const IndicatorSet& indicators,
                                  const Position& position) const override;

   private:
    std::size_t period_;
    double      oversold_;
    double      overbought_;
    double      exitLevel_;
};
