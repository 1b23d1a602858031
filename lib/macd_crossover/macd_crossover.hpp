#pragma once

#include <cstddef>
#include <string>

#include "strategy/istrategy.hpp"

/**
 * @brief MACD Crossover strategy.
 *
 * While flat, enters long when the MACD line crosses above its signal line
 * and short when it crosses below. A long is closed on the next cross below,
 * a short on the next cross above.
 */
class MacdCrossover: public IStrategy {
   public:
    /**
     * @param fastPeriod   Fast EMA span (default: 12).
     * @param slowPeriod   Slow EMA span (default: 26).
     * @param signalPeriod Signal line EMA span (default: 9).
     * @throws std::invalid_argument if a period is 0 or fastPeriod >= slowPeriod.
     */
    explicit MacdCrossover(std::size_t fastPeriod = 12, std::size_t slowPeriod = 26, std::size_t signalPeriod = 9);

    [[nodiscard]] std::string name() const override;

    void init(const BarSeries& data, IndicatorSet& indicators) const override;

    [[nodiscard]] std::size_t warmupPeriod() const override;

    [[nodiscard]] Decision decide(const BarSeries& data, std::size_t index, const IndicatorSet& indicators,
                                  const Position& position) const override;

   private:
    std::size_t fastPeriod_;
    std::size_t slowPeriod_;
    std::size_t signalPeriod_;
};
