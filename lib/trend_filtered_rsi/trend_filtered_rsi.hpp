#pragma once

#include <cstddef>
#include <string>

#include "strategy/istrategy.hpp"

struct TrendFilteredRsiParams {
    std::size_t rsiPeriod      = 14;
    std::size_t emaPeriod      = 200;   // trend filter
    std::size_t atrPeriod      = 14;
    double      oversold       = 30.0;
    double      overbought     = 70.0;
    double      exitLevel      = 50.0;
    double      stopMultiplier = 2.0;   // stop distance in ATRs
};

/**
 * @brief RSI mean-reversion entries filtered by a long EMA trend, protected
 *        by an ATR stop.
 *
 * Long only above the trend EMA with RSI oversold, stop = close - k * ATR.
 * Short only below the trend EMA with RSI overbought, stop = close + k * ATR.
 * Positions are closed when RSI crosses the exit level between the previous
 * and the current bar (upwards for longs, downwards for shorts), or by the
 * stop. An entry whose stop would not be protective is skipped with a
 * diagnostic.
 */
class TrendFilteredRsi: public IStrategy {
   public:
    /**
     * @throws std::invalid_argument for zero periods, unordered thresholds
     *         or a negative stop multiplier.
     */
    explicit TrendFilteredRsi(TrendFilteredRsiParams params = {});

    [[nodiscard]] std::string name() const override;

    void init(const BarSeries& data, IndicatorSet& indicators) const override;

    [[nodiscard]] std::size_t warmupPeriod() const override;

    [[nodiscard]] Decision decide(const BarSeries& data, std::size_t index, const IndicatorSet& indicators,
                                  const Position& position) const override;

    [[nodiscard]] const TrendFilteredRsiParams& params() const {
        return params_;
    }

   private:
    TrendFilteredRsiParams params_;
};
