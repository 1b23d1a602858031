#include "rsi_strategy.hpp"

#include <stdexcept>

#include "indicator.hpp"

RsiStrategy::RsiStrategy(std::size_t period, double oversold, double overbought, double exitLevel)
    : period_(period)
    , oversold_(oversold)
    , overbought_(overbought)
    , exitLevel_(exitLevel) {
    if (period_ == 0) {
        throw std::invalid_argument("RSI period must be positive");
    }
    if (!(0.0 <= oversold_ && oversold_ < overbought_ && overbought_ <= 100.0)) {
        throw std::invalid_argument("RSI thresholds must satisfy 0 <= oversold < overbought <= 100");
    }
    if (!(0.0 <= exitLevel_ && exitLevel_ <= 100.0)) {
        throw std::invalid_argument("RSI exit level must be within [0, 100]");
    }
}

std::string RsiStrategy::name() const {
    return "RSI Mean-Reversion (" + std::to_string(period_) + ", " + std::to_string(static_cast<int>(oversold_)) + "/"
         + std::to_string(static_cast<int>(overbought_)) + ", exit " + std::to_string(static_cast<int>(exitLevel_))
         + ")";
}

void RsiStrategy::init(const BarSeries& data, IndicatorSet& indicators) const {
    indicators.add("rsi", indicator::rsi(data.close, period_), period_);
}

std::size_t RsiStrategy::warmupPeriod() const {
    return period_;
}

Decision RsiStrategy::decide(const BarSeries& /* data */, std::size_t index, const IndicatorSet& indicators,
                             const Position& position) const {
    const auto rsi = indicators.at("rsi", index);
    if (!rsi) {
        return Decision::none();
    }

    const double val = *rsi;

    if (position.isFlat()) {
        // Oversold → long
        if (val < oversold_) {
            return Decision::enterLong();
        }
        // Overbought → short
        if (val > overbought_) {
            return Decision::enterShort();
        }
        return Decision::none();
    }

    if (position.isLong() && val > exitLevel_) {
        return Decision::close();
    }
    if (position.isShort() && val < exitLevel_) {
        return Decision::close();
    }

    return Decision::none();
}
