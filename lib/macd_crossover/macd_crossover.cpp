#include "macd_crossover.hpp"

#include <stdexcept>
#include <utility>

#include "indicator.hpp"

MacdCrossover::MacdCrossover(std::size_t fastPeriod, std::size_t slowPeriod, std::size_t signalPeriod)
    : fastPeriod_(fastPeriod)
    , slowPeriod_(slowPeriod)
    , signalPeriod_(signalPeriod) {
    if (fastPeriod_ == 0 || slowPeriod_ == 0 || signalPeriod_ == 0) {
        throw std::invalid_argument("MACD periods must be positive");
    }
    if (fastPeriod_ >= slowPeriod_) {
        throw std::invalid_argument("MACD fast period must be shorter than the slow period");
    }
}

std::string MacdCrossover::name() const {
    return "MACD Crossover (" + std::to_string(fastPeriod_) + "/" + std::to_string(slowPeriod_) + "/"
         + std::to_string(signalPeriod_) + ")";
}

void MacdCrossover::init(const BarSeries& data, IndicatorSet& indicators) const {
    auto macd = indicator::macd(data.close, fastPeriod_, slowPeriod_, signalPeriod_);

    // EMA-based lines are defined from the first bar.
    indicators.add("macd", std::move(macd.line), 1);
    indicators.add("macd_signal", std::move(macd.signal), 1);
}

std::size_t MacdCrossover::warmupPeriod() const {
    // Need 2 points for crossover detection
    return 2;
}

Decision MacdCrossover::decide(const BarSeries& /* data */, std::size_t index, const IndicatorSet& indicators,
                               const Position& position) const {
    if (index < 1) {
        return Decision::none();
    }

    const auto& line   = indicators.series("macd");
    const auto& signal = indicators.series("macd_signal");

    const bool crossedAbove = indicator::crossover(line, signal, index);
    const bool crossedBelow = indicator::crossover(signal, line, index);

    if (position.isFlat()) {
        if (crossedAbove) {
            return Decision::enterLong();
        }
        if (crossedBelow) {
            return Decision::enterShort();
        }
        return Decision::none();
    }

    if (position.isLong() && crossedBelow) {
        return Decision::close();
    }
    if (position.isShort() && crossedAbove) {
        return Decision::close();
    }

    return Decision::none();
}
