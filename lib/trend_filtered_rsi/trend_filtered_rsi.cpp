#include "trend_filtered_rsi.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "indicator.hpp"

namespace {

std::string illogicalStop(const char* side, double stop, double price) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(5) << "illogical stop for " << side << " " << stop << " vs price " << price
        << ", skipping trade";
    return out.str();
}

}  // namespace

TrendFilteredRsi::TrendFilteredRsi(TrendFilteredRsiParams params)
    : params_(params) {
    if (params_.rsiPeriod == 0 || params_.emaPeriod == 0 || params_.atrPeriod == 0) {
        throw std::invalid_argument("Trend-filtered RSI periods must be positive");
    }
    if (!(0.0 <= params_.oversold && params_.oversold < params_.overbought && params_.overbought <= 100.0)) {
        throw std::invalid_argument("RSI thresholds must satisfy 0 <= oversold < overbought <= 100");
    }
    if (!(0.0 <= params_.exitLevel && params_.exitLevel <= 100.0)) {
        throw std::invalid_argument("RSI exit level must be within [0, 100]");
    }
    if (!(params_.stopMultiplier >= 0.0)) {
        throw std::invalid_argument("ATR stop multiplier must be >= 0");
    }
}

std::string TrendFilteredRsi::name() const {
    std::ostringstream out;
    out << "Trend-Filtered RSI (" << params_.rsiPeriod << ", EMA " << params_.emaPeriod << ", ATR "
        << params_.atrPeriod << "x" << std::fixed << std::setprecision(1) << params_.stopMultiplier << ")";
    return out.str();
}

void TrendFilteredRsi::init(const BarSeries& data, IndicatorSet& indicators) const {
    indicators.add("rsi", indicator::rsi(data.close, params_.rsiPeriod), params_.rsiPeriod);
    indicators.add("ema_trend", indicator::ema(data.close, params_.emaPeriod), 1);
    indicators.add("atr", indicator::atr(data.high, data.low, data.close, params_.atrPeriod), params_.atrPeriod);
}

std::size_t TrendFilteredRsi::warmupPeriod() const {
    // The trend EMA is defined from the first bar; still wait for its full span.
    return std::max({params_.rsiPeriod, params_.emaPeriod, params_.atrPeriod});
}

Decision TrendFilteredRsi::decide(const BarSeries& data, std::size_t index, const IndicatorSet& indicators,
                                  const Position& position) const {
    const auto rsi = indicators.at("rsi", index);
    const auto ema = indicators.at("ema_trend", index);
    const auto atr = indicators.at("atr", index);
    if (!rsi || !ema || !atr || *atr <= 0.0) {
        return Decision::none();
    }

    const double price = data.close[index];

    if (position.isFlat()) {
        const bool isUptrend    = price > *ema;
        const bool isDowntrend  = price < *ema;
        const bool isOversold   = *rsi < params_.oversold;
        const bool isOverbought = *rsi > params_.overbought;

        if (isUptrend && isOversold) {
            const double stop = price - params_.stopMultiplier * *atr;
            if (stop < price) {
                return Decision::enterLong(stop);
            }
            return Decision::skip(illogicalStop("long", stop, price));
        }
        if (isDowntrend && isOverbought) {
            const double stop = price + params_.stopMultiplier * *atr;
            if (stop > price) {
                return Decision::enterShort(stop);
            }
            return Decision::skip(illogicalStop("short", stop, price));
        }
        return Decision::none();
    }

    const auto& rsiSeries = indicators.series("rsi");
    if (position.isLong() && indicator::crossover(rsiSeries, params_.exitLevel, index)) {
        return Decision::close();
    }
    if (position.isShort() && indicator::crossover(params_.exitLevel, rsiSeries, index)) {
        return Decision::close();
    }

    return Decision::none();
}
