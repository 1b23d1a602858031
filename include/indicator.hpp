#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <vector>

namespace indicator {

/**
 * @brief Value stored at positions where an indicator is not yet defined.
 *
 * Never compare against it directly, use isDefined().
 */
inline constexpr double undefined = std::numeric_limits<double>::quiet_NaN();

/**
 * @brief Averages below this are treated as zero.
 */
inline constexpr double epsilon = 1e-12;

[[nodiscard]] inline bool isDefined(double value) {
    return !std::isnan(value);
}

/**
 * @brief Compute Simple Moving Average (SMA).
 * @param values  Input series (may contain undefined entries).
 * @param window  Window size for the moving average.
 * @return        Series aligned with values. Entry i is defined once the
 *                window ending at i holds `window` defined inputs.
 *                An empty vector is returned if window == 0.
 */
[[nodiscard]] inline std::vector<double> sma(const std::vector<double>& values, std::size_t window) {
    if (window == 0) {
        return {};
    }

    std::vector<double> result(values.size(), undefined);

    double      sum   = 0.0;
    std::size_t valid = 0;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (isDefined(values[i])) {
            sum += values[i];
            ++valid;
        }
        if (i >= window && isDefined(values[i - window])) {
            sum -= values[i - window];
            --valid;
        }
        if (i + 1 >= window && valid == window) {
            result[i] = sum / static_cast<double>(window);
        }
    }

    return result;
}

/**
 * @brief Compute Exponential Moving Average (EMA).
 * @param values  Input series.
 * @param window  Smoothing span, alpha = 2 / (window + 1).
 * @return        Series aligned with values. Seeded with the first defined
 *                input, so there is no warm-up gap. ema(values, 1) == values.
 *                An empty vector is returned if window == 0.
 */
[[nodiscard]] inline std::vector<double> ema(const std::vector<double>& values, std::size_t window) {
    if (window == 0) {
        return {};
    }

    std::vector<double> result(values.size(), undefined);

    const double alpha  = 2.0 / (static_cast<double>(window) + 1.0);
    bool         seeded = false;
    double       prev   = 0.0;

    for (std::size_t i = 0; i < values.size(); ++i) {
        if (!isDefined(values[i])) {
            continue;
        }
        if (!seeded) {
            prev   = values[i];
            seeded = true;
        } else {
            prev = alpha * values[i] + (1.0 - alpha) * prev;
        }
        result[i] = prev;
    }

    return result;
}

/**
 * @brief Compute Relative Strength Index (RSI).
 * @param prices  Input price series.
 * @param period  Lookback period (typically 14).
 * @return        RSI values (0~100) aligned with prices, defined from index
 *                period - 1. An empty vector is returned if period == 0.
 *
 * Uses simple rolling means of gains and losses (not Wilder's smoothing).
 * The first bar has no prior close and counts as a zero change.
 * A window with losses but no gains is 0, with gains but no losses 100,
 * and with neither (flat prices) undefined.
 */
[[nodiscard]] inline std::vector<double> rsi(const std::vector<double>& prices, std::size_t period) {
    if (period == 0) {
        return {};
    }

    std::vector<double> gains(prices.size(), 0.0);
    std::vector<double> losses(prices.size(), 0.0);
    for (std::size_t i = 1; i < prices.size(); ++i) {
        const double change = prices[i] - prices[i - 1];
        if (change > 0.0) {
            gains[i] = change;
        } else if (change < 0.0) {
            losses[i] = -change;
        }
    }

    const auto avgGain = sma(gains, period);
    const auto avgLoss = sma(losses, period);

    std::vector<double> result(prices.size(), undefined);
    for (std::size_t i = 0; i < prices.size(); ++i) {
        if (!isDefined(avgGain[i]) || !isDefined(avgLoss[i])) {
            continue;
        }
        const bool noGain = avgGain[i] < epsilon;
        const bool noLoss = avgLoss[i] < epsilon;
        if (noGain && noLoss) {
            continue;
        }
        if (noLoss) {
            result[i] = 100.0;
        } else {
            const double rs = avgGain[i] / avgLoss[i];
            result[i]       = 100.0 - (100.0 / (1.0 + rs));
        }
    }

    return result;
}

/**
 * @brief True range per bar: max(high - low, |high - prevClose|, |low - prevClose|).
 *        The first bar has no previous close and uses high - low.
 * @return Series aligned with the inputs, empty if their sizes differ.
 */
[[nodiscard]] inline std::vector<double> trueRange(const std::vector<double>& high, const std::vector<double>& low,
                                                   const std::vector<double>& close) {
    if (high.size() != low.size() || high.size() != close.size()) {
        return {};
    }

    std::vector<double> result(high.size(), undefined);
    for (std::size_t i = 0; i < high.size(); ++i) {
        double range = high[i] - low[i];
        if (i > 0) {
            range = std::max({range, std::abs(high[i] - close[i - 1]), std::abs(low[i] - close[i - 1])});
        }
        result[i] = range;
    }
    return result;
}

/**
 * @brief Average True Range: simple rolling mean of trueRange over period bars.
 * @return Series aligned with the inputs, defined from index period - 1.
 */
[[nodiscard]] inline std::vector<double> atr(const std::vector<double>& high, const std::vector<double>& low,
                                             const std::vector<double>& close, std::size_t period) {
    if (period == 0) {
        return {};
    }
    return sma(trueRange(high, low, close), period);
}

struct Macd {
    std::vector<double> line;       // ema(fast) - ema(slow)
    std::vector<double> signal;     // ema(line, signalPeriod)
    std::vector<double> histogram;  // line - signal
};

/**
 * @brief Moving Average Convergence/Divergence built from EMAs.
 *        All three series are aligned with prices and defined from index 0.
 */
[[nodiscard]] inline Macd macd(const std::vector<double>& prices, std::size_t fast, std::size_t slow,
                               std::size_t signalPeriod) {
    Macd result;

    const auto emaFast = ema(prices, fast);
    const auto emaSlow = ema(prices, slow);
    if (emaFast.size() != prices.size() || emaSlow.size() != prices.size()) {
        return result;
    }

    result.line.resize(prices.size(), undefined);
    for (std::size_t i = 0; i < prices.size(); ++i) {
        if (isDefined(emaFast[i]) && isDefined(emaSlow[i])) {
            result.line[i] = emaFast[i] - emaSlow[i];
        }
    }

    result.signal = ema(result.line, signalPeriod);
    result.histogram.resize(prices.size(), undefined);
    for (std::size_t i = 0; i < result.signal.size(); ++i) {
        if (isDefined(result.line[i]) && isDefined(result.signal[i])) {
            result.histogram[i] = result.line[i] - result.signal[i];
        }
    }

    return result;
}

/**
 * @brief True if `a` crossed above `b` between index - 1 and index.
 *
 * Only the immediately prior pair is compared. Returns false at index 0,
 * out of range, or when any of the four values is undefined.
 */
[[nodiscard]] inline bool crossover(const std::vector<double>& a, const std::vector<double>& b, std::size_t index) {
    if (index == 0 || index >= a.size() || index >= b.size()) {
        return false;
    }
    const double prevA = a[index - 1];
    const double prevB = b[index - 1];
    const double currA = a[index];
    const double currB = b[index];
    if (!isDefined(prevA) || !isDefined(prevB) || !isDefined(currA) || !isDefined(currB)) {
        return false;
    }
    return prevA < prevB && currA > currB;
}

/**
 * @brief True if `a` crossed above a constant level.
 */
[[nodiscard]] inline bool crossover(const std::vector<double>& a, double level, std::size_t index) {
    if (index == 0 || index >= a.size()) {
        return false;
    }
    if (!isDefined(a[index - 1]) || !isDefined(a[index])) {
        return false;
    }
    return a[index - 1] < level && a[index] > level;
}

/**
 * @brief True if a constant level crossed above `b`, i.e. `b` crossed below it.
 */
[[nodiscard]] inline bool crossover(double level, const std::vector<double>& b, std::size_t index) {
    if (index == 0 || index >= b.size()) {
        return false;
    }
    if (!isDefined(b[index - 1]) || !isDefined(b[index])) {
        return false;
    }
    return level < b[index - 1] && level > b[index];
}

}  // namespace indicator
