#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Single OHLCV observation, a by-value view of one row of a BarSeries.
 */
struct Bar {
    int64_t timestamp = 0;
    double  open      = 0.0;
    double  high      = 0.0;
    double  low       = 0.0;
    double  close     = 0.0;
    double  volume    = 0.0;
};

/**
 * @brief Ordered OHLCV time series stored column-wise.
 *
 * Indicators consume whole columns (e.g. close), the simulation loop reads
 * single rows through at(). Once loaded, a series is shared read-only
 * (std::shared_ptr<const BarSeries>) between runs.
 */
struct BarSeries {
    /**
     * @brief
     * @example "EURUSD=X", "SPY", etc.
     */
    std::string ticker = "";

    /**
     * @brief
     * @example "USD", "KRW", etc.
     */
    std::string currency = "";

    /**
     * @brief
     * @example "America/New_York", "Europe/London", etc.
     */
    std::string timezone = "";

    /* HISTORICAL DATA */

    /**
     * @brief Unix seconds, strictly increasing.
     * @example [1705641600, 1705728000, ...]
     */
    std::vector<int64_t> timestamps;

    /**
     * @example [1.0921, 1.0934, ...]
     */
    std::vector<double> open;

    /**
     * @example [1.0950, 1.0961, ...]
     */
    std::vector<double> high;

    /**
     * @example [1.0902, 1.0915, ...]
     */
    std::vector<double> low;

    /**
     * @example [1.0933, 1.0948, ...]
     */
    std::vector<double> close;

    /**
     * @example [15230.0, 17004.0, ...]
     */
    std::vector<double> volume;

    [[nodiscard]] std::size_t size() const {
        return close.size();
    }

    [[nodiscard]] bool empty() const {
        return close.empty();
    }

    /**
     * @brief Row view of the series.
     * @throws std::out_of_range if index >= size().
     */
    [[nodiscard]] Bar at(std::size_t index) const {
        if (index >= size()) {
            throw std::out_of_range("BarSeries::at: index " + std::to_string(index) + " >= size "
                                    + std::to_string(size()));
        }
        Bar bar;
        bar.timestamp = index < timestamps.size() ? timestamps[index] : 0;
        bar.open      = open[index];
        bar.high      = high[index];
        bar.low       = low[index];
        bar.close     = close[index];
        bar.volume    = index < volume.size() ? volume[index] : 0.0;
        return bar;
    }

    /**
     * @brief Append one bar to every column. Used by loaders and test fixtures.
     */
    void push_back(const Bar& bar) {
        timestamps.push_back(bar.timestamp);
        open.push_back(bar.open);
        high.push_back(bar.high);
        low.push_back(bar.low);
        close.push_back(bar.close);
        volume.push_back(bar.volume);
    }
};
