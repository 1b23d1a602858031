#pragma once

#include <memory>
#include <string>

#include "bar_series.hpp"

/**
 * @brief Reads OHLCV series stored in the Yahoo Finance chart layout:
 *
 * {"chart": {"result": [{
 *     "meta": {"symbol": "SPY", "currency": "USD", "exchangeTimezoneName": "America/New_York"},
 *     "timestamp": [...],
 *     "indicators": {"quote": [{"open": [...], "high": [...], "low": [...], "close": [...], "volume": [...]}]}
 * }]}}
 *
 * Failures are reported on std::cerr and returned as nullptr.
 */
class SeriesLoader {
   public:
    SeriesLoader() = delete;

    /**
     * @brief Load and validate a series from a JSON file.
     * @param path   File path.
     * @param ticker Overrides meta.symbol when not empty.
     */
    [[nodiscard]] static std::shared_ptr<BarSeries> load(const std::string& path, const std::string& ticker = "");

    /**
     * @brief Parse and validate a series from JSON text.
     */
    [[nodiscard]] static std::shared_ptr<BarSeries> fromJson(const std::string& text, const std::string& ticker = "");

    /**
     * @brief Structural check of a series.
     * @return Empty string when valid, otherwise the first problem found.
     */
    [[nodiscard]] static std::string validate(const BarSeries& series);
};
