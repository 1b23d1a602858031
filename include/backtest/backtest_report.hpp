#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "backtest/backtest_engine.hpp"

/**
 * @brief Console and JSON rendering of a BacktestResult.
 */
class BacktestReport {
   public:
    BacktestReport() = delete;

    /**
     * @brief Headline metrics and capital summary, written to std::clog.
     */
    static void printSummary(const BacktestResult& result);

    /**
     * @brief One row per closed trade, written to std::clog.
     */
    static void printTrades(const BacktestResult& result);

    /**
     * @brief Full result (metrics, trades, equity curve, diagnostics) as JSON.
     */
    [[nodiscard]] static nlohmann::json toJson(const BacktestResult& result);

    /**
     * @return false (with a message on std::cerr) if the file cannot be written.
     */
    static bool writeJson(const BacktestResult& result, const std::string& path);

    /**
     * @brief Unix seconds as a UTC "YYYY-MM-DD" date.
     */
    [[nodiscard]] static std::string formatTime(int64_t timestamp);
};
