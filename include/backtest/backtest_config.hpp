#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

/**
 * @brief Commission charged once per closed trade.
 *
 * cost = perTrade + rate * (entry notional + exit notional)
 */
struct CommissionModel {
    double perTrade = 0.0;  // flat amount per round trip
    double rate     = 0.0;  // fraction of traded notional, e.g. 0.0002

    [[nodiscard]] double cost(double entryNotional, double exitNotional) const {
        return perTrade + rate * (entryNotional + exitNotional);
    }
};

enum class EndOfDataPolicy
{
    MarkToMarket,  // leave the last position open, equity is marked at the last close
    ForceClose,    // close the last position at the last close
};

/**
 * @brief Everything a single backtest run depends on besides the bars.
 *
 * Passed explicitly into every run; there are no process-wide defaults.
 *
 * JSON layout (all keys optional):
 * @code
 * {
 *   "initial_cash": 10000.0,
 *   "commission": { "per_trade": 0.0, "rate": 0.0 },
 *   "position_fraction": 1.0,
 *   "trade_on_close": false,
 *   "end_of_data": "mark_to_market",
 *   "periods_per_year": 252,
 *   "strategy": { "name": "rsi_mean_reversion", "params": { "period": 14 } }
 * }
 * @endcode
 */
struct BacktestConfig {
    double          initialCash      = 10000.0;
    CommissionModel commission;
    double          positionFraction = 1.0;  // share of cash committed per entry, (0, 1]
    bool            tradeOnClose     = false;  // fill at the signal bar's close instead of the next open
    EndOfDataPolicy endOfData        = EndOfDataPolicy::MarkToMarket;
    double          periodsPerYear   = 252.0;  // annualization factor for per-bar returns

    std::string    strategy       = "rsi_mean_reversion";
    nlohmann::json strategyParams = nlohmann::json::object();

    /**
     * @throws std::invalid_argument describing the first invalid field.
     */
    void validate() const;

    /**
     * @brief Build from JSON, missing keys keep their defaults.
     * @throws std::invalid_argument for invalid values,
     *         nlohmann::json::type_error for mistyped keys.
     */
    [[nodiscard]] static BacktestConfig fromJson(const nlohmann::json& json);

    [[nodiscard]] nlohmann::json toJson() const;

    /**
     * @brief Load and validate a JSON config file.
     * @return std::nullopt on failure, the reason is printed to std::cerr.
     */
    [[nodiscard]] static std::optional<BacktestConfig> load(const std::string& path);
};

[[nodiscard]] std::string endOfDataPolicyToString(EndOfDataPolicy policy);
