#include "backtest/backtest_config.hpp"

#include <cmath>
#include <fstream>
#include <iostream>
#include <stdexcept>

std::string endOfDataPolicyToString(EndOfDataPolicy policy) {
    switch (policy) {
    case EndOfDataPolicy::MarkToMarket:
        return "mark_to_market";
    case EndOfDataPolicy::ForceClose:
        return "force_close";
    }
    return "unknown";
}

void BacktestConfig::validate() const {
    if (!std::isfinite(initialCash) || initialCash <= 0.0) {
        throw std::invalid_argument("initial_cash must be positive");
    }
    if (!std::isfinite(commission.perTrade) || commission.perTrade < 0.0) {
        throw std::invalid_argument("commission.per_trade must be >= 0");
    }
    if (!std::isfinite(commission.rate) || commission.rate < 0.0) {
        throw std::invalid_argument("commission.rate must be >= 0");
    }
    if (!(positionFraction > 0.0 && positionFraction <= 1.0)) {
        throw std::invalid_argument("position_fraction must be in (0, 1]");
    }
    if (!std::isfinite(periodsPerYear) || periodsPerYear <= 0.0) {
        throw std::invalid_argument("periods_per_year must be positive");
    }
    if (strategy.empty()) {
        throw std::invalid_argument("strategy name must not be empty");
    }
    if (!strategyParams.is_object()) {
        throw std::invalid_argument("strategy params must be a JSON object");
    }
}

BacktestConfig BacktestConfig::fromJson(const nlohmann::json& json) {
    BacktestConfig config;

    config.initialCash         = json.value("initial_cash", config.initialCash);
    config.commission.perTrade = json.value("/commission/per_trade"_json_pointer, config.commission.perTrade);
    config.commission.rate     = json.value("/commission/rate"_json_pointer, config.commission.rate);
    config.positionFraction    = json.value("position_fraction", config.positionFraction);
    config.tradeOnClose        = json.value("trade_on_close", config.tradeOnClose);
    config.periodsPerYear      = json.value("periods_per_year", config.periodsPerYear);

    const auto policy = json.value("end_of_data", endOfDataPolicyToString(config.endOfData));
    if (policy == "mark_to_market") {
        config.endOfData = EndOfDataPolicy::MarkToMarket;
    } else if (policy == "force_close") {
        config.endOfData = EndOfDataPolicy::ForceClose;
    } else {
        throw std::invalid_argument("end_of_data must be 'mark_to_market' or 'force_close', got '" + policy + "'");
    }

    if (json.contains("strategy")) {
        const auto& s   = json["strategy"];
        config.strategy = s.value("name", config.strategy);
        if (s.contains("params")) {
            config.strategyParams = s["params"];
        }
    }

    config.validate();
    return config;
}

nlohmann::json BacktestConfig::toJson() const {
    // clang-format off
    return {
        {"initial_cash", initialCash},
        {"commission", {{"per_trade", commission.perTrade}, {"rate", commission.rate}}},
        {"position_fraction", positionFraction},
        {"trade_on_close", tradeOnClose},
        {"end_of_data", endOfDataPolicyToString(endOfData)},
        {"periods_per_year", periodsPerYear},
        {"strategy", {{"name", strategy}, {"params", strategyParams}}},
    };
    // clang-format on
}

std::optional<BacktestConfig> BacktestConfig::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::cerr << "Error: Cannot open config file: " << path << std::endl;
        return std::nullopt;
    }

    try {
        nlohmann::json json;
        f >> json;
        return fromJson(json);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Config parse error (" << path << "): " << e.what() << std::endl;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid config (" << path << "): " << e.what() << std::endl;
    }
    return std::nullopt;
}
