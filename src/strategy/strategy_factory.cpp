#include "strategy/strategy_factory.hpp"

#include <algorithm>
#include <cstddef>
#include <map>
#include <mutex>
#include <stdexcept>
#include <utility>

#include "macd_crossover.hpp"
#include "rsi_strategy.hpp"
#include "trend_filtered_rsi.hpp"

namespace {

struct Registry {
    Registry();

    std::vector<std::string>                        names;   // registration order
    std::map<std::string, StrategyFactory::Creator> creators;
    std::mutex                                      mtx;
};

std::size_t readPeriod(const nlohmann::json& params, const char* key, int fallback) {
    const int value = params.value(key, fallback);
    if (value <= 0) {
        throw std::invalid_argument(std::string(key) + " must be positive");
    }
    return static_cast<std::size_t>(value);
}

void addLocked(Registry& r, const std::string& name, StrategyFactory::Creator creator) {
    r.creators[name] = std::move(creator);
    if (std::find(r.names.begin(), r.names.end(), name) == r.names.end()) {
        r.names.push_back(name);
    }
}

Registry::Registry() {
    addLocked(*this, "macd_crossover", [](const nlohmann::json& p) -> std::unique_ptr<IStrategy> {
        return std::make_unique<MacdCrossover>(readPeriod(p, "fast_period", 12), readPeriod(p, "slow_period", 26),
                                               readPeriod(p, "signal_period", 9));
    });
    addLocked(*this, "rsi_mean_reversion", [](const nlohmann::json& p) -> std::unique_ptr<IStrategy> {
        return std::make_unique<RsiStrategy>(readPeriod(p, "period", 14), p.value("oversold", 30.0),
                                             p.value("overbought", 70.0), p.value("exit_level", 50.0));
    });
    addLocked(*this, "trend_filtered_rsi", [](const nlohmann::json& p) -> std::unique_ptr<IStrategy> {
        TrendFilteredRsiParams params;
        params.rsiPeriod      = readPeriod(p, "rsi_period", 14);
        params.emaPeriod      = readPeriod(p, "ema_period", 200);
        params.atrPeriod      = readPeriod(p, "atr_period", 14);
        params.oversold       = p.value("oversold", params.oversold);
        params.overbought     = p.value("overbought", params.overbought);
        params.exitLevel      = p.value("exit_level", params.exitLevel);
        params.stopMultiplier = p.value("stop_multiplier", params.stopMultiplier);
        return std::make_unique<TrendFilteredRsi>(params);
    });
}

Registry& registry() {
    static Registry r;
    return r;
}

}  // namespace

void StrategyFactory::add(const std::string& name, Creator creator) {
    auto&                       r = registry();
    std::lock_guard<std::mutex> lock(r.mtx);
    addLocked(r, name, std::move(creator));
}

bool StrategyFactory::has(const std::string& name) {
    auto&                       r = registry();
    std::lock_guard<std::mutex> lock(r.mtx);
    return r.creators.count(name) > 0;
}

std::vector<std::string> StrategyFactory::names() {
    auto&                       r = registry();
    std::lock_guard<std::mutex> lock(r.mtx);
    return r.names;
}

std::unique_ptr<IStrategy> StrategyFactory::create(const std::string& name, const nlohmann::json& params) {
    Creator creator;
    {
        auto&                       r = registry();
        std::lock_guard<std::mutex> lock(r.mtx);
        auto                        it = r.creators.find(name);
        if (it == r.creators.end() || !it->second) {
            throw std::invalid_argument("Unknown strategy: " + name);
        }
        creator = it->second;
    }

    if (!params.is_object()) {
        throw std::invalid_argument("Parameters for " + name + " must be a JSON object");
    }
    try {
        return creator(params);
    } catch (const nlohmann::json::type_error& e) {
        throw std::invalid_argument("Invalid parameter type for " + name + ": " + e.what());
    }
}
