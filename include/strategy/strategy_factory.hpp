#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "strategy/istrategy.hpp"

/**
 * @brief Registry mapping a strategy name to a creator.
 *
 * The built-in strategies (`macd_crossover`, `rsi_mean_reversion`,
 * `trend_filtered_rsi`) are registered on first use. All members are
 * thread-safe.
 */
class StrategyFactory {
   public:
    using Creator = std::function<std::unique_ptr<IStrategy>(const nlohmann::json& params)>;

    StrategyFactory() = delete;

    /**
     * @brief Registers (or replaces) a creator under @p name.
     */
    static void add(const std::string& name, Creator creator);

    [[nodiscard]] static bool has(const std::string& name);

    /**
     * @brief Registered names in registration order.
     */
    [[nodiscard]] static std::vector<std::string> names();

    /**
     * @brief Builds a strategy from its JSON parameter object. Missing keys
     *        take the strategy's defaults.
     * @throws std::invalid_argument for an unknown name or invalid parameters.
     */
    [[nodiscard]] static std::unique_ptr<IStrategy> create(const std::string& name,
                                                           const nlohmann::json& params = nlohmann::json::object());
};
