#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "backtest/backtest_config.hpp"
#include "backtest/backtest_engine.hpp"
#include "bar_series.hpp"

struct SweepCase {
    std::string    label;  // e.g. "macd_crossover fast_period=8 slow_period=21"
    BacktestConfig config;
};

struct SweepOutcome {
    std::string    label;
    BacktestConfig config;

    std::optional<BacktestResult> result;  // empty when the run failed
    std::string                   error;

    double score = 0.0;
};

/**
 * @brief Weights of the composite ranking score:
 *
 * score = annualReturn% * annualReturn + sharpe * 100 * sharpe + (100 + maxDrawdown%) * drawdown
 */
struct RankingWeights {
    double annualReturn = 0.35;
    double sharpe       = 0.35;
    double drawdown     = 0.30;

    /**
     * @brief Reads {"annual_return_weight", "sharpe_weight", "drawdown_weight"}.
     */
    [[nodiscard]] static RankingWeights fromJson(const nlohmann::json& json);
};

/**
 * @brief Runs many independent configurations over one shared series.
 *
 * Each run owns its engine, strategy and simulation state; workers share
 * only the read-only BarSeries. A failing run (invalid parameters, too few
 * bars) is recorded in its outcome and does not stop the sweep.
 */
class ParameterSweep {
   public:
    /**
     * @param workers Thread count, 0 = std::thread::hardware_concurrency().
     */
    explicit ParameterSweep(std::size_t workers = 0, RankingWeights weights = {});

    /**
     * @brief Cartesian product of parameter values on top of @p base.
     *
     * @p grid is an array of
     * @code
     * { "strategy": "rsi_mean_reversion", "params": { "period": [7, 14], "oversold": [25, 30] } }
     * @endcode
     * where a scalar value counts as a single-element list. Base parameters
     * apply when the entry names the base strategy.
     * @throws std::invalid_argument for a malformed grid.
     */
    [[nodiscard]] static std::vector<SweepCase> expandGrid(const BacktestConfig& base, const nlohmann::json& grid);

    /**
     * @return One outcome per case, in case order, scored but not sorted.
     */
    [[nodiscard]] std::vector<SweepOutcome> run(const std::shared_ptr<const BarSeries>& data,
                                                const std::vector<SweepCase>&           cases) const;

    [[nodiscard]] double score(const PerformanceMetrics& metrics) const;

    /**
     * @brief Sorts by score, best first; failed runs go last in case order.
     */
    static void rank(std::vector<SweepOutcome>& outcomes);

    static void printRanking(const std::vector<SweepOutcome>& outcomes, std::size_t limit = 20);

    [[nodiscard]] std::size_t workers() const {
        return workers_;
    }

   private:
    std::size_t    workers_;
    RankingWeights weights_;
};
