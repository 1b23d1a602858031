#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

#include "backtest/position.hpp"
#include "bar_series.hpp"
#include "indicator_set.hpp"

enum class Action
{
    None,
    EnterLong,
    EnterShort,
    Close,
};

/**
 * @brief Outcome of one IStrategy::decide() call.
 *
 * `stopLoss` is only meaningful for entries. `diagnostic` carries a
 * non-fatal message (e.g. a rejected stop) that the engine logs and keeps
 * in the result.
 */
struct Decision {
    Action                action = Action::None;
    std::optional<double> stopLoss;
    std::string           diagnostic;

    [[nodiscard]] static Decision none() {
        return {};
    }

    [[nodiscard]] static Decision enterLong(std::optional<double> stopLoss = std::nullopt) {
        return {Action::EnterLong, stopLoss, ""};
    }

    [[nodiscard]] static Decision enterShort(std::optional<double> stopLoss = std::nullopt) {
        return {Action::EnterShort, stopLoss, ""};
    }

    [[nodiscard]] static Decision close() {
        return {Action::Close, std::nullopt, ""};
    }

    [[nodiscard]] static Decision skip(std::string diagnostic) {
        return {Action::None, std::nullopt, std::move(diagnostic)};
    }
};

[[nodiscard]] std::string actionToString(Action action);

/**
 * @brief Abstract interface for trading strategies.
 *
 * A strategy only holds its parameters. Everything that changes during a run
 * (indicator values, the position) is handed in by the engine, which is why
 * every method is const and one instance can serve concurrent runs.
 */
struct IStrategy {
    virtual ~IStrategy() = default;

    /**
     * @brief Strategy display name.
     */
    [[nodiscard]] virtual std::string name() const = 0;

    /**
     * @brief Compute and register the indicators this strategy reads.
     * @param data        Historical bar data.
     * @param indicators  Empty set sized to data.size().
     */
    virtual void init(const BarSeries& data, IndicatorSet& indicators) const = 0;

    /**
     * @brief Minimum number of bars required before the strategy
     *        can produce meaningful decisions.
     */
    [[nodiscard]] virtual std::size_t warmupPeriod() const = 0;

    /**
     * @brief Decide what to do at the close of a bar.
     * @param data        Historical bar data.
     * @param index       Current bar index (0-based). Only data up to index may be read.
     * @param indicators  Series registered in init().
     * @param position    Current position.
     * @return Decision with at most one action.
     */
    [[nodiscard]] virtual Decision decide(const BarSeries& data, std::size_t index, const IndicatorSet& indicators,
                                          const Position& position) const = 0;
};
