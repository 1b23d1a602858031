#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "backtest/backtest_config.hpp"
#include "backtest/position.hpp"
#include "bar_series.hpp"
#include "strategy/istrategy.hpp"

/**
 * @brief Owns the single position, cash and trade log of a run.
 *
 * State machine over {Flat, Long, Short}:
 *   Flat  -> Long/Short  on a filled EnterLong/EnterShort
 *   Long  -> Flat        on Close, or when a bar's low reaches the stop
 *   Short -> Flat        on Close, or when a bar's high reaches the stop
 *
 * Orders are exclusive: an entry while positioned and a close while flat are
 * ignored, never queued or stacked. Cash only changes when a position is
 * closed, by the trade's profit minus its commission.
 */
class OrderManager {
   public:
    OrderManager(double initialCash, CommissionModel commission, double positionFraction = 1.0);

    /**
     * @brief Queue the action of a decision for the next fill.
     * @return false if the action was ignored (None, or not valid in the current state).
     */
    bool submit(const Decision& decision, std::size_t index);

    [[nodiscard]] bool hasPending() const {
        return pending_.has_value();
    }

    /**
     * @brief Execute the pending order at `price` on bar `index`.
     *
     * Entries are sized as positionFraction * cash / price. An entry whose
     * stop is not protective relative to `price` is rejected and recorded as
     * a diagnostic.
     */
    void fill(const BarSeries& data, std::size_t index, double price);

    /**
     * @brief Drop the pending order without executing it, noting the
     *        dropped action as a diagnostic.
     */
    void cancelPending();

    /**
     * @brief Close the position if bar `index` traded through its stop.
     *
     * The exit price is the stop itself, or the bar's open when the bar
     * gapped beyond the stop.
     * @return true if the position was stopped out.
     */
    bool checkStopLoss(const BarSeries& data, std::size_t index);

    /**
     * @brief Close the open position at `price`. No-op when flat.
     */
    void close(const BarSeries& data, std::size_t index, double price, ExitReason reason);

    /**
     * @brief Cash plus unrealized profit of the open position marked at `markPrice`.
     */
    [[nodiscard]] double equity(double markPrice) const;

    [[nodiscard]] const Position& position() const {
        return position_;
    }

    [[nodiscard]] double cash() const {
        return cash_;
    }

    [[nodiscard]] double initialCash() const {
        return initialCash_;
    }

    [[nodiscard]] double commissionPaid() const {
        return commissionPaid_;
    }

    [[nodiscard]] const std::vector<Trade>& trades() const {
        return trades_;
    }

    [[nodiscard]] const std::vector<std::string>& diagnostics() const {
        return diagnostics_;
    }

    /**
     * @brief Record a non-fatal message and echo it to std::cerr.
     */
    void warn(const std::string& message);

   private:
    struct PendingOrder {
        Action                action = Action::None;
        std::optional<double> stopLoss;
        std::size_t           signalIndex = 0;
    };

    void open(const BarSeries& data, std::size_t index, double price, Direction direction,
              std::optional<double> stopLoss);

    double          initialCash_;
    CommissionModel commission_;
    double          positionFraction_;

    double                      cash_;
    double                      commissionPaid_ = 0.0;
    Position                    position_;
    std::optional<PendingOrder> pending_;
    std::vector<Trade>          trades_;
    std::vector<std::string>    diagnostics_;
};
