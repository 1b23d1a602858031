#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

enum class Direction
{
    Flat,
    Long,
    Short,
};

enum class ExitReason
{
    Signal,     // strategy emitted Action::Close
    StopLoss,   // bar traded through the protective stop
    EndOfData,  // force-closed after the last bar
};

[[nodiscard]] std::string directionToString(Direction direction);
[[nodiscard]] std::string exitReasonToString(ExitReason reason);

/**
 * @brief The single open position of a run.
 *
 * Only one direction is representable at a time, so a run can never be long
 * and short simultaneously.
 */
struct Position {
    Direction             direction  = Direction::Flat;
    double                entryPrice = 0.0;
    double                size       = 0.0;  // units, always >= 0
    std::optional<double> stopLoss;
    std::size_t           entryIndex = 0;
    int64_t               entryTime  = 0;

    [[nodiscard]] bool isFlat() const {
        return direction == Direction::Flat;
    }

    [[nodiscard]] bool isLong() const {
        return direction == Direction::Long;
    }

    [[nodiscard]] bool isShort() const {
        return direction == Direction::Short;
    }

    /**
     * @brief +1 for long, -1 for short, 0 when flat.
     */
    [[nodiscard]] double sign() const {
        return isLong() ? 1.0 : (isShort() ? -1.0 : 0.0);
    }

    /**
     * @brief Profit of the position if it were closed at `price`, before commission.
     */
    [[nodiscard]] double unrealizedPnl(double price) const {
        return sign() * (price - entryPrice) * size;
    }
};

/**
 * @brief Closed position. Appended to the trade log and never modified.
 */
struct Trade {
    Direction   direction  = Direction::Long;
    std::size_t entryIndex = 0;
    std::size_t exitIndex  = 0;
    int64_t     entryTime  = 0;
    int64_t     exitTime   = 0;
    double      entryPrice = 0.0;
    double      exitPrice  = 0.0;
    double      size       = 0.0;
    double      profit     = 0.0;  // gross, before commission
    double      commission = 0.0;
    double      returnPct  = 0.0;  // (profit - commission) / entry notional * 100
    ExitReason  exitReason = ExitReason::Signal;

    [[nodiscard]] double netProfit() const {
        return profit - commission;
    }
};
