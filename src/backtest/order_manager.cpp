#include "backtest/order_manager.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

std::string formatPrice(double price) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(5) << price;
    return out.str();
}

}  // namespace

OrderManager::OrderManager(double initialCash, CommissionModel commission, double positionFraction)
    : initialCash_(initialCash)
    , commission_(commission)
    , positionFraction_(positionFraction)
    , cash_(initialCash) {}

bool OrderManager::submit(const Decision& decision, std::size_t index) {
    switch (decision.action) {
    case Action::None:
        return false;
    case Action::EnterLong:
    case Action::EnterShort:
        if (!position_.isFlat()) {
            return false;
        }
        break;
    case Action::Close:
        if (position_.isFlat()) {
            return false;
        }
        break;
    }

    PendingOrder order;
    order.action      = decision.action;
    order.stopLoss    = decision.stopLoss;
    order.signalIndex = index;
    pending_          = order;
    return true;
}

void OrderManager::cancelPending() {
    if (pending_) {
        warn("bar " + std::to_string(pending_->signalIndex) + ": dropped " + actionToString(pending_->action)
             + " order, no bar left to fill it");
    }
    pending_.reset();
}

void OrderManager::fill(const BarSeries& data, std::size_t index, double price) {
    if (!pending_) {
        return;
    }
    const PendingOrder order = *pending_;
    pending_.reset();

    switch (order.action) {
    case Action::EnterLong:
        if (position_.isFlat()) {
            open(data, index, price, Direction::Long, order.stopLoss);
        }
        break;
    case Action::EnterShort:
        if (position_.isFlat()) {
            open(data, index, price, Direction::Short, order.stopLoss);
        }
        break;
    case Action::Close:
        close(data, index, price, ExitReason::Signal);
        break;
    case Action::None:
        break;
    }
}

void OrderManager::open(const BarSeries& data, std::size_t index, double price, Direction direction,
                        std::optional<double> stopLoss) {
    const auto when = "bar " + std::to_string(index);

    if (stopLoss) {
        const bool protective = (direction == Direction::Long) ? (*stopLoss < price) : (*stopLoss > price);
        if (!protective) {
            warn(when + ": rejected " + directionToString(direction) + " entry, stop " + formatPrice(*stopLoss)
                 + " is not protective against fill " + formatPrice(price));
            return;
        }
    }

    if (cash_ <= 0.0 || price <= 0.0) {
        warn(when + ": rejected " + directionToString(direction) + " entry, no cash to commit");
        return;
    }

    position_            = Position{};
    position_.direction  = direction;
    position_.entryPrice = price;
    position_.size       = positionFraction_ * cash_ / price;
    position_.stopLoss   = stopLoss;
    position_.entryIndex = index;
    position_.entryTime  = data.timestamps[index];
}

void OrderManager::close(const BarSeries& data, std::size_t index, double price, ExitReason reason) {
    if (position_.isFlat()) {
        return;
    }

    const double entryNotional = position_.entryPrice * position_.size;
    const double exitNotional  = price * position_.size;

    Trade trade;
    trade.direction  = position_.direction;
    trade.entryIndex = position_.entryIndex;
    trade.exitIndex  = index;
    trade.entryTime  = position_.entryTime;
    trade.exitTime   = data.timestamps[index];
    trade.entryPrice = position_.entryPrice;
    trade.exitPrice  = price;
    trade.size       = position_.size;
    trade.profit     = position_.unrealizedPnl(price);
    trade.commission = commission_.cost(entryNotional, exitNotional);
    trade.returnPct  = entryNotional > 0.0 ? trade.netProfit() / entryNotional * 100.0 : 0.0;
    trade.exitReason = reason;

    cash_ += trade.profit - trade.commission;
    commissionPaid_ += trade.commission;
    trades_.push_back(trade);

    position_ = Position{};
}

bool OrderManager::checkStopLoss(const BarSeries& data, std::size_t index) {
    if (position_.isFlat() || !position_.stopLoss) {
        return false;
    }

    const double stop    = *position_.stopLoss;
    const double barOpen = data.open[index];

    if (position_.isLong() && data.low[index] <= stop) {
        close(data, index, barOpen <= stop ? barOpen : stop, ExitReason::StopLoss);
        return true;
    }
    if (position_.isShort() && data.high[index] >= stop) {
        close(data, index, barOpen >= stop ? barOpen : stop, ExitReason::StopLoss);
        return true;
    }
    return false;
}

double OrderManager::equity(double markPrice) const {
    return cash_ + position_.unrealizedPnl(markPrice);
}

void OrderManager::warn(const std::string& message) {
    std::cerr << "  [WARN] " << message << std::endl;
    diagnostics_.push_back(message);
}
