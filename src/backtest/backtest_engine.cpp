#include "backtest/backtest_engine.hpp"

#include <algorithm>
#include <utility>

#include "backtest/order_manager.hpp"
#include "indicator_set.hpp"

namespace {

/**
 * @brief Mutable state of one run. Created per run() call and never shared.
 */
struct SimulationState {
    SimulationState(const BacktestConfig& config, std::size_t bars)
        : orders(config.initialCash, config.commission, config.positionFraction)
        , indicators(bars) {
        equityCurve.reserve(bars);
    }

    std::size_t              index = 0;
    OrderManager             orders;
    IndicatorSet             indicators;
    std::vector<EquityPoint> equityCurve;
};

void checkColumns(const BarSeries& data) {
    const auto n = data.close.size();
    if (data.timestamps.size() != n || data.open.size() != n || data.high.size() != n || data.low.size() != n
        || data.volume.size() != n) {
        throw std::invalid_argument("BarSeries columns differ in length");
    }
}

void markEquity(SimulationState& state, const BarSeries& data) {
    const auto  i = state.index;
    EquityPoint point;
    point.timestamp = data.timestamps[i];
    point.equity    = state.orders.equity(data.close[i]);
    point.inMarket  = !state.orders.position().isFlat();
    state.equityCurve.push_back(point);
}

}  // namespace

DataInsufficientError::DataInsufficientError(std::size_t available, std::size_t required)
    : std::runtime_error("insufficient data: " + std::to_string(available) + " bars available, "
                         + std::to_string(required) + " required")
    , available_(available)
    , required_(required) {}

BacktestEngine::BacktestEngine(BacktestConfig config)
    : config_(std::move(config)) {
    config_.validate();
}

BacktestResult BacktestEngine::run(const IStrategy& strategy, const BarSeries& data) const {
    checkColumns(data);

    BacktestResult result;
    result.ticker         = data.ticker;
    result.strategyName   = strategy.name();
    result.initialCapital = config_.initialCash;

    const auto n = data.size();

    SimulationState state(config_, n);

    // Initialize strategy (precompute indicators)
    strategy.init(data, state.indicators);

    const auto warmup = std::max<std::size_t>({strategy.warmupPeriod(), state.indicators.warmup(), 1});
    if (n < warmup) {
        throw DataInsufficientError(n, warmup);
    }
    result.warmup = warmup;

    auto& orders = state.orders;

    for (std::size_t i = 0; i < n; ++i) {
        state.index = i;

        if (!config_.tradeOnClose) {
            orders.fill(data, i, data.open[i]);
        }

        // Stops are checked before this bar's decision, so a stopped-out
        // position is already flat when the strategy looks at it.
        orders.checkStopLoss(data, i);

        if (i + 1 >= warmup) {
            const auto decision = strategy.decide(data, i, state.indicators, orders.position());
            if (!decision.diagnostic.empty()) {
                orders.warn("bar " + std::to_string(i) + ": " + decision.diagnostic);
            }
            if (orders.submit(decision, i) && config_.tradeOnClose) {
                orders.fill(data, i, data.close[i]);
            }
        }

        markEquity(state, data);
    }

    // An order decided on the last bar has no next bar to fill on.
    orders.cancelPending();

    if (!orders.position().isFlat()) {
        if (config_.endOfData == EndOfDataPolicy::ForceClose) {
            orders.close(data, n - 1, data.close[n - 1], ExitReason::EndOfData);
            state.equityCurve.back().equity = orders.equity(data.close[n - 1]);
        } else {
            result.openPosition = orders.position();
        }
    }

    result.finalCash      = orders.cash();
    result.finalCapital   = state.equityCurve.back().equity;
    result.commissionPaid = orders.commissionPaid();
    result.trades         = orders.trades();
    result.equityCurve    = std::move(state.equityCurve);
    result.diagnostics    = orders.diagnostics();

    // --- Compute metrics ---
    result.metrics = MetricsAggregator::compute(result.trades, result.equityCurve, config_.initialCash,
                                                config_.periodsPerYear);

    return result;
}
