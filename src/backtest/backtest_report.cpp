#include "backtest/backtest_report.hpp"

#include <algorithm>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

std::string BacktestReport::formatTime(const int64_t timestamp) {
    const std::time_t t = static_cast<std::time_t>(timestamp);
    std::tm           utc{};
    gmtime_r(&t, &utc);
    char mbstr[32];
    std::strftime(mbstr, sizeof(mbstr), "%Y-%m-%d", &utc);
    return mbstr;
}

void BacktestReport::printSummary(const BacktestResult& result) {
    const auto& m    = result.metrics;
    const auto  wins = std::count_if(result.trades.begin(), result.trades.end(),
                                     [](const Trade& t) { return t.netProfit() > 0.0; });

    std::string period = "-";
    if (!result.equityCurve.empty()) {
        period = formatTime(result.equityCurve.front().timestamp) + " ~ "
               + formatTime(result.equityCurve.back().timestamp);
    }

    // clang-format off
    std::clog << "\n"
        << "=== Backtest Result: " << result.strategyName << " ===" << "\n"
        << "Ticker:         " << result.ticker << "\n"
        << "Period:         " << period << " (" << result.equityCurve.size() << " bars, warm-up "
            << result.warmup << ")" << "\n"
        << std::fixed << std::setprecision(2)
        << "Initial:        $" << result.initialCapital << "\n"
        << "Final:          $" << result.finalCapital << "\n"
        << "Peak:           $" << m.equityPeak << "\n"
        << "Commissions:    $" << result.commissionPaid << "\n"
        << "-" << "\n"
        << "Total Return:   " << m.totalReturnPct << "%" << "\n"
        << "Annual Return:  " << m.annualizedReturnPct << "%" << "\n"
        << "Annual Vol:     " << m.annualizedVolatilityPct << "%" << "\n"
        << "Exposure:       " << m.exposureTimePct << "%" << "\n"
        << "Win Rate:       " << m.winRatePct << "%"
            << " (" << wins << "/" << result.trades.size() << ")" << "\n"
        << "Best Trade:     " << m.bestTradePct << "%" << "\n"
        << "Worst Trade:    " << m.worstTradePct << "%" << "\n"
        << "Avg Trade:      " << m.avgTradePct << "%" << "\n"
        << "Profit Factor:  " << m.profitFactor << "\n"
        << "-" << "\n"
        << "Max Drawdown:   " << m.maxDrawdownPct << "%"
            << " (" << m.maxDrawdownDuration << " bars)" << "\n"
        << "Sharpe Ratio:   " << m.sharpeRatio << "\n"
        << "Sortino Ratio:  " << m.sortinoRatio << "\n"
        << "Calmar Ratio:   " << m.calmarRatio << "\n";
    // clang-format on

    if (result.openPosition) {
        std::clog << "Open Position:  " << directionToString(result.openPosition->direction) << " "
                  << result.openPosition->size << " @ $" << result.openPosition->entryPrice << "\n";
    }
    std::clog << std::endl;
}

void BacktestReport::printTrades(const BacktestResult& result) {
    if (result.trades.empty()) {
        std::clog << "(No trades executed)" << std::endl;
        return;
    }

    // clang-format off
    std::clog << "=== Trades ===" << "\n"
        << std::left
        << std::setw(8)  << "(Side)"
        << std::setw(14) << "(Entry Date)"
        << std::setw(14) << "(Exit Date)"
        << std::setw(14) << "(Entry)"
        << std::setw(14) << "(Exit)"
        << std::setw(12) << "(Return)"
        << "(Reason)"
        << "\n-"
        << std::endl;
    // clang-format on

    for (const auto& trade : result.trades) {
        std::ostringstream ret;
        ret << std::fixed << std::setprecision(2) << (trade.returnPct >= 0.0 ? "+" : "") << trade.returnPct << "%";

        // clang-format off
        std::clog << std::left
            << std::setw(8)  << directionToString(trade.direction)
            << std::setw(14) << formatTime(trade.entryTime)
            << std::setw(14) << formatTime(trade.exitTime)
            << std::fixed << std::setprecision(4)
            << "$" << std::setw(13) << trade.entryPrice
            << "$" << std::setw(13) << trade.exitPrice
            << std::setw(12) << ret.str()
            << exitReasonToString(trade.exitReason)
            << std::endl;
        // clang-format on
    }
}

nlohmann::json BacktestReport::toJson(const BacktestResult& result) {
    const auto& m = result.metrics;

    nlohmann::json out;
    out["ticker"]          = result.ticker;
    out["strategy"]        = result.strategyName;
    out["initial_capital"] = result.initialCapital;
    out["final_capital"]   = result.finalCapital;
    out["final_cash"]      = result.finalCash;
    out["commission_paid"] = result.commissionPaid;
    out["warmup"]          = result.warmup;

    out["metrics"] = {
        {"win_rate_pct", m.winRatePct},
        {"total_return_pct", m.totalReturnPct},
        {"sharpe_ratio", m.sharpeRatio},
        {"sortino_ratio", m.sortinoRatio},
        {"max_drawdown_pct", m.maxDrawdownPct},
        {"calmar_ratio", m.calmarRatio},
        {"annualized_return_pct", m.annualizedReturnPct},
        {"annualized_volatility_pct", m.annualizedVolatilityPct},
        {"exposure_time_pct", m.exposureTimePct},
        {"trade_count", m.tradeCount},
        {"best_trade_pct", m.bestTradePct},
        {"worst_trade_pct", m.worstTradePct},
        {"avg_trade_pct", m.avgTradePct},
        {"profit_factor", m.profitFactor},
        {"equity_final", m.equityFinal},
        {"equity_peak", m.equityPeak},
        {"max_drawdown_duration", m.maxDrawdownDuration},
    };

    out["trades"] = nlohmann::json::array();
    for (const auto& t : result.trades) {
        out["trades"].push_back({
            {"direction", directionToString(t.direction)},
            {"entry_index", t.entryIndex},
            {"exit_index", t.exitIndex},
            {"entry_time", t.entryTime},
            {"exit_time", t.exitTime},
            {"entry_price", t.entryPrice},
            {"exit_price", t.exitPrice},
            {"size", t.size},
            {"profit", t.profit},
            {"commission", t.commission},
            {"return_pct", t.returnPct},
            {"exit_reason", exitReasonToString(t.exitReason)},
        });
    }

    out["equity_curve"] = nlohmann::json::array();
    for (const auto& p : result.equityCurve) {
        out["equity_curve"].push_back({{"timestamp", p.timestamp}, {"equity", p.equity}, {"in_market", p.inMarket}});
    }

    if (result.openPosition) {
        const auto& p = *result.openPosition;

        out["open_position"] = {
            {"direction", directionToString(p.direction)},
            {"entry_price", p.entryPrice},
            {"size", p.size},
            {"entry_index", p.entryIndex},
            {"entry_time", p.entryTime},
        };
        out["open_position"]["stop_loss"] = p.stopLoss ? nlohmann::json(*p.stopLoss) : nlohmann::json(nullptr);
    } else {
        out["open_position"] = nullptr;
    }

    out["diagnostics"] = result.diagnostics;
    return out;
}

bool BacktestReport::writeJson(const BacktestResult& result, const std::string& path) {
    std::ofstream file(path);
    if (!file) {
        std::cerr << "Failed to open " << path << " for writing" << std::endl;
        return false;
    }
    file << toJson(result).dump(2) << std::endl;
    if (!file) {
        std::cerr << "Failed to write " << path << std::endl;
        return false;
    }
    return true;
}
