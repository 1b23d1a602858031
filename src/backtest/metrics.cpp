#include "backtest/metrics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace {

constexpr double kEpsilon = 1e-12;

}  // namespace

double MetricsAggregator::mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

double MetricsAggregator::stdDev(const std::vector<double>& values) {
    if (values.size() < 2) {
        return 0.0;
    }
    const double m = mean(values);

    double variance = 0.0;
    for (const auto& v : values) {
        variance += (v - m) * (v - m);
    }
    variance /= static_cast<double>(values.size());

    return std::sqrt(variance);
}

double MetricsAggregator::winRate(const std::vector<Trade>& trades) {
    if (trades.empty()) {
        return 0.0;
    }
    const auto wins =
        std::count_if(trades.begin(), trades.end(), [](const Trade& t) { return t.netProfit() > 0.0; });
    return static_cast<double>(wins) / static_cast<double>(trades.size()) * 100.0;
}

std::vector<double> MetricsAggregator::barReturns(const std::vector<double>& equity) {
    std::vector<double> returns;
    if (equity.size() < 2) {
        return returns;
    }
    returns.reserve(equity.size() - 1);
    for (std::size_t i = 1; i < equity.size(); ++i) {
        if (equity[i - 1] > 0.0) {
            returns.push_back((equity[i] - equity[i - 1]) / equity[i - 1]);
        }
    }
    return returns;
}

double MetricsAggregator::sharpeRatio(const std::vector<double>& returns, double periodsPerYear) {
    const double sd = stdDev(returns);
    if (sd < kEpsilon) {
        return 0.0;
    }
    return (mean(returns) / sd) * std::sqrt(periodsPerYear);
}

double MetricsAggregator::sortinoRatio(const std::vector<double>& returns, double periodsPerYear) {
    if (returns.empty()) {
        return 0.0;
    }

    double downside = 0.0;
    for (const auto& r : returns) {
        if (r < 0.0) {
            downside += r * r;
        }
    }
    const double downsideDev = std::sqrt(downside / static_cast<double>(returns.size()));
    if (downsideDev < kEpsilon) {
        return 0.0;
    }
    return (mean(returns) / downsideDev) * std::sqrt(periodsPerYear);
}

double MetricsAggregator::maxDrawdown(const std::vector<double>& equity) {
    if (equity.empty()) {
        return 0.0;
    }

    double peak  = equity[0];
    double maxDD = 0.0;
    for (const auto& eq : equity) {
        peak = std::max(peak, eq);
        if (peak > 0.0) {
            const double dd = (eq - peak) / peak * 100.0;
            maxDD           = std::min(maxDD, dd);
        }
    }
    return maxDD;
}

std::size_t MetricsAggregator::maxDrawdownDuration(const std::vector<double>& equity) {
    std::size_t longest = 0;
    std::size_t current = 0;
    double      peak    = equity.empty() ? 0.0 : equity[0];

    for (const auto& eq : equity) {
        if (eq >= peak) {
            peak    = eq;
            current = 0;
        } else {
            longest = std::max(longest, ++current);
        }
    }
    return longest;
}

double MetricsAggregator::annualizedReturn(double initialEquity, double finalEquity, std::size_t bars,
                                           double periodsPerYear) {
    if (bars == 0 || initialEquity <= 0.0) {
        return 0.0;
    }
    if (finalEquity <= 0.0) {
        return -100.0;
    }

    const double years  = static_cast<double>(bars) / periodsPerYear;
    const double result = (std::pow(finalEquity / initialEquity, 1.0 / years) - 1.0) * 100.0;
    return std::isfinite(result) ? result : 0.0;
}

double MetricsAggregator::calmarRatio(double annualizedReturnPct, double maxDrawdownPct) {
    if (std::abs(maxDrawdownPct) < kEpsilon) {
        return 0.0;
    }
    return annualizedReturnPct / std::abs(maxDrawdownPct);
}

PerformanceMetrics MetricsAggregator::compute(const std::vector<Trade>&       trades,
                                              const std::vector<EquityPoint>& equityCurve, double initialCash,
                                              double periodsPerYear) {
    PerformanceMetrics m;

    std::vector<double> equity;
    equity.reserve(equityCurve.size());
    std::size_t exposed = 0;
    for (const auto& point : equityCurve) {
        equity.push_back(point.equity);
        if (point.inMarket) {
            ++exposed;
        }
    }

    m.equityFinal = equity.empty() ? initialCash : equity.back();
    m.equityPeak  = equity.empty() ? initialCash : *std::max_element(equity.begin(), equity.end());

    // 1. Total Return
    if (initialCash > 0.0) {
        m.totalReturnPct = (m.equityFinal / initialCash - 1.0) * 100.0;
    }

    // 2. Win Rate
    m.winRatePct = winRate(trades);

    // 3. Max Drawdown
    m.maxDrawdownPct      = maxDrawdown(equity);
    m.maxDrawdownDuration = maxDrawdownDuration(equity);

    // 4. Sharpe / Sortino from per-bar returns
    const auto returns = barReturns(equity);
    m.sharpeRatio      = sharpeRatio(returns, periodsPerYear);
    m.sortinoRatio     = sortinoRatio(returns, periodsPerYear);

    // 5. Annualized figures and Calmar
    const std::size_t periods = equity.empty() ? 0 : equity.size() - 1;
    m.annualizedReturnPct     = annualizedReturn(initialCash, m.equityFinal, periods, periodsPerYear);
    m.annualizedVolatilityPct = stdDev(returns) * std::sqrt(periodsPerYear) * 100.0;
    m.calmarRatio             = calmarRatio(m.annualizedReturnPct, m.maxDrawdownPct);

    // 6. Trade statistics
    m.tradeCount = trades.size();
    if (!equity.empty()) {
        m.exposureTimePct = static_cast<double>(exposed) / static_cast<double>(equity.size()) * 100.0;
    }
    if (!trades.empty()) {
        const auto [worst, best] = std::minmax_element(
            trades.begin(), trades.end(), [](const Trade& a, const Trade& b) { return a.returnPct < b.returnPct; });
        m.bestTradePct  = best->returnPct;
        m.worstTradePct = worst->returnPct;

        double sumPct      = 0.0;
        double grossWins   = 0.0;
        double grossLosses = 0.0;
        for (const auto& t : trades) {
            sumPct += t.returnPct;
            if (t.netProfit() > 0.0) {
                grossWins += t.netProfit();
            } else {
                grossLosses += -t.netProfit();
            }
        }
        m.avgTradePct = sumPct / static_cast<double>(trades.size());
        if (grossLosses > kEpsilon) {
            m.profitFactor = grossWins / grossLosses;
        }
    }

    return m;
}
