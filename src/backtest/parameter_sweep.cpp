#include "backtest/parameter_sweep.hpp"

#include <algorithm>
#include <atomic>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>

#include "strategy/strategy_factory.hpp"

namespace {

std::string formatValue(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

}  // namespace

RankingWeights RankingWeights::fromJson(const nlohmann::json& json) {
    RankingWeights weights;
    weights.annualReturn = json.value("annual_return_weight", weights.annualReturn);
    weights.sharpe       = json.value("sharpe_weight", weights.sharpe);
    weights.drawdown     = json.value("drawdown_weight", weights.drawdown);
    return weights;
}

ParameterSweep::ParameterSweep(std::size_t workers, RankingWeights weights)
    : workers_(workers)
    , weights_(weights) {
    if (workers_ == 0) {
        workers_ = std::max(1U, std::thread::hardware_concurrency());
    }
}

std::vector<SweepCase> ParameterSweep::expandGrid(const BacktestConfig& base, const nlohmann::json& grid) {
    if (!grid.is_array()) {
        throw std::invalid_argument("sweep grid must be an array");
    }

    std::vector<SweepCase> cases;
    for (const auto& entry : grid) {
        if (!entry.is_object()) {
            throw std::invalid_argument("sweep grid entries must be objects");
        }

        const std::string strategy = entry.value("strategy", base.strategy);
        const auto        params   = entry.value("params", nlohmann::json::object());
        if (!params.is_object()) {
            throw std::invalid_argument("sweep params for " + strategy + " must be an object");
        }

        // Axes in key order, each a non-empty list of values.
        std::vector<std::pair<std::string, nlohmann::json>> axes;
        for (const auto& [key, values] : params.items()) {
            nlohmann::json list = values.is_array() ? values : nlohmann::json::array({values});
            if (list.empty()) {
                throw std::invalid_argument("sweep axis '" + key + "' has no values");
            }
            axes.emplace_back(key, std::move(list));
        }

        SweepCase seed;
        seed.label           = strategy;
        seed.config          = base;
        seed.config.strategy = strategy;
        if (strategy != base.strategy) {
            seed.config.strategyParams = nlohmann::json::object();
        }

        std::vector<SweepCase> expanded{seed};
        for (const auto& [key, values] : axes) {
            std::vector<SweepCase> next;
            next.reserve(expanded.size() * values.size());
            for (const auto& partial : expanded) {
                for (const auto& value : values) {
                    SweepCase c = partial;
                    c.config.strategyParams[key] = value;
                    c.label += " " + key + "=" + formatValue(value);
                    next.push_back(std::move(c));
                }
            }
            expanded = std::move(next);
        }

        std::move(expanded.begin(), expanded.end(), std::back_inserter(cases));
    }
    return cases;
}

double ParameterSweep::score(const PerformanceMetrics& metrics) const {
    return metrics.annualizedReturnPct * weights_.annualReturn + metrics.sharpeRatio * 100.0 * weights_.sharpe
         + (100.0 + metrics.maxDrawdownPct) * weights_.drawdown;
}

std::vector<SweepOutcome> ParameterSweep::run(const std::shared_ptr<const BarSeries>& data,
                                              const std::vector<SweepCase>&           cases) const {
    std::vector<SweepOutcome> outcomes(cases.size());
    if (cases.empty()) {
        return outcomes;
    }
    if (!data) {
        throw std::invalid_argument("ParameterSweep::run: no data");
    }

    std::atomic<std::size_t> nextCase{0};
    std::atomic<std::size_t> completed{0};
    std::mutex               logMutex;

    auto worker = [&]() {
        while (true) {
            const std::size_t i = nextCase.fetch_add(1);
            if (i >= cases.size()) {
                break;
            }

            SweepOutcome outcome;
            outcome.label  = cases[i].label;
            outcome.config = cases[i].config;

            try {
                const auto strategy = StrategyFactory::create(outcome.config.strategy,
                                                              outcome.config.strategyParams);

                BacktestEngine engine(outcome.config);
                outcome.result = engine.run(*strategy, *data);
                outcome.score  = score(outcome.result->metrics);
            } catch (const std::exception& e) {
                outcome.error = e.what();
            }

            const std::size_t done = completed.fetch_add(1) + 1;
            {
                std::lock_guard<std::mutex> lock(logMutex);
                if (outcome.error.empty()) {
                    std::cerr << "  [OK] (" << done << "/" << cases.size() << ") " << outcome.label << std::endl;
                } else {
                    std::cerr << "  [WARN] (" << done << "/" << cases.size() << ") " << outcome.label << " - "
                              << outcome.error << std::endl;
                }
            }

            // Each worker owns distinct slots.
            outcomes[i] = std::move(outcome);
        }
    };

    const std::size_t        threadCount = std::min(workers_, cases.size());
    std::vector<std::thread> threads;
    threads.reserve(threadCount);
    for (std::size_t t = 0; t < threadCount; ++t) {
        threads.emplace_back(worker);
    }
    for (auto& t : threads) {
        t.join();
    }

    return outcomes;
}

void ParameterSweep::rank(std::vector<SweepOutcome>& outcomes) {
    std::stable_sort(outcomes.begin(), outcomes.end(), [](const SweepOutcome& a, const SweepOutcome& b) {
        if (a.result.has_value() != b.result.has_value()) {
            return a.result.has_value();
        }
        if (!a.result) {
            return false;
        }
        return a.score > b.score;
    });
}

void ParameterSweep::printRanking(const std::vector<SweepOutcome>& outcomes, std::size_t limit) {
    constexpr int labelW = 48;

    std::clog << std::endl;
    std::clog << "=== Parameter Ranking ===" << std::endl;
    std::clog << std::endl;

    std::clog << std::left << std::setw(6) << "Rank" << std::setw(labelW) << "Configuration" << std::right
              << std::setw(10) << "Return" << std::setw(10) << "CAGR" << std::setw(9) << "Sharpe" << std::setw(10)
              << "MDD" << std::setw(8) << "Trades" << std::setw(10) << "Score" << std::endl;
    std::clog << std::string(111, '-') << std::endl;

    std::size_t shown  = 0;
    std::size_t failed = 0;
    for (const auto& o : outcomes) {
        if (!o.result) {
            ++failed;
            continue;
        }
        if (shown >= limit) {
            continue;
        }
        ++shown;

        const auto& m = o.result->metrics;
        std::clog << std::left << std::setw(6) << ("#" + std::to_string(shown)) << std::setw(labelW) << o.label
                  << std::right << std::fixed << std::setprecision(1) << std::setw(9) << m.totalReturnPct << "%"
                  << std::setw(9) << m.annualizedReturnPct << "%" << std::setprecision(2) << std::setw(9)
                  << m.sharpeRatio << std::setprecision(1) << std::setw(9) << m.maxDrawdownPct << "%" << std::setw(8)
                  << m.tradeCount << std::setw(10) << o.score << std::endl;
    }

    if (failed > 0) {
        std::clog << std::endl << "Failed runs: " << failed << std::endl;
        for (const auto& o : outcomes) {
            if (!o.result) {
                std::clog << "  " << o.label << ": " << o.error << std::endl;
            }
        }
    }
    std::clog << std::endl;
}
