#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>

#include <unistd.h>

#include "backtest/backtest_config.hpp"
#include "backtest/backtest_engine.hpp"
#include "backtest/backtest_report.hpp"
#include "series_loader.hpp"
#include "strategy/strategy_factory.hpp"

static std::string resolveFromExe(const std::string& relativePath) {
    char    buf[4096];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0)
        return relativePath;
    buf[len] = '\0';
    std::string exePath(buf);
    // <root>/<build>/backtest -> <root>
    for (int i = 0; i < 2; ++i) {
        auto pos = exePath.rfind('/');
        if (pos == std::string::npos)
            return relativePath;
        exePath = exePath.substr(0, pos);
    }
    return exePath + "/" + relativePath;
}

static void usage(const char* exe) {
    std::cerr << "Usage: " << exe << " <data.json> [config.json] [--json]" << "\n"
              << "  data.json    OHLCV series in the Yahoo Finance chart layout" << "\n"
              << "  config.json  run configuration (default: config/backtest.json)" << "\n"
              << "  --json       print the full result as JSON on stdout" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string dataPath;
    std::string configPath;
    bool        asJson = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--json") == 0) {
            asJson = true;
        } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            usage(argv[0]);
            return 0;
        } else if (dataPath.empty()) {
            dataPath = argv[i];
        } else if (configPath.empty()) {
            configPath = argv[i];
        } else {
            usage(argv[0]);
            return 1;
        }
    }

    if (dataPath.empty()) {
        usage(argv[0]);
        return 1;
    }
    if (configPath.empty()) {
        configPath = resolveFromExe("config/backtest.json");
    }

    const auto config = BacktestConfig::load(configPath);
    if (!config) {
        return 1;
    }

    const auto data = SeriesLoader::load(dataPath);
    if (!data) {
        std::cerr << "Failed to load series from " << dataPath << std::endl;
        return 1;
    }
    std::cerr << "Loaded " << data->size() << " bars for " << data->ticker << std::endl;

    try {
        const auto     strategy = StrategyFactory::create(config->strategy, config->strategyParams);
        BacktestEngine engine(*config);
        const auto     result = engine.run(*strategy, *data);

        if (asJson) {
            std::cout << BacktestReport::toJson(result).dump(2) << std::endl;
        } else {
            BacktestReport::printSummary(result);
            BacktestReport::printTrades(result);
        }
    } catch (const DataInsufficientError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid configuration: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
