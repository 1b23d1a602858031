#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "backtest/parameter_sweep.hpp"
#include "series_loader.hpp"

static std::string resolveFromExe(const std::string& relativePath) {
    char    buf[4096];
    ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (len <= 0)
        return relativePath;
    buf[len] = '\0';
    std::string exePath(buf);
    for (int i = 0; i < 2; ++i) {
        auto pos = exePath.rfind('/');
        if (pos == std::string::npos)
            return relativePath;
        exePath = exePath.substr(0, pos);
    }
    return exePath + "/" + relativePath;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <data.json> [sweep.json]" << std::endl;
        return 1;
    }

    const std::string dataPath  = argv[1];
    std::string       sweepPath = resolveFromExe("config/sweep.json");
    if (argc > 2)
        sweepPath = argv[2];

    /* ---- Load sweep config ---- */
    nlohmann::json sweepCfg;
    {
        std::ifstream f(sweepPath);
        if (!f.is_open()) {
            std::cerr << "Error: Cannot open: " << sweepPath << std::endl;
            return 1;
        }
        try {
            f >> sweepCfg;
        } catch (const nlohmann::json::parse_error& e) {
            std::cerr << "Sweep config parse error (" << sweepPath << "): " << e.what() << std::endl;
            return 1;
        }
    }

    std::vector<SweepCase> cases;
    std::size_t            workers = 0;
    RankingWeights         weights;
    std::size_t            top     = 20;
    try {
        const auto base = BacktestConfig::fromJson(sweepCfg.value("base", nlohmann::json::object()));

        cases   = ParameterSweep::expandGrid(base, sweepCfg.value("grid", nlohmann::json::array()));
        workers = sweepCfg.value("workers", workers);
        weights = RankingWeights::fromJson(sweepCfg.value("ranking", nlohmann::json::object()));
        top     = sweepCfg.value("top", top);
    } catch (const nlohmann::json::type_error& e) {
        std::cerr << "Invalid sweep config: " << e.what() << std::endl;
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid sweep config: " << e.what() << std::endl;
        return 1;
    }

    if (cases.empty()) {
        std::cerr << "Error: sweep grid is empty" << std::endl;
        return 1;
    }

    std::shared_ptr<const BarSeries> data = SeriesLoader::load(dataPath);
    if (!data) {
        std::cerr << "Failed to load series from " << dataPath << std::endl;
        return 1;
    }

    const ParameterSweep sweep(workers, weights);
    std::cerr << "Running " << cases.size() << " configurations on " << data->ticker << " (" << data->size()
              << " bars, " << sweep.workers() << " workers)..." << std::endl;

    auto outcomes = sweep.run(data, cases);
    ParameterSweep::rank(outcomes);
    ParameterSweep::printRanking(outcomes, top);

    return 0;
}
