#include "series_loader.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace {

/**
 * @brief Reads one price column. A null or missing entry makes the whole
 *        series unusable.
 */
bool readPrices(const nlohmann::json& quote, const char* key, std::vector<double>& out) {
    if (!quote.contains(key) || !quote[key].is_array()) {
        std::cerr << "SeriesLoader: missing quote column '" << key << "'" << std::endl;
        return false;
    }
    const auto& column = quote[key];
    out.reserve(column.size());
    for (std::size_t i = 0; i < column.size(); ++i) {
        if (!column[i].is_number()) {
            std::cerr << "SeriesLoader: '" << key << "' has no value at bar " << i << std::endl;
            return false;
        }
        out.push_back(column[i].get<double>());
    }
    return true;
}

std::string rowError(std::size_t index, const std::string& what) {
    return "bar " + std::to_string(index) + ": " + what;
}

}  // namespace

std::shared_ptr<BarSeries> SeriesLoader::load(const std::string& path, const std::string& ticker) {
    std::ifstream file(path);
    if (!file) {
        std::cerr << "SeriesLoader: cannot open " << path << std::endl;
        return nullptr;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return fromJson(buffer.str(), ticker);
}

std::shared_ptr<BarSeries> SeriesLoader::fromJson(const std::string& text, const std::string& ticker) {
    auto data = std::make_shared<BarSeries>();

    try {
        const auto parsed = nlohmann::json::parse(text);
        if (!parsed.contains("chart") || !parsed["chart"].contains("result") || !parsed["chart"]["result"].is_array()
            || parsed["chart"]["result"].empty()) {
            std::cerr << "SeriesLoader: no chart result" << std::endl;
            return nullptr;
        }

        const auto& result = parsed["chart"]["result"][0];
        const auto  meta   = result.value("meta", nlohmann::json::object());

        /**
         * @note SYMBOL
         * @example "SPY", "EURUSD=X", etc.
         */
        data->ticker = ticker;
        if (data->ticker.empty() && meta.contains("symbol") && meta["symbol"].is_string()) {
            data->ticker = meta["symbol"];
        }

        if (meta.contains("currency") && meta["currency"].is_string()) {
            data->currency = meta["currency"];
        }

        /**
         * @note TIMEZONE
         * @example "America/New_York"; falls back to the short "timezone" ("EST").
         */
        if (meta.contains("exchangeTimezoneName") && meta["exchangeTimezoneName"].is_string()) {
            data->timezone = meta["exchangeTimezoneName"];
        } else if (meta.contains("timezone") && meta["timezone"].is_string()) {
            data->timezone = meta["timezone"];
        }

        if (!result.contains("timestamp") || !result["timestamp"].is_array()) {
            std::cerr << "SeriesLoader: missing timestamps" << std::endl;
            return nullptr;
        }
        data->timestamps = result["timestamp"].get<std::vector<int64_t>>();

        const auto quote = result.value("/indicators/quote/0"_json_pointer, nlohmann::json::object());
        if (!readPrices(quote, "open", data->open) || !readPrices(quote, "high", data->high)
            || !readPrices(quote, "low", data->low) || !readPrices(quote, "close", data->close)) {
            return nullptr;
        }

        // Volume is optional (FX and indices report none); nulls read as 0.
        if (quote.contains("volume") && quote["volume"].is_array()) {
            for (const auto& v : quote["volume"]) {
                data->volume.push_back(v.is_number() ? v.get<double>() : 0.0);
            }
        } else {
            data->volume.assign(data->close.size(), 0.0);
        }
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "SeriesLoader: " << e.what() << std::endl;
        return nullptr;
    } catch (const nlohmann::json::type_error& e) {
        std::cerr << "SeriesLoader: " << e.what() << std::endl;
        return nullptr;
    }

    const auto error = validate(*data);
    if (!error.empty()) {
        std::cerr << "SeriesLoader: invalid series " << data->ticker << ": " << error << std::endl;
        return nullptr;
    }
    return data;
}

std::string SeriesLoader::validate(const BarSeries& series) {
    const std::size_t n = series.close.size();
    if (series.timestamps.size() != n || series.open.size() != n || series.high.size() != n
        || series.low.size() != n || series.volume.size() != n) {
        return "column lengths differ";
    }

    for (std::size_t i = 0; i < n; ++i) {
        if (i > 0 && series.timestamps[i] <= series.timestamps[i - 1]) {
            return rowError(i, "timestamps not strictly increasing");
        }

        const double o = series.open[i];
        const double h = series.high[i];
        const double l = series.low[i];
        const double c = series.close[i];

        for (const double price : {o, h, l, c}) {
            if (!std::isfinite(price) || price <= 0.0) {
                return rowError(i, "prices must be finite and positive");
            }
        }
        if (l > std::min(o, c)) {
            return rowError(i, "low above open/close");
        }
        if (h < std::max(o, c)) {
            return rowError(i, "high below open/close");
        }
        if (!std::isfinite(series.volume[i]) || series.volume[i] < 0.0) {
            return rowError(i, "negative volume");
        }
    }
    return "";
}
