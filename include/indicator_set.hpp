#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Named indicator series registered by a strategy for one run.
 *
 * Every series is aligned with the bar series it was computed from. The set
 * is filled once in IStrategy::init() and read-only for the rest of the run.
 */
class IndicatorSet {
   public:
    /**
     * @param length Number of bars every registered series must have.
     */
    explicit IndicatorSet(std::size_t length = 0);

    /**
     * @brief Register an indicator series.
     * @param name    Lookup key, e.g. "rsi".
     * @param values  Series aligned with the bars.
     * @param warmup  Bars required before the first defined value.
     * @throws std::invalid_argument if values.size() != length() or the name is taken.
     */
    void add(const std::string& name, std::vector<double> values, std::size_t warmup);

    [[nodiscard]] bool contains(const std::string& name) const;

    /**
     * @throws std::out_of_range for an unknown name.
     */
    [[nodiscard]] const std::vector<double>& series(const std::string& name) const;

    /**
     * @brief Value at a bar index, std::nullopt while undefined or out of range.
     * @throws std::out_of_range for an unknown name.
     */
    [[nodiscard]] std::optional<double> at(const std::string& name, std::size_t index) const;

    /**
     * @brief Largest warm-up window among registered series (0 when empty).
     */
    [[nodiscard]] std::size_t warmup() const;

    [[nodiscard]] std::size_t length() const {
        return length_;
    }

    [[nodiscard]] std::vector<std::string> names() const;

   private:
    struct Entry {
        std::vector<double> values;
        std::size_t         warmup = 0;
    };

    std::size_t                  length_;
    std::map<std::string, Entry> entries_;
};
