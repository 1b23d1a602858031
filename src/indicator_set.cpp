#include "indicator_set.hpp"

#include <algorithm>
#include <stdexcept>

#include "indicator.hpp"

IndicatorSet::IndicatorSet(std::size_t length)
    : length_(length) {}

void IndicatorSet::add(const std::string& name, std::vector<double> values, std::size_t warmup) {
    if (values.size() != length_) {
        throw std::invalid_argument("IndicatorSet: '" + name + "' has " + std::to_string(values.size())
                                    + " values, expected " + std::to_string(length_));
    }
    if (entries_.count(name) > 0) {
        throw std::invalid_argument("IndicatorSet: '" + name + "' is already registered");
    }

    Entry entry;
    entry.values = std::move(values);
    entry.warmup = warmup;
    entries_.emplace(name, std::move(entry));
}

bool IndicatorSet::contains(const std::string& name) const {
    return entries_.count(name) > 0;
}

const std::vector<double>& IndicatorSet::series(const std::string& name) const {
    const auto it = entries_.find(name);
    if (it == entries_.end()) {
        throw std::out_of_range("IndicatorSet: unknown indicator '" + name + "'");
    }
    return it->second.values;
}

std::optional<double> IndicatorSet::at(const std::string& name, std::size_t index) const {
    const auto& values = series(name);
    if (index >= values.size() || !indicator::isDefined(values[index])) {
        return std::nullopt;
    }
    return values[index];
}

std::size_t IndicatorSet::warmup() const {
    std::size_t result = 0;
    for (const auto& [name, entry] : entries_) {
        result = std::max(result, entry.warmup);
    }
    return result;
}

std::vector<std::string> IndicatorSet::names() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& [name, entry] : entries_) {
        result.push_back(name);
    }
    return result;
}
