// src/market/as_of_resolver.cpp

#include "fomc_ngin/market/as_of_resolver.hpp"
#include <algorithm>

namespace fomc_ngin {

namespace {

// Index of the largest key <= t, or -1
std::ptrdiff_t predecessor_index(const PriceSeries& series, EpochSeconds t) {
    const auto& times = series.times();
    auto it = std::upper_bound(times.begin(), times.end(), t);
    return std::distance(times.begin(), it) - 1;
}

}  // namespace

std::optional<Price> AsOfResolver::resolve(const PriceSeries& series, EpochSeconds t) {
    std::ptrdiff_t idx = predecessor_index(series, t);
    if (idx < 0) {
        return std::nullopt;
    }
    return series.prices()[static_cast<size_t>(idx)];
}

std::optional<Price> AsOfResolver::last_in_window(const PriceSeries& series, EpochSeconds start,
                                                  EpochSeconds end) {
    if (end < start) {
        return std::nullopt;
    }
    std::ptrdiff_t idx = predecessor_index(series, end);
    if (idx < 0 || series.times()[static_cast<size_t>(idx)] < start) {
        return std::nullopt;
    }
    return series.prices()[static_cast<size_t>(idx)];
}

std::optional<Price> AsOfResolver::last_in_exact_window(const PriceSeries& series,
                                                        EpochSeconds start, EpochSeconds end) {
    if (end < start) {
        return std::nullopt;
    }
    std::ptrdiff_t idx = predecessor_index(series, end);
    if (idx < 0) {
        return std::nullopt;
    }
    auto i = static_cast<size_t>(idx);
    if (series.times()[i] == end) {
        if (const auto& exact = series.on_second_prices()[i]) {
            return *exact;
        }
        if (i == 0) {
            return std::nullopt;
        }
        --i;
    }
    if (series.times()[i] < start) {
        return std::nullopt;
    }
    return series.prices()[i];
}

}  // namespace fomc_ngin
