// include/fomc_ngin/market/as_of_resolver.hpp
#pragma once

#include <optional>
#include "fomc_ngin/core/types.hpp"
#include "fomc_ngin/market/price_series.hpp"

namespace fomc_ngin {

/**
 * @brief Predecessor lookups over a pre-sorted PriceSeries
 *
 * All queries are binary searches; the series is never re-sorted.
 */
class AsOfResolver {
public:
    /**
     * @brief Price at the largest observed second <= t
     * @return std::nullopt when t precedes the first observation
     */
    static std::optional<Price> resolve(const PriceSeries& series, EpochSeconds t);

    /**
     * @brief Last observed price inside the closed window [start, end]
     * @return std::nullopt when no observation falls inside the window
     */
    static std::optional<Price> last_in_window(const PriceSeries& series, EpochSeconds start,
                                               EpochSeconds end);

    /**
     * @brief Last price among trades stamped in [start, end] at full precision
     *
     * Differs from last_in_window only at the end edge: the bucket of second
     * end contributes just the trades stamped exactly on end, so a print at
     * end + 0.4s is outside the window.
     */
    static std::optional<Price> last_in_exact_window(const PriceSeries& series,
                                                     EpochSeconds start, EpochSeconds end);

    /**
     * @brief Whether t lies within the observed span, i.e. t <= last observation
     */
    static bool covers(const PriceSeries& series, EpochSeconds t) {
        return !series.empty() && t <= series.last_time();
    }
};

}  // namespace fomc_ngin
