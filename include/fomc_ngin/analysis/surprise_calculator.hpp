// include/fomc_ngin/analysis/surprise_calculator.hpp
#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "fomc_ngin/analysis/event_anchor.hpp"
#include "fomc_ngin/core/error.hpp"
#include "fomc_ngin/market/contract_selector.hpp"
#include "fomc_ngin/market/price_series.hpp"

namespace fomc_ngin {

struct SurpriseConfig {
    std::string root{"ZQ"};
    int pre_window_s{600};
    int post_window_s{600};
};

/**
 * @brief Policy-rate surprise implied by fed funds futures around one meeting
 *
 * Prices, deltas and the surprise are empty when neither candidate contract
 * traded in both windows; notes then carries the reason.
 */
struct SurpriseRecord {
    std::string meeting_id;
    std::string t0_utc;
    std::string primary_symbol;
    std::string fallback_symbol;
    std::optional<std::string> symbol_used;
    std::optional<Price> price_pre;
    std::optional<Price> price_post;
    std::optional<double> implied_pre;
    std::optional<double> implied_post;
    std::optional<double> delta_implied_bps;
    int days_in_month{0};
    int days_remaining_after_announcement{0};
    std::optional<double> scaling_factor;
    std::optional<double> target_surprise_bps;
    std::string notes;
};

/**
 * @brief Returns the price series of one contract symbol for the meeting day
 */
using ContractSeriesLookup =
    std::function<Result<std::shared_ptr<const PriceSeries>>(const std::string& contract_symbol)>;

class SurpriseCalculator {
public:
    explicit SurpriseCalculator(SurpriseConfig config);

    /**
     * @brief Compute the surprise record for one meeting
     *
     * Candidates (meeting-month contract, then next month) are tried in order
     * and the first with a trade in both [t0 - pre, t0 - 1s] and [t0, t0 + post]
     * wins. Missing data yields a record without a symbol; only setup errors
     * are returned as errors.
     */
    Result<SurpriseRecord> compute(const EventAnchor& anchor,
                                   const ContractSeriesLookup& lookup) const;

    /**
     * @brief Days remaining in the month counting the meeting day: D - d + 1
     */
    static int days_remaining(const CalendarDate& date);

    /**
     * @brief D / days_remaining, empty when days_remaining <= 0
     */
    static std::optional<double> scaling_factor(const CalendarDate& date);

    const SurpriseConfig& config() const {
        return config_;
    }

private:
    SurpriseConfig config_;
    ContractSelector selector_;
};

}  // namespace fomc_ngin
