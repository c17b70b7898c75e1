// include/fomc_ngin/analysis/forward_return_engine.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "fomc_ngin/core/error.hpp"
#include "fomc_ngin/core/types.hpp"
#include "fomc_ngin/market/price_series.hpp"

namespace fomc_ngin {

/**
 * @brief How a forward price delta was obtained
 */
enum class ReturnStatus {
    OBSERVED,         // Both p0 and p1 resolved from trades
    CARRIED_FORWARD,  // t0 + h lies past the last trade; p1 taken as p0
    UNAVAILABLE       // No p0, or carry-forward disabled
};

/**
 * @brief Treatment of horizons that reach past the last observed trade
 */
enum class MissingForwardPolicy {
    CARRY_FORWARD,  // delta 0, flagged CARRIED_FORWARD
    UNAVAILABLE     // null delta, flagged UNAVAILABLE
};

std::string return_status_to_string(ReturnStatus status);
std::string missing_forward_policy_to_string(MissingForwardPolicy policy);
Result<MissingForwardPolicy> missing_forward_policy_from_string(const std::string& text);

struct ForwardReturnConfig {
    std::vector<int> horizons;
    MissingForwardPolicy policy{MissingForwardPolicy::CARRY_FORWARD};
};

/**
 * @brief One row whose forward returns are requested
 */
struct ReturnRequest {
    std::string meeting_id;
    std::string instrument_symbol;
    std::int64_t segment_id{0};
    EpochSeconds anchor_timestamp{0};
};

struct ForwardReturnRow {
    std::string meeting_id;
    std::string instrument_symbol;
    std::int64_t segment_id{0};
    EpochSeconds anchor_timestamp{0};
    int horizon_seconds{0};
    std::optional<double> price_delta;
    ReturnStatus status{ReturnStatus::UNAVAILABLE};
};

/**
 * @brief Computes price(t0 + h) - price(t0) per horizon from a shared series
 *
 * Horizons are independent of each other and only share p0. The series is
 * only read, so one engine and one series may serve many threads.
 */
class ForwardReturnEngine {
public:
    explicit ForwardReturnEngine(ForwardReturnConfig config) : config_(std::move(config)) {}

    /**
     * @brief One row per configured horizon, in configuration order
     */
    std::vector<ForwardReturnRow> compute_rows(const ReturnRequest& request,
                                               const PriceSeries& series) const;

    /**
     * @brief Rows marked UNAVAILABLE for a request without a usable series
     */
    std::vector<ForwardReturnRow> unavailable_rows(const ReturnRequest& request) const;

    const ForwardReturnConfig& config() const {
        return config_;
    }

private:
    ForwardReturnRow make_row(const ReturnRequest& request, int horizon) const;

    ForwardReturnConfig config_;
};

}  // namespace fomc_ngin
