// include/fomc_ngin/market/price_series.hpp
#pragma once

#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <tuple>
#include <vector>
#include "fomc_ngin/core/calendar.hpp"
#include "fomc_ngin/core/error.hpp"
#include "fomc_ngin/core/types.hpp"
#include "fomc_ngin/data/tick_source.hpp"

namespace fomc_ngin {

/**
 * @brief Last traded price per epoch second for one (instrument, day)
 *
 * Keys are strictly increasing and unique. Built once and never mutated.
 */
class PriceSeries {
public:
    PriceSeries() = default;

    /**
     * @brief Build a series from ticks
     *
     * Ticks are ordered by event time (input order breaks exact ties) and
     * bucketed by floor(epoch second). The latest tick of a bucket wins.
     * The latest tick stamped exactly on the second is kept separately.
     *
     * @param ticks Raw ticks, any order
     * @param price_scale Factor applied to every price
     */
    static PriceSeries from_ticks(std::vector<Tick> ticks, double price_scale = 1.0);

    const std::vector<EpochSeconds>& times() const {
        return times_;
    }
    const std::vector<Price>& prices() const {
        return prices_;
    }

    /**
     * @brief Parallel to times(): last price stamped exactly on that second, if any
     */
    const std::vector<std::optional<Price>>& on_second_prices() const {
        return on_second_prices_;
    }

    size_t size() const {
        return times_.size();
    }
    bool empty() const {
        return times_.empty();
    }

    /**
     * @brief First and last observed second; only valid on a non-empty series
     */
    EpochSeconds first_time() const {
        return times_.front();
    }
    EpochSeconds last_time() const {
        return times_.back();
    }

private:
    std::vector<EpochSeconds> times_;
    std::vector<Price> prices_;
    std::vector<std::optional<Price>> on_second_prices_;
};

/**
 * @brief Accepts only single-leg monthly contracts of a root, e.g. ZQX3 for ZQ
 *
 * Calendar spreads and multi-leg notations ("ZQ:BF F5-G5-J5", "ESZ3-ESH4")
 * are rejected.
 */
class SingleLegFilter {
public:
    /**
     * @return CONFIGURATION_ERROR when the root cannot form a symbol pattern
     */
    static Result<SingleLegFilter> create(const std::string& root);

    SingleLegFilter() = default;

    bool matches(const std::string& symbol) const;

    const std::string& root() const {
        return root_;
    }

private:
    std::string root_;
    std::regex pattern_;
};

/**
 * @brief Which single-leg contracts feed a root-level series
 */
enum class ContractFilter {
    ALL,       // Every single-leg contract of the root
    DOMINANT   // Only the contract with the most ticks that day
};

std::string contract_filter_to_string(ContractFilter filter);
Result<ContractFilter> contract_filter_from_string(const std::string& text);

/**
 * @brief Builds and caches price series per (meeting, instrument)
 *
 * Raw day ticks are loaded once per (root, day) and each series is built once
 * per key and shared read-only afterwards. A caller asking for a day or series
 * that another thread is still loading waits for that load instead of
 * starting its own. Missing data is reported as DATA_UNAVAILABLE so callers
 * can skip and continue.
 */
class PriceSeriesStore {
public:
    PriceSeriesStore(std::shared_ptr<TickSource> source, ContractFilter filter);

    /**
     * @brief Series over all single-leg contracts of an instrument root
     */
    Result<std::shared_ptr<const PriceSeries>> get_root_series(const std::string& meeting_id,
                                                               const CalendarDate& day,
                                                               const InstrumentSpec& instrument);

    /**
     * @brief Series for one contract symbol (e.g. ZQX3) of a root
     */
    Result<std::shared_ptr<const PriceSeries>> get_contract_series(
        const std::string& meeting_id, const CalendarDate& day, const std::string& root,
        const std::string& contract_symbol);

    size_t cached_series_count() const;

    /**
     * @brief Number of times the tick source was hit; one per (root, day)
     */
    size_t tick_loads() const;

private:
    using DayKey = std::pair<std::string, std::string>;              // (root, date)
    using SeriesKey = std::tuple<std::string, std::string, std::string>;  // (meeting, root, contract)
    using DayTicks = std::shared_ptr<const std::vector<Tick>>;

    Result<DayTicks> load_day(const std::string& root, const CalendarDate& day);

    // Cached series for key, or nullptr after marking key as being built by
    // the caller. Waits while another thread builds the same key.
    std::shared_ptr<const PriceSeries> find_or_claim_series(const SeriesKey& key);
    std::shared_ptr<const PriceSeries> insert_series(const SeriesKey& key,
                                                     std::shared_ptr<const PriceSeries> series);

    std::shared_ptr<TickSource> source_;
    ContractFilter filter_;

    mutable std::mutex mutex_;
    std::map<DayKey, DayTicks> day_cache_;  // nullptr marks a known-missing day
    std::map<SeriesKey, std::shared_ptr<const PriceSeries>> series_cache_;
    std::set<DayKey> loading_days_;
    std::set<SeriesKey> building_series_;
    std::condition_variable in_flight_cv_;
    size_t tick_loads_{0};
};

}  // namespace fomc_ngin
