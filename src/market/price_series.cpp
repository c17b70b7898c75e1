// src/market/price_series.cpp

#include "fomc_ngin/market/price_series.hpp"
#include <algorithm>
#include <unordered_map>
#include "fomc_ngin/core/logger.hpp"

namespace fomc_ngin {

namespace {

// Releases a key claimed in an in-flight set and wakes waiting callers
template <typename Key>
class InFlightRelease {
public:
    InFlightRelease(std::mutex& mutex, std::condition_variable& cv, std::set<Key>& keys,
                    Key key)
        : mutex_(mutex), cv_(cv), keys_(keys), key_(std::move(key)) {}

    ~InFlightRelease() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            keys_.erase(key_);
        }
        cv_.notify_all();
    }

    InFlightRelease(const InFlightRelease&) = delete;
    InFlightRelease& operator=(const InFlightRelease&) = delete;

private:
    std::mutex& mutex_;
    std::condition_variable& cv_;
    std::set<Key>& keys_;
    Key key_;
};

}  // namespace

PriceSeries PriceSeries::from_ticks(std::vector<Tick> ticks, double price_scale) {
    std::stable_sort(ticks.begin(), ticks.end(), [](const Tick& a, const Tick& b) {
        return a.event_time < b.event_time;
    });

    PriceSeries series;
    series.times_.reserve(ticks.size());
    series.prices_.reserve(ticks.size());
    series.on_second_prices_.reserve(ticks.size());

    for (const auto& tick : ticks) {
        EpochSeconds bucket = to_epoch_seconds(tick.event_time);
        Price price = tick.price * price_scale;
        if (series.times_.empty() || series.times_.back() != bucket) {
            series.times_.push_back(bucket);
            series.prices_.push_back(price);
            series.on_second_prices_.emplace_back();
        }
        series.prices_.back() = price;
        if (tick.event_time == from_epoch_seconds(bucket)) {
            series.on_second_prices_.back() = price;
        }
    }

    series.times_.shrink_to_fit();
    series.prices_.shrink_to_fit();
    series.on_second_prices_.shrink_to_fit();
    return series;
}

Result<SingleLegFilter> SingleLegFilter::create(const std::string& root) {
    static const std::regex kRootPattern("^[A-Z0-9]{1,4}$");
    if (!std::regex_match(root, kRootPattern)) {
        return make_error<SingleLegFilter>(ErrorCode::CONFIGURATION_ERROR,
                                           "Malformed instrument root for symbol pattern: '" +
                                               root + "'",
                                           "SingleLegFilter");
    }
    SingleLegFilter filter;
    filter.root_ = root;
    filter.pattern_ = std::regex("^" + root + "[A-Z]\\d$");
    return filter;
}

bool SingleLegFilter::matches(const std::string& symbol) const {
    return !root_.empty() && std::regex_match(symbol, pattern_);
}

std::string contract_filter_to_string(ContractFilter filter) {
    switch (filter) {
        case ContractFilter::ALL:
            return "all";
        case ContractFilter::DOMINANT:
            return "dominant";
        default:
            return "unknown";
    }
}

Result<ContractFilter> contract_filter_from_string(const std::string& text) {
    if (text == "all")
        return ContractFilter::ALL;
    if (text == "dominant")
        return ContractFilter::DOMINANT;
    return make_error<ContractFilter>(ErrorCode::CONFIGURATION_ERROR,
                                      "Unknown contract_filter: '" + text + "'", "ContractFilter");
}

PriceSeriesStore::PriceSeriesStore(std::shared_ptr<TickSource> source, ContractFilter filter)
    : source_(std::move(source)), filter_(filter) {}

Result<PriceSeriesStore::DayTicks> PriceSeriesStore::load_day(const std::string& root,
                                                              const CalendarDate& day) {
    DayKey key{root, day.to_string()};
    auto filter_result = SingleLegFilter::create(root);
    if (filter_result.is_error()) {
        return forward_error<DayTicks>(filter_result, "PriceSeriesStore");
    }
    const SingleLegFilter& filter = filter_result.value();

    {
        std::unique_lock<std::mutex> lock(mutex_);
        in_flight_cv_.wait(lock, [&] { return loading_days_.count(key) == 0; });
        auto it = day_cache_.find(key);
        if (it != day_cache_.end()) {
            if (!it->second) {
                return make_error<DayTicks>(ErrorCode::DATA_UNAVAILABLE,
                                            "No ticks for " + root + " on " + key.second,
                                            "PriceSeriesStore");
            }
            return it->second;
        }
        loading_days_.insert(key);
    }
    InFlightRelease<DayKey> release(mutex_, in_flight_cv_, loading_days_, key);

    auto ticks_result = source_->load_ticks(root, day);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++tick_loads_;
    }

    DayTicks day_ticks;
    if (ticks_result.is_error()) {
        if (!is_recoverable(ticks_result.error()->code())) {
            return forward_error<DayTicks>(ticks_result, "PriceSeriesStore");
        }
        WARN("Tick load failed for " << root << " " << key.second << ": "
                                     << ticks_result.error()->what());
    } else {
        auto kept = std::make_shared<std::vector<Tick>>();
        size_t dropped = 0;
        for (const auto& tick : ticks_result.value()) {
            if (filter.matches(tick.symbol)) {
                kept->push_back(tick);
            } else {
                ++dropped;
            }
        }
        if (dropped > 0) {
            DEBUG("Dropped " << dropped << " multi-leg/foreign ticks for " << root << " "
                             << key.second);
        }
        if (!kept->empty()) {
            day_ticks = kept;
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto inserted = day_cache_.emplace(key, day_ticks);
        day_ticks = inserted.first->second;
    }

    if (!day_ticks) {
        return make_error<DayTicks>(ErrorCode::DATA_UNAVAILABLE,
                                    "No ticks for " + root + " on " + key.second,
                                    "PriceSeriesStore");
    }
    return day_ticks;
}

std::shared_ptr<const PriceSeries> PriceSeriesStore::find_or_claim_series(const SeriesKey& key) {
    std::unique_lock<std::mutex> lock(mutex_);
    in_flight_cv_.wait(lock, [&] { return building_series_.count(key) == 0; });
    auto it = series_cache_.find(key);
    if (it != series_cache_.end()) {
        return it->second;
    }
    building_series_.insert(key);
    return nullptr;
}

std::shared_ptr<const PriceSeries> PriceSeriesStore::insert_series(
    const SeriesKey& key, std::shared_ptr<const PriceSeries> series) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto inserted = series_cache_.emplace(key, std::move(series));
    return inserted.first->second;
}

Result<std::shared_ptr<const PriceSeries>> PriceSeriesStore::get_root_series(
    const std::string& meeting_id, const CalendarDate& day, const InstrumentSpec& instrument) {
    SeriesKey key{meeting_id, instrument.root, ""};
    if (auto cached = find_or_claim_series(key)) {
        return cached;
    }
    InFlightRelease<SeriesKey> release(mutex_, in_flight_cv_, building_series_, key);

    auto day_result = load_day(instrument.root, day);
    if (day_result.is_error()) {
        return forward_error<std::shared_ptr<const PriceSeries>>(day_result, "PriceSeriesStore");
    }
    const auto& ticks = *day_result.value();

    std::vector<Tick> selected;
    if (filter_ == ContractFilter::DOMINANT) {
        std::unordered_map<std::string, size_t> counts;
        for (const auto& tick : ticks) {
            ++counts[tick.symbol];
        }
        std::string dominant;
        size_t best = 0;
        for (const auto& [symbol, count] : counts) {
            if (count > best || (count == best && symbol < dominant)) {
                dominant = symbol;
                best = count;
            }
        }
        for (const auto& tick : ticks) {
            if (tick.symbol == dominant) {
                selected.push_back(tick);
            }
        }
        DEBUG("Dominant contract for " << instrument.root << " " << meeting_id << ": "
                                       << dominant << " (" << best << " ticks)");
    } else {
        selected = ticks;
    }

    auto series = std::make_shared<const PriceSeries>(
        PriceSeries::from_ticks(std::move(selected), instrument.price_scale));
    return insert_series(key, std::move(series));
}

Result<std::shared_ptr<const PriceSeries>> PriceSeriesStore::get_contract_series(
    const std::string& meeting_id, const CalendarDate& day, const std::string& root,
    const std::string& contract_symbol) {
    SeriesKey key{meeting_id, root, contract_symbol};
    if (auto cached = find_or_claim_series(key)) {
        return cached;
    }
    InFlightRelease<SeriesKey> release(mutex_, in_flight_cv_, building_series_, key);

    auto day_result = load_day(root, day);
    if (day_result.is_error()) {
        return forward_error<std::shared_ptr<const PriceSeries>>(day_result, "PriceSeriesStore");
    }

    std::vector<Tick> selected;
    for (const auto& tick : *day_result.value()) {
        if (tick.symbol == contract_symbol) {
            selected.push_back(tick);
        }
    }
    if (selected.empty()) {
        return make_error<std::shared_ptr<const PriceSeries>>(
            ErrorCode::DATA_UNAVAILABLE,
            "No ticks for contract " + contract_symbol + " on " + day.to_string(),
            "PriceSeriesStore");
    }

    auto series =
        std::make_shared<const PriceSeries>(PriceSeries::from_ticks(std::move(selected)));
    return insert_series(key, std::move(series));
}

size_t PriceSeriesStore::cached_series_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return series_cache_.size();
}

size_t PriceSeriesStore::tick_loads() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tick_loads_;
}

}  // namespace fomc_ngin
