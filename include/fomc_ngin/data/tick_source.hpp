// include/fomc_ngin/data/tick_source.hpp
#pragma once

#include <string>
#include <vector>
#include "fomc_ngin/core/calendar.hpp"
#include "fomc_ngin/core/error.hpp"
#include "fomc_ngin/core/types.hpp"

namespace fomc_ngin {

/**
 * @brief Provider of raw trade ticks for one futures root on one calendar day
 *
 * Implementations return DATA_UNAVAILABLE when the provider has nothing for the
 * requested (root, day); any other error aborts the run.
 */
class TickSource {
public:
    virtual ~TickSource() = default;

    virtual Result<std::vector<Tick>> load_ticks(const std::string& root,
                                                 const CalendarDate& day) = 0;
};

}  // namespace fomc_ngin
