// include/fomc_ngin/market/contract_selector.hpp
#pragma once

#include <string>
#include <vector>
#include "fomc_ngin/core/calendar.hpp"
#include "fomc_ngin/core/error.hpp"

namespace fomc_ngin {

/**
 * @brief Maps a calendar month to monthly futures contract symbols
 *
 * Symbols are <root><month code><last digit of year>, e.g. ZQX3 for
 * November 2023. Month codes: F G H J K M N Q U V X Z.
 */
class ContractSelector {
public:
    ContractSelector() = default;
    explicit ContractSelector(std::string root) : root_(std::move(root)) {}

    /**
     * @brief Single-letter month code
     * @return CONFIGURATION_ERROR for a month outside 1-12
     */
    static Result<char> month_code(int month);

    /**
     * @brief Inverse of month_code
     * @return CONFIGURATION_ERROR for a letter that is not a month code
     */
    static Result<int> month_from_code(char code);

    Result<std::string> symbol_for(int year, int month) const;

    /**
     * @brief Contract of the date's own month
     */
    Result<std::string> primary(const CalendarDate& date) const;

    /**
     * @brief Contract of the following month, rolling December into January
     */
    Result<std::string> fallback(const CalendarDate& date) const;

    /**
     * @brief Ordered candidates tried in turn: primary, then fallback
     */
    Result<std::vector<std::string>> candidates(const CalendarDate& date) const;

    const std::string& root() const {
        return root_;
    }

private:
    std::string root_;
};

}  // namespace fomc_ngin
