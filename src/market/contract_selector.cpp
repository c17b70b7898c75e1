// src/market/contract_selector.cpp

#include "fomc_ngin/market/contract_selector.hpp"

namespace fomc_ngin {

namespace {
constexpr char kMonthCodes[12] = {'F', 'G', 'H', 'J', 'K', 'M', 'N', 'Q', 'U', 'V', 'X', 'Z'};
}

Result<char> ContractSelector::month_code(int month) {
    if (month < 1 || month > 12) {
        return make_error<char>(ErrorCode::CONFIGURATION_ERROR,
                                "Month out of range for contract code: " + std::to_string(month),
                                "ContractSelector");
    }
    return kMonthCodes[month - 1];
}

Result<int> ContractSelector::month_from_code(char code) {
    for (int i = 0; i < 12; ++i) {
        if (kMonthCodes[i] == code) {
            return i + 1;
        }
    }
    return make_error<int>(ErrorCode::CONFIGURATION_ERROR,
                           std::string("Unknown contract month code: ") + code,
                           "ContractSelector");
}

Result<std::string> ContractSelector::symbol_for(int year, int month) const {
    auto code = month_code(month);
    if (code.is_error()) {
        return forward_error<std::string>(code, "ContractSelector");
    }
    int year_digit = ((year % 10) + 10) % 10;
    return root_ + code.value() + std::to_string(year_digit);
}

Result<std::string> ContractSelector::primary(const CalendarDate& date) const {
    return symbol_for(date.year, date.month);
}

Result<std::string> ContractSelector::fallback(const CalendarDate& date) const {
    if (date.month < 1 || date.month > 12) {
        return make_error<std::string>(ErrorCode::CONFIGURATION_ERROR,
                                       "Month out of range: " + std::to_string(date.month),
                                       "ContractSelector");
    }
    int month = date.month + 1;
    int year = date.year;
    if (month == 13) {
        month = 1;
        ++year;
    }
    return symbol_for(year, month);
}

Result<std::vector<std::string>> ContractSelector::candidates(const CalendarDate& date) const {
    auto first = primary(date);
    if (first.is_error()) {
        return forward_error<std::vector<std::string>>(first, "ContractSelector");
    }
    auto second = fallback(date);
    if (second.is_error()) {
        return forward_error<std::vector<std::string>>(second, "ContractSelector");
    }
    return std::vector<std::string>{first.value(), second.value()};
}

}  // namespace fomc_ngin
