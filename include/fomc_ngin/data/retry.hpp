// include/fomc_ngin/data/retry.hpp
#pragma once

#include <chrono>
#include <cstdlib>
#include <string>
#include <thread>
#include "fomc_ngin/core/error.hpp"
#include "fomc_ngin/core/logger.hpp"

namespace fomc_ngin {
namespace utils {

// Retry function with exponential backoff; only I/O failures are retried
template <typename Func>
auto retry_with_backoff(Func func, int max_retries = 3) -> decltype(func()) {
    int attempt = 0;
    std::chrono::milliseconds delay(100);  // Start with 100ms delay

    while (attempt < max_retries) {
        auto result = func();

        if (!result.is_error() || result.error()->code() != ErrorCode::FILE_IO_ERROR) {
            return result;
        }

        WARN("Read failed, retrying (attempt " + std::to_string(attempt + 1) + " of " +
             std::to_string(max_retries) + "): " + result.error()->what());

        std::this_thread::sleep_for(delay);

        // Exponential backoff with jitter
        delay *= 2;
        delay += std::chrono::milliseconds(std::rand() % 100);

        attempt++;
    }

    // All retries failed, execute one last time and return the result
    return func();
}

}  // namespace utils
}  // namespace fomc_ngin
