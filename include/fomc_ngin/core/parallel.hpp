// include/fomc_ngin/core/parallel.hpp
#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace fomc_ngin {
namespace core {

/**
 * @brief Run fn(i) for every i in [0, n_tasks) on up to num_workers threads
 *
 * Workers pull the next index from a shared counter, so tasks must be
 * independent. The first exception thrown by a task stops further pulls and
 * is rethrown on the calling thread after all workers joined.
 */
template <typename Fn>
void parallel_for_each(size_t n_tasks, size_t num_workers, Fn&& fn) {
    if (n_tasks == 0) {
        return;
    }
    num_workers = std::max<size_t>(1, std::min(num_workers, n_tasks));
    if (num_workers == 1) {
        for (size_t i = 0; i < n_tasks; ++i) {
            fn(i);
        }
        return;
    }

    std::atomic<size_t> next{0};
    std::atomic<bool> failed{false};
    std::exception_ptr first_error;
    std::mutex error_mutex;

    auto worker = [&]() {
        while (!failed.load()) {
            size_t i = next.fetch_add(1);
            if (i >= n_tasks) {
                return;
            }
            try {
                fn(i);
            } catch (...) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error) {
                    first_error = std::current_exception();
                }
                failed.store(true);
            }
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(num_workers);
    for (size_t w = 0; w < num_workers; ++w) {
        threads.emplace_back(worker);
    }
    for (auto& t : threads) {
        t.join();
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

}  // namespace core
}  // namespace fomc_ngin
