#include <gtest/gtest.h>
#include <atomic>
#include <stdexcept>
#include <vector>
#include "fomc_ngin/core/parallel.hpp"

using namespace fomc_ngin::core;

class ParallelTest : public ::testing::Test {};

TEST_F(ParallelTest, VisitsEveryIndexOnce) {
    const size_t n = 500;
    std::vector<std::atomic<int>> visits(n);
    for (auto& v : visits) {
        v.store(0);
    }

    parallel_for_each(n, 4, [&](size_t i) { visits[i].fetch_add(1); });

    for (size_t i = 0; i < n; ++i) {
        EXPECT_EQ(visits[i].load(), 1) << "index " << i;
    }
}

TEST_F(ParallelTest, SingleWorkerRunsInOrder) {
    std::vector<size_t> order;
    parallel_for_each(5, 1, [&](size_t i) { order.push_back(i); });
    EXPECT_EQ(order, (std::vector<size_t>{0, 1, 2, 3, 4}));
}

TEST_F(ParallelTest, ZeroTasksIsNoop) {
    bool called = false;
    parallel_for_each(0, 8, [&](size_t) { called = true; });
    EXPECT_FALSE(called);
}

TEST_F(ParallelTest, ExceptionRethrownAfterJoin) {
    std::atomic<int> completed{0};
    EXPECT_THROW(parallel_for_each(100, 4,
                                   [&](size_t i) {
                                       if (i == 17) {
                                           throw std::runtime_error("task failed");
                                       }
                                       completed.fetch_add(1);
                                   }),
                 std::runtime_error);
    EXPECT_LT(completed.load(), 100);
}
