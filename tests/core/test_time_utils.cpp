#include <gtest/gtest.h>
#include <atomic>
#include <ctime>
#include <regex>
#include <thread>
#include <vector>
#include "fomc_ngin/core/time_utils.hpp"

using namespace fomc_ngin::core;

class TimeUtilsTest : public ::testing::Test {};

TEST_F(TimeUtilsTest, SafeGmtimeEpochTime) {
    std::time_t epoch = 0;
    std::tm result;

    std::tm* ret = safe_gmtime(&epoch, &result);

    ASSERT_NE(ret, nullptr);
    EXPECT_EQ(ret, &result);
    EXPECT_EQ(result.tm_year, 70);
    EXPECT_EQ(result.tm_mon, 0);
    EXPECT_EQ(result.tm_mday, 1);
    EXPECT_EQ(result.tm_hour, 0);
    EXPECT_EQ(result.tm_min, 0);
    EXPECT_EQ(result.tm_sec, 0);
}

TEST_F(TimeUtilsTest, SafeLocaltimeValidInput) {
    std::time_t now = std::time(nullptr);
    std::tm result;

    std::tm* ret = safe_localtime(&now, &result);

    ASSERT_NE(ret, nullptr);
    EXPECT_EQ(ret, &result);
    EXPECT_GE(result.tm_year, 100);
    EXPECT_GE(result.tm_mon, 0);
    EXPECT_LE(result.tm_mon, 11);
}

TEST_F(TimeUtilsTest, GetFormattedTimeBasic) {
    std::string time_str = get_formatted_time("%Y-%m-%d %H:%M:%S");

    std::regex pattern(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2})");
    EXPECT_TRUE(std::regex_match(time_str, pattern));

    std::string session = get_formatted_time("%Y%m%d_%H%M%S", false);
    EXPECT_TRUE(std::regex_match(session, std::regex(R"(\d{8}_\d{6})")));
}

TEST_F(TimeUtilsTest, FormatUtcIso) {
    EXPECT_EQ(format_utc(0), "1970-01-01T00:00:00Z");
    // 2023-11-01 14:30 New York (EDT)
    EXPECT_EQ(format_utc(1698863400), "2023-11-01T18:30:00Z");
    // 2024-01-31 14:30 New York (EST)
    EXPECT_EQ(format_utc(1706729400), "2024-01-31T19:30:00Z");
}

TEST_F(TimeUtilsTest, FormatUtcThreadSafety) {
    const int num_threads = 8;
    const int iterations = 200;
    std::vector<std::thread> threads;
    std::atomic<int> success_count{0};

    for (int i = 0; i < num_threads; ++i) {
        threads.emplace_back([&success_count, iterations, i]() {
            for (int j = 0; j < iterations; ++j) {
                std::int64_t secs = 1698863400 + static_cast<std::int64_t>(i) * 86400;
                if (format_utc(secs).substr(11) == "18:30:00Z") {
                    success_count++;
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(success_count.load(), num_threads * iterations);
}
