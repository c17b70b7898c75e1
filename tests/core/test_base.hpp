//===== test_base.hpp =====
#pragma once

#ifndef TESTING
#define TESTING
#endif

#include <gtest/gtest.h>
#include "fomc_ngin/core/logger.hpp"

namespace fomc_ngin {
namespace testing {

class TestBase : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::reset_for_tests();
        LoggerConfig config;
        config.destination = LogDestination::CONSOLE;
        config.min_level = LogLevel::ERR;
        Logger::instance().initialize(config);
    }

    void TearDown() override {
        Logger::reset_for_tests();
    }
};

}  // namespace testing
}  // namespace fomc_ngin
