//===== test_base.hpp =====
#pragma once

#include <gtest/gtest.h>
#include "mktflow/core/logger.hpp"

namespace mktflow {
namespace testing {

class TestBase : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::reset_for_tests();
        LoggerConfig config;
        config.min_level = LogLevel::ERR;
        config.destination = LogDestination::CONSOLE;
        Logger::instance().initialize(config);
    }

    void TearDown() override {
        Logger::reset_for_tests();
    }
};

}  // namespace testing
}  // namespace mktflow
