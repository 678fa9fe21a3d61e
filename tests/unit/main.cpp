#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "logging/logger.hpp"

int main(int argc, char **argv) {
    // Explicitly initialize GoogleTest so --gtest_list_tests and filters work
    // reliably during CTest discovery.
    ::testing::InitGoogleTest(&argc, argv);
    ::testing::InitGoogleMock(&argc, argv);

    // Keep request traces out of test output
    timestamp::logging::Logger::set_level(timestamp::logging::Level::LVL_WARN);
    return RUN_ALL_TESTS();
}
