#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "logging/logger.hpp"

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    ::testing::InitGoogleMock(&argc, argv);

    // Gateway and runner log every invocation; keep test output to failures
    mup1gw::logging::Logger::set_level(mup1gw::logging::Level::LVL_ERROR);

    return RUN_ALL_TESTS();
}
