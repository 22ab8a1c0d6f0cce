#include "logging/logger.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace mup1gw::logging;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override { saved_ = Logger::level(); }
    void TearDown() override { Logger::set_level(saved_); }

    Level saved_ = Level::LVL_INFO;
};

TEST_F(LoggerTest, LevelNamesAreCaseInsensitive) {
    EXPECT_EQ(string_to_level("debug"), Level::LVL_DEBUG);
    EXPECT_EQ(string_to_level("INFO"), Level::LVL_INFO);
    EXPECT_EQ(string_to_level("Warn"), Level::LVL_WARN);
    EXPECT_EQ(string_to_level("error"), Level::LVL_ERROR);
}

TEST_F(LoggerTest, UnknownLevelMapsToNone) {
    EXPECT_EQ(string_to_level("verbose"), Level::LVL_NONE);
    EXPECT_EQ(string_to_level(""), Level::LVL_NONE);
}

TEST_F(LoggerTest, LevelNamesRoundTrip) {
    for (Level level : {Level::LVL_DEBUG, Level::LVL_INFO, Level::LVL_WARN, Level::LVL_ERROR}) {
        EXPECT_EQ(string_to_level(level_to_string(level)), level);
    }
}

TEST_F(LoggerTest, ThresholdFiltersLowerLevels) {
    Logger::set_level(Level::LVL_WARN);

    EXPECT_FALSE(Logger::enabled(Level::LVL_DEBUG));
    EXPECT_FALSE(Logger::enabled(Level::LVL_INFO));
    EXPECT_TRUE(Logger::enabled(Level::LVL_WARN));
    EXPECT_TRUE(Logger::enabled(Level::LVL_ERROR));
}

TEST_F(LoggerTest, NoneSilencesEverything) {
    Logger::set_level(Level::LVL_NONE);

    EXPECT_FALSE(Logger::enabled(Level::LVL_ERROR));
}

TEST_F(LoggerTest, MacroSkipsStreamingWhenDisabled) {
    Logger::set_level(Level::LVL_ERROR);

    int evaluations = 0;
    auto count = [&evaluations]() {
        ++evaluations;
        return "x";
    };
    LOG_DEBUG("value " << count());
    EXPECT_EQ(evaluations, 0);
}
