/**
 * logger_test.cpp - Stream-style logging macros
 *
 * Tests:
 * - Each LOG_* macro records its message at its own level
 * - Threshold filtering, including skipping message construction
 * - Level name parsing
 */

#include "logging/logger.hpp"

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

using agentgate::logging::Level;
using agentgate::logging::Logger;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_level_ = Logger::level();
        Logger::set_sink([this](Level level, const std::string &message) { records_.emplace_back(level, message); });
    }

    void TearDown() override {
        Logger::reset_sink();
        Logger::set_level(saved_level_);
    }

    Level saved_level_ = Level::LVL_INFO;
    std::vector<std::pair<Level, std::string>> records_;
};

TEST_F(LoggerTest, MacrosStreamMessageAtTheirLevel) {
    Logger::set_level(Level::LVL_DEBUG);
    int pid = 4242;

    LOG_DEBUG("[Agent] spawned pid=" << pid);
    LOG_INFO("[HTTP] listening on " << "127.0.0.1:" << 8085);
    LOG_WARN("[Protocol] dropped " << 2 << " lines");
    LOG_ERROR("[Runtime] fatal");

    ASSERT_EQ(records_.size(), 4u);
    EXPECT_EQ(records_[0].first, Level::LVL_DEBUG);
    EXPECT_EQ(records_[0].second, "[Agent] spawned pid=4242");
    EXPECT_EQ(records_[1].first, Level::LVL_INFO);
    EXPECT_EQ(records_[1].second, "[HTTP] listening on 127.0.0.1:8085");
    EXPECT_EQ(records_[2].first, Level::LVL_WARN);
    EXPECT_EQ(records_[2].second, "[Protocol] dropped 2 lines");
    EXPECT_EQ(records_[3].first, Level::LVL_ERROR);
}

TEST_F(LoggerTest, ThresholdFiltersLowerLevels) {
    Logger::set_level(Level::LVL_WARN);

    LOG_DEBUG("hidden");
    LOG_INFO("hidden");
    LOG_WARN("shown");

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].second, "shown");
}

TEST_F(LoggerTest, MessageIsNotBuiltBelowThreshold) {
    Logger::set_level(Level::LVL_ERROR);
    int evaluations = 0;
    auto count = [&evaluations]() { return ++evaluations; };

    LOG_INFO("value=" << count());
    EXPECT_EQ(evaluations, 0);

    LOG_ERROR("value=" << count());
    EXPECT_EQ(evaluations, 1);
    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].second, "value=1");
}

TEST(LoggerLevelTest, ParsesLevelNamesCaseInsensitively) {
    EXPECT_EQ(agentgate::logging::string_to_level("debug"), Level::LVL_DEBUG);
    EXPECT_EQ(agentgate::logging::string_to_level("WARN"), Level::LVL_WARN);
    EXPECT_EQ(agentgate::logging::string_to_level("bogus"), Level::LVL_INFO);
    EXPECT_TRUE(agentgate::logging::is_valid_level("Error"));
    EXPECT_FALSE(agentgate::logging::is_valid_level("trace"));
}
