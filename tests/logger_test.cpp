// SPDX-License-Identifier: MIT

// tests/logger_test.cpp
#include <gtest/gtest.h>

#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

#include "stream_pump/stream/logger.hpp"

using namespace stream_pump;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_level_ = Logger::Instance().Level();
        Logger::Instance().SetOutput([this](LogLevel level, std::string_view msg) {
            lines_.emplace_back(level, std::string(msg));
        });
    }

    void TearDown() override {
        Logger::Instance().SetOutput(nullptr);
        Logger::Instance().SetLevel(saved_level_);
        unsetenv("STREAM_PUMP_LOG_LEVEL");
    }

    LogLevel saved_level_ = LogLevel::Warn;
    std::vector<std::pair<LogLevel, std::string>> lines_;
};

TEST_F(LoggerTest, FormatsWithFmt) {
    auto& log = Logger::Instance();
    log.SetLevel(LogLevel::Debug);
    log.Info("copied {} bytes in {} chunks", 150000, 3);

    ASSERT_EQ(lines_.size(), 1u);
    EXPECT_EQ(lines_[0].first, LogLevel::Info);
    EXPECT_EQ(lines_[0].second, "copied 150000 bytes in 3 chunks");
}

TEST_F(LoggerTest, MessagesBelowLevelAreDropped) {
    auto& log = Logger::Instance();
    log.SetLevel(LogLevel::Warn);

    log.Debug("debug {}", 1);
    log.Info("info {}", 2);
    log.Warn("warn {}", 3);
    log.Error("error {}", 4);

    ASSERT_EQ(lines_.size(), 2u);
    EXPECT_EQ(lines_[0].second, "warn 3");
    EXPECT_EQ(lines_[1].first, LogLevel::Error);
}

TEST_F(LoggerTest, OffDisablesEverything) {
    auto& log = Logger::Instance();
    log.SetLevel(LogLevel::Off);
    log.Log(LogLevel::Error, "nothing");
    EXPECT_TRUE(lines_.empty());
    EXPECT_FALSE(log.Enabled(LogLevel::Off));
}

TEST_F(LoggerTest, InitFromEnvironment) {
    setenv("STREAM_PUMP_LOG_LEVEL", "DEBUG", 1);
    ASSERT_TRUE(Logger::Instance().InitFromEnvironment().has_value());
    EXPECT_EQ(Logger::Instance().Level(), LogLevel::Debug);
}

TEST_F(LoggerTest, InitFromEnvironmentRejectsUnknownLevel) {
    Logger::Instance().SetLevel(LogLevel::Info);
    setenv("STREAM_PUMP_LOG_LEVEL", "loud", 1);

    auto result = Logger::Instance().InitFromEnvironment();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConfigurationError);
    EXPECT_EQ(Logger::Instance().Level(), LogLevel::Info);
}

TEST(ParseLogLevelTest, AcceptsNamesCaseInsensitively) {
    EXPECT_EQ(ParseLogLevel("debug").value(), LogLevel::Debug);
    EXPECT_EQ(ParseLogLevel("Info").value(), LogLevel::Info);
    EXPECT_EQ(ParseLogLevel("WARNING").value(), LogLevel::Warn);
    EXPECT_EQ(ParseLogLevel("error").value(), LogLevel::Error);
    EXPECT_EQ(ParseLogLevel("none").value(), LogLevel::Off);
    EXPECT_FALSE(ParseLogLevel("").has_value());
}

TEST(ParseLogLevelTest, LevelNames) {
    EXPECT_EQ(to_string(LogLevel::Warn), "WARN");
    EXPECT_EQ(to_string(LogLevel::Off), "OFF");
}
