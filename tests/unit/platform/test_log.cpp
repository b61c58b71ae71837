/**
 * @file test_log.cpp
 * @brief Unit tests for Platform/Log.h
 */

#include <QiTraffic/Platform/Log.h>
#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

using namespace Qi::Traffic::Platform;

class LogTest : public ::testing::Test {
protected:
    void SetUp() override {
        savedLevel_ = GetLogLevel();
        SetLogSink([this](LogLevel level, const std::string& message) {
            messages.emplace_back(level, message);
        });
    }

    void TearDown() override {
        SetLogSink(LogSink());
        SetLogLevel(savedLevel_);
    }

    std::vector<std::pair<LogLevel, std::string>> messages;

private:
    LogLevel savedLevel_ = LogLevel::Info;
};

TEST_F(LogTest, FormatsMessage) {
    SetLogLevel(LogLevel::Debug);

    LogInfo("%zu tracks in %s", static_cast<size_t>(3), "north");

    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].first, LogLevel::Info);
    EXPECT_EQ(messages[0].second, "3 tracks in north");
}

TEST_F(LogTest, FiltersBelowLevel) {
    SetLogLevel(LogLevel::Warning);

    LogDebug("debug");
    LogInfo("info");
    LogWarning("warning");
    LogError("error");

    ASSERT_EQ(messages.size(), 2u);
    EXPECT_EQ(messages[0].first, LogLevel::Warning);
    EXPECT_EQ(messages[1].first, LogLevel::Error);
}

TEST_F(LogTest, OffSuppressesEverything) {
    SetLogLevel(LogLevel::Off);

    LogError("error");
    Log(LogLevel::Error, "%d", 1);

    EXPECT_TRUE(messages.empty());
    EXPECT_FALSE(IsLogEnabled(LogLevel::Error));
}

TEST_F(LogTest, IsLogEnabled) {
    SetLogLevel(LogLevel::Info);

    EXPECT_FALSE(IsLogEnabled(LogLevel::Debug));
    EXPECT_TRUE(IsLogEnabled(LogLevel::Info));
    EXPECT_TRUE(IsLogEnabled(LogLevel::Error));
}

TEST_F(LogTest, LevelNames) {
    EXPECT_STREQ(LogLevelName(LogLevel::Debug), "DEBUG");
    EXPECT_STREQ(LogLevelName(LogLevel::Info), "INFO");
    EXPECT_STREQ(LogLevelName(LogLevel::Warning), "WARNING");
    EXPECT_STREQ(LogLevelName(LogLevel::Error), "ERROR");
}
