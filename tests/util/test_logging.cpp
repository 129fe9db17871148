// SEMAPHORE - Logging Tests
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License

#include <gtest/gtest.h>

#include "semaphore/util/logging.h"

#include <memory>
#include <string>
#include <vector>

namespace semaphore {
namespace util {
namespace {

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        previousLevel_ = Logger::Instance().GetLevel();
        Logger::Instance().ClearCategoryLevels();
        sink_ = std::make_shared<CallbackSink>(
            [this](const LogRecord& record) { records_.push_back(record); });
        Logger::Instance().AddSink(sink_);
    }

    void TearDown() override {
        Logger::Instance().RemoveSink(sink_);
        Logger::Instance().SetStderrOutput(false);
        Logger::Instance().ClearCategoryLevels();
        Logger::Instance().SetLevel(previousLevel_);
    }

    std::vector<LogRecord> records_;
    std::shared_ptr<CallbackSink> sink_;
    LogLevel previousLevel_{LogLevel::Info};
};

TEST(LogLevelTest, Names) {
    EXPECT_STREQ(LogLevelName(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(LogLevelName(LogLevel::Warn), "WARN");
    EXPECT_STREQ(LogLevelName(LogLevel::Off), "OFF");
}

TEST(LogLevelTest, Parse) {
    EXPECT_EQ(ParseLogLevel("trace"), LogLevel::Trace);
    EXPECT_EQ(ParseLogLevel("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(ParseLogLevel("Info"), LogLevel::Info);
    EXPECT_EQ(ParseLogLevel("warning"), LogLevel::Warn);
    EXPECT_EQ(ParseLogLevel("error"), LogLevel::Error);
    EXPECT_EQ(ParseLogLevel("none"), LogLevel::Off);

    EXPECT_FALSE(ParseLogLevel("verbose").has_value());
    EXPECT_FALSE(ParseLogLevel("").has_value());
}

TEST(LogCategoryTest, NamesRoundTrip) {
    for (size_t i = 0; i < NUM_LOG_CATEGORIES; ++i) {
        auto category = static_cast<LogCategory>(i);
        EXPECT_EQ(ParseLogCategory(LogCategoryName(category)), category);
    }
    EXPECT_STREQ(LogCategoryName(LogCategory::Proof), "proof");
    EXPECT_FALSE(ParseLogCategory("Proof").has_value());
    EXPECT_FALSE(ParseLogCategory("network").has_value());
}

TEST_F(LoggingTest, Singleton) {
    EXPECT_EQ(&Logger::Instance(), &Logger::Instance());
}

TEST_F(LoggingTest, GlobalThreshold) {
    auto& logger = Logger::Instance();
    logger.SetLevel(LogLevel::Info);

    EXPECT_FALSE(logger.Enabled(LogLevel::Debug, LogCategory::Group));
    EXPECT_TRUE(logger.Enabled(LogLevel::Info, LogCategory::Group));
    EXPECT_TRUE(logger.Enabled(LogLevel::Error, LogCategory::Group));
    EXPECT_FALSE(logger.Enabled(LogLevel::Off, LogCategory::Group));

    logger.SetLevel(LogLevel::Off);
    EXPECT_FALSE(logger.Enabled(LogLevel::Error, LogCategory::Group));
}

TEST_F(LoggingTest, CategoryThresholdOverridesGlobal) {
    auto& logger = Logger::Instance();
    logger.SetLevel(LogLevel::Warn);
    logger.SetLevel(LogCategory::Proof, LogLevel::Debug);
    logger.SetLevel(LogCategory::Group, LogLevel::Off);

    EXPECT_TRUE(logger.Enabled(LogLevel::Debug, LogCategory::Proof));
    EXPECT_FALSE(logger.Enabled(LogLevel::Info, LogCategory::Identity));
    EXPECT_FALSE(logger.Enabled(LogLevel::Error, LogCategory::Group));

    logger.ClearCategoryLevels();
    EXPECT_FALSE(logger.Enabled(LogLevel::Debug, LogCategory::Proof));
    EXPECT_TRUE(logger.Enabled(LogLevel::Error, LogCategory::Group));
}

TEST_F(LoggingTest, StreamMacros) {
    Logger::Instance().SetLevel(LogLevel::Debug);

    LOG_DEBUG(LogCategory::Group) << "size " << 3 << " depth " << 2;
    LOG_TRACE(LogCategory::Group) << "dropped";

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].message, "size 3 depth 2");
    EXPECT_EQ(records_[0].level, LogLevel::Debug);
    EXPECT_EQ(records_[0].category, LogCategory::Group);
    ASSERT_NE(records_[0].file, nullptr);
    EXPECT_NE(std::string(records_[0].file).find("test_logging"), std::string::npos);
    EXPECT_GT(records_[0].line, 0);
}

TEST_F(LoggingTest, DisabledStreamSkipsOperands) {
    Logger::Instance().SetLevel(LogLevel::Error);
    int evaluated = 0;
    auto count = [&evaluated]() { return ++evaluated; };

    LOG_INFO(LogCategory::Config) << count();

    EXPECT_EQ(evaluated, 0);
    EXPECT_TRUE(records_.empty());
}

TEST_F(LoggingTest, RemovedSinkStopsReceiving) {
    auto& logger = Logger::Instance();
    logger.SetLevel(LogLevel::Info);

    logger.Write(LogLevel::Info, LogCategory::Identity, "first");
    logger.RemoveSink(sink_);
    logger.Write(LogLevel::Info, LogCategory::Identity, "second");

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].message, "first");
}

TEST_F(LoggingTest, StderrOutputToggleIsIdempotent) {
    auto& logger = Logger::Instance();
    logger.SetLevel(LogLevel::Error);

    logger.SetStderrOutput(true);
    logger.SetStderrOutput(true);
    logger.SetStderrOutput(false);
    logger.SetStderrOutput(false);

    // Other sinks are untouched by the toggle
    logger.Write(LogLevel::Error, LogCategory::Config, "still delivered");
    ASSERT_EQ(records_.size(), 1u);
}

TEST_F(LoggingTest, StderrFormat) {
    LogRecord record;
    record.level = LogLevel::Warn;
    record.category = LogCategory::Proof;
    record.message = "unsupported depth 40";
    record.timestamp = std::chrono::system_clock::now();

    std::string line = StderrSink::Format(record);

    // YYYY-mm-dd HH:MM:SS.mmm prefix
    ASSERT_GT(line.size(), 24u);
    EXPECT_EQ(line[4], '-');
    EXPECT_EQ(line[10], ' ');
    EXPECT_EQ(line[19], '.');
    EXPECT_EQ(line.substr(23), " [WARN] proof: unsupported depth 40");
}

TEST_F(LoggingTest, ScopedTimerLogsAtDebug) {
    auto& logger = Logger::Instance();
    logger.SetLevel(LogLevel::Info);
    {
        ScopedLogTimer timer(LogCategory::Group, "Tree build");
        EXPECT_GE(timer.ElapsedMillis(), 0);
    }
    EXPECT_TRUE(records_.empty());

    logger.SetLevel(LogCategory::Group, LogLevel::Debug);
    {
        ScopedLogTimer timer(LogCategory::Group, "Tree build");
    }
    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].level, LogLevel::Debug);
    EXPECT_EQ(records_[0].category, LogCategory::Group);
    EXPECT_EQ(records_[0].message.rfind("Tree build took ", 0), 0u);
    EXPECT_NE(records_[0].message.find("ms"), std::string::npos);
}

} // namespace
} // namespace util
} // namespace semaphore
