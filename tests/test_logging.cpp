#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/Logging.h"
#include <thread>
#include <vector>

namespace conn_tracker {

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::Info);
    }
    void TearDown() override {
        Logger::instance().set_level(LogLevel::Info);
    }
};

TEST_F(LoggingTest, SingletonInstance) {
    EXPECT_EQ(&Logger::instance(), &Logger::instance());
}

TEST_F(LoggingTest, SetLogLevel) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::Debug);
    EXPECT_EQ(logger.level(), LogLevel::Debug);
    logger.set_level(LogLevel::Error);
    EXPECT_EQ(logger.level(), LogLevel::Error);
}

TEST_F(LoggingTest, LogLevelEnumValues) {
    EXPECT_EQ(static_cast<int>(LogLevel::Error), 0);
    EXPECT_EQ(static_cast<int>(LogLevel::Warn), 1);
    EXPECT_EQ(static_cast<int>(LogLevel::Info), 2);
    EXPECT_EQ(static_cast<int>(LogLevel::Debug), 3);
    EXPECT_EQ(static_cast<int>(LogLevel::Trace), 4);
}

TEST_F(LoggingTest, EnabledFollowsLevel) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::Warn);
    EXPECT_TRUE(logger.enabled(LogLevel::Error));
    EXPECT_TRUE(logger.enabled(LogLevel::Warn));
    EXPECT_FALSE(logger.enabled(LogLevel::Info));
    EXPECT_FALSE(logger.enabled(LogLevel::Trace));
}

TEST_F(LoggingTest, WritesPrefixedLinesToStderr) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::Debug);
    ::testing::internal::CaptureStderr();
    logger.warn("tcp6 table unreadable");
    logger.debug("4 rows matched");
    logger.trace("dropped");
    std::string out = ::testing::internal::GetCapturedStderr();
    EXPECT_EQ(out, "[WARN] tcp6 table unreadable\n[DEBUG] 4 rows matched\n");
}

TEST_F(LoggingTest, FilteredMessagesProduceNothing) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::Error);
    ::testing::internal::CaptureStderr();
    logger.info("quiet");
    logger.warn("quiet");
    std::string out = ::testing::internal::GetCapturedStderr();
    EXPECT_TRUE(out.empty());
}

TEST_F(LoggingTest, ParseLogLevel) {
    LogLevel lvl = LogLevel::Info;
    EXPECT_TRUE(parse_log_level("error", lvl));
    EXPECT_EQ(lvl, LogLevel::Error);
    EXPECT_TRUE(parse_log_level("Warning", lvl));
    EXPECT_EQ(lvl, LogLevel::Warn);
    EXPECT_TRUE(parse_log_level("TRACE", lvl));
    EXPECT_EQ(lvl, LogLevel::Trace);
    EXPECT_FALSE(parse_log_level("verbose", lvl));
    EXPECT_EQ(lvl, LogLevel::Trace);
}

TEST_F(LoggingTest, ThreadSafety) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::Error);
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&logger, i]() {
            for (int j = 0; j < 100; ++j) {
                logger.info("thread " + std::to_string(i) + " log " + std::to_string(j));
            }
        });
    }
    for (auto& t : threads) t.join();
    SUCCEED();
}

} // namespace conn_tracker
