#include <gtest/gtest.h>
#include "logger.h"
#include "fs.h"
#include <string>
#include <thread>
#include <vector>

using namespace skyshare;

class LoggerTest : public ::testing::Test {
protected:
    const std::string log_file = "test_skyshare.log";

    void SetUp() override {
        Logger& logger = Logger::getInstance();
        saved_level_ = logger.get_log_level();
        logger.set_console_logging_enabled(false);
        delete_file(log_file);
    }

    void TearDown() override {
        Logger& logger = Logger::getInstance();
        logger.close_log_file();
        logger.set_log_level(saved_level_);
        logger.set_console_logging_enabled(true);
        delete_file(log_file);
    }

    LogLevel saved_level_;
};

TEST_F(LoggerTest, ParseLogLevel) {
    LogLevel level;
    ASSERT_TRUE(parse_log_level("debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    ASSERT_TRUE(parse_log_level("INFO", level));
    EXPECT_EQ(level, LogLevel::INFO);
    ASSERT_TRUE(parse_log_level("Warning", level));
    EXPECT_EQ(level, LogLevel::WARN);
    ASSERT_TRUE(parse_log_level("error", level));
    EXPECT_EQ(level, LogLevel::ERROR);

    level = LogLevel::INFO;
    EXPECT_FALSE(parse_log_level("verbose", level));
    EXPECT_FALSE(parse_log_level("", level));
    EXPECT_EQ(level, LogLevel::INFO);
}

TEST_F(LoggerTest, WritesModuleAndLevelToFile) {
    Logger& logger = Logger::getInstance();
    ASSERT_TRUE(logger.set_log_file(log_file));
    EXPECT_EQ(logger.get_log_file_path(), log_file);
    logger.set_log_level(LogLevel::DEBUG);

    LOG_INFO("network", "alice connected on port " << 25071);
    logger.close_log_file();
    EXPECT_TRUE(logger.get_log_file_path().empty());

    std::string content = read_file_text_cpp(log_file);
    EXPECT_NE(content.find("[INFO ]"), std::string::npos);
    EXPECT_NE(content.find("[network]"), std::string::npos);
    EXPECT_NE(content.find("alice connected on port 25071"), std::string::npos);
    // Files never carry color codes
    EXPECT_EQ(content.find("\033["), std::string::npos);
}

TEST_F(LoggerTest, FiltersBelowMinimumLevel) {
    Logger& logger = Logger::getInstance();
    ASSERT_TRUE(logger.set_log_file(log_file));
    logger.set_log_level(LogLevel::WARN);

    LOG_DEBUG("test", "hidden debug");
    LOG_INFO("test", "hidden info");
    LOG_WARN("test", "visible warning");
    LOG_ERROR("test", "visible error");
    logger.close_log_file();

    std::string content = read_file_text_cpp(log_file);
    EXPECT_EQ(content.find("hidden"), std::string::npos);
    EXPECT_NE(content.find("visible warning"), std::string::npos);
    EXPECT_NE(content.find("visible error"), std::string::npos);
}

TEST_F(LoggerTest, ReopeningTruncates) {
    Logger& logger = Logger::getInstance();
    logger.set_log_level(LogLevel::INFO);

    ASSERT_TRUE(logger.set_log_file(log_file));
    LOG_INFO("test", "first run");
    ASSERT_TRUE(logger.set_log_file(log_file));
    LOG_INFO("test", "second run");
    logger.close_log_file();

    std::string content = read_file_text_cpp(log_file);
    EXPECT_EQ(content.find("first run"), std::string::npos);
    EXPECT_NE(content.find("second run"), std::string::npos);
}

TEST_F(LoggerTest, UnwritablePathFails) {
    Logger& logger = Logger::getInstance();
    EXPECT_FALSE(logger.set_log_file("no_such_directory/skyshare.log"));
    EXPECT_TRUE(logger.get_log_file_path().empty());
}

TEST_F(LoggerTest, ConcurrentLoggingKeepsLinesWhole) {
    Logger& logger = Logger::getInstance();
    ASSERT_TRUE(logger.set_log_file(log_file));
    logger.set_timestamps_enabled(false);
    logger.set_colors_enabled(false);
    logger.set_log_level(LogLevel::INFO);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([t]() {
            for (int i = 0; i < 50; ++i) {
                LOG_INFO("worker", "thread " << t << " line " << i);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    logger.close_log_file();
    logger.set_timestamps_enabled(true);
    logger.set_colors_enabled(true);

    std::string content = read_file_text_cpp(log_file);
    size_t lines = 0;
    size_t pos = 0;
    while ((pos = content.find('\n', pos)) != std::string::npos) {
        lines++;
        pos++;
    }
    EXPECT_EQ(lines, 200u);
    EXPECT_NE(content.find("[INFO ] [worker] thread 3 line 49\n"), std::string::npos);
}
