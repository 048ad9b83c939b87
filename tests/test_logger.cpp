/**
 * @file test_logger.cpp
 * @brief Logger file output, level filtering and thread safety
 *
 * Tests:
 * 1. Timestamped log file creation
 * 2. Level filtering and message format
 * 3. Concurrent logging from multiple threads
 * 4. Log level name parsing
 */

#include <gtest/gtest.h>
#include <handctl/core/Logger.hpp>
#include <chrono>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace handctl::core;

namespace {

std::string read_file(const std::string& path) {
    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

int count_occurrences(const std::string& text, const std::string& needle) {
    int count = 0;
    for (std::size_t pos = text.find(needle); pos != std::string::npos;
         pos = text.find(needle, pos + needle.size())) {
        count++;
    }
    return count;
}

} // namespace

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& logger = Logger::getInstance();
        ASSERT_TRUE(logger.initializeWithTimestamp("/tmp/handctl_test_logs", LogLevel::DEBUG));
        logger.setConsoleOutput(false);
        logFile = logger.getCurrentLogFile();
    }

    void TearDown() override {
        auto& logger = Logger::getInstance();
        logger.closeLogFile();
        logger.setConsoleOutput(true);
        logger.setLevel(LogLevel::INFO);
    }

    std::string logFile;
};

TEST_F(LoggerTest, CreatesTimestampedFile) {
    EXPECT_FALSE(logFile.empty());
    EXPECT_NE(logFile.find("/tmp/handctl_test_logs/handctl_"), std::string::npos);
    EXPECT_TRUE(std::ifstream(logFile).good());
}

TEST_F(LoggerTest, FiltersByLevel) {
    auto& logger = Logger::getInstance();
    logger.setLevel(LogLevel::WARNING);

    EXPECT_FALSE(logger.isEnabled(LogLevel::INFO));
    EXPECT_TRUE(logger.isEnabled(LogLevel::ERROR));

    LOG_INFO("filtered-info-message");
    LOG_WARNING("kept-warning-message");
    HANDCTL_LOG_ERROR("pipeline") << "kept-error " << 42;
    logger.flush();

    std::string content = read_file(logFile);
    EXPECT_EQ(content.find("filtered-info-message"), std::string::npos);
    EXPECT_NE(content.find("[WARNING] kept-warning-message"), std::string::npos);
    EXPECT_NE(content.find("test_logger.cpp:"), std::string::npos);
    EXPECT_NE(content.find("[ERROR] [pipeline] kept-error 42"), std::string::npos);
}

TEST_F(LoggerTest, ConcurrentLogging) {
    constexpr int NUM_THREADS = 8;
    constexpr int MESSAGES_PER_THREAD = 50;

    // Runs within the same second share a log file
    const std::string marker = "concurrent-" +
        std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());

    std::vector<std::thread> threads;
    threads.reserve(NUM_THREADS);
    for (int i = 0; i < NUM_THREADS; ++i) {
        threads.emplace_back([i, &marker]() {
            for (int j = 0; j < MESSAGES_PER_THREAD; ++j) {
                LOG_DEBUG(marker + " thread " + std::to_string(i) + " msg " + std::to_string(j));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    Logger::getInstance().flush();

    std::string content = read_file(logFile);
    EXPECT_EQ(count_occurrences(content, marker + " "), NUM_THREADS * MESSAGES_PER_THREAD);
}

TEST(LogLevelTest, ParseNames) {
    LogLevel level = LogLevel::INFO;

    ASSERT_TRUE(parseLogLevel("debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    ASSERT_TRUE(parseLogLevel("WARNING", level));
    EXPECT_EQ(level, LogLevel::WARNING);
    ASSERT_TRUE(parseLogLevel("Critical", level));
    EXPECT_EQ(level, LogLevel::CRITICAL);

    EXPECT_FALSE(parseLogLevel("verbose", level));
    EXPECT_EQ(level, LogLevel::CRITICAL);

    EXPECT_EQ(Logger::levelToString(LogLevel::TRACE), "TRACE");
}
