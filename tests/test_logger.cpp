/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger
 */

#include <gtest/gtest.h>
#include "chimera/logger.h"

#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace chimera {
namespace testing {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_dir_ = "/tmp/chimera_logger_test_" + std::to_string(getpid()) + "/nested";
        std::filesystem::remove_all(std::filesystem::path(log_dir_).parent_path());
    }

    void TearDown() override {
        std::filesystem::remove_all(std::filesystem::path(log_dir_).parent_path());
    }

    std::vector<std::string> readLines() const {
        std::ifstream file(log_dir_ + "/server.log");
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(file, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    std::string log_dir_;
};

TEST_F(LoggerTest, WritesFormattedLines) {
    Logger logger(log_dir_);
    logger.info("Server started");

    EXPECT_EQ(logger.logFilePath(), log_dir_ + "/server.log");

    auto lines = readLines();
    ASSERT_EQ(lines.size(), 1u);
    std::regex pattern(R"(\[\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{3}\] \[INFO\] Server started)");
    EXPECT_TRUE(std::regex_match(lines[0], pattern)) << lines[0];
}

TEST_F(LoggerTest, DropsMessagesBelowMinLevel) {
    Logger logger(log_dir_, LogLevel::WARN);
    logger.debug("noise");
    logger.info("more noise");
    logger.warn("disk almost full");
    logger.error("disk full");

    auto lines = readLines();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[0].find("[WARN] disk almost full"), std::string::npos);
    EXPECT_NE(lines[1].find("[ERROR] disk full"), std::string::npos);

    logger.setMinLevel(LogLevel::DEBUG);
    logger.debug("now visible");
    EXPECT_EQ(readLines().size(), 3u);
}

TEST_F(LoggerTest, DisabledLoggerWritesNothing) {
    Logger logger;
    EXPECT_FALSE(logger.enabled());
    EXPECT_TRUE(logger.logFilePath().empty());
    logger.error("dropped");

    EXPECT_FALSE(Logger::null()->enabled());
    EXPECT_EQ(Logger::null(), Logger::null());
}

TEST_F(LoggerTest, ConcurrentWritersKeepLinesIntact) {
    Logger logger(log_dir_);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&logger, t] {
            for (int i = 0; i < 50; ++i) {
                logger.info("writer " + std::to_string(t) + " line " + std::to_string(i));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    auto lines = readLines();
    ASSERT_EQ(lines.size(), 200u);
    for (const auto& line : lines) {
        EXPECT_NE(line.find("] [INFO] writer "), std::string::npos) << line;
    }
}

TEST(LogLevelTest, ParsesNamesCaseInsensitively) {
    EXPECT_EQ(logLevelFromString("debug"), LogLevel::DEBUG);
    EXPECT_EQ(logLevelFromString("INFO"), LogLevel::INFO);
    EXPECT_EQ(logLevelFromString("Warning"), LogLevel::WARN);
    EXPECT_EQ(logLevelToString(LogLevel::ERROR), "ERROR");
    EXPECT_THROW(logLevelFromString("verbose"), std::invalid_argument);
}

} // namespace testing
} // namespace chimera
