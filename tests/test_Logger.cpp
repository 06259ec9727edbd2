#include <gtest/gtest.h>
#include "utils/Logger.h"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

TEST(LoggerTest, DropsMessagesBelowLevel) {
    Logger::Options opts;
    opts.minLevel = LogLevel::WARNING;
    Logger logger(opts);

    std::vector<std::pair<LogLevel, std::string>> seen;
    logger.setCallback([&](LogLevel level, const std::string& msg) { seen.emplace_back(level, msg); });

    logger.debug("hidden");
    logger.info("hidden");
    logger.warn("shown");
    logger.error("also shown");

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].first, LogLevel::WARNING);
    EXPECT_EQ(seen[0].second, "shown");
    EXPECT_EQ(seen[1].first, LogLevel::ERROR);

    logger.setLevel(LogLevel::TRACE);
    EXPECT_TRUE(logger.isEnabled(LogLevel::TRACE));
    logger.trace("now visible");
    EXPECT_EQ(seen.size(), 3u);
}

TEST(LoggerTest, NullLoggerIsSilent) {
    auto logger = Logger::null();
    int calls = 0;
    logger->setCallback([&](LogLevel, const std::string&) { calls++; });
    logger->error("nobody hears this");
    EXPECT_EQ(calls, 0);
    EXPECT_FALSE(logger->isEnabled(LogLevel::ERROR));
}

TEST(LoggerTest, ParsesLevelNames) {
    EXPECT_EQ(parseLogLevel("trace"), LogLevel::TRACE);
    EXPECT_EQ(parseLogLevel("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(parseLogLevel("Warn"), LogLevel::WARNING);
    EXPECT_EQ(parseLogLevel("warning"), LogLevel::WARNING);
    EXPECT_EQ(parseLogLevel("error"), LogLevel::ERROR);
    EXPECT_EQ(parseLogLevel("off"), LogLevel::OFF);
    EXPECT_EQ(parseLogLevel("loud"), LogLevel::INFO);
    EXPECT_STREQ(logLevelName(LogLevel::SUCCESS), "SUCCESS");
}

TEST(LoggerTest, NonAsciiLevelNameFallsBackToInfo) {
    EXPECT_EQ(parseLogLevel("调试"), LogLevel::INFO);
    EXPECT_EQ(parseLogLevel("d\xE9bug"), LogLevel::INFO);
}

TEST(LoggerTest, CallbackMayLogAgain) {
    Logger::Options opts;
    opts.minLevel = LogLevel::DEBUG;
    Logger logger(opts);

    std::vector<std::string> seen;
    logger.setCallback([&](LogLevel level, const std::string& msg) {
        seen.push_back(msg);
        if (level == LogLevel::ERROR) {
            logger.debug("echo: " + msg);
        }
    });

    logger.error("first");
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], "first");
    EXPECT_EQ(seen[1], "echo: first");
}

TEST(LoggerTest, WritesToFile) {
    auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path path = fs::temp_directory_path() / fs::path("quark_logger_test_" + std::to_string(now) + ".log");
    {
        Logger::Options opts;
        opts.minLevel = LogLevel::INFO;
        opts.filePath = path.string();
        Logger logger(opts);
        logger.error("boom");
        logger.debug("skipped");
    }

    std::ifstream f(path);
    std::stringstream buffer;
    buffer << f.rdbuf();
    std::string content = buffer.str();
    EXPECT_NE(content.find("[ERROR] boom"), std::string::npos);
    EXPECT_EQ(content.find("skipped"), std::string::npos);
    f.close();
    fs::remove(path);
}
