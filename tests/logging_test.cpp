#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "trend_engine/common/logging.h"

using trend_engine::common::Logger;
using trend_engine::common::LogLevel;

namespace {

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = std::filesystem::temp_directory_path() /
                ("trend_engine_log_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) + ".log");
        std::filesystem::remove(path_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    std::vector<std::string> readLines() const {
        std::vector<std::string> lines;
        std::ifstream in(path_);
        std::string line;
        while (std::getline(in, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    std::filesystem::path path_;
};

} // namespace

TEST_F(LoggingTest, ConcurrentWritersLoseNothing) {
    constexpr int kThreads = 4;
    constexpr int kPerThread = 250;

    {
        Logger logger("concurrent", LogLevel::DEBUG);
        logger.open(path_.string(), 1);

        std::vector<std::thread> writers;
        for (int t = 0; t < kThreads; ++t) {
            writers.emplace_back([&logger, t]() {
                for (int i = 0; i < kPerThread; ++i) {
                    logger.log(LogLevel::INFO, "writer " + std::to_string(t) + " entry " + std::to_string(i));
                }
            });
        }
        for (auto& writer : writers) {
            writer.join();
        }
        logger.flush();
    }

    auto lines = readLines();
    ASSERT_EQ(lines.size(), static_cast<size_t>(kThreads * kPerThread));
    for (const auto& line : lines) {
        EXPECT_NE(line.find("[INFO] [concurrent]"), std::string::npos) << line;
    }
}

TEST_F(LoggingTest, EntriesBelowLevelAreDropped) {
    {
        Logger logger("levels", LogLevel::WARNING);
        logger.open(path_.string(), 1000);

        logger.log(LogLevel::INFO, "quiet");
        logger.log(LogLevel::ERROR, "loud");
        logger.flush();
    }

    auto lines = readLines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("[ERROR] [levels]"), std::string::npos);
    EXPECT_NE(lines[0].find("loud"), std::string::npos);
}

TEST(LogLevelTest, StringConversion) {
    EXPECT_EQ(Logger::stringToLogLevel("ERROR"), LogLevel::ERROR);
    EXPECT_EQ(Logger::stringToLogLevel("bogus"), LogLevel::INFO);
    EXPECT_STREQ(Logger::logLevelToString(LogLevel::CRITICAL), "CRITICAL");
}
