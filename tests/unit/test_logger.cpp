#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "../../src/core/logger/logger.hpp"

using namespace Burrow::Core;

class LoggerTest : public ::testing::Test {
protected:
    void TearDown() override {
        Logger::set_level(LOG_DEFAULT);
    }
};

TEST_F(LoggerTest, LevelFiltering) {
    Logger::set_level(LOG_ERROR);
    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    Logger::info("hidden info");
    Logger::error("visible error");
    std::string out = testing::internal::GetCapturedStdout();
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(out.find("hidden info"), std::string::npos);
    EXPECT_NE(err.find("visible error"), std::string::npos);
}

TEST_F(LoggerTest, QuietKeepsFindings) {
    Logger::set_level(LOG_WARN | LOG_ERROR | LOG_SUCCESS);
    testing::internal::CaptureStdout();
    Logger::info("progress");
    Logger::success("200 GET http://host/admin");
    std::string out = testing::internal::GetCapturedStdout();

    EXPECT_EQ(out.find("progress"), std::string::npos);
    EXPECT_NE(out.find("[FOUND]"), std::string::npos);
}

TEST_F(LoggerTest, DebugOnlyWhenVerbose) {
    Logger::set_level(LOG_DEFAULT);
    testing::internal::CaptureStdout();
    Logger::debug("retry 1");
    EXPECT_EQ(testing::internal::GetCapturedStdout().find("retry 1"), std::string::npos);

    Logger::set_level(LOG_ALL);
    testing::internal::CaptureStdout();
    Logger::debug("retry 2");
    EXPECT_NE(testing::internal::GetCapturedStdout().find("retry 2"), std::string::npos);
}

TEST_F(LoggerTest, StressTest) {
    Logger::set_level(LOG_NONE);
    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([]() {
            for (int j = 0; j < 200; ++j)
                Logger::info("Logging from worker");
        });
    }
    for (auto& t : threads)
        t.join();
    EXPECT_EQ(Logger::level(), LOG_NONE);
}
