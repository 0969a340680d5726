#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "../../src/core/errors/errors.hpp"
#include "../../src/core/logger/logger.hpp"

using namespace Trawl::Core;

TEST(LoggerTest, SetLevel) {
    Logger::set_level(LOG_NONE);
    EXPECT_EQ(Logger::level(), LOG_NONE);
    Logger::info("Test info message - hidden");
    Logger::set_level(LOG_DEFAULT);
    EXPECT_EQ(Logger::level(), LOG_DEFAULT);
}

TEST(LoggerTest, LevelFiltering) {
    Logger::set_level(LOG_ERROR);
    Logger::info("This should not be printed");
    Logger::error("This should be printed");
    Logger::set_level(LOG_DEFAULT);
}

TEST(LoggerTest, ParseLevel) {
    EXPECT_EQ(Logger::parse_level("debug"), LOG_ALL);
    EXPECT_EQ(Logger::parse_level("ALL"), LOG_ALL);
    EXPECT_EQ(Logger::parse_level("info"), LOG_DEFAULT);
    EXPECT_EQ(Logger::parse_level(" warn "), LOG_WARN | LOG_ERROR);
    EXPECT_EQ(Logger::parse_level("error"), LOG_ERROR);
    EXPECT_EQ(Logger::parse_level("quiet"), LOG_NONE);
    EXPECT_EQ(Logger::parse_level("none"), LOG_NONE);
    EXPECT_THROW(Logger::parse_level("verbose"), ConfigurationError);
}

TEST(LoggerTest, DefaultHidesDebug) {
    EXPECT_EQ(LOG_DEFAULT & LOG_DEBUG, 0);
    EXPECT_NE(LOG_ALL & LOG_DEBUG, 0);
}

TEST(LoggerTest, StressTest) {
    Logger::set_level(LOG_NONE);
    std::vector<std::thread> threads;
    for (int i = 0; i < 50; ++i) {
        threads.emplace_back([]() {
            for (int j = 0; j < 100; ++j) {
                Logger::info("Logging from thread "
                             + std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id())));
                Logger::warn("warn");
            }
        });
    }
    for (auto& t : threads)
        t.join();
    Logger::set_level(LOG_DEFAULT);
}

TEST(LoggerTest, LargeMessage) {
    std::string large(1024 * 1024, 'A');
    Logger::info("Large message test: " + large.substr(0, 10) + "... [size: "
                 + std::to_string(large.size()) + "]");
}
