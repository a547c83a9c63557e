#include <cstdlib>
#include <string>
#include <gtest/gtest.h>
#include <hostkit/logger.hpp>
#include <hostkit/rect.hpp>
#include <vector>

using namespace hostkit;

class LoggerTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        Logger::instance().clear_sinks();
        Logger::instance().add_sink(sinks::memory_sink(entries));
        Logger::instance().set_level(LogLevel::Trace);
    }

    void TearDown() override
    {
        Logger::instance().clear_sinks();
        Logger::instance().set_level(LogLevel::Info);
    }

    std::vector<Logger::LogEntry> entries;
};

TEST_F(LoggerTest, FormatsPlaceholdersInOrder)
{
    HOSTKIT_LOG_INFO("host", "Host {} is {} at {}", 3, "shown", 1.5);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].category, "host");
    EXPECT_EQ(entries[0].level, LogLevel::Info);
    EXPECT_EQ(entries[0].message.rfind("Host 3 is shown at 1.5", 0), 0u);
}

TEST_F(LoggerTest, FormatsBoolsAndRects)
{
    HOSTKIT_LOG_DEBUG("bounds", "{} {}", true, Rect{1, 2, 3, 4});
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "true [1, 2, 3, 4]");
}

TEST_F(LoggerTest, ExtraPlaceholdersAreKept)
{
    HOSTKIT_LOG_WARN("host", "{} and {}", 1);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "1 and {}");
}

TEST_F(LoggerTest, LevelFiltersEntries)
{
    Logger::instance().set_level(LogLevel::Warning);
    HOSTKIT_LOG_DEBUG("host", "hidden");
    HOSTKIT_LOG_INFO("host", "hidden");
    HOSTKIT_LOG_ERROR("host", "shown");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].level, LogLevel::Error);
}

TEST_F(LoggerTest, HereMacrosCarryLocation)
{
    HOSTKIT_LOG_INFO_HERE("host", "with location");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message.rfind("with location [", 0), 0u);
    EXPECT_NE(entries[0].message.find("test_logger.cpp"), std::string::npos);
}

TEST(LoggerLevels, ParseLevel)
{
    LogLevel level = LogLevel::Info;
    EXPECT_TRUE(Logger::parse_level("trace", level));
    EXPECT_EQ(level, LogLevel::Trace);
    EXPECT_TRUE(Logger::parse_level("WARN", level));
    EXPECT_EQ(level, LogLevel::Warning);
    EXPECT_TRUE(Logger::parse_level("critical", level));
    EXPECT_EQ(level, LogLevel::Critical);
    EXPECT_FALSE(Logger::parse_level("loud", level));
    EXPECT_EQ(level, LogLevel::Critical);
}

TEST(LoggerLevels, LevelFromEnvironment)
{
    ::setenv("HOSTKIT_LOG_LEVEL", "error", 1);
    EXPECT_TRUE(Logger::instance().set_level_from_env());
    EXPECT_EQ(Logger::instance().get_level(), LogLevel::Error);

    ::setenv("HOSTKIT_LOG_LEVEL", "bogus", 1);
    EXPECT_FALSE(Logger::instance().set_level_from_env());
    EXPECT_EQ(Logger::instance().get_level(), LogLevel::Error);

    ::unsetenv("HOSTKIT_LOG_LEVEL");
    EXPECT_FALSE(Logger::instance().set_level_from_env());
    Logger::instance().set_level(LogLevel::Info);
}

TEST(LoggerLevels, LevelToString)
{
    EXPECT_EQ(Logger::level_to_string(LogLevel::Debug), "DEBUG");
    EXPECT_EQ(Logger::level_to_string(LogLevel::Error), "ERROR");
}
