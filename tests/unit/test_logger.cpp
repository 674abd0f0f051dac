#include <gtest/gtest.h>
#include <kara/logger.hpp>
#include <sstream>

using namespace kara;

class LoggerTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        logger.set_level(LogLevel::Trace);
        logger.add_sink(sinks::stream_sink(out_));
    }

    void TearDown() override
    {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        logger.set_level(LogLevel::Info);
    }

    std::ostringstream out_;
};

// ─── Level filtering ─────────────────────────────────────────────────────────

TEST_F(LoggerTest, EntriesBelowLevelAreDropped)
{
    Logger::instance().set_level(LogLevel::Warning);
    EXPECT_FALSE(Logger::instance().is_enabled(LogLevel::Info));
    EXPECT_TRUE(Logger::instance().is_enabled(LogLevel::Error));

    KARA_LOG_INFO("test", "hidden");
    EXPECT_TRUE(out_.str().empty());

    KARA_LOG_WARN("test", "shown");
    EXPECT_NE(out_.str().find("WARN [test] shown"), std::string::npos);
}

TEST_F(LoggerTest, EntryCarriesCategoryAndSource)
{
    Logger::instance().log(LogLevel::Error, "codec", "bad header", "codec.cpp", 42, "decode");
    std::string line = out_.str();
    EXPECT_NE(line.find("ERROR [codec] bad header (codec.cpp:42 in decode)"), std::string::npos);
    EXPECT_EQ(line.back(), '\n');
}

// ─── Formatting ──────────────────────────────────────────────────────────────

TEST_F(LoggerTest, PlaceholdersFillInOrder)
{
    KARA_LOG_INFO("fmt", "{} lines, {} keyframes in {}", 2, 7u, std::string("demo"));
    EXPECT_NE(out_.str().find("2 lines, 7 keyframes in demo"), std::string::npos);
}

TEST_F(LoggerTest, FloatsUseMillisecondPrecision)
{
    KARA_LOG_DEBUG("fmt", "t={} dt={}", 1.5f, 0.0166);
    EXPECT_NE(out_.str().find("t=1.500 dt=0.017"), std::string::npos);
}

TEST_F(LoggerTest, BoolsAndMissingArguments)
{
    KARA_LOG_INFO("fmt", "playing={} extra={}", true);
    EXPECT_NE(out_.str().find("playing=true extra={}"), std::string::npos);
}

TEST_F(LoggerTest, ArgumentTextIsNotRescanned)
{
    KARA_LOG_INFO("fmt", "{} then {}", "{}", 5);
    EXPECT_NE(out_.str().find("{} then 5"), std::string::npos);
}

// ─── Levels by name ──────────────────────────────────────────────────────────

TEST(LoggerLevels, ToString)
{
    EXPECT_EQ(Logger::level_to_string(LogLevel::Trace), "TRACE");
    EXPECT_EQ(Logger::level_to_string(LogLevel::Warning), "WARN");
    EXPECT_EQ(Logger::level_to_string(LogLevel::Critical), "CRITICAL");
}

TEST(LoggerLevels, FromString)
{
    EXPECT_EQ(Logger::level_from_string("debug"), LogLevel::Debug);
    EXPECT_EQ(Logger::level_from_string("WARN"), LogLevel::Warning);
    EXPECT_EQ(Logger::level_from_string("Warning"), LogLevel::Warning);
    EXPECT_FALSE(Logger::level_from_string("loud").has_value());
    EXPECT_FALSE(Logger::level_from_string("").has_value());
}

// ─── Sinks ───────────────────────────────────────────────────────────────────

TEST_F(LoggerTest, EverySinkReceivesEntry)
{
    std::ostringstream second;
    Logger::instance().add_sink(sinks::stream_sink(second));
    Logger::instance().add_sink(sinks::null_sink());
    EXPECT_EQ(Logger::instance().sink_count(), 3u);

    KARA_LOG_ERROR("test", "twice");
    EXPECT_NE(out_.str().find("twice"), std::string::npos);
    EXPECT_NE(second.str().find("twice"), std::string::npos);

    Logger::instance().clear_sinks();
    EXPECT_EQ(Logger::instance().sink_count(), 0u);
}
