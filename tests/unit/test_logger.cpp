#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sheetscape/logger.hpp>
#include <string>
#include <vector>

using namespace sheetscape;

class LoggerTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        saved_level_ = Logger::instance().get_level();
        Logger::instance().clear_sinks();
        Logger::instance().add_sink([this](const Logger::LogEntry& e) { entries.push_back(e); });
        Logger::instance().set_level(LogLevel::Trace);
    }

    void TearDown() override
    {
        Logger::instance().clear_sinks();
        Logger::instance().set_level(saved_level_);
    }

    std::vector<Logger::LogEntry> entries;

   private:
    LogLevel saved_level_ = LogLevel::Info;
};

TEST_F(LoggerTest, MacroFormatsPlaceholders)
{
    SHEETSCAPE_LOG_INFO("layout", "{} boards, active {}", 3, std::string("artifact-2"));

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].level, LogLevel::Info);
    EXPECT_EQ(entries[0].category, "layout");
    EXPECT_EQ(entries[0].message, "3 boards, active artifact-2");
}

TEST_F(LoggerTest, LevelFilter)
{
    Logger::instance().set_level(LogLevel::Warning);
    SHEETSCAPE_LOG_DEBUG("test", "dropped");
    SHEETSCAPE_LOG_INFO("test", "dropped");
    SHEETSCAPE_LOG_WARN("test", "kept");
    SHEETSCAPE_LOG_ERROR("test", "kept");

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].level, LogLevel::Warning);
    EXPECT_EQ(entries[1].level, LogLevel::Error);
}

TEST_F(LoggerTest, OffSilencesEverything)
{
    Logger::instance().set_level(LogLevel::Off);
    SHEETSCAPE_LOG_CRITICAL("test", "dropped");
    EXPECT_TRUE(entries.empty());
    EXPECT_FALSE(Logger::instance().is_enabled(LogLevel::Off));
}

TEST_F(LoggerTest, FanOutToEverySink)
{
    int extra = 0;
    Logger::instance().add_sink([&](const Logger::LogEntry&) { ++extra; });
    EXPECT_EQ(Logger::instance().sink_count(), 2u);

    SHEETSCAPE_LOG_TRACE("test", "x");
    EXPECT_EQ(entries.size(), 1u);
    EXPECT_EQ(extra, 1);
    Logger::instance().clear_sinks();
}

TEST_F(LoggerTest, FileSinkAppendsLines)
{
    std::filesystem::path path = std::filesystem::path(::testing::TempDir()) / "sheetscape_logger_test.log";
    std::filesystem::remove(path);

    Logger::instance().add_sink(sinks::file_sink(path.string()));
    SHEETSCAPE_LOG_INFO("lifecycle", "{} complete", "artifact-1");
    SHEETSCAPE_LOG_WARN("grid", "clip {}", 2);

    std::ifstream            in(path);
    std::vector<std::string> lines;
    for (std::string line; std::getline(in, line);)
        lines.push_back(line);

    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[0].find("INFO [lifecycle] artifact-1 complete"), std::string::npos);
    EXPECT_NE(lines[1].find("WARN [grid] clip 2"), std::string::npos);
    std::filesystem::remove(path);
}

TEST_F(LoggerTest, NullSinkDiscards)
{
    Logger::instance().add_sink(sinks::null_sink());
    SHEETSCAPE_LOG_ERROR("test", "still captured");
    EXPECT_EQ(Logger::instance().sink_count(), 2u);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "still captured");
}

TEST(LoggerFormat, SurplusAndMissingArguments)
{
    EXPECT_EQ(Logger::format_message("a {} b", 1, 2), "a 1 b");
    EXPECT_EQ(Logger::format_message("{} and {}", "x"), "x and {}");
    EXPECT_EQ(Logger::format_message("flag={}", true), "flag=true");
    EXPECT_EQ(Logger::format_message("no placeholders"), "no placeholders");
}

TEST(LoggerFormat, LevelNames)
{
    EXPECT_EQ(Logger::level_to_string(LogLevel::Warning), "WARN");
    EXPECT_EQ(Logger::level_from_string("Warning"), LogLevel::Warning);
    EXPECT_EQ(Logger::level_from_string("DEBUG"), LogLevel::Debug);
    EXPECT_FALSE(Logger::level_from_string("verbose").has_value());
}
