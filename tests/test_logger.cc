#include <gtest/gtest.h>

#include "logger.hpp"
#include "test_helpers.hpp"

using namespace promfile;

TEST(LoggerTest, ParsesLevels) {
    LogLevel level = LogLevel::ERROR;
    ASSERT_TRUE(parse_log_level("debug", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    ASSERT_TRUE(parse_log_level("INFO", level));
    EXPECT_EQ(level, LogLevel::INFO);
    ASSERT_TRUE(parse_log_level("Warning", level));
    EXPECT_EQ(level, LogLevel::WARN);
    ASSERT_TRUE(parse_log_level("error", level));
    EXPECT_EQ(level, LogLevel::ERROR);

    EXPECT_FALSE(parse_log_level("verbose", level));
    EXPECT_EQ(level, LogLevel::ERROR);
}

class LoggerFileTest : public TempDirTest {
   protected:
    void TearDown() override {
        Logger::init(LogLevel::INFO);
        TempDirTest::TearDown();
    }
};

TEST_F(LoggerFileTest, WritesAtOrAboveLevel) {
    fs::path log_path = test_dir / "server.log";
    Logger::init(LogLevel::WARN, log_path.string());
    EXPECT_EQ(Logger::level(), LogLevel::WARN);

    Logger::info("[Test] hidden");
    Logger::warn("[Test] shown");
    Logger::error("[Test] also shown");
    Logger::init(LogLevel::INFO);

    std::string written = read_file(log_path);
    EXPECT_EQ(written.find("hidden"), std::string::npos);
    EXPECT_NE(written.find("[WARN]  [Test] shown"), std::string::npos);
    EXPECT_NE(written.find("[ERROR] [Test] also shown"), std::string::npos);
}
