// airbeacon headers
#include "core/logger.hpp"

// Test helpers
#include "TempDir.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <fstream>
#include <string>
#include <vector>

namespace airbeacon::test {

  using airbeacon::core::LogContext;
  using airbeacon::core::LoggerManager;
  using airbeacon::core::LogLevel;

  class LoggerTest : public ::testing::Test {
  protected:
    void SetUp() override {
      LoggerManager::instance().set_sink([this](LogLevel level, const std::string& name, const std::string& line) {
        levels.push_back(level);
        names.push_back(name);
        lines.push_back(line);
      });
    }

    void TearDown() override {
      LoggerManager::instance().set_sink(nullptr);
      airbeacon::core::setup_logging(LogLevel::INFO, "", true);
    }

    std::vector<LogLevel> levels;
    std::vector<std::string> names;
    std::vector<std::string> lines;
  };

  TEST_F(LoggerTest, sinkReceivesFormattedLineWithContext) {
    auto logger = airbeacon::core::get_logger("LoggerTest.context");

    logger->warning("Cannot delete orphan beacon file", LogContext().add("path", "/tmp/x").add("pid", 42));

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(levels[0], LogLevel::WARNING);
    EXPECT_EQ(names[0], "LoggerTest.context");
    EXPECT_NE(lines[0].find("[WARN] LoggerTest.context: Cannot delete orphan beacon file path=/tmp/x pid=42"),
              std::string::npos);
  }

  TEST_F(LoggerTest, messagesBelowLevelAreDropped) {
    auto logger = airbeacon::core::get_logger("LoggerTest.level");
    logger->set_level(LogLevel::INFO);

    logger->debug("hidden");
    logger->info("shown");

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("shown"), std::string::npos);
  }

  TEST_F(LoggerTest, setupLoggingRaisesLevelOfExistingLoggers) {
    auto logger = airbeacon::core::get_logger("LoggerTest.setup");
    airbeacon::core::setup_logging(LogLevel::DEBUG, "", false);

    logger->debug("now visible");

    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("[DEBUG] LoggerTest.setup: now visible"), std::string::npos);
  }

  TEST_F(LoggerTest, allLoggersShareOneLogFile) {
    TempDir dir;
    auto path = dir.file("beacon.log");
    airbeacon::core::setup_logging(LogLevel::INFO, path.string(), false);

    airbeacon::core::get_logger("LoggerTest.first")->info("one");
    airbeacon::core::get_logger("LoggerTest.second")->error("two");
    airbeacon::core::setup_logging(LogLevel::INFO, "", false);

    std::ifstream in(path);
    std::vector<std::string> file_lines;
    for (std::string line; std::getline(in, line);) {
      file_lines.push_back(line);
    }
    ASSERT_EQ(file_lines.size(), 2u);
    EXPECT_NE(file_lines[0].find("LoggerTest.first: one"), std::string::npos);
    EXPECT_NE(file_lines[1].find("[ERROR] LoggerTest.second: two"), std::string::npos);
  }

  TEST(LoggerManagerTest, levelNames) {
    EXPECT_STREQ(LoggerManager::level_to_string(LogLevel::DEBUG), "DEBUG");
    EXPECT_STREQ(LoggerManager::level_to_string(LogLevel::WARNING), "WARN");
    EXPECT_STREQ(LoggerManager::level_to_string(LogLevel::ERROR), "ERROR");
  }

} // namespace airbeacon::test
