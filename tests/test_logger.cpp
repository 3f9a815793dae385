#include "observability/logger.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>

using payments::observability::Logger;
using payments::observability::LogLevel;
using payments::observability::parseLogLevel;

class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    previous_level_ = Logger::getInstance().getLogLevel();
    Logger::getInstance().setOutputStream(out_);
    Logger::getInstance().setLogLevel(LogLevel::INFO);
  }

  void TearDown() override {
    Logger::getInstance().setOutputStream(std::cerr);
    Logger::getInstance().setLogLevel(previous_level_);
  }

  std::ostringstream out_;
  LogLevel previous_level_ = LogLevel::WARN;
};

TEST_F(LoggerTest, ParsesLevelNames) {
  EXPECT_EQ(parseLogLevel("DEBUG"), LogLevel::DEBUG);
  EXPECT_EQ(parseLogLevel("WARN"), LogLevel::WARN);
  EXPECT_EQ(parseLogLevel("FATAL"), LogLevel::FATAL);
  EXPECT_FALSE(parseLogLevel("warning").has_value());
  EXPECT_FALSE(parseLogLevel("").has_value());
}

TEST_F(LoggerTest, FiltersBelowMinimumLevel) {
  LOG_DEBUG("hidden");
  EXPECT_TRUE(out_.str().empty());
  EXPECT_FALSE(Logger::getInstance().isEnabled(LogLevel::DEBUG));
  EXPECT_TRUE(Logger::getInstance().isEnabled(LogLevel::ERROR));
}

TEST_F(LoggerTest, WritesOneJsonObjectPerLine) {
  LOG_WARN("metrics file missing");

  auto entry = nlohmann::json::parse(out_.str());
  EXPECT_EQ(entry["level"].get<std::string>(), "WARN");
  EXPECT_EQ(entry["message"].get<std::string>(), "metrics file missing");
  EXPECT_TRUE(entry.contains("timestamp"));
  EXPECT_TRUE(entry.contains("component"));
}

TEST_F(LoggerTest, BuilderAddsStructuredFields) {
  {
    LOG_BUILDER(LogLevel::INFO, "Processing complete")
        .field("records", static_cast<std::size_t>(12))
        .field("tx", 4294967295u)
        .field("kind", "InsufficientFunds");
  }

  auto entry = nlohmann::json::parse(out_.str());
  EXPECT_EQ(entry["message"].get<std::string>(), "Processing complete");
  EXPECT_EQ(entry["records"].get<std::size_t>(), 12u);
  EXPECT_EQ(entry["tx"].get<std::uint32_t>(), 4294967295u);
  EXPECT_EQ(entry["kind"].get<std::string>(), "InsufficientFunds");
}
