#include "config/config_loader.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

using payments::config::AppConfig;
using payments::config::loadConfig;
using payments::config::parseConfig;
using payments::observability::LogLevel;

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    path_ = ::testing::TempDir() + "payments_config_test.json";
  }

  void TearDown() override {
    std::remove(path_.c_str());
  }

  void writeFile(const std::string& content) {
    std::ofstream out(path_, std::ios::out | std::ios::trunc);
    out << content;
  }

  std::string path_;
};

TEST_F(ConfigTest, EmptyObjectGivesDefaults) {
  AppConfig config = parseConfig(nlohmann::json::object());
  EXPECT_EQ(config.error_log, "errors.log");
  EXPECT_EQ(config.log_level, LogLevel::WARN);
  EXPECT_FALSE(config.allow_withdrawal_disputes);
  EXPECT_TRUE(config.metrics_file.empty());
}

TEST_F(ConfigTest, ReadsAllKeys) {
  auto document = nlohmann::json::parse(R"({
    "error_log": "rejected.log",
    "log_level": "DEBUG",
    "allow_withdrawal_disputes": true,
    "metrics_file": "metrics.prom",
    "unrelated": 42
  })");
  AppConfig config = parseConfig(document);
  EXPECT_EQ(config.error_log, "rejected.log");
  EXPECT_EQ(config.log_level, LogLevel::DEBUG);
  EXPECT_TRUE(config.allow_withdrawal_disputes);
  EXPECT_EQ(config.metrics_file, "metrics.prom");
}

TEST_F(ConfigTest, NullValuesKeepDefaults) {
  auto document = nlohmann::json::parse(R"({"error_log": null, "log_level": null})");
  AppConfig config = parseConfig(document);
  EXPECT_EQ(config.error_log, "errors.log");
  EXPECT_EQ(config.log_level, LogLevel::WARN);
}

TEST_F(ConfigTest, RejectsInvalidDocuments) {
  EXPECT_THROW(parseConfig(nlohmann::json::array()), std::runtime_error);
  EXPECT_THROW(parseConfig(nlohmann::json::parse(R"({"allow_withdrawal_disputes": "yes"})")),
               std::runtime_error);
  EXPECT_THROW(parseConfig(nlohmann::json::parse(R"({"error_log": 5})")), std::runtime_error);
  EXPECT_THROW(parseConfig(nlohmann::json::parse(R"({"log_level": "verbose"})")),
               std::runtime_error);
}

TEST_F(ConfigTest, LoadsFromFile) {
  writeFile(R"({"log_level": "ERROR", "error_log": "out.log"})");
  AppConfig config = loadConfig(path_);
  EXPECT_EQ(config.log_level, LogLevel::ERROR);
  EXPECT_EQ(config.error_log, "out.log");
}

TEST_F(ConfigTest, LoadFailsOnMissingOrMalformedFile) {
  EXPECT_THROW(loadConfig(path_ + ".missing"), std::runtime_error);
  writeFile("{ not json");
  EXPECT_THROW(loadConfig(path_), std::runtime_error);
}
