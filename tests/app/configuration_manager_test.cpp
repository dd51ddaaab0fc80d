/**
 * @file configuration_manager_test.cpp
 * @brief Unit tests for ConfigurationManager
 */

#include "app/configuration_manager.h"

#include <gtest/gtest.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>

#include "utils/structured_log.h"

using namespace mybinlog::app;
using mybinlog::utils::ErrorCode;
using mybinlog::utils::StructuredLog;

class ConfigurationManagerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const std::string test_name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
    config_path_ = std::filesystem::temp_directory_path() / ("mybinlog_" + test_name + ".yaml");
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove(config_path_, ec);
    StructuredLog::SetFormat(StructuredLog::Format::kJson);
    spdlog::set_level(spdlog::level::info);
  }

  void WriteConfig(const std::string& contents) {
    std::ofstream f(config_path_, std::ios::trunc);
    f << contents;
  }

  std::filesystem::path config_path_;
};

// ===========================================================================
// Create
// ===========================================================================

TEST_F(ConfigurationManagerTest, CreateFromPositionalOnly) {
  CommandLineArgs args;
  args.binlog_file = "binlog.000001";

  auto manager = ConfigurationManager::Create(args);
  ASSERT_TRUE(manager) << manager.error().to_string();
  const auto& config = (*manager)->GetConfig();
  EXPECT_EQ(config.input.path, "binlog.000001");
  EXPECT_EQ(config.reader.max_events, 0U);
  EXPECT_EQ(config.logging.level, "info");
}

TEST_F(ConfigurationManagerTest, CreateFromConfigFile) {
  WriteConfig(
      "input:\n"
      "  path: from-config.000001\n"
      "reader:\n"
      "  start_position: 100\n"
      "  max_events: 7\n"
      "logging:\n"
      "  level: warn\n");
  CommandLineArgs args;
  args.config_file = config_path_.string();

  auto manager = ConfigurationManager::Create(args);
  ASSERT_TRUE(manager) << manager.error().to_string();
  const auto& config = (*manager)->GetConfig();
  EXPECT_EQ(config.input.path, "from-config.000001");
  EXPECT_EQ(config.reader.start_position, 100);
  EXPECT_EQ(config.reader.max_events, 7U);
  EXPECT_EQ(config.logging.level, "warn");
}

TEST_F(ConfigurationManagerTest, CommandLineOverridesFile) {
  WriteConfig(
      "input:\n"
      "  path: from-config.000001\n"
      "reader:\n"
      "  start_position: 100\n"
      "  stop_position: 900\n"
      "  max_events: 7\n");
  CommandLineArgs args;
  args.config_file = config_path_.string();
  args.binlog_file = "from-cli.000002";
  args.start_position = 4;
  args.max_events = 0;
  args.log_level = "debug";
  args.include_raw = true;

  auto manager = ConfigurationManager::Create(args);
  ASSERT_TRUE(manager) << manager.error().to_string();
  const auto& config = (*manager)->GetConfig();
  EXPECT_EQ(config.input.path, "from-cli.000002");
  EXPECT_EQ(config.reader.start_position, 4);
  EXPECT_EQ(config.reader.stop_position, 900);  // not overridden
  EXPECT_EQ(config.reader.max_events, 0U);
  EXPECT_EQ(config.logging.level, "debug");
  EXPECT_TRUE(config.output.include_raw);
}

TEST_F(ConfigurationManagerTest, MissingBinlogPath) {
  WriteConfig("reader:\n  max_events: 1\n");
  CommandLineArgs args;
  args.config_file = config_path_.string();

  auto manager = ConfigurationManager::Create(args);
  ASSERT_FALSE(manager);
  EXPECT_EQ(manager.error().code(), ErrorCode::kAppInvalidArguments);
}

TEST_F(ConfigurationManagerTest, ConfigErrorsPropagate) {
  CommandLineArgs args;
  args.config_file = "/nonexistent/mybinlog/config.yaml";
  args.binlog_file = "binlog.000001";

  auto manager = ConfigurationManager::Create(args);
  ASSERT_FALSE(manager);
  EXPECT_EQ(manager.error().code(), ErrorCode::kConfigFileNotFound);
}

// ===========================================================================
// BuildReaderOptions
// ===========================================================================

TEST_F(ConfigurationManagerTest, ReaderOptionsFromDatetimes) {
  CommandLineArgs args;
  args.binlog_file = "binlog.000001";
  args.start_position = 4;
  args.stop_position = 5000;
  args.start_datetime = "2024-01-01 00:00:00";
  args.stop_datetime = "1704153600";

  auto manager = ConfigurationManager::Create(args);
  ASSERT_TRUE(manager) << manager.error().to_string();
  auto options = (*manager)->BuildReaderOptions();
  ASSERT_TRUE(options) << options.error().to_string();
  EXPECT_EQ(options->start_position, 4);
  EXPECT_EQ(options->stop_position, 5000);
  EXPECT_EQ(options->start_time, 1704067200);
  EXPECT_EQ(options->stop_time, 1704153600);
}

TEST_F(ConfigurationManagerTest, ReaderOptionsUseTimezone) {
  WriteConfig(
      "input:\n"
      "  path: binlog.000001\n"
      "reader:\n"
      "  start_datetime: \"2024-01-01 09:00:00\"\n"
      "  timezone: \"+09:00\"\n");
  CommandLineArgs args;
  args.config_file = config_path_.string();

  auto manager = ConfigurationManager::Create(args);
  ASSERT_TRUE(manager) << manager.error().to_string();
  auto options = (*manager)->BuildReaderOptions();
  ASSERT_TRUE(options) << options.error().to_string();
  EXPECT_EQ(options->start_time, 1704067200);
  EXPECT_EQ(options->stop_time, 0);
}

TEST_F(ConfigurationManagerTest, ReaderOptionsRejectBadDatetime) {
  CommandLineArgs args;
  args.binlog_file = "binlog.000001";
  args.start_datetime = "2024-02-30 00:00:00";

  auto manager = ConfigurationManager::Create(args);
  ASSERT_TRUE(manager) << manager.error().to_string();
  auto options = (*manager)->BuildReaderOptions();
  ASSERT_FALSE(options);
  EXPECT_EQ(options.error().code(), ErrorCode::kInvalidArgument);

  EXPECT_EQ((*manager)->PrintConfigTest(), 1);
}

TEST_F(ConfigurationManagerTest, PrintConfigTestSucceeds) {
  CommandLineArgs args;
  args.binlog_file = "binlog.000001";

  auto manager = ConfigurationManager::Create(args);
  ASSERT_TRUE(manager);
  EXPECT_EQ((*manager)->PrintConfigTest(), 0);
}

// ===========================================================================
// ApplyLoggingConfig
// ===========================================================================

TEST_F(ConfigurationManagerTest, ApplyLoggingConfigToFile) {
  const auto log_dir = std::filesystem::temp_directory_path() / "mybinlog_logging_test";
  std::error_code ec;
  std::filesystem::remove_all(log_dir, ec);

  WriteConfig("input:\n  path: binlog.000001\nlogging:\n  level: debug\n  format: text\n  file: " +
              (log_dir / "nested" / "mybinlog.log").string() + "\n");
  CommandLineArgs args;
  args.config_file = config_path_.string();

  auto manager = ConfigurationManager::Create(args);
  ASSERT_TRUE(manager) << manager.error().to_string();
  auto applied = (*manager)->ApplyLoggingConfig();
  ASSERT_TRUE(applied) << applied.error().to_string();

  EXPECT_EQ(spdlog::get_level(), spdlog::level::debug);
  EXPECT_EQ(StructuredLog::GetFormat(), StructuredLog::Format::kText);
  EXPECT_TRUE(std::filesystem::exists(log_dir / "nested"));

  // Close the file sink before removing the directory
  spdlog::drop("mybinlog");
  spdlog::set_default_logger(spdlog::stderr_color_mt("mybinlog"));
  std::filesystem::remove_all(log_dir, ec);
}

TEST_F(ConfigurationManagerTest, ApplyLoggingConfigToStderr) {
  CommandLineArgs args;
  args.binlog_file = "binlog.000001";
  args.log_level = "error";

  auto manager = ConfigurationManager::Create(args);
  ASSERT_TRUE(manager);
  auto applied = (*manager)->ApplyLoggingConfig();
  ASSERT_TRUE(applied) << applied.error().to_string();
  EXPECT_EQ(spdlog::get_level(), spdlog::level::err);
  EXPECT_EQ(StructuredLog::GetFormat(), StructuredLog::Format::kJson);

  // Applying twice replaces the logger
  EXPECT_TRUE((*manager)->ApplyLoggingConfig());
}
