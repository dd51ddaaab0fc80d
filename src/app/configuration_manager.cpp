/**
 * @file configuration_manager.cpp
 * @brief Configuration manager implementation
 */

#include "app/configuration_manager.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>

#include "utils/datetime_converter.h"
#include "utils/structured_log.h"

namespace mybinlog::app {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

constexpr const char* kLoggerName = "mybinlog";

spdlog::level::level_enum ParseLogLevel(const std::string& level) {
  if (level == "trace") {
    return spdlog::level::trace;
  }
  if (level == "debug") {
    return spdlog::level::debug;
  }
  if (level == "warn") {
    return spdlog::level::warn;
  }
  if (level == "error") {
    return spdlog::level::err;
  }
  return spdlog::level::info;
}

/**
 * @brief Command-line values replace file values field by field
 */
void ApplyOverrides(const CommandLineArgs& args, config::Config& config) {
  if (!args.binlog_file.empty()) {
    config.input.path = args.binlog_file;
  }
  if (args.start_position) {
    config.reader.start_position = *args.start_position;
  }
  if (args.stop_position) {
    config.reader.stop_position = *args.stop_position;
  }
  if (args.start_datetime) {
    config.reader.start_datetime = *args.start_datetime;
  }
  if (args.stop_datetime) {
    config.reader.stop_datetime = *args.stop_datetime;
  }
  if (args.max_events) {
    config.reader.max_events = *args.max_events;
  }
  if (args.log_level) {
    config.logging.level = *args.log_level;
  }
  if (args.include_raw) {
    config.output.include_raw = true;
  }
}

}  // namespace

Expected<std::unique_ptr<ConfigurationManager>, Error> ConfigurationManager::Create(const CommandLineArgs& args) {
  config::Config config;
  if (!args.config_file.empty()) {
    auto config_result = config::LoadConfig(args.config_file, args.schema_file);
    if (!config_result) {
      return MakeUnexpected(config_result.error());
    }
    config = std::move(*config_result);
  }

  ApplyOverrides(args, config);

  if (config.input.path.empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kAppInvalidArguments,
                                    "Binlog file path required (positional argument or input.path)"));
  }

  return std::unique_ptr<ConfigurationManager>(new ConfigurationManager(std::move(config)));
}

ConfigurationManager::ConfigurationManager(config::Config config) : config_(std::move(config)) {}

int ConfigurationManager::PrintConfigTest() const {
  auto options = BuildReaderOptions();
  if (!options) {
    std::cout << "Configuration error: " << options.error().to_string() << "\n";
    return 1;
  }

  std::cout << "Configuration is OK\n";
  std::cout << "Configuration details:\n";
  std::cout << "  Binlog file: " << config_.input.path << "\n";
  std::cout << "  Start position: " << options->start_position << "\n";
  std::cout << "  Stop position: " << options->stop_position << "\n";
  std::cout << "  Start time: " << options->start_time << "\n";
  std::cout << "  Stop time: " << options->stop_time << "\n";
  std::cout << "  Max events: " << config_.reader.max_events << "\n";
  std::cout << "  Logging level: " << config_.logging.level << " (" << config_.logging.format << ")\n";
  return 0;
}

Expected<void, Error> ConfigurationManager::ApplyLoggingConfig() const {
  try {
    spdlog::drop(kLoggerName);

    std::shared_ptr<spdlog::logger> logger;
    if (!config_.logging.file.empty()) {
      // Ensure log directory exists
      std::filesystem::path log_path(config_.logging.file);
      std::filesystem::path log_dir = log_path.parent_path();
      if (!log_dir.empty() && !std::filesystem::exists(log_dir)) {
        std::filesystem::create_directories(log_dir);
      }
      logger = spdlog::basic_logger_mt(kLoggerName, config_.logging.file);
    } else {
      logger = spdlog::stderr_color_mt(kLoggerName);
    }
    spdlog::set_default_logger(logger);
  } catch (const spdlog::spdlog_ex& ex) {
    return MakeUnexpected(MakeError(ErrorCode::kIOError, "Log initialization failed: " + std::string(ex.what())));
  } catch (const std::filesystem::filesystem_error& ex) {
    return MakeUnexpected(
        MakeError(ErrorCode::kIOError, "Failed to create log directory: " + std::string(ex.what())));
  }

  // Apply logging level (must be AFTER setting default logger)
  spdlog::set_level(ParseLogLevel(config_.logging.level));

  utils::StructuredLog::SetFormat(utils::StructuredLog::ParseFormat(config_.logging.format));

  if (!config_.logging.file.empty()) {
    spdlog::debug("Logging to file: {}", config_.logging.file);
  }
  return {};
}

Expected<binlog::ReaderOptions, Error> ConfigurationManager::BuildReaderOptions() const {
  auto timezone = utils::TimezoneOffset::Parse(config_.reader.timezone);
  if (!timezone) {
    return MakeUnexpected(timezone.error());
  }
  const utils::DateTimeProcessor processor(*timezone);

  binlog::ReaderOptions options;
  options.start_position = config_.reader.start_position;
  options.stop_position = config_.reader.stop_position;

  if (!config_.reader.start_datetime.empty()) {
    auto start_time = processor.ParseDateTimeValue(config_.reader.start_datetime);
    if (!start_time) {
      return MakeUnexpected(start_time.error());
    }
    options.start_time = *start_time;
  }
  if (!config_.reader.stop_datetime.empty()) {
    auto stop_time = processor.ParseDateTimeValue(config_.reader.stop_datetime);
    if (!stop_time) {
      return MakeUnexpected(stop_time.error());
    }
    options.stop_time = *stop_time;
  }
  return options;
}

}  // namespace mybinlog::app
