/**
 * @file config.h
 * @brief Configuration structures and YAML/JSON loader
 */

#pragma once

#include <cstdint>
#include <string>

#include "utils/error.h"
#include "utils/expected.h"

namespace mybinlog::config {

// Default values for configuration
namespace defaults {

constexpr const char* kLogLevel = "info";
constexpr const char* kLogFormat = "json";
constexpr const char* kTimezone = "+00:00";

}  // namespace defaults

/**
 * @brief Binlog input configuration
 */
struct InputConfig {
  std::string path;  ///< Binlog file to decode
};

/**
 * @brief Reading window configuration
 *
 * Zero and empty values mean "not set".
 */
struct ReaderConfig {
  int64_t start_position = 0;
  int64_t stop_position = 0;
  std::string start_datetime;  ///< "YYYY-MM-DD HH:MM:SS" or epoch seconds
  std::string stop_datetime;
  std::string timezone = defaults::kTimezone;  ///< Offset applied to datetime strings
  uint64_t max_events = 0;                     ///< 0 = unlimited
};

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
  std::string level = defaults::kLogLevel;    ///< debug, info, warn, error
  std::string format = defaults::kLogFormat;  ///< json or text
  std::string file;                           ///< Log file path (empty = stderr)
};

/**
 * @brief Dump output configuration
 */
struct OutputConfig {
  bool include_raw = false;  ///< Hex-dump payloads of events without a dedicated decoder
};

/**
 * @brief Root configuration
 */
struct Config {
  InputConfig input;
  ReaderConfig reader;
  LoggingConfig logging;
  OutputConfig output;
};

/**
 * @brief Load configuration, detecting the format from the file extension
 *
 * ".json" is parsed as JSON, ".yaml"/".yml" as YAML. Other extensions are
 * tried as YAML (a superset of JSON). Every file is validated against the
 * JSON Schema before it is converted.
 *
 * @param path Configuration file path
 * @param schema_path Optional schema file (empty = embedded schema)
 */
utils::Expected<Config, utils::Error> LoadConfig(const std::string& path, const std::string& schema_path = "");

/**
 * @brief Load a YAML configuration file
 */
utils::Expected<Config, utils::Error> LoadConfigYaml(const std::string& path, const std::string& schema_path = "");

/**
 * @brief Load a JSON configuration file
 */
utils::Expected<Config, utils::Error> LoadConfigJson(const std::string& path, const std::string& schema_path = "");

/**
 * @brief Validate a JSON document against the configuration schema
 *
 * @param config_json_str JSON text to validate
 * @param schema_json_str Schema text (empty = embedded schema)
 * @return kConfigJsonError on malformed input, kConfigSchemaError on a bad
 *         schema, kConfigValidationError when the document does not conform
 */
utils::Expected<void, utils::Error> ValidateConfigJson(const std::string& config_json_str,
                                                       const std::string& schema_json_str = "");

}  // namespace mybinlog::config
