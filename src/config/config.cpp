/**
 * @file config.cpp
 * @brief Configuration parser implementation with JSON Schema validation
 */

#include "config/config.h"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <fstream>
#include <nlohmann/json-schema.hpp>
#include <nlohmann/json.hpp>
#include <sstream>

#include "config_schema_embedded.h"  // Generated from config_schema.json

namespace mybinlog::config {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

using json = nlohmann::json;
using nlohmann::json_schema::json_validator;

/**
 * @brief Convert YAML node to JSON object recursively
 *
 * Scalars that read as JSON (numbers, booleans, null) keep that type,
 * everything else becomes a string.
 */
json YamlToJson(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      return {};
    case YAML::NodeType::Scalar: {
      const auto scalar = node.as<std::string>();
      if (node.Tag() == "!") {
        // Quoted in the source document
        return scalar;
      }
      json parsed = json::parse(scalar, nullptr, /*allow_exceptions=*/false);
      if (parsed.is_discarded() || parsed.is_structured() || parsed.is_string()) {
        return scalar;
      }
      return parsed;
    }
    case YAML::NodeType::Sequence: {
      json result = json::array();
      for (const auto& item : node) {
        result.push_back(YamlToJson(item));
      }
      return result;
    }
    case YAML::NodeType::Map: {
      json result = json::object();
      for (const auto& key_value : node) {
        result[key_value.first.as<std::string>()] = YamlToJson(key_value.second);
      }
      return result;
    }
    default:
      return {};
  }
}

/**
 * @brief Read file contents as string
 */
Expected<std::string, Error> ReadFileToString(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return MakeUnexpected(
        MakeError(ErrorCode::kConfigFileNotFound, "Failed to open configuration file: " + path, path));
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  std::string content = buffer.str();
  if (content.empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigParseError, "Configuration file is empty: " + path, path));
  }
  return content;
}

/**
 * @brief Datetime values may be written as strings or epoch seconds
 */
std::string DateTimeValue(const json& value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  return std::to_string(value.get<int64_t>());
}

/**
 * @brief Build Config from an already validated JSON document
 */
Config ParseConfigFromJson(const json& root) {
  Config config;

  if (root.contains("input")) {
    const auto& input = root["input"];
    config.input.path = input.value("path", config.input.path);
  }

  if (root.contains("reader")) {
    const auto& reader = root["reader"];
    config.reader.start_position = reader.value("start_position", config.reader.start_position);
    config.reader.stop_position = reader.value("stop_position", config.reader.stop_position);
    if (reader.contains("start_datetime")) {
      config.reader.start_datetime = DateTimeValue(reader["start_datetime"]);
    }
    if (reader.contains("stop_datetime")) {
      config.reader.stop_datetime = DateTimeValue(reader["stop_datetime"]);
    }
    config.reader.timezone = reader.value("timezone", config.reader.timezone);
    config.reader.max_events = reader.value("max_events", config.reader.max_events);
  }

  if (root.contains("logging")) {
    const auto& logging = root["logging"];
    config.logging.level = logging.value("level", config.logging.level);
    config.logging.format = logging.value("format", config.logging.format);
    config.logging.file = logging.value("file", config.logging.file);
  }

  if (root.contains("output")) {
    const auto& output = root["output"];
    config.output.include_raw = output.value("include_raw", config.output.include_raw);
  }

  return config;
}

/**
 * @brief Validate and convert a parsed document
 */
Expected<Config, Error> BuildConfig(const json& root, const std::string& path, const std::string& schema_path) {
  std::string schema_str;
  if (!schema_path.empty()) {
    auto schema_file = ReadFileToString(schema_path);
    if (!schema_file) {
      return MakeUnexpected(schema_file.error());
    }
    schema_str = std::move(*schema_file);
  }

  // ValidateConfigJson falls back to the embedded schema when schema_str is empty
  auto valid = ValidateConfigJson(root.dump(), schema_str);
  if (!valid) {
    return MakeUnexpected(MakeError(valid.error().code(), valid.error().message(), path));
  }

  Config config;
  try {
    config = ParseConfigFromJson(root);
  } catch (const json::exception& e) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigInvalidValue, e.what(), path));
  }

  spdlog::info("Configuration loaded successfully from {}", path);
  spdlog::debug("  Input: {}", config.input.path.empty() ? "(command line)" : config.input.path);
  spdlog::debug("  Logging: level={} format={}", config.logging.level, config.logging.format);
  return config;
}

/**
 * @brief Detect file format based on extension
 */
// NOLINTNEXTLINE(performance-enum-size)
enum class FileFormat { kYaml, kJson, kUnknown };

constexpr size_t kJsonExtLength = 5;  // ".json"
constexpr size_t kYamlExtLength = 5;  // ".yaml"
constexpr size_t kYmlExtLength = 4;   // ".yml"

FileFormat DetectFileFormat(const std::string& path) {
  if (path.size() >= kJsonExtLength && path.substr(path.size() - kJsonExtLength) == ".json") {
    return FileFormat::kJson;
  }
  if (path.size() >= kYamlExtLength && path.substr(path.size() - kYamlExtLength) == ".yaml") {
    return FileFormat::kYaml;
  }
  if (path.size() >= kYmlExtLength && path.substr(path.size() - kYmlExtLength) == ".yml") {
    return FileFormat::kYaml;
  }
  return FileFormat::kUnknown;
}

}  // namespace

Expected<void, Error> ValidateConfigJson(const std::string& config_json_str, const std::string& schema_json_str) {
  json config_json = json::parse(config_json_str, nullptr, /*allow_exceptions=*/false);
  if (config_json.is_discarded()) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigJsonError, "Configuration is not valid JSON"));
  }

  // Use embedded schema if no custom schema provided
  const std::string schema_to_use = schema_json_str.empty() ? std::string(kConfigSchemaJson) : schema_json_str;
  json schema_json = json::parse(schema_to_use, nullptr, /*allow_exceptions=*/false);
  if (schema_json.is_discarded()) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigSchemaError, "Configuration schema is not valid JSON"));
  }

  json_validator validator;
  try {
    validator.set_root_schema(schema_json);
  } catch (const std::exception& e) {
    return MakeUnexpected(MakeError(ErrorCode::kConfigSchemaError, std::string("Invalid schema: ") + e.what()));
  }

  try {
    validator.validate(config_json);
  } catch (const std::exception& e) {
    return MakeUnexpected(
        MakeError(ErrorCode::kConfigValidationError, std::string("Configuration validation failed: ") + e.what()));
  }

  spdlog::debug("Configuration validation passed");
  return {};
}

Expected<Config, Error> LoadConfigJson(const std::string& path, const std::string& schema_path) {
  auto config_str = ReadFileToString(path);
  if (!config_str) {
    return MakeUnexpected(config_str.error());
  }

  json root;
  try {
    root = json::parse(*config_str);
  } catch (const json::parse_error& e) {
    std::stringstream err_msg;
    err_msg << "JSON parse error: " << e.what();
    if (e.byte != 0) {
      err_msg << " (byte " << e.byte << ")";
    }
    return MakeUnexpected(MakeError(ErrorCode::kConfigJsonError, err_msg.str(), path));
  }

  return BuildConfig(root, path, schema_path);
}

Expected<Config, Error> LoadConfigYaml(const std::string& path, const std::string& schema_path) {
  auto config_str = ReadFileToString(path);
  if (!config_str) {
    return MakeUnexpected(config_str.error());
  }

  json root;
  try {
    root = YamlToJson(YAML::Load(*config_str));
  } catch (const YAML::Exception& e) {
    std::stringstream err_msg;
    err_msg << "YAML parse error: " << e.msg;
    if (e.mark.line >= 0) {
      err_msg << " (line " << (e.mark.line + 1) << ", column " << (e.mark.column + 1) << ")";
    }
    return MakeUnexpected(MakeError(ErrorCode::kConfigYamlError, err_msg.str(), path));
  }

  if (root.is_null()) {
    // An empty document (comments only) means all defaults
    root = json::object();
  }
  return BuildConfig(root, path, schema_path);
}

Expected<Config, Error> LoadConfig(const std::string& path, const std::string& schema_path) {
  switch (DetectFileFormat(path)) {
    case FileFormat::kJson:
      spdlog::debug("Detected JSON format for config file: {}", path);
      return LoadConfigJson(path, schema_path);

    case FileFormat::kYaml:
      spdlog::debug("Detected YAML format for config file: {}", path);
      return LoadConfigYaml(path, schema_path);

    case FileFormat::kUnknown:
    default:
      // YAML accepts JSON documents as well
      spdlog::debug("Unknown file format, parsing as YAML: {}", path);
      return LoadConfigYaml(path, schema_path);
  }
}

}  // namespace mybinlog::config
