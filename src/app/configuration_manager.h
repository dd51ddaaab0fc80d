/**
 * @file configuration_manager.h
 * @brief Configuration manager: file values, command-line overrides and logging setup
 */

#ifndef MYBINLOG_APP_CONFIGURATION_MANAGER_H_
#define MYBINLOG_APP_CONFIGURATION_MANAGER_H_

#include <memory>
#include <string>

#include "app/command_line_parser.h"
#include "binlog/window_filter.h"
#include "config/config.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace mybinlog::app {

/**
 * @brief Configuration manager
 *
 * Responsibilities:
 * - Load configuration from file (YAML/JSON) when one is given
 * - Apply command-line overrides on top of it
 * - Apply logging configuration
 * - Turn the reader section into binlog::ReaderOptions
 */
class ConfigurationManager {
 public:
  /**
   * @brief Create manager from parsed command-line arguments
   * @return Expected with manager instance, kConfig* errors from the loader,
   *         or kAppInvalidArguments when no binlog file is known
   */
  static Expected<std::unique_ptr<ConfigurationManager>, Error> Create(const CommandLineArgs& args);

  ~ConfigurationManager() = default;

  ConfigurationManager(const ConfigurationManager&) = delete;
  ConfigurationManager& operator=(const ConfigurationManager&) = delete;
  ConfigurationManager(ConfigurationManager&&) = delete;
  ConfigurationManager& operator=(ConfigurationManager&&) = delete;

  /**
   * @brief Get current configuration (read-only)
   */
  const config::Config& GetConfig() const { return config_; }

  /**
   * @brief Test mode: print the effective configuration
   * @return Exit code (0 = success, 1 = window values do not parse)
   */
  int PrintConfigTest() const;

  /**
   * @brief Apply logging configuration
   *
   * Side effects:
   * - Replaces the default spdlog logger (file sink, or stderr so that stdout
   *   carries only event output)
   * - Sets spdlog log level
   * - Sets the StructuredLog format
   */
  Expected<void, Error> ApplyLoggingConfig() const;

  /**
   * @brief Convert the reader section into decoder options
   *
   * Datetime values are interpreted in reader.timezone.
   * @return kInvalidArgument when a datetime or the timezone does not parse
   */
  Expected<binlog::ReaderOptions, Error> BuildReaderOptions() const;

 private:
  explicit ConfigurationManager(config::Config config);

  config::Config config_;
};

}  // namespace mybinlog::app

#endif  // MYBINLOG_APP_CONFIGURATION_MANAGER_H_
