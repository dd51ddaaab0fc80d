/**
 * @file command_line_parser.h
 * @brief Command-line argument parser
 */

#ifndef MYBINLOG_APP_COMMAND_LINE_PARSER_H_
#define MYBINLOG_APP_COMMAND_LINE_PARSER_H_

#include <cstdint>
#include <optional>
#include <string>

#include "utils/error.h"
#include "utils/expected.h"

namespace mybinlog::app {

// Import Expected from utils namespace
using utils::Error;
using utils::Expected;

/**
 * @brief Parsed command-line arguments
 *
 * Window and logging values are optional so that only the flags actually
 * given override the configuration file.
 */
struct CommandLineArgs {
  std::string config_file;
  std::string schema_file;  ///< Optional JSON Schema file path
  std::string binlog_file;  ///< Positional argument
  std::optional<int64_t> start_position;
  std::optional<int64_t> stop_position;
  std::optional<std::string> start_datetime;
  std::optional<std::string> stop_datetime;
  std::optional<uint64_t> max_events;
  std::optional<std::string> log_level;
  bool include_raw = false;
  bool config_test_mode = false;
  bool show_help = false;
  bool show_version = false;
};

/**
 * @brief Command-line argument parser
 *
 * Supports short (-c) and long (--config) option formats. Option values are
 * given as the following argument.
 */
class CommandLineParser {
 public:
  /**
   * @brief Parse command line arguments
   * @param argc Argument count
   * @param argv Argument values
   * @return Expected with parsed arguments or kAppInvalidArguments
   *
   * Supported options:
   * - -c, --config <file>: Configuration file path
   * - -s, --schema <file>: Use custom JSON Schema
   * - -t, --config-test: Test configuration and exit
   * - --start-position <N>, --stop-position <N>
   * - --start-datetime <T>, --stop-datetime <T>
   * - --max-events <N>
   * - --log-level <level>
   * - --include-raw: Hex-dump payloads of undecoded events
   * - -h, --help / -v, --version
   * - Positional argument: binlog file path
   *
   * @note Help and version flags take precedence
   */
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays) - Standard C/C++ main signature
  static Expected<CommandLineArgs, Error> Parse(int argc, char* argv[]);

  /**
   * @brief Print help message to stdout
   * @param program_name Program name (argv[0])
   */
  static void PrintHelp(const char* program_name);

  /**
   * @brief Print version information to stdout
   */
  static void PrintVersion();

 private:
  // Private constructor (utility class - all static methods)
  CommandLineParser() = default;
};

}  // namespace mybinlog::app

#endif  // MYBINLOG_APP_COMMAND_LINE_PARSER_H_
