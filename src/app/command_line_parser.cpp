/**
 * @file command_line_parser.cpp
 * @brief Command-line argument parser implementation
 */

#include "app/command_line_parser.h"

#include <charconv>
#include <iostream>
#include <type_traits>

#include "version.h"

namespace mybinlog::app {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

/**
 * @brief Check if argument matches short or long option
 * @param arg Command-line argument
 * @param short_opt Short option (e.g., "-c"), nullptr if none
 * @param long_opt Long option (e.g., "--config")
 * @return True if argument matches either option
 */
bool MatchesOption(const std::string& arg, const char* short_opt, const char* long_opt) {
  return (short_opt != nullptr && arg == short_opt) || arg == long_opt;
}

Error InvalidArguments(const std::string& message) {
  return MakeError(ErrorCode::kAppInvalidArguments, message);
}

/**
 * @brief Parse a non-negative integer option value
 */
template <typename T>
Expected<T, Error> ParseNumber(const std::string& option, const std::string& value) {
  T result = 0;
  // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  const char* end = value.data() + value.size();
  auto [ptr, ec] = std::from_chars(value.data(), end, result);
  bool negative = false;
  if constexpr (std::is_signed_v<T>) {
    negative = result < 0;
  }
  if (value.empty() || ec != std::errc{} || ptr != end || negative) {
    return MakeUnexpected(InvalidArguments(option + " requires a non-negative integer, got '" + value + "'"));
  }
  return result;
}

}  // namespace

// NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays) - Standard C/C++ main signature
Expected<CommandLineArgs, Error> CommandLineParser::Parse(int argc, char* argv[]) {
  // NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  CommandLineArgs args;

  if (argc < 1) {
    return MakeUnexpected(InvalidArguments("Invalid argument count (argc < 1)"));
  }

  // Handle help and version flags first (early exit)
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      args.show_help = true;
      return args;
    }
    if (arg == "-v" || arg == "--version") {
      args.show_version = true;
      return args;
    }
  }

  // Fetch the value that follows an option
  auto next_value = [&](int& index, const std::string& option) -> Expected<std::string, Error> {
    if (index + 1 >= argc) {
      return MakeUnexpected(InvalidArguments(option + " requires an argument"));
    }
    return std::string(argv[++index]);
  };

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (MatchesOption(arg, "-c", "--config")) {
      auto value = next_value(i, arg);
      if (!value) {
        return MakeUnexpected(value.error());
      }
      args.config_file = *value;
    } else if (MatchesOption(arg, "-s", "--schema")) {
      auto value = next_value(i, arg);
      if (!value) {
        return MakeUnexpected(value.error());
      }
      args.schema_file = *value;
    } else if (MatchesOption(arg, "-t", "--config-test")) {
      args.config_test_mode = true;
    } else if (MatchesOption(arg, nullptr, "--start-position") || MatchesOption(arg, nullptr, "--stop-position")) {
      auto value = next_value(i, arg);
      if (!value) {
        return MakeUnexpected(value.error());
      }
      auto position = ParseNumber<int64_t>(arg, *value);
      if (!position) {
        return MakeUnexpected(position.error());
      }
      (arg == "--start-position" ? args.start_position : args.stop_position) = *position;
    } else if (MatchesOption(arg, nullptr, "--start-datetime")) {
      auto value = next_value(i, arg);
      if (!value) {
        return MakeUnexpected(value.error());
      }
      args.start_datetime = *value;
    } else if (MatchesOption(arg, nullptr, "--stop-datetime")) {
      auto value = next_value(i, arg);
      if (!value) {
        return MakeUnexpected(value.error());
      }
      args.stop_datetime = *value;
    } else if (MatchesOption(arg, nullptr, "--max-events")) {
      auto value = next_value(i, arg);
      if (!value) {
        return MakeUnexpected(value.error());
      }
      auto max_events = ParseNumber<uint64_t>(arg, *value);
      if (!max_events) {
        return MakeUnexpected(max_events.error());
      }
      args.max_events = *max_events;
    } else if (MatchesOption(arg, nullptr, "--log-level")) {
      auto value = next_value(i, arg);
      if (!value) {
        return MakeUnexpected(value.error());
      }
      if (*value != "trace" && *value != "debug" && *value != "info" && *value != "warn" && *value != "error") {
        return MakeUnexpected(InvalidArguments("Invalid log level: " + *value));
      }
      args.log_level = *value;
    } else if (MatchesOption(arg, nullptr, "--include-raw")) {
      args.include_raw = true;
    } else if (arg.size() > 1 && arg[0] == '-') {
      return MakeUnexpected(InvalidArguments("Unknown option: " + arg));
    } else {
      if (!args.binlog_file.empty()) {
        return MakeUnexpected(
            InvalidArguments("Unexpected positional argument: " + arg + " (binlog file already specified)"));
      }
      args.binlog_file = arg;
    }
  }

  // The binlog file may instead come from input.path in the configuration
  if (args.binlog_file.empty() && args.config_file.empty()) {
    return MakeUnexpected(InvalidArguments("Binlog file path required. Use --help for usage."));
  }

  // NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  return args;
}

void CommandLineParser::PrintHelp(const char* program_name) {
  std::cout << "Usage: " << program_name << " [OPTIONS] <binlog-file>\n";
  std::cout << "       " << program_name << " -c <config.yaml|config.json> [OPTIONS]\n";
  std::cout << "\n";
  std::cout << "Options:\n";
  std::cout << "  -c, --config <file>            Configuration file path\n";
  std::cout << "  -s, --schema <schema.json>     Use custom JSON Schema (optional)\n";
  std::cout << "  -t, --config-test              Test configuration and exit\n";
  std::cout << "      --start-position <N>       Skip events that start before byte offset N\n";
  std::cout << "      --stop-position <N>        Stop at the first event ending after offset N\n";
  std::cout << "      --start-datetime <T>       Skip events before T (YYYY-MM-DD HH:MM:SS or epoch)\n";
  std::cout << "      --stop-datetime <T>        Stop at the first event at or after T\n";
  std::cout << "      --max-events <N>           Print at most N events (0 = unlimited)\n";
  std::cout << "      --log-level <level>        trace, debug, info, warn or error\n";
  std::cout << "      --include-raw              Hex-dump payloads of undecoded events\n";
  std::cout << "  -h, --help                     Show this help message\n";
  std::cout << "  -v, --version                  Show version information\n";
  std::cout << "\n";
  std::cout << "Command-line options override values from the configuration file.\n";
  std::cout << "Each event is printed as one JSON object per line, followed by a summary line.\n";
}

void CommandLineParser::PrintVersion() {
  std::cout << Version::FullString() << "\n";
}

}  // namespace mybinlog::app
