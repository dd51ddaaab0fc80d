/**
 * @file application.cpp
 * @brief Main application class implementation
 */

#include "app/application.h"

#include <spdlog/spdlog.h>

#include <iostream>
#include <optional>
#include <string>

#include "app/event_formatter.h"
#include "binlog/binlog_decoder.h"
#include "utils/structured_log.h"
#include "version.h"

namespace mybinlog::app {

using utils::MakeUnexpected;

namespace {

/**
 * @brief Compact single-line JSON
 *
 * Query text and file names are not guaranteed to be UTF-8; invalid
 * sequences are replaced with U+FFFD.
 */
std::string ToLine(const nlohmann::json& value) {
  return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace

// NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays) - Standard C/C++ main signature
Expected<std::unique_ptr<Application>, Error> Application::Create(int argc, char* argv[]) {
  // Step 1: Parse command-line arguments
  auto args_result = CommandLineParser::Parse(argc, argv);
  if (!args_result) {
    return MakeUnexpected(args_result.error());
  }

  CommandLineArgs args = std::move(*args_result);

  // Handle help and version early (before loading config)
  if (args.show_help) {
    CommandLineParser::PrintHelp(argv[0]);  // NOLINT
    return std::unique_ptr<Application>(new Application(std::move(args), nullptr));
  }

  if (args.show_version) {
    CommandLineParser::PrintVersion();
    return std::unique_ptr<Application>(new Application(std::move(args), nullptr));
  }

  // Step 2: Load configuration
  auto config_mgr = ConfigurationManager::Create(args);
  if (!config_mgr) {
    return MakeUnexpected(config_mgr.error());
  }

  return std::unique_ptr<Application>(new Application(std::move(args), std::move(*config_mgr)));
}

Application::Application(CommandLineArgs args, std::unique_ptr<ConfigurationManager> config_mgr)
    : args_(std::move(args)), config_manager_(std::move(config_mgr)) {}

int Application::HandleSpecialModes() {
  if (args_.show_help || args_.show_version) {
    return 0;
  }
  if (args_.config_test_mode) {
    return config_manager_->PrintConfigTest();
  }
  return -1;
}

int Application::Run() {
  return Run(std::cout);
}

int Application::Run(std::ostream& out) {
  int special_exit_code = HandleSpecialModes();
  if (special_exit_code >= 0) {
    return special_exit_code;
  }

  auto logging_result = config_manager_->ApplyLoggingConfig();
  if (!logging_result) {
    std::cerr << "Failed to apply logging configuration: " << logging_result.error().to_string() << "\n";
    return 1;
  }

  spdlog::debug("{} starting", Version::FullString());

  auto dump_result = Dump(out);
  if (!dump_result) {
    utils::StructuredLog()
        .Event("application_error")
        .Field("type", "dump_failed")
        .Field("file", config_manager_->GetConfig().input.path)
        .Field("error", dump_result.error().to_string())
        .Error();
    return 1;
  }
  return 0;
}

Expected<void, Error> Application::Dump(std::ostream& out) {
  const config::Config& config = config_manager_->GetConfig();
  const std::string& path = config.input.path;

  auto options = config_manager_->BuildReaderOptions();
  if (!options) {
    return MakeUnexpected(options.error());
  }

  auto decoder = binlog::BinlogDecoder::OpenFile(path, *options);
  if (!decoder) {
    out << ToLine(FormatSummary(path, binlog::DecoderStats(), 0, decoder.error().to_string())) << "\n";
    return MakeUnexpected(decoder.error());
  }

  uint64_t events_printed = 0;
  std::optional<Error> failure;
  while (config.reader.max_events == 0 || events_printed < config.reader.max_events) {
    auto next = (*decoder)->DecodeNext();
    if (!next) {
      if (utils::IsRecoverableBinlogError(next.error().code())) {
        // The event was consumed; the stream is still aligned
        spdlog::warn("Skipping event: {}", next.error().to_string());
        continue;
      }
      failure = next.error();
      break;
    }
    if (!next->has_value()) {
      break;
    }

    out << ToLine(FormatEvent(**next, (*decoder)->Context(), config.output.include_raw)) << "\n";
    ++events_printed;
  }

  const binlog::DecoderStats& stats = (*decoder)->Stats();
  utils::LogBinlogWalkSummary(path, stats.events_read, stats.events_delivered, stats.events_skipped,
                              !failure.has_value());
  out << ToLine(FormatSummary(path, stats, events_printed, failure ? failure->to_string() : std::string())) << "\n";
  out.flush();
  if (!out) {
    return MakeUnexpected(utils::MakeError(utils::ErrorCode::kAppOutputFailed, "Failed to write output"));
  }

  if (failure) {
    return MakeUnexpected(*failure);
  }
  return {};
}

}  // namespace mybinlog::app
