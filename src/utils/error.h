/**
 * @file error.h
 * @brief Error codes and Error class used with Expected<T, Error>
 */

#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace mybinlog::utils {

/**
 * @brief Error codes grouped by module
 *
 * - 0-999: general
 * - 1000-1999: configuration
 * - 2000-2999: binlog decoding
 * - 3000-3999: command line / application
 */
enum class ErrorCode : uint16_t {
  // General
  kSuccess = 0,
  kUnknown = 1,
  kInvalidArgument = 2,
  kOutOfRange = 3,
  kNotImplemented = 4,
  kInternalError = 5,
  kIOError = 6,
  kPermissionDenied = 7,
  kNotFound = 8,
  kAlreadyExists = 9,
  kTimeout = 10,
  kCancelled = 11,

  // Configuration
  kConfigFileNotFound = 1000,
  kConfigParseError = 1001,
  kConfigValidationError = 1002,
  kConfigMissingRequired = 1003,
  kConfigInvalidValue = 1004,
  kConfigSchemaError = 1005,
  kConfigYamlError = 1006,
  kConfigJsonError = 1007,

  // Binlog decoding
  kBinlogInvalidFileHeader = 2000,
  kBinlogTruncated = 2001,
  kBinlogEndOfStream = 2002,
  kBinlogInvalidHeader = 2003,
  kBinlogSizeMismatch = 2004,
  kBinlogChecksumMismatch = 2005,
  kBinlogUnknownEventType = 2006,
  kBinlogInvalidBody = 2007,
  kBinlogUnknownTable = 2008,
  kBinlogUnknownStatusVar = 2009,
  kBinlogMissingFormatDescription = 2010,

  // Application
  kAppInvalidArguments = 3000,
  kAppOutputFailed = 3001,
};

/**
 * @brief Human readable description of an error code
 */
inline const char* ErrorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kUnknown:
      return "Unknown error";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    case ErrorCode::kOutOfRange:
      return "Out of range";
    case ErrorCode::kNotImplemented:
      return "Not implemented";
    case ErrorCode::kInternalError:
      return "Internal error";
    case ErrorCode::kIOError:
      return "I/O error";
    case ErrorCode::kPermissionDenied:
      return "Permission denied";
    case ErrorCode::kNotFound:
      return "Not found";
    case ErrorCode::kAlreadyExists:
      return "Already exists";
    case ErrorCode::kTimeout:
      return "Timeout";
    case ErrorCode::kCancelled:
      return "Cancelled";

    case ErrorCode::kConfigFileNotFound:
      return "Configuration file not found";
    case ErrorCode::kConfigParseError:
      return "Configuration parse error";
    case ErrorCode::kConfigValidationError:
      return "Configuration validation error";
    case ErrorCode::kConfigMissingRequired:
      return "Missing required configuration";
    case ErrorCode::kConfigInvalidValue:
      return "Invalid configuration value";
    case ErrorCode::kConfigSchemaError:
      return "JSON schema error";
    case ErrorCode::kConfigYamlError:
      return "YAML parsing error";
    case ErrorCode::kConfigJsonError:
      return "JSON parsing error";

    case ErrorCode::kBinlogInvalidFileHeader:
      return "Invalid binlog file header";
    case ErrorCode::kBinlogTruncated:
      return "Truncated binlog data";
    case ErrorCode::kBinlogEndOfStream:
      return "End of stream";
    case ErrorCode::kBinlogInvalidHeader:
      return "Invalid event header";
    case ErrorCode::kBinlogSizeMismatch:
      return "Event size mismatch";
    case ErrorCode::kBinlogChecksumMismatch:
      return "Event checksum mismatch";
    case ErrorCode::kBinlogUnknownEventType:
      return "Unknown event type";
    case ErrorCode::kBinlogInvalidBody:
      return "Invalid event body";
    case ErrorCode::kBinlogUnknownTable:
      return "Unknown table id";
    case ErrorCode::kBinlogUnknownStatusVar:
      return "Unknown status variable";
    case ErrorCode::kBinlogMissingFormatDescription:
      return "Missing format description";

    case ErrorCode::kAppInvalidArguments:
      return "Invalid command line arguments";
    case ErrorCode::kAppOutputFailed:
      return "Output failed";

    default:
      return "Unknown error code";
  }
}

/**
 * @brief Whether a binlog error leaves the stream position trustworthy
 *
 * UnknownTable and UnknownStatusVar come from secondary decoding after the
 * event has been fully framed, so the caller may continue with the next event.
 */
inline bool IsRecoverableBinlogError(ErrorCode code) {
  return code == ErrorCode::kBinlogUnknownTable || code == ErrorCode::kBinlogUnknownStatusVar;
}

/**
 * @brief Error value carried by Expected<T, Error>
 */
class Error {
 public:
  Error() = default;

  explicit Error(ErrorCode code) : code_(code), message_(ErrorCodeToString(code)) {}

  Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

  Error(ErrorCode code, std::string message, std::string context)
      : code_(code), message_(std::move(message)), context_(std::move(context)) {}

  ErrorCode code() const { return code_; }
  const std::string& message() const { return message_; }
  const std::string& context() const { return context_; }

  bool is_error() const { return code_ != ErrorCode::kSuccess; }

  /**
   * @brief Format as "[<code name> (<code>)] <message> (context: <context>)"
   */
  std::string to_string() const {
    std::string result = "[";
    result += ErrorCodeToString(code_);
    result += " (" + std::to_string(static_cast<int>(code_)) + ")] ";
    result += message_;
    if (!context_.empty()) {
      result += " (context: " + context_ + ")";
    }
    return result;
  }

  // NOLINTNEXTLINE(google-explicit-constructor)
  operator std::string() const { return to_string(); }

  const char* what() const { return message_.c_str(); }

 private:
  ErrorCode code_ = ErrorCode::kSuccess;
  std::string message_;
  std::string context_;
};

inline Error MakeError(ErrorCode code) {
  return Error(code);
}

inline Error MakeError(ErrorCode code, std::string message) {
  return {code, std::move(message)};
}

inline Error MakeError(ErrorCode code, std::string message, std::string context) {
  return {code, std::move(message), std::move(context)};
}

}  // namespace mybinlog::utils

#define MYBINLOG_STRINGIFY_DETAIL(x) #x
#define MYBINLOG_STRINGIFY(x) MYBINLOG_STRINGIFY_DETAIL(x)

/**
 * @brief Create an Error whose context is the current file:line
 */
#define MYBINLOG_ERROR(code, message) \
  ::mybinlog::utils::MakeError((code), (message), __FILE__ ":" MYBINLOG_STRINGIFY(__LINE__))
