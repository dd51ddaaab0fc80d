/**
 * @file structured_log.h
 * @brief Structured single-line log records on top of spdlog
 *
 * Decode failures and walk summaries are logged as key/value records so that
 * they can be grepped or parsed by log shippers.
 */

#pragma once

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace mybinlog::utils {

/**
 * @brief Structured log builder
 *
 * Example usage:
 * @code
 * StructuredLog()
 *   .Event("binlog_decode_error")
 *   .Field("event_type", "TABLE_MAP_EVENT")
 *   .Field("log_pos", log_pos)
 *   .Field("error", error.to_string())
 *   .Error();
 * @endcode
 */
class StructuredLog {
 public:
  enum class Format : uint8_t { kJson, kText };

  StructuredLog() = default;

  /**
   * @brief Select output format for all subsequent records
   */
  static void SetFormat(Format format) { FormatStorage().store(format); }

  static Format GetFormat() { return FormatStorage().load(); }

  /**
   * @brief Parse "json" / "text" (anything else falls back to JSON)
   */
  static Format ParseFormat(std::string_view name) { return name == "text" ? Format::kText : Format::kJson; }

  StructuredLog& Event(const std::string& event) {
    event_ = event;
    return *this;
  }

  StructuredLog& Field(const std::string& key, const char* value) { return AddQuoted(key, std::string(value)); }

  StructuredLog& Field(const std::string& key, const std::string& value) { return AddQuoted(key, value); }

  StructuredLog& Field(const std::string& key, std::string_view value) { return AddQuoted(key, std::string(value)); }

  StructuredLog& Field(const std::string& key, int64_t value) { return AddRaw(key, std::to_string(value)); }

  StructuredLog& Field(const std::string& key, uint64_t value) { return AddRaw(key, std::to_string(value)); }

  StructuredLog& Field(const std::string& key, int value) { return AddRaw(key, std::to_string(value)); }

  StructuredLog& Field(const std::string& key, double value) {
    std::ostringstream oss;
    oss << value;
    return AddRaw(key, oss.str());
  }

  StructuredLog& Field(const std::string& key, bool value) { return AddRaw(key, value ? "true" : "false"); }

  /**
   * @brief Optional human-readable context
   */
  StructuredLog& Message(const std::string& message) {
    message_ = message;
    return *this;
  }

  void Error() { spdlog::error("{}", Build()); }
  void Warn() { spdlog::warn("{}", Build()); }
  void Info() { spdlog::info("{}", Build()); }
  void Debug() { spdlog::debug("{}", Build()); }

  /**
   * @brief Render the record without logging it
   */
  std::string Build() const { return GetFormat() == Format::kText ? BuildText() : BuildJson(); }

 private:
  struct FieldEntry {
    std::string key;
    std::string value;
    bool quoted;
  };

  std::string event_;
  std::string message_;
  std::vector<FieldEntry> fields_;

  static std::atomic<Format>& FormatStorage() {
    static std::atomic<Format> format{Format::kJson};
    return format;
  }

  StructuredLog& AddQuoted(const std::string& key, const std::string& value) {
    fields_.push_back({key, value, true});
    return *this;
  }

  StructuredLog& AddRaw(const std::string& key, const std::string& value) {
    fields_.push_back({key, value, false});
    return *this;
  }

  std::string BuildJson() const {
    std::ostringstream json;
    json << "{";
    bool first = true;
    auto append = [&](const std::string& key, const std::string& value, bool quoted) {
      if (!first) {
        json << ",";
      }
      first = false;
      json << "\"" << Escape(key) << "\":";
      if (quoted) {
        json << "\"" << Escape(value) << "\"";
      } else {
        json << value;
      }
    };

    if (!event_.empty()) {
      append("event", event_, true);
    }
    if (!message_.empty()) {
      append("message", message_, true);
    }
    for (const auto& field : fields_) {
      append(field.key, field.value, field.quoted);
    }
    json << "}";
    return json.str();
  }

  std::string BuildText() const {
    std::ostringstream text;
    text << event_;
    if (!message_.empty()) {
      text << ": " << message_;
    }
    for (const auto& field : fields_) {
      text << " " << field.key << "=" << field.value;
    }
    return text.str();
  }

  static std::string Escape(const std::string& str) {
    constexpr char kControlCharThreshold = 0x20;

    std::ostringstream escaped;
    for (char chr : str) {
      switch (chr) {
        case '"':
          escaped << R"(\")";
          break;
        case '\\':
          escaped << R"(\\)";
          break;
        case '\n':
          escaped << R"(\n)";
          break;
        case '\r':
          escaped << R"(\r)";
          break;
        case '\t':
          escaped << R"(\t)";
          break;
        default:
          if (chr >= 0 && chr < kControlCharThreshold) {
            escaped << R"(\u)" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(chr);
          } else {
            escaped << chr;
          }
      }
    }
    return escaped.str();
  }
};

/**
 * @brief Log a fatal decode failure with the position it happened at
 */
inline void LogBinlogDecodeError(const std::string& source, uint64_t offset, const std::string& error_msg) {
  StructuredLog()
      .Event("binlog_decode_error")
      .Field("source", source)
      .Field("offset", offset)
      .Field("error", error_msg)
      .Error();
}

/**
 * @brief Log the totals of a finished walk
 */
inline void LogBinlogWalkSummary(const std::string& source, uint64_t events_read, uint64_t events_delivered,
                                 uint64_t events_skipped, bool success) {
  StructuredLog()
      .Event("binlog_walk_summary")
      .Field("source", source)
      .Field("events_read", events_read)
      .Field("events_delivered", events_delivered)
      .Field("events_skipped", events_skipped)
      .Field("success", success)
      .Info();
}

}  // namespace mybinlog::utils
