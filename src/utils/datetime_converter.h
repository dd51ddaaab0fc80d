/**
 * @file datetime_converter.h
 * @brief Window boundary parsing: datetime strings to epoch seconds
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "utils/error.h"
#include "utils/expected.h"

namespace mybinlog::utils {

/**
 * @brief Timezone offset value object
 *
 * Represents a timezone offset in hours and minutes from UTC.
 */
class TimezoneOffset {
 public:
  /**
   * @brief Parse timezone offset string
   * @param offset_str String in format "+HH:MM" or "-HH:MM" (e.g., "+09:00", "-05:30")
   * @return TimezoneOffset if valid, kInvalidArgument otherwise
   */
  static Expected<TimezoneOffset, Error> Parse(std::string_view offset_str);

  static TimezoneOffset UTC() { return TimezoneOffset(0); }

  int32_t GetOffsetSeconds() const { return offset_seconds_; }

  /**
   * @brief Get string representation (e.g., "+09:00")
   */
  std::string ToString() const;

 private:
  explicit TimezoneOffset(int32_t offset_seconds) : offset_seconds_(offset_seconds) {}

  int32_t offset_seconds_;
};

/**
 * @brief Converts --start-datetime / --stop-datetime values to epoch seconds
 *
 * Event timestamps in a binlog are UTC epoch seconds; datetime strings are
 * interpreted in the configured timezone.
 */
class DateTimeProcessor {
 public:
  explicit DateTimeProcessor(TimezoneOffset timezone) : timezone_(timezone) {}

  /**
   * @brief Convert a datetime string to epoch seconds
   * @param datetime_str "YYYY-MM-DD HH:MM:SS", "YYYY-MM-DDTHH:MM:SS", optionally
   *        followed by ".ffffff" (ignored)
   */
  Expected<int64_t, Error> DateTimeToEpoch(std::string_view datetime_str) const;

  /**
   * @brief Convert a numeric string of epoch seconds
   */
  static Expected<int64_t, Error> TimestampToEpoch(std::string_view timestamp_str);

  /**
   * @brief Accept either epoch seconds or a datetime string
   */
  Expected<int64_t, Error> ParseDateTimeValue(std::string_view value_str) const;

  const TimezoneOffset& GetTimezone() const { return timezone_; }

 private:
  TimezoneOffset timezone_;
};

/**
 * @brief Check if string contains only digits (and is not empty)
 */
bool IsNumericString(std::string_view str);

}  // namespace mybinlog::utils
