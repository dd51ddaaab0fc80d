/**
 * @file datetime_converter.cpp
 * @brief DateTime string to epoch seconds converter implementation
 */

#include "utils/datetime_converter.h"

#include <algorithm>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace mybinlog::utils {

namespace {

constexpr size_t kTimezoneOffsetLength = 6;  // "+HH:MM"
constexpr size_t kDateTimeLength = 19;       // "YYYY-MM-DD HH:MM:SS"
constexpr size_t kMaxFractionDigits = 6;     // ".ffffff"
constexpr int kDecimalBase = 10;
constexpr int kMaxHour = 23;
constexpr int kMaxMinute = 59;
constexpr int kMaxSecond = 59;
constexpr int kSecondsPerHour = 3600;
constexpr int kSecondsPerMinute = 60;
constexpr int kTmEpochYear = 1900;

inline bool IsLeapYear(int year) {
  return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);  // NOLINT(readability-magic-numbers)
}

int DaysInMonth(int year, int month) {
  // NOLINTNEXTLINE(cppcoreguidelines-avoid-c-arrays,modernize-avoid-c-arrays,readability-magic-numbers)
  static constexpr int kDaysInMonth[] = {0, 31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month < 1 || month > 12) {  // NOLINT(readability-magic-numbers)
    return 0;
  }
  if (month == 2 && IsLeapYear(year)) {
    return 29;  // NOLINT(readability-magic-numbers)
  }
  return kDaysInMonth[month];  // NOLINT(cppcoreguidelines-pro-bounds-constant-array-index)
}

/**
 * @brief Parse a fixed run of digits; -1 if any character is not a digit
 */
int ParseDigits(std::string_view str, size_t pos, size_t count) {
  int value = 0;
  for (size_t i = pos; i < pos + count; ++i) {
    if (str[i] < '0' || str[i] > '9') {
      return -1;
    }
    value = value * kDecimalBase + (str[i] - '0');
  }
  return value;
}

Error InvalidDateTime(std::string_view datetime_str, const char* reason) {
  return MakeError(ErrorCode::kInvalidArgument,
                   std::string("Invalid datetime '") + std::string(datetime_str) + "': " + reason);
}

}  // namespace

// ============================================================================
// TimezoneOffset
// ============================================================================

Expected<TimezoneOffset, Error> TimezoneOffset::Parse(std::string_view offset_str) {
  if (offset_str.size() != kTimezoneOffsetLength) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Invalid timezone offset format (expected +HH:MM)"));
  }

  const char sign = offset_str[0];
  if (sign != '+' && sign != '-') {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Timezone offset must start with + or -"));
  }
  if (offset_str[3] != ':') {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Missing colon separator in timezone offset"));
  }

  const int hours = ParseDigits(offset_str, 1, 2);
  const int minutes = ParseDigits(offset_str, 4, 2);  // NOLINT(readability-magic-numbers)
  if (hours < 0 || hours > kMaxHour) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Hours must be 0-23"));
  }
  if (minutes < 0 || minutes > kMaxMinute) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Minutes must be 0-59"));
  }

  int32_t offset_seconds = hours * kSecondsPerHour + minutes * kSecondsPerMinute;
  if (sign == '-') {
    offset_seconds = -offset_seconds;
  }
  return TimezoneOffset(offset_seconds);
}

std::string TimezoneOffset::ToString() const {
  std::ostringstream oss;
  const int32_t abs_offset = std::abs(offset_seconds_);
  const int hours = abs_offset / kSecondsPerHour;
  const int minutes = (abs_offset % kSecondsPerHour) / kSecondsPerMinute;

  oss << (offset_seconds_ >= 0 ? '+' : '-') << std::setfill('0') << std::setw(2) << hours << ':' << std::setw(2)
      << minutes;
  return oss.str();
}

// ============================================================================
// DateTimeProcessor
// ============================================================================

Expected<int64_t, Error> DateTimeProcessor::DateTimeToEpoch(std::string_view datetime_str) const {
  // "YYYY-MM-DD HH:MM:SS"
  //  0123456789012345678
  if (datetime_str.size() < kDateTimeLength) {
    return MakeUnexpected(InvalidDateTime(datetime_str, "expected YYYY-MM-DD HH:MM:SS"));
  }
  if (datetime_str.size() > kDateTimeLength) {
    // Optional ".ffffff" fraction, ignored after validation
    const std::string_view fraction = datetime_str.substr(kDateTimeLength + 1);
    if (datetime_str[kDateTimeLength] != '.') {
      return MakeUnexpected(InvalidDateTime(datetime_str, "trailing characters"));
    }
    if (fraction.size() > kMaxFractionDigits || !IsNumericString(fraction)) {
      return MakeUnexpected(InvalidDateTime(datetime_str, "fraction must be 1-6 digits"));
    }
  }
  // NOLINTBEGIN(readability-magic-numbers)
  if (datetime_str[4] != '-' || datetime_str[7] != '-' || (datetime_str[10] != ' ' && datetime_str[10] != 'T') ||
      datetime_str[13] != ':' || datetime_str[16] != ':') {
    return MakeUnexpected(InvalidDateTime(datetime_str, "bad separator"));
  }

  const int year = ParseDigits(datetime_str, 0, 4);
  const int month = ParseDigits(datetime_str, 5, 2);
  const int day = ParseDigits(datetime_str, 8, 2);
  const int hour = ParseDigits(datetime_str, 11, 2);
  const int minute = ParseDigits(datetime_str, 14, 2);
  const int second = ParseDigits(datetime_str, 17, 2);
  // NOLINTEND(readability-magic-numbers)

  if (year < 0 || month < 0 || day < 0 || hour < 0 || minute < 0 || second < 0) {
    return MakeUnexpected(InvalidDateTime(datetime_str, "non-digit character"));
  }
  if (day < 1 || day > DaysInMonth(year, month)) {
    return MakeUnexpected(InvalidDateTime(datetime_str, "not a calendar date"));
  }
  if (hour > kMaxHour || minute > kMaxMinute || second > kMaxSecond) {
    return MakeUnexpected(InvalidDateTime(datetime_str, "time out of range"));
  }

  std::tm tm_struct = {};
  tm_struct.tm_year = year - kTmEpochYear;
  tm_struct.tm_mon = month - 1;
  tm_struct.tm_mday = day;
  tm_struct.tm_hour = hour;
  tm_struct.tm_min = minute;
  tm_struct.tm_sec = second;

  // timegm interprets the fields as UTC; the configured offset is applied after
  const std::time_t utc_time = timegm(&tm_struct);
  const int64_t epoch_seconds = static_cast<int64_t>(utc_time) - timezone_.GetOffsetSeconds();
  if (epoch_seconds < 0) {
    return MakeUnexpected(InvalidDateTime(datetime_str, "before 1970-01-01"));
  }
  return epoch_seconds;
}

Expected<int64_t, Error> DateTimeProcessor::TimestampToEpoch(std::string_view timestamp_str) {
  if (!IsNumericString(timestamp_str)) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Invalid timestamp: " + std::string(timestamp_str)));
  }
  try {
    return static_cast<int64_t>(std::stoll(std::string(timestamp_str)));
  } catch (const std::out_of_range&) {
    return MakeUnexpected(MakeError(ErrorCode::kOutOfRange, "Timestamp out of range: " + std::string(timestamp_str)));
  }
}

Expected<int64_t, Error> DateTimeProcessor::ParseDateTimeValue(std::string_view value_str) const {
  if (IsNumericString(value_str)) {
    return TimestampToEpoch(value_str);
  }
  return DateTimeToEpoch(value_str);
}

bool IsNumericString(std::string_view str) {
  if (str.empty()) {
    return false;
  }
  return std::all_of(str.begin(), str.end(), [](char character) { return character >= '0' && character <= '9'; });
}

}  // namespace mybinlog::utils
