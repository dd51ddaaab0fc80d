/**
 * @file format_description.cpp
 * @brief FORMAT_DESCRIPTION_EVENT decoder
 */

#include "binlog/format_description.h"

#include <array>
#include <cctype>

#include "binlog/byte_codec.h"

// NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic,readability-magic-numbers)

namespace mybinlog::binlog {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

using VersionTriple = std::array<unsigned int, 3>;

constexpr VersionTriple kMySQLChecksumVersion = {5, 6, 1};
constexpr VersionTriple kMariaDBChecksumVersion = {5, 3, 0};

/**
 * @brief Parse the leading "major.minor.patch" of a server version string
 *
 * "5.7.44-log" -> {5, 7, 44}; components that are missing read as 0.
 */
std::optional<VersionTriple> ParseVersionTriple(const std::string& version) {
  VersionTriple triple = {0, 0, 0};
  size_t pos = 0;
  for (size_t part = 0; part < triple.size(); ++part) {
    if (pos >= version.size() || std::isdigit(static_cast<unsigned char>(version[pos])) == 0) {
      if (part == 0) {
        return std::nullopt;
      }
      break;
    }
    unsigned int value = 0;
    while (pos < version.size() && std::isdigit(static_cast<unsigned char>(version[pos])) != 0) {
      value = value * 10 + static_cast<unsigned int>(version[pos] - '0');
      ++pos;
    }
    triple[part] = value;
    if (pos < version.size() && version[pos] == '.') {
      ++pos;
    } else {
      break;
    }
  }
  return triple;
}

std::string TrimTrailingNul(const uint8_t* data, size_t length) {
  size_t end = length;
  while (end > 0 && data[end - 1] == 0) {
    --end;
  }
  return {reinterpret_cast<const char*>(data), end};
}

std::string ExtractServerVersion(const uint8_t* body, size_t length) {
  if (length < 2 + kServerVersionLength) {
    return {};
  }
  return TrimTrailingNul(body + 2, kServerVersionLength);
}

}  // namespace

const char* ChecksumAlgorithmName(ChecksumAlgorithm algorithm) {
  switch (algorithm) {
    case ChecksumAlgorithm::kOff:
      return "OFF";
    case ChecksumAlgorithm::kCrc32:
      return "CRC32";
    case ChecksumAlgorithm::kUndefined:
      return "UNDEF";
    default:
      return "UNKNOWN";
  }
}

bool ServerVersionSupportsChecksum(const std::string& server_version) {
  auto triple = ParseVersionTriple(server_version);
  if (!triple) {
    return false;
  }
  const bool is_mariadb = server_version.find("MariaDB") != std::string::npos;
  return *triple >= (is_mariadb ? kMariaDBChecksumVersion : kMySQLChecksumVersion);
}

FormatDescriptionChecksum DetectFormatDescriptionChecksum(const uint8_t* body, size_t length) {
  FormatDescriptionChecksum result;
  if (length < kFormatDescriptionFixedLength + kFormatDescriptionChecksumTrailer) {
    return result;
  }
  if (!ServerVersionSupportsChecksum(ExtractServerVersion(body, length))) {
    return result;
  }

  result.has_trailer = true;
  result.algorithm = static_cast<ChecksumAlgorithm>(body[length - kFormatDescriptionChecksumTrailer]);
  result.enabled = result.algorithm == ChecksumAlgorithm::kCrc32;
  return result;
}

Expected<FormatDescription, Error> DecodeFormatDescription(const uint8_t* body, size_t length) {
  if (length < kFormatDescriptionFixedLength) {
    return MakeUnexpected(MakeError(ErrorCode::kBinlogTruncated, "format description needs " +
                                                                     std::to_string(kFormatDescriptionFixedLength) +
                                                                     " bytes, got " + std::to_string(length)));
  }

  // Length was checked above, so none of these reads can fail
  FormatDescription fd;
  ByteCursor cursor(body, length);
  fd.binlog_version = *cursor.ReadUint16();
  const std::string padded_version = *cursor.ReadString(kServerVersionLength);
  fd.server_version = TrimTrailingNul(reinterpret_cast<const uint8_t*>(padded_version.data()), padded_version.size());
  fd.create_timestamp = static_cast<int64_t>(*cursor.ReadUint32());
  fd.header_length = *cursor.ReadUint8();

  if (fd.binlog_version < 1) {
    return MakeUnexpected(MakeError(ErrorCode::kBinlogInvalidBody, "format description has binlog version 0"));
  }

  const FormatDescriptionChecksum checksum = DetectFormatDescriptionChecksum(body, length);
  size_t table_end = length;
  if (checksum.has_trailer) {
    table_end -= kFormatDescriptionChecksumTrailer;
  }
  fd.post_header_lengths.assign(body + kFormatDescriptionFixedLength, body + table_end);
  fd.checksum_algorithm = checksum.algorithm;
  fd.checksum_enabled = checksum.enabled;
  return fd;
}

}  // namespace mybinlog::binlog

// NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic,readability-magic-numbers)
