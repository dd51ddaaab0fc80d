/**
 * @file format_description.h
 * @brief FORMAT_DESCRIPTION_EVENT payload and checksum policy
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace mybinlog::binlog {

/// Length of the NUL-padded server version field
constexpr size_t kServerVersionLength = 50;
/// binlog_version(2) + server_version(50) + create_timestamp(4) + header_length(1)
constexpr size_t kFormatDescriptionFixedLength = 2 + kServerVersionLength + 4 + 1;
/// Size of the CRC32 value appended to every event when checksums are on
constexpr size_t kChecksumLength = 4;
/// checksum_alg(1) + crc32(4) carried by a checksum-aware format description
constexpr size_t kFormatDescriptionChecksumTrailer = 1 + kChecksumLength;

/**
 * @brief binlog_checksum_alg values (enum_binlog_checksum_alg)
 */
enum class ChecksumAlgorithm : uint8_t {
  kOff = 0,
  kCrc32 = 1,
  kUndefined = 255,
};

const char* ChecksumAlgorithmName(ChecksumAlgorithm algorithm);

/**
 * @brief Decoded FORMAT_DESCRIPTION_EVENT
 */
struct FormatDescription {
  uint16_t binlog_version = 4;
  std::string server_version;
  int64_t create_timestamp = 0;
  uint8_t header_length = 19;
  std::vector<uint8_t> post_header_lengths;  // index = event type - 1
  ChecksumAlgorithm checksum_algorithm = ChecksumAlgorithm::kUndefined;
  bool checksum_enabled = false;

  /**
   * @brief Post-header length announced for an event type, if the table has it
   */
  std::optional<uint8_t> PostHeaderLength(uint8_t event_type) const {
    if (event_type == 0 || event_type > post_header_lengths.size()) {
      return std::nullopt;
    }
    return post_header_lengths[event_type - 1];
  }
};

/**
 * @brief Check whether a server version writes the checksum trailer
 *
 * MySQL added binlog checksums in 5.6.1 and MariaDB in 5.3.0. Versions are
 * compared numerically on major.minor.patch; unparseable versions predate
 * the feature.
 */
bool ServerVersionSupportsChecksum(const std::string& server_version);

/**
 * @brief Checksum policy carried by a raw format description body
 */
struct FormatDescriptionChecksum {
  bool has_trailer = false;  // the last 5 body bytes are alg + crc32
  ChecksumAlgorithm algorithm = ChecksumAlgorithm::kUndefined;
  bool enabled = false;  // trailer present and alg == CRC32
};

/**
 * @brief Inspect a format description body before it is validated
 *
 * The format description announces the policy for itself as well as for
 * every later event, so the walker needs it before running the validator.
 *
 * @param body Event body including any checksum trailer
 * @param length Body length
 */
FormatDescriptionChecksum DetectFormatDescriptionChecksum(const uint8_t* body, size_t length);

/**
 * @brief Decode a format description body
 *
 * Takes the body as stored in the file. When the server version is
 * checksum-aware the trailing alg byte and CRC are excluded from the
 * post-header length table.
 *
 * @return Payload, or kBinlogTruncated if the fixed part is incomplete
 */
utils::Expected<FormatDescription, utils::Error> DecodeFormatDescription(const uint8_t* body, size_t length);

}  // namespace mybinlog::binlog
