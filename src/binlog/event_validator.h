/**
 * @file event_validator.h
 * @brief Event size and CRC32 checksum validation
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>

#include "binlog/format_description.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace mybinlog::binlog {

/**
 * @brief Checksum carried by an event
 */
struct EventChecksum {
  ChecksumAlgorithm algorithm = ChecksumAlgorithm::kCrc32;
  uint32_t value = 0;
};

/**
 * @brief Outcome of validating one event
 */
struct ValidatedFrame {
  size_t body_length = 0;  // body bytes left for the decoder
  std::optional<EventChecksum> checksum;
};

/**
 * @brief Check the size of an event and verify its checksum
 *
 * When checksums are enabled the last 4 body bytes are the CRC32 of
 * header + remaining body. They are excluded from body_length.
 *
 * @param header Header bytes
 * @param header_length Header length
 * @param body Body bytes
 * @param body_length Body length
 * @param event_size event_size from the header
 * @param checksum_enabled Whether a CRC32 trailer is present
 * @param algorithm Algorithm recorded in the result
 * @return Frame, or kBinlogSizeMismatch / kBinlogTruncated / kBinlogChecksumMismatch
 */
utils::Expected<ValidatedFrame, utils::Error> ValidateEventFrame(const uint8_t* header, size_t header_length,
                                                                 const uint8_t* body, size_t body_length,
                                                                 uint32_t event_size, bool checksum_enabled,
                                                                 ChecksumAlgorithm algorithm = ChecksumAlgorithm::kCrc32);

/**
 * @brief CRC32 of header followed by body
 */
uint32_t ComputeEventChecksum(const uint8_t* header, size_t header_length, const uint8_t* body, size_t body_length);

}  // namespace mybinlog::binlog
