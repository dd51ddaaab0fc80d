/**
 * @file event_validator.cpp
 * @brief Event validation
 */

#include "binlog/event_validator.h"

#include <zlib.h>

#include <string>

#include "binlog/byte_codec.h"

namespace mybinlog::binlog {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

uint32_t ComputeEventChecksum(const uint8_t* header, size_t header_length, const uint8_t* body, size_t body_length) {
  uLong crc = crc32(0L, Z_NULL, 0);
  crc = crc32(crc, header, static_cast<uInt>(header_length));
  if (body_length > 0) {
    crc = crc32(crc, body, static_cast<uInt>(body_length));
  }
  return static_cast<uint32_t>(crc);
}

Expected<ValidatedFrame, Error> ValidateEventFrame(const uint8_t* header, size_t header_length, const uint8_t* body,
                                                   size_t body_length, uint32_t event_size, bool checksum_enabled,
                                                   ChecksumAlgorithm algorithm) {
  if (header_length + body_length != event_size) {
    return MakeUnexpected(MakeError(ErrorCode::kBinlogSizeMismatch,
                                    "event size " + std::to_string(event_size) + " but got " +
                                        std::to_string(header_length + body_length) + " bytes"));
  }

  ValidatedFrame frame;
  frame.body_length = body_length;
  if (!checksum_enabled) {
    return frame;
  }

  if (body_length < kChecksumLength) {
    return MakeUnexpected(MakeError(ErrorCode::kBinlogTruncated, "event body of " + std::to_string(body_length) +
                                                                     " bytes cannot hold a checksum"));
  }

  const size_t trimmed = body_length - kChecksumLength;
  const uint32_t stored = uint4korr(body + trimmed);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  const uint32_t computed = ComputeEventChecksum(header, header_length, body, trimmed);
  if (stored != computed) {
    return MakeUnexpected(MakeError(ErrorCode::kBinlogChecksumMismatch,
                                    "stored crc32 " + std::to_string(stored) + ", computed " + std::to_string(computed)));
  }

  frame.body_length = trimmed;
  frame.checksum = EventChecksum{algorithm, stored};
  return frame;
}

}  // namespace mybinlog::binlog
