/**
 * @file byte_codec.h
 * @brief Bounds-checked readers for the MySQL binlog wire format
 *
 * Fixed-width little-endian integers, length-encoded ("packed") integers and
 * length-prefixed strings. Every reader checks the remaining length first and
 * reports kBinlogTruncated instead of reading past the supplied region.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace mybinlog::binlog {

/**
 * @brief Read 2 bytes in little-endian format
 */
inline uint16_t uint2korr(const uint8_t* ptr) {
  return static_cast<uint16_t>(ptr[0] | (ptr[1] << 8));
}

/**
 * @brief Read 4 bytes in little-endian format
 */
inline uint32_t uint4korr(const uint8_t* ptr) {
  return static_cast<uint32_t>(ptr[0]) | (static_cast<uint32_t>(ptr[1]) << 8) | (static_cast<uint32_t>(ptr[2]) << 16) |
         (static_cast<uint32_t>(ptr[3]) << 24);
}

/// First byte of a packed integer that marks SQL NULL
constexpr uint8_t kPackedNull = 0xFB;
/// Prefix for a 2-byte packed integer
constexpr uint8_t kPacked2Bytes = 0xFC;
/// Prefix for a 3-byte packed integer
constexpr uint8_t kPacked3Bytes = 0xFD;
/// Prefix for an 8-byte packed integer
constexpr uint8_t kPacked8Bytes = 0xFE;

/**
 * @brief Result of decoding a length-encoded integer
 */
struct PackedInt {
  uint64_t value = 0;
  bool is_null = false;  // 0xFB marker; value is 0
  size_t consumed = 0;
};

/**
 * @brief Result of decoding a length-prefixed string
 */
struct PackedString {
  std::string value;
  bool is_null = false;
  size_t consumed = 0;
};

/**
 * @brief Read an unsigned little-endian integer of 1 to 8 bytes
 *
 * @param data Start of the region
 * @param length Bytes available from data
 * @param width Integer width in bytes
 * @return Value, kInvalidArgument for a bad width, kBinlogTruncated if short
 */
utils::Expected<uint64_t, utils::Error> ReadFixedLengthInt(const uint8_t* data, size_t length, size_t width);

/**
 * @brief Read a length-encoded integer
 *
 * Based on MySQL's net_field_length_ll:
 * - first byte <= 0xFA: the byte itself
 * - 0xFB: NULL
 * - 0xFC / 0xFD / 0xFE: 2 / 3 / 8 following bytes
 * - 0xFF: not a valid prefix (kBinlogInvalidBody)
 */
utils::Expected<PackedInt, utils::Error> ReadPackedInt(const uint8_t* data, size_t length);

/**
 * @brief Read a packed length followed by that many raw bytes
 */
utils::Expected<PackedString, utils::Error> ReadPackedString(const uint8_t* data, size_t length);

/**
 * @brief Offset-tracking reader over a borrowed byte region
 *
 * The cursor never owns the bytes. A failed read leaves the position where it
 * was before the call.
 */
class ByteCursor {
 public:
  ByteCursor(const uint8_t* data, size_t size) : data_(data), size_(size) {}
  explicit ByteCursor(const std::vector<uint8_t>& bytes) : data_(bytes.data()), size_(bytes.size()) {}

  size_t Position() const { return pos_; }
  size_t Remaining() const { return size_ - pos_; }
  bool AtEnd() const { return pos_ >= size_; }

  /**
   * @brief Pointer to the next unread byte
   */
  const uint8_t* Current() const { return data_ + pos_; }

  utils::Expected<uint64_t, utils::Error> ReadFixed(size_t width);
  utils::Expected<uint8_t, utils::Error> ReadUint8();
  utils::Expected<uint16_t, utils::Error> ReadUint16();
  utils::Expected<uint32_t, utils::Error> ReadUint32();
  utils::Expected<uint64_t, utils::Error> ReadUint64();

  utils::Expected<PackedInt, utils::Error> ReadPacked();
  utils::Expected<PackedString, utils::Error> ReadPackedString();

  utils::Expected<std::vector<uint8_t>, utils::Error> ReadBytes(size_t count);
  utils::Expected<std::string, utils::Error> ReadString(size_t count);

  /**
   * @brief Read bytes up to (not including) the next NUL and skip the NUL
   */
  utils::Expected<std::string, utils::Error> ReadNullTerminated();

  utils::Expected<void, utils::Error> Skip(size_t count);

  /**
   * @brief Consume and return everything that is left
   */
  std::vector<uint8_t> Rest();

 private:
  utils::Error TruncatedError(const char* what, size_t needed) const;

  const uint8_t* data_;
  size_t size_;
  size_t pos_ = 0;
};

}  // namespace mybinlog::binlog
