/**
 * @file bitfield.h
 * @brief Packed column bitmaps used by TABLE_MAP and rows events
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace mybinlog::binlog {

/**
 * @brief Calculate number of bytes needed for bitmap
 */
inline size_t BitmapBytes(size_t bit_count) {
  return (bit_count + 7) / 8;
}

/**
 * @brief Bit set packed low-to-high within each byte, first byte first
 */
class Bitfield {
 public:
  Bitfield() = default;
  Bitfield(std::vector<uint8_t> bytes, size_t bit_count) : bytes_(std::move(bytes)), bit_count_(bit_count) {}

  /**
   * @brief Check if bit is set; indexes past the end read as unset
   */
  bool IsSet(size_t index) const {
    if (index >= bit_count_ || index / 8 >= bytes_.size()) {
      return false;
    }
    return ((bytes_[index / 8] >> (index % 8)) & 1) != 0;
  }

  size_t Size() const { return bit_count_; }

  size_t CountSet() const {
    size_t count = 0;
    for (size_t i = 0; i < bit_count_; ++i) {
      if (IsSet(i)) {
        ++count;
      }
    }
    return count;
  }

  const std::vector<uint8_t>& Bytes() const { return bytes_; }

 private:
  std::vector<uint8_t> bytes_;
  size_t bit_count_ = 0;
};

}  // namespace mybinlog::binlog
