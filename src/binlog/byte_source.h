/**
 * @file byte_source.h
 * @brief Sequential byte sources feeding the binlog decoder
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace mybinlog::binlog {

/**
 * @brief Abstract sequential byte source
 *
 * Lets the decoder run over files and in-memory buffers alike, and makes it
 * testable without touching the filesystem.
 */
class ByteSource {
 public:
  virtual ~ByteSource() = default;

  /**
   * @brief Read exactly count bytes
   * @return Bytes, kBinlogEndOfStream if no byte was available, or
   *         kBinlogTruncated if the stream ended part way
   */
  virtual utils::Expected<std::vector<uint8_t>, utils::Error> ReadExactly(size_t count) = 0;

  /**
   * @brief Bytes consumed so far
   */
  virtual uint64_t Offset() const = 0;

  /**
   * @brief Human readable name used in log records
   */
  virtual std::string Name() const = 0;
};

/**
 * @brief Byte source over a binlog file
 */
class FileByteSource : public ByteSource {
 public:
  /**
   * @brief Open a file for reading
   *
   * The file size is taken at open time; reads past it fail without
   * allocating the requested buffer.
   *
   * @return Source, kNotFound / kIOError if the file cannot be opened
   */
  static utils::Expected<std::unique_ptr<FileByteSource>, utils::Error> Open(const std::string& path);

  utils::Expected<std::vector<uint8_t>, utils::Error> ReadExactly(size_t count) override;
  uint64_t Offset() const override { return offset_; }
  std::string Name() const override { return path_; }

 private:
  FileByteSource(std::string path, std::ifstream stream, uint64_t size);

  std::string path_;
  std::ifstream stream_;
  uint64_t size_ = 0;
  uint64_t offset_ = 0;
};

/**
 * @brief Byte source over an owned buffer
 */
class MemoryByteSource : public ByteSource {
 public:
  explicit MemoryByteSource(std::vector<uint8_t> data, std::string name = "memory")
      : data_(std::move(data)), name_(std::move(name)) {}

  utils::Expected<std::vector<uint8_t>, utils::Error> ReadExactly(size_t count) override;
  uint64_t Offset() const override { return position_; }
  std::string Name() const override { return name_; }

 private:
  std::vector<uint8_t> data_;
  std::string name_;
  size_t position_ = 0;
};

}  // namespace mybinlog::binlog
