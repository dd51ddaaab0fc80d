/**
 * @file byte_source.cpp
 * @brief File and memory byte sources
 */

#include "binlog/byte_source.h"

#include <sys/stat.h>

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <utility>

namespace mybinlog::binlog {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

Error ShortRead(size_t requested, size_t got) {
  if (got == 0) {
    return MakeError(ErrorCode::kBinlogEndOfStream, "end of stream");
  }
  return MakeError(ErrorCode::kBinlogTruncated,
                   "requested " + std::to_string(requested) + " bytes, stream ended after " + std::to_string(got));
}

}  // namespace

// ============================================================================
// FileByteSource
// ============================================================================

FileByteSource::FileByteSource(std::string path, std::ifstream stream, uint64_t size)
    : path_(std::move(path)), stream_(std::move(stream)), size_(size) {}

Expected<std::unique_ptr<FileByteSource>, Error> FileByteSource::Open(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) {
    const int err = errno;
    const ErrorCode code = err == ENOENT ? ErrorCode::kNotFound : ErrorCode::kIOError;
    return MakeUnexpected(MakeError(code, "cannot stat binlog file: " + std::string(std::strerror(err)), path));
  }
  if (!S_ISREG(st.st_mode)) {
    return MakeUnexpected(MakeError(ErrorCode::kIOError, "not a regular file", path));
  }

  std::ifstream stream(path, std::ios::binary);
  if (!stream.is_open()) {
    return MakeUnexpected(MakeError(ErrorCode::kIOError, "cannot open binlog file", path));
  }
  return std::unique_ptr<FileByteSource>(
      new FileByteSource(path, std::move(stream), static_cast<uint64_t>(st.st_size)));
}

Expected<std::vector<uint8_t>, Error> FileByteSource::ReadExactly(size_t count) {
  if (count == 0) {
    return std::vector<uint8_t>();
  }

  // A corrupt event size must not turn into a huge allocation
  const uint64_t available = size_ > offset_ ? size_ - offset_ : 0;
  if (count > available) {
    stream_.ignore(static_cast<std::streamsize>(available));
    const auto skipped = static_cast<size_t>(stream_.gcount());
    offset_ += skipped;
    if (stream_.bad()) {
      return MakeUnexpected(MakeError(ErrorCode::kIOError, "read failed", path_));
    }
    return MakeUnexpected(ShortRead(count, skipped));
  }

  std::vector<uint8_t> bytes(count);
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  stream_.read(reinterpret_cast<char*>(bytes.data()), static_cast<std::streamsize>(count));
  const auto got = static_cast<size_t>(stream_.gcount());
  offset_ += got;
  if (got != count) {
    if (stream_.bad()) {
      return MakeUnexpected(MakeError(ErrorCode::kIOError, "read failed", path_));
    }
    return MakeUnexpected(ShortRead(count, got));
  }
  return bytes;
}

// ============================================================================
// MemoryByteSource
// ============================================================================

Expected<std::vector<uint8_t>, Error> MemoryByteSource::ReadExactly(size_t count) {
  const size_t available = data_.size() - position_;
  if (count == 0) {
    return std::vector<uint8_t>();
  }
  if (available < count) {
    position_ = data_.size();
    return MakeUnexpected(ShortRead(count, available));
  }
  // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  std::vector<uint8_t> bytes(data_.begin() + static_cast<std::ptrdiff_t>(position_),
                             data_.begin() + static_cast<std::ptrdiff_t>(position_ + count));
  position_ += count;
  return bytes;
}

}  // namespace mybinlog::binlog
