/**
 * @file byte_codec.cpp
 * @brief Primitive binlog readers
 */

#include "binlog/byte_codec.h"

#include <cstring>

// NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic,readability-magic-numbers)

namespace mybinlog::binlog {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

constexpr size_t kMaxFixedWidth = 8;

Error Truncated(const char* what, size_t needed, size_t available) {
  return MakeError(ErrorCode::kBinlogTruncated, std::string(what) + ": need " + std::to_string(needed) +
                                                    " bytes, " + std::to_string(available) + " available");
}

}  // namespace

Expected<uint64_t, Error> ReadFixedLengthInt(const uint8_t* data, size_t length, size_t width) {
  if (width == 0 || width > kMaxFixedWidth) {
    return MakeUnexpected(
        MakeError(ErrorCode::kInvalidArgument, "fixed-length integer width must be 1..8, got " + std::to_string(width)));
  }
  if (length < width) {
    return MakeUnexpected(Truncated("fixed-length integer", width, length));
  }

  uint64_t value = 0;
  for (size_t i = 0; i < width; ++i) {
    value |= static_cast<uint64_t>(data[i]) << (i * 8);
  }
  return value;
}

Expected<PackedInt, Error> ReadPackedInt(const uint8_t* data, size_t length) {
  if (length == 0) {
    return MakeUnexpected(Truncated("packed integer", 1, 0));
  }

  PackedInt result;
  const uint8_t first = data[0];

  if (first < kPackedNull) {
    result.value = first;
    result.consumed = 1;
    return result;
  }
  if (first == kPackedNull) {
    result.is_null = true;
    result.consumed = 1;
    return result;
  }

  size_t width = 0;
  switch (first) {
    case kPacked2Bytes:
      width = 2;
      break;
    case kPacked3Bytes:
      width = 3;
      break;
    case kPacked8Bytes:
      width = 8;
      break;
    default:
      return MakeUnexpected(MakeError(ErrorCode::kBinlogInvalidBody, "invalid packed integer prefix 0xFF"));
  }

  auto value = ReadFixedLengthInt(data + 1, length - 1, width);
  if (!value) {
    return MakeUnexpected(Truncated("packed integer", width + 1, length));
  }
  result.value = *value;
  result.consumed = width + 1;
  return result;
}

Expected<PackedString, Error> ReadPackedString(const uint8_t* data, size_t length) {
  auto len = ReadPackedInt(data, length);
  if (!len) {
    return MakeUnexpected(len.error());
  }

  PackedString result;
  if (len->is_null) {
    result.is_null = true;
    result.consumed = len->consumed;
    return result;
  }

  const size_t available = length - len->consumed;
  if (len->value > available) {
    return MakeUnexpected(Truncated("packed string", static_cast<size_t>(len->value), available));
  }
  const auto str_len = static_cast<size_t>(len->value);
  result.value.assign(reinterpret_cast<const char*>(data + len->consumed), str_len);
  result.consumed = len->consumed + str_len;
  return result;
}

// ============================================================================
// ByteCursor
// ============================================================================

Error ByteCursor::TruncatedError(const char* what, size_t needed) const {
  Error base = Truncated(what, needed, Remaining());
  return MakeError(base.code(), base.message(), "offset " + std::to_string(pos_));
}

Expected<uint64_t, Error> ByteCursor::ReadFixed(size_t width) {
  auto value = ReadFixedLengthInt(Current(), Remaining(), width);
  if (!value) {
    if (value.error().code() == ErrorCode::kBinlogTruncated) {
      return MakeUnexpected(TruncatedError("fixed-length integer", width));
    }
    return MakeUnexpected(value.error());
  }
  pos_ += width;
  return value;
}

Expected<uint8_t, Error> ByteCursor::ReadUint8() {
  if (Remaining() < 1) {
    return MakeUnexpected(TruncatedError("uint8", 1));
  }
  return data_[pos_++];
}

Expected<uint16_t, Error> ByteCursor::ReadUint16() {
  if (Remaining() < 2) {
    return MakeUnexpected(TruncatedError("uint16", 2));
  }
  uint16_t value = uint2korr(Current());
  pos_ += 2;
  return value;
}

Expected<uint32_t, Error> ByteCursor::ReadUint32() {
  if (Remaining() < 4) {
    return MakeUnexpected(TruncatedError("uint32", 4));
  }
  uint32_t value = uint4korr(Current());
  pos_ += 4;
  return value;
}

Expected<uint64_t, Error> ByteCursor::ReadUint64() {
  return ReadFixed(8);
}

Expected<PackedInt, Error> ByteCursor::ReadPacked() {
  auto packed = ReadPackedInt(Current(), Remaining());
  if (!packed) {
    return MakeUnexpected(MakeError(packed.error().code(), packed.error().message(), "offset " + std::to_string(pos_)));
  }
  pos_ += packed->consumed;
  return packed;
}

Expected<PackedString, Error> ByteCursor::ReadPackedString() {
  auto str = binlog::ReadPackedString(Current(), Remaining());
  if (!str) {
    return MakeUnexpected(MakeError(str.error().code(), str.error().message(), "offset " + std::to_string(pos_)));
  }
  pos_ += str->consumed;
  return str;
}

Expected<std::vector<uint8_t>, Error> ByteCursor::ReadBytes(size_t count) {
  if (Remaining() < count) {
    return MakeUnexpected(TruncatedError("byte run", count));
  }
  std::vector<uint8_t> bytes(Current(), Current() + count);
  pos_ += count;
  return bytes;
}

Expected<std::string, Error> ByteCursor::ReadString(size_t count) {
  if (Remaining() < count) {
    return MakeUnexpected(TruncatedError("string", count));
  }
  std::string str(reinterpret_cast<const char*>(Current()), count);
  pos_ += count;
  return str;
}

Expected<std::string, Error> ByteCursor::ReadNullTerminated() {
  const void* nul = std::memchr(Current(), 0, Remaining());
  if (nul == nullptr) {
    return MakeUnexpected(TruncatedError("NUL-terminated string", Remaining() + 1));
  }
  const auto len = static_cast<size_t>(static_cast<const uint8_t*>(nul) - Current());
  std::string str(reinterpret_cast<const char*>(Current()), len);
  pos_ += len + 1;
  return str;
}

Expected<void, Error> ByteCursor::Skip(size_t count) {
  if (Remaining() < count) {
    return MakeUnexpected(TruncatedError("skip", count));
  }
  pos_ += count;
  return {};
}

std::vector<uint8_t> ByteCursor::Rest() {
  std::vector<uint8_t> rest(Current(), data_ + size_);
  pos_ = size_;
  return rest;
}

}  // namespace mybinlog::binlog

// NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic,readability-magic-numbers)
