/**
 * @file simple_events.cpp
 * @brief XID / INTVAR / ROTATE / GTID decoders
 */

#include "binlog/simple_events.h"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

#include "binlog/byte_codec.h"

// NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic,readability-magic-numbers)

namespace mybinlog::binlog {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

Error TooShort(const char* event, size_t needed, size_t length) {
  return MakeError(ErrorCode::kBinlogTruncated, std::string(event) + " needs " + std::to_string(needed) +
                                                    " bytes, got " + std::to_string(length));
}

std::string TrimWhitespace(const std::string& str) {
  size_t begin = 0;
  size_t end = str.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(str[begin])) != 0) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(str[end - 1])) != 0) {
    --end;
  }
  return str.substr(begin, end - begin);
}

}  // namespace

const char* IntvarTypeName(uint8_t type) {
  switch (static_cast<IntvarType>(type)) {
    case IntvarType::kLastInsertId:
      return "LAST_INSERT_ID";
    case IntvarType::kInsertId:
      return "INSERT_ID";
    default:
      return "INVALID_INT";
  }
}

std::string GtidPayload::ToString() const {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (size_t i = 0; i < sid.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      oss << '-';
    }
    oss << std::setw(2) << static_cast<int>(sid[i]);
  }
  oss << std::dec << ':' << gno;
  return oss.str();
}

Expected<XidPayload, Error> DecodeXidEvent(const uint8_t* body, size_t length) {
  auto xid = ReadFixedLengthInt(body, length, 8);
  if (!xid) {
    return MakeUnexpected(TooShort("XID event", 8, length));
  }
  XidPayload payload;
  payload.xid = *xid;
  return payload;
}

Expected<IntvarPayload, Error> DecodeIntvarEvent(const uint8_t* body, size_t length) {
  if (length < 9) {
    return MakeUnexpected(TooShort("INTVAR event", 9, length));
  }
  ByteCursor cursor(body, length);
  IntvarPayload payload;
  payload.type = *cursor.ReadUint8();
  payload.value = *cursor.ReadUint64();
  return payload;
}

Expected<RotatePayload, Error> DecodeRotateEvent(const uint8_t* body, size_t length, uint16_t binlog_version) {
  ByteCursor cursor(body, length);
  RotatePayload payload;
  if (binlog_version > 1) {
    auto position = cursor.ReadUint64();
    if (!position) {
      return MakeUnexpected(TooShort("ROTATE event", 8, length));
    }
    payload.position = *position;
  }
  const auto rest = cursor.Rest();
  payload.next_file = TrimWhitespace(std::string(rest.begin(), rest.end()));
  return payload;
}

Expected<GtidPayload, Error> DecodeGtidEvent(const uint8_t* body, size_t length) {
  // flags(1) sid(16) gno(8)
  constexpr size_t kGtidFixedLength = 1 + 16 + 8;
  if (length < kGtidFixedLength) {
    return MakeUnexpected(TooShort("GTID event", kGtidFixedLength, length));
  }
  GtidPayload payload;
  payload.flags = body[0];
  std::copy(body + 1, body + 17, payload.sid.begin());
  payload.gno = *ReadFixedLengthInt(body + 17, 8, 8);
  return payload;
}

UnsupportedPayload DecodeUnsupportedEvent(const uint8_t* body, size_t length) {
  UnsupportedPayload payload;
  if (body != nullptr) {
    payload.data.assign(body, body + length);
  }
  return payload;
}

}  // namespace mybinlog::binlog

// NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic,readability-magic-numbers)
