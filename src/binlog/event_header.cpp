/**
 * @file event_header.cpp
 * @brief Event header codec
 */

#include "binlog/event_header.h"

#include <string>

#include "binlog/byte_codec.h"

namespace mybinlog::binlog {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

Expected<EventHeader, Error> DecodeEventHeader(const uint8_t* data, size_t length, size_t header_width) {
  if (header_width < kLegacyEventHeaderLength ||
      (header_width > kLegacyEventHeaderLength && header_width < kEventHeaderLength)) {
    return MakeUnexpected(
        MakeError(ErrorCode::kBinlogInvalidHeader, "unsupported header width " + std::to_string(header_width)));
  }
  if (data == nullptr || length < header_width) {
    return MakeUnexpected(MakeError(ErrorCode::kBinlogInvalidHeader, "need " + std::to_string(header_width) +
                                                                         " header bytes, got " +
                                                                         std::to_string(data == nullptr ? 0 : length)));
  }

  // Width was checked above, so none of these reads can fail
  ByteCursor cursor(data, header_width);
  EventHeader header;
  header.timestamp = static_cast<int64_t>(*cursor.ReadUint32());
  header.event_type = *cursor.ReadUint8();
  header.server_id = static_cast<int64_t>(*cursor.ReadUint32());
  header.event_size = *cursor.ReadUint32();

  if (header_width > kLegacyEventHeaderLength) {
    header.log_pos = *cursor.ReadUint32();
    header.flags = *cursor.ReadUint16();
  }
  return header;
}

}  // namespace mybinlog::binlog
