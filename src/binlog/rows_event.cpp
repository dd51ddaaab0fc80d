/**
 * @file rows_event.cpp
 * @brief Rows event decoder
 */

#include "binlog/rows_event.h"

#include <string>

#include "binlog/binlog_event_types.h"
#include "binlog/byte_codec.h"

namespace mybinlog::binlog {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

/// The v2 extra-data length counts its own 2 bytes
constexpr uint16_t kExtraDataLengthSize = 2;

}  // namespace

const char* RowsEventKindName(RowsEventKind kind) {
  switch (kind) {
    case RowsEventKind::kWrite:
      return "write";
    case RowsEventKind::kUpdate:
      return "update";
    case RowsEventKind::kDelete:
      return "delete";
  }
  return "unknown";
}

std::optional<RowsEventInfo> GetRowsEventInfo(uint8_t event_type) {
  switch (static_cast<MySQLBinlogEventType>(event_type)) {
    case MySQLBinlogEventType::PRE_GA_WRITE_ROWS_EVENT:
      return RowsEventInfo{0, RowsEventKind::kWrite};
    case MySQLBinlogEventType::PRE_GA_UPDATE_ROWS_EVENT:
      return RowsEventInfo{0, RowsEventKind::kUpdate};
    case MySQLBinlogEventType::PRE_GA_DELETE_ROWS_EVENT:
      return RowsEventInfo{0, RowsEventKind::kDelete};
    case MySQLBinlogEventType::WRITE_ROWS_EVENT_V1:
      return RowsEventInfo{1, RowsEventKind::kWrite};
    case MySQLBinlogEventType::UPDATE_ROWS_EVENT_V1:
      return RowsEventInfo{1, RowsEventKind::kUpdate};
    case MySQLBinlogEventType::DELETE_ROWS_EVENT_V1:
      return RowsEventInfo{1, RowsEventKind::kDelete};
    case MySQLBinlogEventType::WRITE_ROWS_EVENT:
      return RowsEventInfo{2, RowsEventKind::kWrite};
    case MySQLBinlogEventType::UPDATE_ROWS_EVENT:
      return RowsEventInfo{2, RowsEventKind::kUpdate};
    case MySQLBinlogEventType::DELETE_ROWS_EVENT:
      return RowsEventInfo{2, RowsEventKind::kDelete};
    default:
      return std::nullopt;
  }
}

Expected<RowsEventPayload, Error> DecodeRowsEvent(const uint8_t* body, size_t length, uint8_t event_type,
                                                  size_t table_id_width) {
  auto info = GetRowsEventInfo(event_type);
  if (!info) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, std::string(GetEventTypeName(event_type)) +
                                                                     " is not a rows event"));
  }

  RowsEventPayload payload;
  payload.version = info->version;
  payload.kind = info->kind;

  ByteCursor cursor(body, length);
  auto table_id = cursor.ReadFixed(table_id_width);
  if (!table_id) {
    return MakeUnexpected(table_id.error());
  }
  payload.table_id = *table_id;

  auto flags = cursor.ReadUint16();
  if (!flags) {
    return MakeUnexpected(flags.error());
  }
  payload.flags = *flags;

  if (payload.version == 2) {
    auto extra_length = cursor.ReadUint16();
    if (!extra_length) {
      return MakeUnexpected(extra_length.error());
    }
    if (*extra_length < kExtraDataLengthSize) {
      return MakeUnexpected(MakeError(ErrorCode::kBinlogInvalidBody,
                                      "extra data length " + std::to_string(*extra_length) + " is below 2"));
    }
    auto extra_data = cursor.ReadBytes(*extra_length - kExtraDataLengthSize);
    if (!extra_data) {
      return MakeUnexpected(extra_data.error());
    }
    payload.extra_data = std::move(*extra_data);
  }

  auto column_count = cursor.ReadPacked();
  if (!column_count) {
    return MakeUnexpected(column_count.error());
  }
  if (column_count->is_null) {
    return MakeUnexpected(MakeError(ErrorCode::kBinlogInvalidBody, "rows event column count is NULL"));
  }
  payload.column_count = column_count->value;

  // A bitmap cannot be longer than the body that carries it
  if (payload.column_count / 8 > cursor.Remaining()) {
    return MakeUnexpected(MakeError(ErrorCode::kBinlogTruncated,
                                    "column bitmap for " + std::to_string(payload.column_count) +
                                        " columns exceeds remaining " + std::to_string(cursor.Remaining()) + " bytes"));
  }
  const auto columns = static_cast<size_t>(payload.column_count);
  const size_t bitmap_length = BitmapBytes(columns);

  auto present = cursor.ReadBytes(bitmap_length);
  if (!present) {
    return MakeUnexpected(present.error());
  }
  payload.columns_present = Bitfield(std::move(*present), columns);

  // Only v1 / v2 UPDATE carry the after-image bitmap
  if (payload.kind == RowsEventKind::kUpdate && payload.version >= 1) {
    auto after = cursor.ReadBytes(bitmap_length);
    if (!after) {
      return MakeUnexpected(after.error());
    }
    payload.columns_after_image = Bitfield(std::move(*after), columns);
  }

  payload.rows_data = cursor.Rest();
  return payload;
}

}  // namespace mybinlog::binlog
