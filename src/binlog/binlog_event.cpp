/**
 * @file binlog_event.cpp
 * @brief Event body dispatch
 */

#include "binlog/binlog_event.h"

#include <string>
#include <utility>

namespace mybinlog::binlog {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

/**
 * @brief Lift Expected<Payload> into Expected<EventBody>
 */
template <typename Payload>
Expected<EventBody, Error> ToBody(Expected<Payload, Error>&& payload) {
  if (!payload) {
    return MakeUnexpected(std::move(payload).error());
  }
  return EventBody(std::move(*payload));
}

}  // namespace

Expected<EventBody, Error> DecodeEventBody(const EventHeader& header, const uint8_t* body, size_t length,
                                           const DecodeContext& context) {
  const uint8_t type = header.event_type;
  if (!IsKnownEventType(type)) {
    return MakeUnexpected(MakeError(ErrorCode::kBinlogUnknownEventType, "unknown event type " + std::to_string(type),
                                    "log_pos " + std::to_string(header.log_pos)));
  }

  if (IsRowsEvent(type)) {
    return ToBody(DecodeRowsEvent(body, length, type, TableIdWidth(context.PostHeaderLength(type))));
  }

  switch (static_cast<MySQLBinlogEventType>(type)) {
    case MySQLBinlogEventType::FORMAT_DESCRIPTION_EVENT:
      return ToBody(DecodeFormatDescription(body, length));
    case MySQLBinlogEventType::QUERY_EVENT:
      return ToBody(DecodeQueryEvent(body, length, context.BinlogVersion()));
    case MySQLBinlogEventType::XID_EVENT:
      return ToBody(DecodeXidEvent(body, length));
    case MySQLBinlogEventType::INTVAR_EVENT:
      return ToBody(DecodeIntvarEvent(body, length));
    case MySQLBinlogEventType::ROTATE_EVENT:
      return ToBody(DecodeRotateEvent(body, length, context.BinlogVersion()));
    case MySQLBinlogEventType::TABLE_MAP_EVENT:
      return ToBody(DecodeTableMapEvent(body, length, TableIdWidth(context.PostHeaderLength(type))));
    case MySQLBinlogEventType::GTID_LOG_EVENT:
      return ToBody(DecodeGtidEvent(body, length));
    default:
      return EventBody(DecodeUnsupportedEvent(body, length));
  }
}

}  // namespace mybinlog::binlog
