/**
 * @file binlog_event.h
 * @brief Decoded binlog event and body dispatch
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <variant>

#include "binlog/binlog_event_types.h"
#include "binlog/decode_context.h"
#include "binlog/event_header.h"
#include "binlog/event_validator.h"
#include "binlog/format_description.h"
#include "binlog/query_event.h"
#include "binlog/rows_event.h"
#include "binlog/simple_events.h"
#include "binlog/table_map.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace mybinlog::binlog {

/**
 * @brief Payload of a decoded event, one alternative per supported type
 */
using EventBody = std::variant<FormatDescription, QueryPayload, XidPayload, IntvarPayload, RotatePayload, TableSchema,
                               RowsEventPayload, GtidPayload, UnsupportedPayload>;

/**
 * @brief One decoded binlog event
 */
struct Event {
  EventHeader header;
  EventBody body;
  std::optional<EventChecksum> checksum;

  MySQLBinlogEventType Type() const { return static_cast<MySQLBinlogEventType>(header.event_type); }
  const char* TypeName() const { return GetEventTypeName(header.event_type); }
};

/**
 * @brief Decode the body of an event
 *
 * Version-dependent values (binlog version, table id width) come from the
 * context; the context itself is not modified.
 *
 * @param header Decoded header
 * @param body Checksum-trimmed body, except for FORMAT_DESCRIPTION_EVENT which
 *        takes the body as stored (see DecodeFormatDescription())
 * @param length Body length
 * @param context Current decode context
 * @return Body, or kBinlogUnknownEventType for unrecognized type codes
 */
utils::Expected<EventBody, utils::Error> DecodeEventBody(const EventHeader& header, const uint8_t* body, size_t length,
                                                         const DecodeContext& context);

}  // namespace mybinlog::binlog
