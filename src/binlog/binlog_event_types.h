/**
 * @file binlog_event_types.h
 * @brief MySQL binlog event type definitions
 *
 * Event type codes follow enum Log_event_type from the MySQL server sources
 * (libbinlogevents). Codes 20-22 are the pre-GA (v0) rows events. MariaDB
 * numbers its own events from 160 up.
 */

#pragma once

#include <cstdint>

namespace mybinlog::binlog {

/**
 * @brief MySQL binlog event types
 */
enum class MySQLBinlogEventType : uint8_t {
  UNKNOWN_EVENT = 0,
  START_EVENT_V3 = 1,
  QUERY_EVENT = 2,
  STOP_EVENT = 3,
  ROTATE_EVENT = 4,
  INTVAR_EVENT = 5,
  LOAD_EVENT = 6,
  SLAVE_EVENT = 7,
  CREATE_FILE_EVENT = 8,
  APPEND_BLOCK_EVENT = 9,
  EXEC_LOAD_EVENT = 10,
  DELETE_FILE_EVENT = 11,
  NEW_LOAD_EVENT = 12,
  RAND_EVENT = 13,
  USER_VAR_EVENT = 14,
  FORMAT_DESCRIPTION_EVENT = 15,
  XID_EVENT = 16,
  BEGIN_LOAD_QUERY_EVENT = 17,
  EXECUTE_LOAD_QUERY_EVENT = 18,
  TABLE_MAP_EVENT = 19,

  // Pre-GA rows events (5.1.0 - 5.1.15)
  PRE_GA_WRITE_ROWS_EVENT = 20,
  PRE_GA_UPDATE_ROWS_EVENT = 21,
  PRE_GA_DELETE_ROWS_EVENT = 22,

  // V1 rows events
  WRITE_ROWS_EVENT_V1 = 23,
  UPDATE_ROWS_EVENT_V1 = 24,
  DELETE_ROWS_EVENT_V1 = 25,

  INCIDENT_EVENT = 26,
  HEARTBEAT_LOG_EVENT = 27,
  IGNORABLE_LOG_EVENT = 28,
  ROWS_QUERY_LOG_EVENT = 29,

  // V2 rows events (current format)
  WRITE_ROWS_EVENT = 30,
  UPDATE_ROWS_EVENT = 31,
  DELETE_ROWS_EVENT = 32,

  GTID_LOG_EVENT = 33,
  ANONYMOUS_GTID_LOG_EVENT = 34,
  PREVIOUS_GTIDS_LOG_EVENT = 35,
  TRANSACTION_CONTEXT_EVENT = 36,
  VIEW_CHANGE_EVENT = 37,
  XA_PREPARE_LOG_EVENT = 38,
  PARTIAL_UPDATE_ROWS_EVENT = 39,
  TRANSACTION_PAYLOAD_EVENT = 40,
  HEARTBEAT_LOG_EVENT_V2 = 41,
  GTID_TAGGED_LOG_EVENT = 42,

  // MariaDB events
  ANNOTATE_ROWS_EVENT = 160,
  BINLOG_CHECKPOINT_EVENT = 161,
  GTID_EVENT = 162,
  GTID_LIST_EVENT = 163,
  START_ENCRYPTION_EVENT = 164,
};

/// Highest MySQL event type code this decoder recognizes
constexpr uint8_t kMaxKnownEventType = static_cast<uint8_t>(MySQLBinlogEventType::GTID_TAGGED_LOG_EVENT);

/// MariaDB event type range this decoder recognizes
constexpr uint8_t kMinMariaDBEventType = static_cast<uint8_t>(MySQLBinlogEventType::ANNOTATE_ROWS_EVENT);
constexpr uint8_t kMaxMariaDBEventType = static_cast<uint8_t>(MySQLBinlogEventType::START_ENCRYPTION_EVENT);

/**
 * @brief Check whether an event type code is recognized
 *
 * UNKNOWN_EVENT (0), codes between kMaxKnownEventType and the MariaDB range,
 * and MariaDB codes past START_ENCRYPTION_EVENT (the compressed events) are
 * not recognized.
 */
inline bool IsKnownEventType(uint8_t code) {
  if (code >= kMinMariaDBEventType) {
    return code <= kMaxMariaDBEventType;
  }
  return code != 0 && code <= kMaxKnownEventType;
}

/**
 * @brief Get event type name as string
 */
inline const char* GetEventTypeName(MySQLBinlogEventType type) {
  switch (type) {
    case MySQLBinlogEventType::UNKNOWN_EVENT: return "UNKNOWN_EVENT";
    case MySQLBinlogEventType::START_EVENT_V3: return "START_EVENT_V3";
    case MySQLBinlogEventType::QUERY_EVENT: return "QUERY_EVENT";
    case MySQLBinlogEventType::STOP_EVENT: return "STOP_EVENT";
    case MySQLBinlogEventType::ROTATE_EVENT: return "ROTATE_EVENT";
    case MySQLBinlogEventType::INTVAR_EVENT: return "INTVAR_EVENT";
    case MySQLBinlogEventType::LOAD_EVENT: return "LOAD_EVENT";
    case MySQLBinlogEventType::SLAVE_EVENT: return "SLAVE_EVENT";
    case MySQLBinlogEventType::CREATE_FILE_EVENT: return "CREATE_FILE_EVENT";
    case MySQLBinlogEventType::APPEND_BLOCK_EVENT: return "APPEND_BLOCK_EVENT";
    case MySQLBinlogEventType::EXEC_LOAD_EVENT: return "EXEC_LOAD_EVENT";
    case MySQLBinlogEventType::DELETE_FILE_EVENT: return "DELETE_FILE_EVENT";
    case MySQLBinlogEventType::NEW_LOAD_EVENT: return "NEW_LOAD_EVENT";
    case MySQLBinlogEventType::RAND_EVENT: return "RAND_EVENT";
    case MySQLBinlogEventType::USER_VAR_EVENT: return "USER_VAR_EVENT";
    case MySQLBinlogEventType::FORMAT_DESCRIPTION_EVENT: return "FORMAT_DESCRIPTION_EVENT";
    case MySQLBinlogEventType::XID_EVENT: return "XID_EVENT";
    case MySQLBinlogEventType::BEGIN_LOAD_QUERY_EVENT: return "BEGIN_LOAD_QUERY_EVENT";
    case MySQLBinlogEventType::EXECUTE_LOAD_QUERY_EVENT: return "EXECUTE_LOAD_QUERY_EVENT";
    case MySQLBinlogEventType::TABLE_MAP_EVENT: return "TABLE_MAP_EVENT";
    case MySQLBinlogEventType::PRE_GA_WRITE_ROWS_EVENT: return "PRE_GA_WRITE_ROWS_EVENT";
    case MySQLBinlogEventType::PRE_GA_UPDATE_ROWS_EVENT: return "PRE_GA_UPDATE_ROWS_EVENT";
    case MySQLBinlogEventType::PRE_GA_DELETE_ROWS_EVENT: return "PRE_GA_DELETE_ROWS_EVENT";
    case MySQLBinlogEventType::WRITE_ROWS_EVENT_V1: return "WRITE_ROWS_EVENT_V1";
    case MySQLBinlogEventType::UPDATE_ROWS_EVENT_V1: return "UPDATE_ROWS_EVENT_V1";
    case MySQLBinlogEventType::DELETE_ROWS_EVENT_V1: return "DELETE_ROWS_EVENT_V1";
    case MySQLBinlogEventType::INCIDENT_EVENT: return "INCIDENT_EVENT";
    case MySQLBinlogEventType::HEARTBEAT_LOG_EVENT: return "HEARTBEAT_LOG_EVENT";
    case MySQLBinlogEventType::IGNORABLE_LOG_EVENT: return "IGNORABLE_LOG_EVENT";
    case MySQLBinlogEventType::ROWS_QUERY_LOG_EVENT: return "ROWS_QUERY_LOG_EVENT";
    case MySQLBinlogEventType::WRITE_ROWS_EVENT: return "WRITE_ROWS_EVENT";
    case MySQLBinlogEventType::UPDATE_ROWS_EVENT: return "UPDATE_ROWS_EVENT";
    case MySQLBinlogEventType::DELETE_ROWS_EVENT: return "DELETE_ROWS_EVENT";
    case MySQLBinlogEventType::GTID_LOG_EVENT: return "GTID_LOG_EVENT";
    case MySQLBinlogEventType::ANONYMOUS_GTID_LOG_EVENT: return "ANONYMOUS_GTID_LOG_EVENT";
    case MySQLBinlogEventType::PREVIOUS_GTIDS_LOG_EVENT: return "PREVIOUS_GTIDS_LOG_EVENT";
    case MySQLBinlogEventType::TRANSACTION_CONTEXT_EVENT: return "TRANSACTION_CONTEXT_EVENT";
    case MySQLBinlogEventType::VIEW_CHANGE_EVENT: return "VIEW_CHANGE_EVENT";
    case MySQLBinlogEventType::XA_PREPARE_LOG_EVENT: return "XA_PREPARE_LOG_EVENT";
    case MySQLBinlogEventType::PARTIAL_UPDATE_ROWS_EVENT: return "PARTIAL_UPDATE_ROWS_EVENT";
    case MySQLBinlogEventType::TRANSACTION_PAYLOAD_EVENT: return "TRANSACTION_PAYLOAD_EVENT";
    case MySQLBinlogEventType::HEARTBEAT_LOG_EVENT_V2: return "HEARTBEAT_LOG_EVENT_V2";
    case MySQLBinlogEventType::GTID_TAGGED_LOG_EVENT: return "GTID_TAGGED_LOG_EVENT";
    case MySQLBinlogEventType::ANNOTATE_ROWS_EVENT: return "ANNOTATE_ROWS_EVENT";
    case MySQLBinlogEventType::BINLOG_CHECKPOINT_EVENT: return "BINLOG_CHECKPOINT_EVENT";
    case MySQLBinlogEventType::GTID_EVENT: return "GTID_EVENT";
    case MySQLBinlogEventType::GTID_LIST_EVENT: return "GTID_LIST_EVENT";
    case MySQLBinlogEventType::START_ENCRYPTION_EVENT: return "START_ENCRYPTION_EVENT";
    default: return "UNKNOWN";
  }
}

/**
 * @brief Get event type name from a raw type code
 */
inline const char* GetEventTypeName(uint8_t code) {
  return GetEventTypeName(static_cast<MySQLBinlogEventType>(code));
}

}  // namespace mybinlog::binlog
