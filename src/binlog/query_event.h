/**
 * @file query_event.h
 * @brief QUERY_EVENT payload and status variable decoding
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace mybinlog::binlog {

/**
 * @brief Decoded QUERY_EVENT
 *
 * Status variables are kept as the raw region; DecodeStatusVars() interprets
 * them on request.
 */
struct QueryPayload {
  uint32_t thread_id = 0;
  uint32_t exec_time = 0;
  uint16_t error_code = 0;
  std::string schema;
  std::string query;
  std::vector<uint8_t> status_vars;
};

/**
 * @brief Status variable keys (Query_event_status_vars)
 */
enum class QueryStatusVarKey : uint8_t {
  kFlags2 = 0,
  kSqlMode = 1,
  kCatalog = 2,
  kAutoIncrement = 3,
  kCharset = 4,
  kTimeZone = 5,
  kCatalogNz = 6,
  kLcTimeNames = 7,
  kCharsetDatabase = 8,
  kTableMapForUpdate = 9,
  kMasterDataWritten = 10,
  kInvoker = 11,
  kUpdatedDbNames = 12,
  kMicroseconds = 13,
  kCommitTs = 14,
  kCommitTs2 = 15,
  kExplicitDefaultsForTimestamp = 16,
  kDdlLoggedWithXid = 17,
  kDefaultCollationForUtf8mb4 = 18,
  kSqlRequirePrimaryKey = 19,
  kDefaultTableEncryption = 20,
};

/// Q_UPDATED_DB_NAMES count meaning "too many databases, names omitted"
constexpr uint8_t kOverMaxDbsInEventMts = 254;

/**
 * @brief Status variables decoded from a QUERY_EVENT
 *
 * Only keys that were present are set.
 */
struct QueryStatusVars {
  struct Charset {
    uint16_t client = 0;
    uint16_t collation_connection = 0;
    uint16_t collation_server = 0;
  };

  std::optional<uint32_t> flags2;
  std::optional<uint64_t> sql_mode;
  std::optional<std::string> catalog;
  std::optional<uint16_t> auto_increment_increment;
  std::optional<uint16_t> auto_increment_offset;
  std::optional<Charset> charset;
  std::optional<std::string> time_zone;
  std::optional<uint16_t> lc_time_names;
  std::optional<uint16_t> charset_database;
  std::optional<uint64_t> table_map_for_update;
  std::optional<uint32_t> master_data_written;
  std::optional<std::string> invoker_user;
  std::optional<std::string> invoker_host;
  std::vector<std::string> updated_db_names;
  bool updated_db_names_overflow = false;
  std::optional<uint32_t> microseconds;
  std::optional<uint8_t> explicit_defaults_for_timestamp;
  std::optional<uint64_t> ddl_xid;
  std::optional<uint16_t> default_collation_for_utf8mb4;
  std::optional<uint8_t> sql_require_primary_key;
  std::optional<uint8_t> default_table_encryption;

  std::vector<uint8_t> keys;  // keys in the order they appeared
};

/**
 * @brief Decode a QUERY_EVENT body
 *
 * @param body Checksum-trimmed body
 * @param length Body length
 * @param binlog_version Binlog version from the format description; status
 *        variables exist from version 4 on
 */
utils::Expected<QueryPayload, utils::Error> DecodeQueryEvent(const uint8_t* body, size_t length,
                                                             uint16_t binlog_version);

/**
 * @brief Decode the raw status variable region of a QUERY_EVENT
 *
 * @return Decoded variables, kBinlogUnknownStatusVar for an unrecognized key
 *         or kBinlogTruncated when a value runs past the region
 */
utils::Expected<QueryStatusVars, utils::Error> DecodeStatusVars(const std::vector<uint8_t>& raw);

}  // namespace mybinlog::binlog
