/**
 * @file table_map.h
 * @brief Table schema from TABLE_MAP events
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "binlog/bitfield.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace mybinlog::binlog {

/**
 * @brief MySQL column types
 *
 * Based on enum_field_types from MySQL source
 */
enum class ColumnType : uint8_t {
  DECIMAL = 0,        // Pre-5.0 DECIMAL
  TINY = 1,           // TINYINT
  SHORT = 2,          // SMALLINT
  LONG = 3,           // INT
  FLOAT = 4,          // FLOAT
  DOUBLE = 5,         // DOUBLE
  NULL_TYPE = 6,      // NULL
  TIMESTAMP = 7,      // TIMESTAMP
  LONGLONG = 8,       // BIGINT
  INT24 = 9,          // MEDIUMINT
  DATE = 10,          // DATE
  TIME = 11,          // TIME
  DATETIME = 12,      // DATETIME
  YEAR = 13,          // YEAR
  NEWDATE = 14,       // Internal
  VARCHAR = 15,       // VARCHAR
  BIT = 16,           // BIT
  TIMESTAMP2 = 17,    // TIMESTAMP with fractional seconds
  DATETIME2 = 18,     // DATETIME with fractional seconds
  TIME2 = 19,         // TIME with fractional seconds
  JSON = 245,         // JSON
  NEWDECIMAL = 246,   // DECIMAL
  ENUM = 247,         // ENUM
  SET = 248,          // SET
  TINY_BLOB = 249,    // TINYBLOB/TINYTEXT
  MEDIUM_BLOB = 250,  // MEDIUMBLOB/MEDIUMTEXT
  LONG_BLOB = 251,    // LONGBLOB/LONGTEXT
  BLOB = 252,         // BLOB/TEXT
  VAR_STRING = 253,   // VARCHAR/VARBINARY
  STRING = 254,       // CHAR/BINARY
  GEOMETRY = 255      // Spatial types
};

const char* ColumnTypeName(uint8_t type);

// Per-column metadata shapes. Which one a column carries depends on its type.

/// Types without metadata (integers, temporal types without fsp, YEAR, NULL)
struct NoColumnMeta {};

/// VARCHAR / VAR_STRING / DECIMAL / STRING: maximum length in bytes
struct MaxLengthMeta {
  uint16_t max_length = 0;
};

/// BLOB / GEOMETRY / JSON: size of the length prefix; FLOAT / DOUBLE: pack length
struct LengthSizeMeta {
  uint8_t length_size = 0;
};

/// ENUM / SET declared as STRING: real type and pack length
struct EnumSetMeta {
  uint8_t real_type = 0;
  uint16_t size = 0;
};

/// NEWDECIMAL
struct DecimalMeta {
  uint8_t precision = 0;
  uint8_t scale = 0;
};

/// BIT(n)
struct BitMeta {
  uint16_t bits = 0;
  uint16_t bytes = 0;
};

/// TIME2 / DATETIME2 / TIMESTAMP2: fractional seconds precision
struct FspMeta {
  uint8_t fsp = 0;
};

using ColumnMeta = std::variant<NoColumnMeta, MaxLengthMeta, LengthSizeMeta, EnumSetMeta, DecimalMeta, BitMeta, FspMeta>;

/**
 * @brief Table schema announced by a TABLE_MAP event
 */
struct TableSchema {
  uint64_t table_id = 0;
  uint16_t flags = 0;
  std::string schema_name;
  std::string table_name;
  uint64_t column_count = 0;
  std::vector<uint8_t> column_types;
  std::vector<ColumnMeta> column_metas;
  Bitfield null_bitmap;

  bool IsNullable(size_t column) const { return null_bitmap.IsSet(column); }
};

/**
 * @brief Width of the table id field in TABLE_MAP and rows events
 *
 * Servers that announce a 6-byte post-header use a 4-byte table id; all
 * others (and a missing table entry) use 6 bytes.
 */
inline size_t TableIdWidth(std::optional<uint8_t> post_header_length) {
  constexpr uint8_t kShortPostHeader = 6;
  return post_header_length && *post_header_length == kShortPostHeader ? 4 : 6;
}

/**
 * @brief Parse the metadata block of a TABLE_MAP event
 *
 * @param column_types One type code per column
 * @param meta Raw metadata block (without its packed length)
 * @return One entry per column, or kBinlogInvalidBody for an unknown column
 *         type or a block that ends early
 */
utils::Expected<std::vector<ColumnMeta>, utils::Error> DecodeColumnMetadata(const std::vector<uint8_t>& column_types,
                                                                            const std::string& meta);

/**
 * @brief Decode a TABLE_MAP_EVENT body
 *
 * @param body Checksum-trimmed body
 * @param length Body length
 * @param table_id_width 4 or 6, see TableIdWidth()
 * @return Schema, kBinlogTruncated if the body ends early, or
 *         kBinlogInvalidBody when the null bitmap length is not ceil(n/8)
 */
utils::Expected<TableSchema, utils::Error> DecodeTableMapEvent(const uint8_t* body, size_t length,
                                                               size_t table_id_width);

}  // namespace mybinlog::binlog
