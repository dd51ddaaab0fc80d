/**
 * @file binlog_test_builder.h
 * @brief Helpers that assemble binlog events and streams for unit tests
 */

#pragma once

#include <zlib.h>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "binlog/binlog_event_types.h"

namespace mybinlog::binlog::testing {

using Bytes = std::vector<uint8_t>;

inline void PutFixed(Bytes& out, uint64_t value, size_t width) {
  for (size_t i = 0; i < width; ++i) {
    out.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
  }
}

inline void PutString(Bytes& out, const std::string& str) {
  out.insert(out.end(), str.begin(), str.end());
}

inline void Append(Bytes& out, const Bytes& bytes) {
  out.insert(out.end(), bytes.begin(), bytes.end());
}

inline uint32_t Crc32(const Bytes& bytes) {
  uLong crc = crc32(0L, Z_NULL, 0);
  return static_cast<uint32_t>(crc32(crc, bytes.data(), static_cast<uInt>(bytes.size())));
}

/**
 * @brief 19-byte (v4) or 13-byte (legacy) event header
 */
inline Bytes BuildHeader(uint32_t timestamp, uint8_t type, uint32_t server_id, uint32_t event_size, uint32_t log_pos,
                         uint16_t flags, size_t width = 19) {
  Bytes header;
  PutFixed(header, timestamp, 4);
  header.push_back(type);
  PutFixed(header, server_id, 4);
  PutFixed(header, event_size, 4);
  if (width > 13) {
    PutFixed(header, log_pos, 4);
    PutFixed(header, flags, 2);
  }
  return header;
}

// ============================================================================
// Event bodies
// ============================================================================

inline Bytes QueryBody(uint32_t thread_id, uint32_t exec_time, uint16_t error_code, const std::string& schema,
                       const std::string& query, const Bytes& status_vars = {}) {
  Bytes body;
  PutFixed(body, thread_id, 4);
  PutFixed(body, exec_time, 4);
  body.push_back(static_cast<uint8_t>(schema.size()));
  PutFixed(body, error_code, 2);
  PutFixed(body, status_vars.size(), 2);
  Append(body, status_vars);
  PutString(body, schema);
  body.push_back(0x00);
  PutString(body, query);
  return body;
}

inline Bytes XidBody(uint64_t xid) {
  Bytes body;
  PutFixed(body, xid, 8);
  return body;
}

inline Bytes IntvarBody(uint8_t type, uint64_t value) {
  Bytes body{type};
  PutFixed(body, value, 8);
  return body;
}

inline Bytes RotateBody(uint64_t position, const std::string& next_file) {
  Bytes body;
  PutFixed(body, position, 8);
  PutString(body, next_file);
  return body;
}

inline Bytes GtidBody(uint8_t flags, const Bytes& sid, uint64_t gno) {
  Bytes body{flags};
  Append(body, sid);
  PutFixed(body, gno, 8);
  return body;
}

inline Bytes TableMapBody(uint64_t table_id, const std::string& schema, const std::string& table,
                          const Bytes& column_types, const Bytes& metadata, const Bytes& null_bitmap,
                          size_t table_id_width = 6) {
  Bytes body;
  PutFixed(body, table_id, table_id_width);
  PutFixed(body, 0x0001, 2);
  body.push_back(static_cast<uint8_t>(schema.size()));
  PutString(body, schema);
  body.push_back(0x00);
  body.push_back(static_cast<uint8_t>(table.size()));
  PutString(body, table);
  body.push_back(0x00);
  body.push_back(static_cast<uint8_t>(column_types.size()));
  Append(body, column_types);
  body.push_back(static_cast<uint8_t>(metadata.size()));
  Append(body, metadata);
  Append(body, null_bitmap);
  return body;
}

/**
 * @brief Rows event body; version 2 adds an empty extra-data block
 */
inline Bytes RowsBody(uint64_t table_id, int version, uint8_t column_count, const Bytes& present,
                      const std::optional<Bytes>& after_image, const Bytes& rows_data, size_t table_id_width = 6) {
  Bytes body;
  PutFixed(body, table_id, table_id_width);
  PutFixed(body, 0x0001, 2);
  if (version == 2) {
    PutFixed(body, 2, 2);
  }
  body.push_back(column_count);
  Append(body, present);
  if (after_image) {
    Append(body, *after_image);
  }
  Append(body, rows_data);
  return body;
}

/**
 * @brief Post-header lengths as written by a MySQL 8.0 server (types 1..41)
 */
inline Bytes PostHeaderLengths(uint8_t table_map_length = 8) {
  Bytes lengths(41, 0);
  auto set = [&lengths](MySQLBinlogEventType type, uint8_t length) {
    lengths[static_cast<size_t>(type) - 1] = length;
  };
  set(MySQLBinlogEventType::QUERY_EVENT, 13);
  set(MySQLBinlogEventType::ROTATE_EVENT, 8);
  set(MySQLBinlogEventType::FORMAT_DESCRIPTION_EVENT, 84);
  set(MySQLBinlogEventType::TABLE_MAP_EVENT, table_map_length);
  set(MySQLBinlogEventType::WRITE_ROWS_EVENT_V1, table_map_length);
  set(MySQLBinlogEventType::UPDATE_ROWS_EVENT_V1, table_map_length);
  set(MySQLBinlogEventType::DELETE_ROWS_EVENT_V1, table_map_length);
  set(MySQLBinlogEventType::WRITE_ROWS_EVENT, static_cast<uint8_t>(table_map_length + 2));
  set(MySQLBinlogEventType::UPDATE_ROWS_EVENT, static_cast<uint8_t>(table_map_length + 2));
  set(MySQLBinlogEventType::DELETE_ROWS_EVENT, static_cast<uint8_t>(table_map_length + 2));
  set(MySQLBinlogEventType::GTID_LOG_EVENT, 42);
  return lengths;
}

/**
 * @brief FORMAT_DESCRIPTION body as stored in the file
 *
 * For servers that know about checksums a 5-byte trailer (algorithm byte and
 * 4 checksum bytes) is appended; its checksum bytes are filled in by
 * BinlogStreamBuilder.
 */
inline Bytes FormatDescriptionBody(const std::string& server_version, uint8_t checksum_algorithm, bool with_trailer,
                                   uint32_t create_timestamp = 0, uint8_t header_length = 19,
                                   uint8_t table_map_length = 8) {
  Bytes body;
  PutFixed(body, 4, 2);
  Bytes version(50, 0);
  std::copy(server_version.begin(), server_version.end(), version.begin());
  Append(body, version);
  PutFixed(body, create_timestamp, 4);
  body.push_back(header_length);
  Append(body, PostHeaderLengths(table_map_length));
  if (with_trailer) {
    body.push_back(checksum_algorithm);
    PutFixed(body, 0, 4);
  }
  return body;
}

// ============================================================================
// Streams
// ============================================================================

/**
 * @brief Builds a binlog file image event by event
 *
 * log_pos of every event is its end offset in the image. When checksums are
 * on, each event gets a CRC32 over header and body.
 */
class BinlogStreamBuilder {
 public:
  explicit BinlogStreamBuilder(bool checksum = true, std::string server_version = "8.0.36")
      : checksum_(checksum), server_version_(std::move(server_version)) {
    bytes_ = {0xFE, 0x62, 0x69, 0x6E};
  }

  /**
   * @brief Append the format description; call first
   */
  BinlogStreamBuilder& FormatDescription(uint32_t timestamp = 1700000000, uint8_t table_map_length = 8) {
    const bool with_trailer = server_version_.rfind("5.5", 0) != 0 && server_version_.rfind("5.1", 0) != 0;
    Bytes body = FormatDescriptionBody(server_version_, checksum_ ? 1 : 0, with_trailer, timestamp, 19,
                                       table_map_length);
    if (with_trailer) {
      // Drop the placeholder checksum; AddRaw writes the real one
      body.resize(body.size() - 4);
    }
    AddRaw(MySQLBinlogEventType::FORMAT_DESCRIPTION_EVENT, body, timestamp, with_trailer);
    return *this;
  }

  BinlogStreamBuilder& Add(MySQLBinlogEventType type, const Bytes& body, uint32_t timestamp = 1700000000) {
    AddRaw(type, body, timestamp, checksum_);
    return *this;
  }

  /**
   * @brief Current end of the image (the next event starts here)
   */
  uint32_t Offset() const { return static_cast<uint32_t>(bytes_.size()); }

  Bytes Build() const { return bytes_; }

  /// Start offsets of the events added so far
  const std::vector<uint32_t>& EventStarts() const { return starts_; }

 private:
  void AddRaw(MySQLBinlogEventType type, const Bytes& body, uint32_t timestamp, bool with_checksum) {
    const uint32_t start = Offset();
    const auto event_size = static_cast<uint32_t>(19 + body.size() + (with_checksum ? 4 : 0));
    Bytes event = BuildHeader(timestamp, static_cast<uint8_t>(type), 1, event_size, start + event_size, 0);
    Append(event, body);
    if (with_checksum) {
      PutFixed(event, Crc32(event), 4);
    }
    starts_.push_back(start);
    Append(bytes_, event);
  }

  bool checksum_;
  std::string server_version_;
  Bytes bytes_;
  std::vector<uint32_t> starts_;
};

}  // namespace mybinlog::binlog::testing
