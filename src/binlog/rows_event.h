/**
 * @file rows_event.h
 * @brief WRITE / UPDATE / DELETE rows events (v0, v1, v2)
 *
 * Decoding stops after the column presence bitmaps. Row images are kept as
 * raw bytes; interpreting them needs the TableSchema of the referenced table.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "binlog/bitfield.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace mybinlog::binlog {

enum class RowsEventKind : uint8_t {
  kWrite,
  kUpdate,
  kDelete,
};

const char* RowsEventKindName(RowsEventKind kind);

/**
 * @brief Version and kind of a rows event type code
 */
struct RowsEventInfo {
  uint8_t version = 0;  // 0, 1 or 2
  RowsEventKind kind = RowsEventKind::kWrite;
};

/**
 * @brief Classify a rows event type code (20-25, 30-32)
 */
std::optional<RowsEventInfo> GetRowsEventInfo(uint8_t event_type);

inline bool IsRowsEvent(uint8_t event_type) {
  return GetRowsEventInfo(event_type).has_value();
}

/**
 * @brief Decoded rows event header and column bitmaps
 */
struct RowsEventPayload {
  uint8_t version = 0;
  RowsEventKind kind = RowsEventKind::kWrite;
  uint64_t table_id = 0;
  uint16_t flags = 0;
  std::vector<uint8_t> extra_data;  // v2 only, without its length field
  uint64_t column_count = 0;
  Bitfield columns_present;                      // before image for UPDATE
  std::optional<Bitfield> columns_after_image;  // UPDATE v1 / v2 only
  std::vector<uint8_t> rows_data;               // undecoded row images
};

/**
 * @brief Decode a rows event body
 *
 * @param body Checksum-trimmed body
 * @param length Body length
 * @param event_type Rows event type code
 * @param table_id_width 4 or 6, see TableIdWidth()
 */
utils::Expected<RowsEventPayload, utils::Error> DecodeRowsEvent(const uint8_t* body, size_t length, uint8_t event_type,
                                                                size_t table_id_width);

}  // namespace mybinlog::binlog
