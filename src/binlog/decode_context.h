/**
 * @file decode_context.h
 * @brief Cross-event state of one binlog stream
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>

#include "binlog/format_description.h"
#include "binlog/table_map.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace mybinlog::binlog {

/**
 * @brief Format description and table registry of a binlog stream
 *
 * Owned by one BinlogDecoder. Only the decoder's dispatch step mutates it;
 * body decoders receive the values they need explicitly.
 */
class DecodeContext {
 public:
  /**
   * @brief Replace the current format description
   */
  void AdoptFormatDescription(FormatDescription format_description);

  /**
   * @brief Add or replace the schema registered for schema.table_id
   */
  void RegisterTable(TableSchema schema);

  /**
   * @brief Header width for the next event (19 until a description is seen)
   */
  size_t HeaderWidth() const;

  /**
   * @brief Post-header length of an event type, if the description lists it
   */
  std::optional<uint8_t> PostHeaderLength(uint8_t event_type) const;

  bool ChecksumEnabled() const;

  ChecksumAlgorithm GetChecksumAlgorithm() const;

  /**
   * @brief Binlog version (4 until a description is seen)
   */
  uint16_t BinlogVersion() const;

  bool HasFormatDescription() const { return format_description_.has_value(); }

  const std::optional<FormatDescription>& GetFormatDescription() const { return format_description_; }

  /**
   * @brief Look up a table schema
   * @return Schema, or kBinlogUnknownTable if no TABLE_MAP announced the id
   */
  utils::Expected<const TableSchema*, utils::Error> TableSchemaFor(uint64_t table_id) const;

  size_t TableCount() const { return tables_.size(); }

  /**
   * @brief Forget the format description and all tables
   */
  void Reset();

 private:
  std::optional<FormatDescription> format_description_;
  std::map<uint64_t, TableSchema> tables_;
};

}  // namespace mybinlog::binlog
