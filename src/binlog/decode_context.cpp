/**
 * @file decode_context.cpp
 * @brief Decode context implementation
 */

#include "binlog/decode_context.h"

#include <string>
#include <utility>

#include "binlog/event_header.h"

namespace mybinlog::binlog {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

constexpr uint16_t kDefaultBinlogVersion = 4;

}  // namespace

void DecodeContext::AdoptFormatDescription(FormatDescription format_description) {
  format_description_ = std::move(format_description);
}

void DecodeContext::RegisterTable(TableSchema schema) {
  const uint64_t table_id = schema.table_id;
  tables_[table_id] = std::move(schema);
}

size_t DecodeContext::HeaderWidth() const {
  if (!format_description_) {
    return kEventHeaderLength;
  }
  return format_description_->header_length;
}

std::optional<uint8_t> DecodeContext::PostHeaderLength(uint8_t event_type) const {
  if (!format_description_) {
    return std::nullopt;
  }
  return format_description_->PostHeaderLength(event_type);
}

bool DecodeContext::ChecksumEnabled() const {
  return format_description_ && format_description_->checksum_enabled;
}

ChecksumAlgorithm DecodeContext::GetChecksumAlgorithm() const {
  if (!format_description_) {
    return ChecksumAlgorithm::kUndefined;
  }
  return format_description_->checksum_algorithm;
}

uint16_t DecodeContext::BinlogVersion() const {
  if (!format_description_) {
    return kDefaultBinlogVersion;
  }
  return format_description_->binlog_version;
}

Expected<const TableSchema*, Error> DecodeContext::TableSchemaFor(uint64_t table_id) const {
  auto iter = tables_.find(table_id);
  if (iter == tables_.end()) {
    return MakeUnexpected(
        MakeError(ErrorCode::kBinlogUnknownTable, "no TABLE_MAP_EVENT seen for table id " + std::to_string(table_id)));
  }
  return &iter->second;
}

void DecodeContext::Reset() {
  format_description_.reset();
  tables_.clear();
}

}  // namespace mybinlog::binlog
