/**
 * @file table_map.cpp
 * @brief TABLE_MAP_EVENT decoder
 */

#include "binlog/table_map.h"

#include "binlog/byte_codec.h"

// NOLINTBEGIN(readability-magic-numbers)

namespace mybinlog::binlog {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

const char* ColumnTypeName(uint8_t type) {
  switch (static_cast<ColumnType>(type)) {
    case ColumnType::DECIMAL: return "DECIMAL";
    case ColumnType::TINY: return "TINY";
    case ColumnType::SHORT: return "SHORT";
    case ColumnType::LONG: return "LONG";
    case ColumnType::FLOAT: return "FLOAT";
    case ColumnType::DOUBLE: return "DOUBLE";
    case ColumnType::NULL_TYPE: return "NULL";
    case ColumnType::TIMESTAMP: return "TIMESTAMP";
    case ColumnType::LONGLONG: return "LONGLONG";
    case ColumnType::INT24: return "INT24";
    case ColumnType::DATE: return "DATE";
    case ColumnType::TIME: return "TIME";
    case ColumnType::DATETIME: return "DATETIME";
    case ColumnType::YEAR: return "YEAR";
    case ColumnType::NEWDATE: return "NEWDATE";
    case ColumnType::VARCHAR: return "VARCHAR";
    case ColumnType::BIT: return "BIT";
    case ColumnType::TIMESTAMP2: return "TIMESTAMP2";
    case ColumnType::DATETIME2: return "DATETIME2";
    case ColumnType::TIME2: return "TIME2";
    case ColumnType::JSON: return "JSON";
    case ColumnType::NEWDECIMAL: return "NEWDECIMAL";
    case ColumnType::ENUM: return "ENUM";
    case ColumnType::SET: return "SET";
    case ColumnType::TINY_BLOB: return "TINY_BLOB";
    case ColumnType::MEDIUM_BLOB: return "MEDIUM_BLOB";
    case ColumnType::LONG_BLOB: return "LONG_BLOB";
    case ColumnType::BLOB: return "BLOB";
    case ColumnType::VAR_STRING: return "VAR_STRING";
    case ColumnType::STRING: return "STRING";
    case ColumnType::GEOMETRY: return "GEOMETRY";
    default: return "UNKNOWN";
  }
}

Expected<std::vector<ColumnMeta>, Error> DecodeColumnMetadata(const std::vector<uint8_t>& column_types,
                                                              const std::string& meta) {
  ByteCursor cursor(reinterpret_cast<const uint8_t*>(meta.data()), meta.size());
  std::vector<ColumnMeta> metas;
  metas.reserve(column_types.size());

  for (size_t i = 0; i < column_types.size(); ++i) {
    const uint8_t type = column_types[i];
    size_t needed = 0;
    switch (static_cast<ColumnType>(type)) {
      case ColumnType::STRING:
      case ColumnType::VAR_STRING:
      case ColumnType::VARCHAR:
      case ColumnType::DECIMAL:
      case ColumnType::BIT:
      case ColumnType::NEWDECIMAL:
        needed = 2;
        break;
      case ColumnType::BLOB:
      case ColumnType::TINY_BLOB:
      case ColumnType::MEDIUM_BLOB:
      case ColumnType::LONG_BLOB:
      case ColumnType::GEOMETRY:
      case ColumnType::DOUBLE:
      case ColumnType::FLOAT:
      case ColumnType::JSON:
      case ColumnType::TIME2:
      case ColumnType::DATETIME2:
      case ColumnType::TIMESTAMP2:
        needed = 1;
        break;
      case ColumnType::DATE:
      case ColumnType::DATETIME:
      case ColumnType::TIMESTAMP:
      case ColumnType::TIME:
      case ColumnType::TINY:
      case ColumnType::SHORT:
      case ColumnType::INT24:
      case ColumnType::LONG:
      case ColumnType::LONGLONG:
      case ColumnType::NULL_TYPE:
      case ColumnType::YEAR:
      case ColumnType::NEWDATE:
        needed = 0;
        break;
      default:
        return MakeUnexpected(MakeError(ErrorCode::kBinlogInvalidBody, "unknown column type " + std::to_string(type),
                                        "column " + std::to_string(i)));
    }
    if (cursor.Remaining() < needed) {
      return MakeUnexpected(MakeError(ErrorCode::kBinlogInvalidBody, "column metadata block ends early",
                                      "column " + std::to_string(i)));
    }

    // Remaining length was checked above, so the reads below cannot fail
    switch (static_cast<ColumnType>(type)) {
      case ColumnType::STRING: {
        // Stored big-endian: real_type, then length
        const uint8_t real_type = *cursor.ReadUint8();
        const uint8_t field_length = *cursor.ReadUint8();
        const uint16_t metadata = static_cast<uint16_t>((real_type << 8) | field_length);
        if (real_type == static_cast<uint8_t>(ColumnType::ENUM) || real_type == static_cast<uint8_t>(ColumnType::SET)) {
          metas.emplace_back(EnumSetMeta{real_type, static_cast<uint16_t>(metadata & 0x00FF)});
        } else {
          const auto max_length =
              static_cast<uint16_t>((((metadata >> 4) & 0x300) ^ 0x300) + (metadata & 0x00FF));
          metas.emplace_back(MaxLengthMeta{max_length});
        }
        break;
      }
      case ColumnType::VAR_STRING:
      case ColumnType::VARCHAR:
      case ColumnType::DECIMAL:
        metas.emplace_back(MaxLengthMeta{*cursor.ReadUint16()});
        break;
      case ColumnType::BIT: {
        const uint8_t bits = *cursor.ReadUint8();
        const uint8_t bytes = *cursor.ReadUint8();
        const auto total_bits = static_cast<uint16_t>(bytes * 8 + bits);
        metas.emplace_back(BitMeta{total_bits, static_cast<uint16_t>((total_bits + 7) / 8)});
        break;
      }
      case ColumnType::NEWDECIMAL: {
        const uint8_t precision = *cursor.ReadUint8();
        const uint8_t scale = *cursor.ReadUint8();
        metas.emplace_back(DecimalMeta{precision, scale});
        break;
      }
      case ColumnType::TIME2:
      case ColumnType::DATETIME2:
      case ColumnType::TIMESTAMP2:
        metas.emplace_back(FspMeta{*cursor.ReadUint8()});
        break;
      default:
        if (needed == 1) {
          metas.emplace_back(LengthSizeMeta{*cursor.ReadUint8()});
        } else {
          metas.emplace_back(NoColumnMeta{});
        }
        break;
    }
  }
  return metas;
}

Expected<TableSchema, Error> DecodeTableMapEvent(const uint8_t* body, size_t length, size_t table_id_width) {
  ByteCursor cursor(body, length);
  TableSchema schema;

  auto table_id = cursor.ReadFixed(table_id_width);
  if (!table_id) {
    return MakeUnexpected(table_id.error());
  }
  schema.table_id = *table_id;

  auto flags = cursor.ReadUint16();
  if (!flags) {
    return MakeUnexpected(flags.error());
  }
  schema.flags = *flags;

  // database name: length, bytes, NUL
  auto schema_length = cursor.ReadUint8();
  if (!schema_length) {
    return MakeUnexpected(schema_length.error());
  }
  auto schema_name = cursor.ReadString(*schema_length);
  if (!schema_name) {
    return MakeUnexpected(schema_name.error());
  }
  schema.schema_name = std::move(*schema_name);
  if (auto nul = cursor.Skip(1); !nul) {
    return MakeUnexpected(nul.error());
  }

  // table name: length, bytes, NUL
  auto table_length = cursor.ReadUint8();
  if (!table_length) {
    return MakeUnexpected(table_length.error());
  }
  auto table_name = cursor.ReadString(*table_length);
  if (!table_name) {
    return MakeUnexpected(table_name.error());
  }
  schema.table_name = std::move(*table_name);
  if (auto nul = cursor.Skip(1); !nul) {
    return MakeUnexpected(nul.error());
  }

  auto column_count = cursor.ReadPacked();
  if (!column_count) {
    return MakeUnexpected(column_count.error());
  }
  if (column_count->is_null) {
    return MakeUnexpected(MakeError(ErrorCode::kBinlogInvalidBody, "table map column count is NULL"));
  }
  schema.column_count = column_count->value;
  if (schema.column_count > cursor.Remaining()) {
    return MakeUnexpected(MakeError(ErrorCode::kBinlogTruncated,
                                    "table map declares " + std::to_string(schema.column_count) + " columns but only " +
                                        std::to_string(cursor.Remaining()) + " bytes remain"));
  }
  const auto columns = static_cast<size_t>(schema.column_count);

  auto column_types = cursor.ReadBytes(columns);
  if (!column_types) {
    return MakeUnexpected(column_types.error());
  }
  schema.column_types = std::move(*column_types);

  auto meta_block = cursor.ReadPackedString();
  if (!meta_block) {
    return MakeUnexpected(meta_block.error());
  }
  auto metas = DecodeColumnMetadata(schema.column_types, meta_block->value);
  if (!metas) {
    return MakeUnexpected(metas.error());
  }
  schema.column_metas = std::move(*metas);

  const size_t bitmap_length = BitmapBytes(columns);
  if (cursor.Remaining() != bitmap_length) {
    return MakeUnexpected(MakeError(ErrorCode::kBinlogInvalidBody,
                                    "null bitmap is " + std::to_string(cursor.Remaining()) + " bytes, expected " +
                                        std::to_string(bitmap_length),
                                    schema.schema_name + "." + schema.table_name));
  }
  schema.null_bitmap = Bitfield(cursor.Rest(), columns);
  return schema;
}

}  // namespace mybinlog::binlog

// NOLINTEND(readability-magic-numbers)
