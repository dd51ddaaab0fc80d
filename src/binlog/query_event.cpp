/**
 * @file query_event.cpp
 * @brief QUERY_EVENT decoder
 */

#include "binlog/query_event.h"

#include "binlog/byte_codec.h"

// NOLINTBEGIN(readability-magic-numbers)

namespace mybinlog::binlog {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

/// Status variables exist from binlog version 4 on
constexpr uint16_t kStatusVarsBinlogVersion = 4;

/**
 * @brief Read a 1-byte length followed by that many bytes
 */
Expected<std::string, Error> ReadLengthPrefixed(ByteCursor& cursor) {
  auto len = cursor.ReadUint8();
  if (!len) {
    return MakeUnexpected(len.error());
  }
  return cursor.ReadString(*len);
}

/**
 * @brief Decode the value of one status variable into vars
 */
Expected<void, Error> DecodeStatusVar(uint8_t key, ByteCursor& cursor, QueryStatusVars& vars) {
  switch (static_cast<QueryStatusVarKey>(key)) {
    case QueryStatusVarKey::kFlags2: {
      auto value = cursor.ReadUint32();
      if (!value) {
        return MakeUnexpected(value.error());
      }
      vars.flags2 = *value;
      return {};
    }
    case QueryStatusVarKey::kSqlMode: {
      auto value = cursor.ReadUint64();
      if (!value) {
        return MakeUnexpected(value.error());
      }
      vars.sql_mode = *value;
      return {};
    }
    case QueryStatusVarKey::kCatalog: {
      // Pre-5.0.4 catalog: length, bytes, trailing NUL
      auto value = ReadLengthPrefixed(cursor);
      if (!value) {
        return MakeUnexpected(value.error());
      }
      auto nul = cursor.Skip(1);
      if (!nul) {
        return MakeUnexpected(nul.error());
      }
      vars.catalog = std::move(*value);
      return {};
    }
    case QueryStatusVarKey::kAutoIncrement: {
      auto increment = cursor.ReadUint16();
      if (!increment) {
        return MakeUnexpected(increment.error());
      }
      auto offset = cursor.ReadUint16();
      if (!offset) {
        return MakeUnexpected(offset.error());
      }
      vars.auto_increment_increment = *increment;
      vars.auto_increment_offset = *offset;
      return {};
    }
    case QueryStatusVarKey::kCharset: {
      if (cursor.Remaining() < 6) {
        return MakeUnexpected(MakeError(ErrorCode::kBinlogTruncated, "charset status var needs 6 bytes"));
      }
      QueryStatusVars::Charset charset;
      charset.client = *cursor.ReadUint16();
      charset.collation_connection = *cursor.ReadUint16();
      charset.collation_server = *cursor.ReadUint16();
      vars.charset = charset;
      return {};
    }
    case QueryStatusVarKey::kTimeZone: {
      auto value = ReadLengthPrefixed(cursor);
      if (!value) {
        return MakeUnexpected(value.error());
      }
      vars.time_zone = std::move(*value);
      return {};
    }
    case QueryStatusVarKey::kCatalogNz: {
      auto value = ReadLengthPrefixed(cursor);
      if (!value) {
        return MakeUnexpected(value.error());
      }
      vars.catalog = std::move(*value);
      return {};
    }
    case QueryStatusVarKey::kLcTimeNames: {
      auto value = cursor.ReadUint16();
      if (!value) {
        return MakeUnexpected(value.error());
      }
      vars.lc_time_names = *value;
      return {};
    }
    case QueryStatusVarKey::kCharsetDatabase: {
      auto value = cursor.ReadUint16();
      if (!value) {
        return MakeUnexpected(value.error());
      }
      vars.charset_database = *value;
      return {};
    }
    case QueryStatusVarKey::kTableMapForUpdate: {
      auto value = cursor.ReadUint64();
      if (!value) {
        return MakeUnexpected(value.error());
      }
      vars.table_map_for_update = *value;
      return {};
    }
    case QueryStatusVarKey::kMasterDataWritten: {
      auto value = cursor.ReadUint32();
      if (!value) {
        return MakeUnexpected(value.error());
      }
      vars.master_data_written = *value;
      return {};
    }
    case QueryStatusVarKey::kInvoker: {
      auto user = ReadLengthPrefixed(cursor);
      if (!user) {
        return MakeUnexpected(user.error());
      }
      auto host = ReadLengthPrefixed(cursor);
      if (!host) {
        return MakeUnexpected(host.error());
      }
      vars.invoker_user = std::move(*user);
      vars.invoker_host = std::move(*host);
      return {};
    }
    case QueryStatusVarKey::kUpdatedDbNames: {
      auto count = cursor.ReadUint8();
      if (!count) {
        return MakeUnexpected(count.error());
      }
      if (*count == kOverMaxDbsInEventMts) {
        vars.updated_db_names_overflow = true;
        return {};
      }
      for (uint8_t i = 0; i < *count; ++i) {
        auto name = cursor.ReadNullTerminated();
        if (!name) {
          return MakeUnexpected(name.error());
        }
        vars.updated_db_names.push_back(std::move(*name));
      }
      return {};
    }
    case QueryStatusVarKey::kMicroseconds: {
      auto value = cursor.ReadFixed(3);
      if (!value) {
        return MakeUnexpected(value.error());
      }
      vars.microseconds = static_cast<uint32_t>(*value);
      return {};
    }
    case QueryStatusVarKey::kExplicitDefaultsForTimestamp: {
      auto value = cursor.ReadUint8();
      if (!value) {
        return MakeUnexpected(value.error());
      }
      vars.explicit_defaults_for_timestamp = *value;
      return {};
    }
    case QueryStatusVarKey::kDdlLoggedWithXid: {
      auto value = cursor.ReadUint64();
      if (!value) {
        return MakeUnexpected(value.error());
      }
      vars.ddl_xid = *value;
      return {};
    }
    case QueryStatusVarKey::kDefaultCollationForUtf8mb4: {
      auto value = cursor.ReadUint16();
      if (!value) {
        return MakeUnexpected(value.error());
      }
      vars.default_collation_for_utf8mb4 = *value;
      return {};
    }
    case QueryStatusVarKey::kSqlRequirePrimaryKey: {
      auto value = cursor.ReadUint8();
      if (!value) {
        return MakeUnexpected(value.error());
      }
      vars.sql_require_primary_key = *value;
      return {};
    }
    case QueryStatusVarKey::kDefaultTableEncryption: {
      auto value = cursor.ReadUint8();
      if (!value) {
        return MakeUnexpected(value.error());
      }
      vars.default_table_encryption = *value;
      return {};
    }
    default:
      // Q_COMMIT_TS / Q_COMMIT_TS2 (NDB) and anything newer
      return MakeUnexpected(
          MakeError(ErrorCode::kBinlogUnknownStatusVar, "unknown status var key " + std::to_string(key)));
  }
}

}  // namespace

Expected<QueryPayload, Error> DecodeQueryEvent(const uint8_t* body, size_t length, uint16_t binlog_version) {
  ByteCursor cursor(body, length);
  QueryPayload payload;

  // thread_id(4) exec_time(4) schema_length(1) error_code(2)
  constexpr size_t kFixedPart = 11;
  if (cursor.Remaining() < kFixedPart) {
    return MakeUnexpected(MakeError(ErrorCode::kBinlogTruncated, "query event post-header needs 11 bytes, got " +
                                                                     std::to_string(length)));
  }
  payload.thread_id = *cursor.ReadUint32();
  payload.exec_time = *cursor.ReadUint32();
  const uint8_t schema_length = *cursor.ReadUint8();
  payload.error_code = *cursor.ReadUint16();

  if (binlog_version >= kStatusVarsBinlogVersion) {
    auto status_vars_length = cursor.ReadUint16();
    if (!status_vars_length) {
      return MakeUnexpected(status_vars_length.error());
    }
    auto status_vars = cursor.ReadBytes(*status_vars_length);
    if (!status_vars) {
      return MakeUnexpected(status_vars.error());
    }
    payload.status_vars = std::move(*status_vars);
  }

  auto schema = cursor.ReadString(schema_length);
  if (!schema) {
    return MakeUnexpected(schema.error());
  }
  payload.schema = std::move(*schema);

  // NUL separator between schema and statement
  auto separator = cursor.Skip(1);
  if (!separator) {
    return MakeUnexpected(separator.error());
  }

  const auto rest = cursor.Rest();
  payload.query.assign(rest.begin(), rest.end());
  return payload;
}

Expected<QueryStatusVars, Error> DecodeStatusVars(const std::vector<uint8_t>& raw) {
  QueryStatusVars vars;
  ByteCursor cursor(raw);

  while (!cursor.AtEnd()) {
    const size_t key_offset = cursor.Position();
    const uint8_t key = *cursor.ReadUint8();
    auto decoded = DecodeStatusVar(key, cursor, vars);
    if (!decoded) {
      const Error& error = decoded.error();
      return MakeUnexpected(
          MakeError(error.code(), error.message(), "status var at offset " + std::to_string(key_offset)));
    }
    vars.keys.push_back(key);
  }
  return vars;
}

}  // namespace mybinlog::binlog

// NOLINTEND(readability-magic-numbers)
