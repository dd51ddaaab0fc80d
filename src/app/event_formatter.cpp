/**
 * @file event_formatter.cpp
 * @brief JSON rendering of decoded events
 */

#include "app/event_formatter.h"

#include <iomanip>
#include <sstream>
#include <type_traits>

#include "utils/string_utils.h"
#include "utils/structured_log.h"

namespace mybinlog::app {

using json = nlohmann::json;

namespace {

json ColumnMetaToJson(const binlog::ColumnMeta& meta) {
  json serialized = nullptr;
  std::visit(
      [&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, binlog::MaxLengthMeta>) {
          serialized = {{"max_length", arg.max_length}};
        } else if constexpr (std::is_same_v<T, binlog::LengthSizeMeta>) {
          serialized = {{"length_size", arg.length_size}};
        } else if constexpr (std::is_same_v<T, binlog::EnumSetMeta>) {
          serialized = {{"real_type", binlog::ColumnTypeName(arg.real_type)}, {"size", arg.size}};
        } else if constexpr (std::is_same_v<T, binlog::DecimalMeta>) {
          serialized = {{"precision", arg.precision}, {"scale", arg.scale}};
        } else if constexpr (std::is_same_v<T, binlog::BitMeta>) {
          serialized = {{"bits", arg.bits}, {"bytes", arg.bytes}};
        } else if constexpr (std::is_same_v<T, binlog::FspMeta>) {
          serialized = {{"fsp", arg.fsp}};
        }
      },
      meta);
  return serialized;
}

/// Indexes of set bits
json BitfieldToJson(const binlog::Bitfield& bits) {
  json indexes = json::array();
  for (size_t i = 0; i < bits.Size(); ++i) {
    if (bits.IsSet(i)) {
      indexes.push_back(i);
    }
  }
  return indexes;
}

json TableSchemaToJson(const binlog::TableSchema& schema) {
  json columns = json::array();
  for (size_t i = 0; i < schema.column_types.size(); ++i) {
    json column = {{"type", binlog::ColumnTypeName(schema.column_types[i])}, {"nullable", schema.IsNullable(i)}};
    json meta = ColumnMetaToJson(schema.column_metas[i]);
    if (!meta.is_null()) {
      column["meta"] = std::move(meta);
    }
    columns.push_back(std::move(column));
  }
  return {{"table_id", schema.table_id}, {"flags", schema.flags},      {"schema", schema.schema_name},
          {"table", schema.table_name},  {"columns", std::move(columns)}};
}

json RowsToJson(const binlog::RowsEventPayload& rows, const binlog::DecodeContext& context) {
  json body = {{"kind", binlog::RowsEventKindName(rows.kind)},
               {"version", rows.version},
               {"table_id", rows.table_id},
               {"flags", rows.flags},
               {"column_count", rows.column_count},
               {"columns_present", BitfieldToJson(rows.columns_present)},
               {"rows_data_length", rows.rows_data.size()}};
  if (rows.columns_after_image) {
    body["columns_after_image"] = BitfieldToJson(*rows.columns_after_image);
  }
  if (!rows.extra_data.empty()) {
    body["extra_data"] = utils::HexString(rows.extra_data);
  }
  auto schema = context.TableSchemaFor(rows.table_id);
  if (schema) {
    body["schema"] = (*schema)->schema_name;
    body["table"] = (*schema)->table_name;
  }
  return body;
}

json StatusVarsToJson(const binlog::QueryStatusVars& vars) {
  json serialized = json::object();
  if (vars.flags2) {
    serialized["flags2"] = *vars.flags2;
  }
  if (vars.sql_mode) {
    serialized["sql_mode"] = *vars.sql_mode;
  }
  if (vars.catalog) {
    serialized["catalog"] = *vars.catalog;
  }
  if (vars.auto_increment_increment) {
    serialized["auto_increment_increment"] = *vars.auto_increment_increment;
    serialized["auto_increment_offset"] = vars.auto_increment_offset.value_or(0);
  }
  if (vars.charset) {
    serialized["charset"] = {{"client", vars.charset->client},
                             {"collation_connection", vars.charset->collation_connection},
                             {"collation_server", vars.charset->collation_server}};
  }
  if (vars.time_zone) {
    serialized["time_zone"] = *vars.time_zone;
  }
  if (vars.lc_time_names) {
    serialized["lc_time_names"] = *vars.lc_time_names;
  }
  if (vars.charset_database) {
    serialized["charset_database"] = *vars.charset_database;
  }
  if (vars.table_map_for_update) {
    serialized["table_map_for_update"] = *vars.table_map_for_update;
  }
  if (vars.master_data_written) {
    serialized["master_data_written"] = *vars.master_data_written;
  }
  if (vars.invoker_user) {
    serialized["invoker"] = {{"user", *vars.invoker_user}, {"host", vars.invoker_host.value_or("")}};
  }
  if (vars.updated_db_names_overflow) {
    serialized["updated_db_names_overflow"] = true;
  } else if (!vars.updated_db_names.empty()) {
    serialized["updated_db_names"] = vars.updated_db_names;
  }
  if (vars.microseconds) {
    serialized["microseconds"] = *vars.microseconds;
  }
  if (vars.explicit_defaults_for_timestamp) {
    serialized["explicit_defaults_for_timestamp"] = *vars.explicit_defaults_for_timestamp;
  }
  if (vars.ddl_xid) {
    serialized["ddl_xid"] = *vars.ddl_xid;
  }
  if (vars.default_collation_for_utf8mb4) {
    serialized["default_collation_for_utf8mb4"] = *vars.default_collation_for_utf8mb4;
  }
  if (vars.sql_require_primary_key) {
    serialized["sql_require_primary_key"] = *vars.sql_require_primary_key;
  }
  if (vars.default_table_encryption) {
    serialized["default_table_encryption"] = *vars.default_table_encryption;
  }
  return serialized;
}

/**
 * @brief Query body with its status variables
 *
 * Status variables are best effort: an unknown key leaves the raw region in
 * the output and logs a warning instead of failing the event.
 */
json QueryToJson(const binlog::QueryPayload& query, const binlog::EventHeader& header) {
  json serialized = {{"thread_id", query.thread_id}, {"exec_time", query.exec_time}, {"error_code", query.error_code},
                     {"schema", query.schema},       {"query", query.query}};
  if (query.status_vars.empty()) {
    return serialized;
  }

  auto vars = binlog::DecodeStatusVars(query.status_vars);
  if (vars) {
    serialized["status_vars"] = StatusVarsToJson(*vars);
    return serialized;
  }

  serialized["status_vars_raw"] = utils::HexString(query.status_vars);
  serialized["status_vars_error"] = vars.error().to_string();
  utils::StructuredLog()
      .Event("binlog_status_vars_undecoded")
      .Field("log_pos", static_cast<uint64_t>(header.log_pos))
      .Field("error", vars.error().to_string())
      .Warn();
  return serialized;
}

json BodyToJson(const binlog::EventHeader& header, const binlog::EventBody& body, const binlog::DecodeContext& context,
                bool include_raw) {
  json serialized = json::object();
  std::visit(
      [&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, binlog::FormatDescription>) {
          serialized = {{"binlog_version", arg.binlog_version},
                        {"server_version", arg.server_version},
                        {"create_timestamp", arg.create_timestamp},
                        {"header_length", arg.header_length},
                        {"checksum_algorithm", binlog::ChecksumAlgorithmName(arg.checksum_algorithm)}};
        } else if constexpr (std::is_same_v<T, binlog::QueryPayload>) {
          serialized = QueryToJson(arg, header);
        } else if constexpr (std::is_same_v<T, binlog::XidPayload>) {
          serialized = {{"xid", arg.xid}};
        } else if constexpr (std::is_same_v<T, binlog::IntvarPayload>) {
          serialized = {{"intvar_type", binlog::IntvarTypeName(arg.type)}, {"value", arg.value}};
        } else if constexpr (std::is_same_v<T, binlog::RotatePayload>) {
          serialized = {{"position", arg.position}, {"next_file", arg.next_file}};
        } else if constexpr (std::is_same_v<T, binlog::TableSchema>) {
          serialized = TableSchemaToJson(arg);
        } else if constexpr (std::is_same_v<T, binlog::RowsEventPayload>) {
          serialized = RowsToJson(arg, context);
        } else if constexpr (std::is_same_v<T, binlog::GtidPayload>) {
          serialized = {{"gtid", arg.ToString()}, {"flags", arg.flags}};
        } else if constexpr (std::is_same_v<T, binlog::UnsupportedPayload>) {
          serialized = {{"payload_length", arg.data.size()}};
          if (include_raw) {
            serialized["raw"] = utils::HexString(arg.data);
          }
        }
      },
      body);
  return serialized;
}

}  // namespace

json FormatEvent(const binlog::Event& event, const binlog::DecodeContext& context, bool include_raw) {
  const binlog::EventHeader& header = event.header;
  json line = {{"type", event.TypeName()},         {"type_code", header.event_type}, {"timestamp", header.timestamp},
               {"server_id", header.server_id},    {"event_size", header.event_size}, {"log_pos", header.log_pos},
               {"flags", header.flags}};
  if (event.checksum) {
    std::ostringstream crc;
    crc << std::hex << std::setfill('0') << std::setw(8) << event.checksum->value;  // NOLINT(readability-magic-numbers)
    line["checksum"] = crc.str();
  }
  line["body"] = BodyToJson(header, event.body, context, include_raw);
  return line;
}

json FormatSummary(const std::string& path, const binlog::DecoderStats& stats, uint64_t events_printed,
                   const std::string& error) {
  json summary = {{"summary", true},
                  {"file", path},
                  {"events_read", stats.events_read},
                  {"events_delivered", stats.events_delivered},
                  {"events_skipped", stats.events_skipped},
                  {"events_printed", events_printed},
                  {"success", error.empty()}};
  if (!error.empty()) {
    summary["error"] = error;
  }
  return summary;
}

}  // namespace mybinlog::app
