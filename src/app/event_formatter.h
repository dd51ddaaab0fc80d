/**
 * @file event_formatter.h
 * @brief JSON rendering of decoded events for mybinlog-dump
 */

#ifndef MYBINLOG_APP_EVENT_FORMATTER_H_
#define MYBINLOG_APP_EVENT_FORMATTER_H_

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "binlog/binlog_decoder.h"
#include "binlog/binlog_event.h"
#include "binlog/decode_context.h"

namespace mybinlog::app {

/**
 * @brief Render one event as a JSON object
 *
 * Common fields: type, type_code, timestamp, server_id, event_size, log_pos,
 * flags, and checksum when the event carried one. Body fields depend on the
 * event type. Rows events are labelled with the schema and table name of
 * their table map when context knows it.
 *
 * @param include_raw Hex-dump payloads of events without a dedicated decoder
 */
nlohmann::json FormatEvent(const binlog::Event& event, const binlog::DecodeContext& context, bool include_raw);

/**
 * @brief Final line printed after the walk
 */
nlohmann::json FormatSummary(const std::string& path, const binlog::DecoderStats& stats, uint64_t events_printed,
                             const std::string& error);

}  // namespace mybinlog::app

#endif  // MYBINLOG_APP_EVENT_FORMATTER_H_
