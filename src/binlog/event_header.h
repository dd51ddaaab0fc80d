/**
 * @file event_header.h
 * @brief Common binlog event header
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "utils/error.h"
#include "utils/expected.h"

namespace mybinlog::binlog {

/// Header width for binlog v1 (no log_pos / flags)
constexpr size_t kLegacyEventHeaderLength = 13;
/// Header width for binlog v3 and v4
constexpr size_t kEventHeaderLength = 19;

/**
 * @brief Decoded common header of a binlog event
 */
struct EventHeader {
  int64_t timestamp = 0;  // seconds since epoch, 32 bits on the wire
  uint8_t event_type = 0;
  int64_t server_id = 0;
  uint32_t event_size = 0;  // header + body (+ checksum)
  uint32_t log_pos = 0;     // end offset of this event, 0 for legacy headers
  uint16_t flags = 0;
};

/**
 * @brief Decode an event header
 *
 * Layout: timestamp(4) type(1) server_id(4) event_size(4), followed by
 * log_pos(4) flags(2) when header_width is greater than 13.
 * The type code is not checked here.
 *
 * @param data Header bytes
 * @param length Number of bytes available
 * @param header_width Width announced by the current format description
 * @return Header, or kBinlogInvalidHeader if fewer than header_width bytes are
 *         supplied or the width is neither 13 nor at least 19
 */
utils::Expected<EventHeader, utils::Error> DecodeEventHeader(const uint8_t* data, size_t length, size_t header_width);

}  // namespace mybinlog::binlog
