/**
 * @file simple_events.h
 * @brief Fixed-layout event payloads: XID, INTVAR, ROTATE, GTID and raw
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace mybinlog::binlog {

/**
 * @brief XID_EVENT: commit of an XA-capable transaction
 */
struct XidPayload {
  uint64_t xid = 0;
};

/**
 * @brief INTVAR_EVENT sub-types
 */
enum class IntvarType : uint8_t {
  kInvalid = 0,
  kLastInsertId = 1,
  kInsertId = 2,
};

const char* IntvarTypeName(uint8_t type);

/**
 * @brief INTVAR_EVENT: value of LAST_INSERT_ID() or the next auto-increment
 */
struct IntvarPayload {
  uint8_t type = 0;
  uint64_t value = 0;
};

/// Position used when a rotate event carries none (binlog v1)
constexpr uint64_t kDefaultRotatePosition = 4;

/**
 * @brief ROTATE_EVENT: name of the next binlog file
 */
struct RotatePayload {
  uint64_t position = kDefaultRotatePosition;
  std::string next_file;
};

/**
 * @brief GTID_LOG_EVENT: identifier of the following transaction
 */
struct GtidPayload {
  uint8_t flags = 0;  // bit 0: may have been committed in parallel
  std::array<uint8_t, 16> sid{};
  uint64_t gno = 0;

  /**
   * @brief Format as "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx:gno"
   */
  std::string ToString() const;
};

/**
 * @brief Recognized event whose body is kept verbatim
 */
struct UnsupportedPayload {
  std::vector<uint8_t> data;
};

utils::Expected<XidPayload, utils::Error> DecodeXidEvent(const uint8_t* body, size_t length);

utils::Expected<IntvarPayload, utils::Error> DecodeIntvarEvent(const uint8_t* body, size_t length);

/**
 * @brief Decode a ROTATE_EVENT body
 *
 * The 8-byte position is present only for binlog version > 1. The file name
 * runs to the end of the body and is trimmed of surrounding whitespace.
 */
utils::Expected<RotatePayload, utils::Error> DecodeRotateEvent(const uint8_t* body, size_t length,
                                                               uint16_t binlog_version);

/**
 * @brief Decode a GTID_LOG_EVENT body
 *
 * Only flags, SID and GNO are read; logical clock fields that newer servers
 * append are ignored.
 */
utils::Expected<GtidPayload, utils::Error> DecodeGtidEvent(const uint8_t* body, size_t length);

UnsupportedPayload DecodeUnsupportedEvent(const uint8_t* body, size_t length);

}  // namespace mybinlog::binlog
