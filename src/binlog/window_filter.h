/**
 * @file window_filter.h
 * @brief Position / time window applied while walking a binlog
 */

#pragma once

#include <cstdint>

#include "binlog/event_header.h"

namespace mybinlog::binlog {

/**
 * @brief Reader options; 0 means unset for every field
 */
struct ReaderOptions {
  int64_t start_position = 0;  // first event starting at or after this offset
  int64_t stop_position = 0;   // stop at the first event ending after this offset
  int64_t start_time = 0;      // unix seconds
  int64_t stop_time = 0;       // unix seconds
};

/**
 * @brief Start/stop decisions for a stream of event headers
 *
 * The start condition latches: once an event is inside the window every
 * later event is too, regardless of its own position or time.
 */
class WindowFilter {
 public:
  WindowFilter() = default;
  explicit WindowFilter(const ReaderOptions& options) : options_(options) {}

  /**
   * @brief Whether this event (and everything after it) is inside the window
   */
  bool Started(const EventHeader& header);

  /**
   * @brief Whether the walk must end before delivering this event
   */
  bool ShouldStop(const EventHeader& header) const;

  bool HasStarted() const { return started_; }

  const ReaderOptions& Options() const { return options_; }

 private:
  ReaderOptions options_;
  bool started_ = false;
};

}  // namespace mybinlog::binlog
