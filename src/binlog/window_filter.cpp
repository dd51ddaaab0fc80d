/**
 * @file window_filter.cpp
 * @brief Window filter implementation
 */

#include "binlog/window_filter.h"

namespace mybinlog::binlog {

bool WindowFilter::Started(const EventHeader& header) {
  if (started_) {
    return true;
  }

  const bool has_start_position = options_.start_position != 0;
  const bool has_start_time = options_.start_time != 0;
  if (!has_start_position && !has_start_time) {
    started_ = true;
    return true;
  }

  const int64_t event_start = static_cast<int64_t>(header.log_pos) - static_cast<int64_t>(header.event_size);
  if (has_start_position && event_start >= options_.start_position) {
    started_ = true;
  }
  if (has_start_time && header.timestamp >= options_.start_time) {
    started_ = true;
  }
  return started_;
}

bool WindowFilter::ShouldStop(const EventHeader& header) const {
  if (options_.stop_position != 0 && static_cast<int64_t>(header.log_pos) > options_.stop_position) {
    return true;
  }
  return options_.stop_time != 0 && header.timestamp >= options_.stop_time;
}

}  // namespace mybinlog::binlog
