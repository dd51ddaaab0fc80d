/**
 * @file binlog_decoder.h
 * @brief Sequential binlog decoder
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "binlog/binlog_event.h"
#include "binlog/byte_source.h"
#include "binlog/decode_context.h"
#include "binlog/window_filter.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace mybinlog::binlog {

/// Magic bytes at the start of every binlog file: 0xFE 'b' 'i' 'n'
constexpr uint8_t kBinlogMagic[] = {0xFE, 0x62, 0x69, 0x6E};
constexpr size_t kBinlogMagicLength = sizeof(kBinlogMagic);

/**
 * @brief Counters kept while walking a binlog
 */
struct DecoderStats {
  uint64_t events_read = 0;       // events framed and validated
  uint64_t events_delivered = 0;  // events returned to the caller
  uint64_t events_skipped = 0;    // events before the start of the window
};

/**
 * @brief Decodes the events of one binlog stream in order
 *
 * Reads the magic, then one event at a time. Header width, checksum policy
 * and table schemas come from earlier events in the same stream and are kept
 * in the decoder's DecodeContext.
 *
 * Example usage:
 * @code
 * auto source = FileByteSource::Open("binlog.000001");
 * BinlogDecoder decoder(std::move(*source), options);
 * auto result = decoder.Walk([](const Event& event) -> Expected<bool, Error> {
 *   std::cout << event.TypeName() << "\n";
 *   return true;
 * });
 * @endcode
 */
class BinlogDecoder {
 public:
  /**
   * @brief Return true to continue, false to stop; an error ends the walk
   */
  using EventConsumer = std::function<utils::Expected<bool, utils::Error>(const Event&)>;

  enum class State : uint8_t {
    kAwaitingMagic,
    kStreaming,
    kFinished,
  };

  explicit BinlogDecoder(std::unique_ptr<ByteSource> source, const ReaderOptions& options = ReaderOptions());

  /**
   * @brief Open a binlog file and create a decoder for it
   */
  static utils::Expected<std::unique_ptr<BinlogDecoder>, utils::Error> OpenFile(
      const std::string& path, const ReaderOptions& options = ReaderOptions());

  /**
   * @brief Read and check the 4-byte magic
   * @return kBinlogInvalidFileHeader on mismatch or a stream shorter than 4 bytes
   */
  utils::Expected<void, utils::Error> Open();

  /**
   * @brief Decode the next event inside the window
   *
   * Opens the stream first if Open() was not called. Events before the window
   * start are validated and, for FORMAT_DESCRIPTION and TABLE_MAP, applied to
   * the context without being returned.
   *
   * @return Event; std::nullopt at the end of the stream or once the stop
   *         condition matched; an error otherwise. kBinlogUnknownTable leaves
   *         the decoder positioned at the next event.
   */
  utils::Expected<std::optional<Event>, utils::Error> DecodeNext();

  /**
   * @brief Decode all remaining events and pass each one to consumer
   *
   * @return Success when the stream ended, the stop condition matched or the
   *         consumer returned false; the first error otherwise
   */
  utils::Expected<void, utils::Error> Walk(const EventConsumer& consumer);

  const DecodeContext& Context() const { return context_; }

  State GetState() const { return state_; }

  const DecoderStats& Stats() const { return stats_; }

  /**
   * @brief Bytes consumed from the source
   */
  uint64_t Offset() const { return source_->Offset(); }

 private:
  utils::Error Fail(utils::Error error);

  std::unique_ptr<ByteSource> source_;
  DecodeContext context_;
  WindowFilter window_;
  State state_ = State::kAwaitingMagic;
  DecoderStats stats_;
  std::optional<utils::Error> fatal_error_;
};

}  // namespace mybinlog::binlog
