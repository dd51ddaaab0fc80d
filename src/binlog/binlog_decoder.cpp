/**
 * @file binlog_decoder.cpp
 * @brief Sequential binlog decoder implementation
 */

#include "binlog/binlog_decoder.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <utility>

#include "utils/string_utils.h"
#include "utils/structured_log.h"

namespace mybinlog::binlog {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

std::string PositionContext(const EventHeader& header) {
  return std::string(GetEventTypeName(header.event_type)) + " at log_pos " + std::to_string(header.log_pos);
}

}  // namespace

BinlogDecoder::BinlogDecoder(std::unique_ptr<ByteSource> source, const ReaderOptions& options)
    : source_(std::move(source)), window_(options) {}

Expected<std::unique_ptr<BinlogDecoder>, Error> BinlogDecoder::OpenFile(const std::string& path,
                                                                        const ReaderOptions& options) {
  auto source = FileByteSource::Open(path);
  if (!source) {
    return MakeUnexpected(source.error());
  }
  return std::make_unique<BinlogDecoder>(std::move(*source), options);
}

Error BinlogDecoder::Fail(Error error) {
  state_ = State::kFinished;
  fatal_error_ = error;
  utils::LogBinlogDecodeError(source_->Name(), source_->Offset(), error.to_string());
  return error;
}

Expected<void, Error> BinlogDecoder::Open() {
  if (state_ != State::kAwaitingMagic) {
    return {};
  }

  auto magic = source_->ReadExactly(kBinlogMagicLength);
  if (!magic) {
    return MakeUnexpected(Fail(MakeError(ErrorCode::kBinlogInvalidFileHeader,
                                         "stream too short for binlog magic: " + magic.error().message(),
                                         source_->Name())));
  }
  if (!std::equal(magic->begin(), magic->end(), std::begin(kBinlogMagic))) {
    return MakeUnexpected(Fail(MakeError(ErrorCode::kBinlogInvalidFileHeader,
                                         "invalid binlog magic " + utils::HexString(*magic), source_->Name())));
  }

  state_ = State::kStreaming;
  spdlog::debug("Opened binlog {}", source_->Name());
  return {};
}

Expected<std::optional<Event>, Error> BinlogDecoder::DecodeNext() {
  if (state_ == State::kAwaitingMagic) {
    auto opened = Open();
    if (!opened) {
      return MakeUnexpected(opened.error());
    }
  }

  while (state_ == State::kStreaming) {
    // Header width comes from the last format description (19 before any)
    const size_t header_width = context_.HeaderWidth();
    auto header_bytes = source_->ReadExactly(header_width);
    if (!header_bytes) {
      if (header_bytes.error().code() == ErrorCode::kBinlogEndOfStream) {
        state_ = State::kFinished;
        return std::optional<Event>();
      }
      return MakeUnexpected(Fail(header_bytes.error()));
    }

    auto header = DecodeEventHeader(header_bytes->data(), header_bytes->size(), header_width);
    if (!header) {
      return MakeUnexpected(Fail(header.error()));
    }
    const uint8_t type = header->event_type;
    if (!IsKnownEventType(type)) {
      return MakeUnexpected(Fail(MakeError(ErrorCode::kBinlogUnknownEventType,
                                           "unknown event type " + std::to_string(type),
                                           "log_pos " + std::to_string(header->log_pos))));
    }
    if (header->event_size < header_width) {
      return MakeUnexpected(Fail(MakeError(ErrorCode::kBinlogInvalidHeader,
                                           "event size " + std::to_string(header->event_size) +
                                               " is smaller than the header",
                                           PositionContext(*header))));
    }

    auto body = source_->ReadExactly(header->event_size - header_width);
    if (!body) {
      // The header promised a body, so a clean end here is still a truncation
      return MakeUnexpected(Fail(MakeError(ErrorCode::kBinlogTruncated, body.error().message(),
                                           PositionContext(*header))));
    }
    ++stats_.events_read;

    const bool is_format_description = type == static_cast<uint8_t>(MySQLBinlogEventType::FORMAT_DESCRIPTION_EVENT);

    // Events before the window start are discarded unvalidated; format
    // descriptions and table maps are still validated and applied
    const bool in_window = is_format_description || window_.Started(*header);
    const bool carries_state = type == static_cast<uint8_t>(MySQLBinlogEventType::TABLE_MAP_EVENT);
    if (!in_window && !carries_state) {
      ++stats_.events_skipped;
      spdlog::debug("Skipping {} before window start", PositionContext(*header));
      continue;
    }

    // A format description announces the checksum policy for itself
    bool checksum_enabled = context_.ChecksumEnabled();
    ChecksumAlgorithm algorithm = context_.GetChecksumAlgorithm();
    if (is_format_description) {
      const FormatDescriptionChecksum policy = DetectFormatDescriptionChecksum(body->data(), body->size());
      checksum_enabled = policy.enabled;
      algorithm = policy.algorithm;
    }

    auto frame = ValidateEventFrame(header_bytes->data(), header_bytes->size(), body->data(), body->size(),
                                    header->event_size, checksum_enabled, algorithm);
    if (!frame) {
      const Error& error = frame.error();
      return MakeUnexpected(Fail(MakeError(error.code(), error.message(), PositionContext(*header))));
    }

    const size_t decode_length = is_format_description ? body->size() : frame->body_length;
    auto decoded = DecodeEventBody(*header, body->data(), decode_length, context_);
    if (!decoded) {
      const Error& error = decoded.error();
      return MakeUnexpected(Fail(MakeError(error.code(), error.message(), PositionContext(*header))));
    }

    if (const auto* format_description = std::get_if<FormatDescription>(&*decoded)) {
      context_.AdoptFormatDescription(*format_description);
      spdlog::debug("Adopted format description: binlog v{} server {} header {} checksum {}",
                    format_description->binlog_version, format_description->server_version,
                    format_description->header_length, ChecksumAlgorithmName(format_description->checksum_algorithm));
    } else if (const auto* schema = std::get_if<TableSchema>(&*decoded)) {
      context_.RegisterTable(*schema);
    }

    if (!in_window) {
      ++stats_.events_skipped;
      spdlog::debug("Applied {} before window start", PositionContext(*header));
      continue;
    }

    if (window_.ShouldStop(*header)) {
      state_ = State::kFinished;
      spdlog::debug("Stop condition reached at {}", PositionContext(*header));
      return std::optional<Event>();
    }

    if (const auto* rows = std::get_if<RowsEventPayload>(&*decoded)) {
      auto schema = context_.TableSchemaFor(rows->table_id);
      if (!schema) {
        // Event fully consumed, the caller may continue with the next one
        const Error& error = schema.error();
        spdlog::warn("{} ({})", error.message(), PositionContext(*header));
        return MakeUnexpected(MakeError(error.code(), error.message(), PositionContext(*header)));
      }
    }

    ++stats_.events_delivered;
    spdlog::debug("Decoded {}", PositionContext(*header));
    Event event{*header, std::move(*decoded), frame->checksum};
    return std::optional<Event>(std::move(event));
  }

  if (fatal_error_) {
    return MakeUnexpected(*fatal_error_);
  }
  return std::optional<Event>();
}

Expected<void, Error> BinlogDecoder::Walk(const EventConsumer& consumer) {
  auto result = [&]() -> Expected<void, Error> {
    while (true) {
      auto next = DecodeNext();
      if (!next) {
        return MakeUnexpected(next.error());
      }
      if (!next->has_value()) {
        return {};
      }

      auto keep_going = consumer(**next);
      if (!keep_going) {
        state_ = State::kFinished;
        return MakeUnexpected(keep_going.error());
      }
      if (!*keep_going) {
        state_ = State::kFinished;
        return {};
      }
    }
  }();

  utils::LogBinlogWalkSummary(source_->Name(), stats_.events_read, stats_.events_delivered, stats_.events_skipped,
                              result.has_value());
  return result;
}

}  // namespace mybinlog::binlog
