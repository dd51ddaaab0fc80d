/**
 * @file binlog_event_test.cpp
 * @brief Unit tests for event body dispatch
 */

#include "binlog/binlog_event.h"

#include <gtest/gtest.h>

#include "binlog/binlog_test_builder.h"

using namespace mybinlog::binlog;
using namespace mybinlog::binlog::testing;
using mybinlog::utils::ErrorCode;

namespace {

EventHeader HeaderFor(MySQLBinlogEventType type, size_t body_length) {
  EventHeader header;
  header.timestamp = 1700000000;
  header.event_type = static_cast<uint8_t>(type);
  header.server_id = 1;
  header.event_size = static_cast<uint32_t>(19 + body_length);
  header.log_pos = 1000;
  return header;
}

DecodeContext ContextFor(const std::string& server_version, uint8_t table_map_length = 8) {
  DecodeContext context;
  Bytes fde = FormatDescriptionBody(server_version, 1, ServerVersionSupportsChecksum(server_version), 0, 19,
                                    table_map_length);
  auto fd = DecodeFormatDescription(fde.data(), fde.size());
  EXPECT_TRUE(fd) << fd.error().to_string();
  if (fd) {
    context.AdoptFormatDescription(*fd);
  }
  return context;
}

}  // namespace

TEST(DecodeEventBodyTest, DispatchesByType) {
  DecodeContext context = ContextFor("8.0.36");

  Bytes query = QueryBody(1, 0, 0, "shop", "BEGIN");
  auto query_body =
      DecodeEventBody(HeaderFor(MySQLBinlogEventType::QUERY_EVENT, query.size()), query.data(), query.size(), context);
  ASSERT_TRUE(query_body) << query_body.error().to_string();
  ASSERT_TRUE(std::holds_alternative<QueryPayload>(*query_body));
  EXPECT_EQ(std::get<QueryPayload>(*query_body).query, "BEGIN");

  Bytes xid = XidBody(9);
  auto xid_body = DecodeEventBody(HeaderFor(MySQLBinlogEventType::XID_EVENT, xid.size()), xid.data(), xid.size(), context);
  ASSERT_TRUE(xid_body);
  EXPECT_EQ(std::get<XidPayload>(*xid_body).xid, 9U);

  Bytes intvar = IntvarBody(1, 5);
  auto intvar_body = DecodeEventBody(HeaderFor(MySQLBinlogEventType::INTVAR_EVENT, intvar.size()), intvar.data(),
                                     intvar.size(), context);
  ASSERT_TRUE(intvar_body);
  EXPECT_EQ(std::get<IntvarPayload>(*intvar_body).value, 5U);

  Bytes rotate = RotateBody(4, "binlog.000002");
  auto rotate_body = DecodeEventBody(HeaderFor(MySQLBinlogEventType::ROTATE_EVENT, rotate.size()), rotate.data(),
                                     rotate.size(), context);
  ASSERT_TRUE(rotate_body);
  EXPECT_EQ(std::get<RotatePayload>(*rotate_body).next_file, "binlog.000002");

  Bytes gtid = GtidBody(0, Bytes(16, 0xAB), 3);
  auto gtid_body =
      DecodeEventBody(HeaderFor(MySQLBinlogEventType::GTID_LOG_EVENT, gtid.size()), gtid.data(), gtid.size(), context);
  ASSERT_TRUE(gtid_body);
  EXPECT_EQ(std::get<GtidPayload>(*gtid_body).gno, 3U);
}

TEST(DecodeEventBodyTest, TableMapAndRowsUseContextTableIdWidth) {
  DecodeContext context = ContextFor("5.1.10", 6);

  Bytes table_map = TableMapBody(77, "db", "t", {static_cast<uint8_t>(ColumnType::LONG)}, {}, {0x00}, 4);
  auto schema = DecodeEventBody(HeaderFor(MySQLBinlogEventType::TABLE_MAP_EVENT, table_map.size()), table_map.data(),
                                table_map.size(), context);
  ASSERT_TRUE(schema) << schema.error().to_string();
  EXPECT_EQ(std::get<TableSchema>(*schema).table_id, 77U);

  Bytes rows = RowsBody(77, 1, 1, {0x01}, std::nullopt, {0x00, 0x01, 0x00, 0x00, 0x00}, 4);
  auto rows_body = DecodeEventBody(HeaderFor(MySQLBinlogEventType::WRITE_ROWS_EVENT_V1, rows.size()), rows.data(),
                                   rows.size(), context);
  ASSERT_TRUE(rows_body) << rows_body.error().to_string();
  const auto& payload = std::get<RowsEventPayload>(*rows_body);
  EXPECT_EQ(payload.table_id, 77U);
  EXPECT_EQ(payload.rows_data.size(), 5U);
}

TEST(DecodeEventBodyTest, FormatDescription) {
  DecodeContext context;
  Bytes fde = FormatDescriptionBody("8.0.36", 1, true);
  auto body = DecodeEventBody(HeaderFor(MySQLBinlogEventType::FORMAT_DESCRIPTION_EVENT, fde.size()), fde.data(),
                              fde.size(), context);
  ASSERT_TRUE(body) << body.error().to_string();
  EXPECT_EQ(std::get<FormatDescription>(*body).server_version, "8.0.36");
  // Dispatch does not modify the context
  EXPECT_FALSE(context.HasFormatDescription());
}

TEST(DecodeEventBodyTest, RecognizedButUnsupportedKeepsRaw) {
  DecodeContext context = ContextFor("8.0.36");
  Bytes raw = {0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};
  auto body = DecodeEventBody(HeaderFor(MySQLBinlogEventType::PREVIOUS_GTIDS_LOG_EVENT, raw.size()), raw.data(),
                              raw.size(), context);
  ASSERT_TRUE(body) << body.error().to_string();
  ASSERT_TRUE(std::holds_alternative<UnsupportedPayload>(*body));
  EXPECT_EQ(std::get<UnsupportedPayload>(*body).data, raw);

  auto stop = DecodeEventBody(HeaderFor(MySQLBinlogEventType::STOP_EVENT, 0), nullptr, 0, context);
  ASSERT_TRUE(stop);
  EXPECT_TRUE(std::get<UnsupportedPayload>(*stop).data.empty());
}

TEST(DecodeEventBodyTest, MariaDBEventsKeepRaw) {
  DecodeContext context = ContextFor("10.6.16-MariaDB-log");
  Bytes raw = {0x01, 0x00, 0x00, 0x00};
  for (MySQLBinlogEventType type :
       {MySQLBinlogEventType::ANNOTATE_ROWS_EVENT, MySQLBinlogEventType::BINLOG_CHECKPOINT_EVENT,
        MySQLBinlogEventType::GTID_EVENT, MySQLBinlogEventType::GTID_LIST_EVENT,
        MySQLBinlogEventType::START_ENCRYPTION_EVENT}) {
    auto body = DecodeEventBody(HeaderFor(type, raw.size()), raw.data(), raw.size(), context);
    ASSERT_TRUE(body) << GetEventTypeName(type) << ": " << body.error().to_string();
    ASSERT_TRUE(std::holds_alternative<UnsupportedPayload>(*body)) << GetEventTypeName(type);
    EXPECT_EQ(std::get<UnsupportedPayload>(*body).data, raw);
  }
  EXPECT_STREQ(GetEventTypeName(MySQLBinlogEventType::GTID_LIST_EVENT), "GTID_LIST_EVENT");
}

TEST(DecodeEventBodyTest, UnknownEventType) {
  DecodeContext context = ContextFor("8.0.36");
  Bytes raw = {0x00};
  for (uint8_t code : {uint8_t{0}, uint8_t{43}, uint8_t{159}, uint8_t{165}, uint8_t{200}}) {
    EventHeader header = HeaderFor(MySQLBinlogEventType::QUERY_EVENT, raw.size());
    header.event_type = code;
    auto body = DecodeEventBody(header, raw.data(), raw.size(), context);
    ASSERT_FALSE(body) << "code " << static_cast<int>(code);
    EXPECT_EQ(body.error().code(), ErrorCode::kBinlogUnknownEventType);
    EXPECT_EQ(body.error().context(), "log_pos 1000");
  }
}

TEST(DecodeEventBodyTest, PropagatesBodyErrors) {
  DecodeContext context = ContextFor("8.0.36");
  Bytes xid = {0x01, 0x02};
  auto body = DecodeEventBody(HeaderFor(MySQLBinlogEventType::XID_EVENT, xid.size()), xid.data(), xid.size(), context);
  ASSERT_FALSE(body);
  EXPECT_EQ(body.error().code(), ErrorCode::kBinlogTruncated);
}

TEST(EventTest, TypeAccessors) {
  Event event;
  event.header.event_type = static_cast<uint8_t>(MySQLBinlogEventType::XID_EVENT);
  event.body = XidPayload{1};
  EXPECT_EQ(event.Type(), MySQLBinlogEventType::XID_EVENT);
  EXPECT_STREQ(event.TypeName(), "XID_EVENT");
}
