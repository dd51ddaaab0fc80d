/**
 * @file event_formatter_test.cpp
 * @brief Unit tests for JSON rendering of decoded events
 */

#include "app/event_formatter.h"

#include <gtest/gtest.h>

#include "binlog/binlog_test_builder.h"

using namespace mybinlog::app;
using namespace mybinlog::binlog;
using json = nlohmann::json;

namespace {

Event MakeEvent(MySQLBinlogEventType type, EventBody body) {
  Event event;
  event.header.timestamp = 1700000000;
  event.header.event_type = static_cast<uint8_t>(type);
  event.header.server_id = 7;
  event.header.event_size = 50;
  event.header.log_pos = 400;
  event.header.flags = 0x0008;
  event.body = std::move(body);
  return event;
}

TableSchema OrdersSchema() {
  std::vector<uint8_t> body = mybinlog::binlog::testing::TableMapBody(
      108, "shop", "orders",
      {static_cast<uint8_t>(ColumnType::LONG), static_cast<uint8_t>(ColumnType::VARCHAR),
       static_cast<uint8_t>(ColumnType::NEWDECIMAL)},
      {0xFC, 0x03, 10, 2}, {0x06});
  auto schema = DecodeTableMapEvent(body.data(), body.size(), 6);
  EXPECT_TRUE(schema) << schema.error().to_string();
  return schema ? *schema : TableSchema();
}

}  // namespace

TEST(EventFormatterTest, CommonFields) {
  Event event = MakeEvent(MySQLBinlogEventType::XID_EVENT, XidPayload{42});
  event.checksum = EventChecksum{ChecksumAlgorithm::kCrc32, 0x00ABCDEF};

  json line = FormatEvent(event, DecodeContext(), false);
  EXPECT_EQ(line["type"], "XID_EVENT");
  EXPECT_EQ(line["type_code"], 16);
  EXPECT_EQ(line["timestamp"], 1700000000);
  EXPECT_EQ(line["server_id"], 7);
  EXPECT_EQ(line["event_size"], 50);
  EXPECT_EQ(line["log_pos"], 400);
  EXPECT_EQ(line["flags"], 8);
  EXPECT_EQ(line["checksum"], "00abcdef");
  EXPECT_EQ(line["body"]["xid"], 42);
}

TEST(EventFormatterTest, NoChecksumField) {
  Event event = MakeEvent(MySQLBinlogEventType::XID_EVENT, XidPayload{1});
  json line = FormatEvent(event, DecodeContext(), false);
  EXPECT_FALSE(line.contains("checksum"));
}

TEST(EventFormatterTest, QueryBody) {
  QueryPayload query;
  query.thread_id = 12;
  query.exec_time = 1;
  query.schema = "shop";
  query.query = "INSERT INTO orders VALUES (1)";
  json line = FormatEvent(MakeEvent(MySQLBinlogEventType::QUERY_EVENT, query), DecodeContext(), false);

  EXPECT_EQ(line["body"]["thread_id"], 12);
  EXPECT_EQ(line["body"]["exec_time"], 1);
  EXPECT_EQ(line["body"]["error_code"], 0);
  EXPECT_EQ(line["body"]["schema"], "shop");
  EXPECT_EQ(line["body"]["query"], "INSERT INTO orders VALUES (1)");
  EXPECT_FALSE(line["body"].contains("status_vars"));
}

TEST(EventFormatterTest, QueryStatusVars) {
  QueryPayload query;
  query.schema = "shop";
  query.query = "BEGIN";
  // Q_FLAGS2 = 0x00004000, Q_CHARSET = {33, 33, 255}
  query.status_vars = {0x00, 0x00, 0x40, 0x00, 0x00, 0x04, 0x21, 0x00, 0x21, 0x00, 0xFF, 0x00};
  json line = FormatEvent(MakeEvent(MySQLBinlogEventType::QUERY_EVENT, query), DecodeContext(), false);

  const json& vars = line["body"]["status_vars"];
  EXPECT_EQ(vars["flags2"], 0x4000);
  EXPECT_EQ(vars["charset"]["client"], 33);
  EXPECT_EQ(vars["charset"]["collation_connection"], 33);
  EXPECT_EQ(vars["charset"]["collation_server"], 255);
  EXPECT_FALSE(vars.contains("sql_mode"));
  EXPECT_FALSE(line["body"].contains("status_vars_error"));
}

TEST(EventFormatterTest, UnknownStatusVarKeepsRawRegion) {
  QueryPayload query;
  query.query = "COMMIT";
  // Q_COMMIT_TS (14) has no decoder
  query.status_vars = {0x00, 0x00, 0x00, 0x00, 0x00, 0x0E, 0x01, 0x02};
  json line = FormatEvent(MakeEvent(MySQLBinlogEventType::QUERY_EVENT, query), DecodeContext(), false);

  const json& body = line["body"];
  EXPECT_EQ(body["query"], "COMMIT");
  EXPECT_FALSE(body.contains("status_vars"));
  EXPECT_EQ(body["status_vars_raw"], "00000000000e0102");
  EXPECT_NE(body["status_vars_error"].get<std::string>().find("2009"), std::string::npos);
  EXPECT_NE(body["status_vars_error"].get<std::string>().find("status var at offset 5"), std::string::npos);
}

TEST(EventFormatterTest, FormatDescriptionBody) {
  FormatDescription fd;
  fd.server_version = "8.0.36";
  fd.checksum_algorithm = ChecksumAlgorithm::kCrc32;
  json line = FormatEvent(MakeEvent(MySQLBinlogEventType::FORMAT_DESCRIPTION_EVENT, fd), DecodeContext(), false);

  EXPECT_EQ(line["type"], "FORMAT_DESCRIPTION_EVENT");
  EXPECT_EQ(line["body"]["binlog_version"], 4);
  EXPECT_EQ(line["body"]["server_version"], "8.0.36");
  EXPECT_EQ(line["body"]["header_length"], 19);
  EXPECT_EQ(line["body"]["checksum_algorithm"], ChecksumAlgorithmName(ChecksumAlgorithm::kCrc32));
}

TEST(EventFormatterTest, IntvarRotateGtid) {
  json intvar = FormatEvent(MakeEvent(MySQLBinlogEventType::INTVAR_EVENT, IntvarPayload{2, 99}), DecodeContext(),
                            false);
  EXPECT_EQ(intvar["body"]["intvar_type"], "INSERT_ID");
  EXPECT_EQ(intvar["body"]["value"], 99);

  RotatePayload rotate;
  rotate.position = 4;
  rotate.next_file = "binlog.000002";
  json rotated = FormatEvent(MakeEvent(MySQLBinlogEventType::ROTATE_EVENT, rotate), DecodeContext(), false);
  EXPECT_EQ(rotated["body"]["position"], 4);
  EXPECT_EQ(rotated["body"]["next_file"], "binlog.000002");

  GtidPayload gtid;
  gtid.flags = 1;
  gtid.sid.fill(0x11);
  gtid.gno = 5;
  json gtid_line = FormatEvent(MakeEvent(MySQLBinlogEventType::GTID_LOG_EVENT, gtid), DecodeContext(), false);
  EXPECT_EQ(gtid_line["body"]["gtid"], "11111111-1111-1111-1111-111111111111:5");
  EXPECT_EQ(gtid_line["body"]["flags"], 1);
}

TEST(EventFormatterTest, TableMapColumns) {
  TableSchema schema = OrdersSchema();
  json line = FormatEvent(MakeEvent(MySQLBinlogEventType::TABLE_MAP_EVENT, schema), DecodeContext(), false);

  const json& body = line["body"];
  EXPECT_EQ(body["table_id"], 108);
  EXPECT_EQ(body["schema"], "shop");
  EXPECT_EQ(body["table"], "orders");
  ASSERT_EQ(body["columns"].size(), 3U);

  EXPECT_EQ(body["columns"][0]["type"], "LONG");
  EXPECT_FALSE(body["columns"][0]["nullable"].get<bool>());
  EXPECT_FALSE(body["columns"][0].contains("meta"));

  EXPECT_EQ(body["columns"][1]["type"], "VARCHAR");
  EXPECT_TRUE(body["columns"][1]["nullable"].get<bool>());
  EXPECT_EQ(body["columns"][1]["meta"]["max_length"], 1020);

  EXPECT_EQ(body["columns"][2]["type"], "NEWDECIMAL");
  EXPECT_EQ(body["columns"][2]["meta"]["precision"], 10);
  EXPECT_EQ(body["columns"][2]["meta"]["scale"], 2);
}

TEST(EventFormatterTest, RowsLabelledFromContext) {
  RowsEventPayload rows;
  rows.kind = RowsEventKind::kUpdate;
  rows.version = 2;
  rows.table_id = 108;
  rows.column_count = 3;
  rows.columns_present = Bitfield({0x05}, 3);
  rows.columns_after_image = Bitfield({0x07}, 3);
  rows.rows_data = {0x01, 0x02, 0x03};
  const Event event = MakeEvent(MySQLBinlogEventType::UPDATE_ROWS_EVENT, rows);

  json unlabelled = FormatEvent(event, DecodeContext(), false);
  EXPECT_EQ(unlabelled["body"]["kind"], RowsEventKindName(RowsEventKind::kUpdate));
  EXPECT_EQ(unlabelled["body"]["columns_present"], json::array({0, 2}));
  EXPECT_EQ(unlabelled["body"]["columns_after_image"], json::array({0, 1, 2}));
  EXPECT_EQ(unlabelled["body"]["rows_data_length"], 3);
  EXPECT_FALSE(unlabelled["body"].contains("schema"));
  EXPECT_FALSE(unlabelled["body"].contains("extra_data"));

  DecodeContext context;
  context.RegisterTable(OrdersSchema());
  json labelled = FormatEvent(event, context, false);
  EXPECT_EQ(labelled["body"]["schema"], "shop");
  EXPECT_EQ(labelled["body"]["table"], "orders");
}

TEST(EventFormatterTest, RawPayloadOnlyWhenRequested) {
  UnsupportedPayload payload{{0xDE, 0xAD, 0x01}};
  const Event event = MakeEvent(MySQLBinlogEventType::PREVIOUS_GTIDS_LOG_EVENT, payload);

  json plain = FormatEvent(event, DecodeContext(), false);
  EXPECT_EQ(plain["body"]["payload_length"], 3);
  EXPECT_FALSE(plain["body"].contains("raw"));

  json raw = FormatEvent(event, DecodeContext(), true);
  EXPECT_EQ(raw["body"]["raw"], "dead01");
}

TEST(EventFormatterTest, Summary) {
  DecoderStats stats;
  stats.events_read = 10;
  stats.events_delivered = 8;
  stats.events_skipped = 2;

  json ok = FormatSummary("binlog.000001", stats, 8, "");
  EXPECT_TRUE(ok["summary"].get<bool>());
  EXPECT_EQ(ok["file"], "binlog.000001");
  EXPECT_EQ(ok["events_read"], 10);
  EXPECT_EQ(ok["events_delivered"], 8);
  EXPECT_EQ(ok["events_skipped"], 2);
  EXPECT_EQ(ok["events_printed"], 8);
  EXPECT_TRUE(ok["success"].get<bool>());
  EXPECT_FALSE(ok.contains("error"));

  json failed = FormatSummary("binlog.000001", stats, 3, "[Truncated binlog data (2001)] short");
  EXPECT_FALSE(failed["success"].get<bool>());
  EXPECT_EQ(failed["error"], "[Truncated binlog data (2001)] short");
}
