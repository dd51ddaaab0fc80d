/**
 * @file decode_context_test.cpp
 * @brief Unit tests for the per-stream decode context
 */

#include "binlog/decode_context.h"

#include <gtest/gtest.h>

#include "binlog/binlog_event_types.h"
#include "binlog/event_header.h"
#include "binlog/binlog_test_builder.h"

using namespace mybinlog::binlog;
using namespace mybinlog::binlog::testing;
using mybinlog::utils::ErrorCode;

namespace {

FormatDescription MakeFormatDescription(const std::string& version, uint8_t alg, uint8_t table_map_length = 8) {
  Bytes body = FormatDescriptionBody(version, alg, ServerVersionSupportsChecksum(version), 0, 19, table_map_length);
  auto fd = DecodeFormatDescription(body.data(), body.size());
  EXPECT_TRUE(fd) << fd.error().to_string();
  return fd ? *fd : FormatDescription{};
}

TableSchema MakeSchema(uint64_t table_id, const std::string& table) {
  TableSchema schema;
  schema.table_id = table_id;
  schema.schema_name = "shop";
  schema.table_name = table;
  schema.column_count = 1;
  schema.column_types = {static_cast<uint8_t>(ColumnType::LONG)};
  schema.column_metas = {NoColumnMeta{}};
  return schema;
}

}  // namespace

TEST(DecodeContextTest, DefaultsBeforeFormatDescription) {
  DecodeContext context;
  EXPECT_FALSE(context.HasFormatDescription());
  EXPECT_EQ(context.HeaderWidth(), kEventHeaderLength);
  EXPECT_EQ(context.BinlogVersion(), 4);
  EXPECT_FALSE(context.ChecksumEnabled());
  EXPECT_EQ(context.GetChecksumAlgorithm(), ChecksumAlgorithm::kUndefined);
  EXPECT_FALSE(context.PostHeaderLength(static_cast<uint8_t>(MySQLBinlogEventType::TABLE_MAP_EVENT)).has_value());
  EXPECT_EQ(context.TableCount(), 0U);
}

TEST(DecodeContextTest, AdoptsFormatDescription) {
  DecodeContext context;
  context.AdoptFormatDescription(MakeFormatDescription("8.0.36", 1));

  EXPECT_TRUE(context.HasFormatDescription());
  EXPECT_EQ(context.HeaderWidth(), 19U);
  EXPECT_TRUE(context.ChecksumEnabled());
  EXPECT_EQ(context.GetChecksumAlgorithm(), ChecksumAlgorithm::kCrc32);
  auto tm_len = context.PostHeaderLength(static_cast<uint8_t>(MySQLBinlogEventType::TABLE_MAP_EVENT));
  ASSERT_TRUE(tm_len.has_value());
  EXPECT_EQ(*tm_len, 8);
  EXPECT_EQ(context.GetFormatDescription()->server_version, "8.0.36");
}

TEST(DecodeContextTest, ReplacesFormatDescription) {
  DecodeContext context;
  context.AdoptFormatDescription(MakeFormatDescription("8.0.36", 1));
  context.AdoptFormatDescription(MakeFormatDescription("5.5.62", 0, 6));

  EXPECT_FALSE(context.ChecksumEnabled());
  EXPECT_EQ(context.GetFormatDescription()->server_version, "5.5.62");
  EXPECT_EQ(TableIdWidth(context.PostHeaderLength(static_cast<uint8_t>(MySQLBinlogEventType::TABLE_MAP_EVENT))),
            4U);
}

TEST(DecodeContextTest, TableRegistry) {
  DecodeContext context;
  context.RegisterTable(MakeSchema(10, "orders"));
  context.RegisterTable(MakeSchema(11, "items"));
  EXPECT_EQ(context.TableCount(), 2U);

  auto orders = context.TableSchemaFor(10);
  ASSERT_TRUE(orders) << orders.error().to_string();
  EXPECT_EQ((*orders)->table_name, "orders");

  auto missing = context.TableSchemaFor(99);
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error().code(), ErrorCode::kBinlogUnknownTable);
}

TEST(DecodeContextTest, ReRegisterReplacesSchema) {
  DecodeContext context;
  context.RegisterTable(MakeSchema(10, "orders"));
  context.RegisterTable(MakeSchema(10, "orders_v2"));
  EXPECT_EQ(context.TableCount(), 1U);

  auto schema = context.TableSchemaFor(10);
  ASSERT_TRUE(schema);
  EXPECT_EQ((*schema)->table_name, "orders_v2");
}

TEST(DecodeContextTest, Reset) {
  DecodeContext context;
  context.AdoptFormatDescription(MakeFormatDescription("8.0.36", 1));
  context.RegisterTable(MakeSchema(10, "orders"));

  context.Reset();
  EXPECT_FALSE(context.HasFormatDescription());
  EXPECT_EQ(context.TableCount(), 0U);
  EXPECT_FALSE(context.TableSchemaFor(10));
}
