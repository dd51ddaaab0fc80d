/**
 * @file error_test.cpp
 * @brief Unit tests for Error class and error codes
 */

#include "utils/error.h"

#include <gtest/gtest.h>

using namespace mybinlog::utils;

// ========== Test ErrorCode enum ==========

TEST(ErrorCodeTest, ErrorCodeValues) {
  EXPECT_EQ(static_cast<int>(ErrorCode::kSuccess), 0);
  EXPECT_EQ(static_cast<int>(ErrorCode::kUnknown), 1);
  EXPECT_EQ(static_cast<int>(ErrorCode::kConfigFileNotFound), 1000);
  EXPECT_EQ(static_cast<int>(ErrorCode::kBinlogInvalidFileHeader), 2000);
  EXPECT_EQ(static_cast<int>(ErrorCode::kAppInvalidArguments), 3000);
}

TEST(ErrorCodeTest, ErrorCodeToString) {
  EXPECT_STREQ(ErrorCodeToString(ErrorCode::kSuccess), "Success");
  EXPECT_STREQ(ErrorCodeToString(ErrorCode::kInvalidArgument), "Invalid argument");
  EXPECT_STREQ(ErrorCodeToString(ErrorCode::kConfigFileNotFound), "Configuration file not found");
  EXPECT_STREQ(ErrorCodeToString(ErrorCode::kBinlogChecksumMismatch), "Event checksum mismatch");
  EXPECT_STREQ(ErrorCodeToString(ErrorCode::kBinlogUnknownTable), "Unknown table id");
  EXPECT_STREQ(ErrorCodeToString(ErrorCode::kAppInvalidArguments), "Invalid command line arguments");
}

TEST(ErrorCodeTest, UnknownErrorCode) {
  EXPECT_STREQ(ErrorCodeToString(static_cast<ErrorCode>(9999)), "Unknown error code");
}

TEST(ErrorCodeTest, AllBinlogErrorCodesHaveNames) {
  for (int code = 2000; code <= 2010; ++code) {
    EXPECT_STRNE(ErrorCodeToString(static_cast<ErrorCode>(code)), "Unknown error code") << "code " << code;
  }
}

TEST(ErrorCodeTest, RecoverableBinlogErrors) {
  EXPECT_TRUE(IsRecoverableBinlogError(ErrorCode::kBinlogUnknownTable));
  EXPECT_TRUE(IsRecoverableBinlogError(ErrorCode::kBinlogUnknownStatusVar));

  EXPECT_FALSE(IsRecoverableBinlogError(ErrorCode::kBinlogTruncated));
  EXPECT_FALSE(IsRecoverableBinlogError(ErrorCode::kBinlogChecksumMismatch));
  EXPECT_FALSE(IsRecoverableBinlogError(ErrorCode::kBinlogUnknownEventType));
  EXPECT_FALSE(IsRecoverableBinlogError(ErrorCode::kBinlogInvalidBody));
}

// ========== Test Error class ==========

TEST(ErrorTest, DefaultConstructor) {
  Error error;
  EXPECT_EQ(error.code(), ErrorCode::kSuccess);
  EXPECT_FALSE(error.is_error());
}

TEST(ErrorTest, CodeOnlyConstructor) {
  Error error(ErrorCode::kBinlogTruncated);
  EXPECT_EQ(error.code(), ErrorCode::kBinlogTruncated);
  EXPECT_EQ(error.message(), "Truncated binlog data");
  EXPECT_TRUE(error.context().empty());
  EXPECT_TRUE(error.is_error());
}

TEST(ErrorTest, FullConstructor) {
  Error error(ErrorCode::kBinlogInvalidBody, "null bitmap is 2 bytes, expected 1", "shop.orders");
  EXPECT_EQ(error.code(), ErrorCode::kBinlogInvalidBody);
  EXPECT_EQ(error.message(), "null bitmap is 2 bytes, expected 1");
  EXPECT_EQ(error.context(), "shop.orders");
}

TEST(ErrorTest, ToString) {
  Error error1(ErrorCode::kInvalidArgument);
  EXPECT_EQ(error1.to_string(), "[Invalid argument (2)] Invalid argument");

  Error error2(ErrorCode::kNotFound, "binlog.000042");
  EXPECT_EQ(error2.to_string(), "[Not found (8)] binlog.000042");

  Error error3(ErrorCode::kBinlogChecksumMismatch, "stored crc32 1, computed 2", "XID_EVENT at log_pos 512");
  EXPECT_EQ(error3.to_string(),
            "[Event checksum mismatch (2005)] stored crc32 1, computed 2 (context: XID_EVENT at log_pos 512)");
}

TEST(ErrorTest, StringConversion) {
  Error error(ErrorCode::kInvalidArgument, "Invalid input");
  std::string str = error;
  EXPECT_EQ(str, "[Invalid argument (2)] Invalid input");
}

TEST(ErrorTest, WhatMethod) {
  Error error(ErrorCode::kBinlogEndOfStream, "end of stream");
  EXPECT_STREQ(error.what(), "end of stream");
}

// ========== Test helper functions ==========

TEST(ErrorTest, MakeErrorVariants) {
  auto code_only = MakeError(ErrorCode::kInternalError);
  EXPECT_EQ(code_only.message(), "Internal error");

  auto with_message = MakeError(ErrorCode::kIOError, "Failed to read file");
  EXPECT_EQ(with_message.code(), ErrorCode::kIOError);
  EXPECT_EQ(with_message.message(), "Failed to read file");

  auto with_context = MakeError(ErrorCode::kBinlogTruncated, "uint32: need 4 bytes, 1 available", "offset 17");
  EXPECT_EQ(with_context.context(), "offset 17");
}

TEST(ErrorTest, ErrorMacroRecordsLocation) {
  auto error = MYBINLOG_ERROR(ErrorCode::kUnknown, "Something went wrong");
  EXPECT_EQ(error.code(), ErrorCode::kUnknown);
  EXPECT_EQ(error.message(), "Something went wrong");
  EXPECT_NE(error.context().find("error_test.cpp:"), std::string::npos);
}
