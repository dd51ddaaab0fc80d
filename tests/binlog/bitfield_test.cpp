/**
 * @file bitfield_test.cpp
 * @brief Unit tests for packed column bitmaps
 */

#include "binlog/bitfield.h"

#include <gtest/gtest.h>

using namespace mybinlog::binlog;

TEST(BitfieldTest, BitmapBytes) {
  EXPECT_EQ(BitmapBytes(0), 0U);
  EXPECT_EQ(BitmapBytes(1), 1U);
  EXPECT_EQ(BitmapBytes(8), 1U);
  EXPECT_EQ(BitmapBytes(9), 2U);
  EXPECT_EQ(BitmapBytes(64), 8U);
}

TEST(BitfieldTest, LowBitFirst) {
  // 0b00000101, 0b00000010 -> bits 0, 2 and 9
  Bitfield bits({0x05, 0x02}, 10);
  EXPECT_TRUE(bits.IsSet(0));
  EXPECT_FALSE(bits.IsSet(1));
  EXPECT_TRUE(bits.IsSet(2));
  EXPECT_FALSE(bits.IsSet(8));
  EXPECT_TRUE(bits.IsSet(9));
  EXPECT_EQ(bits.Size(), 10U);
  EXPECT_EQ(bits.CountSet(), 3U);
}

TEST(BitfieldTest, PaddingBitsIgnored) {
  // Bits above bit_count are padding and never counted
  Bitfield bits({0xFF}, 3);
  EXPECT_EQ(bits.CountSet(), 3U);
  EXPECT_FALSE(bits.IsSet(3));
  EXPECT_FALSE(bits.IsSet(100));
}

TEST(BitfieldTest, Empty) {
  Bitfield bits;
  EXPECT_EQ(bits.Size(), 0U);
  EXPECT_EQ(bits.CountSet(), 0U);
  EXPECT_FALSE(bits.IsSet(0));
  EXPECT_TRUE(bits.Bytes().empty());
}
