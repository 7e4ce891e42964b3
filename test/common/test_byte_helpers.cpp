#include <gtest/gtest.h>
#include <cstdint>
#include <vector>
#include "modbus_link/common/byte_helpers.hpp"

using mblink::AppendU16;
using mblink::GetHighByte;
using mblink::GetLowByte;
using mblink::MakeUint16;
using mblink::ReadU16;
using mblink::SwapBytes;

TEST(ByteHelpers, SplitAndJoin) {
  EXPECT_EQ(GetHighByte(0x1234), 0x12);
  EXPECT_EQ(GetLowByte(0x1234), 0x34);
  EXPECT_EQ(MakeUint16(0x12, 0x34), 0x1234);
  EXPECT_EQ(MakeUint16(0xFF, 0xFF), 0xFFFF);
}

TEST(ByteHelpers, SwapBytes) {
  EXPECT_EQ(SwapBytes(0x1234), 0x3412);
  EXPECT_EQ(SwapBytes(SwapBytes(0xBEEF)), 0xBEEF);
}

TEST(ByteHelpers, AppendIsBigEndian) {
  std::vector<uint8_t> bytes{0x01};
  AppendU16(bytes, 0xABCD);
  ASSERT_EQ(bytes.size(), 3);
  EXPECT_EQ(bytes[1], 0xAB);
  EXPECT_EQ(bytes[2], 0xCD);
}

TEST(ByteHelpers, ReadAtOffset) {
  std::vector<uint8_t> bytes{0x00, 0x12, 0x34, 0x56};
  EXPECT_EQ(ReadU16(bytes, 1), 0x1234);
  EXPECT_EQ(ReadU16(bytes, 2), 0x3456);
}
