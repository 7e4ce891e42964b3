#include <gtest/gtest.h>
#include <array>
#include <cstdint>
#include <vector>
#include "modbus_link/common/byte_helpers.hpp"
#include "modbus_link/common/crc16.hpp"

using mblink::CalculateCrc16;
using mblink::GetHighByte;
using mblink::GetLowByte;
using mblink::VerifyCrc16;

TEST(CRC16, EmptyDataIsInitialValue) {
  std::vector<uint8_t> empty;
  EXPECT_EQ(CalculateCrc16(empty), 0xFFFF);
}

TEST(CRC16, ReadHoldingRegistersRequest) {
  // 01 03 00 00 00 02 goes on the wire as ... C4 0B
  std::vector<uint8_t> frame{0x01, 0x03, 0x00, 0x00, 0x00, 0x02};
  uint16_t crc = CalculateCrc16(frame);
  EXPECT_EQ(GetLowByte(crc), 0xC4);
  EXPECT_EQ(GetHighByte(crc), 0x0B);

  frame.push_back(0xC4);
  frame.push_back(0x0B);
  EXPECT_TRUE(VerifyCrc16(frame));
}

TEST(CRC16, KnownTestVectors) {
  std::vector<uint8_t> read_ten{0x01, 0x03, 0x00, 0x00, 0x00, 0x0A};
  EXPECT_EQ(CalculateCrc16(read_ten), 0xCDC5);

  std::vector<uint8_t> read_three{0x11, 0x03, 0x00, 0x6B, 0x00, 0x03};
  EXPECT_EQ(CalculateCrc16(read_three), 0x8776);

  std::vector<uint8_t> write_register{0x01, 0x06, 0x00, 0x01, 0x00, 0x17};
  EXPECT_EQ(CalculateCrc16(write_register), 0x0498);
}

TEST(CRC16, ComputableAtCompileTime) {
  static constexpr std::array<uint8_t, 6> kRequest{0x01, 0x03, 0x00, 0x00, 0x00, 0x02};
  static_assert(CalculateCrc16(kRequest) == 0x0BC4);
  SUCCEED();
}

TEST(CRC16, VerifyRejectsTooShortFrame) {
  std::vector<uint8_t> frame{0x01};
  EXPECT_FALSE(VerifyCrc16(frame));
}

TEST(CRC16, VerifyRejectsCorruptedCrc) {
  std::vector<uint8_t> frame{0x01, 0x03, 0x00, 0x00, 0x00, 0x02, 0xC4, 0x0B};
  frame[7] = static_cast<uint8_t>(frame[7] ^ 0xFF);
  EXPECT_FALSE(VerifyCrc16(frame));
}

TEST(CRC16, EverySingleBitFlipIsDetected) {
  std::vector<uint8_t> frame{0x11, 0x03, 0x00, 0x6B, 0x00, 0x03};
  uint16_t crc = CalculateCrc16(frame);
  frame.push_back(GetLowByte(crc));
  frame.push_back(GetHighByte(crc));
  ASSERT_TRUE(VerifyCrc16(frame));

  for (size_t byte = 0; byte < frame.size(); ++byte) {
    for (int bit = 0; bit < 8; ++bit) {
      std::vector<uint8_t> corrupted = frame;
      corrupted[byte] = static_cast<uint8_t>(corrupted[byte] ^ (1U << bit));
      EXPECT_FALSE(VerifyCrc16(corrupted)) << "byte " << byte << " bit " << bit;
    }
  }
}

TEST(CRC16, OrderMatters) {
  std::vector<uint8_t> frame1{0x01, 0x02, 0x03, 0x04};
  std::vector<uint8_t> frame2{0x04, 0x03, 0x02, 0x01};
  EXPECT_NE(CalculateCrc16(frame1), CalculateCrc16(frame2));
}
