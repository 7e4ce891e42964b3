#include <gtest/gtest.h>
#include <cstdint>
#include <span>
#include <string>
#include <vector>
#include "modbus_link/ascii/ascii_frame.hpp"
#include "modbus_link/common/errors.hpp"
#include "modbus_link/pdu/pdu.hpp"

using mblink::Adu;
using mblink::AsciiFrame;
using mblink::CrcError;
using mblink::InvalidResponseError;
using mblink::Pdu;

namespace {

std::span<uint8_t const> AsBytes(std::string const &text) {
  return {reinterpret_cast<uint8_t const *>(text.data()), text.size()};
}

}  // namespace

TEST(AsciiFrame, EncodeReadHoldingRegisters) {
  Pdu request{0x03, {0x00, 0x00, 0x00, 0x02}};
  EXPECT_EQ(AsciiFrame::Encode(0x01, request), ":010300000002FA\r\n");
}

TEST(AsciiFrame, DecodeReadResponse) {
  Adu adu = AsciiFrame::Decode(":010304000A0102EB\r\n");
  EXPECT_EQ(adu.unit_id, 0x01);
  EXPECT_EQ(adu.pdu.function_code, 0x03);
  EXPECT_EQ(adu.pdu.payload, (std::vector<uint8_t>{0x04, 0x00, 0x0A, 0x01, 0x02}));
}

TEST(AsciiFrame, DecodeAcceptsLowerCaseHex) {
  Adu adu = AsciiFrame::Decode(":010304000a0102eb\r\n");
  EXPECT_EQ(adu.pdu.payload, (std::vector<uint8_t>{0x04, 0x00, 0x0A, 0x01, 0x02}));
}

TEST(AsciiFrame, DecodeExceptionResponse) {
  Adu adu = AsciiFrame::Decode(":0183027A\r\n");
  EXPECT_TRUE(adu.pdu.IsException());
  EXPECT_EQ(adu.pdu.payload, (std::vector<uint8_t>{0x02}));
}

TEST(AsciiFrame, MalformedFramesAreInvalidResponses) {
  EXPECT_THROW(static_cast<void>(AsciiFrame::Decode("010300000002FA\r\n")), InvalidResponseError);
  EXPECT_THROW(static_cast<void>(AsciiFrame::Decode(":010300000002FA\n")), InvalidResponseError);
  EXPECT_THROW(static_cast<void>(AsciiFrame::Decode(":010300000002F\r\n")), InvalidResponseError);
  EXPECT_THROW(static_cast<void>(AsciiFrame::Decode(":0103000000G2FA\r\n")), InvalidResponseError);
  EXPECT_THROW(static_cast<void>(AsciiFrame::Decode(":01FF\r\n")), InvalidResponseError);
}

TEST(AsciiFrame, WrongLrcIsCrcError) {
  EXPECT_THROW(static_cast<void>(AsciiFrame::Decode(":010300000002FB\r\n")), CrcError);
}

TEST(AsciiFrame, SingleBitFlipInBodyIsCrcError) {
  Pdu request{0x06, {0x00, 0x01, 0x00, 0x03}};
  std::string encoded = AsciiFrame::Encode(0x11, request);
  ASSERT_EQ(encoded, ":110600010003E5\r\n");

  std::string hex = encoded.substr(1, encoded.size() - 3);
  auto body = AsciiFrame::HexToBytes(hex);
  ASSERT_TRUE(body.has_value());
  for (size_t byte = 0; byte < body->size(); ++byte) {
    for (int bit = 0; bit < 8; ++bit) {
      std::vector<uint8_t> corrupted = *body;
      corrupted[byte] = static_cast<uint8_t>(corrupted[byte] ^ (1U << bit));
      std::string frame = ":" + AsciiFrame::BytesToHex(corrupted) + "\r\n";
      EXPECT_THROW(static_cast<void>(AsciiFrame::Decode(frame)), CrcError) << "byte " << byte << " bit " << bit;
    }
  }
}

TEST(AsciiFrame, BytesNeededUntilLineFeed) {
  std::string frame = ":010300000002FA\r\n";
  EXPECT_EQ(AsciiFrame::BytesNeeded(AsBytes(frame).first(0)), 1);
  EXPECT_EQ(AsciiFrame::BytesNeeded(AsBytes(frame).first(frame.size() - 1)), 1);
  EXPECT_EQ(AsciiFrame::BytesNeeded(AsBytes(frame)), 0);
}

TEST(AsciiFrame, BytesNeededRejectsRunawayFrame) {
  std::string runaway(AsciiFrame::kMaxFrameLength + 1, '0');
  EXPECT_THROW(static_cast<void>(AsciiFrame::BytesNeeded(AsBytes(runaway))), InvalidResponseError);
}

TEST(AsciiFrame, HexHelpers) {
  std::vector<uint8_t> bytes{0x00, 0x7F, 0xAB};
  EXPECT_EQ(AsciiFrame::BytesToHex(bytes), "007FAB");
  EXPECT_EQ(AsciiFrame::HexToBytes("007fab"), bytes);
  EXPECT_FALSE(AsciiFrame::HexToBytes("0Z").has_value());
}
