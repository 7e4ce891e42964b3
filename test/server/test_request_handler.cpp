#include <gtest/gtest.h>
#include <cstdint>
#include <vector>
#include "modbus_link/pdu/pdu.hpp"
#include "modbus_link/server/data_store.hpp"
#include "modbus_link/server/request_handler.hpp"

using mblink::BitTable;
using mblink::DataStore;
using mblink::DataStoreSizes;
using mblink::Pdu;
using mblink::RegisterTable;
using mblink::RequestHandler;

namespace {

class RequestHandlerTest : public ::testing::Test {
 protected:
  DataStore store_{DataStoreSizes{100, 100, 100, 100}};
  RequestHandler handler_{store_};
};

}  // namespace

TEST_F(RequestHandlerTest, ReadHoldingRegisters) {
  std::vector<uint16_t> values{0x000A, 0x0102};
  ASSERT_TRUE(store_.WriteRegisters(RegisterTable::kHolding, 0, values));

  Pdu response = handler_.Handle(Pdu{0x03, {0x00, 0x00, 0x00, 0x02}});

  EXPECT_EQ(response, (Pdu{0x03, {0x04, 0x00, 0x0A, 0x01, 0x02}}));
}

TEST_F(RequestHandlerTest, ReadInputRegistersUsesInputTable) {
  std::vector<uint16_t> values{0xBEEF};
  ASSERT_TRUE(store_.WriteRegisters(RegisterTable::kInput, 9, values));

  EXPECT_EQ(handler_.Handle(Pdu{0x04, {0x00, 0x09, 0x00, 0x01}}), (Pdu{0x04, {0x02, 0xBE, 0xEF}}));
}

TEST_F(RequestHandlerTest, ReadCoilsPacksBits) {
  ASSERT_TRUE(store_.WriteBits(BitTable::kCoils, 0, {true, false, true}));
  EXPECT_EQ(handler_.Handle(Pdu{0x01, {0x00, 0x00, 0x00, 0x03}}), (Pdu{0x01, {0x01, 0x05}}));
}

TEST_F(RequestHandlerTest, ReadDiscreteInputs) {
  ASSERT_TRUE(store_.WriteBits(BitTable::kDiscreteInputs, 8, {true}));
  EXPECT_EQ(handler_.Handle(Pdu{0x02, {0x00, 0x00, 0x00, 0x09}}), (Pdu{0x02, {0x02, 0x00, 0x01}}));
}

TEST_F(RequestHandlerTest, WriteSingleCoilEchoes) {
  Pdu request{0x05, {0x00, 0x0A, 0xFF, 0x00}};
  EXPECT_EQ(handler_.Handle(request), request);
  EXPECT_EQ(store_.ReadBits(BitTable::kCoils, 10, 1), (std::vector<bool>{true}));
}

TEST_F(RequestHandlerTest, WriteSingleCoilRejectsOtherValues) {
  EXPECT_EQ(handler_.Handle(Pdu{0x05, {0x00, 0x0A, 0x12, 0x34}}), (Pdu{0x85, {0x03}}));
}

TEST_F(RequestHandlerTest, WriteSingleRegisterEchoes) {
  Pdu request{0x06, {0x00, 0x01, 0x00, 0x03}};
  EXPECT_EQ(handler_.Handle(request), request);
  EXPECT_EQ(store_.ReadRegisters(RegisterTable::kHolding, 1, 1), (std::vector<uint16_t>{3}));
}

TEST_F(RequestHandlerTest, WriteMultipleCoils) {
  Pdu response = handler_.Handle(Pdu{0x0F, {0x00, 0x13, 0x00, 0x0A, 0x02, 0xCD, 0x01}});

  EXPECT_EQ(response, (Pdu{0x0F, {0x00, 0x13, 0x00, 0x0A}}));
  EXPECT_EQ(store_.ReadBits(BitTable::kCoils, 0x13, 10),
            (std::vector<bool>{true, false, true, true, false, false, true, true, true, false}));
}

TEST_F(RequestHandlerTest, WriteMultipleRegisters) {
  Pdu response = handler_.Handle(Pdu{0x10, {0x00, 0x14, 0x00, 0x02, 0x04, 0x41, 0xCC, 0xCC, 0xCD}});

  EXPECT_EQ(response, (Pdu{0x10, {0x00, 0x14, 0x00, 0x02}}));
  EXPECT_EQ(store_.ReadRegisters(RegisterTable::kHolding, 20, 2), (std::vector<uint16_t>{0x41CC, 0xCCCD}));
}

TEST_F(RequestHandlerTest, ByteCountMismatchIsIllegalValue) {
  EXPECT_EQ(handler_.Handle(Pdu{0x10, {0x00, 0x00, 0x00, 0x02, 0x03, 0x00, 0x01, 0x00}}), (Pdu{0x90, {0x03}}));
  EXPECT_EQ(handler_.Handle(Pdu{0x0F, {0x00, 0x00, 0x00, 0x09, 0x01, 0xFF}}), (Pdu{0x8F, {0x03}}));
}

TEST_F(RequestHandlerTest, UnknownFunctionIsIllegalFunction) {
  EXPECT_EQ(handler_.Handle(Pdu{0x2B, {0x0E, 0x01, 0x00}}), (Pdu{0xAB, {0x01}}));
}

TEST_F(RequestHandlerTest, QuantityOutsideProtocolLimitsIsIllegalValue) {
  EXPECT_EQ(handler_.Handle(Pdu{0x03, {0x00, 0x00, 0x00, 0x00}}), (Pdu{0x83, {0x03}}));
  EXPECT_EQ(handler_.Handle(Pdu{0x03, {0x00, 0x00, 0x00, 0x7E}}), (Pdu{0x83, {0x03}}));
  EXPECT_EQ(handler_.Handle(Pdu{0x01, {0x00, 0x00, 0x07, 0xD1}}), (Pdu{0x81, {0x03}}));
}

TEST_F(RequestHandlerTest, RangeBeyondTableIsIllegalAddress) {
  EXPECT_EQ(handler_.Handle(Pdu{0x03, {0x00, 0x63, 0x00, 0x02}}), (Pdu{0x83, {0x02}}));
  EXPECT_EQ(handler_.Handle(Pdu{0x06, {0x00, 0x64, 0x00, 0x01}}), (Pdu{0x86, {0x02}}));
}

TEST_F(RequestHandlerTest, FailedMultipleWriteChangesNothing) {
  Pdu request{0x10, {0x00, 0x63, 0x00, 0x02, 0x04, 0x00, 0x01, 0x00, 0x02}};
  EXPECT_EQ(handler_.Handle(request), (Pdu{0x90, {0x02}}));
  EXPECT_EQ(store_.ReadRegisters(RegisterTable::kHolding, 99, 1), (std::vector<uint16_t>{0}));
}

TEST_F(RequestHandlerTest, TruncatedPayloadIsIllegalValue) {
  EXPECT_EQ(handler_.Handle(Pdu{0x03, {0x00, 0x00}}), (Pdu{0x83, {0x03}}));
  EXPECT_EQ(handler_.Handle(Pdu{0x10, {0x00, 0x00, 0x00}}), (Pdu{0x90, {0x03}}));
}
