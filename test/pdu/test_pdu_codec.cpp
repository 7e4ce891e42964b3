#include <gtest/gtest.h>
#include <cstdint>
#include <vector>
#include "modbus_link/common/errors.hpp"
#include "modbus_link/common/exception_code.hpp"
#include "modbus_link/common/function_code.hpp"
#include "modbus_link/pdu/pdu.hpp"
#include "modbus_link/pdu/pdu_codec.hpp"

using mblink::ExceptionCode;
using mblink::FunctionCode;
using mblink::InvalidArgumentError;
using mblink::InvalidResponseError;
using mblink::ModbusException;
using mblink::Pdu;
using mblink::PduCodec;

TEST(PduCodec, EncodeReadHoldingRegisters) {
  Pdu request = PduCodec::EncodeReadRequest(FunctionCode::kReadHR, 0x006B, 3);
  EXPECT_EQ(request.function_code, 0x03);
  EXPECT_EQ(request.payload, (std::vector<uint8_t>{0x00, 0x6B, 0x00, 0x03}));
}

TEST(PduCodec, ReadQuantityLimits) {
  EXPECT_NO_THROW(static_cast<void>(PduCodec::EncodeReadRequest(FunctionCode::kReadCoils, 0, 2000)));
  EXPECT_THROW(static_cast<void>(PduCodec::EncodeReadRequest(FunctionCode::kReadCoils, 0, 2001)),
               InvalidArgumentError);
  EXPECT_NO_THROW(static_cast<void>(PduCodec::EncodeReadRequest(FunctionCode::kReadIR, 0, 125)));
  EXPECT_THROW(static_cast<void>(PduCodec::EncodeReadRequest(FunctionCode::kReadHR, 0, 126)), InvalidArgumentError);
  EXPECT_THROW(static_cast<void>(PduCodec::EncodeReadRequest(FunctionCode::kReadHR, 0, 0)), InvalidArgumentError);
}

TEST(PduCodec, RangeMustFitAddressSpace) {
  EXPECT_NO_THROW(static_cast<void>(PduCodec::EncodeReadRequest(FunctionCode::kReadHR, 0xFFFF, 1)));
  EXPECT_THROW(static_cast<void>(PduCodec::EncodeReadRequest(FunctionCode::kReadHR, 0xFFFF, 2)),
               InvalidArgumentError);
}

TEST(PduCodec, ReadRequestRejectsWriteFunction) {
  EXPECT_THROW(static_cast<void>(PduCodec::EncodeReadRequest(FunctionCode::kWriteSingleReg, 0, 1)),
               InvalidArgumentError);
}

TEST(PduCodec, EncodeWriteSingleCoil) {
  EXPECT_EQ(PduCodec::EncodeWriteSingleCoil(0x00AC, true).payload, (std::vector<uint8_t>{0x00, 0xAC, 0xFF, 0x00}));
  EXPECT_EQ(PduCodec::EncodeWriteSingleCoil(0x00AC, false).payload, (std::vector<uint8_t>{0x00, 0xAC, 0x00, 0x00}));
}

TEST(PduCodec, EncodeWriteMultipleCoils) {
  // 10 coils starting at 19: 1 0 1 1 0 0 1 1 | 1 0
  std::vector<bool> coils{true, false, true, true, false, false, true, true, true, false};
  Pdu request = PduCodec::EncodeWriteMultipleCoils(0x0013, coils);
  EXPECT_EQ(request.function_code, 0x0F);
  EXPECT_EQ(request.payload, (std::vector<uint8_t>{0x00, 0x13, 0x00, 0x0A, 0x02, 0xCD, 0x01}));
}

TEST(PduCodec, WriteMultipleLimits) {
  EXPECT_THROW(static_cast<void>(PduCodec::EncodeWriteMultipleCoils(0, std::vector<bool>(1969, true))),
               InvalidArgumentError);
  EXPECT_THROW(static_cast<void>(PduCodec::EncodeWriteMultipleCoils(0, std::vector<bool>{})), InvalidArgumentError);
  EXPECT_THROW(static_cast<void>(PduCodec::EncodeWriteMultipleRegisters(0, std::vector<uint16_t>(124, 0))),
               InvalidArgumentError);
  EXPECT_NO_THROW(static_cast<void>(PduCodec::EncodeWriteMultipleRegisters(0, std::vector<uint16_t>(123, 0))));
}

TEST(PduCodec, EncodeWriteMultipleRegisters) {
  std::vector<uint16_t> values{0x000A, 0x0102};
  Pdu request = PduCodec::EncodeWriteMultipleRegisters(0x0001, values);
  EXPECT_EQ(request.function_code, 0x10);
  EXPECT_EQ(request.payload, (std::vector<uint8_t>{0x00, 0x01, 0x00, 0x02, 0x04, 0x00, 0x0A, 0x01, 0x02}));
}

TEST(PduCodec, DecodeReadRegisters) {
  Pdu response{0x03, {0x04, 0x02, 0x2B, 0x00, 0x64}};
  EXPECT_EQ(PduCodec::DecodeReadRegistersResponse(response, 0x03, 2), (std::vector<uint16_t>{0x022B, 0x0064}));
}

TEST(PduCodec, DecodeReadRegistersRejectsWrongByteCount) {
  Pdu response{0x03, {0x02, 0x02, 0x2B}};
  EXPECT_THROW(static_cast<void>(PduCodec::DecodeReadRegistersResponse(response, 0x03, 2)), InvalidResponseError);

  Pdu truncated{0x03, {0x04, 0x02, 0x2B, 0x00}};
  EXPECT_THROW(static_cast<void>(PduCodec::DecodeReadRegistersResponse(truncated, 0x03, 2)), InvalidResponseError);
}

TEST(PduCodec, DecodeReadBitsDropsPadding) {
  Pdu response{0x01, {0x02, 0xCD, 0x01}};
  std::vector<bool> bits = PduCodec::DecodeReadBitsResponse(response, 0x01, 10);
  EXPECT_EQ(bits, (std::vector<bool>{true, false, true, true, false, false, true, true, true, false}));
}

TEST(PduCodec, ExceptionResponseBecomesModbusException) {
  Pdu response = PduCodec::ExceptionResponse(0x03, ExceptionCode::kIllegalDataAddress);
  EXPECT_EQ(response.function_code, 0x83);
  EXPECT_TRUE(response.IsException());

  try {
    static_cast<void>(PduCodec::DecodeReadRegistersResponse(response, 0x03, 1));
    FAIL() << "expected ModbusException";
  } catch (ModbusException const &exception) {
    EXPECT_EQ(exception.GetExceptionCode(), ExceptionCode::kIllegalDataAddress);
    EXPECT_EQ(exception.GetFunctionCode(), 0x03);
  }
}

TEST(PduCodec, ExceptionForOtherFunctionIsInvalidResponse) {
  Pdu response = PduCodec::ExceptionResponse(0x04, ExceptionCode::kIllegalDataAddress);
  EXPECT_THROW(PduCodec::ThrowIfException(response, 0x03), InvalidResponseError);
}

TEST(PduCodec, MismatchedFunctionCodeIsInvalidResponse) {
  Pdu response{0x04, {0x02, 0x00, 0x01}};
  EXPECT_THROW(static_cast<void>(PduCodec::DecodeReadRegistersResponse(response, 0x03, 1)), InvalidResponseError);
}

TEST(PduCodec, WriteEchoChecks) {
  Pdu single = PduCodec::EncodeWriteSingleRegister(0x0001, 0x0003);
  EXPECT_NO_THROW(PduCodec::DecodeWriteResponse(single, single));

  Pdu wrong_value{0x06, {0x00, 0x01, 0x00, 0x04}};
  EXPECT_THROW(PduCodec::DecodeWriteResponse(wrong_value, single), InvalidResponseError);

  std::vector<uint16_t> values{1, 2, 3};
  Pdu multiple = PduCodec::EncodeWriteMultipleRegisters(0x0010, values);
  EXPECT_NO_THROW(PduCodec::DecodeWriteResponse(Pdu{0x10, {0x00, 0x10, 0x00, 0x03}}, multiple));
  EXPECT_THROW(PduCodec::DecodeWriteResponse(Pdu{0x10, {0x00, 0x10, 0x00, 0x02}}, multiple), InvalidResponseError);
}

TEST(PduCodec, PackAndUnpackBits) {
  std::vector<bool> bits{true, true, false, false, false, false, false, false, true};
  std::vector<uint8_t> packed = PduCodec::PackBits(bits);
  EXPECT_EQ(packed, (std::vector<uint8_t>{0x03, 0x01}));
  EXPECT_EQ(PduCodec::UnpackBits(packed, bits.size()), bits);
}
