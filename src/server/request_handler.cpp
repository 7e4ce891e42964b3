#include <cstdint>
#include <optional>
#include <span>
#include <vector>
#include "common/byte_helpers.hpp"
#include "common/exception_code.hpp"
#include "common/function_code.hpp"
#include "pdu/pdu.hpp"
#include "pdu/pdu_codec.hpp"
#include "server/data_store.hpp"
#include "server/request_handler.hpp"

namespace mblink {

namespace {

constexpr size_t kAddressOffset = 0;
constexpr size_t kQuantityOffset = 2;
constexpr size_t kValueOffset = 2;
constexpr size_t kByteCountOffset = 4;
constexpr size_t kFixedRequestSize = 4;   // address(2) + quantity/value(2)
constexpr size_t kMinWriteDataSize = 5;   // address(2) + quantity(2) + byte_count(1)

Pdu EchoAddressAndQuantity(Pdu const &request) {
  return Pdu{request.function_code,
             std::vector<uint8_t>(request.payload.begin(), request.payload.begin() + kFixedRequestSize)};
}

}  // namespace

Pdu RequestHandler::Handle(Pdu const &request) {
  switch (static_cast<FunctionCode>(request.function_code)) {
    case FunctionCode::kReadCoils:
      return HandleReadBits(BitTable::kCoils, request);
    case FunctionCode::kReadDI:
      return HandleReadBits(BitTable::kDiscreteInputs, request);
    case FunctionCode::kReadHR:
      return HandleReadRegisters(RegisterTable::kHolding, request);
    case FunctionCode::kReadIR:
      return HandleReadRegisters(RegisterTable::kInput, request);
    case FunctionCode::kWriteSingleCoil:
      return HandleWriteSingleCoil(request);
    case FunctionCode::kWriteSingleReg:
      return HandleWriteSingleRegister(request);
    case FunctionCode::kWriteMultCoils:
      return HandleWriteMultipleCoils(request);
    case FunctionCode::kWriteMultRegs:
      return HandleWriteMultipleRegisters(request);
    default:
      return PduCodec::ExceptionResponse(request.function_code & kFunctionCodeMask,
                                         ExceptionCode::kIllegalFunction);
  }
}

Pdu RequestHandler::HandleReadBits(BitTable table, Pdu const &request) {
  if (request.payload.size() != kFixedRequestSize) {
    return PduCodec::ExceptionResponse(request.function_code, ExceptionCode::kIllegalDataValue);
  }
  uint16_t address = ReadU16(request.payload, kAddressOffset);
  uint16_t quantity = ReadU16(request.payload, kQuantityOffset);
  if (quantity < 1 || quantity > kMaxReadBits) {
    return PduCodec::ExceptionResponse(request.function_code, ExceptionCode::kIllegalDataValue);
  }

  std::optional<std::vector<bool>> bits = store_.ReadBits(table, address, quantity);
  if (!bits.has_value()) {
    return PduCodec::ExceptionResponse(request.function_code, ExceptionCode::kIllegalDataAddress);
  }

  std::vector<uint8_t> packed = PduCodec::PackBits(*bits);
  Pdu response{request.function_code, {static_cast<uint8_t>(packed.size())}};
  response.payload.insert(response.payload.end(), packed.begin(), packed.end());
  return response;
}

Pdu RequestHandler::HandleReadRegisters(RegisterTable table, Pdu const &request) {
  if (request.payload.size() != kFixedRequestSize) {
    return PduCodec::ExceptionResponse(request.function_code, ExceptionCode::kIllegalDataValue);
  }
  uint16_t address = ReadU16(request.payload, kAddressOffset);
  uint16_t quantity = ReadU16(request.payload, kQuantityOffset);
  if (quantity < 1 || quantity > kMaxReadRegisters) {
    return PduCodec::ExceptionResponse(request.function_code, ExceptionCode::kIllegalDataValue);
  }

  std::optional<std::vector<uint16_t>> registers = store_.ReadRegisters(table, address, quantity);
  if (!registers.has_value()) {
    return PduCodec::ExceptionResponse(request.function_code, ExceptionCode::kIllegalDataAddress);
  }

  Pdu response{request.function_code, {static_cast<uint8_t>(registers->size() * 2)}};
  for (uint16_t value : *registers) {
    AppendU16(response.payload, value);
  }
  return response;
}

Pdu RequestHandler::HandleWriteSingleCoil(Pdu const &request) {
  if (request.payload.size() != kFixedRequestSize) {
    return PduCodec::ExceptionResponse(request.function_code, ExceptionCode::kIllegalDataValue);
  }
  uint16_t address = ReadU16(request.payload, kAddressOffset);
  uint16_t value = ReadU16(request.payload, kValueOffset);
  if (value != kCoilOnValue && value != kCoilOffValue) {
    return PduCodec::ExceptionResponse(request.function_code, ExceptionCode::kIllegalDataValue);
  }

  if (!store_.WriteBits(BitTable::kCoils, address, {value == kCoilOnValue})) {
    return PduCodec::ExceptionResponse(request.function_code, ExceptionCode::kIllegalDataAddress);
  }
  return request;
}

Pdu RequestHandler::HandleWriteSingleRegister(Pdu const &request) {
  if (request.payload.size() != kFixedRequestSize) {
    return PduCodec::ExceptionResponse(request.function_code, ExceptionCode::kIllegalDataValue);
  }
  uint16_t address = ReadU16(request.payload, kAddressOffset);
  uint16_t value = ReadU16(request.payload, kValueOffset);

  std::vector<uint16_t> values{value};
  if (!store_.WriteRegisters(RegisterTable::kHolding, address, values)) {
    return PduCodec::ExceptionResponse(request.function_code, ExceptionCode::kIllegalDataAddress);
  }
  return request;
}

Pdu RequestHandler::HandleWriteMultipleCoils(Pdu const &request) {
  if (request.payload.size() < kMinWriteDataSize) {
    return PduCodec::ExceptionResponse(request.function_code, ExceptionCode::kIllegalDataValue);
  }
  uint16_t address = ReadU16(request.payload, kAddressOffset);
  uint16_t quantity = ReadU16(request.payload, kQuantityOffset);
  uint8_t byte_count = request.payload[kByteCountOffset];
  if (quantity < 1 || quantity > kMaxWriteBits || byte_count != (quantity + kBitsPerByte - 1) / kBitsPerByte ||
      request.payload.size() != kMinWriteDataSize + byte_count) {
    return PduCodec::ExceptionResponse(request.function_code, ExceptionCode::kIllegalDataValue);
  }

  std::vector<bool> values =
      PduCodec::UnpackBits(std::span<uint8_t const>(request.payload).subspan(kMinWriteDataSize), quantity);
  if (!store_.WriteBits(BitTable::kCoils, address, values)) {
    return PduCodec::ExceptionResponse(request.function_code, ExceptionCode::kIllegalDataAddress);
  }
  return EchoAddressAndQuantity(request);
}

Pdu RequestHandler::HandleWriteMultipleRegisters(Pdu const &request) {
  if (request.payload.size() < kMinWriteDataSize) {
    return PduCodec::ExceptionResponse(request.function_code, ExceptionCode::kIllegalDataValue);
  }
  uint16_t address = ReadU16(request.payload, kAddressOffset);
  uint16_t quantity = ReadU16(request.payload, kQuantityOffset);
  uint8_t byte_count = request.payload[kByteCountOffset];
  if (quantity < 1 || quantity > kMaxWriteRegisters || byte_count != quantity * 2 ||
      request.payload.size() != kMinWriteDataSize + byte_count) {
    return PduCodec::ExceptionResponse(request.function_code, ExceptionCode::kIllegalDataValue);
  }

  std::vector<uint16_t> values;
  values.reserve(quantity);
  for (size_t i = 0; i < quantity; ++i) {
    values.push_back(ReadU16(request.payload, kMinWriteDataSize + i * 2));
  }
  if (!store_.WriteRegisters(RegisterTable::kHolding, address, values)) {
    return PduCodec::ExceptionResponse(request.function_code, ExceptionCode::kIllegalDataAddress);
  }
  return EchoAddressAndQuantity(request);
}

}  // namespace mblink
