#include <cstdint>
#include <span>
#include <string>
#include <vector>
#include "common/byte_helpers.hpp"
#include "common/errors.hpp"
#include "common/exception_code.hpp"
#include "common/function_code.hpp"
#include "pdu/pdu.hpp"
#include "pdu/pdu_codec.hpp"

namespace mblink {

namespace {

// Byte offsets inside request and response payloads
constexpr size_t kAddressOffset = 0;
constexpr size_t kQuantityOffset = 2;
constexpr size_t kByteCountOffset = 4;
constexpr size_t kWriteEchoSize = 4;

void RequireValidQuantity(uint8_t function_code, uint16_t address, size_t quantity) {
  if (!PduCodec::IsQuantityValid(function_code, address, quantity)) {
    throw InvalidArgumentError("quantity " + std::to_string(quantity) + " at address " + std::to_string(address) +
                               " out of range for function " + std::to_string(function_code));
  }
}

}  // namespace

bool PduCodec::IsQuantityValid(uint8_t function_code, uint16_t address, size_t quantity) {
  size_t limit = 0;
  switch (static_cast<FunctionCode>(function_code)) {
    case FunctionCode::kReadCoils:
    case FunctionCode::kReadDI:
      limit = kMaxReadBits;
      break;
    case FunctionCode::kReadHR:
    case FunctionCode::kReadIR:
      limit = kMaxReadRegisters;
      break;
    case FunctionCode::kWriteMultCoils:
      limit = kMaxWriteBits;
      break;
    case FunctionCode::kWriteMultRegs:
      limit = kMaxWriteRegisters;
      break;
    case FunctionCode::kWriteSingleCoil:
    case FunctionCode::kWriteSingleReg:
      limit = 1;
      break;
    default:
      return false;
  }
  if (quantity < 1 || quantity > limit) {
    return false;
  }
  return static_cast<uint32_t>(address) + quantity <= kAddressSpaceSize;
}

Pdu PduCodec::EncodeReadRequest(FunctionCode function_code, uint16_t address, uint16_t quantity) {
  if (!IsReadFunction(ToByte(function_code))) {
    throw InvalidArgumentError("function " + std::to_string(ToByte(function_code)) + " is not a read function");
  }
  RequireValidQuantity(ToByte(function_code), address, quantity);

  Pdu request{ToByte(function_code), {}};
  AppendU16(request.payload, address);
  AppendU16(request.payload, quantity);
  return request;
}

Pdu PduCodec::EncodeWriteSingleCoil(uint16_t address, bool value) {
  Pdu request{ToByte(FunctionCode::kWriteSingleCoil), {}};
  AppendU16(request.payload, address);
  AppendU16(request.payload, value ? kCoilOnValue : kCoilOffValue);
  return request;
}

Pdu PduCodec::EncodeWriteSingleRegister(uint16_t address, uint16_t value) {
  Pdu request{ToByte(FunctionCode::kWriteSingleReg), {}};
  AppendU16(request.payload, address);
  AppendU16(request.payload, value);
  return request;
}

Pdu PduCodec::EncodeWriteMultipleCoils(uint16_t address, std::vector<bool> const &values) {
  RequireValidQuantity(ToByte(FunctionCode::kWriteMultCoils), address, values.size());

  std::vector<uint8_t> packed = PackBits(values);
  Pdu request{ToByte(FunctionCode::kWriteMultCoils), {}};
  AppendU16(request.payload, address);
  AppendU16(request.payload, static_cast<uint16_t>(values.size()));
  request.payload.push_back(static_cast<uint8_t>(packed.size()));
  request.payload.insert(request.payload.end(), packed.begin(), packed.end());
  return request;
}

Pdu PduCodec::EncodeWriteMultipleRegisters(uint16_t address, std::span<uint16_t const> values) {
  RequireValidQuantity(ToByte(FunctionCode::kWriteMultRegs), address, values.size());

  Pdu request{ToByte(FunctionCode::kWriteMultRegs), {}};
  AppendU16(request.payload, address);
  AppendU16(request.payload, static_cast<uint16_t>(values.size()));
  request.payload.push_back(static_cast<uint8_t>(values.size() * 2));
  for (uint16_t value : values) {
    AppendU16(request.payload, value);
  }
  return request;
}

void PduCodec::ThrowIfException(Pdu const &response, uint8_t function_code) {
  if (response.IsException()) {
    if ((response.function_code & kFunctionCodeMask) != function_code) {
      throw InvalidResponseError("exception response for function " +
                                 std::to_string(response.function_code & kFunctionCodeMask) + ", expected " +
                                 std::to_string(function_code));
    }
    if (response.payload.size() != 1) {
      throw InvalidResponseError("exception response must carry exactly one exception code byte");
    }
    throw ModbusException(function_code, static_cast<ExceptionCode>(response.payload[0]));
  }
  if (response.function_code != function_code) {
    throw InvalidResponseError("response function code " + std::to_string(response.function_code) +
                               " does not match request " + std::to_string(function_code));
  }
}

std::vector<bool> PduCodec::DecodeReadBitsResponse(Pdu const &response, uint8_t function_code, uint16_t quantity) {
  ThrowIfException(response, function_code);

  size_t expected_bytes = (static_cast<size_t>(quantity) + kBitsPerByte - 1) / kBitsPerByte;
  if (response.payload.empty() || response.payload[0] != expected_bytes ||
      response.payload.size() != 1 + expected_bytes) {
    throw InvalidResponseError("byte count does not match " + std::to_string(quantity) + " requested bits");
  }
  return UnpackBits(std::span<uint8_t const>(response.payload).subspan(1), quantity);
}

std::vector<uint16_t> PduCodec::DecodeReadRegistersResponse(Pdu const &response, uint8_t function_code,
                                                            uint16_t quantity) {
  ThrowIfException(response, function_code);

  size_t expected_bytes = static_cast<size_t>(quantity) * 2;
  if (response.payload.empty() || response.payload[0] != expected_bytes ||
      response.payload.size() != 1 + expected_bytes) {
    throw InvalidResponseError("byte count does not match " + std::to_string(quantity) + " requested registers");
  }

  std::vector<uint16_t> registers;
  registers.reserve(quantity);
  for (size_t i = 0; i < quantity; ++i) {
    registers.push_back(ReadU16(response.payload, 1 + i * 2));
  }
  return registers;
}

void PduCodec::DecodeWriteResponse(Pdu const &response, Pdu const &request) {
  ThrowIfException(response, request.function_code);

  switch (static_cast<FunctionCode>(request.function_code)) {
    case FunctionCode::kWriteSingleCoil:
    case FunctionCode::kWriteSingleReg:
      // Single writes echo the whole request
      if (response.payload != request.payload) {
        throw InvalidResponseError("write response does not echo the request");
      }
      return;
    case FunctionCode::kWriteMultCoils:
    case FunctionCode::kWriteMultRegs:
      // Multiple writes echo address and quantity
      if (response.payload.size() != kWriteEchoSize || request.payload.size() < kByteCountOffset ||
          ReadU16(response.payload, kAddressOffset) != ReadU16(request.payload, kAddressOffset) ||
          ReadU16(response.payload, kQuantityOffset) != ReadU16(request.payload, kQuantityOffset)) {
        throw InvalidResponseError("write response does not echo address and quantity");
      }
      return;
    default:
      throw InvalidArgumentError("function " + std::to_string(request.function_code) + " is not a write function");
  }
}

Pdu PduCodec::ExceptionResponse(uint8_t function_code, ExceptionCode exception_code) {
  return Pdu{static_cast<uint8_t>(function_code | kExceptionFunctionCodeMask),
             {static_cast<uint8_t>(exception_code)}};
}

std::vector<uint8_t> PduCodec::PackBits(std::vector<bool> const &values) {
  std::vector<uint8_t> bytes((values.size() + kBitsPerByte - 1) / kBitsPerByte, 0);
  for (size_t i = 0; i < values.size(); ++i) {
    if (values[i]) {
      bytes[i / kBitsPerByte] |= static_cast<uint8_t>(1U << (i % kBitsPerByte));
    }
  }
  return bytes;
}

std::vector<bool> PduCodec::UnpackBits(std::span<uint8_t const> bytes, size_t count) {
  std::vector<bool> values;
  values.reserve(count);
  for (size_t i = 0; i < count && i / kBitsPerByte < bytes.size(); ++i) {
    values.push_back(((bytes[i / kBitsPerByte] >> (i % kBitsPerByte)) & 0x01) != 0);
  }
  return values;
}

}  // namespace mblink
