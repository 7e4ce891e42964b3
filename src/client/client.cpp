#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "client/client.hpp"
#include "common/errors.hpp"
#include "common/function_code.hpp"
#include "pdu/data_codec.hpp"
#include "pdu/pdu.hpp"
#include "pdu/pdu_codec.hpp"

namespace mblink {

Pdu Client::Transact(uint8_t unit_id, Pdu const &request) {
  std::optional<Pdu> response = transport_.Exchange(unit_id, request);
  if (!response.has_value()) {
    throw InvalidResponseError("no response for function " + std::to_string(request.function_code) + " to unit " +
                               std::to_string(unit_id));
  }
  return std::move(*response);
}

void Client::TransactWrite(uint8_t unit_id, Pdu const &request) {
  std::optional<Pdu> response = transport_.Exchange(unit_id, request);
  if (!response.has_value()) {
    return;  // broadcast
  }
  PduCodec::DecodeWriteResponse(*response, request);
}

std::vector<uint16_t> Client::ReadRegisterBlock(uint8_t unit_id, uint16_t address, size_t quantity) {
  auto count = static_cast<uint16_t>(quantity);
  Pdu request = PduCodec::EncodeReadRequest(FunctionCode::kReadHR, address, count);
  return PduCodec::DecodeReadRegistersResponse(Transact(unit_id, request), request.function_code, count);
}

std::vector<bool> Client::ReadCoils(uint8_t unit_id, uint16_t address, uint16_t quantity,
                                    Completion<std::vector<bool>> const &on_complete) {
  Pdu request = PduCodec::EncodeReadRequest(FunctionCode::kReadCoils, address, quantity);
  return Complete(PduCodec::DecodeReadBitsResponse(Transact(unit_id, request), request.function_code, quantity),
                  on_complete);
}

std::vector<bool> Client::ReadDiscreteInputs(uint8_t unit_id, uint16_t address, uint16_t quantity,
                                             Completion<std::vector<bool>> const &on_complete) {
  Pdu request = PduCodec::EncodeReadRequest(FunctionCode::kReadDI, address, quantity);
  return Complete(PduCodec::DecodeReadBitsResponse(Transact(unit_id, request), request.function_code, quantity),
                  on_complete);
}

std::vector<uint16_t> Client::ReadHoldingRegisters(uint8_t unit_id, uint16_t address, uint16_t quantity,
                                                   Completion<std::vector<uint16_t>> const &on_complete) {
  Pdu request = PduCodec::EncodeReadRequest(FunctionCode::kReadHR, address, quantity);
  return Complete(
      PduCodec::DecodeReadRegistersResponse(Transact(unit_id, request), request.function_code, quantity),
      on_complete);
}

std::vector<uint16_t> Client::ReadInputRegisters(uint8_t unit_id, uint16_t address, uint16_t quantity,
                                                 Completion<std::vector<uint16_t>> const &on_complete) {
  Pdu request = PduCodec::EncodeReadRequest(FunctionCode::kReadIR, address, quantity);
  return Complete(
      PduCodec::DecodeReadRegistersResponse(Transact(unit_id, request), request.function_code, quantity),
      on_complete);
}

void Client::WriteSingleCoil(uint8_t unit_id, uint16_t address, bool value, WriteCompletion const &on_complete) {
  TransactWrite(unit_id, PduCodec::EncodeWriteSingleCoil(address, value));
  Complete(on_complete);
}

void Client::WriteSingleRegister(uint8_t unit_id, uint16_t address, uint16_t value,
                                 WriteCompletion const &on_complete) {
  TransactWrite(unit_id, PduCodec::EncodeWriteSingleRegister(address, value));
  Complete(on_complete);
}

void Client::WriteMultipleCoils(uint8_t unit_id, uint16_t address, std::vector<bool> const &values,
                                WriteCompletion const &on_complete) {
  TransactWrite(unit_id, PduCodec::EncodeWriteMultipleCoils(address, values));
  Complete(on_complete);
}

void Client::WriteMultipleRegisters(uint8_t unit_id, uint16_t address, std::span<uint16_t const> values,
                                    WriteCompletion const &on_complete) {
  TransactWrite(unit_id, PduCodec::EncodeWriteMultipleRegisters(address, values));
  Complete(on_complete);
}

float Client::ReadFloat32(uint8_t unit_id, uint16_t address, WireFormatOptions format,
                          Completion<float> const &on_complete) {
  return Complete(DecodeFloat32(ReadRegisterBlock(unit_id, address, kRegistersPer32Bit), format), on_complete);
}

void Client::WriteFloat32(uint8_t unit_id, uint16_t address, float value, WireFormatOptions format,
                          WriteCompletion const &on_complete) {
  WriteMultipleRegisters(unit_id, address, EncodeFloat32(value, format), on_complete);
}

double Client::ReadFloat64(uint8_t unit_id, uint16_t address, WireFormatOptions format,
                           Completion<double> const &on_complete) {
  return Complete(DecodeFloat64(ReadRegisterBlock(unit_id, address, kRegistersPer64Bit), format), on_complete);
}

void Client::WriteFloat64(uint8_t unit_id, uint16_t address, double value, WireFormatOptions format,
                          WriteCompletion const &on_complete) {
  WriteMultipleRegisters(unit_id, address, EncodeFloat64(value, format), on_complete);
}

int32_t Client::ReadInt32(uint8_t unit_id, uint16_t address, WireFormatOptions format,
                          Completion<int32_t> const &on_complete) {
  return Complete(DecodeInt32(ReadRegisterBlock(unit_id, address, kRegistersPer32Bit), format), on_complete);
}

void Client::WriteInt32(uint8_t unit_id, uint16_t address, int32_t value, WireFormatOptions format,
                        WriteCompletion const &on_complete) {
  WriteMultipleRegisters(unit_id, address, EncodeInt32(value, format), on_complete);
}

uint32_t Client::ReadUint32(uint8_t unit_id, uint16_t address, WireFormatOptions format,
                            Completion<uint32_t> const &on_complete) {
  return Complete(DecodeUint32(ReadRegisterBlock(unit_id, address, kRegistersPer32Bit), format), on_complete);
}

void Client::WriteUint32(uint8_t unit_id, uint16_t address, uint32_t value, WireFormatOptions format,
                         WriteCompletion const &on_complete) {
  WriteMultipleRegisters(unit_id, address, EncodeUint32(value, format), on_complete);
}

std::string Client::ReadString(uint8_t unit_id, uint16_t address, size_t byte_length, ByteOrder byte_order,
                               Completion<std::string> const &on_complete) {
  size_t quantity = RegistersForString(byte_length);
  if (quantity < 1 || quantity > kMaxReadRegisters) {
    throw InvalidArgumentError("string of " + std::to_string(byte_length) + " bytes cannot be read in one request");
  }
  return Complete(DecodeString(ReadRegisterBlock(unit_id, address, quantity), byte_length, byte_order),
                  on_complete);
}

void Client::WriteString(uint8_t unit_id, uint16_t address, std::string_view text, ByteOrder byte_order,
                         WriteCompletion const &on_complete) {
  WriteMultipleRegisters(unit_id, address, EncodeString(text, byte_order), on_complete);
}

}  // namespace mblink
