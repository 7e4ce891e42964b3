#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "async/async_client.hpp"
#include "common/errors.hpp"
#include "common/function_code.hpp"
#include "pdu/data_codec.hpp"
#include "pdu/pdu.hpp"
#include "pdu/pdu_codec.hpp"

namespace mblink {

namespace {

template <size_t N>
std::vector<uint16_t> ToVector(std::array<uint16_t, N> const &words) {
  return {words.begin(), words.end()};
}

}  // namespace

asio::awaitable<Pdu> AsyncClient::Transact(uint8_t unit_id, Pdu request) {
  std::optional<Pdu> response = co_await transport_.Exchange(unit_id, request);
  if (!response.has_value()) {
    throw InvalidResponseError("no response for function " + std::to_string(request.function_code) + " to unit " +
                               std::to_string(unit_id));
  }
  co_return std::move(*response);
}

asio::awaitable<void> AsyncClient::TransactWrite(uint8_t unit_id, Pdu request) {
  std::optional<Pdu> response = co_await transport_.Exchange(unit_id, request);
  if (response.has_value()) {
    PduCodec::DecodeWriteResponse(*response, request);
  }
}

asio::awaitable<std::vector<uint16_t>> AsyncClient::ReadRegisterBlock(uint8_t unit_id, uint16_t address,
                                                                      size_t quantity) {
  auto count = static_cast<uint16_t>(quantity);
  Pdu request = PduCodec::EncodeReadRequest(FunctionCode::kReadHR, address, count);
  Pdu response = co_await Transact(unit_id, request);
  co_return PduCodec::DecodeReadRegistersResponse(response, request.function_code, count);
}

asio::awaitable<std::vector<bool>> AsyncClient::ReadCoils(uint8_t unit_id, uint16_t address, uint16_t quantity,
                                                          Completion<std::vector<bool>> on_complete) {
  Pdu request = PduCodec::EncodeReadRequest(FunctionCode::kReadCoils, address, quantity);
  Pdu response = co_await Transact(unit_id, request);
  co_return Complete(PduCodec::DecodeReadBitsResponse(response, request.function_code, quantity), on_complete);
}

asio::awaitable<std::vector<bool>> AsyncClient::ReadDiscreteInputs(uint8_t unit_id, uint16_t address,
                                                                   uint16_t quantity,
                                                                   Completion<std::vector<bool>> on_complete) {
  Pdu request = PduCodec::EncodeReadRequest(FunctionCode::kReadDI, address, quantity);
  Pdu response = co_await Transact(unit_id, request);
  co_return Complete(PduCodec::DecodeReadBitsResponse(response, request.function_code, quantity), on_complete);
}

asio::awaitable<std::vector<uint16_t>> AsyncClient::ReadHoldingRegisters(
    uint8_t unit_id, uint16_t address, uint16_t quantity, Completion<std::vector<uint16_t>> on_complete) {
  Pdu request = PduCodec::EncodeReadRequest(FunctionCode::kReadHR, address, quantity);
  Pdu response = co_await Transact(unit_id, request);
  co_return Complete(PduCodec::DecodeReadRegistersResponse(response, request.function_code, quantity), on_complete);
}

asio::awaitable<std::vector<uint16_t>> AsyncClient::ReadInputRegisters(
    uint8_t unit_id, uint16_t address, uint16_t quantity, Completion<std::vector<uint16_t>> on_complete) {
  Pdu request = PduCodec::EncodeReadRequest(FunctionCode::kReadIR, address, quantity);
  Pdu response = co_await Transact(unit_id, request);
  co_return Complete(PduCodec::DecodeReadRegistersResponse(response, request.function_code, quantity), on_complete);
}

asio::awaitable<void> AsyncClient::WriteSingleCoil(uint8_t unit_id, uint16_t address, bool value,
                                                   WriteCompletion on_complete) {
  co_await TransactWrite(unit_id, PduCodec::EncodeWriteSingleCoil(address, value));
  Complete(on_complete);
}

asio::awaitable<void> AsyncClient::WriteSingleRegister(uint8_t unit_id, uint16_t address, uint16_t value,
                                                       WriteCompletion on_complete) {
  co_await TransactWrite(unit_id, PduCodec::EncodeWriteSingleRegister(address, value));
  Complete(on_complete);
}

asio::awaitable<void> AsyncClient::WriteMultipleCoils(uint8_t unit_id, uint16_t address, std::vector<bool> values,
                                                      WriteCompletion on_complete) {
  co_await TransactWrite(unit_id, PduCodec::EncodeWriteMultipleCoils(address, values));
  Complete(on_complete);
}

asio::awaitable<void> AsyncClient::WriteMultipleRegisters(uint8_t unit_id, uint16_t address,
                                                          std::vector<uint16_t> values, WriteCompletion on_complete) {
  co_await TransactWrite(unit_id, PduCodec::EncodeWriteMultipleRegisters(address, values));
  Complete(on_complete);
}

asio::awaitable<float> AsyncClient::ReadFloat32(uint8_t unit_id, uint16_t address, WireFormatOptions format,
                                                Completion<float> on_complete) {
  std::vector<uint16_t> registers = co_await ReadRegisterBlock(unit_id, address, kRegistersPer32Bit);
  co_return Complete(DecodeFloat32(registers, format), on_complete);
}

asio::awaitable<void> AsyncClient::WriteFloat32(uint8_t unit_id, uint16_t address, float value,
                                                WireFormatOptions format, WriteCompletion on_complete) {
  co_await WriteMultipleRegisters(unit_id, address, ToVector(EncodeFloat32(value, format)), std::move(on_complete));
}

asio::awaitable<double> AsyncClient::ReadFloat64(uint8_t unit_id, uint16_t address, WireFormatOptions format,
                                                 Completion<double> on_complete) {
  std::vector<uint16_t> registers = co_await ReadRegisterBlock(unit_id, address, kRegistersPer64Bit);
  co_return Complete(DecodeFloat64(registers, format), on_complete);
}

asio::awaitable<void> AsyncClient::WriteFloat64(uint8_t unit_id, uint16_t address, double value,
                                                WireFormatOptions format, WriteCompletion on_complete) {
  co_await WriteMultipleRegisters(unit_id, address, ToVector(EncodeFloat64(value, format)), std::move(on_complete));
}

asio::awaitable<int32_t> AsyncClient::ReadInt32(uint8_t unit_id, uint16_t address, WireFormatOptions format,
                                                 Completion<int32_t> on_complete) {
  std::vector<uint16_t> registers = co_await ReadRegisterBlock(unit_id, address, kRegistersPer32Bit);
  co_return Complete(DecodeInt32(registers, format), on_complete);
}

asio::awaitable<void> AsyncClient::WriteInt32(uint8_t unit_id, uint16_t address, int32_t value,
                                              WireFormatOptions format, WriteCompletion on_complete) {
  co_await WriteMultipleRegisters(unit_id, address, ToVector(EncodeInt32(value, format)), std::move(on_complete));
}

asio::awaitable<uint32_t> AsyncClient::ReadUint32(uint8_t unit_id, uint16_t address, WireFormatOptions format,
                                                  Completion<uint32_t> on_complete) {
  std::vector<uint16_t> registers = co_await ReadRegisterBlock(unit_id, address, kRegistersPer32Bit);
  co_return Complete(DecodeUint32(registers, format), on_complete);
}

asio::awaitable<void> AsyncClient::WriteUint32(uint8_t unit_id, uint16_t address, uint32_t value,
                                               WireFormatOptions format, WriteCompletion on_complete) {
  co_await WriteMultipleRegisters(unit_id, address, ToVector(EncodeUint32(value, format)), std::move(on_complete));
}

asio::awaitable<std::string> AsyncClient::ReadString(uint8_t unit_id, uint16_t address, size_t byte_length,
                                                     ByteOrder byte_order, Completion<std::string> on_complete) {
  size_t quantity = RegistersForString(byte_length);
  if (quantity < 1 || quantity > kMaxReadRegisters) {
    throw InvalidArgumentError("string of " + std::to_string(byte_length) + " bytes cannot be read in one request");
  }
  std::vector<uint16_t> registers = co_await ReadRegisterBlock(unit_id, address, quantity);
  co_return Complete(DecodeString(registers, byte_length, byte_order), on_complete);
}

asio::awaitable<void> AsyncClient::WriteString(uint8_t unit_id, uint16_t address, std::string text,
                                               ByteOrder byte_order, WriteCompletion on_complete) {
  co_await WriteMultipleRegisters(unit_id, address, EncodeString(text, byte_order), std::move(on_complete));
}

}  // namespace mblink
