#pragma once

#include <boost/asio/awaitable.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "../client/completion.hpp"
#include "../common/wire_format_options.hpp"
#include "../pdu/pdu.hpp"
#include "async_byte_stream.hpp"
#include "async_transport.hpp"

namespace mblink {

/**
 * @brief Coroutine Modbus client over any AsyncTransport
 *
 * Same operations and error behavior as Client. The only suspension point is the
 * transport exchange; validation and encoding run before the first co_await, so an
 * invalid request fails without any I/O. Arguments are taken by value because they
 * must outlive the suspension.
 */
class AsyncClient {
 public:
  explicit AsyncClient(AsyncTransport &transport)
      : transport_(transport) {}

  asio::awaitable<std::vector<bool>> ReadCoils(uint8_t unit_id, uint16_t address, uint16_t quantity,
                                               Completion<std::vector<bool>> on_complete = {});
  asio::awaitable<std::vector<bool>> ReadDiscreteInputs(uint8_t unit_id, uint16_t address, uint16_t quantity,
                                                        Completion<std::vector<bool>> on_complete = {});
  asio::awaitable<std::vector<uint16_t>> ReadHoldingRegisters(uint8_t unit_id, uint16_t address, uint16_t quantity,
                                                              Completion<std::vector<uint16_t>> on_complete = {});
  asio::awaitable<std::vector<uint16_t>> ReadInputRegisters(uint8_t unit_id, uint16_t address, uint16_t quantity,
                                                            Completion<std::vector<uint16_t>> on_complete = {});

  asio::awaitable<void> WriteSingleCoil(uint8_t unit_id, uint16_t address, bool value,
                                        WriteCompletion on_complete = {});
  asio::awaitable<void> WriteSingleRegister(uint8_t unit_id, uint16_t address, uint16_t value,
                                            WriteCompletion on_complete = {});
  asio::awaitable<void> WriteMultipleCoils(uint8_t unit_id, uint16_t address, std::vector<bool> values,
                                           WriteCompletion on_complete = {});
  asio::awaitable<void> WriteMultipleRegisters(uint8_t unit_id, uint16_t address, std::vector<uint16_t> values,
                                               WriteCompletion on_complete = {});

  asio::awaitable<float> ReadFloat32(uint8_t unit_id, uint16_t address, WireFormatOptions format = {},
                                     Completion<float> on_complete = {});
  asio::awaitable<void> WriteFloat32(uint8_t unit_id, uint16_t address, float value, WireFormatOptions format = {},
                                     WriteCompletion on_complete = {});
  asio::awaitable<double> ReadFloat64(uint8_t unit_id, uint16_t address, WireFormatOptions format = {},
                                      Completion<double> on_complete = {});
  asio::awaitable<void> WriteFloat64(uint8_t unit_id, uint16_t address, double value, WireFormatOptions format = {},
                                     WriteCompletion on_complete = {});
  asio::awaitable<int32_t> ReadInt32(uint8_t unit_id, uint16_t address, WireFormatOptions format = {},
                                     Completion<int32_t> on_complete = {});
  asio::awaitable<void> WriteInt32(uint8_t unit_id, uint16_t address, int32_t value, WireFormatOptions format = {},
                                   WriteCompletion on_complete = {});
  asio::awaitable<uint32_t> ReadUint32(uint8_t unit_id, uint16_t address, WireFormatOptions format = {},
                                       Completion<uint32_t> on_complete = {});
  asio::awaitable<void> WriteUint32(uint8_t unit_id, uint16_t address, uint32_t value, WireFormatOptions format = {},
                                    WriteCompletion on_complete = {});

  /**
   * @brief Read @p byte_length bytes of UTF-8 text from (byte_length + 1) / 2 holding registers
   */
  asio::awaitable<std::string> ReadString(uint8_t unit_id, uint16_t address, size_t byte_length,
                                          ByteOrder byte_order = ByteOrder::BigEndian,
                                          Completion<std::string> on_complete = {});
  asio::awaitable<void> WriteString(uint8_t unit_id, uint16_t address, std::string text,
                                    ByteOrder byte_order = ByteOrder::BigEndian, WriteCompletion on_complete = {});

 private:
  asio::awaitable<Pdu> Transact(uint8_t unit_id, Pdu request);
  asio::awaitable<void> TransactWrite(uint8_t unit_id, Pdu request);
  asio::awaitable<std::vector<uint16_t>> ReadRegisterBlock(uint8_t unit_id, uint16_t address, size_t quantity);

  AsyncTransport &transport_;
};

}  // namespace mblink
