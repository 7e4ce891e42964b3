#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "../common/wire_format_options.hpp"
#include "../pdu/pdu.hpp"
#include "../transport/transport.hpp"
#include "completion.hpp"

namespace mblink {

/**
 * @brief Blocking Modbus client over any Transport
 *
 * Every operation validates and encodes its request before the transport is touched,
 * performs one exchange, and decodes the response. Errors propagate unchanged as
 * ModbusError subclasses; nothing is retried. The client holds no state of its own,
 * so one instance can be shared between threads (the transport serializes exchanges).
 *
 * Extended types (32/64-bit values, strings) read holding registers (0x03) and write
 * with 0x10. A unit id of 0 on a serial transport broadcasts a write; no response is
 * read and the completion handler still fires.
 */
class Client {
 public:
  explicit Client(Transport &transport)
      : transport_(transport) {}

  [[nodiscard]] std::vector<bool> ReadCoils(uint8_t unit_id, uint16_t address, uint16_t quantity,
                                            Completion<std::vector<bool>> const &on_complete = {});
  [[nodiscard]] std::vector<bool> ReadDiscreteInputs(uint8_t unit_id, uint16_t address, uint16_t quantity,
                                                     Completion<std::vector<bool>> const &on_complete = {});
  [[nodiscard]] std::vector<uint16_t> ReadHoldingRegisters(uint8_t unit_id, uint16_t address, uint16_t quantity,
                                                           Completion<std::vector<uint16_t>> const &on_complete = {});
  [[nodiscard]] std::vector<uint16_t> ReadInputRegisters(uint8_t unit_id, uint16_t address, uint16_t quantity,
                                                         Completion<std::vector<uint16_t>> const &on_complete = {});

  void WriteSingleCoil(uint8_t unit_id, uint16_t address, bool value, WriteCompletion const &on_complete = {});
  void WriteSingleRegister(uint8_t unit_id, uint16_t address, uint16_t value,
                           WriteCompletion const &on_complete = {});
  void WriteMultipleCoils(uint8_t unit_id, uint16_t address, std::vector<bool> const &values,
                          WriteCompletion const &on_complete = {});
  void WriteMultipleRegisters(uint8_t unit_id, uint16_t address, std::span<uint16_t const> values,
                              WriteCompletion const &on_complete = {});

  [[nodiscard]] float ReadFloat32(uint8_t unit_id, uint16_t address, WireFormatOptions format = {},
                                  Completion<float> const &on_complete = {});
  void WriteFloat32(uint8_t unit_id, uint16_t address, float value, WireFormatOptions format = {},
                    WriteCompletion const &on_complete = {});
  [[nodiscard]] double ReadFloat64(uint8_t unit_id, uint16_t address, WireFormatOptions format = {},
                                   Completion<double> const &on_complete = {});
  void WriteFloat64(uint8_t unit_id, uint16_t address, double value, WireFormatOptions format = {},
                    WriteCompletion const &on_complete = {});
  [[nodiscard]] int32_t ReadInt32(uint8_t unit_id, uint16_t address, WireFormatOptions format = {},
                                  Completion<int32_t> const &on_complete = {});
  void WriteInt32(uint8_t unit_id, uint16_t address, int32_t value, WireFormatOptions format = {},
                  WriteCompletion const &on_complete = {});
  [[nodiscard]] uint32_t ReadUint32(uint8_t unit_id, uint16_t address, WireFormatOptions format = {},
                                    Completion<uint32_t> const &on_complete = {});
  void WriteUint32(uint8_t unit_id, uint16_t address, uint32_t value, WireFormatOptions format = {},
                   WriteCompletion const &on_complete = {});

  /**
   * @brief Read @p byte_length bytes of UTF-8 text from (byte_length + 1) / 2 holding registers
   *
   * The result is exactly @p byte_length bytes; trailing or embedded nulls are kept.
   */
  [[nodiscard]] std::string ReadString(uint8_t unit_id, uint16_t address, size_t byte_length,
                                       ByteOrder byte_order = ByteOrder::BigEndian,
                                       Completion<std::string> const &on_complete = {});
  void WriteString(uint8_t unit_id, uint16_t address, std::string_view text,
                   ByteOrder byte_order = ByteOrder::BigEndian, WriteCompletion const &on_complete = {});

 private:
  /**
   * @brief Exchange a request that must be answered
   * @throws InvalidResponseError if the transport produced no response
   */
  [[nodiscard]] Pdu Transact(uint8_t unit_id, Pdu const &request);

  /**
   * @brief Exchange a write request and verify its echo (skipped for broadcasts)
   */
  void TransactWrite(uint8_t unit_id, Pdu const &request);

  [[nodiscard]] std::vector<uint16_t> ReadRegisterBlock(uint8_t unit_id, uint16_t address, size_t quantity);

  Transport &transport_;
};

}  // namespace mblink
