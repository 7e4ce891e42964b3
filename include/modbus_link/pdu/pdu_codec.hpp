#pragma once

#include <cstdint>
#include <span>
#include <vector>
#include "../common/exception_code.hpp"
#include "../common/function_code.hpp"
#include "pdu.hpp"

namespace mblink {

static constexpr uint16_t kMaxReadBits = 2000;
static constexpr uint16_t kMaxWriteBits = 1968;
static constexpr uint16_t kMaxReadRegisters = 125;
static constexpr uint16_t kMaxWriteRegisters = 123;
static constexpr uint32_t kAddressSpaceSize = 0x10000;

static constexpr uint16_t kCoilOnValue = 0xFF00;
static constexpr uint16_t kCoilOffValue = 0x0000;

/**
 * @brief Encodes client requests and decodes server responses for the supported function codes
 *
 * Encoders validate quantity and address bounds and throw InvalidArgumentError, so nothing
 * out of range ever reaches a transport. Decoders translate exception responses into
 * ModbusException and structural mismatches into InvalidResponseError.
 */
class PduCodec {
 public:
  [[nodiscard]] static Pdu EncodeReadRequest(FunctionCode function_code, uint16_t address, uint16_t quantity);
  [[nodiscard]] static Pdu EncodeWriteSingleCoil(uint16_t address, bool value);
  [[nodiscard]] static Pdu EncodeWriteSingleRegister(uint16_t address, uint16_t value);
  [[nodiscard]] static Pdu EncodeWriteMultipleCoils(uint16_t address, std::vector<bool> const &values);
  [[nodiscard]] static Pdu EncodeWriteMultipleRegisters(uint16_t address, std::span<uint16_t const> values);

  /**
   * @brief Decode a response to 0x01/0x02
   * @return Exactly @p quantity bit values; padding bits of the last byte are dropped
   */
  [[nodiscard]] static std::vector<bool> DecodeReadBitsResponse(Pdu const &response, uint8_t function_code,
                                                                uint16_t quantity);

  /**
   * @brief Decode a response to 0x03/0x04
   * @return Exactly @p quantity register values
   */
  [[nodiscard]] static std::vector<uint16_t> DecodeReadRegistersResponse(Pdu const &response,
                                                                         uint8_t function_code, uint16_t quantity);

  /**
   * @brief Verify the echo of a write response against the request that produced it
   */
  static void DecodeWriteResponse(Pdu const &response, Pdu const &request);

  /**
   * @brief Throw ModbusException for an exception response, InvalidResponseError for a foreign function code
   */
  static void ThrowIfException(Pdu const &response, uint8_t function_code);

  [[nodiscard]] static Pdu ExceptionResponse(uint8_t function_code, ExceptionCode exception_code);

  [[nodiscard]] static std::vector<uint8_t> PackBits(std::vector<bool> const &values);
  [[nodiscard]] static std::vector<bool> UnpackBits(std::span<uint8_t const> bytes, size_t count);

  /**
   * @brief Check @p quantity against the protocol limit for @p function_code and the 16-bit address space
   */
  [[nodiscard]] static bool IsQuantityValid(uint8_t function_code, uint16_t address, size_t quantity);
};

}  // namespace mblink
