#pragma once

#include <cstdint>

namespace mblink {

enum class FunctionCode : uint8_t {
  kInvalid = 0,
  kReadCoils = 1,
  kReadDI = 2,
  kReadHR = 3,
  kReadIR = 4,
  kWriteSingleCoil = 5,
  kWriteSingleReg = 6,
  kWriteMultCoils = 15,
  kWriteMultRegs = 16
};

static constexpr uint8_t kExceptionFunctionCodeMask = 0x80;
static constexpr uint8_t kFunctionCodeMask = 0x7F;

[[nodiscard]] constexpr uint8_t ToByte(FunctionCode function_code) noexcept {
  return static_cast<uint8_t>(function_code);
}

[[nodiscard]] constexpr bool IsReadFunction(uint8_t function_code) noexcept {
  return function_code >= ToByte(FunctionCode::kReadCoils) && function_code <= ToByte(FunctionCode::kReadIR);
}

/**
 * @brief Write function codes that a serial master may send to unit 0 (broadcast)
 */
[[nodiscard]] constexpr bool IsBroadcastableWrite(uint8_t function_code) noexcept {
  switch (static_cast<FunctionCode>(function_code)) {
    case FunctionCode::kWriteSingleCoil:
    case FunctionCode::kWriteSingleReg:
    case FunctionCode::kWriteMultCoils:
    case FunctionCode::kWriteMultRegs:
      return true;
    default:
      return false;
  }
}

}  // namespace mblink
