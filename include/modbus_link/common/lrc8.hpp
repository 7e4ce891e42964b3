#pragma once

#include <cstdint>
#include <span>

namespace mblink {

/**
 * @brief Calculate LRC-8 (Longitudinal Redundancy Check) for Modbus ASCII frames
 *
 * LRC = two's complement of the 8-bit sum of unit id and PDU bytes.
 *
 * @param data Unit id followed by the PDU
 * @return 8-bit LRC value; 0 for empty input
 */
[[nodiscard]] constexpr uint8_t CalculateLrc8(std::span<uint8_t const> data) {
  uint8_t sum = 0;
  for (uint8_t byte : data) {
    sum = static_cast<uint8_t>(sum + byte);
  }
  return static_cast<uint8_t>(-sum);
}

/**
 * @brief Verify LRC-8 of decoded ASCII frame bytes (LRC as the last byte)
 *
 * The sum of all bytes including the LRC is zero for an intact frame.
 */
[[nodiscard]] constexpr bool VerifyLrc8(std::span<uint8_t const> bytes) {
  if (bytes.empty()) {
    return false;
  }
  uint8_t sum = 0;
  for (uint8_t byte : bytes) {
    sum = static_cast<uint8_t>(sum + byte);
  }
  return sum == 0;
}

}  // namespace mblink
