#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace mblink {

static constexpr uint8_t kMaxByte = 0xFF;
static constexpr uint8_t kBitsPerByte = 8;

static inline constexpr uint8_t GetLowByte(uint16_t value) {
  return value & kMaxByte;
}

static inline constexpr uint8_t GetHighByte(uint16_t value) {
  return (value >> kBitsPerByte) & kMaxByte;
}

static inline constexpr uint16_t MakeUint16(uint8_t high_byte, uint8_t low_byte) {
  return static_cast<uint16_t>((static_cast<uint16_t>(high_byte) << kBitsPerByte) | low_byte);
}

static inline constexpr uint16_t SwapBytes(uint16_t value) {
  return MakeUint16(GetLowByte(value), GetHighByte(value));
}

/**
 * @brief Read a big-endian 16-bit value at offset (caller guarantees bounds)
 */
static inline uint16_t ReadU16(std::span<uint8_t const> bytes, size_t offset) {
  return MakeUint16(bytes[offset], bytes[offset + 1]);
}

/**
 * @brief Append a 16-bit value in Modbus (big-endian) order
 */
static inline void AppendU16(std::vector<uint8_t> &bytes, uint16_t value) {
  bytes.push_back(GetHighByte(value));
  bytes.push_back(GetLowByte(value));
}

}  // namespace mblink
