#pragma once

#include <array>
#include <cstdint>
#include <span>

namespace mblink {

namespace detail {

constexpr uint16_t kCrc16Polynomial = 0xA001;  // 0x8005 reflected

constexpr std::array<uint16_t, 256> MakeCrc16Table() {
  std::array<uint16_t, 256> table{};
  for (uint16_t i = 0; i < table.size(); ++i) {
    uint16_t crc = i;
    for (int bit = 0; bit < 8; ++bit) {
      crc = (crc & 0x0001) != 0 ? static_cast<uint16_t>((crc >> 1) ^ kCrc16Polynomial) : static_cast<uint16_t>(crc >> 1);
    }
    table[i] = crc;
  }
  return table;
}

inline constexpr std::array<uint16_t, 256> kCrc16Table = MakeCrc16Table();

}  // namespace detail

static constexpr uint16_t kCrc16InitialValue = 0xFFFF;

/**
 * @brief Calculate CRC-16 for Modbus RTU frames
 *
 * Polynomial 0x8005 (reflected 0xA001), initial value 0xFFFF. The result is
 * appended to the frame low byte first.
 *
 * @param data Bytes covered by the CRC (unit id and PDU)
 * @return 16-bit CRC value; 0xFFFF for empty input
 */
[[nodiscard]] constexpr uint16_t CalculateCrc16(std::span<uint8_t const> data) {
  uint16_t crc = kCrc16InitialValue;
  for (uint8_t byte : data) {
    crc = static_cast<uint16_t>((crc >> 8) ^ detail::kCrc16Table[(crc ^ byte) & 0xFF]);
  }
  return crc;
}

/**
 * @brief Verify CRC-16 of a Modbus RTU frame
 *
 * @param frame Complete frame including the two trailing CRC bytes
 * @return true if the trailing CRC matches the preceding bytes
 */
[[nodiscard]] constexpr bool VerifyCrc16(std::span<uint8_t const> frame) {
  if (frame.size() < 2) {
    return false;
  }
  uint16_t calculated = CalculateCrc16(frame.first(frame.size() - 2));
  uint16_t received =
      static_cast<uint16_t>(frame[frame.size() - 2]) | static_cast<uint16_t>(frame[frame.size() - 1] << 8);
  return calculated == received;
}

}  // namespace mblink
