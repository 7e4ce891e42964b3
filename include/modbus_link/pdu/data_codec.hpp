#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "../common/wire_format_options.hpp"

namespace mblink {

static constexpr size_t kRegistersPer32Bit = 2;
static constexpr size_t kRegistersPer64Bit = 4;

/**
 * @brief Number of registers needed to hold @p byte_length bytes of string data
 */
[[nodiscard]] constexpr size_t RegistersForString(size_t byte_length) {
  return (byte_length + 1) / 2;
}

/**
 * @name Extended data types over 16-bit registers
 *
 * Values are split into registers most significant word first, then
 * WordOrder::LowWordFirst reverses the registers and ByteOrder::LittleEndian swaps
 * the two bytes inside every register. Decoding applies the inverse, so every
 * (ByteOrder, WordOrder) pair round-trips. Decoders require exactly the right number
 * of registers and throw InvalidArgumentError otherwise.
 * @{
 */
[[nodiscard]] std::array<uint16_t, kRegistersPer32Bit> EncodeUint32(uint32_t value, WireFormatOptions format = {});
[[nodiscard]] std::array<uint16_t, kRegistersPer32Bit> EncodeInt32(int32_t value, WireFormatOptions format = {});
[[nodiscard]] std::array<uint16_t, kRegistersPer32Bit> EncodeFloat32(float value, WireFormatOptions format = {});
[[nodiscard]] std::array<uint16_t, kRegistersPer64Bit> EncodeFloat64(double value, WireFormatOptions format = {});

[[nodiscard]] uint32_t DecodeUint32(std::span<uint16_t const> registers, WireFormatOptions format = {});
[[nodiscard]] int32_t DecodeInt32(std::span<uint16_t const> registers, WireFormatOptions format = {});
[[nodiscard]] float DecodeFloat32(std::span<uint16_t const> registers, WireFormatOptions format = {});
[[nodiscard]] double DecodeFloat64(std::span<uint16_t const> registers, WireFormatOptions format = {});
/** @} */

/**
 * @brief Pack UTF-8 bytes two per register; an odd length is padded with a null byte
 *
 * BigEndian puts the first character in the high byte of each register.
 */
[[nodiscard]] std::vector<uint16_t> EncodeString(std::string_view text, ByteOrder byte_order = ByteOrder::BigEndian);

/**
 * @brief Unpack exactly @p byte_length bytes; embedded nulls are preserved
 */
[[nodiscard]] std::string DecodeString(std::span<uint16_t const> registers, size_t byte_length,
                                       ByteOrder byte_order = ByteOrder::BigEndian);

}  // namespace mblink
