#include <algorithm>
#include <array>
#include <bit>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "common/byte_helpers.hpp"
#include "common/errors.hpp"
#include "common/wire_format_options.hpp"
#include "pdu/data_codec.hpp"

namespace mblink {

namespace {

template <size_t N, typename Unsigned>
std::array<uint16_t, N> SplitWords(Unsigned value, WireFormatOptions format) {
  std::array<uint16_t, N> words{};
  for (size_t i = 0; i < N; ++i) {
    words[i] = static_cast<uint16_t>(value >> (16 * (N - 1 - i)));
  }
  if (format.word_order == WordOrder::LowWordFirst) {
    std::reverse(words.begin(), words.end());
  }
  if (format.byte_order == ByteOrder::LittleEndian) {
    std::transform(words.begin(), words.end(), words.begin(), SwapBytes);
  }
  return words;
}

template <size_t N, typename Unsigned>
Unsigned JoinWords(std::span<uint16_t const> registers, WireFormatOptions format) {
  if (registers.size() != N) {
    throw InvalidArgumentError("expected " + std::to_string(N) + " registers, got " +
                               std::to_string(registers.size()));
  }
  std::array<uint16_t, N> words{};
  std::copy(registers.begin(), registers.end(), words.begin());
  if (format.byte_order == ByteOrder::LittleEndian) {
    std::transform(words.begin(), words.end(), words.begin(), SwapBytes);
  }
  if (format.word_order == WordOrder::LowWordFirst) {
    std::reverse(words.begin(), words.end());
  }

  Unsigned value = 0;
  for (uint16_t word : words) {
    value = static_cast<Unsigned>((value << 16) | word);
  }
  return value;
}

}  // namespace

std::array<uint16_t, kRegistersPer32Bit> EncodeUint32(uint32_t value, WireFormatOptions format) {
  return SplitWords<kRegistersPer32Bit>(value, format);
}

std::array<uint16_t, kRegistersPer32Bit> EncodeInt32(int32_t value, WireFormatOptions format) {
  return SplitWords<kRegistersPer32Bit>(static_cast<uint32_t>(value), format);
}

std::array<uint16_t, kRegistersPer32Bit> EncodeFloat32(float value, WireFormatOptions format) {
  return SplitWords<kRegistersPer32Bit>(std::bit_cast<uint32_t>(value), format);
}

std::array<uint16_t, kRegistersPer64Bit> EncodeFloat64(double value, WireFormatOptions format) {
  return SplitWords<kRegistersPer64Bit>(std::bit_cast<uint64_t>(value), format);
}

uint32_t DecodeUint32(std::span<uint16_t const> registers, WireFormatOptions format) {
  return JoinWords<kRegistersPer32Bit, uint32_t>(registers, format);
}

int32_t DecodeInt32(std::span<uint16_t const> registers, WireFormatOptions format) {
  return static_cast<int32_t>(JoinWords<kRegistersPer32Bit, uint32_t>(registers, format));
}

float DecodeFloat32(std::span<uint16_t const> registers, WireFormatOptions format) {
  return std::bit_cast<float>(JoinWords<kRegistersPer32Bit, uint32_t>(registers, format));
}

double DecodeFloat64(std::span<uint16_t const> registers, WireFormatOptions format) {
  return std::bit_cast<double>(JoinWords<kRegistersPer64Bit, uint64_t>(registers, format));
}

std::vector<uint16_t> EncodeString(std::string_view text, ByteOrder byte_order) {
  std::vector<uint16_t> registers(RegistersForString(text.size()), 0);
  for (size_t i = 0; i < registers.size(); ++i) {
    auto first = static_cast<uint8_t>(text[i * 2]);
    uint8_t second = i * 2 + 1 < text.size() ? static_cast<uint8_t>(text[i * 2 + 1]) : 0;
    registers[i] = byte_order == ByteOrder::BigEndian ? MakeUint16(first, second) : MakeUint16(second, first);
  }
  return registers;
}

std::string DecodeString(std::span<uint16_t const> registers, size_t byte_length, ByteOrder byte_order) {
  if (registers.size() != RegistersForString(byte_length)) {
    throw InvalidArgumentError(std::to_string(registers.size()) + " registers cannot hold exactly " +
                               std::to_string(byte_length) + " bytes");
  }

  std::string text;
  text.reserve(registers.size() * 2);
  for (uint16_t reg : registers) {
    if (byte_order == ByteOrder::BigEndian) {
      text.push_back(static_cast<char>(GetHighByte(reg)));
      text.push_back(static_cast<char>(GetLowByte(reg)));
    } else {
      text.push_back(static_cast<char>(GetLowByte(reg)));
      text.push_back(static_cast<char>(GetHighByte(reg)));
    }
  }
  text.resize(byte_length);
  return text;
}

}  // namespace mblink
