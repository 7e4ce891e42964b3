#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "../pdu/pdu.hpp"

namespace mblink {

/**
 * @brief Modbus ASCII frame encoder/decoder
 *
 * Frame layout: ':' + hex(unit id, PDU, LRC) + CR + LF. Each byte is two upper-case
 * hex characters; decoding accepts either case.
 */
class AsciiFrame {
 public:
  static constexpr char kStartByte = ':';
  static constexpr char kCr = '\r';
  static constexpr char kLf = '\n';
  static constexpr size_t kMaxFrameLength = 513;

  [[nodiscard]] static std::string BytesToHex(std::span<uint8_t const> bytes);
  [[nodiscard]] static std::optional<std::vector<uint8_t>> HexToBytes(std::string_view hex);

  /**
   * @brief Encode unit id and PDU into an ASCII frame with LRC and CRLF
   */
  [[nodiscard]] static std::string Encode(uint8_t unit_id, Pdu const &pdu);

  /**
   * @brief Decode a complete frame including the ':' and CRLF delimiters
   * @throws InvalidResponseError on a missing delimiter, odd digit count, non-hex digit or short body
   * @throws CrcError if the LRC does not match
   */
  [[nodiscard]] static Adu Decode(std::string_view frame);

  /**
   * @brief Number of characters still missing from a frame that starts with @p prefix
   *
   * ASCII frames are delimited, so this is 1 until the last character read is LF.
   * @throws InvalidResponseError once the prefix exceeds kMaxFrameLength
   */
  [[nodiscard]] static size_t BytesNeeded(std::span<uint8_t const> prefix);
};

}  // namespace mblink
