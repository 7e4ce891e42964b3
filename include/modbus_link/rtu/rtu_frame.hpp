#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>
#include "../pdu/pdu.hpp"

namespace mblink {

/**
 * @brief RTU frame encoder/decoder
 *
 * Frame layout: unit id (1) + PDU (1..253) + CRC16 (2, low byte first).
 * The frame has no length field, so readers use ResponseBytesNeeded /
 * RequestBytesNeeded to find where a frame ends.
 */
class RtuFrame {
 public:
  static constexpr size_t kMinFrameSize = 4;  // unit id + function code + CRC
  static constexpr size_t kMaxFrameSize = 256;
  static constexpr size_t kCrcSize = 2;

  /**
   * @brief Encode unit id and PDU into a frame with trailing CRC
   */
  [[nodiscard]] static std::vector<uint8_t> Encode(uint8_t unit_id, Pdu const &pdu);

  /**
   * @brief Decode a complete frame
   * @throws InvalidResponseError if the frame is too short or too long
   * @throws CrcError if the CRC does not match
   */
  [[nodiscard]] static Adu Decode(std::span<uint8_t const> frame);

  /**
   * @brief Number of bytes still missing from a response frame that starts with @p prefix
   *
   * Two stages: unit id and function code first, then the byte count for reads.
   * Exception responses are 5 bytes, write echoes 8 bytes.
   * @return 0 when @p prefix holds a complete frame
   * @throws InvalidResponseError for an unsupported function code
   */
  [[nodiscard]] static size_t ResponseBytesNeeded(std::span<uint8_t const> prefix);

  /**
   * @brief Number of bytes still missing from a request frame that starts with @p prefix
   *
   * Requests for 0x01-0x06 are 8 bytes, 0x0F/0x10 carry a byte count at offset 6.
   * Any other function code is treated as a bare 4-byte frame so that the server
   * can reply with an illegal function exception.
   */
  [[nodiscard]] static size_t RequestBytesNeeded(std::span<uint8_t const> prefix);

  /**
   * @brief Silent interval of 3.5 character times that separates frames on the line
   *
   * Fixed at 1750us above 19200 baud.
   */
  [[nodiscard]] static std::chrono::microseconds InterFrameGap(int baud_rate);
};

}  // namespace mblink
