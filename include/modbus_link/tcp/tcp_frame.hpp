#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>
#include "../pdu/pdu.hpp"

namespace mblink {

/**
 * @brief TCP frame encoder/decoder
 *
 * Modbus TCP prefixes the PDU with an MBAP (Modbus Application Protocol) header:
 * - Transaction ID (2 bytes)
 * - Protocol ID (2 bytes, always 0x0000)
 * - Length (2 bytes) - number of bytes following (Unit ID + PDU)
 * - Unit ID (1 byte)
 */
class TcpFrame {
 public:
  static constexpr size_t kMbapHeaderSize = 7;
  static constexpr uint16_t kProtocolId = 0x0000;
  static constexpr uint16_t kMinLength = 2;  // unit id + function code
  static constexpr uint16_t kMaxLength = 1 + kMaxPduSize;

  /**
   * @brief Encode a PDU with its MBAP header
   * @return MBAP header followed by the PDU; length field is 1 + PDU size
   */
  [[nodiscard]] static std::vector<uint8_t> Encode(uint16_t transaction_id, uint8_t unit_id, Pdu const &pdu);

  /**
   * @brief Decode a complete frame
   * @throws InvalidResponseError on a non-zero protocol id or a length field that disagrees with the frame
   */
  [[nodiscard]] static TcpAdu Decode(std::span<uint8_t const> frame);

  /**
   * @brief Number of bytes still missing from a frame that starts with @p prefix
   *
   * The 7-byte header is read first, then the remaining length - 1 bytes.
   * @throws InvalidResponseError as soon as the header is known to be invalid
   */
  [[nodiscard]] static size_t BytesNeeded(std::span<uint8_t const> prefix);
};

}  // namespace mblink
