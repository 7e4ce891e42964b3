#pragma once

#include <chrono>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>
#include "../pdu/pdu.hpp"
#include "stream_io.hpp"

namespace mblink {

/**
 * @brief Framing used on a serial line
 */
enum class SerialFraming {
  kRtu,
  kAscii
};

[[nodiscard]] std::string_view SerialFramingName(SerialFraming framing);

/**
 * @brief How long the line must stay quiet before it is considered idle
 *
 * RTU uses 3.5 character times at @p baud_rate. ASCII frames are delimited, so a fixed
 * gap is used regardless of speed.
 */
[[nodiscard]] std::chrono::microseconds SerialIdleGap(SerialFraming framing, int baud_rate);

/**
 * @brief Encode a frame as it goes on the wire (ASCII frames as their character bytes)
 */
[[nodiscard]] std::vector<uint8_t> EncodeSerialFrame(SerialFraming framing, uint8_t unit_id, Pdu const &pdu);

/**
 * @throws InvalidResponseError, CrcError
 */
[[nodiscard]] Adu DecodeSerialFrame(SerialFraming framing, std::span<uint8_t const> frame);

[[nodiscard]] BytesNeededFn SerialResponseBytesNeeded(SerialFraming framing);
[[nodiscard]] BytesNeededFn SerialRequestBytesNeeded(SerialFraming framing);

/**
 * @brief Local checks a serial master applies before sending
 *
 * Unit ids above 247 are rejected, and unit 0 (broadcast) is only allowed for write functions.
 * @throws InvalidArgumentError
 */
void ValidateSerialRequest(uint8_t unit_id, Pdu const &request);

}  // namespace mblink
