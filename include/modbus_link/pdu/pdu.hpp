#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>
#include "../common/function_code.hpp"

namespace mblink {

static constexpr size_t kMaxPduSize = 253;

static constexpr uint8_t kBroadcastUnitId = 0;
static constexpr uint8_t kMaxSerialUnitId = 247;

/**
 * @brief Protocol data unit: function code followed by its payload
 *
 * An exception response has the high bit of the function code set and a
 * single payload byte holding the exception code.
 */
struct Pdu {
  uint8_t function_code{0};
  std::vector<uint8_t> payload{};

  [[nodiscard]] bool IsException() const { return (function_code & kExceptionFunctionCodeMask) != 0; }
  [[nodiscard]] size_t Size() const { return 1 + payload.size(); }

  bool operator==(Pdu const &) const = default;
};

/**
 * @brief Serial application data unit (unit id + PDU), as decoded from an RTU or ASCII frame
 */
struct Adu {
  uint8_t unit_id{0};
  Pdu pdu{};
};

/**
 * @brief TCP application data unit (MBAP header fields + PDU)
 */
struct TcpAdu {
  uint16_t transaction_id{0};
  uint8_t unit_id{0};
  Pdu pdu{};
};

}  // namespace mblink
