#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include "../common/diagnostics.hpp"
#include "../pdu/pdu.hpp"

namespace mblink {

struct ServerOptions {
  /** Unit id this server answers to; unit 0 is accepted as well */
  uint8_t unit_id{1};
  /** TCP only: connections beyond this are closed as soon as they are accepted */
  size_t max_connections{10};
  /** Deadline for the rest of a frame once its first byte arrived */
  std::chrono::milliseconds frame_timeout{1000};
  /** Optional sink for frame dumps, discarded frames and lifecycle messages; not owned */
  DiagnosticsSink *diagnostics{nullptr};
};

/**
 * @brief True if a request addressed to @p unit_id is meant for a server configured with @p own_unit_id
 */
[[nodiscard]] constexpr bool IsAddressedTo(uint8_t unit_id, uint8_t own_unit_id) noexcept {
  return unit_id == own_unit_id || unit_id == kBroadcastUnitId;
}

}  // namespace mblink
