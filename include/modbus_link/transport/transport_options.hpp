#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include "../common/diagnostics.hpp"

namespace mblink {

static constexpr std::chrono::milliseconds kDefaultTimeout{1000};

/**
 * @brief Options shared by every client-side transport
 */
struct TransportOptions {
  /** Deadline for one complete response frame */
  std::chrono::milliseconds timeout{kDefaultTimeout};
  /** Optional sink for frame dumps and errors; not owned */
  DiagnosticsSink *diagnostics{nullptr};
};

/**
 * @brief Serial line settings
 */
struct SerialConfig {
  std::string port{};
  int baud_rate{9600};
  /** 'N' (none), 'E' (even) or 'O' (odd) */
  char parity{'N'};
  int data_bits{8};
  int stop_bits{1};
};

struct TcpEndpoint {
  std::string host{"127.0.0.1"};
  uint16_t port{502};
};

}  // namespace mblink
