#pragma once

#include <cstdint>
#include <mutex>
#include <ostream>
#include <span>
#include <string_view>
#include "errors.hpp"

namespace mblink {

/**
 * @brief Receiver for frame-level diagnostics
 *
 * Transports and servers call the sink they were given at frame boundaries. There is
 * no process-wide logger; pass a sink through TransportOptions or ServerOptions.
 * Implementations must be safe to call from several threads.
 */
class DiagnosticsSink {
 public:
  virtual ~DiagnosticsSink() = default;

  virtual void OnFrameSent(std::string_view channel, std::span<uint8_t const> frame) = 0;
  virtual void OnFrameReceived(std::string_view channel, std::span<uint8_t const> frame) = 0;
  virtual void OnError(std::string_view channel, ModbusError const &error) = 0;
  virtual void OnMessage(std::string_view channel, std::string_view message) = 0;
};

/**
 * @brief Writes one line per event to an std::ostream, frames as hex dumps
 *
 *   [tcp] TX 00 01 00 00 00 06 01 03 00 00 00 02
 */
class StreamDiagnostics : public DiagnosticsSink {
 public:
  explicit StreamDiagnostics(std::ostream &out)
      : out_(out) {}

  void OnFrameSent(std::string_view channel, std::span<uint8_t const> frame) override;
  void OnFrameReceived(std::string_view channel, std::span<uint8_t const> frame) override;
  void OnError(std::string_view channel, ModbusError const &error) override;
  void OnMessage(std::string_view channel, std::string_view message) override;

 private:
  void WriteFrame(std::string_view channel, std::string_view direction, std::span<uint8_t const> frame);

  std::ostream &out_;
  std::mutex mutex_;
};

inline void NotifyFrameSent(DiagnosticsSink *sink, std::string_view channel, std::span<uint8_t const> frame) {
  if (sink != nullptr) {
    sink->OnFrameSent(channel, frame);
  }
}

inline void NotifyFrameReceived(DiagnosticsSink *sink, std::string_view channel, std::span<uint8_t const> frame) {
  if (sink != nullptr) {
    sink->OnFrameReceived(channel, frame);
  }
}

inline void NotifyError(DiagnosticsSink *sink, std::string_view channel, ModbusError const &error) {
  if (sink != nullptr) {
    sink->OnError(channel, error);
  }
}

inline void NotifyMessage(DiagnosticsSink *sink, std::string_view channel, std::string_view message) {
  if (sink != nullptr) {
    sink->OnMessage(channel, message);
  }
}

}  // namespace mblink
