#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include "../pdu/pdu.hpp"
#include "byte_stream.hpp"
#include "serial_framing.hpp"
#include "transport.hpp"
#include "transport_options.hpp"

namespace mblink {

/**
 * @brief Serial master transport shared by RTU and ASCII
 *
 * Owns the stream. On timeout or a corrupt frame the line is drained until it has
 * been idle for one idle gap and the port stays open. Broadcast writes
 * (unit 0) are sent without waiting for a reply.
 */
class SerialLineTransport : public Transport {
 public:
  /**
   * @param baud_rate Line speed, used to derive the idle gap (see SerialIdleGap)
   */
  SerialLineTransport(SerialFraming framing, std::unique_ptr<ByteStream> stream, TransportOptions options,
                      int baud_rate);

  void Open() override;
  void Close() override;
  [[nodiscard]] bool IsOpen() const override;
  [[nodiscard]] std::optional<Pdu> Exchange(uint8_t unit_id, Pdu const &request) override;

  [[nodiscard]] SerialFraming GetFraming() const { return framing_; }

 private:
  SerialFraming framing_;
  std::unique_ptr<ByteStream> stream_;
  TransportOptions options_;
  std::chrono::microseconds idle_gap_;
  mutable std::mutex mutex_;
};

}  // namespace mblink
