#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include "../pdu/pdu.hpp"
#include "../transport/serial_framing.hpp"
#include "../transport/transport_options.hpp"
#include "async_byte_stream.hpp"
#include "async_mutex.hpp"
#include "async_transport.hpp"

namespace mblink {

/**
 * @brief Coroutine serial master transport shared by RTU and ASCII
 *
 * Behaves like SerialLineTransport: a timeout or corrupt frame drains the line and the
 * port stays open; broadcast writes are not answered.
 */
class AsyncSerialLineTransport : public AsyncTransport {
 public:
  AsyncSerialLineTransport(SerialFraming framing, std::unique_ptr<AsyncByteStream> stream, TransportOptions options,
                           int baud_rate);

  asio::awaitable<void> Open() override;
  void Close() override;
  [[nodiscard]] bool IsOpen() const override;
  asio::awaitable<std::optional<Pdu>> Exchange(uint8_t unit_id, Pdu request) override;

  [[nodiscard]] SerialFraming GetFraming() const { return framing_; }

 private:
  SerialFraming framing_;
  std::unique_ptr<AsyncByteStream> stream_;
  TransportOptions options_;
  std::chrono::microseconds idle_gap_;
  AsyncMutex mutex_;
};

}  // namespace mblink
