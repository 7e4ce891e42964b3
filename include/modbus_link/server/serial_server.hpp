#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include "../transport/byte_stream.hpp"
#include "../transport/serial_framing.hpp"
#include "data_store.hpp"
#include "request_handler.hpp"
#include "server_options.hpp"

namespace mblink {

/**
 * @brief Blocking Modbus RTU/ASCII server on a serial line
 *
 * Handles one frame at a time. Frames for other unit ids are ignored, broadcast
 * writes (unit 0) are applied without a reply, and frames that fail their checksum
 * or cannot be parsed are reported to the diagnostics sink and the line is drained.
 */
class SerialServer {
 public:
  static constexpr std::chrono::milliseconds kPollInterval{100};

  /**
   * @param baud_rate Line speed, used to derive the idle gap for draining after a bad frame
   */
  SerialServer(std::unique_ptr<ByteStream> stream, SerialFraming framing, DataStore &store,
               ServerOptions options = {}, int baud_rate = 9600);
  ~SerialServer();

  SerialServer(SerialServer const &) = delete;
  SerialServer &operator=(SerialServer const &) = delete;

  /**
   * @brief Wait up to @p wait for a request and process it
   * @return true if a frame was received (answered, ignored or discarded), false if the line stayed idle
   * @throws ConnectionError if the stream fails
   */
  bool ServeOnce(std::chrono::milliseconds wait);

  /**
   * @brief Open the stream if needed and serve on a background thread until Stop()
   */
  void Start();
  void Stop();
  [[nodiscard]] bool IsRunning() const { return running_; }

 private:
  void Run();

  std::unique_ptr<ByteStream> stream_;
  SerialFraming framing_;
  RequestHandler handler_;
  ServerOptions options_;
  std::chrono::microseconds idle_gap_;
  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace mblink
