#pragma once

#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <memory>
#include "../server/data_store.hpp"
#include "../server/request_handler.hpp"
#include "../server/server_options.hpp"
#include "../transport/serial_framing.hpp"
#include "async_byte_stream.hpp"

namespace mblink {

/**
 * @brief Modbus RTU/ASCII server on an asynchronous serial line
 *
 * Same frame handling as SerialServer, run as one coroutine on the stream's executor.
 * The first byte of a request is awaited without a deadline; the rest of the frame
 * must follow within ServerOptions::frame_timeout.
 */
class AsyncSerialServer {
 public:
  AsyncSerialServer(std::unique_ptr<AsyncByteStream> stream, SerialFraming framing, DataStore &store,
                    ServerOptions options = {}, int baud_rate = 9600);

  AsyncSerialServer(AsyncSerialServer const &) = delete;
  AsyncSerialServer &operator=(AsyncSerialServer const &) = delete;

  /**
   * @brief Spawn the serving coroutine; the stream is opened from within it
   *
   * Exceptions other than ModbusError escape from the executor's run().
   */
  void Start();

  /**
   * @brief Cancel the pending read; the coroutine finishes the next time the executor runs
   */
  void Stop();
  [[nodiscard]] bool IsRunning() const { return running_; }

  /**
   * @brief Serve requests until Stop() or a connection failure
   */
  asio::awaitable<void> ServeForever();

 private:
  asio::awaitable<void> Serve();
  asio::awaitable<void> ServeOne();

  std::unique_ptr<AsyncByteStream> stream_;
  SerialFraming framing_;
  RequestHandler handler_;
  ServerOptions options_;
  std::chrono::microseconds idle_gap_;
  bool running_{false};
};

}  // namespace mblink
