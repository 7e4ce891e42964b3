#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/serial_port.hpp>
#include <chrono>
#include "../transport/transport_options.hpp"
#include "async_byte_stream.hpp"

namespace mblink {

/**
 * @brief Serial line on an Asio serial_port, configured from a SerialConfig
 */
class AsyncSerialPort : public BasicAsyncStream<asio::serial_port> {
 public:
  AsyncSerialPort(asio::any_io_executor executor, SerialConfig config);

  /**
   * @throws InvalidArgumentError for an unsupported parity or stop bit setting
   * @throws ConnectionError if the device cannot be opened or configured
   */
  asio::awaitable<void> Open() override;

 private:
  SerialConfig config_;
};

/**
 * @brief TCP client connection; Open() resolves and connects to the endpoint
 */
class AsyncTcpStream : public BasicAsyncStream<asio::ip::tcp::socket> {
 public:
  /**
   * @param connect_timeout Bound on the connect in Open()
   */
  AsyncTcpStream(asio::any_io_executor executor, TcpEndpoint endpoint,
                 std::chrono::milliseconds connect_timeout = kDefaultTimeout);

  /**
   * @brief Adopt an already-connected socket (e.g. from an acceptor)
   */
  explicit AsyncTcpStream(asio::ip::tcp::socket socket);

  /**
   * @throws ConnectionError if resolution or connect fails, or if an adopted socket was closed
   * @throws TimeoutError if the connection is not established within the connect timeout
   */
  asio::awaitable<void> Open() override;

 private:
  TcpEndpoint endpoint_;
  std::chrono::milliseconds connect_timeout_{kDefaultTimeout};
  bool adopted_{false};
};

/**
 * @brief Any POSIX descriptor (pty, pipe, socketpair end); ownership of the fd is taken
 */
class AsyncDescriptorStream : public BasicAsyncStream<asio::posix::stream_descriptor> {
 public:
  /**
   * @throws ConnectionError if the descriptor cannot be registered with the executor
   */
  AsyncDescriptorStream(asio::any_io_executor executor, int fd);

  /**
   * @brief No-op while the descriptor is open
   * @throws ConnectionError once it has been closed
   */
  asio::awaitable<void> Open() override;
};

}  // namespace mblink
