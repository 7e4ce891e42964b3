#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include "byte_stream.hpp"
#include "transport_options.hpp"

namespace mblink {

/**
 * @brief ByteStream over a TCP socket
 *
 * Either connects to an endpoint in Open(), or wraps an already-connected socket
 * from TcpListener::Accept (ownership of the fd is taken). End of stream closes the
 * socket and is reported as a read error.
 */
class TcpSocket : public ByteStream {
 public:
  /**
   * @param connect_timeout Bound on each connect attempt in Open()
   */
  explicit TcpSocket(TcpEndpoint endpoint, std::chrono::milliseconds connect_timeout = kDefaultTimeout)
      : endpoint_(std::move(endpoint)),
        connect_timeout_(connect_timeout) {}

  /**
   * @brief Wrap a connected socket fd (e.g. from accept(2))
   */
  explicit TcpSocket(int connected_fd)
      : fd_(connected_fd) {}

  ~TcpSocket() override { Close(); }

  TcpSocket(TcpSocket const &) = delete;
  TcpSocket &operator=(TcpSocket const &) = delete;

  /**
   * @brief Connect to the endpoint
   * @throws ConnectionError if resolution or connect fails, or if an accepted socket was already closed
   * @throws TimeoutError if no address accepted the connection within the connect timeout
   */
  void Open() override;
  void Close() override;
  [[nodiscard]] bool IsOpen() const override { return fd_ >= 0; }

  // ByteReader interface
  [[nodiscard]] int Read(std::span<uint8_t> buffer) override;
  [[nodiscard]] bool HasData() const override;
  [[nodiscard]] size_t AvailableBytes() const override;

  // ByteWriter interface
  [[nodiscard]] int Write(std::span<uint8_t const> data) override;
  [[nodiscard]] bool WaitWritable(std::chrono::milliseconds wait) override;
  [[nodiscard]] bool Flush() override { return fd_ >= 0; }  // no application-level buffering

  [[nodiscard]] int GetFd() const { return fd_; }

 private:
  std::optional<TcpEndpoint> endpoint_{};
  std::chrono::milliseconds connect_timeout_{kDefaultTimeout};
  int fd_{-1};
};

/**
 * @brief Listening TCP socket
 */
class TcpListener {
 public:
  /**
   * @param bind_address Address to bind ("0.0.0.0" or empty for any)
   * @param port Port number; 0 picks an ephemeral port, see GetPort()
   */
  TcpListener(std::string bind_address, uint16_t port)
      : bind_address_(std::move(bind_address)),
        port_(port) {}

  ~TcpListener() { Close(); }

  TcpListener(TcpListener const &) = delete;
  TcpListener &operator=(TcpListener const &) = delete;

  /**
   * @brief Bind and listen
   * @throws ConnectionError on failure
   */
  void Listen(int backlog = 16);
  void Close();
  [[nodiscard]] bool IsListening() const { return fd_ >= 0; }

  /**
   * @brief Wait up to @p wait for an incoming connection
   * @return Connected fd, or -1 if none arrived in time
   */
  [[nodiscard]] int Accept(std::chrono::milliseconds wait);

  /**
   * @brief Port actually bound (resolves port 0)
   */
  [[nodiscard]] uint16_t GetPort() const;

 private:
  std::string bind_address_;
  uint16_t port_;
  int fd_{-1};
};

}  // namespace mblink
