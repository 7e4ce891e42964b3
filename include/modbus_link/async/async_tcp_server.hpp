#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <string>
#include "../server/data_store.hpp"
#include "../server/request_handler.hpp"
#include "../server/server_options.hpp"
#include "async_byte_stream.hpp"

namespace mblink {

/**
 * @brief Modbus TCP server running as coroutines on one executor
 *
 * The accept loop and every connection are spawned with co_spawn. Request handling
 * matches TcpServer. The server must outlive the executor's run() while it is started.
 */
class AsyncTcpServer {
 public:
  /**
   * @param port Port to listen on; 0 picks an ephemeral port (see GetPort)
   */
  AsyncTcpServer(asio::any_io_executor executor, std::string bind_address, uint16_t port, DataStore &store,
                 ServerOptions options = {});

  AsyncTcpServer(AsyncTcpServer const &) = delete;
  AsyncTcpServer &operator=(AsyncTcpServer const &) = delete;

  /**
   * @brief Bind and listen now, then accept from a spawned coroutine
   * @throws ConnectionError if the address cannot be bound
   */
  void Start();

  /**
   * @brief Close the acceptor and every connection; the coroutines wind down on the executor
   */
  void Stop();

  [[nodiscard]] bool IsRunning() const { return running_; }
  [[nodiscard]] size_t ConnectedClientCount() const { return sessions_.size(); }
  [[nodiscard]] uint16_t GetPort() const;

 private:
  asio::awaitable<void> AcceptLoop();
  asio::awaitable<void> ServeSession(std::shared_ptr<AsyncByteStream> stream);

  asio::any_io_executor executor_;
  std::string bind_address_;
  uint16_t port_;
  RequestHandler handler_;
  ServerOptions options_;
  asio::ip::tcp::acceptor acceptor_;
  std::list<std::shared_ptr<AsyncByteStream>> sessions_;
  bool running_{false};
};

}  // namespace mblink
