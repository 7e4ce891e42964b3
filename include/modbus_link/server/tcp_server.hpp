#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "../transport/tcp_socket.hpp"
#include "data_store.hpp"
#include "request_handler.hpp"
#include "server_options.hpp"

namespace mblink {

/**
 * @brief Blocking Modbus TCP server
 *
 * An accept thread hands every connection to its own session thread. Each session
 * answers requests in order; the MBAP transaction id is echoed unchanged. Requests
 * for a unit id other than ServerOptions::unit_id (or 0) are answered with
 * "gateway target device failed to respond". Connections beyond max_connections are
 * closed immediately.
 */
class TcpServer {
 public:
  static constexpr std::chrono::milliseconds kPollInterval{100};

  /**
   * @param port Port to listen on; 0 picks an ephemeral port (see GetPort)
   */
  TcpServer(std::string bind_address, uint16_t port, DataStore &store, ServerOptions options = {});
  ~TcpServer();

  TcpServer(TcpServer const &) = delete;
  TcpServer &operator=(TcpServer const &) = delete;

  /**
   * @brief Bind, listen and start accepting on a background thread
   * @throws ConnectionError if the port cannot be bound
   */
  void Start();

  /**
   * @brief Stop accepting, wait for every session to finish and close the listener
   */
  void Stop();

  [[nodiscard]] bool IsRunning() const { return running_; }
  [[nodiscard]] size_t ConnectedClientCount() const { return connected_clients_; }
  [[nodiscard]] uint16_t GetPort() const { return listener_.GetPort(); }

 private:
  struct Session {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> finished;
  };

  void AcceptLoop();
  void ServeSession(int fd, std::shared_ptr<std::atomic<bool>> finished);
  void ReapFinishedSessions();

  TcpListener listener_;
  RequestHandler handler_;
  ServerOptions options_;
  std::atomic<bool> running_{false};
  std::atomic<size_t> connected_clients_{0};
  std::thread accept_thread_;
  std::mutex sessions_mutex_;
  std::vector<Session> sessions_;
};

}  // namespace mblink
