#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include "../pdu/pdu.hpp"
#include "../transport/transport_options.hpp"
#include "async_byte_stream.hpp"
#include "async_mutex.hpp"
#include "async_transport.hpp"

namespace mblink {

/**
 * @brief Modbus TCP client transport for coroutines
 *
 * Same rules as TcpTransport: any failure during an exchange closes the connection.
 */
class AsyncTcpTransport : public AsyncTransport {
 public:
  AsyncTcpTransport(asio::any_io_executor executor, TcpEndpoint endpoint, TransportOptions options = {});
  explicit AsyncTcpTransport(std::unique_ptr<AsyncByteStream> stream, TransportOptions options = {});

  asio::awaitable<void> Open() override;
  void Close() override;
  [[nodiscard]] bool IsOpen() const override;
  asio::awaitable<std::optional<Pdu>> Exchange(uint8_t unit_id, Pdu request) override;

 private:
  uint16_t GetNextTransactionId();

  std::unique_ptr<AsyncByteStream> stream_;
  TransportOptions options_;
  AsyncMutex mutex_;
  uint16_t next_transaction_id_{1};
};

}  // namespace mblink
