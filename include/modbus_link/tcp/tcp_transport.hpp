#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include "../pdu/pdu.hpp"
#include "../transport/byte_stream.hpp"
#include "../transport/transport.hpp"
#include "../transport/transport_options.hpp"

namespace mblink {

/**
 * @brief Modbus TCP client transport
 *
 * Each exchange gets the next transaction id; the response must carry the same
 * transaction id and unit id. A timeout, a malformed frame or a mismatched response
 * leaves the byte stream in an unknown position, so the connection is closed and
 * must be reopened.
 */
class TcpTransport : public Transport {
 public:
  explicit TcpTransport(TcpEndpoint endpoint, TransportOptions options = {});
  explicit TcpTransport(std::unique_ptr<ByteStream> stream, TransportOptions options = {});

  void Open() override;
  void Close() override;
  [[nodiscard]] bool IsOpen() const override;
  [[nodiscard]] std::optional<Pdu> Exchange(uint8_t unit_id, Pdu const &request) override;

 private:
  uint16_t GetNextTransactionId();

  std::unique_ptr<ByteStream> stream_;
  TransportOptions options_;
  mutable std::mutex mutex_;
  uint16_t next_transaction_id_{1};
};

}  // namespace mblink
