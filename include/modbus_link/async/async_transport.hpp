#pragma once

#include <boost/asio/awaitable.hpp>
#include <cstdint>
#include <optional>
#include "../pdu/pdu.hpp"
#include "async_byte_stream.hpp"

namespace mblink {

/**
 * @brief Coroutine request/response channel for one binding (RTU, ASCII or TCP)
 *
 * Same contract as Transport. Concurrent Exchange() calls from coroutines on the same
 * executor are serialized in submission order by an AsyncMutex.
 */
class AsyncTransport {
 public:
  virtual ~AsyncTransport() = default;

  /**
   * @throws ConnectionError if the underlying channel cannot be opened
   */
  virtual asio::awaitable<void> Open() = 0;
  virtual void Close() = 0;
  [[nodiscard]] virtual bool IsOpen() const = 0;

  /**
   * @return Response PDU, or std::nullopt for a broadcast write on a serial line
   * @throws InvalidArgumentError before any I/O for requests that can never be sent
   * @throws ConnectionError, TimeoutError, CrcError, InvalidResponseError
   */
  virtual asio::awaitable<std::optional<Pdu>> Exchange(uint8_t unit_id, Pdu request) = 0;
};

}  // namespace mblink
