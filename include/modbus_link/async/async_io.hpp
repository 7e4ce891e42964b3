#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>
#include "../transport/stream_io.hpp"
#include "async_byte_stream.hpp"

namespace mblink {

/**
 * @brief Timer racing the operations on a stream
 *
 * When the timer fires before the guard is destroyed the stream is cancelled (or closed,
 * for operations such as a ranged connect that would move on after a cancel) and
 * Expired() turns true, so the aborted operation can be reported as a timeout.
 */
class Deadline {
 public:
  enum class OnExpiry { kCancel, kClose };

  Deadline(AsyncByteStream &stream, std::chrono::steady_clock::duration timeout,
           OnExpiry on_expiry = OnExpiry::kCancel);
  ~Deadline();

  Deadline(Deadline const &) = delete;
  Deadline &operator=(Deadline const &) = delete;

  [[nodiscard]] bool Expired() const { return state_->expired; }

 private:
  struct State {
    bool expired{false};
    bool active{true};
  };

  asio::steady_timer timer_;
  std::shared_ptr<State> state_;
};

/**
 * @brief Read exactly one frame, as delimited by @p bytes_needed
 *
 * @p timeout bounds the whole frame. Reading continues after @p prefix, the bytes of the
 * frame already received (servers read the first byte without a deadline).
 * @throws TimeoutError if the frame is not complete in time
 * @throws ConnectionError on a read error or end of stream
 */
asio::awaitable<std::vector<uint8_t>> AsyncReadFrame(AsyncByteStream &stream, BytesNeededFn bytes_needed,
                                                     std::chrono::milliseconds timeout,
                                                     std::vector<uint8_t> prefix = {});

/**
 * @brief Discard input until the line has been idle for @p idle_gap
 * @return Number of bytes discarded
 */
asio::awaitable<size_t> AsyncDrainInput(AsyncByteStream &stream, std::chrono::microseconds idle_gap);

}  // namespace mblink
