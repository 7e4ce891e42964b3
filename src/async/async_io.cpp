#include <array>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <memory>
#include <span>
#include <string>
#include <utility>
#include <vector>
#include "async/async_io.hpp"
#include "common/errors.hpp"

namespace mblink {

namespace {

constexpr size_t kDrainChunkSize = 64;

}  // namespace

Deadline::Deadline(AsyncByteStream &stream, std::chrono::steady_clock::duration timeout, OnExpiry on_expiry)
    : timer_(stream.GetExecutor()),
      state_(std::make_shared<State>()) {
  timer_.expires_after(timeout);
  timer_.async_wait([state = state_, &stream, on_expiry](boost::system::error_code const &error) {
    if (!error && state->active) {
      state->expired = true;
      if (on_expiry == OnExpiry::kClose) {
        stream.Close();
      } else {
        stream.Cancel();
      }
    }
  });
}

Deadline::~Deadline() {
  state_->active = false;
  timer_.cancel();
}

asio::awaitable<std::vector<uint8_t>> AsyncReadFrame(AsyncByteStream &stream, BytesNeededFn bytes_needed,
                                                     std::chrono::milliseconds timeout,
                                                     std::vector<uint8_t> prefix) {
  Deadline deadline(stream, timeout);
  std::vector<uint8_t> frame = std::move(prefix);
  frame.reserve(256);

  size_t needed = bytes_needed(frame);
  while (needed > 0) {
    // The timer may fire between two reads, when there is nothing pending to cancel
    if (deadline.Expired()) {
      throw TimeoutError("no complete frame within " + std::to_string(timeout.count()) + " ms (" +
                         std::to_string(frame.size()) + " bytes received)");
    }
    size_t current_size = frame.size();
    frame.resize(current_size + needed);
    boost::system::error_code error;
    size_t bytes_read = co_await stream.ReadSome(std::span<uint8_t>(frame.data() + current_size, needed), error);
    frame.resize(current_size + bytes_read);
    if (error) {
      if (deadline.Expired()) {
        throw TimeoutError("no complete frame within " + std::to_string(timeout.count()) + " ms (" +
                           std::to_string(frame.size()) + " bytes received)");
      }
      throw ConnectionError("read failed after " + std::to_string(frame.size()) + " bytes: " + error.message());
    }
    needed = bytes_needed(frame);
  }
  co_return frame;
}

asio::awaitable<size_t> AsyncDrainInput(AsyncByteStream &stream, std::chrono::microseconds idle_gap) {
  std::array<uint8_t, kDrainChunkSize> scratch{};
  size_t discarded = 0;
  while (stream.IsOpen()) {
    Deadline deadline(stream, idle_gap);
    boost::system::error_code error;
    size_t bytes_read = co_await stream.ReadSome(scratch, error);
    discarded += bytes_read;
    if (error) {
      // Idle for a whole gap, or the stream failed; either way nothing is left to discard
      break;
    }
  }
  co_return discarded;
}

}  // namespace mblink
