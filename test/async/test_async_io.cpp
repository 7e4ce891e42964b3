#include <gtest/gtest.h>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>
#include "modbus_link/async/async_byte_stream.hpp"
#include "modbus_link/async/async_io.hpp"
#include "modbus_link/common/errors.hpp"
#include "modbus_link/rtu/rtu_frame.hpp"
#include "../support/run_awaitable.hpp"

namespace asio = boost::asio;

using mblink::AsyncByteStream;
using mblink::AsyncReadFrame;
using mblink::RtuFrame;
using mblink::TimeoutError;
using mblink::testing::RunAwaitable;

namespace {

/**
 * @brief Stream that trickles one byte per read and cannot abort a read in flight
 */
class TricklingStream : public AsyncByteStream {
 public:
  TricklingStream(asio::any_io_executor executor, std::vector<uint8_t> bytes, std::chrono::milliseconds per_byte)
      : executor_(std::move(executor)),
        bytes_(std::move(bytes)),
        per_byte_(per_byte) {}

  asio::awaitable<void> Open() override { co_return; }
  void Close() override { open_ = false; }
  [[nodiscard]] bool IsOpen() const override { return open_; }

  asio::awaitable<size_t> ReadSome(std::span<uint8_t> buffer, boost::system::error_code &error) override {
    asio::steady_timer delay(executor_, per_byte_);
    co_await delay.async_wait(asio::use_awaitable);
    if (next_ >= bytes_.size() || buffer.empty()) {
      error = asio::error::eof;
      co_return 0;
    }
    buffer[0] = bytes_[next_++];
    co_return 1;
  }

  asio::awaitable<void> WriteAll(std::span<uint8_t const>) override { co_return; }
  void Cancel() override { ++cancels_; }
  [[nodiscard]] asio::any_io_executor GetExecutor() override { return executor_; }

  [[nodiscard]] int Cancels() const { return cancels_; }

 private:
  asio::any_io_executor executor_;
  std::vector<uint8_t> bytes_;
  std::chrono::milliseconds per_byte_;
  size_t next_{0};
  int cancels_{0};
  bool open_{true};
};

std::vector<uint8_t> const kResponse{0x01, 0x03, 0x04, 0x00, 0x0A, 0x01, 0x02, 0x5A, 0x60};

}  // namespace

TEST(AsyncReadFrame, CompletesWithinDeadline) {
  asio::io_context context;
  TricklingStream stream(context.get_executor(), kResponse, std::chrono::milliseconds(1));

  std::vector<uint8_t> frame = RunAwaitable(
      context, AsyncReadFrame(stream, &RtuFrame::ResponseBytesNeeded, std::chrono::milliseconds(500)));

  EXPECT_EQ(frame, kResponse);
  EXPECT_EQ(stream.Cancels(), 0);
}

TEST(AsyncReadFrame, DeadlineHoldsWhenExpiryFallsBetweenReads) {
  asio::io_context context;
  TricklingStream stream(context.get_executor(), kResponse, std::chrono::milliseconds(30));

  auto start = std::chrono::steady_clock::now();
  EXPECT_THROW(RunAwaitable(context, AsyncReadFrame(stream, &RtuFrame::ResponseBytesNeeded,
                                                    std::chrono::milliseconds(50))),
               TimeoutError);

  // Gave up after the read in flight, not after all nine bytes
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(200));
  EXPECT_EQ(stream.Cancels(), 1);
}
