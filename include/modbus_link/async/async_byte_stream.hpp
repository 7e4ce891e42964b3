#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include "../common/errors.hpp"

namespace mblink {

namespace asio = boost::asio;

/**
 * @brief Asynchronous byte stream used by the coroutine transports and servers
 *
 * All operations run on the stream's executor. A read that is interrupted by Cancel()
 * completes with boost::asio::error::operation_aborted.
 */
class AsyncByteStream {
 public:
  virtual ~AsyncByteStream() = default;

  /**
   * @throws ConnectionError if the stream cannot be opened
   */
  virtual asio::awaitable<void> Open() = 0;
  virtual void Close() = 0;
  [[nodiscard]] virtual bool IsOpen() const = 0;

  /**
   * @brief Read at least one byte into @p buffer
   *
   * Errors, end of stream and cancellation are reported through @p error.
   * @return Number of bytes read
   */
  virtual asio::awaitable<size_t> ReadSome(std::span<uint8_t> buffer, boost::system::error_code &error) = 0;

  /**
   * @throws ConnectionError if the write fails
   */
  virtual asio::awaitable<void> WriteAll(std::span<uint8_t const> data) = 0;

  /**
   * @brief Abort pending reads and writes
   */
  virtual void Cancel() = 0;

  [[nodiscard]] virtual asio::any_io_executor GetExecutor() = 0;
};

/**
 * @brief AsyncByteStream over any Asio stream (serial port, TCP socket, POSIX descriptor)
 *
 * Subclasses provide Open().
 */
template <typename AsioStream>
class BasicAsyncStream : public AsyncByteStream {
 public:
  explicit BasicAsyncStream(asio::any_io_executor executor)
      : stream_(executor) {}

  explicit BasicAsyncStream(AsioStream stream)
      : stream_(std::move(stream)) {}

  void Close() override {
    if (stream_.is_open()) {
      boost::system::error_code error;
      stream_.close(error);  // the descriptor is released even when close reports an error
    }
  }

  [[nodiscard]] bool IsOpen() const override { return stream_.is_open(); }

  asio::awaitable<size_t> ReadSome(std::span<uint8_t> buffer, boost::system::error_code &error) override {
    co_return co_await stream_.async_read_some(asio::buffer(buffer.data(), buffer.size()),
                                               asio::redirect_error(asio::use_awaitable, error));
  }

  asio::awaitable<void> WriteAll(std::span<uint8_t const> data) override {
    boost::system::error_code error;
    co_await asio::async_write(stream_, asio::buffer(data.data(), data.size()),
                               asio::redirect_error(asio::use_awaitable, error));
    if (error) {
      throw ConnectionError("write failed: " + error.message());
    }
  }

  void Cancel() override {
    if (stream_.is_open()) {
      boost::system::error_code error;
      stream_.cancel(error);
      if (error) {
        // Closing aborts pending operations as well
        Close();
      }
    }
  }

  [[nodiscard]] asio::any_io_executor GetExecutor() override { return stream_.get_executor(); }

 protected:
  AsioStream stream_;
};

}  // namespace mblink
