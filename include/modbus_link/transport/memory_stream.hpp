#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <mutex>
#include <span>
#include <thread>
#include <utility>
#include <vector>
#include "../common/errors.hpp"
#include "byte_stream.hpp"

namespace mblink {

/**
 * @brief In-memory byte stream for tests and loopback setups
 *
 * Bytes queued with SetReadData/AppendReadData are returned by Read(); everything
 * written is recorded. An optional responder is called for every Write() and its
 * result is queued as read data, which simulates a device answering on the line.
 * All members are safe to call from several threads.
 */
class MemoryStream : public ByteStream {
 public:
  using Responder = std::function<std::vector<uint8_t>(std::span<uint8_t const>)>;

  MemoryStream() = default;

  void Open() override {
    std::lock_guard lock(mutex_);
    if (fail_open_) {
      throw ConnectionError("memory stream refused to open");
    }
    open_ = true;
  }

  void Close() override {
    std::lock_guard lock(mutex_);
    open_ = false;
  }

  [[nodiscard]] bool IsOpen() const override {
    std::lock_guard lock(mutex_);
    return open_;
  }

  // ByteReader interface
  [[nodiscard]] int Read(std::span<uint8_t> buffer) override {
    std::lock_guard lock(mutex_);
    if (!open_) {
      return -1;
    }
    if (read_pos_ >= read_buffer_.size()) {
      return 0;  // No data available
    }

    size_t bytes_to_read = std::min({buffer.size(), read_buffer_.size() - read_pos_, read_chunk_limit_});
    std::copy_n(read_buffer_.begin() + static_cast<std::ptrdiff_t>(read_pos_), bytes_to_read, buffer.begin());
    read_pos_ += bytes_to_read;
    return static_cast<int>(bytes_to_read);
  }

  [[nodiscard]] bool HasData() const override {
    std::lock_guard lock(mutex_);
    return read_pos_ < read_buffer_.size();
  }

  [[nodiscard]] size_t AvailableBytes() const override {
    std::lock_guard lock(mutex_);
    return read_buffer_.size() - read_pos_;
  }

  // ByteWriter interface
  [[nodiscard]] int Write(std::span<uint8_t const> data) override {
    Responder responder;
    {
      std::lock_guard lock(mutex_);
      if (!open_) {
        return -1;
      }
      if (write_stalled_) {
        return 0;
      }
      if (read_pos_ < read_buffer_.size()) {
        ++writes_with_pending_input_;
      }
      write_buffer_.insert(write_buffer_.end(), data.begin(), data.end());
      responder = responder_;
    }
    if (responder) {
      std::vector<uint8_t> reply = responder(data);
      AppendReadData(reply);
    }
    return static_cast<int>(data.size());
  }

  [[nodiscard]] bool WaitWritable(std::chrono::milliseconds wait) override {
    {
      std::lock_guard lock(mutex_);
      if (!write_stalled_) {
        return true;
      }
    }
    std::this_thread::sleep_for(wait);
    return false;
  }

  [[nodiscard]] bool Flush() override { return true; }

  /**
   * @brief Replace the data that will be read by Read()
   */
  void SetReadData(std::span<uint8_t const> data) {
    std::lock_guard lock(mutex_);
    read_buffer_.assign(data.begin(), data.end());
    read_pos_ = 0;
  }

  /**
   * @brief Queue more data behind whatever is still unread
   */
  void AppendReadData(std::span<uint8_t const> data) {
    std::lock_guard lock(mutex_);
    read_buffer_.erase(read_buffer_.begin(), read_buffer_.begin() + static_cast<std::ptrdiff_t>(read_pos_));
    read_pos_ = 0;
    read_buffer_.insert(read_buffer_.end(), data.begin(), data.end());
  }

  /**
   * @brief Get a copy of everything written via Write()
   */
  [[nodiscard]] std::vector<uint8_t> GetWrittenData() const {
    std::lock_guard lock(mutex_);
    return write_buffer_;
  }

  void ClearWriteBuffer() {
    std::lock_guard lock(mutex_);
    write_buffer_.clear();
  }

  void SetResponder(Responder responder) {
    std::lock_guard lock(mutex_);
    responder_ = std::move(responder);
  }

  /**
   * @brief Limit how many bytes one Read() returns, to exercise partial frame reassembly
   */
  void SetReadChunkLimit(size_t limit) {
    std::lock_guard lock(mutex_);
    read_chunk_limit_ = limit == 0 ? std::numeric_limits<size_t>::max() : limit;
  }

  /**
   * @brief Refuse all writes, like a line whose output buffer never drains
   */
  void SetWriteStalled(bool stalled) {
    std::lock_guard lock(mutex_);
    write_stalled_ = stalled;
  }

  void SetFailOpen(bool fail) {
    std::lock_guard lock(mutex_);
    fail_open_ = fail;
  }

  /**
   * @brief Number of writes that happened while earlier input was still unread
   *
   * Stays zero as long as every request/response exchange completes before the next begins.
   */
  [[nodiscard]] size_t WritesWithPendingInput() const {
    std::lock_guard lock(mutex_);
    return writes_with_pending_input_;
  }

 private:
  mutable std::mutex mutex_;
  bool open_{false};
  bool fail_open_{false};
  bool write_stalled_{false};
  std::vector<uint8_t> read_buffer_{};
  size_t read_pos_{0};
  size_t read_chunk_limit_{std::numeric_limits<size_t>::max()};
  std::vector<uint8_t> write_buffer_{};
  Responder responder_{};
  size_t writes_with_pending_input_{0};
};

}  // namespace mblink
