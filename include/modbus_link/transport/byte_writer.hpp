#pragma once

#include <chrono>
#include <cstdint>
#include <span>

namespace mblink {

/**
 * @brief Abstract interface for writing bytes to a stream
 */
class ByteWriter {
 public:
  virtual ~ByteWriter() = default;

  /**
   * @brief Write bytes
   * @return Number of bytes actually written (-1 on error)
   */
  [[nodiscard]] virtual int Write(std::span<uint8_t const> data) = 0;

  /**
   * @brief Wait up to @p wait until Write() can accept more bytes
   * @return true if writable, or if the stream failed (the next Write() reports it)
   */
  [[nodiscard]] virtual bool WaitWritable(std::chrono::milliseconds wait) = 0;

  /**
   * @brief Flush any buffered data
   * @return true on success, false on error
   */
  [[nodiscard]] virtual bool Flush() = 0;
};

}  // namespace mblink
