#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace mblink {

/**
 * @brief Abstract interface for reading bytes from a stream
 *
 * Lets the frame readers work with any byte source (serial port, TCP socket,
 * memory buffer) without knowing the details. Reads never block.
 */
class ByteReader {
 public:
  virtual ~ByteReader() = default;

  /**
   * @brief Read up to buffer.size() bytes
   * @return Number of bytes read (0 if no data available, -1 on error or closed stream)
   */
  [[nodiscard]] virtual int Read(std::span<uint8_t> buffer) = 0;

  /**
   * @brief Check if data (or an end-of-stream condition) is ready to be read
   */
  [[nodiscard]] virtual bool HasData() const = 0;

  /**
   * @brief Get the number of bytes available to read
   * @return Number of bytes available (0 if unknown/unavailable)
   */
  [[nodiscard]] virtual size_t AvailableBytes() const = 0;
};

}  // namespace mblink
