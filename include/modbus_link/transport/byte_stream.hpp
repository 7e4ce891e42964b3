#pragma once

#include "byte_reader.hpp"
#include "byte_writer.hpp"

namespace mblink {

/**
 * @brief Bidirectional byte channel with an explicit open/close lifecycle
 *
 * Open() throws ConnectionError when the channel cannot be established.
 * Close() is idempotent and never throws.
 */
class ByteStream : public ByteReader, public ByteWriter {
 public:
  ~ByteStream() override = default;

  virtual void Open() = 0;
  virtual void Close() = 0;
  [[nodiscard]] virtual bool IsOpen() const = 0;
};

}  // namespace mblink
