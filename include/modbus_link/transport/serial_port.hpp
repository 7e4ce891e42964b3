#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include "byte_stream.hpp"
#include "transport_options.hpp"

namespace mblink {

/**
 * @brief POSIX serial port stream (termios, raw mode, non-blocking reads)
 *
 * Works with real ports and with virtual ports created by socat:
 *   socat -d -d pty,raw,echo=0 pty,raw,echo=0
 */
class SerialPort : public ByteStream {
 public:
  explicit SerialPort(SerialConfig config)
      : config_(std::move(config)) {}

  ~SerialPort() override { Close(); }

  SerialPort(SerialPort const &) = delete;
  SerialPort &operator=(SerialPort const &) = delete;

  /**
   * @brief Open and configure the port
   * @throws ConnectionError if the device cannot be opened or configured
   */
  void Open() override;
  void Close() override;
  [[nodiscard]] bool IsOpen() const override { return fd_ >= 0; }

  // ByteReader interface
  [[nodiscard]] int Read(std::span<uint8_t> buffer) override;
  [[nodiscard]] bool HasData() const override;
  [[nodiscard]] size_t AvailableBytes() const override;

  // ByteWriter interface
  [[nodiscard]] int Write(std::span<uint8_t const> data) override;
  [[nodiscard]] bool WaitWritable(std::chrono::milliseconds wait) override;
  [[nodiscard]] bool Flush() override;

  [[nodiscard]] SerialConfig const &GetConfig() const { return config_; }

 private:
  SerialConfig config_;
  int fd_{-1};
};

}  // namespace mblink
