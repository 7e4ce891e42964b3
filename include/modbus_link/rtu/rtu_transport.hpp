#pragma once

#include <memory>
#include "../transport/byte_stream.hpp"
#include "../transport/serial_line_transport.hpp"
#include "../transport/transport_options.hpp"

namespace mblink {

/**
 * @brief Modbus RTU master transport over a serial line
 */
class RtuTransport : public SerialLineTransport {
 public:
  /**
   * @brief Transport over a POSIX serial port; the port is opened by Open()
   */
  explicit RtuTransport(SerialConfig config, TransportOptions options = {});

  /**
   * @brief Transport over any byte stream (virtual ports, MemoryStream in tests)
   * @param baud_rate Line speed used to derive the inter-frame gap
   */
  explicit RtuTransport(std::unique_ptr<ByteStream> stream, TransportOptions options = {}, int baud_rate = 9600);
};

}  // namespace mblink
