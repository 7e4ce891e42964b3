#pragma once

#include <memory>
#include "../transport/byte_stream.hpp"
#include "../transport/serial_line_transport.hpp"
#include "../transport/transport_options.hpp"

namespace mblink {

/**
 * @brief Modbus ASCII master transport over a serial line
 */
class AsciiTransport : public SerialLineTransport {
 public:
  explicit AsciiTransport(SerialConfig config, TransportOptions options = {});
  explicit AsciiTransport(std::unique_ptr<ByteStream> stream, TransportOptions options = {}, int baud_rate = 9600);
};

}  // namespace mblink
