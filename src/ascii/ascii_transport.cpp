#include <memory>
#include <utility>
#include "ascii/ascii_transport.hpp"
#include "transport/serial_port.hpp"

namespace mblink {

AsciiTransport::AsciiTransport(SerialConfig config, TransportOptions options)
    : SerialLineTransport(SerialFraming::kAscii, std::make_unique<SerialPort>(config), options, config.baud_rate) {}

AsciiTransport::AsciiTransport(std::unique_ptr<ByteStream> stream, TransportOptions options, int baud_rate)
    : SerialLineTransport(SerialFraming::kAscii, std::move(stream), options, baud_rate) {}

}  // namespace mblink
