#include <memory>
#include <utility>
#include "rtu/rtu_transport.hpp"
#include "transport/serial_port.hpp"

namespace mblink {

RtuTransport::RtuTransport(SerialConfig config, TransportOptions options)
    : SerialLineTransport(SerialFraming::kRtu, std::make_unique<SerialPort>(config), options, config.baud_rate) {}

RtuTransport::RtuTransport(std::unique_ptr<ByteStream> stream, TransportOptions options, int baud_rate)
    : SerialLineTransport(SerialFraming::kRtu, std::move(stream), options, baud_rate) {}

}  // namespace mblink
