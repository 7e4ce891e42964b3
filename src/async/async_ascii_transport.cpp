#include <memory>
#include <utility>
#include "async/async_ascii_transport.hpp"
#include "async/async_streams.hpp"

namespace mblink {

AsyncAsciiTransport::AsyncAsciiTransport(asio::any_io_executor executor, SerialConfig config, TransportOptions options)
    : AsyncSerialLineTransport(SerialFraming::kAscii, std::make_unique<AsyncSerialPort>(executor, config), options,
                               config.baud_rate) {}

AsyncAsciiTransport::AsyncAsciiTransport(std::unique_ptr<AsyncByteStream> stream, TransportOptions options, int baud_rate)
    : AsyncSerialLineTransport(SerialFraming::kAscii, std::move(stream), options, baud_rate) {}

}  // namespace mblink
