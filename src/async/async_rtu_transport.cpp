#include <memory>
#include <utility>
#include "async/async_rtu_transport.hpp"
#include "async/async_streams.hpp"

namespace mblink {

AsyncRtuTransport::AsyncRtuTransport(asio::any_io_executor executor, SerialConfig config, TransportOptions options)
    : AsyncSerialLineTransport(SerialFraming::kRtu, std::make_unique<AsyncSerialPort>(executor, config), options,
                               config.baud_rate) {}

AsyncRtuTransport::AsyncRtuTransport(std::unique_ptr<AsyncByteStream> stream, TransportOptions options, int baud_rate)
    : AsyncSerialLineTransport(SerialFraming::kRtu, std::move(stream), options, baud_rate) {}

}  // namespace mblink
