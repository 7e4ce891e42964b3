#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <memory>
#include "../transport/transport_options.hpp"
#include "async_byte_stream.hpp"
#include "async_serial_line_transport.hpp"

namespace mblink {

/**
 * @brief Modbus RTU master over an asynchronous serial line
 */
class AsyncRtuTransport : public AsyncSerialLineTransport {
 public:
  AsyncRtuTransport(asio::any_io_executor executor, SerialConfig config, TransportOptions options = {});
  explicit AsyncRtuTransport(std::unique_ptr<AsyncByteStream> stream, TransportOptions options = {},
                             int baud_rate = 9600);
};

}  // namespace mblink
