#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/serial_port_base.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <string>
#include <unistd.h>
#include <utility>
#include "async/async_io.hpp"
#include "async/async_streams.hpp"
#include "common/errors.hpp"

namespace mblink {

namespace {

asio::serial_port_base::parity ToParity(char parity) {
  switch (parity) {
    case 'N':
    case 'n':
      return asio::serial_port_base::parity(asio::serial_port_base::parity::none);
    case 'E':
    case 'e':
      return asio::serial_port_base::parity(asio::serial_port_base::parity::even);
    case 'O':
    case 'o':
      return asio::serial_port_base::parity(asio::serial_port_base::parity::odd);
    default:
      throw InvalidArgumentError(std::string("unsupported parity '") + parity + "'");
  }
}

asio::serial_port_base::stop_bits ToStopBits(int stop_bits) {
  switch (stop_bits) {
    case 1:
      return asio::serial_port_base::stop_bits(asio::serial_port_base::stop_bits::one);
    case 2:
      return asio::serial_port_base::stop_bits(asio::serial_port_base::stop_bits::two);
    default:
      throw InvalidArgumentError("unsupported stop bits " + std::to_string(stop_bits));
  }
}

}  // namespace

AsyncSerialPort::AsyncSerialPort(asio::any_io_executor executor, SerialConfig config)
    : BasicAsyncStream(executor),
      config_(std::move(config)) {}

asio::awaitable<void> AsyncSerialPort::Open() {
  if (stream_.is_open()) {
    co_return;
  }

  // Validate before touching the device
  auto parity = ToParity(config_.parity);
  auto stop_bits = ToStopBits(config_.stop_bits);
  if (config_.data_bits < 5 || config_.data_bits > 8) {
    throw InvalidArgumentError("unsupported data bits " + std::to_string(config_.data_bits));
  }

  boost::system::error_code error;
  stream_.open(config_.port, error);
  if (error) {
    throw ConnectionError("cannot open " + config_.port + ": " + error.message());
  }

  stream_.set_option(asio::serial_port_base::baud_rate(static_cast<unsigned int>(config_.baud_rate)), error);
  if (!error) {
    stream_.set_option(asio::serial_port_base::character_size(static_cast<unsigned int>(config_.data_bits)), error);
  }
  if (!error) {
    stream_.set_option(parity, error);
  }
  if (!error) {
    stream_.set_option(stop_bits, error);
  }
  if (!error) {
    stream_.set_option(asio::serial_port_base::flow_control(asio::serial_port_base::flow_control::none), error);
  }
  if (error) {
    Close();
    throw ConnectionError("cannot configure " + config_.port + ": " + error.message());
  }
}

AsyncTcpStream::AsyncTcpStream(asio::any_io_executor executor, TcpEndpoint endpoint,
                               std::chrono::milliseconds connect_timeout)
    : BasicAsyncStream(executor),
      endpoint_(std::move(endpoint)),
      connect_timeout_(connect_timeout) {}

AsyncTcpStream::AsyncTcpStream(asio::ip::tcp::socket socket)
    : BasicAsyncStream(std::move(socket)),
      adopted_(true) {}

asio::awaitable<void> AsyncTcpStream::Open() {
  if (stream_.is_open()) {
    co_return;
  }
  if (adopted_) {
    throw ConnectionError("accepted connection was closed");
  }

  boost::system::error_code error;
  asio::ip::tcp::resolver resolver(stream_.get_executor());
  auto endpoints = co_await resolver.async_resolve(endpoint_.host, std::to_string(endpoint_.port),
                                                   asio::redirect_error(asio::use_awaitable, error));
  if (error) {
    throw ConnectionError("cannot resolve " + endpoint_.host + ": " + error.message());
  }

  std::string target = endpoint_.host + ":" + std::to_string(endpoint_.port);
  {
    Deadline deadline(*this, connect_timeout_, Deadline::OnExpiry::kClose);
    co_await asio::async_connect(stream_, endpoints, asio::redirect_error(asio::use_awaitable, error));
    if (deadline.Expired()) {
      Close();
      throw TimeoutError("cannot connect to " + target + " within " + std::to_string(connect_timeout_.count()) +
                         " ms");
    }
  }
  if (error) {
    Close();
    throw ConnectionError("cannot connect to " + target + ": " + error.message());
  }

  // Send small frames immediately
  stream_.set_option(asio::ip::tcp::no_delay(true), error);
  if (error) {
    Close();
    throw ConnectionError("cannot set TCP_NODELAY: " + error.message());
  }
}

AsyncDescriptorStream::AsyncDescriptorStream(asio::any_io_executor executor, int fd)
    : BasicAsyncStream(executor) {
  boost::system::error_code error;
  stream_.assign(fd, error);
  if (error) {
    ::close(fd);
    throw ConnectionError("cannot register descriptor: " + error.message());
  }
}

asio::awaitable<void> AsyncDescriptorStream::Open() {
  if (!stream_.is_open()) {
    throw ConnectionError("descriptor stream was closed");
  }
  co_return;
}

}  // namespace mblink
