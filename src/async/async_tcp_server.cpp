#include <utility>
#include <array>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "async/async_io.hpp"
#include "async/async_streams.hpp"
#include "async/async_tcp_server.hpp"
#include "common/diagnostics.hpp"
#include "common/errors.hpp"
#include "common/exception_code.hpp"
#include "common/function_code.hpp"
#include "pdu/pdu.hpp"
#include "pdu/pdu_codec.hpp"
#include "tcp/tcp_frame.hpp"

namespace mblink {

namespace {

constexpr std::string_view kChannel = "tcp-server";

void RethrowFailure(std::exception_ptr failure) {
  if (failure) {
    std::rethrow_exception(failure);
  }
}

}  // namespace

AsyncTcpServer::AsyncTcpServer(asio::any_io_executor executor, std::string bind_address, uint16_t port,
                               DataStore &store, ServerOptions options)
    : executor_(executor),
      bind_address_(bind_address.empty() ? "0.0.0.0" : std::move(bind_address)),
      port_(port),
      handler_(store),
      options_(options),
      acceptor_(executor) {}

uint16_t AsyncTcpServer::GetPort() const {
  boost::system::error_code error;
  asio::ip::tcp::endpoint endpoint = acceptor_.local_endpoint(error);
  return error ? port_ : endpoint.port();
}

void AsyncTcpServer::Start() {
  if (running_) {
    return;
  }

  boost::system::error_code error;
  asio::ip::address address = asio::ip::make_address(bind_address_, error);
  if (error) {
    throw ConnectionError("invalid bind address " + bind_address_ + ": " + error.message());
  }
  asio::ip::tcp::endpoint endpoint(address, port_);

  acceptor_.open(endpoint.protocol(), error);
  if (!error) {
    acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true), error);
  }
  if (!error) {
    acceptor_.bind(endpoint, error);
  }
  if (!error) {
    acceptor_.listen(asio::socket_base::max_listen_connections, error);
  }
  if (error) {
    boost::system::error_code close_error;
    acceptor_.close(close_error);
    throw ConnectionError("cannot listen on " + bind_address_ + ":" + std::to_string(port_) + ": " +
                          error.message());
  }

  running_ = true;
  NotifyMessage(options_.diagnostics, kChannel, "listening on port " + std::to_string(GetPort()));
  asio::co_spawn(executor_, AcceptLoop(), RethrowFailure);
}

void AsyncTcpServer::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  boost::system::error_code error;
  acceptor_.close(error);
  if (error) {
    NotifyMessage(options_.diagnostics, kChannel, "closing listener failed: " + error.message());
  }
  for (std::shared_ptr<AsyncByteStream> const &session : sessions_) {
    session->Close();
  }
}

asio::awaitable<void> AsyncTcpServer::AcceptLoop() {
  while (running_) {
    boost::system::error_code error;
    asio::ip::tcp::socket socket = co_await acceptor_.async_accept(asio::redirect_error(asio::use_awaitable, error));
    if (!running_) {
      break;
    }
    if (error) {
      NotifyMessage(options_.diagnostics, kChannel, "accept failed: " + error.message());
      running_ = false;
      break;
    }

    if (sessions_.size() >= options_.max_connections) {
      NotifyMessage(options_.diagnostics, kChannel, "connection limit reached, closing new connection");
      socket.close(error);
      continue;
    }

    auto stream = std::make_shared<AsyncTcpStream>(std::move(socket));
    sessions_.push_back(stream);
    asio::co_spawn(executor_, ServeSession(stream), RethrowFailure);
  }
}

asio::awaitable<void> AsyncTcpServer::ServeSession(std::shared_ptr<AsyncByteStream> stream) {
  NotifyMessage(options_.diagnostics, kChannel, "client connected");

  while (running_ && stream->IsOpen()) {
    std::array<uint8_t, 1> first{};
    boost::system::error_code read_error;
    size_t count = co_await stream->ReadSome(first, read_error);
    if (read_error) {
      break;  // peer closed the connection or the server is stopping
    }

    TcpAdu request;
    try {
      std::vector<uint8_t> frame = co_await AsyncReadFrame(*stream, &TcpFrame::BytesNeeded, options_.frame_timeout,
                                                           std::vector<uint8_t>(first.begin(), first.begin() + count));
      NotifyFrameReceived(options_.diagnostics, kChannel, frame);
      request = TcpFrame::Decode(frame);
    } catch (ConnectionError const &) {
      break;
    } catch (ModbusError const &error) {
      // Framing is lost on this connection
      NotifyError(options_.diagnostics, kChannel, error);
      break;
    }

    Pdu response = IsAddressedTo(request.unit_id, options_.unit_id)
                       ? handler_.Handle(request.pdu)
                       : PduCodec::ExceptionResponse(request.pdu.function_code & kFunctionCodeMask,
                                                     ExceptionCode::kGatewayTargetDeviceFailedToRespond);

    std::vector<uint8_t> reply = TcpFrame::Encode(request.transaction_id, request.unit_id, response);
    try {
      co_await stream->WriteAll(reply);
    } catch (ConnectionError const &error) {
      NotifyError(options_.diagnostics, kChannel, error);
      break;
    }
    NotifyFrameSent(options_.diagnostics, kChannel, reply);
  }

  stream->Close();
  sessions_.remove(stream);
  NotifyMessage(options_.diagnostics, kChannel, "client disconnected");
}

}  // namespace mblink
