#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>
#include "common/diagnostics.hpp"
#include "common/errors.hpp"
#include "common/exception_code.hpp"
#include "pdu/pdu.hpp"
#include "pdu/pdu_codec.hpp"
#include "server/tcp_server.hpp"
#include "tcp/tcp_frame.hpp"
#include "transport/stream_io.hpp"
#include "transport/tcp_socket.hpp"

namespace mblink {

namespace {

constexpr std::string_view kChannel = "tcp-server";

}  // namespace

TcpServer::TcpServer(std::string bind_address, uint16_t port, DataStore &store, ServerOptions options)
    : listener_(std::move(bind_address), port),
      handler_(store),
      options_(options) {}

TcpServer::~TcpServer() {
  Stop();
}

void TcpServer::Start() {
  if (running_) {
    return;
  }
  listener_.Listen();
  running_ = true;
  accept_thread_ = std::thread([this] { AcceptLoop(); });
  NotifyMessage(options_.diagnostics, kChannel, "listening on port " + std::to_string(listener_.GetPort()));
}

void TcpServer::Stop() {
  running_ = false;
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }

  std::vector<Session> sessions;
  {
    std::lock_guard lock(sessions_mutex_);
    sessions.swap(sessions_);
  }
  for (Session &session : sessions) {
    if (session.thread.joinable()) {
      session.thread.join();
    }
  }
  listener_.Close();
}

void TcpServer::AcceptLoop() {
  while (running_) {
    int fd = listener_.Accept(kPollInterval);
    ReapFinishedSessions();
    if (fd < 0) {
      continue;
    }

    if (connected_clients_ >= options_.max_connections) {
      NotifyMessage(options_.diagnostics, kChannel, "connection limit reached, closing new connection");
      ::close(fd);
      continue;
    }

    ++connected_clients_;
    auto finished = std::make_shared<std::atomic<bool>>(false);
    std::lock_guard lock(sessions_mutex_);
    sessions_.push_back(Session{std::thread([this, fd, finished] { ServeSession(fd, finished); }), finished});
  }
}

void TcpServer::ReapFinishedSessions() {
  std::lock_guard lock(sessions_mutex_);
  for (auto it = sessions_.begin(); it != sessions_.end();) {
    if (*it->finished) {
      it->thread.join();
      it = sessions_.erase(it);
    } else {
      ++it;
    }
  }
}

void TcpServer::ServeSession(int fd, std::shared_ptr<std::atomic<bool>> finished) {
  TcpSocket socket(fd);
  NotifyMessage(options_.diagnostics, kChannel, "client connected");

  while (running_ && socket.IsOpen()) {
    if (!WaitForData(socket, kPollInterval)) {
      continue;
    }

    TcpAdu request;
    try {
      auto deadline = std::chrono::steady_clock::now() + options_.frame_timeout;
      std::vector<uint8_t> frame = ReadFrame(socket, &TcpFrame::BytesNeeded, deadline);
      NotifyFrameReceived(options_.diagnostics, kChannel, frame);
      request = TcpFrame::Decode(frame);
    } catch (ConnectionError const &) {
      break;  // peer closed the connection
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
      WriteAll(socket, reply, std::chrono::steady_clock::now() + options_.frame_timeout);
    } catch (ModbusError const &error) {
      NotifyError(options_.diagnostics, kChannel, error);
      break;
    }
    NotifyFrameSent(options_.diagnostics, kChannel, reply);
  }

  socket.Close();
  --connected_clients_;
  NotifyMessage(options_.diagnostics, kChannel, "client disconnected");
  *finished = true;
}

}  // namespace mblink
