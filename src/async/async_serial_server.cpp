#include <utility>
#include <array>
#include <boost/asio/co_spawn.hpp>
#include <boost/system/error_code.hpp>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "async/async_io.hpp"
#include "async/async_serial_server.hpp"
#include "common/diagnostics.hpp"
#include "common/errors.hpp"
#include "pdu/pdu.hpp"
#include "transport/serial_framing.hpp"

namespace mblink {

AsyncSerialServer::AsyncSerialServer(std::unique_ptr<AsyncByteStream> stream, SerialFraming framing,
                                     DataStore &store, ServerOptions options, int baud_rate)
    : stream_(std::move(stream)),
      framing_(framing),
      handler_(store),
      options_(options),
      idle_gap_(SerialIdleGap(framing, baud_rate)) {}

void AsyncSerialServer::Start() {
  if (running_) {
    return;
  }
  running_ = true;
  asio::co_spawn(stream_->GetExecutor(), Serve(), [](std::exception_ptr failure) {
    if (failure) {
      std::rethrow_exception(failure);
    }
  });
}

void AsyncSerialServer::Stop() {
  running_ = false;
  stream_->Cancel();
}

asio::awaitable<void> AsyncSerialServer::ServeForever() {
  running_ = true;
  co_await Serve();
}

asio::awaitable<void> AsyncSerialServer::Serve() {
  // Stop() may have run between Start() and the first resumption
  if (!running_) {
    co_return;
  }
  std::string_view channel = SerialFramingName(framing_);
  try {
    co_await stream_->Open();
    NotifyMessage(options_.diagnostics, channel, "server started");
    while (running_) {
      co_await ServeOne();
    }
  } catch (ConnectionError const &error) {
    NotifyError(options_.diagnostics, channel, error);
  }
  running_ = false;
  NotifyMessage(options_.diagnostics, channel, "server stopped");
}

asio::awaitable<void> AsyncSerialServer::ServeOne() {
  std::string_view channel = SerialFramingName(framing_);

  std::array<uint8_t, 1> first{};
  boost::system::error_code read_error;
  size_t count = co_await stream_->ReadSome(first, read_error);
  if (!running_) {
    co_return;
  }
  if (read_error) {
    throw ConnectionError(std::string(channel) + " server read failed: " + read_error.message());
  }

  Adu request;
  bool discarded = false;
  try {
    std::vector<uint8_t> frame = co_await AsyncReadFrame(*stream_, SerialRequestBytesNeeded(framing_),
                                                         options_.frame_timeout,
                                                         std::vector<uint8_t>(first.begin(), first.begin() + count));
    NotifyFrameReceived(options_.diagnostics, channel, frame);
    request = DecodeSerialFrame(framing_, frame);
  } catch (ConnectionError const &) {
    throw;
  } catch (ModbusError const &error) {
    NotifyError(options_.diagnostics, channel, error);
    discarded = true;
  }
  if (discarded) {
    // The frame is discarded; resynchronize on the next idle gap
    co_await AsyncDrainInput(*stream_, idle_gap_);
    co_return;
  }

  if (!IsAddressedTo(request.unit_id, options_.unit_id)) {
    co_return;
  }

  Pdu response = handler_.Handle(request.pdu);
  if (request.unit_id == kBroadcastUnitId) {
    co_return;
  }

  std::vector<uint8_t> reply = EncodeSerialFrame(framing_, request.unit_id, response);
  co_await stream_->WriteAll(reply);
  NotifyFrameSent(options_.diagnostics, channel, reply);
}

}  // namespace mblink
