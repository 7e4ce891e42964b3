#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>
#include "common/diagnostics.hpp"
#include "common/errors.hpp"
#include "pdu/pdu.hpp"
#include "server/serial_server.hpp"
#include "transport/serial_framing.hpp"
#include "transport/stream_io.hpp"

namespace mblink {

SerialServer::SerialServer(std::unique_ptr<ByteStream> stream, SerialFraming framing, DataStore &store,
                           ServerOptions options, int baud_rate)
    : stream_(std::move(stream)),
      framing_(framing),
      handler_(store),
      options_(options),
      idle_gap_(SerialIdleGap(framing, baud_rate)) {}

SerialServer::~SerialServer() {
  Stop();
}

bool SerialServer::ServeOnce(std::chrono::milliseconds wait) {
  if (!stream_->IsOpen()) {
    throw ConnectionError(std::string(SerialFramingName(framing_)) + " server stream is not open");
  }
  if (!WaitForData(*stream_, wait)) {
    return false;
  }

  std::string_view channel = SerialFramingName(framing_);
  Adu request;
  try {
    auto deadline = std::chrono::steady_clock::now() + options_.frame_timeout;
    std::vector<uint8_t> frame = ReadFrame(*stream_, SerialRequestBytesNeeded(framing_), deadline);
    NotifyFrameReceived(options_.diagnostics, channel, frame);
    request = DecodeSerialFrame(framing_, frame);
  } catch (ConnectionError const &) {
    throw;
  } catch (ModbusError const &error) {
    NotifyError(options_.diagnostics, channel, error);
    DrainInput(*stream_, idle_gap_);
    return true;
  }

  if (!IsAddressedTo(request.unit_id, options_.unit_id)) {
    return true;
  }

  Pdu response = handler_.Handle(request.pdu);
  if (request.unit_id == kBroadcastUnitId) {
    return true;
  }

  std::vector<uint8_t> reply = EncodeSerialFrame(framing_, request.unit_id, response);
  try {
    WriteAll(*stream_, reply, std::chrono::steady_clock::now() + options_.frame_timeout);
  } catch (TimeoutError const &error) {
    // Reply dropped
    NotifyError(options_.diagnostics, channel, error);
    return true;
  }
  NotifyFrameSent(options_.diagnostics, channel, reply);
  return true;
}

void SerialServer::Start() {
  if (running_) {
    return;
  }
  // A serve thread that ended on a stream failure is still joinable
  if (thread_.joinable()) {
    thread_.join();
  }
  stream_->Open();
  running_ = true;
  thread_ = std::thread([this] { Run(); });
}

void SerialServer::Stop() {
  running_ = false;
  if (thread_.joinable()) {
    thread_.join();
  }
}

void SerialServer::Run() {
  std::string_view channel = SerialFramingName(framing_);
  NotifyMessage(options_.diagnostics, channel, "server started");
  while (running_) {
    try {
      static_cast<void>(ServeOnce(kPollInterval));
    } catch (ConnectionError const &error) {
      NotifyError(options_.diagnostics, channel, error);
      running_ = false;
    }
  }
  NotifyMessage(options_.diagnostics, channel, "server stopped");
}

}  // namespace mblink
