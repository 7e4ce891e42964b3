#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>
#include "common/diagnostics.hpp"
#include "common/errors.hpp"
#include "pdu/pdu.hpp"
#include "transport/serial_framing.hpp"
#include "transport/serial_line_transport.hpp"
#include "transport/stream_io.hpp"

namespace mblink {

SerialLineTransport::SerialLineTransport(SerialFraming framing, std::unique_ptr<ByteStream> stream,
                                         TransportOptions options, int baud_rate)
    : framing_(framing),
      stream_(std::move(stream)),
      options_(options),
      idle_gap_(SerialIdleGap(framing, baud_rate)) {}

void SerialLineTransport::Open() {
  std::lock_guard lock(mutex_);
  stream_->Open();
}

void SerialLineTransport::Close() {
  std::lock_guard lock(mutex_);
  stream_->Close();
}

bool SerialLineTransport::IsOpen() const {
  std::lock_guard lock(mutex_);
  return stream_->IsOpen();
}

std::optional<Pdu> SerialLineTransport::Exchange(uint8_t unit_id, Pdu const &request) {
  ValidateSerialRequest(unit_id, request);
  std::vector<uint8_t> frame = EncodeSerialFrame(framing_, unit_id, request);
  std::string_view channel = SerialFramingName(framing_);

  std::lock_guard lock(mutex_);
  if (!stream_->IsOpen()) {
    throw ConnectionError(std::string(channel) + " transport is not open");
  }

  try {
    WriteAll(*stream_, frame, std::chrono::steady_clock::now() + options_.timeout);
  } catch (ModbusError const &error) {
    NotifyError(options_.diagnostics, channel, error);
    throw;
  }
  NotifyFrameSent(options_.diagnostics, channel, frame);

  if (unit_id == kBroadcastUnitId) {
    // No reply is defined; keep the line quiet for one gap before the next request
    std::this_thread::sleep_for(idle_gap_);
    return std::nullopt;
  }

  Adu response;
  try {
    auto deadline = std::chrono::steady_clock::now() + options_.timeout;
    std::vector<uint8_t> response_frame = ReadFrame(*stream_, SerialResponseBytesNeeded(framing_), deadline);
    NotifyFrameReceived(options_.diagnostics, channel, response_frame);
    response = DecodeSerialFrame(framing_, response_frame);
  } catch (ConnectionError const &error) {
    NotifyError(options_.diagnostics, channel, error);
    throw;
  } catch (ModbusError const &error) {
    NotifyError(options_.diagnostics, channel, error);
    DrainInput(*stream_, idle_gap_);
    throw;
  }

  if (response.unit_id != unit_id) {
    InvalidResponseError error("response from unit " + std::to_string(response.unit_id) + ", expected " +
                               std::to_string(unit_id));
    NotifyError(options_.diagnostics, channel, error);
    throw error;
  }
  return response.pdu;
}

}  // namespace mblink
