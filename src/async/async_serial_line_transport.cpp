#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "async/async_io.hpp"
#include "async/async_serial_line_transport.hpp"
#include "common/diagnostics.hpp"
#include "common/errors.hpp"
#include "pdu/pdu.hpp"
#include "transport/serial_framing.hpp"

namespace mblink {

AsyncSerialLineTransport::AsyncSerialLineTransport(SerialFraming framing, std::unique_ptr<AsyncByteStream> stream,
                                                   TransportOptions options, int baud_rate)
    : framing_(framing),
      stream_(std::move(stream)),
      options_(options),
      idle_gap_(SerialIdleGap(framing, baud_rate)),
      mutex_(stream_->GetExecutor()) {}

asio::awaitable<void> AsyncSerialLineTransport::Open() {
  co_await stream_->Open();
}

void AsyncSerialLineTransport::Close() {
  stream_->Close();
}

bool AsyncSerialLineTransport::IsOpen() const {
  return stream_->IsOpen();
}

asio::awaitable<std::optional<Pdu>> AsyncSerialLineTransport::Exchange(uint8_t unit_id, Pdu request) {
  ValidateSerialRequest(unit_id, request);
  std::vector<uint8_t> frame = EncodeSerialFrame(framing_, unit_id, request);
  std::string_view channel = SerialFramingName(framing_);

  AsyncMutex::Guard guard = co_await mutex_.ScopedLock();
  if (!stream_->IsOpen()) {
    throw ConnectionError(std::string(channel) + " transport is not open");
  }

  co_await stream_->WriteAll(frame);
  NotifyFrameSent(options_.diagnostics, channel, frame);

  if (unit_id == kBroadcastUnitId) {
    asio::steady_timer gap(stream_->GetExecutor(), idle_gap_);
    co_await gap.async_wait(asio::use_awaitable);
    co_return std::nullopt;
  }

  Adu response;
  std::exception_ptr failure;
  try {
    std::vector<uint8_t> response_frame =
        co_await AsyncReadFrame(*stream_, SerialResponseBytesNeeded(framing_), options_.timeout);
    NotifyFrameReceived(options_.diagnostics, channel, response_frame);
    response = DecodeSerialFrame(framing_, response_frame);
  } catch (ConnectionError const &error) {
    NotifyError(options_.diagnostics, channel, error);
    throw;
  } catch (ModbusError const &error) {
    NotifyError(options_.diagnostics, channel, error);
    failure = std::current_exception();
  }

  if (failure) {
    // co_await is not allowed inside a handler, so the drain happens here
    co_await AsyncDrainInput(*stream_, idle_gap_);
    std::rethrow_exception(failure);
  }

  if (response.unit_id != unit_id) {
    InvalidResponseError error("response from unit " + std::to_string(response.unit_id) + ", expected " +
                               std::to_string(unit_id));
    NotifyError(options_.diagnostics, channel, error);
    throw error;
  }
  co_return response.pdu;
}

}  // namespace mblink
