#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "common/diagnostics.hpp"
#include "common/errors.hpp"
#include "pdu/pdu.hpp"
#include "tcp/tcp_frame.hpp"
#include "tcp/tcp_transport.hpp"
#include "transport/stream_io.hpp"
#include "transport/tcp_socket.hpp"

namespace mblink {

namespace {

constexpr std::string_view kChannel = "tcp";

}  // namespace

TcpTransport::TcpTransport(TcpEndpoint endpoint, TransportOptions options)
    : stream_(std::make_unique<TcpSocket>(std::move(endpoint), options.timeout)),
      options_(options) {}

TcpTransport::TcpTransport(std::unique_ptr<ByteStream> stream, TransportOptions options)
    : stream_(std::move(stream)),
      options_(options) {}

void TcpTransport::Open() {
  std::lock_guard lock(mutex_);
  stream_->Open();
}

void TcpTransport::Close() {
  std::lock_guard lock(mutex_);
  stream_->Close();
}

bool TcpTransport::IsOpen() const {
  std::lock_guard lock(mutex_);
  return stream_->IsOpen();
}

uint16_t TcpTransport::GetNextTransactionId() {
  uint16_t id = next_transaction_id_++;
  if (next_transaction_id_ == 0) {
    next_transaction_id_ = 1;
  }
  return id;
}

std::optional<Pdu> TcpTransport::Exchange(uint8_t unit_id, Pdu const &request) {
  if (request.Size() > kMaxPduSize) {
    throw InvalidArgumentError("PDU of " + std::to_string(request.Size()) + " bytes exceeds 253");
  }

  std::lock_guard lock(mutex_);
  if (!stream_->IsOpen()) {
    throw ConnectionError("tcp transport is not open");
  }

  uint16_t transaction_id = GetNextTransactionId();
  std::vector<uint8_t> frame = TcpFrame::Encode(transaction_id, unit_id, request);

  TcpAdu response;
  try {
    WriteAll(*stream_, frame, std::chrono::steady_clock::now() + options_.timeout);
    NotifyFrameSent(options_.diagnostics, kChannel, frame);

    auto deadline = std::chrono::steady_clock::now() + options_.timeout;
    std::vector<uint8_t> response_frame = ReadFrame(*stream_, &TcpFrame::BytesNeeded, deadline);
    NotifyFrameReceived(options_.diagnostics, kChannel, response_frame);
    response = TcpFrame::Decode(response_frame);

    if (response.transaction_id != transaction_id) {
      throw InvalidResponseError("transaction id " + std::to_string(response.transaction_id) + ", expected " +
                                 std::to_string(transaction_id));
    }
    if (response.unit_id != unit_id) {
      throw InvalidResponseError("response from unit " + std::to_string(response.unit_id) + ", expected " +
                                 std::to_string(unit_id));
    }
  } catch (ModbusError const &error) {
    // Position in the byte stream is unknown from here on
    NotifyError(options_.diagnostics, kChannel, error);
    stream_->Close();
    throw;
  }
  return response.pdu;
}

}  // namespace mblink
