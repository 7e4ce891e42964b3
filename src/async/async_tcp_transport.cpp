#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include "async/async_io.hpp"
#include "async/async_streams.hpp"
#include "async/async_tcp_transport.hpp"
#include "common/diagnostics.hpp"
#include "common/errors.hpp"
#include "pdu/pdu.hpp"
#include "tcp/tcp_frame.hpp"

namespace mblink {

namespace {

constexpr std::string_view kChannel = "tcp";

}  // namespace

AsyncTcpTransport::AsyncTcpTransport(asio::any_io_executor executor, TcpEndpoint endpoint, TransportOptions options)
    : stream_(std::make_unique<AsyncTcpStream>(executor, std::move(endpoint), options.timeout)),
      options_(options),
      mutex_(executor) {}

AsyncTcpTransport::AsyncTcpTransport(std::unique_ptr<AsyncByteStream> stream, TransportOptions options)
    : stream_(std::move(stream)),
      options_(options),
      mutex_(stream_->GetExecutor()) {}

asio::awaitable<void> AsyncTcpTransport::Open() {
  co_await stream_->Open();
}

void AsyncTcpTransport::Close() {
  stream_->Close();
}

bool AsyncTcpTransport::IsOpen() const {
  return stream_->IsOpen();
}

uint16_t AsyncTcpTransport::GetNextTransactionId() {
  uint16_t id = next_transaction_id_++;
  if (next_transaction_id_ == 0) {
    next_transaction_id_ = 1;
  }
  return id;
}

asio::awaitable<std::optional<Pdu>> AsyncTcpTransport::Exchange(uint8_t unit_id, Pdu request) {
  if (request.Size() > kMaxPduSize) {
    throw InvalidArgumentError("PDU of " + std::to_string(request.Size()) + " bytes exceeds 253");
  }

  AsyncMutex::Guard guard = co_await mutex_.ScopedLock();
  if (!stream_->IsOpen()) {
    throw ConnectionError("tcp transport is not open");
  }

  uint16_t transaction_id = GetNextTransactionId();
  std::vector<uint8_t> frame = TcpFrame::Encode(transaction_id, unit_id, request);

  TcpAdu response;
  try {
    co_await stream_->WriteAll(frame);
    NotifyFrameSent(options_.diagnostics, kChannel, frame);

    std::vector<uint8_t> response_frame = co_await AsyncReadFrame(*stream_, &TcpFrame::BytesNeeded, options_.timeout);
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
    NotifyError(options_.diagnostics, kChannel, error);
    stream_->Close();
    throw;
  }
  co_return response.pdu;
}

}  // namespace mblink
