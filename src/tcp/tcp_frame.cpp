#include <cstdint>
#include <span>
#include <string>
#include <vector>
#include "common/byte_helpers.hpp"
#include "common/errors.hpp"
#include "pdu/pdu.hpp"
#include "tcp/tcp_frame.hpp"

namespace mblink {

namespace {

constexpr size_t kTransactionIdOffset = 0;
constexpr size_t kProtocolIdOffset = 2;
constexpr size_t kLengthOffset = 4;
constexpr size_t kUnitIdOffset = 6;

void ValidateHeader(std::span<uint8_t const> header) {
  uint16_t protocol_id = ReadU16(header, kProtocolIdOffset);
  if (protocol_id != TcpFrame::kProtocolId) {
    throw InvalidResponseError("MBAP protocol id " + std::to_string(protocol_id) + " is not Modbus");
  }
  uint16_t length = ReadU16(header, kLengthOffset);
  if (length < TcpFrame::kMinLength || length > TcpFrame::kMaxLength) {
    throw InvalidResponseError("MBAP length " + std::to_string(length) + " out of range");
  }
}

}  // namespace

std::vector<uint8_t> TcpFrame::Encode(uint16_t transaction_id, uint8_t unit_id, Pdu const &pdu) {
  std::vector<uint8_t> frame;
  frame.reserve(kMbapHeaderSize + pdu.Size());

  AppendU16(frame, transaction_id);
  AppendU16(frame, kProtocolId);
  AppendU16(frame, static_cast<uint16_t>(1 + pdu.Size()));
  frame.push_back(unit_id);

  frame.push_back(pdu.function_code);
  frame.insert(frame.end(), pdu.payload.begin(), pdu.payload.end());
  return frame;
}

TcpAdu TcpFrame::Decode(std::span<uint8_t const> frame) {
  if (frame.size() < kMbapHeaderSize + 1) {
    throw InvalidResponseError("TCP frame too short: " + std::to_string(frame.size()) + " bytes");
  }
  ValidateHeader(frame);

  uint16_t length = ReadU16(frame, kLengthOffset);
  if (frame.size() != kMbapHeaderSize - 1 + length) {
    throw InvalidResponseError("MBAP length " + std::to_string(length) + " does not match frame size " +
                               std::to_string(frame.size()));
  }

  TcpAdu adu;
  adu.transaction_id = ReadU16(frame, kTransactionIdOffset);
  adu.unit_id = frame[kUnitIdOffset];
  adu.pdu.function_code = frame[kMbapHeaderSize];
  adu.pdu.payload.assign(frame.begin() + kMbapHeaderSize + 1, frame.end());
  return adu;
}

size_t TcpFrame::BytesNeeded(std::span<uint8_t const> prefix) {
  if (prefix.size() < kMbapHeaderSize) {
    return kMbapHeaderSize - prefix.size();
  }
  ValidateHeader(prefix);

  // Length counts the unit id, which is already part of the header
  size_t total = kMbapHeaderSize - 1 + ReadU16(prefix, kLengthOffset);
  return prefix.size() >= total ? 0 : total - prefix.size();
}

}  // namespace mblink
