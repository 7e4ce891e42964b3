#include <chrono>
#include <cstdint>
#include <span>
#include <string>
#include <vector>
#include "common/byte_helpers.hpp"
#include "common/crc16.hpp"
#include "common/errors.hpp"
#include "common/function_code.hpp"
#include "pdu/pdu.hpp"
#include "rtu/rtu_frame.hpp"

namespace mblink {

namespace {

constexpr size_t kHeaderSize = 2;           // unit id + function code
constexpr size_t kExceptionFrameSize = 5;   // unit id + fc|0x80 + exception code + CRC
constexpr size_t kFixedFrameSize = 8;       // unit id + fc + 4 data bytes + CRC
constexpr size_t kReadByteCountIndex = 2;
constexpr size_t kWriteByteCountIndex = 6;
constexpr int kBitsPerCharacter = 11;       // start + 8 data + parity/stop + stop
constexpr int kFixedGapBaudThreshold = 19200;

size_t Missing(size_t have, size_t total) {
  return have >= total ? 0 : total - have;
}

}  // namespace

std::vector<uint8_t> RtuFrame::Encode(uint8_t unit_id, Pdu const &pdu) {
  std::vector<uint8_t> frame;
  frame.reserve(1 + pdu.Size() + kCrcSize);

  frame.push_back(unit_id);
  frame.push_back(pdu.function_code);
  frame.insert(frame.end(), pdu.payload.begin(), pdu.payload.end());

  // CRC is little-endian on the wire
  uint16_t crc = CalculateCrc16(frame);
  frame.push_back(GetLowByte(crc));
  frame.push_back(GetHighByte(crc));

  return frame;
}

Adu RtuFrame::Decode(std::span<uint8_t const> frame) {
  if (frame.size() < kMinFrameSize) {
    throw InvalidResponseError("RTU frame too short: " + std::to_string(frame.size()) + " bytes");
  }
  if (frame.size() > kMaxFrameSize) {
    throw InvalidResponseError("RTU frame too long: " + std::to_string(frame.size()) + " bytes");
  }
  if (!VerifyCrc16(frame)) {
    throw CrcError("RTU CRC mismatch");
  }

  Adu adu;
  adu.unit_id = frame[0];
  adu.pdu.function_code = frame[1];
  adu.pdu.payload.assign(frame.begin() + kHeaderSize, frame.end() - kCrcSize);
  return adu;
}

size_t RtuFrame::ResponseBytesNeeded(std::span<uint8_t const> prefix) {
  if (prefix.size() < kHeaderSize) {
    return kHeaderSize - prefix.size();
  }

  uint8_t function_code = prefix[1];
  if ((function_code & kExceptionFunctionCodeMask) != 0) {
    return Missing(prefix.size(), kExceptionFrameSize);
  }

  switch (static_cast<FunctionCode>(function_code)) {
    case FunctionCode::kReadCoils:
    case FunctionCode::kReadDI:
    case FunctionCode::kReadHR:
    case FunctionCode::kReadIR:
      if (prefix.size() <= kReadByteCountIndex) {
        return kReadByteCountIndex + 1 - prefix.size();
      }
      return Missing(prefix.size(), kReadByteCountIndex + 1 + prefix[kReadByteCountIndex] + kCrcSize);
    case FunctionCode::kWriteSingleCoil:
    case FunctionCode::kWriteSingleReg:
    case FunctionCode::kWriteMultCoils:
    case FunctionCode::kWriteMultRegs:
      return Missing(prefix.size(), kFixedFrameSize);
    default:
      throw InvalidResponseError("unsupported function code in RTU response: " + std::to_string(function_code));
  }
}

size_t RtuFrame::RequestBytesNeeded(std::span<uint8_t const> prefix) {
  if (prefix.size() < kHeaderSize) {
    return kHeaderSize - prefix.size();
  }

  switch (static_cast<FunctionCode>(prefix[1])) {
    case FunctionCode::kReadCoils:
    case FunctionCode::kReadDI:
    case FunctionCode::kReadHR:
    case FunctionCode::kReadIR:
    case FunctionCode::kWriteSingleCoil:
    case FunctionCode::kWriteSingleReg:
      return Missing(prefix.size(), kFixedFrameSize);
    case FunctionCode::kWriteMultCoils:
    case FunctionCode::kWriteMultRegs:
      if (prefix.size() <= kWriteByteCountIndex) {
        return kWriteByteCountIndex + 1 - prefix.size();
      }
      return Missing(prefix.size(), kWriteByteCountIndex + 1 + prefix[kWriteByteCountIndex] + kCrcSize);
    default:
      return Missing(prefix.size(), kMinFrameSize);
  }
}

std::chrono::microseconds RtuFrame::InterFrameGap(int baud_rate) {
  if (baud_rate <= 0 || baud_rate > kFixedGapBaudThreshold) {
    return std::chrono::microseconds(1750);
  }
  // 3.5 characters, rounded up
  int64_t micros = (static_cast<int64_t>(kBitsPerCharacter) * 3500000 + baud_rate - 1) / baud_rate;
  return std::chrono::microseconds(micros);
}

}  // namespace mblink
