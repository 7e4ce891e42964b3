#include <chrono>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "ascii/ascii_frame.hpp"
#include "common/errors.hpp"
#include "common/function_code.hpp"
#include "pdu/pdu.hpp"
#include "rtu/rtu_frame.hpp"
#include "transport/serial_framing.hpp"

namespace mblink {

namespace {

constexpr std::chrono::milliseconds kAsciiIdleGap{20};

}  // namespace

std::string_view SerialFramingName(SerialFraming framing) {
  return framing == SerialFraming::kRtu ? "rtu" : "ascii";
}

std::chrono::microseconds SerialIdleGap(SerialFraming framing, int baud_rate) {
  if (framing == SerialFraming::kRtu) {
    return RtuFrame::InterFrameGap(baud_rate);
  }
  return kAsciiIdleGap;
}

std::vector<uint8_t> EncodeSerialFrame(SerialFraming framing, uint8_t unit_id, Pdu const &pdu) {
  if (framing == SerialFraming::kRtu) {
    return RtuFrame::Encode(unit_id, pdu);
  }
  std::string text = AsciiFrame::Encode(unit_id, pdu);
  return {text.begin(), text.end()};
}

Adu DecodeSerialFrame(SerialFraming framing, std::span<uint8_t const> frame) {
  if (framing == SerialFraming::kRtu) {
    return RtuFrame::Decode(frame);
  }
  return AsciiFrame::Decode(std::string_view(reinterpret_cast<char const *>(frame.data()), frame.size()));
}

BytesNeededFn SerialResponseBytesNeeded(SerialFraming framing) {
  return framing == SerialFraming::kRtu ? &RtuFrame::ResponseBytesNeeded : &AsciiFrame::BytesNeeded;
}

BytesNeededFn SerialRequestBytesNeeded(SerialFraming framing) {
  return framing == SerialFraming::kRtu ? &RtuFrame::RequestBytesNeeded : &AsciiFrame::BytesNeeded;
}

void ValidateSerialRequest(uint8_t unit_id, Pdu const &request) {
  if (unit_id > kMaxSerialUnitId) {
    throw InvalidArgumentError("unit id " + std::to_string(unit_id) + " out of serial range 0-247");
  }
  if (unit_id == kBroadcastUnitId && !IsBroadcastableWrite(request.function_code)) {
    throw InvalidArgumentError("function " + std::to_string(request.function_code) + " cannot be broadcast");
  }
  if (request.Size() > kMaxPduSize) {
    throw InvalidArgumentError("PDU of " + std::to_string(request.Size()) + " bytes exceeds 253");
  }
}

}  // namespace mblink
