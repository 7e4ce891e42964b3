#include <cctype>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "ascii/ascii_frame.hpp"
#include "common/errors.hpp"
#include "common/lrc8.hpp"
#include "pdu/pdu.hpp"

namespace mblink {

namespace {

constexpr size_t kMinDecodedSize = 3;  // unit id + function code + LRC

std::optional<int> HexCharToNibble(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  char uc = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  if (uc >= 'A' && uc <= 'F') {
    return uc - 'A' + 10;
  }
  return {};
}

}  // namespace

std::string AsciiFrame::BytesToHex(std::span<uint8_t const> bytes) {
  static constexpr char kHexChars[] = "0123456789ABCDEF";
  std::string result;
  result.reserve(bytes.size() * 2);
  for (uint8_t b : bytes) {
    result += kHexChars[(b >> 4) & 0x0F];
    result += kHexChars[b & 0x0F];
  }
  return result;
}

std::optional<std::vector<uint8_t>> AsciiFrame::HexToBytes(std::string_view hex) {
  if (hex.size() % 2 != 0) {
    return {};
  }
  std::vector<uint8_t> result;
  result.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto hi = HexCharToNibble(hex[i]);
    auto lo = HexCharToNibble(hex[i + 1]);
    if (!hi.has_value() || !lo.has_value()) {
      return {};
    }
    result.push_back(static_cast<uint8_t>((*hi << 4) | *lo));
  }
  return result;
}

std::string AsciiFrame::Encode(uint8_t unit_id, Pdu const &pdu) {
  std::vector<uint8_t> body;
  body.reserve(1 + pdu.Size() + 1);
  body.push_back(unit_id);
  body.push_back(pdu.function_code);
  body.insert(body.end(), pdu.payload.begin(), pdu.payload.end());
  body.push_back(CalculateLrc8(body));

  std::string frame;
  frame.reserve(1 + body.size() * 2 + 2);  // ':' + hex + CRLF
  frame += kStartByte;
  frame += BytesToHex(body);
  frame += kCr;
  frame += kLf;
  return frame;
}

Adu AsciiFrame::Decode(std::string_view frame) {
  if (frame.empty() || frame.front() != kStartByte) {
    throw InvalidResponseError("ASCII frame does not start with ':'");
  }
  if (frame.size() < 3 || frame[frame.size() - 2] != kCr || frame.back() != kLf) {
    throw InvalidResponseError("ASCII frame does not end with CRLF");
  }

  std::string_view hex = frame.substr(1, frame.size() - 3);
  if (hex.size() % 2 != 0) {
    throw InvalidResponseError("ASCII frame has an odd number of hex digits");
  }
  auto body = HexToBytes(hex);
  if (!body.has_value()) {
    throw InvalidResponseError("ASCII frame contains a non-hex character");
  }
  if (body->size() < kMinDecodedSize) {
    throw InvalidResponseError("ASCII frame too short: " + std::to_string(body->size()) + " bytes");
  }
  if (!VerifyLrc8(*body)) {
    throw CrcError("ASCII LRC mismatch");
  }

  Adu adu;
  adu.unit_id = (*body)[0];
  adu.pdu.function_code = (*body)[1];
  adu.pdu.payload.assign(body->begin() + 2, body->end() - 1);
  return adu;
}

size_t AsciiFrame::BytesNeeded(std::span<uint8_t const> prefix) {
  if (prefix.size() > kMaxFrameLength) {
    throw InvalidResponseError("ASCII frame exceeds " + std::to_string(kMaxFrameLength) + " characters");
  }
  if (!prefix.empty() && prefix.back() == static_cast<uint8_t>(kLf)) {
    return 0;
  }
  return 1;
}

}  // namespace mblink
