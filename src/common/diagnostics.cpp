#include <cstdint>
#include <mutex>
#include <span>
#include <string_view>
#include "common/diagnostics.hpp"
#include "common/errors.hpp"

namespace mblink {

namespace {

std::string_view ErrorCodeLabel(ErrorCode code) {
  switch (code) {
    case ErrorCode::kConnection:
      return "connection";
    case ErrorCode::kTimeout:
      return "timeout";
    case ErrorCode::kChecksum:
      return "checksum";
    case ErrorCode::kInvalidResponse:
      return "invalid response";
    case ErrorCode::kModbusException:
      return "modbus exception";
    case ErrorCode::kInvalidArgument:
      return "invalid argument";
  }
  return "error";
}

}  // namespace

void StreamDiagnostics::OnFrameSent(std::string_view channel, std::span<uint8_t const> frame) {
  WriteFrame(channel, "TX", frame);
}

void StreamDiagnostics::OnFrameReceived(std::string_view channel, std::span<uint8_t const> frame) {
  WriteFrame(channel, "RX", frame);
}

void StreamDiagnostics::OnError(std::string_view channel, ModbusError const &error) {
  std::lock_guard lock(mutex_);
  out_ << '[' << channel << "] " << ErrorCodeLabel(error.GetCode()) << ": " << error.what() << '\n';
}

void StreamDiagnostics::OnMessage(std::string_view channel, std::string_view message) {
  std::lock_guard lock(mutex_);
  out_ << '[' << channel << "] " << message << '\n';
}

void StreamDiagnostics::WriteFrame(std::string_view channel, std::string_view direction,
                                   std::span<uint8_t const> frame) {
  static constexpr char kHexChars[] = "0123456789ABCDEF";
  std::lock_guard lock(mutex_);
  out_ << '[' << channel << "] " << direction;
  for (uint8_t byte : frame) {
    out_ << ' ' << kHexChars[byte >> 4] << kHexChars[byte & 0x0F];
  }
  out_ << '\n';
}

}  // namespace mblink
