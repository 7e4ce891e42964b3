#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include "exception_code.hpp"

namespace mblink {

/**
 * @brief Closed set of failure categories reported by the library
 */
enum class ErrorCode : uint8_t {
  kConnection,
  kTimeout,
  kChecksum,
  kInvalidResponse,
  kModbusException,
  kInvalidArgument
};

/**
 * @brief Base of every error thrown by transports, codecs and clients
 */
class ModbusError : public std::runtime_error {
 public:
  ModbusError(ErrorCode code, std::string const &what)
      : std::runtime_error(what),
        code_(code) {}

  [[nodiscard]] ErrorCode GetCode() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

/** The channel could not be opened or was lost. The transport must be reopened. */
class ConnectionError : public ModbusError {
 public:
  explicit ConnectionError(std::string const &what)
      : ModbusError(ErrorCode::kConnection, what) {}
};

/** No complete frame arrived before the deadline. */
class TimeoutError : public ModbusError {
 public:
  explicit TimeoutError(std::string const &what)
      : ModbusError(ErrorCode::kTimeout, what) {}
};

/** A structurally complete RTU/ASCII frame failed its CRC16/LRC check. */
class CrcError : public ModbusError {
 public:
  explicit CrcError(std::string const &what)
      : ModbusError(ErrorCode::kChecksum, what) {}
};

/** Malformed framing, unexpected transaction id, unit id or function code. */
class InvalidResponseError : public ModbusError {
 public:
  explicit InvalidResponseError(std::string const &what)
      : ModbusError(ErrorCode::kInvalidResponse, what) {}
};

/** Local validation failure; raised before anything is written to the wire. */
class InvalidArgumentError : public ModbusError {
 public:
  explicit InvalidArgumentError(std::string const &what)
      : ModbusError(ErrorCode::kInvalidArgument, what) {}
};

/**
 * @brief The remote device answered with an exception response
 */
class ModbusException : public ModbusError {
 public:
  ModbusException(uint8_t function_code, ExceptionCode exception_code)
      : ModbusError(ErrorCode::kModbusException, BuildMessage(function_code, exception_code)),
        function_code_(function_code),
        exception_code_(exception_code) {}

  [[nodiscard]] uint8_t GetFunctionCode() const noexcept { return function_code_; }
  [[nodiscard]] ExceptionCode GetExceptionCode() const noexcept { return exception_code_; }

 private:
  static std::string BuildMessage(uint8_t function_code, ExceptionCode exception_code) {
    return "modbus exception 0x" + ToHex(static_cast<uint8_t>(exception_code)) + " (" +
           std::string(ExceptionCodeName(exception_code)) + ") for function 0x" + ToHex(function_code);
  }

  static std::string ToHex(uint8_t value) {
    static constexpr char kHexChars[] = "0123456789ABCDEF";
    return {kHexChars[value >> 4], kHexChars[value & 0x0F]};
  }

  uint8_t function_code_;
  ExceptionCode exception_code_;
};

}  // namespace mblink
