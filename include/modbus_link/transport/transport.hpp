#pragma once

#include <cstdint>
#include <optional>
#include "../pdu/pdu.hpp"

namespace mblink {

/**
 * @brief Blocking request/response channel for one binding (RTU, ASCII or TCP)
 *
 * Implementations serialize concurrent Exchange() calls with a mutex that is held for
 * the whole write and read, so frames from different callers never interleave.
 */
class Transport {
 public:
  virtual ~Transport() = default;

  /**
   * @throws ConnectionError if the underlying channel cannot be opened
   */
  virtual void Open() = 0;
  virtual void Close() = 0;
  [[nodiscard]] virtual bool IsOpen() const = 0;

  /**
   * @brief Send one request PDU to @p unit_id and return the response PDU
   *
   * Single attempt, no retry. Exception responses are returned as PDUs; the client
   * engine turns them into ModbusException.
   *
   * @return Response PDU, or std::nullopt for a broadcast write on a serial line
   * @throws InvalidArgumentError for an invalid unit id or broadcast of a non-write, before any I/O
   * @throws ConnectionError, TimeoutError, CrcError, InvalidResponseError
   */
  [[nodiscard]] virtual std::optional<Pdu> Exchange(uint8_t unit_id, Pdu const &request) = 0;
};

/**
 * @brief Opens a transport (or stream) for the lifetime of the guard
 *
 *   RtuTransport transport(config);
 *   ScopedOpen guard(transport);
 *   Client client(transport);
 */
template <typename T>
class ScopedOpen {
 public:
  explicit ScopedOpen(T &target)
      : target_(target) {
    target_.Open();
  }

  ~ScopedOpen() { target_.Close(); }

  ScopedOpen(ScopedOpen const &) = delete;
  ScopedOpen &operator=(ScopedOpen const &) = delete;

  T &Get() { return target_; }

 private:
  T &target_;
};

}  // namespace mblink
