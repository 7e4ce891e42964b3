#pragma once

#include <cstdint>
#include "../pdu/pdu.hpp"
#include "data_store.hpp"

namespace mblink {

/**
 * @brief Applies request PDUs to a DataStore and builds the response PDU
 *
 * Shared by every server binding. Checks follow the Modbus order: unsupported
 * function (illegal function), malformed payload or quantity out of protocol limits
 * (illegal data value), range outside the table capacity (illegal data address).
 * Never throws for a bad request; every failure becomes an exception response.
 */
class RequestHandler {
 public:
  explicit RequestHandler(DataStore &store)
      : store_(store) {}

  [[nodiscard]] Pdu Handle(Pdu const &request);

 private:
  Pdu HandleReadBits(BitTable table, Pdu const &request);
  Pdu HandleReadRegisters(RegisterTable table, Pdu const &request);
  Pdu HandleWriteSingleCoil(Pdu const &request);
  Pdu HandleWriteSingleRegister(Pdu const &request);
  Pdu HandleWriteMultipleCoils(Pdu const &request);
  Pdu HandleWriteMultipleRegisters(Pdu const &request);

  DataStore &store_;
};

}  // namespace mblink
