#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <vector>
#include "address_table.hpp"

namespace mblink {

enum class BitTable {
  kCoils,
  kDiscreteInputs
};

enum class RegisterTable {
  kHolding,
  kInput
};

static constexpr size_t kDefaultTableSize = 1000;

struct DataStoreSizes {
  size_t coils{kDefaultTableSize};
  size_t discrete_inputs{kDefaultTableSize};
  size_t holding_registers{kDefaultTableSize};
  size_t input_registers{kDefaultTableSize};
};

/**
 * @brief Thread-safe storage for the four Modbus data tables
 *
 * Every table has a fixed capacity chosen at construction. Reads return std::nullopt
 * and writes return false when any part of the range falls outside the table.
 * Discrete inputs and input registers are read-only to Modbus clients but are
 * writable here so the application can publish values.
 */
class DataStore {
 public:
  explicit DataStore(DataStoreSizes sizes = {});

  [[nodiscard]] std::optional<std::vector<bool>> ReadBits(BitTable table, uint16_t start, size_t count) const;
  [[nodiscard]] bool WriteBits(BitTable table, uint16_t start, std::vector<bool> const &values);

  [[nodiscard]] std::optional<std::vector<uint16_t>> ReadRegisters(RegisterTable table, uint16_t start,
                                                                   size_t count) const;
  [[nodiscard]] bool WriteRegisters(RegisterTable table, uint16_t start, std::span<uint16_t const> values);

  [[nodiscard]] size_t Capacity(BitTable table) const;
  [[nodiscard]] size_t Capacity(RegisterTable table) const;

 private:
  AddressTable<bool> &Table(BitTable table);
  AddressTable<bool> const &Table(BitTable table) const;
  AddressTable<uint16_t> &Table(RegisterTable table);
  AddressTable<uint16_t> const &Table(RegisterTable table) const;

  mutable std::mutex mutex_;
  AddressTable<bool> coils_;
  AddressTable<bool> discrete_inputs_;
  AddressTable<uint16_t> holding_registers_;
  AddressTable<uint16_t> input_registers_;
};

}  // namespace mblink
