#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <vector>
#include "server/data_store.hpp"

namespace mblink {

DataStore::DataStore(DataStoreSizes sizes)
    : coils_(sizes.coils),
      discrete_inputs_(sizes.discrete_inputs),
      holding_registers_(sizes.holding_registers),
      input_registers_(sizes.input_registers) {}

std::optional<std::vector<bool>> DataStore::ReadBits(BitTable table, uint16_t start, size_t count) const {
  std::lock_guard lock(mutex_);
  return Table(table).Read(start, count);
}

bool DataStore::WriteBits(BitTable table, uint16_t start, std::vector<bool> const &values) {
  std::lock_guard lock(mutex_);
  return Table(table).Write(start, values);
}

std::optional<std::vector<uint16_t>> DataStore::ReadRegisters(RegisterTable table, uint16_t start,
                                                              size_t count) const {
  std::lock_guard lock(mutex_);
  return Table(table).Read(start, count);
}

bool DataStore::WriteRegisters(RegisterTable table, uint16_t start, std::span<uint16_t const> values) {
  std::lock_guard lock(mutex_);
  return Table(table).Write(start, values);
}

size_t DataStore::Capacity(BitTable table) const {
  return Table(table).Capacity();
}

size_t DataStore::Capacity(RegisterTable table) const {
  return Table(table).Capacity();
}

AddressTable<bool> &DataStore::Table(BitTable table) {
  return table == BitTable::kCoils ? coils_ : discrete_inputs_;
}

AddressTable<bool> const &DataStore::Table(BitTable table) const {
  return table == BitTable::kCoils ? coils_ : discrete_inputs_;
}

AddressTable<uint16_t> &DataStore::Table(RegisterTable table) {
  return table == RegisterTable::kHolding ? holding_registers_ : input_registers_;
}

AddressTable<uint16_t> const &DataStore::Table(RegisterTable table) const {
  return table == RegisterTable::kHolding ? holding_registers_ : input_registers_;
}

}  // namespace mblink
