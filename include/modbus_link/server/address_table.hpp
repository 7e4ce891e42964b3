#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <vector>

namespace mblink {

/**
 * @brief Fixed-capacity table of values addressed from 0 to capacity - 1
 *
 * Accesses that reach past the capacity fail as a whole and leave the table unchanged.
 * Not synchronized; DataStore guards its tables.
 */
template <typename DataType>
class AddressTable {
 public:
  explicit AddressTable(size_t capacity)
      : data_(capacity, DataType{}) {}

  [[nodiscard]] size_t Capacity() const { return data_.size(); }

  [[nodiscard]] bool Contains(size_t start, size_t count) const {
    return count > 0 && start < data_.size() && count <= data_.size() - start;
  }

  [[nodiscard]] std::optional<std::vector<DataType>> Read(size_t start, size_t count) const {
    if (!Contains(start, count)) {
      return {};
    }
    return std::vector<DataType>(data_.begin() + static_cast<std::ptrdiff_t>(start),
                                 data_.begin() + static_cast<std::ptrdiff_t>(start + count));
  }

  template <typename Range>
  [[nodiscard]] bool Write(size_t start, Range const &values) {
    if (!Contains(start, values.size())) {
      return false;
    }
    std::copy(values.begin(), values.end(), data_.begin() + static_cast<std::ptrdiff_t>(start));
    return true;
  }

 private:
  std::vector<DataType> data_;
};

}  // namespace mblink
