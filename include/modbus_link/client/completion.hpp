#pragma once

#include <functional>
#include <utility>

namespace mblink {

/**
 * @brief Typed completion handler; called once with the result, before the operation returns
 */
template <typename T>
using Completion = std::function<void(T const &)>;

/**
 * @brief Completion handler for write operations
 */
using WriteCompletion = std::function<void()>;

/**
 * @brief Hand @p value to @p on_complete (if set) and return it
 */
template <typename T>
T Complete(T value, Completion<T> const &on_complete) {
  if (on_complete) {
    on_complete(value);
  }
  return value;
}

inline void Complete(WriteCompletion const &on_complete) {
  if (on_complete) {
    on_complete();
  }
}

}  // namespace mblink
