#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <cstddef>
#include <deque>
#include <memory>
#include <utility>
#include "async_byte_stream.hpp"

namespace mblink {

/**
 * @brief Single-slot lock for coroutines on one executor
 *
 * Waiters are granted the lock strictly in the order they called ScopedLock(). The
 * lock is handed over directly on unlock, so a newcomer can never overtake a waiter.
 * Not thread-safe: every user must run on the same single-threaded executor.
 */
class AsyncMutex {
 public:
  class Guard {
   public:
    explicit Guard(AsyncMutex *mutex)
        : mutex_(mutex) {}
    Guard(Guard &&other) noexcept
        : mutex_(other.mutex_) {
      other.mutex_ = nullptr;
    }
    Guard &operator=(Guard &&) = delete;
    Guard(Guard const &) = delete;
    Guard &operator=(Guard const &) = delete;

    ~Guard() {
      if (mutex_ != nullptr) {
        mutex_->Unlock();
      }
    }

   private:
    AsyncMutex *mutex_;
  };

  explicit AsyncMutex(asio::any_io_executor executor)
      : executor_(std::move(executor)) {}

  /**
   * @brief Suspend until the lock is ours; it is released when the guard is destroyed
   */
  asio::awaitable<Guard> ScopedLock();

  [[nodiscard]] bool IsLocked() const { return locked_; }
  [[nodiscard]] size_t WaiterCount() const { return waiters_.size(); }

 private:
  void Unlock();

  asio::any_io_executor executor_;
  bool locked_{false};
  std::deque<std::shared_ptr<asio::steady_timer>> waiters_;
};

}  // namespace mblink
