#include <utility>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>
#include <memory>
#include "async/async_mutex.hpp"

namespace mblink {

asio::awaitable<AsyncMutex::Guard> AsyncMutex::ScopedLock() {
  if (!locked_) {
    locked_ = true;
    co_return Guard(this);
  }

  // Parked on a timer that never expires; Unlock() cancels it to hand over the lock
  auto waiter = std::make_shared<asio::steady_timer>(executor_, asio::steady_timer::time_point::max());
  waiters_.push_back(waiter);
  boost::system::error_code error;
  co_await waiter->async_wait(asio::redirect_error(asio::use_awaitable, error));
  co_return Guard(this);
}

void AsyncMutex::Unlock() {
  if (waiters_.empty()) {
    locked_ = false;
    return;
  }
  // Ownership passes to the oldest waiter; locked_ stays set
  std::shared_ptr<asio::steady_timer> next = waiters_.front();
  waiters_.pop_front();
  next->cancel();
}

}  // namespace mblink
