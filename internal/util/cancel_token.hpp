#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace rollout::util {

/*
  One-shot cancellation flag shared between a caller and long-running work
  (health checks, backoff sleeps). Once cancelled it stays cancelled.
*/
class CancelToken {
 public:
  void Cancel() {
    {
      std::lock_guard lock(mutex_);
      cancelled_ = true;
    }
    cv_.notify_all();
  }

  bool IsCancelled() const {
    std::lock_guard lock(mutex_);
    return cancelled_;
  }

  // Sleeps up to `timeout`. Returns true if cancelled before or during the wait.
  bool WaitFor(std::chrono::milliseconds timeout) const {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return cancelled_; });
  }

 private:
  mutable std::mutex              mutex_;
  mutable std::condition_variable cv_;
  bool                            cancelled_ = false;
};

} // namespace rollout::util
