#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

// Shared cancellation flag. Workers poll it at chunk and retry boundaries and
// sleep through it so a cancel interrupts backoff immediately.
class CancelToken {
public:
  void cancel() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      cancelled_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
  }

  bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

  // Returns true if cancelled before the delay elapsed.
  template<typename Rep, typename Period>
  bool wait_for(std::chrono::duration<Rep, Period> delay) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, delay, [this]{ return cancelled(); });
  }

  void reset() { cancelled_.store(false, std::memory_order_release); }

private:
  std::atomic<bool> cancelled_{false};
  std::mutex mutex_;
  std::condition_variable cv_;
};
