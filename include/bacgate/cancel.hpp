#pragma once
/**
 * @file cancel.hpp
 * @brief Cooperative stop signal shared by the gateway's long-running loops.
 *
 * The receive loop, the poller, the bridge and the MQTT loop each take a
 * CancelToken. request_stop() flips the flag once and wakes every thread
 * parked in wait_for(). Blocking system calls (the UDP receive) need their
 * own wake-up on top of this; see IDatalink::interrupt().
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace bacgate {

class CancelToken {
public:
  CancelToken() = default;
  CancelToken(const CancelToken&) = delete;
  CancelToken& operator=(const CancelToken&) = delete;

  /// Raise the stop flag and wake all waiters. Safe to call more than once.
  void request_stop() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      stopped_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
  }

  bool stop_requested() const { return stopped_.load(std::memory_order_acquire); }

  /**
   * @brief Sleep for @p d unless a stop is requested first.
   * @return true if the stop flag is set (caller should exit its loop).
   */
  template <class Rep, class Period>
  bool wait_for(std::chrono::duration<Rep, Period> d) {
    std::unique_lock<std::mutex> lock(mu_);
    return cv_.wait_for(lock, d, [this] { return stopped_.load(std::memory_order_acquire); });
  }

private:
  std::atomic<bool> stopped_{false};
  std::mutex mu_;
  std::condition_variable cv_;
};

} // namespace bacgate
