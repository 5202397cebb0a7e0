#ifndef STOP_SIGNAL_H
#define STOP_SIGNAL_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

// Cooperative cancellation token shared by every loop of a session.
// request_stop() is sticky and wakes all sleepers.
class StopSignal {
public:
  StopSignal() = default;

  StopSignal(const StopSignal&) = delete;
  StopSignal& operator=(const StopSignal&) = delete;

  void request_stop();
  bool stop_requested() const { return stop_.load(std::memory_order_acquire); }

  // Returns false if stop was requested before the delay elapsed.
  bool sleep_for(std::chrono::steady_clock::duration d) const;
  bool sleep_until(std::chrono::steady_clock::time_point deadline) const;

private:
  std::atomic<bool> stop_{false};

  mutable std::mutex mtx_;
  mutable std::condition_variable cv_;
};

#endif // STOP_SIGNAL_H
