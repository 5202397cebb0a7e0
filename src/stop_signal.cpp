#include "stop_signal.hpp"

void StopSignal::request_stop() {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    stop_.store(true, std::memory_order_release);
  }
  cv_.notify_all();
}

bool StopSignal::sleep_for(std::chrono::steady_clock::duration d) const {
  return sleep_until(std::chrono::steady_clock::now() + d);
}

bool StopSignal::sleep_until(std::chrono::steady_clock::time_point deadline) const {
  std::unique_lock<std::mutex> lk(mtx_);
  cv_.wait_until(lk, deadline, [&]{ return stop_.load(std::memory_order_acquire); });
  return !stop_.load(std::memory_order_acquire);
}
