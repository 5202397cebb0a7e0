#ifndef QUEUE_STREAM_H
#define QUEUE_STREAM_H

#include "params.hpp"
#include "telemetry_source.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>

// Bounded hand-off between a push-style producer (SDK callback thread) and a
// fetcher pulling with next(). When full, the oldest item is dropped.
// Queued items are delivered before a close()/fail() takes effect.
template <typename T>
class QueueStream : public Stream<T> {
public:
  explicit QueueStream(std::size_t capacity = param::STREAM_QUEUE_CAP,
                       std::chrono::steady_clock::duration poll_dt = param::STREAM_POLL_DT)
  : capacity_(capacity == 0 ? 1 : capacity), poll_dt_(poll_dt) {}

  void push(const T& item) {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      if (closed_ || failed_) return;
      q_.push_back(item);
      while (q_.size() > capacity_) { q_.pop_front(); ++dropped_; }
    }
    cv_.notify_one();
  }

  // End of sequence (next() returns false once drained).
  void close() {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  // Broken subscription (next() throws StreamError once drained).
  void fail(const std::string& reason) {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      failed_ = true;
      reason_ = reason;
    }
    cv_.notify_all();
  }

  bool next(T& out, const StopSignal& stop) override {
    std::unique_lock<std::mutex> lk(mtx_);
    while (true) {
      if (stop.stop_requested()) return false;

      if (!q_.empty()) {
        out = q_.front();
        q_.pop_front();
        return true;
      }
      if (failed_) throw StreamError(reason_);
      if (closed_) return false;

      // Poll so a stop request is seen even without a notify from this queue.
      cv_.wait_for(lk, poll_dt_, [&]{ return !q_.empty() || failed_ || closed_; });
    }
  }

  std::size_t dropped() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return dropped_;
  }

private:
  const std::size_t capacity_;
  const std::chrono::steady_clock::duration poll_dt_;

  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::deque<T> q_;
  bool closed_ = false;
  bool failed_ = false;
  std::string reason_;
  std::size_t dropped_ = 0;
};

#endif // QUEUE_STREAM_H
