#ifndef DISPLAY_H
#define DISPLAY_H

#include "error_log.hpp"
#include "params.hpp"
#include "stop_signal.hpp"
#include "telemetry_store.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

// Full text frame for one tick: summary fields, the 7 health checks, recent errors.
std::string render_frame(const TelemetryRecord& rec, const std::vector<ErrorEntry>& errors);

// Live terminal view. Owns no data; reads the store and the error log each tick.
class Display {
public:
  Display(const TelemetryStore& store, ErrorLog& errors, const StopSignal& stop,
          std::FILE* out = stdout, std::chrono::steady_clock::duration dt = param::DISPLAY_DT)
  : store_(store), errors_(errors), stop_(stop), out_(out), dt_(dt) {}

  Display(const Display&) = delete;
  Display& operator=(const Display&) = delete;

  void run(); // Thread entry; returns once the stop signal is raised

  // One refresh. Throws std::runtime_error if the frame cannot be written.
  void draw();

  uint64_t get_frame_count() const { return frame_count_.load(std::memory_order_relaxed); }

private:
  const TelemetryStore& store_;
  ErrorLog& errors_;
  const StopSignal& stop_;
  std::FILE* out_;
  const std::chrono::steady_clock::duration dt_;

  std::atomic<uint64_t> frame_count_{0};
};

#endif // DISPLAY_H
