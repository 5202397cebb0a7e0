#ifndef SUPERVISOR_H
#define SUPERVISOR_H

#include "error_log.hpp"
#include "params.hpp"
#include "stop_signal.hpp"
#include "telemetry_source.hpp"
#include "telemetry_types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>

enum class SupervisorState : uint8_t {
  IDLE       = 0, // run() not entered
  CONNECTING = 1, // opening the link / waiting for is_connected
  RUNNING    = 2, // fetchers + consumers live
  BACKOFF    = 3, // session failed, waiting before the next attempt
  STOPPED    = 4, // run() returned
};

struct SupervisorConfig {
  std::string connection_url = param::CONNECTION_URL;
  std::string log_dir        = param::LOG_DIR;

  std::chrono::steady_clock::duration fetch_retry_delay   = param::FETCH_RETRY_DELAY;
  std::chrono::steady_clock::duration session_retry_delay = param::SESSION_RETRY_DELAY;
  std::chrono::steady_clock::duration display_dt          = param::DISPLAY_DT;
  std::chrono::steady_clock::duration csv_dt              = param::CSV_DT;

  std::FILE* display_out = stdout; // nullptr: no display consumer
  bool enable_csv = true;
};

/*
    Supervisor

    One session:
      1. connector.connect(url)
      2. wait (unbounded) for is_connected == true
      3. fresh TelemetryStore; 8 fetcher threads + display + csv threads
      4. keep draining the connection-state stream; a failure of that stream
         is session-fatal
    Any exception in 1-4: recorded as "Main connection error: ...", the session
    is torn down (stop + join, then the store is dropped), and after
    session_retry_delay the protocol starts again from 1. No attempt limit.
*/
class Supervisor {
public:
  Supervisor(Connector& connector, ErrorLog& errors, const SupervisorConfig& cfg = SupervisorConfig{})
  : connector_(connector), errors_(errors), cfg_(cfg) {}
  ~Supervisor(); // stop only; caller must join

  Supervisor(const Supervisor&) = delete;
  Supervisor& operator=(const Supervisor&) = delete;

  void run();          // Thread entry; returns after request_stop()
  void request_stop() { stop_.request_stop(); }

  SupervisorState state() const { return state_.load(std::memory_order_acquire); }
  uint64_t attempt_count() const { return attempt_count_.load(std::memory_order_acquire); } // connect() calls
  uint64_t session_count() const { return session_count_.load(std::memory_order_acquire); } // sessions that went RUNNING

  // Snapshot of the running session's store; false when no session is running.
  bool read_latest(TelemetryRecord& out) const;
  std::string log_path() const;

private:
  struct Session;

  void run_session_();
  void publish_(Session* s, const std::string& log_path);

  Connector& connector_;
  ErrorLog& errors_;
  const SupervisorConfig cfg_;

  StopSignal stop_;

  std::atomic<SupervisorState> state_{SupervisorState::IDLE};
  std::atomic<uint64_t> attempt_count_{0};
  std::atomic<uint64_t> session_count_{0};

  mutable std::mutex session_mtx_;
  Session* session_ = nullptr; // non-null only while RUNNING
  std::string log_path_;
};

#endif // SUPERVISOR_H
