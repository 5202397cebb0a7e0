#include "supervisor.hpp"
#include "csv_logger.hpp"
#include "display.hpp"
#include "stream_fetcher.hpp"
#include "telemetry_store.hpp"

#include <exception>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

// Everything bound to one connection. Destruction order matters: the
// destructor stops and joins every task first, so no thread can touch the
// store (or the source) after they are released.
struct Supervisor::Session {
  std::shared_ptr<TelemetrySource> source;
  TelemetryStore store;
  StopSignal stop;

  std::vector<std::unique_ptr<Fetcher>> fetchers;
  std::unique_ptr<Display> display;
  std::unique_ptr<csv_logger::CsvLogger> csv;

  std::vector<std::thread> threads;

  ~Session() {
    stop.request_stop();
    for (std::thread& t : threads) { if (t.joinable()) t.join(); }
  }
};

// Stop only; caller must join the owning std::thread before destroying this object.
Supervisor::~Supervisor() {
  request_stop();
}

bool Supervisor::read_latest(TelemetryRecord& out) const {
  std::lock_guard<std::mutex> lk(session_mtx_);
  if (!session_) return false;
  session_->store.read_latest(out);
  return true;
}

std::string Supervisor::log_path() const {
  std::lock_guard<std::mutex> lk(session_mtx_);
  return log_path_;
}

void Supervisor::publish_(Session* s, const std::string& log_path) {
  std::lock_guard<std::mutex> lk(session_mtx_);
  session_ = s;
  if (s) log_path_ = log_path;
}

void Supervisor::run() {
  while (!stop_.stop_requested()) {
    try {
      run_session_();
    }
    catch (const std::exception& e) {
      errors_.record(std::string("Main connection error: ") + e.what());
      std::fprintf(stderr, "[SUPERVISOR] session failed: %s\n", e.what()); std::fflush(stderr);
    }
    catch (...) {
      errors_.record("Main connection error: unknown error");
      std::fprintf(stderr, "[SUPERVISOR] session failed: unknown error\n"); std::fflush(stderr);
    }

    if (stop_.stop_requested()) break;
    state_.store(SupervisorState::BACKOFF, std::memory_order_release);
    stop_.sleep_for(cfg_.session_retry_delay);
  }

  state_.store(SupervisorState::STOPPED, std::memory_order_release);
}

void Supervisor::run_session_() {
  state_.store(SupervisorState::CONNECTING, std::memory_order_release);
  attempt_count_.fetch_add(1, std::memory_order_acq_rel);

  // --- 1. Open the link ---
  std::fprintf(stdout, "[SUPERVISOR] Connecting to drone... (%s)\n", cfg_.connection_url.c_str()); std::fflush(stdout);
  std::shared_ptr<TelemetrySource> source = connector_.connect(cfg_.connection_url);
  if (!source) throw std::runtime_error("connector returned no telemetry source");

  // --- 2. Wait for is_connected (no timeout) ---
  StreamPtr<bool> conn = source->subscribe_connection_state();
  if (!conn) throw std::runtime_error("connection state unavailable");

  bool connected = false;
  while (!connected) {
    if (!conn->next(connected, stop_)) {
      if (stop_.stop_requested()) return;
      throw std::runtime_error("connection state stream ended");
    }
  }
  std::fprintf(stdout, "[SUPERVISOR] Drone connected!\n"); std::fflush(stdout);

  // --- 3. Launch fetchers + consumers on a fresh store ---
  std::unique_ptr<Session> session = std::make_unique<Session>();
  session->source = source;

  const std::string path = csv_logger::make_log_path(cfg_.log_dir, std::chrono::system_clock::now());

  session->fetchers = make_fetchers(source, session->store, errors_, session->stop, cfg_.fetch_retry_delay);
  if (cfg_.display_out) {
    session->display = std::make_unique<Display>(session->store, errors_, session->stop, cfg_.display_out, cfg_.display_dt);
  }
  if (cfg_.enable_csv) {
    session->csv = std::make_unique<csv_logger::CsvLogger>(session->store, errors_, session->stop, path, cfg_.csv_dt);
  }

  session->threads.reserve(session->fetchers.size() + 2);
  for (std::unique_ptr<Fetcher>& f : session->fetchers) session->threads.emplace_back(&Fetcher::run, f.get());
  if (session->display) session->threads.emplace_back(&Display::run, session->display.get());
  if (session->csv) session->threads.emplace_back(&csv_logger::CsvLogger::run, session->csv.get());

  // Unpublished before `session` is destroyed (reverse declaration order).
  struct Unpublish {
    Supervisor& self;
    ~Unpublish() { self.publish_(nullptr, std::string()); }
  } unpublish{*this};
  publish_(session.get(), path);

  session_count_.fetch_add(1, std::memory_order_acq_rel);
  state_.store(SupervisorState::RUNNING, std::memory_order_release);

  // --- 4. Await: only a failure of the link itself ends the session ---
  bool link_up = true;
  while (conn->next(connected, stop_)) {
    if (connected != link_up) {
      link_up = connected;
      std::fprintf(stdout, "[SUPERVISOR] link %s\n", link_up ? "restored" : "lost"); std::fflush(stdout);
    }
  }
  if (stop_.stop_requested()) return;
  throw std::runtime_error("connection state stream ended");
}
