#ifndef STREAM_FETCHER_H
#define STREAM_FETCHER_H

#include "error_log.hpp"
#include "params.hpp"
#include "stop_signal.hpp"
#include "telemetry_source.hpp"
#include "telemetry_store.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

enum class FetcherState : uint8_t {
  IDLE        = 0, // not started
  SUBSCRIBING = 1, // opening the subscription
  CONSUMING   = 2, // applying items to the store
  FAULTED     = 3, // waiting out the retry delay
  STOPPED     = 4, // stop signal seen, run() returned
};

// Type-erased part of a fetcher: lifecycle, stats and failure bookkeeping.
class Fetcher {
public:
  virtual ~Fetcher() = default;

  Fetcher(const Fetcher&) = delete;
  Fetcher& operator=(const Fetcher&) = delete;

  // Thread entry. Loops until the session stop signal is raised; never throws.
  virtual void run() = 0;

  Category category() const { return category_; }
  FetcherState state() const { return state_.load(std::memory_order_acquire); }

  uint64_t subscribe_count() const { return subscribe_count_.load(std::memory_order_acquire); }
  uint64_t failure_count() const { return failure_count_.load(std::memory_order_acquire); }
  uint64_t item_count() const { return item_count_.load(std::memory_order_acquire); }

protected:
  Fetcher(Category c, TelemetryStore& store, ErrorLog& errors, const StopSignal& stop,
          std::chrono::steady_clock::duration retry_delay)
  : category_(c), store_(store), errors_(errors), stop_(stop), retry_delay_(retry_delay) {}

  // Faulted: record "<Category> fetch error: <reason>" then wait out the delay.
  void on_failure_(const std::string& reason);

  void set_state_(FetcherState s) { state_.store(s, std::memory_order_release); }

  const Category category_;
  TelemetryStore& store_;
  ErrorLog& errors_;
  const StopSignal& stop_;
  const std::chrono::steady_clock::duration retry_delay_;

  std::atomic<FetcherState> state_{FetcherState::IDLE};
  std::atomic<uint64_t> subscribe_count_{0};
  std::atomic<uint64_t> failure_count_{0};
  std::atomic<uint64_t> item_count_{0};
};

/*
    StreamFetcher<T>

    Owns one subscription for one category:
      SUBSCRIBING -> CONSUMING -> (item) CONSUMING
                              -> (failure) FAULTED -> (retry_delay) SUBSCRIBING

    Every failure (subscribe throws, next() throws, sequence ends) is caught
    here, recorded once, and never leaves run().
*/
template <typename T>
class StreamFetcher : public Fetcher {
public:
  using SubscribeFn = std::function<StreamPtr<T>()>;
  using ApplyFn = void(*)(const T& item, TelemetryStore& store);

  StreamFetcher(Category c, SubscribeFn subscribe, ApplyFn apply,
                TelemetryStore& store, ErrorLog& errors, const StopSignal& stop,
                std::chrono::steady_clock::duration retry_delay = param::FETCH_RETRY_DELAY)
  : Fetcher(c, store, errors, stop, retry_delay), subscribe_(std::move(subscribe)), apply_(apply) {}

  void run() override {
    while (!stop_.stop_requested()) {
      try {
        set_state_(FetcherState::SUBSCRIBING);
        subscribe_count_.fetch_add(1, std::memory_order_acq_rel);
        StreamPtr<T> stream = subscribe_();
        if (!stream) throw StreamError("subscription unavailable");

        set_state_(FetcherState::CONSUMING);
        T item{};
        while (stream->next(item, stop_)) {
          apply_(item, store_);
          item_count_.fetch_add(1, std::memory_order_acq_rel);
        }
        if (stop_.stop_requested()) break;
        throw StreamError("stream ended");
      }
      catch (const std::exception& e) {
        on_failure_(e.what());
      }
      catch (...) {
        on_failure_("unknown error");
      }
    }
    set_state_(FetcherState::STOPPED);
  }

private:
  SubscribeFn subscribe_;
  ApplyFn apply_;
};

// --------- [ Per-category transforms ] ---------
void apply_position(const PositionUpdate& u, TelemetryStore& store);
void apply_attitude(const AttitudeUpdate& u, TelemetryStore& store);
void apply_battery(const BatteryUpdate& u, TelemetryStore& store);
void apply_gps(const GpsUpdate& u, TelemetryStore& store);             // strips "FIX_TYPE_"
void apply_flight_mode(const FlightModeUpdate& u, TelemetryStore& store); // strips "FLIGHT_MODE_"
void apply_armed(const ArmedUpdate& u, TelemetryStore& store);
void apply_rc_status(const RcStatusUpdate& u, TelemetryStore& store);   // unreadable -> unavailable
void apply_health(const HealthUpdate& u, TelemetryStore& store);       // whole-checklist replace

// All 8 fetchers bound to one source/store, in Category order.
std::vector<std::unique_ptr<Fetcher>> make_fetchers(const std::shared_ptr<TelemetrySource>& source,
                                                    TelemetryStore& store, ErrorLog& errors, const StopSignal& stop,
                                                    std::chrono::steady_clock::duration retry_delay = param::FETCH_RETRY_DELAY);

#endif // STREAM_FETCHER_H
