#ifndef TELEMETRY_STORE_H
#define TELEMETRY_STORE_H

#include "telemetry_types.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

// Latest known vehicle state. Fetchers write disjoint field subsets (one
// writer per category); consumers copy the whole record out with read_latest().
// Writers and readers run on separate threads, so the record is guarded by a
// whole-record lock: a reader never sees a half-written field, but may see
// fields from different (racing) category updates.
class TelemetryStore {
public:
  TelemetryStore() = default;

  TelemetryStore(const TelemetryStore&) = delete;
  TelemetryStore& operator=(const TelemetryStore&) = delete;

  // --- Producer helpers (one per category, each bumps its update counter) ---
  void write_position(double lat, double lon, float rel_alt, float abs_alt);
  void write_attitude(float roll, float pitch, float yaw);
  void write_battery(float voltage, float remaining);
  void write_gps(const std::string& fix_label, int32_t satellites);
  void write_flight_mode(const std::string& mode_label);
  void write_armed(bool armed);
  void write_rc_signal(std::optional<float> strength);
  void write_health(const HealthChecklist& health); // replaces all 7 checks

  // --- Consumer helpers ---
  void read_latest(TelemetryRecord& out) const;
  TelemetryRecord snapshot() const;

  uint64_t update_count(Category c) const { return seq_[static_cast<std::size_t>(c)].load(std::memory_order_acquire); }

private:
  void bump_(Category c) { seq_[static_cast<std::size_t>(c)].fetch_add(1, std::memory_order_acq_rel); }

  mutable std::mutex mtx_;
  TelemetryRecord rec_{};

  // Per-category monotonic counters
  std::array<std::atomic<uint64_t>, CATEGORY_NUM> seq_{};
};

#endif // TELEMETRY_STORE_H
