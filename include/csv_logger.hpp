#ifndef CSV_LOGGER_H
#define CSV_LOGGER_H

#include "error_log.hpp"
#include "params.hpp"
#include "stop_signal.hpp"
#include "telemetry_store.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace csv_logger {

// -----------------------------
// Row layout (fixed column set)
// - Column order is the file format; append only.
// - `speed` has no producer yet and is always written as 0.
// -----------------------------
static constexpr std::size_t k_Cols = 23;

static constexpr std::array<const char*, k_Cols> k_Header = {
  "timestamp",
  "lat", "lon", "alt", "abs_alt", "speed",
  "roll", "pitch", "yaw",
  "voltage", "battery",
  "gps_fix", "satellites", "flight_mode", "armed", "rc_signal",
  "health_accelerometer_calibration",
  "health_armable",
  "health_global_position",
  "health_gyrometer_calibration",
  "health_home_position",
  "health_local_position",
  "health_magnetometer_calibration",
};

// Unavailable values are written as this literal.
static constexpr const char* k_Missing = "0";

// Flatten one snapshot. Every unavailable field becomes k_Missing.
std::vector<std::string> make_row(const TelemetryRecord& rec, const std::string& timestamp);

// Comma-joined line without the trailing newline.
std::string join(const std::vector<std::string>& cols);
std::string header_line();

// "<dir>/telemetry_log_YYYYmmdd_HHMMSS.csv"
std::string make_log_path(const std::string& dir, const std::chrono::system_clock::time_point& session_start);

// -----------------------------
// Writer (append-only, one row per tick)
// - The file is reopened for every row; a tick that fails leaves the
//   next one unaffected.
// -----------------------------
class CsvLogger {
public:
  CsvLogger(const TelemetryStore& store, ErrorLog& errors, const StopSignal& stop,
            const std::string& path, std::chrono::steady_clock::duration dt = param::CSV_DT)
  : store_(store), errors_(errors), stop_(stop), path_(path), dt_(dt) {}

  CsvLogger(const CsvLogger&) = delete;
  CsvLogger& operator=(const CsvLogger&) = delete;

  void run(); // Thread entry; returns once the stop signal is raised

  // Append one row; writes the header first if the file is missing or empty.
  // Throws std::runtime_error on any I/O failure.
  void push(const TelemetryRecord& rec, const std::chrono::system_clock::time_point& stamp);

  const std::string& path() const { return path_; }
  uint64_t write_count() const { return write_count_.load(std::memory_order_relaxed); }

private:
  const TelemetryStore& store_;
  ErrorLog& errors_;
  const StopSignal& stop_;
  const std::string path_;
  const std::chrono::steady_clock::duration dt_;

  std::atomic<uint64_t> write_count_{0};
};

} // namespace csv_logger

#endif // CSV_LOGGER_H
