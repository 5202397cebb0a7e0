#ifndef TELEMETRY_TYPES_H
#define TELEMETRY_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

/* Telemetry categories. One fetcher per entry. */
enum class Category : uint8_t {
  POSITION    = 0,
  ATTITUDE    = 1,
  BATTERY     = 2,
  GPS         = 3,
  FLIGHT_MODE = 4,
  ARMED       = 5,
  RC_SIGNAL   = 6,
  HEALTH      = 7,
};

static constexpr std::size_t CATEGORY_NUM = 8;

// Tag used in error log entries ("<tag> fetch error: ...")
const char* category_name(Category c);

// ---------------------------------------------------------------------------
// Source-side update records (one per category)
// ---------------------------------------------------------------------------
struct PositionUpdate {
  double latitude_deg        = 0.0;
  double longitude_deg       = 0.0;
  float  relative_altitude_m = 0.0f;
  float  absolute_altitude_m = 0.0f;
};

struct AttitudeUpdate {
  float roll_deg  = 0.0f;
  float pitch_deg = 0.0f;
  float yaw_deg   = 0.0f;
};

struct BatteryUpdate {
  float voltage_v         = 0.0f;
  float remaining_percent = 0.0f;
};

struct GpsUpdate {
  std::string fix_type;     // protocol enum label, e.g. "FIX_TYPE_FIX_3D"
  int32_t num_satellites = 0;
};

struct FlightModeUpdate {
  std::string mode;         // protocol enum label, e.g. "FLIGHT_MODE_POSCTL"
};

struct ArmedUpdate {
  bool armed = false;
};

struct RcStatusUpdate {
  std::optional<float> signal_strength_percent; // empty when the link does not report it
};

struct HealthUpdate {
  bool is_accelerometer_calibration_ok = false;
  bool is_armable                      = false;
  bool is_global_position_ok           = false;
  bool is_gyrometer_calibration_ok     = false;
  bool is_home_position_ok             = false;
  bool is_local_position_ok            = false;
  bool is_magnetometer_calibration_ok  = false;
};

// ---------------------------------------------------------------------------
// Store-side record
// ---------------------------------------------------------------------------
enum class CheckState : uint8_t {
  UNAVAILABLE = 0,
  OK          = 1,
  FAIL        = 2,
};

enum class HealthCheck : uint8_t {
  ACCELEROMETER_CALIBRATION = 0,
  ARMABLE                   = 1,
  GLOBAL_POSITION           = 2,
  GYROMETER_CALIBRATION     = 3,
  HOME_POSITION             = 4,
  LOCAL_POSITION            = 5,
  MAGNETOMETER_CALIBRATION  = 6,
};

static constexpr std::size_t HEALTH_CHECK_NUM = 7;

const char* health_check_name(HealthCheck h);   // "Accelerometer calibration"
const char* health_check_column(HealthCheck h); // "health_accelerometer_calibration"
const char* check_state_label(CheckState s);    // "OK" / "FAIL" / "N/A"

// Fixed-size by construction: always exactly the 7 checks, in display order.
struct HealthChecklist {
  std::array<CheckState, HEALTH_CHECK_NUM> checks{};

  CheckState get(HealthCheck h) const { return checks[static_cast<std::size_t>(h)]; }
  void set(HealthCheck h, CheckState s) { checks[static_cast<std::size_t>(h)] = s; }

  static HealthChecklist from_update(const HealthUpdate& u);
};

struct TelemetryRecord {
  std::optional<double> lat;          // [deg]
  std::optional<double> lon;          // [deg]
  std::optional<float>  alt;          // relative altitude [m]
  std::optional<float>  abs_alt;      // absolute altitude [m]
  std::optional<float>  speed;        // [m/s] no source writes this yet
  std::optional<float>  roll;         // [deg]
  std::optional<float>  pitch;        // [deg]
  std::optional<float>  yaw;          // [deg]
  std::optional<float>  voltage;      // [V]
  std::optional<float>  battery;      // remaining [%]
  std::optional<std::string> gps_fix; // bare label, e.g. "FIX_3D"
  std::optional<int32_t> satellites;
  std::optional<std::string> flight_mode;
  std::optional<bool>   armed;
  std::optional<float>  rc_signal;    // [%]
  HealthChecklist health{};
};

#endif // TELEMETRY_TYPES_H
