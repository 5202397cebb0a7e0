#include "telemetry_types.hpp"

const char* category_name(Category c) {
  switch (c) {
    case Category::POSITION:    return "Position";
    case Category::ATTITUDE:    return "Attitude";
    case Category::BATTERY:     return "Battery";
    case Category::GPS:         return "GPS";
    case Category::FLIGHT_MODE: return "Flight mode";
    case Category::ARMED:       return "Armed status";
    case Category::RC_SIGNAL:   return "RC signal";
    case Category::HEALTH:      return "Health check";
  }
  return "Unknown";
}

const char* health_check_name(HealthCheck h) {
  switch (h) {
    case HealthCheck::ACCELEROMETER_CALIBRATION: return "Accelerometer calibration";
    case HealthCheck::ARMABLE:                   return "Armable";
    case HealthCheck::GLOBAL_POSITION:           return "Global position";
    case HealthCheck::GYROMETER_CALIBRATION:     return "Gyrometer calibration";
    case HealthCheck::HOME_POSITION:             return "Home position";
    case HealthCheck::LOCAL_POSITION:            return "Local position";
    case HealthCheck::MAGNETOMETER_CALIBRATION:  return "Magnetometer calibration";
  }
  return "Unknown";
}

const char* health_check_column(HealthCheck h) {
  switch (h) {
    case HealthCheck::ACCELEROMETER_CALIBRATION: return "health_accelerometer_calibration";
    case HealthCheck::ARMABLE:                   return "health_armable";
    case HealthCheck::GLOBAL_POSITION:           return "health_global_position";
    case HealthCheck::GYROMETER_CALIBRATION:     return "health_gyrometer_calibration";
    case HealthCheck::HOME_POSITION:             return "health_home_position";
    case HealthCheck::LOCAL_POSITION:            return "health_local_position";
    case HealthCheck::MAGNETOMETER_CALIBRATION:  return "health_magnetometer_calibration";
  }
  return "health_unknown";
}

const char* check_state_label(CheckState s) {
  switch (s) {
    case CheckState::OK:          return "OK";
    case CheckState::FAIL:        return "FAIL";
    case CheckState::UNAVAILABLE: return "N/A";
  }
  return "N/A";
}

HealthChecklist HealthChecklist::from_update(const HealthUpdate& u) {
  auto ok_fail = [](bool ok) { return ok ? CheckState::OK : CheckState::FAIL; };

  HealthChecklist h;
  h.set(HealthCheck::ACCELEROMETER_CALIBRATION, ok_fail(u.is_accelerometer_calibration_ok));
  h.set(HealthCheck::ARMABLE,                   ok_fail(u.is_armable));
  h.set(HealthCheck::GLOBAL_POSITION,           ok_fail(u.is_global_position_ok));
  h.set(HealthCheck::GYROMETER_CALIBRATION,     ok_fail(u.is_gyrometer_calibration_ok));
  h.set(HealthCheck::HOME_POSITION,             ok_fail(u.is_home_position_ok));
  h.set(HealthCheck::LOCAL_POSITION,            ok_fail(u.is_local_position_ok));
  h.set(HealthCheck::MAGNETOMETER_CALIBRATION,  ok_fail(u.is_magnetometer_calibration_ok));
  return h;
}
