#include "telemetry_store.hpp"

void TelemetryStore::write_position(double lat, double lon, float rel_alt, float abs_alt) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    rec_.lat = lat;
    rec_.lon = lon;
    rec_.alt = rel_alt;
    rec_.abs_alt = abs_alt;
  }
  bump_(Category::POSITION);
}

void TelemetryStore::write_attitude(float roll, float pitch, float yaw) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    rec_.roll = roll;
    rec_.pitch = pitch;
    rec_.yaw = yaw;
  }
  bump_(Category::ATTITUDE);
}

void TelemetryStore::write_battery(float voltage, float remaining) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    rec_.voltage = voltage;
    rec_.battery = remaining;
  }
  bump_(Category::BATTERY);
}

void TelemetryStore::write_gps(const std::string& fix_label, int32_t satellites) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    rec_.gps_fix = fix_label;
    rec_.satellites = satellites;
  }
  bump_(Category::GPS);
}

void TelemetryStore::write_flight_mode(const std::string& mode_label) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    rec_.flight_mode = mode_label;
  }
  bump_(Category::FLIGHT_MODE);
}

void TelemetryStore::write_armed(bool armed) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    rec_.armed = armed;
  }
  bump_(Category::ARMED);
}

void TelemetryStore::write_rc_signal(std::optional<float> strength) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    rec_.rc_signal = strength;
  }
  bump_(Category::RC_SIGNAL);
}

void TelemetryStore::write_health(const HealthChecklist& health) {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    rec_.health = health;
  }
  bump_(Category::HEALTH);
}

void TelemetryStore::read_latest(TelemetryRecord& out) const {
  std::lock_guard<std::mutex> lk(mtx_);
  out = rec_;
}

TelemetryRecord TelemetryStore::snapshot() const {
  TelemetryRecord out;
  read_latest(out);
  return out;
}
