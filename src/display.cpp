#include "display.hpp"
#include "utils.hpp"

#include <cerrno>
#include <cstring>
#include <exception>
#include <stdexcept>

static constexpr const char* kNA = "N/A";
static constexpr const char* kClearScreen = "\033[2J\033[H";

static void line(std::string& s, const char* label, const std::string& value, const char* unit = "") {
  char buf[128];
  std::snprintf(buf, sizeof(buf), "%-15s: %s%s\n", label, value.c_str(), unit);
  s += buf;
}

std::string render_frame(const TelemetryRecord& r, const std::vector<ErrorEntry>& errors) {
  std::string s;
  s.reserve(1536);

  s += "========= PX4 MAVSDK Telemetry =========\n";
  line(s, "GPS Fix",     r.gps_fix.value_or(kNA));
  line(s, "Satellites",  r.satellites ? std::to_string(*r.satellites) : std::string(kNA));
  line(s, "Latitude",    format_fixed(r.lat, 6, kNA));
  line(s, "Longitude",   format_fixed(r.lon, 6, kNA));
  line(s, "Rel Alt (m)", format_fixed(r.alt, 2, kNA));
  line(s, "Abs Alt (m)", format_fixed(r.abs_alt, 2, kNA));
  line(s, "Roll",        format_fixed(r.roll, 2, kNA),  r.roll ? "°" : "");
  line(s, "Pitch",       format_fixed(r.pitch, 2, kNA), r.pitch ? "°" : "");
  line(s, "Yaw",         format_fixed(r.yaw, 2, kNA),   r.yaw ? "°" : "");
  line(s, "Voltage",     format_fixed(r.voltage, 2, kNA), r.voltage ? " V" : "");
  line(s, "Battery",     format_fixed(r.battery, 1, kNA), r.battery ? " %" : "");
  line(s, "Flight Mode", r.flight_mode.value_or(kNA));
  line(s, "Armed",       r.armed ? (*r.armed ? "Yes" : "No") : kNA);
  line(s, "RC Signal",   format_fixed(r.rc_signal, 1, kNA));

  s += "\n---------- Pre-Arm Health Check ---------\n";
  for (std::size_t i = 0; i < HEALTH_CHECK_NUM; ++i) {
    const HealthCheck h = static_cast<HealthCheck>(i);
    char buf[96];
    std::snprintf(buf, sizeof(buf), "%-30s: %s\n", health_check_name(h), check_state_label(r.health.get(h)));
    s += buf;
  }

  s += "\n=========== Recent Errors ===========\n";
  if (errors.empty()) {
    s += "No errors recorded\n";
  }
  else {
    for (const ErrorEntry& e : errors) { s += e.to_string(); s += '\n'; }
  }
  s += "=====================================\n";
  return s;
}

void Display::draw() {
  const TelemetryRecord rec = store_.snapshot();
  const std::string frame = render_frame(rec, errors_.recent(param::MAX_ERRORS_DISPLAYED));

  if (!out_) throw std::runtime_error("no output stream");

  std::fputs(kClearScreen, out_);
  std::fputs(frame.c_str(), out_);
  std::fflush(out_);
  if (std::ferror(out_)) {
    std::clearerr(out_);
    throw std::runtime_error(std::string("write failed: ") + std::strerror(errno));
  }

  frame_count_.fetch_add(1, std::memory_order_relaxed);
}

void Display::run() {
  std::chrono::steady_clock::time_point next_tick = std::chrono::steady_clock::now();

  while (!stop_.stop_requested()) {
    try { draw(); }
    catch (const std::exception& e) { errors_.record(std::string("Display loop error: ") + e.what()); }

    next_tick += dt_;
    const std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now();
    if (next_tick < now) next_tick = now; // resync after a stalled tick
    if (!stop_.sleep_until(next_tick)) break;
  }
}
