#include "csv_logger.hpp"
#include "utils.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <exception>
#include <filesystem>
#include <stdexcept>

#include <sys/stat.h>

namespace csv_logger {

static std::string io_error(const char* what, const std::string& path) {
  return std::string("csv_logger: ") + what + " failed: " + path + " (" + std::strerror(errno) + ")";
}

std::vector<std::string> make_row(const TelemetryRecord& r, const std::string& timestamp) {
  std::vector<std::string> cols;
  cols.reserve(k_Cols);

  cols.push_back(timestamp);

  cols.push_back(format_fixed(r.lat, 6, k_Missing));
  cols.push_back(format_fixed(r.lon, 6, k_Missing));
  cols.push_back(format_fixed(r.alt, 2, k_Missing));
  cols.push_back(format_fixed(r.abs_alt, 2, k_Missing));
  cols.push_back(format_fixed(r.speed, 2, k_Missing));

  cols.push_back(format_fixed(r.roll, 2, k_Missing));
  cols.push_back(format_fixed(r.pitch, 2, k_Missing));
  cols.push_back(format_fixed(r.yaw, 2, k_Missing));

  cols.push_back(format_fixed(r.voltage, 2, k_Missing));
  cols.push_back(format_fixed(r.battery, 1, k_Missing));

  cols.push_back(r.gps_fix.value_or(k_Missing));
  cols.push_back(r.satellites ? std::to_string(*r.satellites) : std::string(k_Missing));
  cols.push_back(r.flight_mode.value_or(k_Missing));
  cols.push_back(r.armed ? (*r.armed ? "Yes" : "No") : k_Missing);
  cols.push_back(format_fixed(r.rc_signal, 1, k_Missing));

  for (std::size_t i = 0; i < HEALTH_CHECK_NUM; ++i) {
    const CheckState s = r.health.get(static_cast<HealthCheck>(i));
    cols.push_back(s == CheckState::UNAVAILABLE ? k_Missing : check_state_label(s));
  }

  return cols;
}

std::string join(const std::vector<std::string>& cols) {
  std::string out;
  for (std::size_t i = 0; i < cols.size(); ++i) {
    if (i) out += ',';
    out += cols[i];
  }
  return out;
}

std::string header_line() {
  return join(std::vector<std::string>(k_Header.begin(), k_Header.end()));
}

std::string make_log_path(const std::string& dir, const std::chrono::system_clock::time_point& session_start) {
  std::filesystem::path p(dir.empty() ? std::string(".") : dir);
  p /= std::string(param::LOG_FILE_PREFIX) + format_file_stamp(session_start) + ".csv";
  return p.string();
}

void CsvLogger::push(const TelemetryRecord& rec, const std::chrono::system_clock::time_point& stamp) {
  const std::filesystem::path parent = std::filesystem::path(path_).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent); // throws filesystem_error

  // Header only when the file is new (or was left empty).
  struct stat st{};
  const bool need_header = (::stat(path_.c_str(), &st) != 0) || (st.st_size == 0);

  FILE* fp = std::fopen(path_.c_str(), "a");
  if (!fp) throw std::runtime_error(io_error("fopen()", path_));

  std::string buf;
  if (need_header) { buf += header_line(); buf += '\n'; }
  buf += join(make_row(rec, format_iso8601(stamp)));
  buf += '\n';

  const size_t n = std::fwrite(buf.data(), 1, buf.size(), fp);
  const bool write_ok = (n == buf.size()) && (std::fflush(fp) == 0);
  const bool close_ok = (std::fclose(fp) == 0);
  if (!write_ok || !close_ok) throw std::runtime_error(io_error("write", path_));

  write_count_.fetch_add(1, std::memory_order_relaxed);
}

void CsvLogger::run() {
  std::fprintf(stdout, "[CSV] logging to %s\n", path_.c_str()); std::fflush(stdout);
  std::chrono::steady_clock::time_point next_tick = std::chrono::steady_clock::now();

  while (!stop_.stop_requested()) {
    try { push(store_.snapshot(), std::chrono::system_clock::now()); }
    catch (const std::exception& e) { errors_.record(std::string("CSV write error: ") + e.what()); }

    next_tick += dt_;
    const std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now();
    if (next_tick < now) next_tick = now; // resync after a stalled tick
    if (!stop_.sleep_until(next_tick)) break;
  }
}

} // namespace csv_logger
