#ifndef UTILS_H
#define UTILS_H

#include <chrono>
#include <cstdio>
#include <ctime>
#include <optional>
#include <string>
#include <string_view>

// --------- [ Time ] ---------
static inline std::tm to_local_tm(const std::chrono::system_clock::time_point& tp) {
  const std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  localtime_r(&t, &tm);
  return tm;
}

// "14:03:27"
static inline std::string format_clock(const std::chrono::system_clock::time_point& tp) {
  const std::tm tm = to_local_tm(tp);
  char buf[16];
  std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
  return buf;
}

// "20261017_140327" (log file stamp)
static inline std::string format_file_stamp(const std::chrono::system_clock::time_point& tp) {
  const std::tm tm = to_local_tm(tp);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
  return buf;
}

// "2026-10-17T14:03:27.123456" (local time, microseconds)
static inline std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
  const std::tm tm = to_local_tm(tp);
  const auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count() % 1000000;

  char date[32];
  std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm);
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%s.%06lld", date, static_cast<long long>(us < 0 ? us + 1000000 : us));
  return buf;
}

// --------- [ Text ] ---------
static inline std::string format_fixed(double v, int digits) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.*f", digits, v);
  return buf;
}

// Unavailable fields render as `missing` ("N/A" on screen, "0" in the CSV).
template <typename T>
static inline std::string format_fixed(const std::optional<T>& v, int digits, const char* missing) {
  return v ? format_fixed(static_cast<double>(*v), digits) : std::string(missing);
}

// "FIX_TYPE_FIX_3D" -> "FIX_3D"
static inline std::string strip_prefix(std::string_view label, std::string_view prefix) {
  if (label.substr(0, prefix.size()) == prefix) label.remove_prefix(prefix.size());
  return std::string(label);
}

#endif // UTILS_H
