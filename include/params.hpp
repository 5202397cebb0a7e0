#ifndef PARAMS_H
#define PARAMS_H

#include <chrono>
#include <cstddef>

/* ALL TUNABLE & CONFIGUABLE PARAMETERS ARE HERE */

namespace param {

// ===== Vehicle link =====
static constexpr const char* CONNECTION_URL = "serial:///dev/ttyUSB0:57600"; // PX4 telemetry radio
// static constexpr const char* CONNECTION_URL = "udp://:14540";             // SITL

// ===== Retry delays =====
static constexpr std::chrono::steady_clock::duration FETCH_RETRY_DELAY   = std::chrono::seconds(1); // per-fetcher resubscribe
static constexpr std::chrono::steady_clock::duration SESSION_RETRY_DELAY = std::chrono::seconds(5); // whole-session restart

// ===== Consumer ticks =====
static constexpr std::chrono::steady_clock::duration DISPLAY_DT = std::chrono::seconds(1);
static constexpr std::chrono::steady_clock::duration CSV_DT     = std::chrono::seconds(1);

// ===== Streams =====
static constexpr std::chrono::steady_clock::duration STREAM_POLL_DT = std::chrono::milliseconds(20); // stop-request granularity
static constexpr std::size_t STREAM_QUEUE_CAP = 64; // oldest item dropped beyond this
static constexpr std::chrono::steady_clock::duration LINK_POLL_DT = std::chrono::milliseconds(100); // is_connected sampling

// ===== Error log =====
static constexpr std::size_t MAX_ERRORS_DISPLAYED = 5;

// ===== CSV log =====
static constexpr const char* LOG_DIR         = "flight_logs";
static constexpr const char* LOG_FILE_PREFIX = "telemetry_log_";

// ===== Enum label prefixes (stripped before storing) =====
static constexpr const char* FIX_TYPE_PREFIX    = "FIX_TYPE_";
static constexpr const char* FLIGHT_MODE_PREFIX = "FLIGHT_MODE_";

} // namespace param

#endif // PARAMS_H
