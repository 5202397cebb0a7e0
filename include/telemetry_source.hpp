#ifndef TELEMETRY_SOURCE_H
#define TELEMETRY_SOURCE_H

#include "stop_signal.hpp"
#include "telemetry_types.hpp"

#include <memory>
#include <stdexcept>
#include <string>

// Raised by a subscription that broke (transport / decode failure).
class StreamError : public std::runtime_error {
public:
  explicit StreamError(const std::string& what) : std::runtime_error(what) {}
};

// Pull side of one infinite update sequence.
template <typename T>
class Stream {
public:
  virtual ~Stream() = default;

  // Blocks until the next item.
  //  true  -> `out` holds a fresh item
  //  false -> stop was requested, or the sequence ended
  // Throws StreamError when the subscription fails.
  virtual bool next(T& out, const StopSignal& stop) = 0;
};

template <typename T>
using StreamPtr = std::unique_ptr<Stream<T>>;

/*
    TelemetrySource

    One connected vehicle. Every subscribe_*() call opens a new, independent
    sequence; dropping the returned stream releases the subscription.
    subscribe_*() may throw if the subscription cannot be opened.
*/
class TelemetrySource {
public:
  virtual ~TelemetrySource() = default;

  virtual StreamPtr<bool> subscribe_connection_state() = 0;

  virtual StreamPtr<PositionUpdate>   subscribe_position() = 0;
  virtual StreamPtr<AttitudeUpdate>   subscribe_attitude() = 0;
  virtual StreamPtr<BatteryUpdate>    subscribe_battery() = 0;
  virtual StreamPtr<GpsUpdate>        subscribe_gps() = 0;
  virtual StreamPtr<FlightModeUpdate> subscribe_flight_mode() = 0;
  virtual StreamPtr<ArmedUpdate>      subscribe_armed() = 0;
  virtual StreamPtr<RcStatusUpdate>   subscribe_rc_status() = 0;
  virtual StreamPtr<HealthUpdate>     subscribe_health() = 0;
};

// Opens the vehicle link. Throws std::runtime_error when the link cannot be set up.
class Connector {
public:
  virtual ~Connector() = default;

  virtual std::shared_ptr<TelemetrySource> connect(const std::string& url) = 0;
};

#endif // TELEMETRY_SOURCE_H
