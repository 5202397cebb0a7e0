#ifndef MAVSDK_SOURCE_H
#define MAVSDK_SOURCE_H

#include "params.hpp"
#include "telemetry_source.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include <mavsdk/mavsdk.h>
#include <mavsdk/plugins/telemetry/telemetry.h>

// SDK enum -> canonical label ("FIX_TYPE_FIX_3D", "FLIGHT_MODE_POSCTL", ...)
std::string fix_type_label(mavsdk::Telemetry::FixType t);
std::string flight_mode_label(mavsdk::Telemetry::FlightMode m);

/*
    MavsdkSource

    One MAVSDK instance bound to one link. The first system that shows up on
    the link is the vehicle; the Telemetry plugin is created on discovery.
    SDK callbacks only push into per-subscription queues; the fetcher side
    pulls through Stream<T>::next().
*/
class MavsdkSource : public TelemetrySource, public std::enable_shared_from_this<MavsdkSource> {
public:
  // Throws std::runtime_error if the link cannot be added.
  explicit MavsdkSource(const std::string& url);
  ~MavsdkSource() override = default;

  MavsdkSource(const MavsdkSource&) = delete;
  MavsdkSource& operator=(const MavsdkSource&) = delete;

  StreamPtr<bool> subscribe_connection_state() override;

  StreamPtr<PositionUpdate>   subscribe_position() override;
  StreamPtr<AttitudeUpdate>   subscribe_attitude() override;
  StreamPtr<BatteryUpdate>    subscribe_battery() override;
  StreamPtr<GpsUpdate>        subscribe_gps() override;
  StreamPtr<FlightModeUpdate> subscribe_flight_mode() override;
  StreamPtr<ArmedUpdate>      subscribe_armed() override;
  StreamPtr<RcStatusUpdate>   subscribe_rc_status() override;
  StreamPtr<HealthUpdate>     subscribe_health() override;

  // nullptr until a system has been discovered on the link.
  std::shared_ptr<mavsdk::System> system();

private:
  std::shared_ptr<mavsdk::Telemetry> telemetry_(); // throws StreamError before discovery

  std::unique_ptr<mavsdk::Mavsdk> mavsdk_;

  std::mutex mtx_;
  std::shared_ptr<mavsdk::System> system_;
  std::shared_ptr<mavsdk::Telemetry> telemetry_plugin_;
};

class MavsdkConnector : public Connector {
public:
  std::shared_ptr<TelemetrySource> connect(const std::string& url) override;
};

#endif // MAVSDK_SOURCE_H
