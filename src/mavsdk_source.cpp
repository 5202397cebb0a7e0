#include "mavsdk_source.hpp"
#include "queue_stream.hpp"

#include <cmath>
#include <cstdio>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

// Queue-backed stream that releases its SDK subscription on destruction.
template <typename T>
class SdkStream : public Stream<T> {
public:
  SdkStream(std::shared_ptr<QueueStream<T>> queue, std::function<void()> release)
  : queue_(std::move(queue)), release_(std::move(release)) {}

  ~SdkStream() override {
    if (release_) release_();
  }

  bool next(T& out, const StopSignal& stop) override { return queue_->next(out, stop); }

private:
  std::shared_ptr<QueueStream<T>> queue_;
  std::function<void()> release_;
};

// Emits the link state on every change; the first value once a system exists.
class ConnectionStateStream : public Stream<bool> {
public:
  explicit ConnectionStateStream(std::shared_ptr<MavsdkSource> src) : src_(std::move(src)) {}

  bool next(bool& out, const StopSignal& stop) override {
    while (!stop.stop_requested()) {
      std::shared_ptr<mavsdk::System> sys = src_->system();
      if (sys) {
        const bool c = sys->is_connected();
        if (!have_last_ || c != last_) {
          have_last_ = true;
          last_ = c;
          out = c;
          return true;
        }
      }
      if (!stop.sleep_for(param::LINK_POLL_DT)) break;
    }
    return false;
  }

private:
  std::shared_ptr<MavsdkSource> src_;
  bool have_last_ = false;
  bool last_ = false;
};

} // namespace

std::string fix_type_label(mavsdk::Telemetry::FixType t) {
  using F = mavsdk::Telemetry::FixType;
  switch (t) {
    case F::NoGps:    return "FIX_TYPE_NO_GPS";
    case F::NoFix:    return "FIX_TYPE_NO_FIX";
    case F::Fix2D:    return "FIX_TYPE_FIX_2D";
    case F::Fix3D:    return "FIX_TYPE_FIX_3D";
    case F::FixDgps:  return "FIX_TYPE_FIX_DGPS";
    case F::RtkFloat: return "FIX_TYPE_RTK_FLOAT";
    case F::RtkFixed: return "FIX_TYPE_RTK_FIXED";
    default:          return "FIX_TYPE_UNKNOWN";
  }
}

std::string flight_mode_label(mavsdk::Telemetry::FlightMode m) {
  using M = mavsdk::Telemetry::FlightMode;
  switch (m) {
    case M::Ready:          return "FLIGHT_MODE_READY";
    case M::Takeoff:        return "FLIGHT_MODE_TAKEOFF";
    case M::Hold:           return "FLIGHT_MODE_HOLD";
    case M::Mission:        return "FLIGHT_MODE_MISSION";
    case M::ReturnToLaunch: return "FLIGHT_MODE_RETURN_TO_LAUNCH";
    case M::Land:           return "FLIGHT_MODE_LAND";
    case M::Offboard:       return "FLIGHT_MODE_OFFBOARD";
    case M::FollowMe:       return "FLIGHT_MODE_FOLLOW_ME";
    case M::Manual:         return "FLIGHT_MODE_MANUAL";
    case M::Altctl:         return "FLIGHT_MODE_ALTCTL";
    case M::Posctl:         return "FLIGHT_MODE_POSCTL";
    case M::Acro:           return "FLIGHT_MODE_ACRO";
    case M::Stabilized:     return "FLIGHT_MODE_STABILIZED";
    case M::Rattitude:      return "FLIGHT_MODE_RATTITUDE";
    default:                return "FLIGHT_MODE_UNKNOWN";
  }
}

MavsdkSource::MavsdkSource(const std::string& url) {
  mavsdk::Mavsdk::Configuration cfg(mavsdk::Mavsdk::ComponentType::GroundStation);
  mavsdk_ = std::make_unique<mavsdk::Mavsdk>(cfg);

  const mavsdk::ConnectionResult res = mavsdk_->add_any_connection(url);
  if (res != mavsdk::ConnectionResult::Success) {
    throw std::runtime_error("add_any_connection(" + url + ") failed with code " +
                             std::to_string(static_cast<int>(res)));
  }
}

std::shared_ptr<mavsdk::System> MavsdkSource::system() {
  std::lock_guard<std::mutex> lk(mtx_);
  if (!system_) {
    const std::vector<std::shared_ptr<mavsdk::System>> systems = mavsdk_->systems();
    if (!systems.empty()) {
      system_ = systems.front();
      telemetry_plugin_ = std::make_shared<mavsdk::Telemetry>(system_);
      std::fprintf(stdout, "[MAVSDK] system discovered (%zu on link)\n", systems.size()); std::fflush(stdout);
    }
  }
  return system_;
}

std::shared_ptr<mavsdk::Telemetry> MavsdkSource::telemetry_() {
  system();
  std::lock_guard<std::mutex> lk(mtx_);
  if (!telemetry_plugin_) throw StreamError("no system discovered on link");
  return telemetry_plugin_;
}

StreamPtr<bool> MavsdkSource::subscribe_connection_state() {
  return std::make_unique<ConnectionStateStream>(shared_from_this());
}

StreamPtr<PositionUpdate> MavsdkSource::subscribe_position() {
  auto tel = telemetry_();
  auto q = std::make_shared<QueueStream<PositionUpdate>>();
  std::weak_ptr<QueueStream<PositionUpdate>> wq = q;

  auto h = tel->subscribe_position([wq](mavsdk::Telemetry::Position p) {
    if (auto sq = wq.lock()) {
      sq->push(PositionUpdate{p.latitude_deg, p.longitude_deg, p.relative_altitude_m, p.absolute_altitude_m});
    }
  });
  return std::make_unique<SdkStream<PositionUpdate>>(q, [tel, h]{ tel->unsubscribe_position(h); });
}

StreamPtr<AttitudeUpdate> MavsdkSource::subscribe_attitude() {
  auto tel = telemetry_();
  auto q = std::make_shared<QueueStream<AttitudeUpdate>>();
  std::weak_ptr<QueueStream<AttitudeUpdate>> wq = q;

  auto h = tel->subscribe_attitude_euler([wq](mavsdk::Telemetry::EulerAngle e) {
    if (auto sq = wq.lock()) sq->push(AttitudeUpdate{e.roll_deg, e.pitch_deg, e.yaw_deg});
  });
  return std::make_unique<SdkStream<AttitudeUpdate>>(q, [tel, h]{ tel->unsubscribe_attitude_euler(h); });
}

StreamPtr<BatteryUpdate> MavsdkSource::subscribe_battery() {
  auto tel = telemetry_();
  auto q = std::make_shared<QueueStream<BatteryUpdate>>();
  std::weak_ptr<QueueStream<BatteryUpdate>> wq = q;

  auto h = tel->subscribe_battery([wq](mavsdk::Telemetry::Battery b) {
    if (auto sq = wq.lock()) sq->push(BatteryUpdate{b.voltage_v, b.remaining_percent});
  });
  return std::make_unique<SdkStream<BatteryUpdate>>(q, [tel, h]{ tel->unsubscribe_battery(h); });
}

StreamPtr<GpsUpdate> MavsdkSource::subscribe_gps() {
  auto tel = telemetry_();
  auto q = std::make_shared<QueueStream<GpsUpdate>>();
  std::weak_ptr<QueueStream<GpsUpdate>> wq = q;

  auto h = tel->subscribe_gps_info([wq](mavsdk::Telemetry::GpsInfo g) {
    if (auto sq = wq.lock()) sq->push(GpsUpdate{fix_type_label(g.fix_type), g.num_satellites});
  });
  return std::make_unique<SdkStream<GpsUpdate>>(q, [tel, h]{ tel->unsubscribe_gps_info(h); });
}

StreamPtr<FlightModeUpdate> MavsdkSource::subscribe_flight_mode() {
  auto tel = telemetry_();
  auto q = std::make_shared<QueueStream<FlightModeUpdate>>();
  std::weak_ptr<QueueStream<FlightModeUpdate>> wq = q;

  auto h = tel->subscribe_flight_mode([wq](mavsdk::Telemetry::FlightMode m) {
    if (auto sq = wq.lock()) sq->push(FlightModeUpdate{flight_mode_label(m)});
  });
  return std::make_unique<SdkStream<FlightModeUpdate>>(q, [tel, h]{ tel->unsubscribe_flight_mode(h); });
}

StreamPtr<ArmedUpdate> MavsdkSource::subscribe_armed() {
  auto tel = telemetry_();
  auto q = std::make_shared<QueueStream<ArmedUpdate>>();
  std::weak_ptr<QueueStream<ArmedUpdate>> wq = q;

  auto h = tel->subscribe_armed([wq](bool armed) {
    if (auto sq = wq.lock()) sq->push(ArmedUpdate{armed});
  });
  return std::make_unique<SdkStream<ArmedUpdate>>(q, [tel, h]{ tel->unsubscribe_armed(h); });
}

StreamPtr<RcStatusUpdate> MavsdkSource::subscribe_rc_status() {
  auto tel = telemetry_();
  auto q = std::make_shared<QueueStream<RcStatusUpdate>>();
  std::weak_ptr<QueueStream<RcStatusUpdate>> wq = q;

  // No RC link or no RSSI: strength is unreadable.
  auto h = tel->subscribe_rc_status([wq](mavsdk::Telemetry::RcStatus rc) {
    RcStatusUpdate u;
    if (rc.is_available && !std::isnan(rc.signal_strength_percent)) u.signal_strength_percent = rc.signal_strength_percent;
    if (auto sq = wq.lock()) sq->push(u);
  });
  return std::make_unique<SdkStream<RcStatusUpdate>>(q, [tel, h]{ tel->unsubscribe_rc_status(h); });
}

StreamPtr<HealthUpdate> MavsdkSource::subscribe_health() {
  auto tel = telemetry_();
  auto q = std::make_shared<QueueStream<HealthUpdate>>();
  std::weak_ptr<QueueStream<HealthUpdate>> wq = q;

  auto h = tel->subscribe_health([wq](mavsdk::Telemetry::Health hl) {
    HealthUpdate u;
    u.is_accelerometer_calibration_ok = hl.is_accelerometer_calibration_ok;
    u.is_armable                      = hl.is_armable;
    u.is_global_position_ok           = hl.is_global_position_ok;
    u.is_gyrometer_calibration_ok     = hl.is_gyrometer_calibration_ok;
    u.is_home_position_ok             = hl.is_home_position_ok;
    u.is_local_position_ok            = hl.is_local_position_ok;
    u.is_magnetometer_calibration_ok  = hl.is_magnetometer_calibration_ok;
    if (auto sq = wq.lock()) sq->push(u);
  });
  return std::make_unique<SdkStream<HealthUpdate>>(q, [tel, h]{ tel->unsubscribe_health(h); });
}

std::shared_ptr<TelemetrySource> MavsdkConnector::connect(const std::string& url) {
  return std::make_shared<MavsdkSource>(url);
}
