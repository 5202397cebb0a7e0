#include "stream_fetcher.hpp"
#include "utils.hpp"

#include <cmath>

void Fetcher::on_failure_(const std::string& reason) {
  set_state_(FetcherState::FAULTED);
  failure_count_.fetch_add(1, std::memory_order_acq_rel);
  errors_.record(std::string(category_name(category_)) + " fetch error: " + reason);
  stop_.sleep_for(retry_delay_);
}

void apply_position(const PositionUpdate& u, TelemetryStore& store) {
  store.write_position(u.latitude_deg, u.longitude_deg, u.relative_altitude_m, u.absolute_altitude_m);
}

void apply_attitude(const AttitudeUpdate& u, TelemetryStore& store) {
  store.write_attitude(u.roll_deg, u.pitch_deg, u.yaw_deg);
}

void apply_battery(const BatteryUpdate& u, TelemetryStore& store) {
  store.write_battery(u.voltage_v, u.remaining_percent);
}

void apply_gps(const GpsUpdate& u, TelemetryStore& store) {
  store.write_gps(strip_prefix(u.fix_type, param::FIX_TYPE_PREFIX), u.num_satellites);
}

void apply_flight_mode(const FlightModeUpdate& u, TelemetryStore& store) {
  store.write_flight_mode(strip_prefix(u.mode, param::FLIGHT_MODE_PREFIX));
}

void apply_armed(const ArmedUpdate& u, TelemetryStore& store) {
  store.write_armed(u.armed);
}

void apply_rc_status(const RcStatusUpdate& u, TelemetryStore& store) {
  // Some links never report RSSI (NaN or absent): keep the item, mark unavailable.
  if (!u.signal_strength_percent || std::isnan(*u.signal_strength_percent)) {
    store.write_rc_signal(std::nullopt);
    return;
  }
  store.write_rc_signal(*u.signal_strength_percent);
}

void apply_health(const HealthUpdate& u, TelemetryStore& store) {
  store.write_health(HealthChecklist::from_update(u));
}

std::vector<std::unique_ptr<Fetcher>> make_fetchers(const std::shared_ptr<TelemetrySource>& source,
                                                    TelemetryStore& store, ErrorLog& errors, const StopSignal& stop,
                                                    std::chrono::steady_clock::duration retry_delay) {
  std::vector<std::unique_ptr<Fetcher>> out;
  out.reserve(CATEGORY_NUM);

  out.push_back(std::make_unique<StreamFetcher<PositionUpdate>>(
    Category::POSITION, [source]{ return source->subscribe_position(); }, &apply_position, store, errors, stop, retry_delay));
  out.push_back(std::make_unique<StreamFetcher<AttitudeUpdate>>(
    Category::ATTITUDE, [source]{ return source->subscribe_attitude(); }, &apply_attitude, store, errors, stop, retry_delay));
  out.push_back(std::make_unique<StreamFetcher<BatteryUpdate>>(
    Category::BATTERY, [source]{ return source->subscribe_battery(); }, &apply_battery, store, errors, stop, retry_delay));
  out.push_back(std::make_unique<StreamFetcher<GpsUpdate>>(
    Category::GPS, [source]{ return source->subscribe_gps(); }, &apply_gps, store, errors, stop, retry_delay));
  out.push_back(std::make_unique<StreamFetcher<FlightModeUpdate>>(
    Category::FLIGHT_MODE, [source]{ return source->subscribe_flight_mode(); }, &apply_flight_mode, store, errors, stop, retry_delay));
  out.push_back(std::make_unique<StreamFetcher<ArmedUpdate>>(
    Category::ARMED, [source]{ return source->subscribe_armed(); }, &apply_armed, store, errors, stop, retry_delay));
  out.push_back(std::make_unique<StreamFetcher<RcStatusUpdate>>(
    Category::RC_SIGNAL, [source]{ return source->subscribe_rc_status(); }, &apply_rc_status, store, errors, stop, retry_delay));
  out.push_back(std::make_unique<StreamFetcher<HealthUpdate>>(
    Category::HEALTH, [source]{ return source->subscribe_health(); }, &apply_health, store, errors, stop, retry_delay));

  return out;
}
