#include <gtest/gtest.h>
#include "telemetry_store.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

TEST(TelemetryStore, FreshStoreIsAllUnavailable) {
  TelemetryStore store;
  const TelemetryRecord r = store.snapshot();

  EXPECT_FALSE(r.lat);
  EXPECT_FALSE(r.lon);
  EXPECT_FALSE(r.alt);
  EXPECT_FALSE(r.abs_alt);
  EXPECT_FALSE(r.speed);
  EXPECT_FALSE(r.roll);
  EXPECT_FALSE(r.voltage);
  EXPECT_FALSE(r.gps_fix);
  EXPECT_FALSE(r.satellites);
  EXPECT_FALSE(r.flight_mode);
  EXPECT_FALSE(r.armed);
  EXPECT_FALSE(r.rc_signal);
  for (std::size_t i = 0; i < HEALTH_CHECK_NUM; ++i) {
    EXPECT_EQ(r.health.get(static_cast<HealthCheck>(i)), CheckState::UNAVAILABLE);
  }
  for (std::size_t c = 0; c < CATEGORY_NUM; ++c) EXPECT_EQ(store.update_count(static_cast<Category>(c)), 0u);
}

TEST(TelemetryStore, CategoryWriteTouchesOnlyItsFields) {
  TelemetryStore store;
  store.write_battery(12.6f, 87.5f);

  const TelemetryRecord r = store.snapshot();
  ASSERT_TRUE(r.voltage);
  ASSERT_TRUE(r.battery);
  EXPECT_FLOAT_EQ(*r.voltage, 12.6f);
  EXPECT_FLOAT_EQ(*r.battery, 87.5f);
  EXPECT_FALSE(r.lat);
  EXPECT_FALSE(r.roll);
  EXPECT_FALSE(r.armed);
  EXPECT_EQ(store.update_count(Category::BATTERY), 1u);
  EXPECT_EQ(store.update_count(Category::POSITION), 0u);
}

TEST(TelemetryStore, HealthWriteReplacesAllChecks) {
  TelemetryStore store;

  HealthChecklist first;
  for (std::size_t i = 0; i < HEALTH_CHECK_NUM; ++i) first.set(static_cast<HealthCheck>(i), CheckState::OK);
  store.write_health(first);

  HealthUpdate u; // all false
  u.is_armable = true;
  store.write_health(HealthChecklist::from_update(u));

  const TelemetryRecord r = store.snapshot();
  EXPECT_EQ(r.health.get(HealthCheck::ARMABLE), CheckState::OK);
  EXPECT_EQ(r.health.get(HealthCheck::ACCELEROMETER_CALIBRATION), CheckState::FAIL);
  EXPECT_EQ(r.health.get(HealthCheck::MAGNETOMETER_CALIBRATION), CheckState::FAIL);
  EXPECT_EQ(store.update_count(Category::HEALTH), 2u);
}

TEST(TelemetryStore, RcSignalCanReturnToUnavailable) {
  TelemetryStore store;
  store.write_rc_signal(75.0f);
  ASSERT_TRUE(store.snapshot().rc_signal);

  store.write_rc_signal(std::nullopt);
  EXPECT_FALSE(store.snapshot().rc_signal);
}

// Disjoint writers hammer the store while a reader checks that every field
// group it sees is one that some writer actually wrote in full.
TEST(TelemetryStore, ConcurrentWritersNeverTearAGroup) {
  TelemetryStore store;
  std::atomic<bool> done{false};

  std::thread pos([&]{
    for (int i = 0; i < 5000; ++i) store.write_position(i, i, static_cast<float>(i), static_cast<float>(i));
  });
  std::thread att([&]{
    for (int i = 0; i < 5000; ++i) store.write_attitude(static_cast<float>(i), static_cast<float>(i), static_cast<float>(i));
  });
  std::thread gps([&]{
    for (int i = 0; i < 5000; ++i) store.write_gps(i % 2 ? "FIX_3D" : "NO_FIX", i % 2 ? 12 : 0);
  });

  int bad = 0;
  std::thread reader([&]{
    while (!done.load()) {
      TelemetryRecord r;
      store.read_latest(r);
      if (r.lat && (*r.lat != *r.lon || static_cast<float>(*r.lat) != *r.alt || *r.alt != *r.abs_alt)) ++bad;
      if (r.roll && (*r.roll != *r.pitch || *r.pitch != *r.yaw)) ++bad;
      if (r.gps_fix) {
        const bool fix = (*r.gps_fix == "FIX_3D");
        if (fix != (*r.satellites == 12)) ++bad;
      }
    }
  });

  pos.join();
  att.join();
  gps.join();
  done.store(true);
  reader.join();

  EXPECT_EQ(bad, 0);
  EXPECT_EQ(store.update_count(Category::POSITION), 5000u);
  EXPECT_EQ(store.update_count(Category::ATTITUDE), 5000u);
  EXPECT_EQ(store.update_count(Category::GPS), 5000u);

  const TelemetryRecord r = store.snapshot();
  EXPECT_DOUBLE_EQ(*r.lat, 4999.0);
  EXPECT_FLOAT_EQ(*r.yaw, 4999.0f);
  EXPECT_EQ(*r.satellites, 12);
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
