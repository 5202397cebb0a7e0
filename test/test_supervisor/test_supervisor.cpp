#include <gtest/gtest.h>
#include "fakes/fake_source.hpp"
#include "supervisor.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

using namespace std::chrono_literals;
using fake::wait_until;

namespace {

SupervisorConfig quiet_config() {
  SupervisorConfig cfg;
  cfg.connection_url = "udp://:14540";
  cfg.fetch_retry_delay = 10ms;
  cfg.session_retry_delay = 50ms;
  cfg.display_dt = 10ms;
  cfg.csv_dt = 10ms;
  cfg.display_out = nullptr;
  cfg.enable_csv = false;
  return cfg;
}

// Runs the supervisor on its own thread; stops and joins on scope exit.
struct SupervisorThread {
  Supervisor& sup;
  std::thread th;

  explicit SupervisorThread(Supervisor& s) : sup(s), th(&Supervisor::run, &s) {}
  ~SupervisorThread() { stop(); }

  void stop() {
    sup.request_stop();
    if (th.joinable()) th.join();
  }
};

std::size_t count_message(const std::vector<ErrorEntry>& es, const std::string& msg) {
  std::size_t n = 0;
  for (const ErrorEntry& e : es) if (e.message == msg) ++n;
  return n;
}

} // namespace

TEST(Supervisor, RetriesConnectUntilItSucceeds) {
  fake::FakeConnector conn(3);
  ErrorLog errors;
  Supervisor sup(conn, errors, quiet_config());
  SupervisorThread st(sup);

  ASSERT_TRUE(wait_until([&]{ return sup.state() == SupervisorState::RUNNING; }));
  std::shared_ptr<fake::FakeSource> src = conn.source(0);
  ASSERT_NE(src, nullptr);
  ASSERT_TRUE(wait_until([&]{ return src->all_subscribed(); }));

  const std::vector<std::chrono::steady_clock::time_point> calls = conn.calls();
  ASSERT_EQ(calls.size(), 4u);
  EXPECT_GE(calls[3] - calls[0], 3 * 50ms);
  for (std::size_t i = 1; i < calls.size(); ++i) EXPECT_GE(calls[i] - calls[i - 1], 50ms);

  EXPECT_EQ(count_message(errors.recent(), "Main connection error: link refused"), 3u);
  EXPECT_EQ(sup.attempt_count(), 4u);
  EXPECT_EQ(sup.session_count(), 1u);
  EXPECT_EQ(conn.last_url(), "udp://:14540");
}

TEST(Supervisor, WaitsForLinkBeforeLaunchingFetchers) {
  fake::FakeConnector conn(0, false);
  ErrorLog errors;
  Supervisor sup(conn, errors, quiet_config());
  SupervisorThread st(sup);

  ASSERT_TRUE(wait_until([&]{ return conn.source_count() == 1; }));
  std::shared_ptr<fake::FakeSource> src = conn.source(0);
  ASSERT_TRUE(wait_until([&]{ return src->link.latest() != nullptr; }));

  std::this_thread::sleep_for(50ms);
  EXPECT_EQ(sup.state(), SupervisorState::CONNECTING);
  EXPECT_EQ(src->position.opens(), 0);
  TelemetryRecord r;
  EXPECT_FALSE(sup.read_latest(r));

  src->link.latest()->push(true);
  ASSERT_TRUE(wait_until([&]{ return sup.state() == SupervisorState::RUNNING; }));
  ASSERT_TRUE(wait_until([&]{ return src->all_subscribed(); }));
  EXPECT_EQ(sup.attempt_count(), 1u);
}

TEST(Supervisor, LinkDownThenUpDoesNotRestart) {
  fake::FakeConnector conn;
  ErrorLog errors;
  Supervisor sup(conn, errors, quiet_config());
  SupervisorThread st(sup);

  ASSERT_TRUE(wait_until([&]{ return sup.state() == SupervisorState::RUNNING; }));
  std::shared_ptr<fake::FakeSource> src = conn.source(0);

  src->link.latest()->push(false);
  src->link.latest()->push(true);
  std::this_thread::sleep_for(50ms);

  EXPECT_EQ(sup.state(), SupervisorState::RUNNING);
  EXPECT_EQ(sup.session_count(), 1u);
  EXPECT_EQ(errors.size(), 0u);
}

TEST(Supervisor, FetcherFailureStaysInsideSession) {
  fake::FakeConnector conn;
  ErrorLog errors(5);
  Supervisor sup(conn, errors, quiet_config());
  SupervisorThread st(sup);

  ASSERT_TRUE(wait_until([&]{ return sup.state() == SupervisorState::RUNNING; }));
  std::shared_ptr<fake::FakeSource> src = conn.source(0);
  ASSERT_TRUE(wait_until([&]{ return src->gps.latest() != nullptr; }));

  src->gps.latest()->fail("decode error");
  ASSERT_TRUE(wait_until([&]{ return src->gps.opens() >= 2; }));

  EXPECT_EQ(sup.session_count(), 1u);
  EXPECT_EQ(conn.calls().size(), 1u);
  EXPECT_EQ(count_message(errors.recent(), "GPS fetch error: decode error"), 1u);
}

TEST(Supervisor, LinkFailureRestartsWithFreshStore) {
  fake::FakeConnector conn;
  ErrorLog errors;
  Supervisor sup(conn, errors, quiet_config());
  SupervisorThread st(sup);

  ASSERT_TRUE(wait_until([&]{ return sup.state() == SupervisorState::RUNNING; }));
  std::shared_ptr<fake::FakeSource> first = conn.source(0);
  ASSERT_TRUE(wait_until([&]{ return first->position.latest() != nullptr; }));

  first->position.latest()->push(PositionUpdate{47.0, 8.0, 5.0f, 420.0f});
  ASSERT_TRUE(wait_until([&]{
    TelemetryRecord r;
    return sup.read_latest(r) && r.lat.has_value();
  }));

  first->link.latest()->fail("heartbeat lost");

  ASSERT_TRUE(wait_until([&]{ return sup.session_count() == 2 && sup.state() == SupervisorState::RUNNING; }));
  EXPECT_EQ(count_message(errors.recent(), "Main connection error: heartbeat lost"), 1u);
  EXPECT_EQ(conn.source_count(), 2u);

  TelemetryRecord r;
  ASSERT_TRUE(sup.read_latest(r));
  EXPECT_FALSE(r.lat);
  EXPECT_FALSE(r.abs_alt);
}

TEST(Supervisor, EndedLinkStreamIsSessionFatal) {
  fake::FakeConnector conn;
  ErrorLog errors;
  Supervisor sup(conn, errors, quiet_config());
  SupervisorThread st(sup);

  ASSERT_TRUE(wait_until([&]{ return sup.state() == SupervisorState::RUNNING; }));
  conn.source(0)->link.latest()->close();

  ASSERT_TRUE(wait_until([&]{ return sup.session_count() == 2; }));
  EXPECT_EQ(count_message(errors.recent(), "Main connection error: connection state stream ended"), 1u);
}

TEST(Supervisor, StopEndsRunAndClearsSession) {
  fake::FakeConnector conn;
  ErrorLog errors;
  Supervisor sup(conn, errors, quiet_config());
  SupervisorThread st(sup);

  ASSERT_TRUE(wait_until([&]{ return sup.state() == SupervisorState::RUNNING; }));

  const auto t0 = std::chrono::steady_clock::now();
  st.stop();
  EXPECT_LT(std::chrono::steady_clock::now() - t0, 2s);

  EXPECT_EQ(sup.state(), SupervisorState::STOPPED);
  TelemetryRecord r;
  EXPECT_FALSE(sup.read_latest(r));
  EXPECT_EQ(errors.size(), 0u);
}

TEST(Supervisor, StopDuringBackoffIsPrompt) {
  fake::FakeConnector conn(1000);
  ErrorLog errors;
  SupervisorConfig cfg = quiet_config();
  cfg.session_retry_delay = 10s;
  Supervisor sup(conn, errors, cfg);
  SupervisorThread st(sup);

  ASSERT_TRUE(wait_until([&]{ return sup.state() == SupervisorState::BACKOFF; }));

  const auto t0 = std::chrono::steady_clock::now();
  st.stop();
  EXPECT_LT(std::chrono::steady_clock::now() - t0, 2s);
  EXPECT_EQ(sup.attempt_count(), 1u);
}

TEST(Supervisor, SessionWritesCsvIntoLogDir) {
  const std::filesystem::path dir =
    std::filesystem::temp_directory_path() / ("mavtelem_session_" + std::to_string(::getpid()));
  std::filesystem::remove_all(dir);

  fake::FakeConnector conn;
  ErrorLog errors;
  SupervisorConfig cfg = quiet_config();
  cfg.enable_csv = true;
  cfg.log_dir = dir.string();
  Supervisor sup(conn, errors, cfg);
  {
    SupervisorThread st(sup);
    ASSERT_TRUE(wait_until([&]{ return sup.state() == SupervisorState::RUNNING; }));
    ASSERT_TRUE(wait_until([&]{ return std::filesystem::exists(sup.log_path()); }));
  }

  const std::filesystem::path p(sup.log_path());
  EXPECT_EQ(p.parent_path(), dir);
  EXPECT_EQ(p.filename().string().rfind("telemetry_log_", 0), 0u);
  EXPECT_GT(std::filesystem::file_size(p), 0u);

  std::filesystem::remove_all(dir);
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
