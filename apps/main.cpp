#include "mavsdk_source.hpp"
#include "supervisor.hpp"
#include "error_log.hpp"
#include "params.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <exception>
#include <string>
#include <thread>

static std::atomic<bool> g_killed{false};
static void sigint_handler(int) {g_killed.store(true);}

static void usage(const char* prog) {
  std::fprintf(stdout, "usage: %s [connection_url] [log_dir]\n", prog);
  std::fprintf(stdout, "  connection_url  default %s\n", param::CONNECTION_URL);
  std::fprintf(stdout, "  log_dir         default %s\n", param::LOG_DIR);
  std::fflush(stdout);
}

int main(int argc, char** argv) {
  if (argc > 1 && (std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0)) {
    usage(argv[0]);
    return 0;
  }
  if (argc > 3) {
    usage(argv[0]);
    return 2;
  }

  std::signal(SIGINT, sigint_handler);  // SIGINT handler(ctrl+C)
  std::signal(SIGTERM, sigint_handler);

  ErrorLog errors(param::MAX_ERRORS_DISPLAYED); // outlives every session

  try {
    SupervisorConfig cfg;
    if (argc > 1) cfg.connection_url = argv[1];
    if (argc > 2) cfg.log_dir = argv[2];

    MavsdkConnector connector;
    Supervisor sup(connector, errors, cfg);
    std::thread th_sup(&Supervisor::run, &sup);

    // -------------------------------------------------- //
    //                 [ 0. Main thread ]                 //
    // -------------------------------------------------- //
    while (!g_killed.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::fprintf(stdout, "\nExiting...\n"); std::fflush(stdout);

    sup.request_stop();
    if (th_sup.joinable()) th_sup.join();
  }
  catch (const std::exception& e) {
    errors.record(std::string("Fatal error in main: ") + e.what());
    std::fprintf(stderr, "Fatal error in main: %s\n", e.what()); std::fflush(stderr);
    return 1;
  }

  return 0;
}
