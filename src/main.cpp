#include "app.hpp"
#include "log.hpp"

#include <atomic>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <spdlog/spdlog.h>

namespace {
std::shared_ptr<spdlog::logger> main_log() {
  static auto logger = [] {
    llmperf::ensure_default_logger();
    return llmperf::category_logger("main");
  }();
  return logger;
}

std::atomic<bool> g_stop_requested{false};

extern "C" void handle_stop_signal(int) { g_stop_requested.store(true); }

void install_signal_handlers() {
  struct sigaction action {};
  action.sa_handler = handle_stop_signal;
  sigemptyset(&action.sa_mask);
  // no SA_RESTART: a blocking read on stdin returns so serve mode can drain
  action.sa_flags = 0;
  sigaction(SIGINT, &action, nullptr);
  sigaction(SIGTERM, &action, nullptr);
}
} // namespace

/**
 * Program entry point: resolve configuration, then serve stdin or run the
 * benchmark until done or interrupted.
 *
 * @param argc Number of CLI arguments received from the OS.
 * @param argv Null-terminated array containing the raw CLI arguments.
 * @return Process exit code forwarded from the application logic.
 */
int main(int argc, char **argv) {
  llmperf::App app;
  int ret = app.run(argc, argv);
  if (ret != 0 || app.should_exit()) {
    llmperf::flush_logs();
    return ret;
  }
  install_signal_handlers();
  try {
    if (app.options().bench) {
      ret = app.bench(std::cout, &g_stop_requested);
    } else {
      ret = app.serve(std::cin, std::cout, &g_stop_requested);
    }
  } catch (const std::exception &e) {
    main_log()->critical("Fatal error: {}", e.what());
    ret = 1;
  }
  llmperf::flush_logs();
  return ret;
}
