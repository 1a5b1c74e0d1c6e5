/**
 * @file app.hpp
 * @brief Main application entry point and orchestrator for llmperf.
 *
 * Declares the App class, which resolves configuration from file,
 * environment and command line, initializes logging and runs the serve or
 * benchmark mode.
 */

#ifndef LLMPERF_APP_HPP
#define LLMPERF_APP_HPP

#include "cli.hpp"
#include "config.hpp"

#include <atomic>
#include <iosfwd>

namespace llmperf {

class TelemetryRecorder;

/**
 * Main application entry point responsible for orchestrating high level
 * application flow, configuration loading, and CLI parsing.
 */
class App {
public:
  /**
   * Parse arguments, resolve configuration and initialize logging.
   *
   * Configuration layers are applied in order: defaults, configuration file,
   * environment, command line.
   *
   * @param argc Number of CLI arguments supplied to the executable.
   * @param argv Null-terminated array containing the raw CLI arguments.
   * @return Zero on success, non-zero when execution should terminate due to
   *         an error.
   */
  int run(int argc, char **argv);

  const CliOptions &options() const { return options_; }
  const Config &config() const { return config_; }

  /**
   * Determine whether the application should exit immediately after
   * `run()` completes.
   */
  bool should_exit() const { return should_exit_; }

  /**
   * Serve JSON-lines jobs from @p in and write one JSON line per JobRecord
   * (or admission rejection) to @p out until end of input or interrupt.
   *
   * @return Process exit code.
   */
  int serve(std::istream &in, std::ostream &out,
            const std::atomic<bool> *interrupt);

  /**
   * Run the benchmark configured by the options and print its report to
   * @p out.
   *
   * @return Process exit code.
   */
  int bench(std::ostream &out, const std::atomic<bool> *interrupt);

private:
  void export_run(TelemetryRecorder &recorder) const;

  CliOptions options_;
  Config config_;
  bool should_exit_{false};
};

} // namespace llmperf

#endif // LLMPERF_APP_HPP
