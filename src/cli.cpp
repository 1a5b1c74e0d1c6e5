#include "cli.hpp"
#include "log.hpp"
#include "util/duration.hpp"
#include "version.hpp"

#include <CLI/CLI.hpp>
#include <array>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string_view>

#include <spdlog/spdlog.h>

namespace llmperf {

namespace {
std::shared_ptr<spdlog::logger> cli_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("cli");
  }();
  return logger;
}

std::string log_category_help_text() {
  static const std::array<std::string_view, 12> categories = {
      "app",     "bench",    "cli",   "config",         "engine",
      "main",    "metrics",  "pool",  "telemetry",      "tuner",
      "upstream", "upstream.retry"};
  std::ostringstream oss;
  oss << "Logging categories: ";
  for (std::size_t i = 0; i < categories.size(); ++i) {
    if (i != 0) {
      oss << ", ";
    }
    oss << categories[i];
  }
  oss << "\nUse --log-category NAME=LEVEL to override (e.g., tuner=debug).";
  oss << " Configuration files accept the same mapping under 'log_categories'.";
  return oss.str();
}

/// Register a duration option accepting `500ms`, `15s`, `2m` or seconds.
CLI::Option *add_duration_option(CLI::App &app, const std::string &name,
                                 std::optional<std::chrono::milliseconds> &out,
                                 const std::string &description) {
  return app
      .add_option_function<std::string>(
          name,
          [&out, name](const std::string &value) {
            try {
              out = parse_duration(value);
            } catch (const std::exception &e) {
              throw CLI::ValidationError(name, e.what());
            }
          },
          description)
      ->type_name("DURATION");
}
} // namespace

CliOptions parse_cli(int argc, char **argv) {
  CliOptions options;
  CLI::App app{"Adaptive concurrency and telemetry layer for LLM completion "
               "workloads"};
  app.footer(log_category_help_text());

  app.add_flag("-v,--verbose", options.verbose, "Enable verbose output")
      ->group("General");
  app.add_option("-C,--config", options.config_file,
                 "Path to configuration file (YAML, TOML or JSON)")
      ->type_name("FILE")
      ->check(CLI::ExistingFile)
      ->group("General");
  app.add_flag_function(
         "--version",
         [](std::size_t) {
           std::cout << "llmperf " << kVersionString << std::endl;
           throw CliParseExit(0);
         },
         "Show version information and exit")
      ->group("General");
  app.add_flag("--print-config", options.print_config,
               "Print the effective configuration as JSON and exit")
      ->group("General");

  app.add_option(
         "-G,--log-level", options.log_level,
         "Set logging level (trace, debug, info, warn, error, critical, off)")
      ->type_name("LEVEL")
      ->default_val("info")
      ->group("Logging");
  app.add_option("-F,--log-file", options.log_file, "Path to rotating log file")
      ->type_name("FILE")
      ->group("Logging");
  app.add_option_function<int>(
         "--log-rotate",
         [&options](int value) {
           if (value < 0) {
             throw CLI::ValidationError("--log-rotate",
                                        "rotation count must be non-negative");
           }
           options.log_rotate = value;
         },
         "Number of rotated log files to retain (0 disables rotation)")
      ->type_name("N")
      ->group("Logging");
  app.add_flag_callback(
         "--log-compress",
         [&options] {
           options.log_compress = true;
           options.log_compress_explicit = true;
         },
         "Compress rotated log files with gzip")
      ->group("Logging");
  app.add_option_function<std::string>(
         "--log-category",
         [&options](const std::string &value) {
           auto pos = value.find('=');
           std::string name =
               pos == std::string::npos ? value : value.substr(0, pos);
           std::string level = pos == std::string::npos ? std::string{"debug"}
                                                        : value.substr(pos + 1);
           if (name.empty()) {
             throw CLI::ValidationError("--log-category",
                                        "category name must not be empty");
           }
           if (level.empty()) {
             level = "debug";
           }
           options.log_categories[name] = level;
           options.log_categories_explicit = true;
         },
         "Enable a logging category (NAME or NAME=LEVEL). See help footer for "
         "available categories.")
      ->type_name("NAME[=LEVEL]")
      ->group("Logging");

  app.add_option("-e,--endpoint", options.endpoint_url,
                 "OpenAI-compatible chat completions URL")
      ->type_name("URL")
      ->group("Upstream");
  app.add_option("-m,--model", options.model_id, "Model identifier")
      ->type_name("ID")
      ->group("Upstream");
  app.add_option("--api-key", options.api_key,
                 "Bearer token sent to the endpoint")
      ->type_name("KEY")
      ->group("Upstream");
  add_duration_option(app, "--timeout", options.request_timeout,
                      "Per-request upstream timeout")
      ->group("Upstream");
  app.add_option("--max-tokens", options.max_tokens,
                 "Completion token cap per job")
      ->type_name("N")
      ->check(CLI::Range(1, std::numeric_limits<int>::max()))
      ->group("Upstream");
  app.add_option("--temperature", options.temperature, "Sampling temperature")
      ->type_name("T")
      ->check(CLI::Range(0.0, 2.0))
      ->group("Upstream");

  app.add_option("--min-concurrency", options.concurrency_min,
                 "Lower bound on concurrent executors")
      ->type_name("N")
      ->check(CLI::Range(1, std::numeric_limits<int>::max()))
      ->group("Concurrency");
  app.add_option("--max-concurrency", options.concurrency_max,
                 "Upper bound on concurrent executors")
      ->type_name("N")
      ->check(CLI::Range(1, std::numeric_limits<int>::max()))
      ->group("Concurrency");
  app.add_option("--start-concurrency", options.concurrency_start,
                 "Executors started at launch (default: minimum)")
      ->type_name("N")
      ->check(CLI::Range(1, std::numeric_limits<int>::max()))
      ->group("Concurrency");
  app.add_option("--target-p95-ms", options.target_p95_ms,
                 "p95 latency target in milliseconds")
      ->type_name("MS")
      ->check(CLI::PositiveNumber)
      ->group("Concurrency");
  app.add_option("--target-error-rate", options.target_error_rate,
                 "Tolerated fraction of failed jobs per window")
      ->type_name("RATE")
      ->check(CLI::Range(0.0, 1.0))
      ->group("Concurrency");
  add_duration_option(app, "--sample-window", options.sample_window,
                      "Length of the rolling sample window")
      ->group("Concurrency");
  add_duration_option(app, "--tune-interval", options.tune_interval,
                      "Time between tuner ticks")
      ->group("Concurrency");
  app.add_option("-q,--queue-capacity", options.queue_capacity,
                 "Jobs admitted beyond idle executors before rejecting")
      ->type_name("N")
      ->check(CLI::Range(1, std::numeric_limits<int>::max()))
      ->group("Concurrency");
  app.add_option("--max-retries", options.max_retries,
                 "Retries for transient upstream failures")
      ->type_name("N")
      ->check(CLI::Range(0, std::numeric_limits<int>::max()))
      ->group("Concurrency");
  add_duration_option(app, "--drain-timeout", options.drain_timeout,
                      "Time allowed to finish accepted jobs at shutdown")
      ->group("Concurrency");

  app.add_option("-d,--db", options.db_path, "Path to SQLite telemetry database")
      ->type_name("FILE")
      ->group("Telemetry");
  app.add_flag("--no-db", options.no_db, "Disable telemetry persistence")
      ->group("Telemetry");
  app.add_option("--notes", options.notes, "Free-form notes stored on the run")
      ->type_name("TEXT")
      ->group("Telemetry");
  app.add_option("-p,--metrics-port", options.metrics_port,
                 "Port of the metrics endpoint (0 disables)")
      ->type_name("PORT")
      ->check(CLI::Range(0, 65535))
      ->group("Telemetry");
  app.add_option("--metrics-bind", options.metrics_bind_address,
                 "Bind address of the metrics endpoint")
      ->type_name("ADDR")
      ->group("Telemetry");
  app.add_option("--export-json", options.export_json,
                 "Export the finished run to a JSON file")
      ->type_name("FILE")
      ->group("Telemetry");
  app.add_option("--export-csv", options.export_csv,
                 "Export the finished run's jobs to a CSV file")
      ->type_name("FILE")
      ->group("Telemetry");

  app.add_flag("--simulate", options.simulate,
               "Use an in-process simulated upstream")
      ->group("Simulation");
  add_duration_option(app, "--simulate-latency", options.simulate_latency,
                      "Service time of the simulated upstream")
      ->group("Simulation");
  app.add_option("--simulate-error-rate", options.simulate_error_rate,
                 "Fraction of simulated requests that fail")
      ->type_name("RATE")
      ->check(CLI::Range(0.0, 1.0))
      ->group("Simulation");

  app.add_flag("-b,--bench", options.bench,
               "Run a benchmark instead of serving stdin")
      ->group("Benchmark");
  app.add_option("-n,--jobs", options.bench_jobs, "Number of jobs to submit")
      ->type_name("N")
      ->check(CLI::Range(1, std::numeric_limits<int>::max()))
      ->group("Benchmark");
  add_duration_option(app, "--duration", options.bench_duration,
                      "Benchmark submission window")
      ->group("Benchmark");
  app.add_option("--prompt-file", options.bench_prompt_file,
                 "File with custom prompts (one per line)")
      ->type_name("FILE")
      ->check(CLI::ExistingFile)
      ->group("Benchmark");
  app.add_option("--pace", options.bench_pace,
                 "Submission rate in jobs per second (default: unpaced)")
      ->type_name("RATE")
      ->check(CLI::NonNegativeNumber)
      ->group("Benchmark");
  app.add_option("--report-json", options.report_json,
                 "Write the benchmark report to a JSON file")
      ->type_name("FILE")
      ->group("Benchmark");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    int exit_code = app.exit(e);
    throw CliParseExit(exit_code);
  }
  if (options.verbose && options.log_level == "info") {
    options.log_level = "debug";
  }
  cli_log()->debug("Parsed {} arguments", argc > 0 ? argc - 1 : 0);
  return options;
}

void apply_cli_overrides(const CliOptions &options, Config &config) {
  if (options.endpoint_url)
    config.set_endpoint_url(*options.endpoint_url);
  if (options.model_id)
    config.set_model_id(*options.model_id);
  if (options.api_key)
    config.set_api_key(*options.api_key);
  if (options.request_timeout)
    config.set_request_timeout(*options.request_timeout);
  if (options.max_tokens)
    config.set_max_tokens(*options.max_tokens);
  if (options.temperature)
    config.set_temperature(*options.temperature);
  if (options.concurrency_min)
    config.set_concurrency_min(*options.concurrency_min);
  if (options.concurrency_max)
    config.set_concurrency_max(*options.concurrency_max);
  if (options.concurrency_start)
    config.set_concurrency_start(*options.concurrency_start);
  if (options.target_p95_ms)
    config.set_target_p95_ms(*options.target_p95_ms);
  if (options.target_error_rate)
    config.set_target_error_rate(*options.target_error_rate);
  if (options.sample_window)
    config.set_sample_window(*options.sample_window);
  if (options.tune_interval)
    config.set_tune_interval(*options.tune_interval);
  if (options.queue_capacity)
    config.set_queue_capacity(*options.queue_capacity);
  if (options.max_retries)
    config.set_max_retries(*options.max_retries);
  if (options.drain_timeout)
    config.set_drain_timeout(*options.drain_timeout);
  if (options.db_path)
    config.set_db_path(*options.db_path);
  if (options.no_db)
    config.set_db_path("");
  if (options.notes)
    config.set_notes(*options.notes);
  if (options.metrics_port)
    config.set_metrics_port(*options.metrics_port);
  if (options.metrics_bind_address)
    config.set_metrics_bind_address(*options.metrics_bind_address);
  if (options.simulate)
    config.set_simulate_enabled(true);
  if (options.simulate_latency)
    config.set_simulate_latency(*options.simulate_latency);
  if (options.simulate_error_rate)
    config.set_simulate_error_rate(*options.simulate_error_rate);
  if (options.bench_jobs)
    config.set_bench_jobs(*options.bench_jobs);
  if (options.bench_duration)
    config.set_bench_duration(*options.bench_duration);
  if (options.bench_prompt_file)
    config.set_bench_prompt_file(*options.bench_prompt_file);
  if (options.bench_pace)
    config.set_bench_pace(*options.bench_pace);
  if (!options.log_file.empty())
    config.set_log_file(options.log_file);
  if (options.log_rotate)
    config.set_log_rotate(*options.log_rotate);
  if (options.log_compress_explicit)
    config.set_log_compress(options.log_compress);
  if (options.log_categories_explicit)
    config.set_log_categories(options.log_categories);
  if (options.log_level != "info")
    config.set_log_level(options.log_level);
}

} // namespace llmperf
