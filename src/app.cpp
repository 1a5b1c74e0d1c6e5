#include "app.hpp"
#include "benchmark_driver.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "engine.hpp"
#include "log.hpp"
#include "telemetry_store.hpp"

#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace llmperf {

namespace {
std::shared_ptr<spdlog::logger> app_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("app");
  }();
  return logger;
}
} // namespace

/**
 * Execute the startup flow.
 *
 * This routine orchestrates CLI parsing, configuration loading and logger
 * initialization. Invalid configuration is reported and turned into a
 * non-zero exit code.
 *
 * @param argc Argument count passed from @c main().
 * @param argv Argument vector passed from @c main().
 * @return Zero on success, non-zero if execution should terminate with an
 *         error code.
 */
int App::run(int argc, char **argv) {
  should_exit_ = false;
  try {
    options_ = parse_cli(argc, argv);
  } catch (const CliParseExit &exit) {
    should_exit_ = true;
    return exit.exit_code();
  } catch (const std::exception &e) {
    app_log()->error("{}", e.what());
    should_exit_ = true;
    return 1;
  }
  try {
    if (!options_.config_file.empty()) {
      config_ = Config::from_file(options_.config_file);
    }
    config_.apply_environment();
    apply_cli_overrides(options_, config_);
    config_.validate();
  } catch (const std::exception &e) {
    app_log()->error("Invalid configuration: {}", e.what());
    should_exit_ = true;
    return 2;
  }

  std::string level_str = config_.log_level();
  if (options_.log_level != "info") {
    level_str = options_.log_level;
  }
  spdlog::level::level_enum lvl = parse_log_level(level_str);
  init_logger(lvl, config_.log_pattern(), config_.log_file(),
              static_cast<std::size_t>(config_.log_rotate()),
              config_.log_compress());
  std::unordered_map<std::string, spdlog::level::level_enum> category_levels;
  for (const auto &[category, level_name] : config_.log_categories()) {
    auto level = spdlog::level::from_str(level_name);
    if (level == spdlog::level::off && level_name != "off") {
      app_log()->warn("Ignoring invalid log level '{}' for category '{}'",
                      level_name, category);
      continue;
    }
    category_levels[category] = level;
  }
  configure_log_categories(category_levels);
  if (options_.verbose) {
    app_log()->debug("Verbose mode enabled");
  }

  if (options_.print_config) {
    std::cout << config_.to_json().dump(2) << std::endl;
    should_exit_ = true;
    return 0;
  }
  if (options_.bench && config_.bench_jobs() <= 0 &&
      config_.bench_duration().count() <= 0) {
    app_log()->error("Benchmark requires --jobs and/or --duration");
    should_exit_ = true;
    return 2;
  }
  app_log()->debug("Effective configuration: {}", config_.to_json().dump());
  return 0;
}

int App::serve(std::istream &in, std::ostream &out,
               const std::atomic<bool> *interrupt) {
  PerfEngine engine(config_, PerfEngine::make_client(config_));
  std::mutex out_mutex;
  engine.set_record_callback([&](const JobRecord &record) {
    nlohmann::json j = record;
    std::lock_guard<std::mutex> lock(out_mutex);
    out << j.dump() << '\n';
    out.flush();
  });
  try {
    engine.start();
  } catch (const std::exception &e) {
    app_log()->critical("Failed to start: {}", e.what());
    return 1;
  }

  Job defaults;
  defaults.model_id = config_.model_id();
  defaults.max_tokens = config_.max_tokens();
  defaults.temperature = config_.temperature();
  std::string line;
  std::size_t line_no = 0;
  while (!(interrupt && interrupt->load()) && std::getline(in, line)) {
    ++line_no;
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
      continue;
    }
    Job job;
    try {
      job = job_from_json(nlohmann::json::parse(line), defaults);
    } catch (const std::exception &e) {
      app_log()->warn("Ignoring input line {}: {}", line_no, e.what());
      continue;
    }
    std::uint64_t requested_id = job.id;
    Admission result = engine.submit(std::move(job));
    if (result != Admission::Accepted) {
      nlohmann::json j{{"admission", to_string(result)}};
      if (requested_id != 0) {
        j["id"] = requested_id;
      }
      std::lock_guard<std::mutex> lock(out_mutex);
      out << j.dump() << '\n';
      out.flush();
    }
  }
  if (interrupt && interrupt->load()) {
    app_log()->info("Stop requested; draining");
  } else {
    app_log()->info("End of input; draining");
  }
  bool drained = engine.stop();
  engine.set_record_callback(nullptr);
  export_run(engine.recorder());
  if (auto summary = engine.recorder().summary()) {
    app_log()->info("Run {}: {} jobs, {} failed, avg {:.1f} ms",
                    summary->run.run_id, summary->total_jobs,
                    summary->failed_jobs, summary->avg_latency_ms);
  }
  return drained ? 0 : 3;
}

int App::bench(std::ostream &out, const std::atomic<bool> *interrupt) {
  PerfEngine engine(config_, PerfEngine::make_client(config_));
  BenchmarkOptions options;
  options.jobs = config_.bench_jobs() > 0
                     ? static_cast<std::size_t>(config_.bench_jobs())
                     : 0;
  options.duration = config_.bench_duration();
  options.prompt_file = config_.bench_prompt_file();
  options.pace = config_.bench_pace();
  BenchmarkReport report;
  try {
    BenchmarkDriver driver(engine, options);
    if (config_.metrics_port() > 0) {
      out << "Metrics: http://" << config_.metrics_bind_address() << ":"
          << config_.metrics_port() << "/metrics\n";
    }
    report = driver.run(interrupt);
  } catch (const std::exception &e) {
    app_log()->critical("Benchmark failed: {}", e.what());
    return 1;
  }
  out << std::string(60, '=') << "\nBENCHMARK SUMMARY\n"
      << std::string(60, '=') << "\n"
      << format_report(report);
  out.flush();
  if (!options_.report_json.empty()) {
    std::ofstream file(options_.report_json);
    if (!file) {
      app_log()->error("Failed to open report file {}",
                       options_.report_json);
    } else {
      file << nlohmann::json(report).dump(2);
    }
  }
  export_run(engine.recorder());
  return report.drained ? 0 : 3;
}

void App::export_run(TelemetryRecorder &recorder) const {
  if (options_.export_json.empty() && options_.export_csv.empty()) {
    return;
  }
  TelemetryStore *store = recorder.store();
  if (!store) {
    app_log()->warn("Export requested but telemetry persistence is disabled");
    return;
  }
  recorder.flush();
  const std::string &run_id = recorder.run().run_id;
  try {
    if (!options_.export_json.empty()) {
      store->export_json(run_id, options_.export_json);
      app_log()->info("Exported run {} to {}", run_id, options_.export_json);
    }
    if (!options_.export_csv.empty()) {
      store->export_csv(run_id, options_.export_csv);
      app_log()->info("Exported jobs of run {} to {}", run_id,
                      options_.export_csv);
    }
  } catch (const std::exception &e) {
    app_log()->error("Export failed: {}", e.what());
  }
}

} // namespace llmperf
