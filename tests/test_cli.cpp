#include "cli.hpp"

#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <string>
#include <vector>

using namespace llmperf;
using namespace std::chrono_literals;

namespace {
CliOptions parse(std::vector<std::string> args) {
  args.insert(args.begin(), "llmperf");
  std::vector<char *> argv;
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  return parse_cli(static_cast<int>(argv.size()), argv.data());
}

int exit_code_of(std::vector<std::string> args) {
  try {
    parse(std::move(args));
  } catch (const CliParseExit &e) {
    return e.exit_code();
  }
  return -1;
}
} // namespace

TEST_CASE("no arguments leave every override unset", "[cli]") {
  CliOptions opts = parse({});
  REQUIRE_FALSE(opts.verbose);
  REQUIRE_FALSE(opts.bench);
  REQUIRE(opts.log_level == "info");
  REQUIRE_FALSE(opts.concurrency_min);
  REQUIRE_FALSE(opts.metrics_port);
  REQUIRE_FALSE(opts.db_path);
}

TEST_CASE("verbose raises the default log level", "[cli]") {
  REQUIRE(parse({"-v"}).log_level == "debug");
  REQUIRE(parse({"-v", "--log-level", "trace"}).log_level == "trace");
}

TEST_CASE("concurrency and upstream options", "[cli]") {
  CliOptions opts =
      parse({"--min-concurrency", "3", "--max-concurrency", "12",
             "--target-p95-ms", "1500", "--target-error-rate", "0.1",
             "--sample-window", "45s", "--tune-interval", "500ms", "-q", "20",
             "-e", "http://localhost:8000/v1/chat/completions", "-m",
             "tiny", "--timeout", "1m", "--max-tokens", "64"});
  REQUIRE(opts.concurrency_min == 3);
  REQUIRE(opts.concurrency_max == 12);
  REQUIRE(opts.target_p95_ms == 1500.0);
  REQUIRE(opts.target_error_rate == 0.1);
  REQUIRE(opts.sample_window == 45s);
  REQUIRE(opts.tune_interval == 500ms);
  REQUIRE(opts.queue_capacity == 20);
  REQUIRE(opts.endpoint_url == "http://localhost:8000/v1/chat/completions");
  REQUIRE(opts.model_id == "tiny");
  REQUIRE(opts.request_timeout == 60s);
  REQUIRE(opts.max_tokens == 64);
}

TEST_CASE("benchmark and telemetry options", "[cli]") {
  CliOptions opts =
      parse({"-b", "-n", "200", "--duration", "2m", "--pace", "5", "--no-db",
             "-p", "0", "--simulate", "--simulate-latency", "20ms",
             "--export-json", "run.json", "--report-json", "report.json"});
  REQUIRE(opts.bench);
  REQUIRE(opts.bench_jobs == 200);
  REQUIRE(opts.bench_duration == 120s);
  REQUIRE(opts.bench_pace == 5.0);
  REQUIRE(opts.no_db);
  REQUIRE(opts.metrics_port == 0);
  REQUIRE(opts.simulate);
  REQUIRE(opts.simulate_latency == 20ms);
  REQUIRE(opts.export_json == "run.json");
  REQUIRE(opts.report_json == "report.json");
}

TEST_CASE("log categories parse name and level", "[cli]") {
  CliOptions opts = parse({"--log-category", "tuner=trace", "--log-category",
                           "pool", "--log-rotate", "0", "--log-compress"});
  REQUIRE(opts.log_categories_explicit);
  REQUIRE(opts.log_categories.at("tuner") == "trace");
  REQUIRE(opts.log_categories.at("pool") == "debug");
  REQUIRE(opts.log_rotate == 0);
  REQUIRE(opts.log_compress);
  REQUIRE(opts.log_compress_explicit);
}

TEST_CASE("invalid values request a non-zero exit", "[cli]") {
  REQUIRE(exit_code_of({"--min-concurrency", "0"}) > 0);
  REQUIRE(exit_code_of({"--sample-window", "later"}) > 0);
  REQUIRE(exit_code_of({"--target-error-rate", "2"}) > 0);
  REQUIRE(exit_code_of({"--no-such-flag"}) > 0);
  REQUIRE(exit_code_of({"--version"}) == 0);
  REQUIRE(exit_code_of({"--help"}) == 0);
}

TEST_CASE("overrides win over configuration", "[cli]") {
  Config cfg;
  cfg.set_db_path("perf.db");
  CliOptions opts = parse({"--max-concurrency", "9", "--no-db", "--notes",
                           "nightly", "-G", "warn", "--simulate"});
  apply_cli_overrides(opts, cfg);
  REQUIRE(cfg.concurrency_max() == 9);
  REQUIRE(cfg.concurrency_min() == 2);
  REQUIRE(cfg.db_path().empty());
  REQUIRE(cfg.notes() == "nightly");
  REQUIRE(cfg.log_level() == "warn");
  REQUIRE(cfg.simulate_enabled());
}
