#include "benchmark_driver.hpp"
#include "simulated_client.hpp"

#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace llmperf;
using namespace std::chrono_literals;

namespace {
Config bench_config() {
  Config cfg;
  cfg.set_simulate_enabled(true);
  cfg.set_simulate_latency(50ms);
  cfg.set_db_path(":memory:");
  cfg.set_metrics_port(0);
  cfg.set_concurrency_min(2);
  cfg.set_concurrency_max(6);
  cfg.set_queue_capacity(8);
  cfg.set_sample_window(600ms);
  cfg.set_tune_interval(200ms);
  cfg.set_drain_timeout(5s);
  return cfg;
}
} // namespace

TEST_CASE("prompt files skip blank lines", "[bench]") {
  auto path = std::filesystem::temp_directory_path() / "llmperf_prompts.txt";
  {
    std::ofstream f(path);
    f << "  first prompt  \n\n\t\nsecond prompt\r\n";
  }
  auto prompts = load_prompts(path.string());
  REQUIRE(prompts.size() == 2);
  REQUIRE(prompts[0] == "first prompt");
  REQUIRE(prompts[1] == "second prompt");

  {
    std::ofstream f(path);
    f << "\n  \n";
  }
  REQUIRE_THROWS_AS(load_prompts(path.string()), std::runtime_error);
  std::filesystem::remove(path);
  REQUIRE_THROWS_AS(load_prompts(path.string()), std::runtime_error);
  REQUIRE(default_prompts().size() == 5);
}

TEST_CASE("a benchmark needs a bound", "[bench]") {
  PerfEngine engine(bench_config(),
                    PerfEngine::make_client(bench_config()));
  REQUIRE_THROWS_AS(BenchmarkDriver(engine, BenchmarkOptions{}), ConfigError);
  BenchmarkOptions negative;
  negative.jobs = 1;
  negative.pace = -1.0;
  REQUIRE_THROWS_AS(BenchmarkDriver(engine, negative), ConfigError);
}

TEST_CASE("fixed job count completes every job", "[bench]") {
  Config cfg = bench_config();
  cfg.set_simulate_latency(5ms);
  PerfEngine engine(cfg, PerfEngine::make_client(cfg));
  BenchmarkOptions options;
  options.jobs = 40;
  options.reject_backoff = 2ms;
  BenchmarkDriver driver(engine, options);
  auto report = driver.run();
  REQUIRE(report.submitted == 40);
  REQUIRE(report.completed == 40);
  REQUIRE(report.failed == 0);
  REQUIRE(report.drained);
  REQUIRE(report.run_id == engine.run().run_id);
  REQUIRE(report.summary);
  REQUIRE(report.summary->total_jobs == 40);

  nlohmann::json j = report;
  REQUIRE(j["completed"] == 40);
  REQUIRE(j["summary"]["total_jobs"] == 40);
  auto text = format_report(report);
  REQUIRE(text.find("Jobs Completed: 40") != std::string::npos);
}

TEST_CASE("saturated benchmark converges to the maximum", "[bench]") {
  Config cfg = bench_config();
  PerfEngine engine(cfg, PerfEngine::make_client(cfg));
  BenchmarkOptions options;
  options.duration = 3s;
  options.reject_backoff = 5ms;
  BenchmarkDriver driver(engine, options);
  auto report = driver.run();

  REQUIRE(report.drained);
  REQUIRE(report.final_concurrency == 6);
  REQUIRE(report.failed == 0);
  REQUIRE(report.rejected > 0);
  // 6 executors x (1 / 50 ms) = 120 requests per second
  REQUIRE(report.final_sample.throughput_rps > 90.0);
  REQUIRE(report.final_sample.throughput_rps < 150.0);
  REQUIRE(report.elapsed >= 3s);
  REQUIRE(report.elapsed < 6s);
  REQUIRE(report.summary);
  REQUIRE(report.summary->run.finished_at);
  auto run_length =
      *report.summary->run.finished_at - report.summary->run.started_at;
  REQUIRE(run_length >= 3s);
  REQUIRE(run_length < 7s);
}

TEST_CASE("interrupt ends submission early", "[bench]") {
  Config cfg = bench_config();
  cfg.set_simulate_latency(5ms);
  PerfEngine engine(cfg, PerfEngine::make_client(cfg));
  BenchmarkOptions options;
  options.duration = 30s;
  BenchmarkDriver driver(engine, options);
  std::atomic<bool> interrupt{true};
  auto started = std::chrono::steady_clock::now();
  auto report = driver.run(&interrupt);
  REQUIRE(std::chrono::steady_clock::now() - started < 5s);
  REQUIRE(report.submitted == 0);
  REQUIRE(report.drained);
}
