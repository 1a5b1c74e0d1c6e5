#include "config.hpp"

#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <stdexcept>

using namespace llmperf;
using namespace std::chrono_literals;

TEST_CASE("defaults are valid", "[config]") {
  Config cfg;
  REQUIRE_NOTHROW(cfg.validate());
  REQUIRE(cfg.concurrency_min() == 2);
  REQUIRE(cfg.concurrency_max() == 6);
  REQUIRE(cfg.effective_concurrency_start() == 2);
  REQUIRE(cfg.target_p95_ms() == 2500.0);
  REQUIRE(cfg.target_error_rate() == 0.03);
  REQUIRE(cfg.sample_window() == 30s);
  REQUIRE(cfg.tune_interval() == 15s);
  REQUIRE(cfg.db_path() == "perf.db");
  REQUIRE(cfg.metrics_port() == 8088);
}

TEST_CASE("validation rejects inconsistent bounds", "[config]") {
  Config cfg;
  cfg.set_concurrency_min(5);
  cfg.set_concurrency_max(3);
  REQUIRE_THROWS_AS(cfg.validate(), ConfigError);

  Config zero;
  zero.set_concurrency_min(0);
  REQUIRE_THROWS_AS(zero.validate(), ConfigError);

  Config rate;
  rate.set_target_error_rate(1.5);
  REQUIRE_THROWS_AS(rate.validate(), ConfigError);

  Config port;
  port.set_metrics_port(70000);
  REQUIRE_THROWS_AS(port.validate(), ConfigError);

  Config endpoint;
  endpoint.set_endpoint_url("");
  REQUIRE_THROWS_AS(endpoint.validate(), ConfigError);
  endpoint.set_simulate_enabled(true);
  REQUIRE_NOTHROW(endpoint.validate());
}

TEST_CASE("start concurrency is clamped to the bounds", "[config]") {
  Config cfg;
  cfg.set_concurrency_start(10);
  REQUIRE(cfg.effective_concurrency_start() == 6);
  cfg.set_concurrency_start(4);
  REQUIRE(cfg.effective_concurrency_start() == 4);
}

TEST_CASE("grouped sections and durations load from json", "[config]") {
  nlohmann::json doc;
  doc["concurrency"] = {{"min", 3}, {"max", 9}};
  doc["targets"] = {{"p95_ms", 1800}, {"error_rate", 0.05}};
  doc["tuning"] = {{"sample_window", "45s"}, {"tune_interval", 5}};
  doc["queue"] = {{"backpressure_queue_max", 32}};
  doc["logging"] = {{"level", "debug"}, {"categories", {{"tuner", "TRACE"}}}};
  doc["bench"] = {{"duration", "2m"}, {"jobs", 50}};
  Config cfg = Config::from_json(doc);
  REQUIRE(cfg.concurrency_min() == 3);
  REQUIRE(cfg.concurrency_max() == 9);
  REQUIRE(cfg.target_p95_ms() == 1800.0);
  REQUIRE(cfg.target_error_rate() == 0.05);
  REQUIRE(cfg.sample_window() == 45s);
  REQUIRE(cfg.tune_interval() == 5s);
  REQUIRE(cfg.queue_capacity() == 32);
  REQUIRE(cfg.log_level() == "debug");
  REQUIRE(cfg.log_categories().at("tuner") == "trace");
  REQUIRE(cfg.bench_duration() == 120s);
  REQUIRE(cfg.bench_jobs() == 50);
}

TEST_CASE("bad values name the offending key", "[config]") {
  nlohmann::json doc = {{"concurrency_min", "lots"}};
  try {
    Config::from_json(doc);
    FAIL("expected ConfigError");
  } catch (const ConfigError &e) {
    REQUIRE(std::string(e.what()).find("concurrency_min") !=
            std::string::npos);
  }
  nlohmann::json window = {{"sample_window", "soon"}};
  REQUIRE_THROWS_AS(Config::from_json(window), ConfigError);
}

TEST_CASE("environment overrides file values", "[config]") {
  Config cfg;
  cfg.set_concurrency_max(4);
  setenv("CONCURRENCY_MAX", "12", 1);
  setenv("SAMPLE_WINDOW_SEC", "2.5", 1);
  setenv("MODEL_ID", "env-model", 1);
  cfg.apply_environment();
  unsetenv("CONCURRENCY_MAX");
  unsetenv("SAMPLE_WINDOW_SEC");
  unsetenv("MODEL_ID");
  REQUIRE(cfg.concurrency_max() == 12);
  REQUIRE(cfg.sample_window() == 2500ms);
  REQUIRE(cfg.model_id() == "env-model");

  setenv("TARGET_P95_MS", "fast", 1);
  REQUIRE_THROWS_AS(cfg.apply_environment(), ConfigError);
  unsetenv("TARGET_P95_MS");
}

TEST_CASE("config files load by extension", "[config]") {
  auto dir = std::filesystem::temp_directory_path();
  {
    std::ofstream f(dir / "llmperf_cfg.yaml");
    f << "concurrency:\n";
    f << "  min: 1\n";
    f << "  max: 4\n";
    f << "upstream:\n";
    f << "  endpoint_url: http://localhost:8000/v1/chat/completions\n";
    f << "  model_id: yaml-model\n";
    f << "  request_timeout: 30s\n";
    f << "telemetry:\n";
    f << "  db_path: yaml.db\n";
  }
  Config ycfg = Config::from_file((dir / "llmperf_cfg.yaml").string());
  REQUIRE(ycfg.concurrency_min() == 1);
  REQUIRE(ycfg.concurrency_max() == 4);
  REQUIRE(ycfg.endpoint_url() == "http://localhost:8000/v1/chat/completions");
  REQUIRE(ycfg.model_id() == "yaml-model");
  REQUIRE(ycfg.request_timeout() == 30s);
  REQUIRE(ycfg.db_path() == "yaml.db");

  {
    std::ofstream f(dir / "llmperf_cfg.json");
    f << R"({"metrics": {"port": 0, "bind_address": "0.0.0.0"},
             "simulate": {"enabled": true, "latency": "20ms"}})";
  }
  Config jcfg = Config::from_file((dir / "llmperf_cfg.json").string());
  REQUIRE(jcfg.metrics_port() == 0);
  REQUIRE(jcfg.metrics_bind_address() == "0.0.0.0");
  REQUIRE(jcfg.simulate_enabled());
  REQUIRE(jcfg.simulate_latency() == 20ms);

  {
    std::ofstream f(dir / "llmperf_cfg.toml");
    f << "[concurrency]\nmin = 2\nmax = 8\n\n[targets]\np95_ms = 900.0\n";
  }
  Config tcfg = Config::from_file((dir / "llmperf_cfg.toml").string());
  REQUIRE(tcfg.concurrency_max() == 8);
  REQUIRE(tcfg.target_p95_ms() == 900.0);

  REQUIRE_THROWS(Config::from_file((dir / "llmperf_cfg.ini").string()));

  std::filesystem::remove(dir / "llmperf_cfg.yaml");
  std::filesystem::remove(dir / "llmperf_cfg.json");
  std::filesystem::remove(dir / "llmperf_cfg.toml");
}

TEST_CASE("to_json masks the api key", "[config]") {
  Config cfg;
  cfg.set_api_key("sk-secret");
  auto j = cfg.to_json();
  REQUIRE(j["api_key"] == "***");
  REQUIRE(j["sample_window"] == "30s");
  REQUIRE(j["concurrency_max"] == 6);
}
