/**
 * @file config.hpp
 * @brief Tunables for the performance layer.
 *
 * Declares the Config class loaded from YAML, TOML or JSON files and from
 * environment variables, together with the validation error type.
 */

#ifndef LLMPERF_CONFIG_HPP
#define LLMPERF_CONFIG_HPP

#include <chrono>
#include <nlohmann/json_fwd.hpp>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace llmperf {

/// Raised when configuration values are malformed or out of bounds.
class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Application configuration loaded from a YAML, TOML, or JSON file.
class Config {
public:
  using Millis = std::chrono::milliseconds;

  // Concurrency bounds

  /// Lower bound on live executors.
  int concurrency_min() const { return concurrency_min_; }
  void set_concurrency_min(int v) { concurrency_min_ = v; }

  /// Upper bound on live executors.
  int concurrency_max() const { return concurrency_max_; }
  void set_concurrency_max(int v) { concurrency_max_ = v; }

  /// Requested initial concurrency (0 = start at the minimum).
  int concurrency_start() const { return concurrency_start_; }
  void set_concurrency_start(int v) { concurrency_start_ = v; }

  /// Initial concurrency clamped to [min, max].
  int effective_concurrency_start() const;

  // Tuning targets

  /// p95 latency objective in milliseconds.
  double target_p95_ms() const { return target_p95_ms_; }
  void set_target_p95_ms(double v) { target_p95_ms_ = v; }

  /// Maximum tolerated error fraction per window.
  double target_error_rate() const { return target_error_rate_; }
  void set_target_error_rate(double v) { target_error_rate_ = v; }

  /// Rolling window length used for samples.
  Millis sample_window() const { return sample_window_; }
  void set_sample_window(Millis v) { sample_window_ = v; }

  /// Period of the control loop.
  Millis tune_interval() const { return tune_interval_; }
  void set_tune_interval(Millis v) { tune_interval_ = v; }

  /// Executors added per increase decision.
  int increase_step() const { return increase_step_; }
  void set_increase_step(int v) { increase_step_ = v; }

  /// Executors removed per decrease decision.
  int decrease_step() const { return decrease_step_; }
  void set_decrease_step(int v) { decrease_step_ = v; }

  /// Shrink the pool when it is demonstrably over-provisioned and idle.
  bool scale_down_when_idle() const { return scale_down_when_idle_; }
  void set_scale_down_when_idle(bool v) { scale_down_when_idle_ = v; }

  // Queue, retries and shutdown

  /// Bounded intake capacity.
  int queue_capacity() const { return queue_capacity_; }
  void set_queue_capacity(int v) { queue_capacity_ = v; }

  /// Retries after the first attempt for transient failures.
  int max_retries() const { return max_retries_; }
  void set_max_retries(int v) { max_retries_ = v; }

  /// Base delay for exponential backoff.
  Millis retry_base_delay() const { return retry_base_delay_; }
  void set_retry_base_delay(Millis v) { retry_base_delay_ = v; }

  /// Backoff ceiling.
  Millis retry_max_delay() const { return retry_max_delay_; }
  void set_retry_max_delay(Millis v) { retry_max_delay_ = v; }

  /// Time allowed for accepted jobs to finish on stop.
  Millis drain_timeout() const { return drain_timeout_; }
  void set_drain_timeout(Millis v) { drain_timeout_ = v; }

  // Upstream endpoint

  /// Chat completions URL.
  const std::string &endpoint_url() const { return endpoint_url_; }
  void set_endpoint_url(const std::string &v) { endpoint_url_ = v; }

  /// Model identifier sent with each request.
  const std::string &model_id() const { return model_id_; }
  void set_model_id(const std::string &v) { model_id_ = v; }

  /// Optional bearer token.
  const std::string &api_key() const { return api_key_; }
  void set_api_key(const std::string &v) { api_key_ = v; }

  /// Per-request timeout.
  Millis request_timeout() const { return request_timeout_; }
  void set_request_timeout(Millis v) { request_timeout_ = v; }

  /// Default completion token cap.
  int max_tokens() const { return max_tokens_; }
  void set_max_tokens(int v) { max_tokens_ = v; }

  /// Default sampling temperature.
  double temperature() const { return temperature_; }
  void set_temperature(double v) { temperature_ = v; }

  // Simulated upstream

  /// Replace the HTTP upstream with an in-process simulation.
  bool simulate_enabled() const { return simulate_enabled_; }
  void set_simulate_enabled(bool v) { simulate_enabled_ = v; }

  /// Latency of each simulated completion.
  Millis simulate_latency() const { return simulate_latency_; }
  void set_simulate_latency(Millis v) { simulate_latency_ = v; }

  /// Fraction of simulated completions that fail.
  double simulate_error_rate() const { return simulate_error_rate_; }
  void set_simulate_error_rate(double v) { simulate_error_rate_ = v; }

  /// HTTP status reported by simulated failures.
  int simulate_error_status() const { return simulate_error_status_; }
  void set_simulate_error_status(int v) { simulate_error_status_ = v; }

  // Telemetry persistence

  /// SQLite database path (empty disables persistence).
  const std::string &db_path() const { return db_path_; }
  void set_db_path(const std::string &v) { db_path_ = v; }

  /// Host label recorded with each run (empty = hostname).
  const std::string &host() const { return host_; }
  void set_host(const std::string &v) { host_ = v; }

  /// Free-form notes recorded with each run.
  const std::string &notes() const { return notes_; }
  void set_notes(const std::string &v) { notes_ = v; }

  // Metrics feed

  /// Metrics HTTP port (0 disables the listener).
  int metrics_port() const { return metrics_port_; }
  void set_metrics_port(int v) { metrics_port_ = v; }

  /// Address the metrics listener binds to.
  const std::string &metrics_bind_address() const {
    return metrics_bind_address_;
  }
  void set_metrics_bind_address(const std::string &v) {
    metrics_bind_address_ = v;
  }

  // Benchmark

  /// Number of jobs to submit (0 = bounded by duration only).
  int bench_jobs() const { return bench_jobs_; }
  void set_bench_jobs(int v) { bench_jobs_ = v; }

  /// Submission duration (0 = bounded by job count only).
  Millis bench_duration() const { return bench_duration_; }
  void set_bench_duration(Millis v) { bench_duration_ = v; }

  /// File with one prompt per line.
  const std::string &bench_prompt_file() const { return bench_prompt_file_; }
  void set_bench_prompt_file(const std::string &v) { bench_prompt_file_ = v; }

  /// Submission pace in jobs per second (0 = as fast as admission allows).
  double bench_pace() const { return bench_pace_; }
  void set_bench_pace(double v) { bench_pace_ = v; }

  // Logging

  const std::string &log_level() const { return log_level_; }
  void set_log_level(const std::string &v) { log_level_ = v; }

  const std::string &log_pattern() const { return log_pattern_; }
  void set_log_pattern(const std::string &v) { log_pattern_ = v; }

  const std::string &log_file() const { return log_file_; }
  void set_log_file(const std::string &v) { log_file_ = v; }

  /// Rotated log files to keep (0 disables rotation).
  int log_rotate() const { return log_rotate_; }
  void set_log_rotate(int v) { log_rotate_ = v < 0 ? 0 : v; }

  bool log_compress() const { return log_compress_; }
  void set_log_compress(bool v) { log_compress_ = v; }

  /// Category -> level overrides.
  const std::unordered_map<std::string, std::string> &log_categories() const {
    return log_categories_;
  }
  void set_log_categories(std::unordered_map<std::string, std::string> v) {
    log_categories_ = std::move(v);
  }

  /**
   * Check every tunable against its bounds.
   *
   * @throws ConfigError Naming the first offending key.
   */
  void validate() const;

  /**
   * Override values from the process environment.
   *
   * Reads CONCURRENCY_MIN, CONCURRENCY_MAX, CONCURRENCY_START, TARGET_P95_MS,
   * TARGET_ERROR_RATE, SAMPLE_WINDOW_SEC, TUNE_INTERVAL_SEC, INCREASE_STEP,
   * DECREASE_STEP, REQUEST_TIMEOUT_SEC, METRICS_PORT, BACKPRESSURE_QUEUE_MAX,
   * LLM_ENDPOINT, MODEL_ID, MAX_TOKENS, TEMPERATURE, PERF_DB_PATH and
   * LLM_API_KEY.
   *
   * @throws ConfigError When a variable is set but cannot be parsed.
   */
  void apply_environment();

  /**
   * Merge values from a JSON document, flat or grouped in sections.
   *
   * @throws ConfigError When a value has the wrong type.
   */
  void load_json(const nlohmann::json &j);

  /// Effective configuration as flat JSON, secrets redacted.
  nlohmann::json to_json() const;

  /// Build a configuration from JSON on top of the defaults.
  static Config from_json(const nlohmann::json &j);

  /**
   * Load configuration from a YAML, TOML or JSON file chosen by extension.
   *
   * @throws std::runtime_error When the file cannot be read or parsed.
   */
  static Config from_file(const std::string &path);

private:
  int concurrency_min_{2};
  int concurrency_max_{6};
  int concurrency_start_{0};
  double target_p95_ms_{2500.0};
  double target_error_rate_{0.03};
  Millis sample_window_{std::chrono::seconds(30)};
  Millis tune_interval_{std::chrono::seconds(15)};
  int increase_step_{1};
  int decrease_step_{1};
  bool scale_down_when_idle_{true};
  int queue_capacity_{8};
  int max_retries_{3};
  Millis retry_base_delay_{std::chrono::seconds(1)};
  Millis retry_max_delay_{std::chrono::seconds(30)};
  Millis drain_timeout_{std::chrono::seconds(30)};
  std::string endpoint_url_{"http://127.0.0.1:1234/v1/chat/completions"};
  std::string model_id_{"meta-llama-3-8b-instruct"};
  std::string api_key_;
  Millis request_timeout_{std::chrono::seconds(60)};
  int max_tokens_{128};
  double temperature_{0.7};
  bool simulate_enabled_{false};
  Millis simulate_latency_{std::chrono::milliseconds(50)};
  double simulate_error_rate_{0.0};
  int simulate_error_status_{503};
  std::string db_path_{"perf.db"};
  std::string host_;
  std::string notes_;
  int metrics_port_{8088};
  std::string metrics_bind_address_{"127.0.0.1"};
  int bench_jobs_{0};
  Millis bench_duration_{0};
  std::string bench_prompt_file_;
  double bench_pace_{0.0};
  std::string log_level_{"info"};
  std::string log_pattern_;
  std::string log_file_;
  int log_rotate_{3};
  bool log_compress_{false};
  std::unordered_map<std::string, std::string> log_categories_;
};

} // namespace llmperf

#endif // LLMPERF_CONFIG_HPP
