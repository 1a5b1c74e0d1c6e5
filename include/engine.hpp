/**
 * @file engine.hpp
 * @brief Wiring of queue, pool, tuner, telemetry and metrics for one run.
 */
#ifndef LLMPERF_ENGINE_HPP
#define LLMPERF_ENGINE_HPP

#include "completion_client.hpp"
#include "concurrency_tuner.hpp"
#include "config.hpp"
#include "metrics_server.hpp"
#include "request_queue.hpp"
#include "sample_aggregator.hpp"
#include "telemetry_store.hpp"
#include "types.hpp"
#include "worker_pool.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace llmperf {

/** Point-in-time view of an engine. */
struct EngineStatus {
  PoolState pool;
  std::uint64_t accepted{0};
  std::uint64_t rejected{0};
  std::uint64_t ticks{0};
  bool persistent{false};
};

/**
 * Owns the request queue, worker pool, aggregator, tuner, telemetry
 * recorder and metrics surface of one run.
 *
 * Every JobRecord produced by the pool is fed to the aggregator, the
 * recorder and the optional record callback. Every tuner Sample is recorded
 * and published to the metrics feed.
 */
class PerfEngine {
public:
  using RecordCallback = std::function<void(const JobRecord &)>;

  /**
   * Construct a stopped engine.
   *
   * @param config Validated configuration.
   * @param client Upstream client; see make_client().
   * @param recorder Telemetry recorder, or null to open one from
   *        `config.db_path()`.
   */
  PerfEngine(Config config, std::shared_ptr<CompletionClient> client,
             std::unique_ptr<TelemetryRecorder> recorder = nullptr);

  /// Stops the engine if it is still running.
  ~PerfEngine();

  PerfEngine(const PerfEngine &) = delete;
  PerfEngine &operator=(const PerfEngine &) = delete;

  /**
   * Build the upstream client @p config selects: the simulated client when
   * simulation is enabled, otherwise the OpenAI-compatible HTTP client.
   */
  static std::shared_ptr<CompletionClient> make_client(const Config &config);

  /// Receive every JobRecord on the executor thread that produced it.
  void set_record_callback(RecordCallback callback);

  /**
   * Start executors, the tuner and, when a port is configured, the metrics
   * listener.
   *
   * @throws std::runtime_error When the minimum executors cannot start.
   */
  void start();

  /**
   * Submit a job. Missing model, token cap and timestamps are filled from
   * the configuration and an id is assigned when the job has none.
   */
  Admission submit(Job job);

  /// Submit a single-turn prompt.
  Admission submit_prompt(const std::string &prompt);

  /**
   * Drain for up to the configured drain timeout, emit a final sample,
   * finish the run and stop every thread. Only the first call has an effect.
   *
   * @return `true` if all accepted work completed before the timeout.
   */
  bool stop();

  bool running() const { return running_.load(); }

  EngineStatus status() const;
  PoolState pool_state() const;

  const Config &config() const { return config_; }
  const Run &run() const { return recorder_->run(); }

  RequestQueue &queue() { return queue_; }
  WorkerPool &pool() { return *pool_; }
  SampleAggregator &aggregator() { return aggregator_; }
  ConcurrencyTuner &tuner() { return *tuner_; }
  TelemetryRecorder &recorder() { return *recorder_; }
  MetricsFeed &feed() { return feed_; }

  /// Metrics listener, or null when disabled or not started.
  MetricsServer *metrics_server() { return metrics_.get(); }

private:
  void on_record(const JobRecord &record);
  void on_sample(const Sample &sample, const TuneDecision &decision);

  Config config_;
  std::shared_ptr<CompletionClient> client_;
  RequestQueue queue_;
  SampleAggregator aggregator_;
  std::unique_ptr<TelemetryRecorder> recorder_;
  MetricsFeed feed_;
  std::unique_ptr<WorkerPool> pool_;
  std::unique_ptr<ConcurrencyTuner> tuner_;
  std::unique_ptr<MetricsServer> metrics_;

  std::mutex callback_mutex_;
  RecordCallback callback_;
  std::atomic<std::uint64_t> next_job_id_{1};
  std::atomic<bool> running_{false};
  std::atomic<bool> stopped_{false};
};

} // namespace llmperf

#endif // LLMPERF_ENGINE_HPP
