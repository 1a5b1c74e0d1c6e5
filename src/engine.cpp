/**
 * @file engine.cpp
 * @brief Wiring of queue, executors, tuner, telemetry and metrics.
 */
#include "engine.hpp"
#include "http_client.hpp"
#include "log.hpp"
#include "simulated_client.hpp"
#include "version.hpp"

#include <spdlog/spdlog.h>
#include <utility>

namespace llmperf {

namespace {
std::shared_ptr<spdlog::logger> engine_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("engine");
  }();
  return logger;
}

PoolOptions pool_options(const Config &config) {
  PoolOptions options;
  options.min_workers = config.concurrency_min();
  options.max_workers = config.concurrency_max();
  options.max_retries = config.max_retries();
  options.retry_base_delay = config.retry_base_delay();
  options.retry_max_delay = config.retry_max_delay();
  return options;
}

TunerOptions tuner_options(const Config &config) {
  TunerOptions options;
  options.min_concurrency = config.concurrency_min();
  options.max_concurrency = config.concurrency_max();
  options.target_p95_ms = config.target_p95_ms();
  options.target_error_rate = config.target_error_rate();
  options.increase_step = config.increase_step();
  options.decrease_step = config.decrease_step();
  options.scale_down_when_idle = config.scale_down_when_idle();
  options.interval = config.tune_interval();
  return options;
}
} // namespace

PerfEngine::PerfEngine(Config config, std::shared_ptr<CompletionClient> client,
                       std::unique_ptr<TelemetryRecorder> recorder)
    : config_(std::move(config)), client_(std::move(client)),
      queue_(static_cast<std::size_t>(config_.queue_capacity())),
      aggregator_(config_.sample_window()), recorder_(std::move(recorder)) {
  if (!recorder_) {
    const std::string host =
        config_.host().empty() ? local_hostname() : config_.host();
    recorder_ = TelemetryRecorder::open(config_.db_path(), config_.model_id(),
                                        host, config_.notes());
  }
  feed_.set_run_id(recorder_->run().run_id);
  pool_ = std::make_unique<WorkerPool>(
      queue_, client_, pool_options(config_),
      [this](const JobRecord &record) { on_record(record); });
  tuner_ = std::make_unique<ConcurrencyTuner>(tuner_options(config_),
                                              aggregator_, *pool_, queue_);
  tuner_->add_listener([this](const Sample &sample,
                              const TuneDecision &decision) {
    on_sample(sample, decision);
  });
  feed_.set_state_provider([this] { return pool_state(); });
}

PerfEngine::~PerfEngine() { stop(); }

std::shared_ptr<CompletionClient> PerfEngine::make_client(const Config &config) {
  if (config.simulate_enabled()) {
    SimulationOptions options;
    options.latency = config.simulate_latency();
    options.error_rate = config.simulate_error_rate();
    options.error_status = config.simulate_error_status();
    engine_log()->info("Using simulated upstream ({}ms, error rate {:.3f})",
                       options.latency.count(), options.error_rate);
    return std::make_shared<SimulatedCompletionClient>(options);
  }
  auto http = std::make_shared<CurlHttpClient>(std::string("llmperf/") +
                                               kVersionString);
  return std::make_shared<OpenAICompletionClient>(
      http, config.endpoint_url(), config.api_key(), config.request_timeout());
}

void PerfEngine::set_record_callback(RecordCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  callback_ = std::move(callback);
}

void PerfEngine::start() {
  if (running_) {
    return;
  }
  const int initial = config_.effective_concurrency_start();
  pool_->start(initial);
  tuner_->start();
  running_ = true;
  if (config_.metrics_port() > 0) {
    MetricsServerOptions options;
    options.bind_address = config_.metrics_bind_address();
    options.port = config_.metrics_port();
    metrics_ = std::make_unique<MetricsServer>(feed_, options);
    try {
      metrics_->start();
    } catch (const std::exception &e) {
      engine_log()->error("Metrics endpoint disabled: {}", e.what());
      metrics_.reset();
    }
  }
  engine_log()->info("Engine started: run {} model {} concurrency {} [{}, {}] "
                     "queue {}",
                     run().run_id, config_.model_id(), initial,
                     config_.concurrency_min(), config_.concurrency_max(),
                     config_.queue_capacity());
}

Admission PerfEngine::submit(Job job) {
  if (job.id == 0) {
    job.id = next_job_id_.fetch_add(1);
  }
  if (job.model_id.empty()) {
    job.model_id = config_.model_id();
  }
  if (job.max_tokens <= 0) {
    job.max_tokens = config_.max_tokens();
  }
  if (job.created_at == Timestamp{}) {
    job.created_at = now_timestamp();
  }
  Admission result = queue_.submit(std::move(job));
  if (result != Admission::Accepted) {
    engine_log()->debug("Submission {} (depth {})", to_string(result),
                        queue_.depth());
  }
  return result;
}

Admission PerfEngine::submit_prompt(const std::string &prompt) {
  Job job = make_prompt_job(prompt, config_.model_id());
  job.max_tokens = config_.max_tokens();
  job.temperature = config_.temperature();
  return submit(std::move(job));
}

bool PerfEngine::stop() {
  if (stopped_.exchange(true)) {
    return true;
  }
  if (!running_) {
    recorder_->finish(now_timestamp());
    feed_.close();
    return true;
  }
  engine_log()->info("Stopping: draining {} queued and {} in-flight jobs",
                     queue_.depth(), pool_->in_flight());
  tuner_->stop();
  const bool drained = pool_->stop(config_.drain_timeout());
  if (!drained) {
    engine_log()->warn("Drain timeout reached; outstanding jobs cancelled");
  }
  try {
    Sample last = aggregator_.tick(now_timestamp(), pool_->concurrency(),
                                   queue_.depth());
    on_sample(last, TuneDecision{});
  } catch (const std::exception &e) {
    engine_log()->error("Final sample failed: {}", e.what());
  }
  if (metrics_) {
    metrics_->stop();
  }
  feed_.close();
  recorder_->finish(now_timestamp());
  running_ = false;
  engine_log()->info("Engine stopped: {} accepted, {} rejected, {} completed",
                     queue_.accepted(), queue_.rejected(),
                     pool_->completed());
  return drained;
}

PoolState PerfEngine::pool_state() const {
  PoolState state;
  state.concurrency = pool_->concurrency();
  state.live_workers = static_cast<std::size_t>(pool_->live_workers());
  state.queue_depth = queue_.depth();
  state.in_flight = pool_->in_flight();
  state.completed = pool_->completed();
  return state;
}

EngineStatus PerfEngine::status() const {
  EngineStatus status;
  status.pool = pool_state();
  status.accepted = queue_.accepted();
  status.rejected = queue_.rejected();
  status.ticks = tuner_->ticks();
  status.persistent = recorder_->persistent();
  return status;
}

void PerfEngine::on_record(const JobRecord &record) {
  aggregator_.record(record);
  recorder_->record_job(record);
  RecordCallback callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = callback_;
  }
  if (callback) {
    callback(record);
  }
}

void PerfEngine::on_sample(const Sample &sample, const TuneDecision &) {
  recorder_->record_sample(sample);
  feed_.publish(sample);
}

} // namespace llmperf
