#include "concurrency_tuner.hpp"
#include "log.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>
#include <utility>

namespace llmperf {

namespace {
std::shared_ptr<spdlog::logger> tuner_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("tuner");
  }();
  return logger;
}

constexpr double kErrorEpsilon = 1e-9;
} // namespace

const char *to_string(TuneAction a) {
  switch (a) {
  case TuneAction::Hold:
    return "hold";
  case TuneAction::Increase:
    return "increase";
  case TuneAction::Decrease:
    return "decrease";
  }
  return "unknown";
}

/**
 * Single-step hill climbing against one sample.
 *
 * An empty window holds. An error rate or p95 above target steps down. A
 * comfortable p95 with no errors and a backlog steps up. With idle scale-down
 * enabled, a comfortable window with an empty queue steps down when the
 * average number of busy executors (throughput times p50) is at most
 * `current - decrease_step`. The result is always clamped to [min, max].
 *
 * @param options Targets, steps and bounds.
 * @param sample Latest window summary.
 * @param current Executor target in effect.
 * @return Decision with the action, the clamped target and a short reason.
 */
TuneDecision ConcurrencyTuner::evaluate(const TunerOptions &options,
                                        const Sample &sample, int current) {
  const int lo = options.min_concurrency;
  const int hi = std::max(lo, options.max_concurrency);
  TuneDecision decision;
  decision.previous = current;
  int proposed = current;
  const double comfortable = options.headroom_factor * options.target_p95_ms;
  const bool error_free = sample.error_rate <= kErrorEpsilon;

  if (sample.job_count == 0) {
    decision.reason = "empty window";
  } else if (sample.error_rate > options.target_error_rate) {
    proposed = current - options.decrease_step;
    decision.reason = "error rate above target";
  } else if (sample.p95_ms > options.target_p95_ms) {
    proposed = current - options.decrease_step;
    decision.reason = "p95 above target";
  } else if (sample.p95_ms < comfortable && error_free &&
             sample.queue_depth > 0) {
    proposed = current + options.increase_step;
    decision.reason = "latency headroom with queued work";
  } else if (options.scale_down_when_idle && sample.queue_depth == 0 &&
             error_free && sample.p95_ms < comfortable &&
             sample.throughput_rps * sample.p50_ms / 1000.0 <=
                 static_cast<double>(current - options.decrease_step)) {
    // Little's law: busy executors ~= arrival rate x service time
    proposed = current - options.decrease_step;
    decision.reason = "idle capacity";
  } else {
    decision.reason = "within targets";
  }

  decision.target = std::clamp(proposed, lo, hi);
  if (decision.target > current) {
    decision.action = TuneAction::Increase;
  } else if (decision.target < current) {
    decision.action = TuneAction::Decrease;
  } else {
    decision.action = TuneAction::Hold;
    if (proposed > hi) {
      decision.reason += " (at maximum)";
    } else if (proposed < lo) {
      decision.reason += " (at minimum)";
    }
  }
  return decision;
}

ConcurrencyTuner::ConcurrencyTuner(TunerOptions options,
                                   SampleAggregator &aggregator,
                                   WorkerPool &pool, RequestQueue &queue)
    : options_(std::move(options)), aggregator_(aggregator), pool_(pool),
      queue_(queue) {
  options_.min_concurrency = std::max(1, options_.min_concurrency);
  options_.max_concurrency =
      std::max(options_.min_concurrency, options_.max_concurrency);
  options_.increase_step = std::max(1, options_.increase_step);
  options_.decrease_step = std::max(1, options_.decrease_step);
}

ConcurrencyTuner::~ConcurrencyTuner() { stop(); }

void ConcurrencyTuner::add_listener(SampleListener listener) {
  std::lock_guard<std::mutex> lock(listeners_mutex_);
  listeners_.push_back(std::move(listener));
}

/**
 * One control step: summarize the window, evaluate, resize the pool and
 * hand the sample to every listener. Listener failures are logged.
 */
Sample ConcurrencyTuner::tick() {
  const int current = pool_.concurrency();
  Sample sample = aggregator_.tick(now_timestamp(), current, queue_.depth());
  TuneDecision decision = evaluate(sample, current);
  if (decision.target != current) {
    decision.target = pool_.resize(decision.target);
  }
  ticks_.fetch_add(1);
  if (decision.action != TuneAction::Hold) {
    tuner_log()->info(
        "{} {} -> {} ({}; p95={:.0f}ms err={:.3f} queue={} rps={:.2f})",
        to_string(decision.action), decision.previous, decision.target,
        decision.reason, sample.p95_ms, sample.error_rate, sample.queue_depth,
        sample.throughput_rps);
  } else {
    tuner_log()->debug("hold at {} ({}; p95={:.0f}ms err={:.3f} queue={})",
                       current, decision.reason, sample.p95_ms,
                       sample.error_rate, sample.queue_depth);
  }
  std::vector<SampleListener> listeners;
  {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners = listeners_;
  }
  for (const auto &listener : listeners) {
    try {
      listener(sample, decision);
    } catch (const std::exception &e) {
      tuner_log()->error("Sample listener failed: {}", e.what());
    }
  }
  return sample;
}

void ConcurrencyTuner::start() {
  if (running_) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = false;
  }
  running_ = true;
  thread_ = std::thread([this] { loop(); });
  tuner_log()->info("Tuner started (interval {}ms, p95 target {:.0f}ms, error "
                    "target {:.3f})",
                    options_.interval.count(), options_.target_p95_ms,
                    options_.target_error_rate);
}

void ConcurrencyTuner::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_requested_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
  running_ = false;
}

// Control thread body; ticks on a fixed schedule until stop().
void ConcurrencyTuner::loop() {
  auto next = std::chrono::steady_clock::now() + options_.interval;
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stop_requested_) {
    if (cv_.wait_until(lock, next, [this] { return stop_requested_; })) {
      break;
    }
    next += options_.interval;
    lock.unlock();
    try {
      tick();
    } catch (const std::exception &e) {
      tuner_log()->error("Tuner tick failed: {}", e.what());
    }
    lock.lock();
  }
}

} // namespace llmperf
