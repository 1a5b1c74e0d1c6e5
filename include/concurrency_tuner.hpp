/**
 * @file concurrency_tuner.hpp
 * @brief Feedback loop resizing the worker pool from rolling-window samples.
 */

#ifndef LLMPERF_CONCURRENCY_TUNER_HPP
#define LLMPERF_CONCURRENCY_TUNER_HPP

#include "request_queue.hpp"
#include "sample_aggregator.hpp"
#include "types.hpp"
#include "worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace llmperf {

/// Direction chosen by one tuning step.
enum class TuneAction { Hold, Increase, Decrease };

const char *to_string(TuneAction a);

/** Outcome of evaluating one Sample. */
struct TuneDecision {
  TuneAction action{TuneAction::Hold};
  int previous{0};    ///< Concurrency before the step
  int target{0};      ///< Concurrency after clamping
  std::string reason; ///< Short human-readable justification
};

/** Control-loop parameters. */
struct TunerOptions {
  int min_concurrency{2};
  int max_concurrency{6};
  double target_p95_ms{2500.0};
  double target_error_rate{0.03};
  int increase_step{1};
  int decrease_step{1};
  /// Fraction of the p95 target under which latency counts as comfortable.
  double headroom_factor{0.7};
  bool scale_down_when_idle{true};
  std::chrono::milliseconds interval{15000};
};

/**
 * Single-step hill climber.
 *
 * Each tick asks the aggregator for a Sample, decides a step, applies it to
 * the pool and hands the Sample to every listener.
 */
class ConcurrencyTuner {
public:
  using SampleListener =
      std::function<void(const Sample &, const TuneDecision &)>;

  ConcurrencyTuner(TunerOptions options, SampleAggregator &aggregator,
                   WorkerPool &pool, RequestQueue &queue);

  /// Stops the control thread.
  ~ConcurrencyTuner();

  ConcurrencyTuner(const ConcurrencyTuner &) = delete;
  ConcurrencyTuner &operator=(const ConcurrencyTuner &) = delete;

  /**
   * Decide the next concurrency for @p sample.
   *
   * An empty window holds. An error rate or p95 above target decreases.
   * Comfortable latency with no errors and a non-empty queue increases. With
   * idle scale-down enabled, an empty queue whose busy-executor estimate
   * (throughput x p50) leaves at least one step of slack decreases. The
   * result is always within [min, max].
   *
   * @param options Thresholds and bounds.
   * @param sample Latest window.
   * @param current Concurrency in effect.
   */
  static TuneDecision evaluate(const TunerOptions &options,
                               const Sample &sample, int current);

  /// evaluate() with this tuner's options.
  TuneDecision evaluate(const Sample &sample, int current) const {
    return evaluate(options_, sample, current);
  }

  /**
   * Run one control iteration: sample, decide, resize, notify.
   *
   * @return Sample emitted by this tick.
   */
  Sample tick();

  /// Register a callback invoked after every tick.
  void add_listener(SampleListener listener);

  /// Launch the periodic control thread.
  void start();

  /// Stop the control thread and wait for it.
  void stop();

  bool running() const { return running_.load(); }

  /// Ticks executed so far.
  std::uint64_t ticks() const { return ticks_.load(); }

  const TunerOptions &options() const { return options_; }

private:
  void loop();

  TunerOptions options_;
  SampleAggregator &aggregator_;
  WorkerPool &pool_;
  RequestQueue &queue_;

  std::mutex listeners_mutex_;
  std::vector<SampleListener> listeners_;

  std::thread thread_;
  std::mutex mutex_;
  std::condition_variable cv_;
  bool stop_requested_{false};
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> ticks_{0};
};

} // namespace llmperf

#endif // LLMPERF_CONCURRENCY_TUNER_HPP
