/**
 * @file sample_aggregator.hpp
 * @brief Rolling-window statistics over completed jobs.
 */

#ifndef LLMPERF_SAMPLE_AGGREGATOR_HPP
#define LLMPERF_SAMPLE_AGGREGATOR_HPP

#include "types.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace llmperf {

/**
 * Nearest-rank percentile of already sorted values.
 *
 * @param sorted Values in ascending order.
 * @param q Quantile in [0, 1].
 * @return Value at rank `ceil(q * n)`, or 0 for an empty input.
 */
double nearest_rank(const std::vector<double> &sorted, double q);

/**
 * Collects JobRecords and turns the ones inside the trailing window into a
 * Sample on every tick.
 *
 * record() and tick() may be called from different threads.
 */
class SampleAggregator {
public:
  /// @param window Length of the trailing window, keyed by finish time.
  explicit SampleAggregator(std::chrono::milliseconds window);

  /// Add a terminal job outcome.
  void record(const JobRecord &record);

  /**
   * Evict records older than the window and summarize the rest.
   *
   * @param now Window end.
   * @param concurrency Executor target in effect at emission.
   * @param queue_depth Live queue depth.
   * @return Sample for `(now - window, now]`; `job_count` is 0 when empty.
   *         Its `ts` is @p now, moved forward by 1 ms past the previous
   *         sample when ticks land in the same millisecond.
   */
  Sample tick(Timestamp now, int concurrency, std::size_t queue_depth);

  /// Most recent sample produced by tick().
  std::optional<Sample> latest() const;

  /// Records currently retained.
  std::size_t size() const;

  std::chrono::milliseconds window() const { return window_; }

  /**
   * Summarize an arbitrary set of records over @p span.
   *
   * Throughput is `records / span`. Used for ticks and for benchmark
   * reports covering a whole run.
   */
  static Sample summarize(const std::vector<JobRecord> &records,
                          std::chrono::milliseconds span, Timestamp ts,
                          int concurrency, std::size_t queue_depth);

private:
  const std::chrono::milliseconds window_;
  mutable std::mutex mutex_;
  std::deque<JobRecord> records_;
  std::optional<Sample> latest_;
};

} // namespace llmperf

#endif // LLMPERF_SAMPLE_AGGREGATOR_HPP
