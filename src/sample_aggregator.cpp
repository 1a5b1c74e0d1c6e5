#include "sample_aggregator.hpp"

#include <algorithm>
#include <cmath>

namespace llmperf {

/**
 * Nearest-rank percentile of an ascending series. @p q is clamped to [0, 1].
 */
double nearest_rank(const std::vector<double> &sorted, double q) {
  if (sorted.empty()) {
    return 0.0;
  }
  q = std::clamp(q, 0.0, 1.0);
  auto rank = static_cast<std::size_t>(
      std::ceil(q * static_cast<double>(sorted.size())));
  rank = std::clamp<std::size_t>(rank, 1, sorted.size());
  return sorted[rank - 1];
}

SampleAggregator::SampleAggregator(std::chrono::milliseconds window)
    : window_(std::max(std::chrono::milliseconds(1), window)) {}

void SampleAggregator::record(const JobRecord &record) {
  std::lock_guard<std::mutex> lock(mutex_);
  records_.push_back(record);
}

Sample SampleAggregator::summarize(const std::vector<JobRecord> &records,
                                   std::chrono::milliseconds span,
                                   Timestamp ts, int concurrency,
                                   std::size_t queue_depth) {
  Sample sample;
  sample.ts = ts;
  sample.window_sec = std::chrono::duration<double>(span).count();
  sample.concurrency = concurrency;
  sample.queue_depth = queue_depth;
  sample.job_count = records.size();
  if (records.empty()) {
    return sample;
  }
  std::vector<double> latencies;
  latencies.reserve(records.size());
  std::size_t failed = 0;
  for (const auto &r : records) {
    latencies.push_back(r.latency_ms);
    if (r.failed()) {
      ++failed;
    }
    sample.tokens_in += r.prompt_tokens;
    sample.tokens_out += r.completion_tokens;
  }
  std::sort(latencies.begin(), latencies.end());
  sample.p50_ms = nearest_rank(latencies, 0.50);
  sample.p95_ms = nearest_rank(latencies, 0.95);
  sample.error_rate =
      static_cast<double>(failed) / static_cast<double>(records.size());
  if (sample.window_sec > 0.0) {
    sample.throughput_rps =
        static_cast<double>(records.size()) / sample.window_sec;
  }
  return sample;
}

/**
 * Evict stale records and summarize the trailing window ending at @p now.
 *
 * The returned sample's timestamp is strictly greater than the previous
 * tick's, so distinct samples stay distinct when persisted.
 */
Sample SampleAggregator::tick(Timestamp now, int concurrency,
                              std::size_t queue_depth) {
  std::lock_guard<std::mutex> lock(mutex_);
  const Timestamp cutoff = now - window_;
  // records arrive roughly in finish order; evict the stale prefix
  while (!records_.empty() && records_.front().finished_at <= cutoff) {
    records_.pop_front();
  }
  std::vector<JobRecord> in_window;
  in_window.reserve(records_.size());
  for (const auto &r : records_) {
    if (r.finished_at > cutoff && r.finished_at <= now) {
      in_window.push_back(r);
    }
  }
  Sample sample = summarize(in_window, window_, now, concurrency, queue_depth);
  // sample timestamps key the store; two ticks never share a millisecond
  if (latest_ && sample.ts <= latest_->ts) {
    sample.ts = latest_->ts + std::chrono::milliseconds(1);
  }
  latest_ = sample;
  return sample;
}

std::optional<Sample> SampleAggregator::latest() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return latest_;
}

std::size_t SampleAggregator::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

} // namespace llmperf
