#include "sample_aggregator.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <chrono>

using namespace llmperf;
using namespace std::chrono_literals;
using Catch::Approx;

namespace {
JobRecord finished(Timestamp at, double latency_ms, bool failed = false) {
  JobRecord r;
  r.finished_at = at;
  r.started_at = at - std::chrono::milliseconds(static_cast<long>(latency_ms));
  r.latency_ms = latency_ms;
  r.prompt_tokens = 4;
  r.completion_tokens = 10;
  if (failed) {
    r.error_text = "boom";
  }
  return r;
}
} // namespace

TEST_CASE("nearest rank percentile") {
  std::vector<double> values{10, 20, 30, 40, 50, 60, 70, 80, 90, 100};
  CHECK(nearest_rank(values, 0.50) == 50);
  CHECK(nearest_rank(values, 0.95) == 100);
  CHECK(nearest_rank(values, 0.0) == 10);
  CHECK(nearest_rank({}, 0.5) == 0);
  CHECK(nearest_rank({7}, 0.95) == 7);
}

TEST_CASE("summarize computes latency, errors and tokens") {
  auto now = now_timestamp();
  std::vector<JobRecord> records;
  for (int i = 1; i <= 20; ++i) {
    records.push_back(finished(now, i * 10.0, i % 10 == 0));
  }
  auto sample = SampleAggregator::summarize(records, 10s, now, 4, 3);
  CHECK(sample.job_count == 20);
  CHECK(sample.p50_ms == 100.0);
  CHECK(sample.p95_ms == 190.0);
  CHECK(sample.error_rate == Approx(0.1));
  CHECK(sample.throughput_rps == Approx(2.0));
  CHECK(sample.tokens_in == 80);
  CHECK(sample.tokens_out == 200);
  CHECK(sample.concurrency == 4);
  CHECK(sample.queue_depth == 3);
  CHECK(sample.window_sec == Approx(10.0));
}

TEST_CASE("empty window yields a zero sample") {
  SampleAggregator aggregator(1s);
  auto sample = aggregator.tick(now_timestamp(), 2, 0);
  CHECK(sample.job_count == 0);
  CHECK(sample.throughput_rps == 0.0);
  CHECK(sample.error_rate == 0.0);
  REQUIRE(aggregator.latest());
  CHECK(aggregator.latest()->concurrency == 2);
}

TEST_CASE("records older than the window are evicted") {
  SampleAggregator aggregator(1s);
  auto now = now_timestamp();
  aggregator.record(finished(now - 1500ms, 30));
  aggregator.record(finished(now - 500ms, 40));
  aggregator.record(finished(now, 50, true));
  auto sample = aggregator.tick(now, 3, 1);
  CHECK(sample.job_count == 2);
  CHECK(aggregator.size() == 2);
  CHECK(sample.p95_ms == 50.0);
  CHECK(sample.error_rate == Approx(0.5));
  CHECK(sample.throughput_rps == Approx(2.0));

  auto later = aggregator.tick(now + 2s, 3, 0);
  CHECK(later.job_count == 0);
  CHECK(aggregator.size() == 0);
}

TEST_CASE("ticks in the same millisecond get distinct timestamps") {
  SampleAggregator aggregator(1s);
  auto now = now_timestamp();
  aggregator.record(finished(now, 20));
  auto first = aggregator.tick(now, 2, 0);
  auto second = aggregator.tick(now, 3, 0);
  auto third = aggregator.tick(now - 5ms, 3, 0);
  CHECK(first.ts == now);
  CHECK(second.ts == now + 1ms);
  CHECK(third.ts == now + 2ms);
  CHECK(second.job_count == 1);
}
