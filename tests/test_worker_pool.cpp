#include "simulated_client.hpp"
#include "worker_pool.hpp"

#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace llmperf;
using namespace std::chrono_literals;

namespace {
struct Collector {
  std::mutex mutex;
  std::vector<JobRecord> records;

  WorkerPool::RecordSink sink() {
    return [this](const JobRecord &r) {
      std::lock_guard<std::mutex> lock(mutex);
      records.push_back(r);
    };
  }

  std::vector<JobRecord> snapshot() {
    std::lock_guard<std::mutex> lock(mutex);
    return records;
  }
};

void submit_jobs(RequestQueue &queue, std::uint64_t count) {
  for (std::uint64_t i = 1; i <= count; ++i) {
    Job j = make_prompt_job("prompt " + std::to_string(i), "sim");
    j.id = i;
    REQUIRE(queue.submit(std::move(j)) == Admission::Accepted);
  }
}

PoolOptions fast_options(int min_workers, int max_workers) {
  PoolOptions options;
  options.min_workers = min_workers;
  options.max_workers = max_workers;
  options.retry_base_delay = 1ms;
  options.retry_max_delay = 2ms;
  options.idle_poll = 10ms;
  return options;
}
} // namespace

TEST_CASE("every accepted job yields exactly one record") {
  RequestQueue queue(64);
  SimulationOptions sim;
  sim.latency = 10ms;
  auto client = std::make_shared<SimulatedCompletionClient>(sim);
  Collector collector;
  WorkerPool pool(queue, client, fast_options(2, 6), collector.sink());
  pool.start(4);
  CHECK(pool.concurrency() == 4);
  submit_jobs(queue, 30);
  CHECK(pool.stop(5s));

  auto records = collector.snapshot();
  REQUIRE(records.size() == 30);
  std::set<std::uint64_t> ids;
  for (const auto &r : records) {
    ids.insert(r.job_id);
    CHECK_FALSE(r.failed());
    CHECK(r.latency_ms >= 10.0);
  }
  CHECK(ids.size() == 30);
  CHECK(pool.completed() == 30);
  CHECK(client->peak_in_flight() <= 4);
  CHECK_FALSE(pool.running());
}

TEST_CASE("resize clamps to the bounds") {
  RequestQueue queue(8);
  auto client = std::make_shared<SimulatedCompletionClient>();
  Collector collector;
  WorkerPool pool(queue, client, fast_options(2, 6), collector.sink());
  pool.start(2);
  CHECK(pool.resize(10) == 6);
  CHECK(pool.concurrency() == 6);
  CHECK(pool.live_workers() >= 6);
  CHECK(pool.resize(0) == 2);
  CHECK(pool.concurrency() == 2);

  auto deadline = std::chrono::steady_clock::now() + 2s;
  while (pool.live_workers() > 2 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(10ms);
  }
  CHECK(pool.live_workers() == 2);
  CHECK(pool.stop(1s));
}

TEST_CASE("shrinking under load lets busy executors finish their job") {
  RequestQueue queue(64);
  SimulationOptions sim;
  sim.latency = 200ms;
  auto client = std::make_shared<SimulatedCompletionClient>(sim);
  Collector collector;
  WorkerPool pool(queue, client, fast_options(2, 6), collector.sink());
  pool.start(6);
  submit_jobs(queue, 12);
  std::this_thread::sleep_for(50ms);

  CHECK(pool.resize(2) == 2);
  CHECK(pool.concurrency() == 2);
  CHECK(pool.live_workers() <= 6);
  CHECK(pool.stop(10s));

  auto records = collector.snapshot();
  REQUIRE(records.size() == 12);
  std::set<std::uint64_t> ids;
  for (const auto &r : records) {
    ids.insert(r.job_id);
    CHECK_FALSE(r.failed());
  }
  CHECK(ids.size() == 12);
}

TEST_CASE("growing after a shrink never exceeds the maximum") {
  RequestQueue queue(64);
  SimulationOptions sim;
  sim.latency = 400ms;
  auto client = std::make_shared<SimulatedCompletionClient>(sim);
  Collector collector;
  WorkerPool pool(queue, client, fast_options(2, 6), collector.sink());
  pool.start(6);
  submit_jobs(queue, 20);
  std::this_thread::sleep_for(50ms);

  CHECK(pool.resize(5) == 5);
  CHECK(pool.resize(6) == 6);
  CHECK(pool.live_workers() <= 6);
  CHECK(pool.resize(2) == 2);
  CHECK(pool.resize(6) == 6);
  CHECK(pool.live_workers() <= 6);
  CHECK(pool.concurrency() == 6);
  CHECK(pool.stop(10s));

  CHECK(client->peak_in_flight() <= pool.max_workers());
  auto records = collector.snapshot();
  REQUIRE(records.size() == 20);
  for (const auto &r : records) {
    CHECK_FALSE(r.failed());
  }
}

TEST_CASE("transient failures are retried and reported once") {
  RequestQueue queue(16);
  SimulationOptions sim;
  sim.latency = 1ms;
  sim.error_rate = 1.0;
  sim.error_status = 503;
  auto client = std::make_shared<SimulatedCompletionClient>(sim);
  Collector collector;
  auto options = fast_options(2, 2);
  options.max_retries = 1;
  WorkerPool pool(queue, client, options, collector.sink());
  pool.start(2);
  submit_jobs(queue, 5);
  CHECK(pool.stop(5s));

  auto records = collector.snapshot();
  REQUIRE(records.size() == 5);
  for (const auto &r : records) {
    CHECK(r.failed());
    CHECK(r.http_status == 503);
  }
  CHECK(client->calls() == 10);
}

TEST_CASE("drain timeout cancels outstanding work") {
  RequestQueue queue(16);
  SimulationOptions sim;
  sim.latency = 3s;
  auto client = std::make_shared<SimulatedCompletionClient>(sim);
  Collector collector;
  WorkerPool pool(queue, client, fast_options(1, 1), collector.sink());
  pool.start(1);
  submit_jobs(queue, 3);
  std::this_thread::sleep_for(50ms);

  auto started = std::chrono::steady_clock::now();
  CHECK_FALSE(pool.stop(100ms));
  CHECK(std::chrono::steady_clock::now() - started < 2s);

  auto records = collector.snapshot();
  REQUIRE(records.size() == 3);
  for (const auto &r : records) {
    REQUIRE(r.failed());
    CHECK(r.error_text->rfind("cancelled", 0) == 0);
  }
}

TEST_CASE("constructor rejects a null client") {
  RequestQueue queue(4);
  auto build = [&queue] {
    WorkerPool pool(queue, nullptr, PoolOptions{}, nullptr);
  };
  CHECK_THROWS_AS(build(), std::invalid_argument);
}
