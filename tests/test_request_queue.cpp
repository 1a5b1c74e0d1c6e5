#include "request_queue.hpp"

#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <thread>

using namespace llmperf;
using namespace std::chrono_literals;

namespace {
Job job(std::uint64_t id) {
  Job j = make_prompt_job("hello", "test-model");
  j.id = id;
  return j;
}
} // namespace

TEST_CASE("queue admits up to capacity then rejects") {
  RequestQueue queue(2);
  CHECK(queue.submit(job(1)) == Admission::Accepted);
  CHECK(queue.submit(job(2)) == Admission::Accepted);
  CHECK(queue.submit(job(3)) == Admission::Rejected);
  CHECK(queue.depth() == 2);
  CHECK(queue.accepted() == 2);
  CHECK(queue.rejected() == 1);
}

TEST_CASE("queue is FIFO") {
  RequestQueue queue(4);
  for (std::uint64_t i = 1; i <= 3; ++i) {
    REQUIRE(queue.submit(job(i)) == Admission::Accepted);
  }
  for (std::uint64_t i = 1; i <= 3; ++i) {
    auto next = queue.pop(10ms);
    REQUIRE(next);
    CHECK(next->id == i);
  }
  CHECK_FALSE(queue.pop(10ms));
}

TEST_CASE("an idle executor admits one job beyond capacity") {
  RequestQueue queue(1);
  REQUIRE(queue.submit(job(1)) == Admission::Accepted);
  REQUIRE(queue.pop(10ms));
  REQUIRE(queue.submit(job(2)) == Admission::Accepted);

  std::optional<Job> first;
  std::optional<Job> got;
  // take job 2, then wait idle for the next one
  std::thread waiter([&] {
    first = queue.pop(1s);
    got = queue.pop(2s);
  });
  auto deadline = std::chrono::steady_clock::now() + 2s;
  while (queue.idle_workers() == 0 &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(1ms);
  }
  CHECK(queue.idle_workers() == 1);
  CHECK(queue.submit(job(3)) == Admission::Accepted);
  waiter.join();
  REQUIRE(first);
  CHECK(first->id == 2);
  REQUIRE(got);
  CHECK(got->id == 3);
}

TEST_CASE("closed queue refuses work but keeps queued jobs") {
  RequestQueue queue(4);
  REQUIRE(queue.submit(job(1)) == Admission::Accepted);
  queue.close();
  CHECK(queue.closed());
  CHECK(queue.submit(job(2)) == Admission::Closed);
  CHECK(queue.rejected() == 0);
  auto next = queue.pop(10ms);
  REQUIRE(next);
  CHECK(next->id == 1);
  CHECK_FALSE(queue.pop(10ms));
}

TEST_CASE("take_all empties the queue and interrupt wakes waiters") {
  RequestQueue queue(4);
  REQUIRE(queue.submit(job(1)) == Admission::Accepted);
  REQUIRE(queue.submit(job(2)) == Admission::Accepted);
  auto rest = queue.take_all();
  CHECK(rest.size() == 2);
  CHECK(queue.depth() == 0);

  auto start = std::chrono::steady_clock::now();
  std::optional<Job> got;
  std::thread waiter([&] { got = queue.pop(5s); });
  while (queue.idle_workers() == 0) {
    std::this_thread::sleep_for(1ms);
  }
  queue.interrupt_waiters();
  waiter.join();
  CHECK_FALSE(got);
  CHECK(std::chrono::steady_clock::now() - start < 4s);
}
