#include "retry_policy.hpp"

#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <deque>
#include <functional>
#include <stdexcept>

using namespace llmperf;
using namespace std::chrono_literals;

namespace {
/// Client that replays a scripted sequence of outcomes.
class ScriptedClient : public CompletionClient {
public:
  std::deque<std::function<CompletionResult()>> script;
  int calls = 0;

  CompletionResult complete(const Job &, const std::atomic<bool> &) override {
    ++calls;
    if (script.empty()) {
      throw std::runtime_error("script exhausted");
    }
    auto step = script.front();
    script.pop_front();
    return step();
  }
};

CompletionResult ok_result() {
  CompletionResult r;
  r.content = "fine thanks";
  r.prompt_tokens = 3;
  r.completion_tokens = 2;
  return r;
}

Job sample_job() {
  Job j = make_prompt_job("how are you", "test-model");
  j.id = 7;
  return j;
}
} // namespace

TEST_CASE("failures are classified by status") {
  CHECK(classify_failure(HttpStatusError(429, "slow down")) ==
        FailureKind::Transient);
  CHECK(classify_failure(HttpStatusError(503, "unavailable")) ==
        FailureKind::Transient);
  CHECK(classify_failure(HttpStatusError(400, "bad")) ==
        FailureKind::Permanent);
  CHECK(classify_failure(HttpStatusError(404, "missing")) ==
        FailureKind::Permanent);
  CHECK(classify_failure(TransientNetworkError("reset")) ==
        FailureKind::Transient);
  CHECK(classify_failure(RequestCancelled("stop")) == FailureKind::Cancelled);
  CHECK(classify_failure(MalformedResponseError(200, "garbage")) ==
        FailureKind::Permanent);
}

TEST_CASE("backoff grows and stays under the ceiling") {
  RetryPolicy policy(5, 10ms, 100ms);
  for (int i = 0; i < 20; ++i) {
    auto first = policy.backoff(0);
    CHECK(first >= 10ms);
    CHECK(first < 20ms);
    auto third = policy.backoff(2);
    CHECK(third >= 40ms);
    CHECK(third < 50ms);
    CHECK(policy.backoff(10) <= 100ms);
  }
}

TEST_CASE("transient failure is retried until success") {
  ScriptedClient client;
  client.script.push_back(
      []() -> CompletionResult { throw HttpStatusError(503, "busy"); });
  client.script.push_back(
      []() -> CompletionResult { throw TransientNetworkError("reset"); });
  client.script.push_back([] { return ok_result(); });
  RetryPolicy policy(3, 1ms, 5ms);
  std::atomic<bool> cancel{false};
  auto record = execute_with_retry(client, sample_job(), policy, cancel);
  CHECK(client.calls == 3);
  CHECK_FALSE(record.failed());
  CHECK(record.job_id == 7);
  CHECK(record.model_id == "test-model");
  CHECK(record.http_status == 200);
  CHECK(record.completion_tokens == 2);
  CHECK(record.content == "fine thanks");
  CHECK(record.latency_ms >= 0.0);
}

TEST_CASE("exhausted retries keep the last status") {
  ScriptedClient client;
  for (int i = 0; i < 3; ++i) {
    client.script.push_back(
        []() -> CompletionResult { throw HttpStatusError(429, "rate limited"); });
  }
  RetryPolicy policy(2, 1ms, 2ms);
  std::atomic<bool> cancel{false};
  auto record = execute_with_retry(client, sample_job(), policy, cancel);
  CHECK(client.calls == 3);
  REQUIRE(record.failed());
  CHECK(record.http_status == 429);
  CHECK(*record.error_text == "rate limited");
}

TEST_CASE("permanent failure is not retried") {
  ScriptedClient client;
  client.script.push_back(
      []() -> CompletionResult { throw HttpStatusError(400, "bad request"); });
  client.script.push_back([] { return ok_result(); });
  RetryPolicy policy(3, 1ms, 5ms);
  std::atomic<bool> cancel{false};
  auto record = execute_with_retry(client, sample_job(), policy, cancel);
  CHECK(client.calls == 1);
  REQUIRE(record.failed());
  CHECK(record.http_status == 400);
}

TEST_CASE("long error text is truncated") {
  ScriptedClient client;
  client.script.push_back([]() -> CompletionResult {
    throw HttpStatusError(422, std::string(2000, 'x'));
  });
  RetryPolicy policy(0, 1ms, 1ms);
  std::atomic<bool> cancel{false};
  auto record = execute_with_retry(client, sample_job(), policy, cancel);
  REQUIRE(record.failed());
  CHECK(record.error_text->size() == kMaxErrorTextLength);
}

TEST_CASE("cancellation during backoff ends the job") {
  ScriptedClient client;
  client.script.push_back(
      []() -> CompletionResult { throw HttpStatusError(503, "busy"); });
  client.script.push_back([] { return ok_result(); });
  RetryPolicy policy(3, 1000ms, 5000ms);
  std::atomic<bool> cancel{true};
  auto record = execute_with_retry(client, sample_job(), policy, cancel);
  CHECK(client.calls == 1);
  REQUIRE(record.failed());
  CHECK(record.error_text->rfind("cancelled", 0) == 0);
}

TEST_CASE("cancelled_record marks a job that never ran") {
  auto record = cancelled_record(sample_job(), "drain timeout");
  CHECK(record.job_id == 7);
  REQUIRE(record.failed());
  CHECK(*record.error_text == "cancelled: drain timeout");
  CHECK_FALSE(record.http_status);
}
