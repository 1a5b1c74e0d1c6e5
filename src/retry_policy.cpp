#include "retry_policy.hpp"
#include "log.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>
#include <thread>

namespace llmperf {

namespace {
std::shared_ptr<spdlog::logger> retry_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("upstream.retry");
  }();
  return logger;
}

std::string truncate_error(const std::string &text) {
  if (text.size() <= kMaxErrorTextLength) {
    return text;
  }
  return text.substr(0, kMaxErrorTextLength);
}

double elapsed_ms(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration<double, std::milli>(
             std::chrono::steady_clock::now() - since)
      .count();
}
} // namespace

FailureKind classify_failure(const std::exception &e) {
  if (dynamic_cast<const RequestCancelled *>(&e)) {
    return FailureKind::Cancelled;
  }
  if (dynamic_cast<const TransientNetworkError *>(&e)) {
    return FailureKind::Transient;
  }
  if (auto http_err = dynamic_cast<const HttpStatusError *>(&e)) {
    if (http_err->status == 429) {
      return FailureKind::Transient;
    }
    return (http_err->status >= 500 && http_err->status < 600)
               ? FailureKind::Transient
               : FailureKind::Permanent;
  }
  return FailureKind::Permanent;
}

RetryPolicy::RetryPolicy(int max_retries, std::chrono::milliseconds base_delay,
                         std::chrono::milliseconds max_delay)
    : max_retries_(std::max(0, max_retries)),
      base_delay_(std::max(std::chrono::milliseconds(0), base_delay)),
      max_delay_(std::max(base_delay_, max_delay)),
      rng_(std::random_device{}()) {}

std::chrono::milliseconds RetryPolicy::backoff(int attempt) {
  attempt = std::clamp(attempt, 0, 30);
  long long base = base_delay_.count();
  long long jitter = 0;
  if (base > 0) {
    std::lock_guard<std::mutex> lock(rng_mutex_);
    std::uniform_int_distribution<long long> dist(0, base - 1);
    jitter = dist(rng_);
  }
  long long cap = max_delay_.count();
  long long scaled = base > (cap >> attempt) ? cap : (base << attempt);
  return std::chrono::milliseconds(std::min(cap, scaled + jitter));
}

bool RetryPolicy::wait_before_retry(int attempt,
                                    const std::atomic<bool> &cancel) {
  auto deadline = std::chrono::steady_clock::now() + backoff(attempt);
  while (std::chrono::steady_clock::now() < deadline) {
    if (cancel.load()) {
      return false;
    }
    auto remaining = deadline - std::chrono::steady_clock::now();
    std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
        remaining, std::chrono::milliseconds(50)));
  }
  return !cancel.load();
}

JobRecord execute_with_retry(CompletionClient &client, const Job &job,
                             RetryPolicy &policy,
                             const std::atomic<bool> &cancel) {
  JobRecord record;
  record.job_id = job.id;
  record.model_id = job.model_id;
  record.started_at = now_timestamp();
  auto started = std::chrono::steady_clock::now();

  auto finish = [&] {
    record.finished_at = now_timestamp();
    record.latency_ms = elapsed_ms(started);
    return record;
  };

  int attempt = 0;
  while (true) {
    try {
      auto result = client.complete(job, cancel);
      record.http_status = result.http_status;
      record.prompt_tokens = result.prompt_tokens;
      record.completion_tokens = result.completion_tokens;
      record.content = std::move(result.content);
      return finish();
    } catch (const std::exception &e) {
      FailureKind kind = classify_failure(e);
      record.http_status.reset();
      if (auto http_err = dynamic_cast<const HttpStatusError *>(&e)) {
        record.http_status = http_err->status;
      } else if (auto bad = dynamic_cast<const MalformedResponseError *>(&e)) {
        record.http_status = bad->status;
      }
      if (kind == FailureKind::Cancelled) {
        record.error_text = truncate_error(std::string("cancelled: ") + e.what());
        return finish();
      }
      if (kind == FailureKind::Transient && attempt < policy.max_retries()) {
        retry_log()->debug("job {} attempt {} failed ({}); retrying", job.id,
                           attempt + 1, e.what());
        if (!policy.wait_before_retry(attempt, cancel)) {
          record.error_text = truncate_error(
              std::string("cancelled: during retry backoff after ") + e.what());
          return finish();
        }
        ++attempt;
        continue;
      }
      if (kind == FailureKind::Transient) {
        retry_log()->warn("job {} failed after {} attempt(s): {}", job.id,
                          attempt + 1, e.what());
      } else {
        retry_log()->warn("job {} failed permanently: {}", job.id, e.what());
      }
      record.error_text = truncate_error(e.what());
      return finish();
    }
  }
}

JobRecord cancelled_record(const Job &job, const std::string &reason) {
  JobRecord record;
  record.job_id = job.id;
  record.model_id = job.model_id;
  record.started_at = now_timestamp();
  record.finished_at = record.started_at;
  record.error_text = truncate_error("cancelled: " + reason);
  return record;
}

} // namespace llmperf
