/**
 * @file retry_policy.hpp
 * @brief Failure classification and retry execution for upstream calls.
 */

#ifndef LLMPERF_RETRY_POLICY_HPP
#define LLMPERF_RETRY_POLICY_HPP

#include "completion_client.hpp"
#include "types.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <exception>
#include <mutex>
#include <random>
#include <string>

namespace llmperf {

/// How a failed attempt should be handled.
enum class FailureKind { Transient, Permanent, Cancelled };

/**
 * Classify an exception raised by a CompletionClient.
 *
 * 429, 5xx and transport failures are transient. Other HTTP statuses and
 * malformed bodies are permanent.
 */
FailureKind classify_failure(const std::exception &e);

/// Error text is truncated to this many characters in JobRecords.
constexpr std::size_t kMaxErrorTextLength = 500;

/**
 * Retry budget with jittered exponential backoff.
 */
class RetryPolicy {
public:
  /**
   * @param max_retries Retries after the first attempt.
   * @param base_delay Delay before the first retry.
   * @param max_delay Ceiling applied after jitter.
   */
  RetryPolicy(int max_retries, std::chrono::milliseconds base_delay,
              std::chrono::milliseconds max_delay);

  int max_retries() const { return max_retries_; }

  /**
   * Delay before retry number @p attempt (0-based):
   * `min(max_delay, base * 2^attempt + U[0, base))`.
   */
  std::chrono::milliseconds backoff(int attempt);

  /**
   * Sleep for backoff(@p attempt), waking early when @p cancel is raised.
   *
   * @return `false` when the wait was cut short by cancellation.
   */
  bool wait_before_retry(int attempt, const std::atomic<bool> &cancel);

private:
  int max_retries_;
  std::chrono::milliseconds base_delay_;
  std::chrono::milliseconds max_delay_;
  std::mutex rng_mutex_;
  std::mt19937 rng_;
};

/**
 * Run @p job against @p client, retrying transient failures.
 *
 * Never throws for job-level failures: the outcome, including the final
 * status and error after retries are exhausted, is returned as one record.
 *
 * @param client Upstream client.
 * @param job Job to execute.
 * @param policy Retry budget and backoff.
 * @param cancel Raised to abandon the job; the record then carries a
 *        `cancelled` error.
 * @return Terminal JobRecord for @p job.
 */
JobRecord execute_with_retry(CompletionClient &client, const Job &job,
                             RetryPolicy &policy,
                             const std::atomic<bool> &cancel);

/**
 * Build the record for a job that was accepted but never started.
 */
JobRecord cancelled_record(const Job &job, const std::string &reason);

} // namespace llmperf

#endif // LLMPERF_RETRY_POLICY_HPP
