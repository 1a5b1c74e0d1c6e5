/**
 * @file request_queue.hpp
 * @brief Bounded intake buffer between producers and executors.
 */

#ifndef LLMPERF_REQUEST_QUEUE_HPP
#define LLMPERF_REQUEST_QUEUE_HPP

#include "types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace llmperf {

/// Result of a non-blocking submission.
enum class Admission {
  Accepted, ///< Job queued and will produce exactly one JobRecord
  Rejected, ///< Queue saturated; caller should back off
  Closed    ///< Queue no longer admits work
};

/// Lowercase name of @p a for logs and JSON.
const char *to_string(Admission a);

/**
 * Bounded FIFO with non-blocking admission.
 *
 * A submission is rejected only when the queue holds `capacity` jobs and no
 * executor is idle in pop(); each idle executor lets one extra job through.
 */
class RequestQueue {
public:
  /// @param capacity Jobs held before admission depends on idle executors.
  explicit RequestQueue(std::size_t capacity);

  /**
   * Offer a job without blocking.
   *
   * @param job Job to enqueue.
   * @return Admission outcome; a rejected job is dropped by the caller.
   */
  Admission submit(Job job);

  /**
   * Wait up to @p timeout for the next job.
   *
   * The caller counts as idle while waiting.
   *
   * @return The oldest job, or `std::nullopt` on timeout, interruption, or
   *         when the queue is closed and empty.
   */
  std::optional<Job> pop(std::chrono::milliseconds timeout);

  /// Jobs currently queued.
  std::size_t depth() const;

  /// Executors currently blocked in pop().
  std::size_t idle_workers() const;

  std::size_t capacity() const { return capacity_; }

  /// Stop admitting work. Queued jobs remain available to pop().
  void close();

  bool closed() const;

  /// Remove and return every queued job.
  std::vector<Job> take_all();

  /// Wake every executor blocked in pop() so it can re-check its state.
  void interrupt_waiters();

  /// Total accepted submissions.
  std::uint64_t accepted() const;

  /// Total rejected submissions.
  std::uint64_t rejected() const;

private:
  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Job> jobs_;
  std::size_t waiting_{0};
  std::uint64_t generation_{0};
  bool closed_{false};
  std::uint64_t accepted_{0};
  std::uint64_t rejected_{0};
};

} // namespace llmperf

#endif // LLMPERF_REQUEST_QUEUE_HPP
