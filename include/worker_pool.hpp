/**
 * @file worker_pool.hpp
 * @brief Resizable pool of executors calling the upstream endpoint.
 *
 * Defines the WorkerPool class. Executors pull jobs from a RequestQueue,
 * run them under the retry policy and hand exactly one JobRecord per job to
 * the record sink.
 */
#ifndef LLMPERF_WORKER_POOL_HPP
#define LLMPERF_WORKER_POOL_HPP

#include "completion_client.hpp"
#include "request_queue.hpp"
#include "retry_policy.hpp"
#include "types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace llmperf {

/** Sizing and retry settings for a WorkerPool. */
struct PoolOptions {
  int min_workers{2};
  int max_workers{6};
  int max_retries{3};
  std::chrono::milliseconds retry_base_delay{1000};
  std::chrono::milliseconds retry_max_delay{30000};
  /// Longest time an idle executor blocks before re-checking its state.
  std::chrono::milliseconds idle_poll{100};
};

/**
 * Thread pool whose size is driven by the concurrency tuner.
 *
 * Growing spawns executors immediately. Shrinking marks the excess executors
 * to exit after they finish and record their current job.
 */
class WorkerPool {
public:
  using RecordSink = std::function<void(const JobRecord &)>;

  /**
   * Construct a stopped pool.
   *
   * @param queue Queue the executors drain.
   * @param client Upstream client shared by all executors.
   * @param options Bounds and retry settings.
   * @param sink Receives each JobRecord on the executor thread.
   */
  WorkerPool(RequestQueue &queue, std::shared_ptr<CompletionClient> client,
             PoolOptions options, RecordSink sink);

  /// Cancels outstanding work and joins every executor.
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  /**
   * Launch @p initial executors (clamped to the bounds).
   *
   * @throws std::runtime_error When fewer than the minimum could be started.
   */
  void start(int initial);

  /**
   * Change the executor target.
   *
   * @param target Requested executor count.
   * @return Target actually applied: clamped to [min, max], or the number
   *         of active executors when a thread could not be started.
   */
  int resize(int target);

  /// Current executor target.
  int concurrency() const { return target_.load(); }

  /// Executors whose thread has not exited yet, retiring ones included.
  int live_workers() const;

  /// Jobs currently executing.
  std::size_t in_flight() const { return in_flight_.load(); }

  /// JobRecords emitted so far.
  std::uint64_t completed() const { return completed_.load(); }

  int min_workers() const { return options_.min_workers; }
  int max_workers() const { return options_.max_workers; }

  bool running() const { return running_.load(); }

  /**
   * Stop the pool.
   *
   * Closes the queue, lets executors finish accepted work for up to
   * @p drain_timeout, then cancels in-flight requests and records every job
   * still queued as cancelled.
   *
   * @return `true` if all accepted work completed within the timeout.
   */
  bool stop(std::chrono::milliseconds drain_timeout);

private:
  struct Worker {
    std::uint64_t id{0};
    std::thread thread;
    std::atomic<bool> retire{false};
    std::atomic<bool> done{false};
  };

  void run_worker(Worker *worker);
  void emit(const JobRecord &record);
  bool spawn_locked();
  void reap_locked();
  int active_locked() const;

  RequestQueue &queue_;
  std::shared_ptr<CompletionClient> client_;
  PoolOptions options_;
  RecordSink sink_;
  RetryPolicy policy_;

  mutable std::mutex mutex_;
  std::vector<std::unique_ptr<Worker>> workers_;
  std::uint64_t next_worker_id_{1};
  std::atomic<int> target_{0};
  std::atomic<bool> running_{false};
  std::atomic<bool> cancel_{false};
  std::atomic<std::size_t> in_flight_{0};
  std::atomic<std::uint64_t> completed_{0};

  std::mutex idle_mutex_;
  std::condition_variable idle_cv_;
};

} // namespace llmperf

#endif // LLMPERF_WORKER_POOL_HPP
