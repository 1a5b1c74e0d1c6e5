#include "worker_pool.hpp"
#include "log.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace llmperf {

namespace {
std::shared_ptr<spdlog::logger> pool_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("pool");
  }();
  return logger;
}
} // namespace

/**
 * Construct a stopped pool. The bounds are normalised so that
 * `1 <= min_workers <= max_workers`.
 *
 * @throws std::invalid_argument When @p client is null.
 */
WorkerPool::WorkerPool(RequestQueue &queue,
                       std::shared_ptr<CompletionClient> client,
                       PoolOptions options, RecordSink sink)
    : queue_(queue), client_(std::move(client)), options_(options),
      sink_(std::move(sink)),
      policy_(options.max_retries, options.retry_base_delay,
              options.retry_max_delay) {
  if (!client_) {
    throw std::invalid_argument("WorkerPool requires a completion client");
  }
  options_.min_workers = std::max(1, options_.min_workers);
  options_.max_workers = std::max(options_.min_workers, options_.max_workers);
}

WorkerPool::~WorkerPool() { stop(std::chrono::milliseconds(0)); }

/**
 * Launch the initial executors.
 *
 * @param initial Requested executor count, clamped to the bounds.
 * @throws std::runtime_error When fewer than the minimum could be started.
 */
void WorkerPool::start(int initial) {
  if (running_) {
    return;
  }
  cancel_ = false;
  running_ = true;
  int target = std::clamp(initial, options_.min_workers, options_.max_workers);
  int launched = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (int i = 0; i < target; ++i) {
      if (!spawn_locked()) {
        break;
      }
      ++launched;
    }
  }
  if (launched < options_.min_workers) {
    pool_log()->critical("Started {} of the {} required executors", launched,
                         options_.min_workers);
    stop(std::chrono::milliseconds(0));
    throw std::runtime_error("failed to start the minimum number of executors");
  }
  target_ = launched;
  pool_log()->info("Worker pool started with {} executor(s) (bounds {}..{})",
                   launched, options_.min_workers, options_.max_workers);
}

/// Start one executor thread. Caller holds `mutex_`.
bool WorkerPool::spawn_locked() {
  auto worker = std::make_unique<Worker>();
  worker->id = next_worker_id_++;
  Worker *raw = worker.get();
  try {
    worker->thread = std::thread([this, raw] { run_worker(raw); });
  } catch (const std::system_error &e) {
    pool_log()->error("Could not start executor {}: {}", raw->id, e.what());
    return false;
  }
  workers_.push_back(std::move(worker));
  return true;
}

/// Join and forget executors that have exited.
void WorkerPool::reap_locked() {
  auto it = workers_.begin();
  while (it != workers_.end()) {
    if ((*it)->done) {
      if ((*it)->thread.joinable()) {
        (*it)->thread.join();
      }
      it = workers_.erase(it);
    } else {
      ++it;
    }
  }
}

/// Executors that are neither retiring nor finished.
int WorkerPool::active_locked() const {
  return static_cast<int>(std::count_if(
      workers_.begin(), workers_.end(),
      [](const std::unique_ptr<Worker> &w) { return !w->retire && !w->done; }));
}

/**
 * Change the executor target.
 *
 * Growing first reclaims executors that were marked to retire but are still
 * running, and only spawns threads for the remainder, so the number of
 * executors able to call upstream never exceeds the maximum. Shrinking marks
 * the newest executors to retire after their current job.
 *
 * @param target Requested executor count.
 * @return Number of active executors after the change.
 */
int WorkerPool::resize(int target) {
  int clamped = std::clamp(target, options_.min_workers, options_.max_workers);
  std::lock_guard<std::mutex> lock(mutex_);
  if (!running_) {
    target_ = clamped;
    return clamped;
  }
  reap_locked();
  int active = active_locked();
  int previous = target_.load();
  if (clamped > active) {
    int missing = clamped - active;
    for (auto &w : workers_) {
      if (missing == 0) {
        break;
      }
      if (w->retire && !w->done) {
        w->retire = false;
        --missing;
      }
    }
    while (missing > 0 && spawn_locked()) {
      --missing;
    }
    clamped = active_locked();
  } else if (clamped < active) {
    int excess = active - clamped;
    for (auto it = workers_.rbegin(); it != workers_.rend() && excess > 0;
         ++it) {
      if (!(*it)->retire && !(*it)->done) {
        (*it)->retire = true;
        --excess;
      }
    }
    queue_.interrupt_waiters();
  }
  target_ = clamped;
  if (clamped != previous) {
    pool_log()->debug("Executor target {} -> {}", previous, clamped);
  }
  return clamped;
}

int WorkerPool::live_workers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<int>(
      std::count_if(workers_.begin(), workers_.end(),
                    [](const std::unique_ptr<Worker> &w) { return !w->done; }));
}

/**
 * Count @p record and hand it to the sink. Sink failures are logged and never
 * reach the executor.
 */
void WorkerPool::emit(const JobRecord &record) {
  completed_.fetch_add(1);
  if (!sink_) {
    return;
  }
  try {
    sink_(record);
  } catch (const std::exception &e) {
    pool_log()->error("Record sink failed for job {}: {}", record.job_id,
                      e.what());
  }
}

/**
 * Executor loop: wait for a job, run it, record it, repeat until retired or
 * the closed queue is empty.
 *
 * The retire flag is checked and `done` is set under the pool mutex, so a
 * resize holding that mutex either sees the executor gone or can still
 * reclaim it.
 *
 * @param worker Bookkeeping entry owned by the pool.
 */
void WorkerPool::run_worker(Worker *worker) {
  pool_log()->trace("Executor {} started", worker->id);
  for (;;) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (worker->retire) {
        worker->done = true;
        break;
      }
    }
    auto job = queue_.pop(options_.idle_poll);
    if (!job) {
      if (queue_.closed() && queue_.depth() == 0) {
        std::lock_guard<std::mutex> lock(mutex_);
        worker->done = true;
        break;
      }
      continue;
    }
    in_flight_.fetch_add(1);
    JobRecord record;
    try {
      record = execute_with_retry(*client_, *job, policy_, cancel_);
    } catch (const std::exception &e) {
      record = cancelled_record(*job, "");
      record.error_text = std::string("executor error: ") + e.what();
    }
    in_flight_.fetch_sub(1);
    emit(record);
    {
      std::lock_guard<std::mutex> lock(idle_mutex_);
    }
    idle_cv_.notify_all();
  }
  pool_log()->trace("Executor {} exiting", worker->id);
}

/**
 * Stop the pool.
 *
 * Closes admission, waits up to @p drain_timeout for a record per accepted
 * job, then cancels in-flight transfers and records never-started jobs as
 * cancelled before joining every executor.
 *
 * @param drain_timeout Longest wait for accepted work to finish.
 * @return `true` if all accepted work completed within the timeout.
 */
bool WorkerPool::stop(std::chrono::milliseconds drain_timeout) {
  if (!running_) {
    return true;
  }
  queue_.close();
  bool drained = false;
  {
    std::unique_lock<std::mutex> lock(idle_mutex_);
    // admission is closed, so every accepted job owes exactly one record
    drained = idle_cv_.wait_for(lock, drain_timeout, [this] {
      return completed_.load() >= queue_.accepted();
    });
  }
  if (!drained) {
    cancel_ = true;
    auto pending = queue_.take_all();
    pool_log()->warn(
        "Drain timeout reached; cancelling {} in-flight and {} queued job(s)",
        in_flight_.load(), pending.size());
    for (const auto &job : pending) {
      emit(cancelled_record(job, "shutdown before start"));
    }
  }
  std::vector<std::unique_ptr<Worker>> workers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto &w : workers_) {
      w->retire = true;
    }
    workers.swap(workers_);
  }
  queue_.interrupt_waiters();
  for (auto &w : workers) {
    if (w->thread.joinable()) {
      w->thread.join();
    }
  }
  running_ = false;
  pool_log()->info("Worker pool stopped ({} record(s) emitted, drained={})",
                   completed_.load(), drained);
  return drained;
}

} // namespace llmperf
