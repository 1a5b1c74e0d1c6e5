#include "request_queue.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace llmperf {

const char *to_string(Admission a) {
  switch (a) {
  case Admission::Accepted:
    return "accepted";
  case Admission::Rejected:
    return "rejected";
  case Admission::Closed:
    return "closed";
  }
  return "unknown";
}

RequestQueue::RequestQueue(std::size_t capacity)
    : capacity_(std::max<std::size_t>(1, capacity)) {}

/**
 * Admit @p job without blocking.
 *
 * Each executor currently waiting in pop() raises the effective capacity by
 * one, so a job is only rejected when the queue is full and nobody is idle.
 *
 * @return Accepted, Rejected, or Closed once close() has been called.
 */
Admission RequestQueue::submit(Job job) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return Admission::Closed;
    }
    if (jobs_.size() >= capacity_ + waiting_) {
      ++rejected_;
      return Admission::Rejected;
    }
    jobs_.push_back(std::move(job));
    ++accepted_;
  }
  cv_.notify_one();
  return Admission::Accepted;
}

/**
 * Wait up to @p timeout for the oldest job.
 *
 * Returns early with no job when the queue is closed and empty, or when
 * interrupt_waiters() is called.
 */
std::optional<Job> RequestQueue::pop(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  const std::uint64_t gen = generation_;
  ++waiting_;
  cv_.wait_for(lock, timeout, [this, gen] {
    return closed_ || !jobs_.empty() || generation_ != gen;
  });
  --waiting_;
  if (jobs_.empty()) {
    return std::nullopt;
  }
  Job job = std::move(jobs_.front());
  jobs_.pop_front();
  return job;
}

std::size_t RequestQueue::depth() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return jobs_.size();
}

std::size_t RequestQueue::idle_workers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return waiting_;
}

void RequestQueue::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool RequestQueue::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

/// Remove and return every queued job, oldest first.
std::vector<Job> RequestQueue::take_all() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Job> out(std::make_move_iterator(jobs_.begin()),
                       std::make_move_iterator(jobs_.end()));
  jobs_.clear();
  return out;
}

/// Wake every executor blocked in pop() so it can re-check its state.
void RequestQueue::interrupt_waiters() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++generation_;
  }
  cv_.notify_all();
}

std::uint64_t RequestQueue::accepted() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return accepted_;
}

std::uint64_t RequestQueue::rejected() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rejected_;
}

} // namespace llmperf
