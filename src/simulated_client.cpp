#include "simulated_client.hpp"

#include <algorithm>
#include <string>
#include <thread>

namespace llmperf {

SimulatedCompletionClient::SimulatedCompletionClient(SimulationOptions options)
    : options_(options), rng_(options.seed) {}

bool SimulatedCompletionClient::draw_failure() {
  if (options_.error_rate <= 0.0) {
    return false;
  }
  std::lock_guard<std::mutex> lock(rng_mutex_);
  std::uniform_real_distribution<double> dist(0.0, 1.0);
  return dist(rng_) < options_.error_rate;
}

CompletionResult
SimulatedCompletionClient::complete(const Job &job,
                                    const std::atomic<bool> &cancel) {
  calls_.fetch_add(1);
  int now_in_flight = in_flight_.fetch_add(1) + 1;
  int peak = peak_in_flight_.load();
  while (now_in_flight > peak &&
         !peak_in_flight_.compare_exchange_weak(peak, now_in_flight)) {
  }
  struct InFlightGuard {
    std::atomic<int> &counter;
    ~InFlightGuard() { counter.fetch_sub(1); }
  } guard{in_flight_};

  auto deadline = std::chrono::steady_clock::now() + options_.latency;
  while (true) {
    if (cancel.load()) {
      throw RequestCancelled("cancelled during simulated completion");
    }
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      break;
    }
    auto remaining = deadline - now;
    std::this_thread::sleep_for(
        std::min<std::chrono::steady_clock::duration>(
            remaining, std::chrono::milliseconds(10)));
  }

  if (draw_failure()) {
    throw HttpStatusError(options_.error_status,
                          "simulated upstream returned HTTP " +
                              std::to_string(options_.error_status));
  }
  CompletionResult result;
  int prompt_words = 0;
  for (const auto &m : job.messages) {
    prompt_words += count_words(m.content);
  }
  result.prompt_tokens = prompt_words;
  result.completion_tokens = std::min(job.max_tokens, options_.completion_tokens);
  result.content = "simulated completion for job " + std::to_string(job.id);
  return result;
}

} // namespace llmperf
