/**
 * @file simulated_client.hpp
 * @brief In-process stand-in for an upstream model.
 *
 * Lets benchmarks and tests drive the whole stack with a fixed latency and a
 * configurable failure rate, without a network endpoint.
 */

#ifndef LLMPERF_SIMULATED_CLIENT_HPP
#define LLMPERF_SIMULATED_CLIENT_HPP

#include "completion_client.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <random>

namespace llmperf {

/** Parameters of a SimulatedCompletionClient. */
struct SimulationOptions {
  std::chrono::milliseconds latency{50}; ///< Service time per request
  double error_rate{0.0};                ///< Fraction of requests that fail
  int error_status{503};                 ///< Status reported on failure
  int completion_tokens{32};             ///< Tokens reported per completion
  std::uint64_t seed{42};                ///< RNG seed for failure draws
};

/**
 * CompletionClient that sleeps for the configured latency and then either
 * succeeds or throws HttpStatusError with the configured status.
 */
class SimulatedCompletionClient : public CompletionClient {
public:
  explicit SimulatedCompletionClient(SimulationOptions options = {});

  CompletionResult complete(const Job &job,
                            const std::atomic<bool> &cancel) override;

  /// Requests served so far, successful or not.
  std::size_t calls() const { return calls_.load(); }

  /// Largest number of requests observed in flight at once.
  int peak_in_flight() const { return peak_in_flight_.load(); }

private:
  bool draw_failure();

  SimulationOptions options_;
  std::mutex rng_mutex_;
  std::mt19937_64 rng_;
  std::atomic<std::size_t> calls_{0};
  std::atomic<int> in_flight_{0};
  std::atomic<int> peak_in_flight_{0};
};

} // namespace llmperf

#endif // LLMPERF_SIMULATED_CLIENT_HPP
