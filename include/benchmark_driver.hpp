/**
 * @file benchmark_driver.hpp
 * @brief Bounded load generation against a running engine.
 */

#ifndef LLMPERF_BENCHMARK_DRIVER_HPP
#define LLMPERF_BENCHMARK_DRIVER_HPP

#include "engine.hpp"
#include "telemetry_store.hpp"
#include "types.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

namespace llmperf {

/** Limits and pacing of one benchmark. */
struct BenchmarkOptions {
  std::size_t jobs{0};                    ///< Accepted jobs to submit; 0 = no cap
  std::chrono::milliseconds duration{0};  ///< Submission window; 0 = no cap
  std::string prompt_file;                ///< One prompt per line
  double pace{0.0};                       ///< Jobs per second; 0 = unpaced
  std::chrono::milliseconds reject_backoff{100};
  std::size_t progress_every{100};        ///< Log progress every N jobs
};

/** Outcome of a benchmark. */
struct BenchmarkReport {
  std::string run_id;
  std::size_t submitted{0}; ///< Accepted submissions
  std::size_t rejected{0};  ///< Admission rejections, retried after backoff
  std::size_t completed{0}; ///< JobRecords observed
  std::size_t failed{0};
  std::chrono::milliseconds elapsed{0};
  double throughput_rps{0.0}; ///< completed / elapsed
  int final_concurrency{0};
  bool drained{true};
  Sample final_sample;              ///< Window ending when submission stopped
  std::optional<RunSummary> summary; ///< Present when persistence is available
};

void to_json(nlohmann::json &j, const BenchmarkReport &r);

/// Human-readable multi-line summary of @p report.
std::string format_report(const BenchmarkReport &report);

/// Prompts used when no prompt file is given.
const std::vector<std::string> &default_prompts();

/**
 * Read prompts from @p path, one per line, skipping blank lines.
 *
 * @throws std::runtime_error When the file cannot be read or has no prompts.
 */
std::vector<std::string> load_prompts(const std::string &path);

/**
 * Submits prompts round-robin through a PerfEngine until the job or time
 * bound is reached, then stops the engine and reports.
 */
class BenchmarkDriver {
public:
  /**
   * @param engine Engine to drive; started by run() when needed.
   * @param options Bounds and pacing.
   * @throws ConfigError When neither a job count nor a duration is set.
   */
  BenchmarkDriver(PerfEngine &engine, BenchmarkOptions options);

  /**
   * Execute the benchmark.
   *
   * @param interrupt Optional flag ending submission early when set.
   * @return Report after the engine has drained and the run is finished.
   */
  BenchmarkReport run(const std::atomic<bool> *interrupt = nullptr);

  const std::vector<std::string> &prompts() const { return prompts_; }

private:
  PerfEngine &engine_;
  BenchmarkOptions options_;
  std::vector<std::string> prompts_;
};

} // namespace llmperf

#endif // LLMPERF_BENCHMARK_DRIVER_HPP
