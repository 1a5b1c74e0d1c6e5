#include "benchmark_driver.hpp"
#include "config.hpp"
#include "log.hpp"
#include "util/duration.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <thread>
#include <utility>

namespace llmperf {

namespace {
std::shared_ptr<spdlog::logger> bench_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("bench");
  }();
  return logger;
}

std::string trim(const std::string &s) {
  const char *ws = " \t\r\n";
  auto begin = s.find_first_not_of(ws);
  if (begin == std::string::npos) {
    return {};
  }
  auto end = s.find_last_not_of(ws);
  return s.substr(begin, end - begin + 1);
}
} // namespace

const std::vector<std::string> &default_prompts() {
  static const std::vector<std::string> prompts = {
      "Generate a short conversation between a patient and receptionist "
      "scheduling an appointment.",
      "Create a brief dialogue about rescheduling a medical appointment.",
      "Write a conversation where a patient calls to cancel their "
      "appointment.",
      "Generate a short exchange about insurance verification for an "
      "appointment.",
      "Create a dialogue about scheduling an urgent same-day appointment."};
  return prompts;
}

std::vector<std::string> load_prompts(const std::string &path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Failed to open prompt file " + path);
  }
  std::vector<std::string> prompts;
  std::string line;
  while (std::getline(in, line)) {
    std::string prompt = trim(line);
    if (!prompt.empty()) {
      prompts.push_back(std::move(prompt));
    }
  }
  if (prompts.empty()) {
    throw std::runtime_error("Prompt file " + path + " contains no prompts");
  }
  return prompts;
}

void to_json(nlohmann::json &j, const BenchmarkReport &r) {
  j = nlohmann::json{{"run_id", r.run_id},
                     {"submitted", r.submitted},
                     {"rejected", r.rejected},
                     {"completed", r.completed},
                     {"failed", r.failed},
                     {"elapsed_ms", r.elapsed.count()},
                     {"throughput_rps", r.throughput_rps},
                     {"final_concurrency", r.final_concurrency},
                     {"drained", r.drained},
                     {"final_sample", r.final_sample}};
  if (r.summary) {
    j["summary"] = *r.summary;
  } else {
    j["summary"] = nullptr;
  }
}

std::string format_report(const BenchmarkReport &r) {
  std::string out;
  out += fmt::format("Run ID: {}\n", r.run_id);
  out += fmt::format("Duration: {}\n", format_duration(r.elapsed));
  out += fmt::format("Jobs Submitted: {}\n", r.submitted);
  out += fmt::format("Jobs Rejected: {}\n", r.rejected);
  out += fmt::format("Jobs Completed: {}\n", r.completed);
  out += fmt::format("Jobs Failed: {}\n", r.failed);
  out += fmt::format("Throughput: {:.2f} RPS\n", r.throughput_rps);
  out += fmt::format("Window: {:.2f} RPS, p50 {:.0f} ms, p95 {:.0f} ms, "
                     "error rate {:.3f}\n",
                     r.final_sample.throughput_rps, r.final_sample.p50_ms,
                     r.final_sample.p95_ms, r.final_sample.error_rate);
  out += fmt::format("Final Concurrency: {}\n", r.final_concurrency);
  if (r.summary) {
    const auto &s = *r.summary;
    out += fmt::format("Model: {}\n", s.run.model_id);
    out += fmt::format("Host: {}\n", s.run.host);
    out += fmt::format("Average Latency: {:.1f} ms\n", s.avg_latency_ms);
    out += fmt::format("Max Latency: {:.1f} ms\n", s.max_latency_ms);
    out += fmt::format("Total Tokens: {}\n", s.total_tokens);
    if (s.best_sample) {
      out += fmt::format("Best Throughput: {:.2f} RPS\n",
                         s.best_sample->throughput_rps);
      out += fmt::format("Best Concurrency: {}\n", s.best_sample->concurrency);
      out += fmt::format("Best P95 Latency: {:.0f} ms\n",
                         s.best_sample->p95_ms);
    }
  } else {
    out += "No database configured - limited summary available\n";
  }
  if (!r.drained) {
    out += "Warning: drain timeout reached, outstanding jobs were cancelled\n";
  }
  return out;
}

BenchmarkDriver::BenchmarkDriver(PerfEngine &engine, BenchmarkOptions options)
    : engine_(engine), options_(std::move(options)) {
  if (options_.jobs == 0 && options_.duration.count() <= 0) {
    throw ConfigError("Benchmark requires a job count or a duration");
  }
  if (options_.pace < 0.0) {
    throw ConfigError("Benchmark pace must not be negative");
  }
  prompts_ = options_.prompt_file.empty() ? default_prompts()
                                          : load_prompts(options_.prompt_file);
}

BenchmarkReport BenchmarkDriver::run(const std::atomic<bool> *interrupt) {
  using clock = std::chrono::steady_clock;
  std::atomic<std::size_t> completed{0};
  std::atomic<std::size_t> failed{0};
  engine_.set_record_callback([&](const JobRecord &record) {
    completed.fetch_add(1);
    if (record.failed()) {
      failed.fetch_add(1);
    }
  });
  if (!engine_.running()) {
    engine_.start();
  }

  bench_log()->info("Starting benchmark with {} prompt variations", prompts_.size());
  bench_log()->info("Target: {} jobs, {}",
                    options_.jobs ? std::to_string(options_.jobs) : "unlimited",
                    options_.duration.count() > 0
                        ? format_duration(options_.duration)
                        : std::string("unlimited"));

  BenchmarkReport report;
  report.run_id = engine_.run().run_id;
  const auto start = clock::now();
  const auto deadline = start + options_.duration;
  const auto pace_interval =
      options_.pace > 0.0
          ? std::chrono::duration_cast<clock::duration>(
                std::chrono::duration<double>(1.0 / options_.pace))
          : clock::duration::zero();
  auto next_submit = start;
  std::size_t prompt_index = 0;

  while (true) {
    if (interrupt && interrupt->load()) {
      bench_log()->warn("Benchmark interrupted");
      break;
    }
    const auto now = clock::now();
    if (options_.duration.count() > 0 && now >= deadline) {
      break;
    }
    if (options_.jobs > 0 && report.submitted >= options_.jobs) {
      break;
    }
    if (pace_interval > clock::duration::zero() && now < next_submit) {
      auto wake = next_submit;
      if (options_.duration.count() > 0 && deadline < wake) {
        wake = deadline;
      }
      std::this_thread::sleep_until(wake);
      continue;
    }
    const std::string &prompt = prompts_[prompt_index % prompts_.size()];
    Admission result = engine_.submit_prompt(prompt);
    if (result == Admission::Accepted) {
      ++report.submitted;
      ++prompt_index;
      next_submit += pace_interval;
      if (options_.progress_every > 0 &&
          report.submitted % options_.progress_every == 0) {
        const double elapsed =
            std::chrono::duration<double>(clock::now() - start).count();
        auto state = engine_.pool_state();
        bench_log()->info("Submitted: {} jobs, Rate: {:.1f} jobs/sec, "
                          "Concurrency: {}, Queue: {}",
                          report.submitted,
                          elapsed > 0.0 ? report.submitted / elapsed : 0.0,
                          state.concurrency, state.queue_depth);
      }
    } else if (result == Admission::Rejected) {
      ++report.rejected;
      std::this_thread::sleep_for(options_.reject_backoff);
    } else {
      bench_log()->warn("Queue closed; ending submission");
      break;
    }
  }

  report.final_sample = engine_.aggregator().tick(
      now_timestamp(), engine_.pool().concurrency(), engine_.queue().depth());
  report.final_concurrency = engine_.pool().concurrency();
  bench_log()->info("Submitted {} jobs, waiting for completion...",
                    report.submitted);
  report.drained = engine_.stop();
  report.elapsed =
      std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - start);
  report.completed = completed.load();
  report.failed = failed.load();
  engine_.set_record_callback(nullptr);
  const double secs = std::chrono::duration<double>(report.elapsed).count();
  report.throughput_rps =
      secs > 0.0 ? static_cast<double>(report.completed) / secs : 0.0;
  report.summary = engine_.recorder().summary();
  return report;
}

} // namespace llmperf
