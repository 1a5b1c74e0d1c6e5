/**
 * @file types.hpp
 * @brief Core value types shared across the performance layer.
 *
 * Declares jobs submitted for completion, the per-job outcome record, the
 * rolling-window sample and the run metadata persisted by the telemetry store.
 */

#ifndef LLMPERF_TYPES_HPP
#define LLMPERF_TYPES_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <vector>

namespace llmperf {

/// Wall-clock instant with millisecond resolution.
using Timestamp = std::chrono::time_point<std::chrono::system_clock,
                                          std::chrono::milliseconds>;

/// Current wall-clock time truncated to milliseconds.
Timestamp now_timestamp();

/// Milliseconds since the Unix epoch for @p ts.
long long to_epoch_ms(Timestamp ts);

/// Inverse of to_epoch_ms().
Timestamp timestamp_from_epoch_ms(long long ms);

/**
 * Format a timestamp as an ISO-8601 UTC string.
 *
 * @param ts Instant to format.
 * @return String such as `2024-05-01T12:00:00.250Z`.
 */
std::string iso_timestamp(Timestamp ts);

/** Single chat message sent to the upstream model. */
struct ChatMessage {
  std::string role;    ///< "system", "user" or "assistant"
  std::string content; ///< Message text
};

/**
 * Unit of work submitted to the request queue.
 */
struct Job {
  std::uint64_t id{0};               ///< Caller-visible identifier
  std::string model_id;              ///< Upstream model identifier
  std::vector<ChatMessage> messages; ///< Conversation sent to the model
  int max_tokens{128};               ///< Completion token cap
  double temperature{0.7};           ///< Sampling temperature
  Timestamp created_at{};            ///< Submission time
};

/**
 * Build a single-turn job from a prompt string.
 *
 * @param prompt User prompt text.
 * @param model_id Model the job targets.
 * @return Job carrying one user message.
 */
Job make_prompt_job(const std::string &prompt, const std::string &model_id);

/**
 * Terminal outcome of one job.
 *
 * Created exactly once per job. `error_text` is absent on success and
 * `http_status` is absent on pure transport failures. `job_id` and `content`
 * are carried in memory only and are not persisted.
 */
struct JobRecord {
  std::uint64_t job_id{0};
  Timestamp started_at{};
  Timestamp finished_at{};
  double latency_ms{0.0};
  std::string model_id;
  int prompt_tokens{0};
  int completion_tokens{0};
  std::optional<int> http_status;
  std::optional<std::string> error_text;
  std::string content;

  /// Whether the job ended in failure.
  bool failed() const { return error_text.has_value(); }
};

/**
 * Aggregate statistics over one rolling window.
 */
struct Sample {
  Timestamp ts{};
  double window_sec{0.0};
  int concurrency{0};
  std::size_t queue_depth{0};
  double throughput_rps{0.0};
  double p50_ms{0.0};
  double p95_ms{0.0};
  double error_rate{0.0};
  long long tokens_in{0};
  long long tokens_out{0};
  std::size_t job_count{0}; ///< Records in the window; not persisted
};

/** Metadata describing one benchmark or service session. */
struct Run {
  std::string run_id;
  Timestamp started_at{};
  std::optional<Timestamp> finished_at;
  std::string model_id;
  std::string host;
  std::string notes;
};

void to_json(nlohmann::json &j, const ChatMessage &m);
void to_json(nlohmann::json &j, const JobRecord &r);
void to_json(nlohmann::json &j, const Sample &s);
void to_json(nlohmann::json &j, const Run &r);

/**
 * Parse a job description received on the serve control surface.
 *
 * Accepts either `{"prompt": "..."}` or `{"messages": [...]}` with optional
 * `id`, `model`, `max_tokens` and `temperature` keys.
 *
 * @param j JSON object describing the job.
 * @param defaults Values used for keys the object omits.
 * @return Parsed job.
 * @throws std::invalid_argument When neither prompt nor messages is present.
 */
Job job_from_json(const nlohmann::json &j, const Job &defaults);

} // namespace llmperf

#endif // LLMPERF_TYPES_HPP
