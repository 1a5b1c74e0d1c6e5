#include "types.hpp"

#include <ctime>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

namespace llmperf {

Timestamp now_timestamp() {
  return std::chrono::time_point_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now());
}

long long to_epoch_ms(Timestamp ts) {
  return static_cast<long long>(ts.time_since_epoch().count());
}

Timestamp timestamp_from_epoch_ms(long long ms) {
  return Timestamp(std::chrono::milliseconds(ms));
}

std::string iso_timestamp(Timestamp ts) {
  auto secs = std::chrono::time_point_cast<std::chrono::seconds>(ts);
  auto millis = (ts - secs).count();
  std::time_t t = std::chrono::system_clock::to_time_t(secs);
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3)
      << std::setfill('0') << millis << 'Z';
  return oss.str();
}

Job make_prompt_job(const std::string &prompt, const std::string &model_id) {
  Job job;
  job.model_id = model_id;
  job.messages.push_back({"user", prompt});
  job.created_at = now_timestamp();
  return job;
}

void to_json(nlohmann::json &j, const ChatMessage &m) {
  j = nlohmann::json{{"role", m.role}, {"content", m.content}};
}

void to_json(nlohmann::json &j, const JobRecord &r) {
  j = nlohmann::json{{"job_id", r.job_id},
                     {"started_at", iso_timestamp(r.started_at)},
                     {"finished_at", iso_timestamp(r.finished_at)},
                     {"latency_ms", r.latency_ms},
                     {"model_id", r.model_id},
                     {"prompt_tokens", r.prompt_tokens},
                     {"completion_tokens", r.completion_tokens}};
  j["http_status"] =
      r.http_status ? nlohmann::json(*r.http_status) : nlohmann::json(nullptr);
  j["error_text"] =
      r.error_text ? nlohmann::json(*r.error_text) : nlohmann::json(nullptr);
  if (!r.content.empty()) {
    j["content"] = r.content;
  }
}

void to_json(nlohmann::json &j, const Sample &s) {
  j = nlohmann::json{{"ts", iso_timestamp(s.ts)},
                     {"window_sec", s.window_sec},
                     {"concurrency", s.concurrency},
                     {"queue_depth", s.queue_depth},
                     {"throughput_rps", s.throughput_rps},
                     {"p50_ms", s.p50_ms},
                     {"p95_ms", s.p95_ms},
                     {"error_rate", s.error_rate},
                     {"tokens_in", s.tokens_in},
                     {"tokens_out", s.tokens_out},
                     {"job_count", s.job_count}};
}

void to_json(nlohmann::json &j, const Run &r) {
  j = nlohmann::json{{"run_id", r.run_id},
                     {"started_at", iso_timestamp(r.started_at)},
                     {"model_id", r.model_id},
                     {"host", r.host},
                     {"notes", r.notes}};
  j["finished_at"] = r.finished_at ? nlohmann::json(iso_timestamp(*r.finished_at))
                                   : nlohmann::json(nullptr);
}

Job job_from_json(const nlohmann::json &j, const Job &defaults) {
  if (!j.is_object()) {
    throw std::invalid_argument("job must be a JSON object");
  }
  Job job = defaults;
  job.messages.clear();
  if (j.contains("id")) {
    job.id = j["id"].get<std::uint64_t>();
  }
  if (j.contains("model")) {
    job.model_id = j["model"].get<std::string>();
  }
  if (j.contains("max_tokens")) {
    job.max_tokens = j["max_tokens"].get<int>();
  }
  if (j.contains("temperature")) {
    job.temperature = j["temperature"].get<double>();
  }
  if (j.contains("messages")) {
    for (const auto &m : j["messages"]) {
      job.messages.push_back(
          {m.value("role", std::string{"user"}), m.at("content").get<std::string>()});
    }
  } else if (j.contains("prompt")) {
    job.messages.push_back({"user", j["prompt"].get<std::string>()});
  }
  if (job.messages.empty()) {
    throw std::invalid_argument("job requires 'prompt' or 'messages'");
  }
  job.created_at = now_timestamp();
  return job;
}

} // namespace llmperf
