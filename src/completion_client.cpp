#include "completion_client.hpp"
#include "log.hpp"

#include <cctype>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <utility>
#include <vector>

namespace llmperf {

namespace {
std::shared_ptr<spdlog::logger> upstream_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("upstream");
  }();
  return logger;
}
} // namespace

int count_words(const std::string &text) {
  int words = 0;
  bool in_word = false;
  for (unsigned char c : text) {
    if (std::isspace(c)) {
      in_word = false;
    } else if (!in_word) {
      in_word = true;
      ++words;
    }
  }
  return words;
}

OpenAICompletionClient::OpenAICompletionClient(
    std::shared_ptr<HttpClient> http, std::string endpoint_url,
    std::string api_key, std::chrono::milliseconds timeout)
    : http_(std::move(http)), endpoint_url_(std::move(endpoint_url)),
      api_key_(std::move(api_key)), timeout_(timeout) {
  if (!http_) {
    http_ = std::make_shared<CurlHttpClient>();
  }
}

nlohmann::json OpenAICompletionClient::build_payload(const Job &job) {
  return nlohmann::json{{"model", job.model_id},
                        {"messages", job.messages},
                        {"max_tokens", job.max_tokens},
                        {"temperature", job.temperature}};
}

CompletionResult OpenAICompletionClient::parse_response(const Job &job,
                                                        const std::string &body,
                                                        int status) {
  nlohmann::json data;
  try {
    data = nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error &e) {
    throw MalformedResponseError(status, std::string("invalid JSON body: ") +
                                             e.what());
  }
  CompletionResult result;
  result.http_status = status;
  try {
    result.content =
        data.at("choices").at(0).at("message").at("content").get<std::string>();
  } catch (const nlohmann::json::exception &) {
    throw MalformedResponseError(status,
                                 "response missing choices[0].message.content");
  }
  int prompt_words = 0;
  for (const auto &m : job.messages) {
    prompt_words += count_words(m.content);
  }
  result.prompt_tokens = prompt_words;
  result.completion_tokens = count_words(result.content);
  auto usage = data.find("usage");
  if (usage != data.end() && usage->is_object()) {
    auto read = [&usage](const char *key, int fallback) {
      auto it = usage->find(key);
      return (it != usage->end() && it->is_number_integer()) ? it->get<int>()
                                                           : fallback;
    };
    result.prompt_tokens = read("prompt_tokens", result.prompt_tokens);
    result.completion_tokens =
        read("completion_tokens", result.completion_tokens);
  }
  return result;
}

CompletionResult
OpenAICompletionClient::complete(const Job &job,
                                 const std::atomic<bool> &cancel) {
  std::vector<std::string> headers;
  if (!api_key_.empty()) {
    headers.push_back("Authorization: Bearer " + api_key_);
  }
  auto payload = build_payload(job).dump();
  upstream_log()->trace("job {} -> {}", job.id, endpoint_url_);
  auto response = http_->post(endpoint_url_, payload, headers, timeout_, &cancel);
  return parse_response(job, response.body,
                        static_cast<int>(response.status_code));
}

} // namespace llmperf
