/**
 * @file completion_client.hpp
 * @brief Upstream completion client abstraction.
 *
 * Declares the CompletionClient seam used by executors and the client for
 * OpenAI-compatible chat completion endpoints.
 */

#ifndef LLMPERF_COMPLETION_CLIENT_HPP
#define LLMPERF_COMPLETION_CLIENT_HPP

#include "http_client.hpp"
#include "types.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <nlohmann/json_fwd.hpp>
#include <stdexcept>
#include <string>

namespace llmperf {

/// 2xx response whose body is not a usable completion. Never retried.
class MalformedResponseError : public std::runtime_error {
public:
  MalformedResponseError(int status_code, const std::string &message)
      : std::runtime_error(message), status(status_code) {}

  int status;
};

/** Successful completion returned by the upstream model. */
struct CompletionResult {
  std::string content;
  int prompt_tokens{0};
  int completion_tokens{0};
  int http_status{200};
};

/**
 * Interface executors call to obtain one completion.
 *
 * Implementations must be safe to call from several threads at once.
 */
class CompletionClient {
public:
  virtual ~CompletionClient() = default;

  /**
   * Request a completion for @p job.
   *
   * @param job Job to complete.
   * @param cancel Raised by the pool when in-flight work must be abandoned.
   * @return Completion text and token usage.
   * @throws TransientNetworkError, HttpStatusError, MalformedResponseError or
   *         RequestCancelled.
   */
  virtual CompletionResult complete(const Job &job,
                                    const std::atomic<bool> &cancel) = 0;
};

/// Count whitespace-separated words, the fallback token estimate.
int count_words(const std::string &text);

/**
 * Client for `POST /v1/chat/completions` style endpoints.
 */
class OpenAICompletionClient : public CompletionClient {
public:
  /**
   * @param http Transport shared by all executors.
   * @param endpoint_url Full chat completions URL.
   * @param api_key Bearer token; empty sends no Authorization header.
   * @param timeout Per-request timeout.
   */
  OpenAICompletionClient(std::shared_ptr<HttpClient> http,
                         std::string endpoint_url, std::string api_key,
                         std::chrono::milliseconds timeout);

  CompletionResult complete(const Job &job,
                            const std::atomic<bool> &cancel) override;

  /// Request body for @p job.
  static nlohmann::json build_payload(const Job &job);

  /**
   * Extract content and usage from a response body.
   *
   * Missing usage falls back to word counts of the prompt and the content.
   *
   * @throws MalformedResponseError When the body is not JSON or has no
   *         `choices[0].message.content`.
   */
  static CompletionResult parse_response(const Job &job,
                                         const std::string &body, int status);

private:
  std::shared_ptr<HttpClient> http_;
  std::string endpoint_url_;
  std::string api_key_;
  std::chrono::milliseconds timeout_;
};

} // namespace llmperf

#endif // LLMPERF_COMPLETION_CLIENT_HPP
