/**
 * @file http_client.hpp
 * @brief HTTP transport used to reach the upstream completion endpoint.
 *
 * Declares the transport error types, the abstract HttpClient seam and the
 * libcurl implementation.
 */

#ifndef LLMPERF_HTTP_CLIENT_HPP
#define LLMPERF_HTTP_CLIENT_HPP

#include <atomic>
#include <chrono>
#include <curl/curl.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace llmperf {

/// Connection, DNS or timeout failure; the request may succeed if retried.
class TransientNetworkError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Non-2xx HTTP response.
class HttpStatusError : public std::runtime_error {
public:
  HttpStatusError(int status_code, const std::string &message)
      : std::runtime_error(message), status(status_code) {}

  int status; ///< HTTP status returned by the server
};

/// Request aborted because the caller asked for cancellation.
class RequestCancelled : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * Simple HTTP response container capturing body, headers, and status code.
 */
struct HttpResponse {
  std::string body;                 ///< Response body
  std::vector<std::string> headers; ///< Response headers
  long status_code = 0;             ///< HTTP status code
};

/** Interface for performing HTTP requests. */
class HttpClient {
public:
  virtual ~HttpClient() = default;

  /**
   * Perform an HTTP POST.
   *
   * @param url Absolute request URL.
   * @param body Request payload.
   * @param headers Extra headers as `Header: value` strings.
   * @param timeout Whole-request timeout.
   * @param cancel Optional flag; once set the transfer is aborted.
   * @return Response with a 2xx status.
   * @throws TransientNetworkError On transport failures and timeouts.
   * @throws HttpStatusError On non-2xx responses.
   * @throws RequestCancelled When @p cancel was raised mid-transfer.
   */
  virtual HttpResponse post(const std::string &url, const std::string &body,
                            const std::vector<std::string> &headers,
                            std::chrono::milliseconds timeout,
                            const std::atomic<bool> *cancel = nullptr) = 0;
};

/**
 * RAII wrapper for a CURL easy handle ensuring global CURL initialization.
 */
class CurlHandle {
public:
  CurlHandle();
  ~CurlHandle();

  CurlHandle(const CurlHandle &) = delete;
  CurlHandle &operator=(const CurlHandle &) = delete;

  /// Borrowed easy handle.
  CURL *get() const { return handle_; }

private:
  CURL *handle_;
};

/**
 * libcurl-backed HttpClient.
 *
 * Each request uses its own easy handle, so one instance may be shared by all
 * executors.
 */
class CurlHttpClient : public HttpClient {
public:
  /// @param user_agent Value of the User-Agent header.
  explicit CurlHttpClient(std::string user_agent = "llmperf");

  HttpResponse post(const std::string &url, const std::string &body,
                    const std::vector<std::string> &headers,
                    std::chrono::milliseconds timeout,
                    const std::atomic<bool> *cancel = nullptr) override;

private:
  std::string user_agent_;
};

} // namespace llmperf

#endif // LLMPERF_HTTP_CLIENT_HPP
