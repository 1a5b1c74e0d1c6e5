#include "http_client.hpp"
#include "log.hpp"

#include <memory>
#include <mutex>
#include <sstream>
#include <spdlog/spdlog.h>
#include <utility>

namespace llmperf {

namespace {
std::shared_ptr<spdlog::logger> http_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("upstream.http");
  }();
  return logger;
}

/**
 * RAII wrapper managing a CURL linked list of headers.
 */
struct CurlSlist {
  curl_slist *list{nullptr};
  CurlSlist() = default;
  ~CurlSlist() { curl_slist_free_all(list); }
  void append(const std::string &s) {
    list = curl_slist_append(list, s.c_str());
  }
  curl_slist *get() const { return list; }
  CurlSlist(const CurlSlist &) = delete;
  CurlSlist &operator=(const CurlSlist &) = delete;
};

size_t write_callback(void *contents, size_t size, size_t nmemb, void *userp) {
  size_t total = size * nmemb;
  static_cast<std::string *>(userp)->append(static_cast<char *>(contents),
                                            total);
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems,
                       void *userdata) {
  size_t total = size * nitems;
  std::string line(buffer, total);
  while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
    line.pop_back();
  if (!line.empty()) {
    static_cast<std::vector<std::string> *>(userdata)->push_back(line);
  }
  return total;
}

/// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int progress_callback(void *clientp, curl_off_t, curl_off_t, curl_off_t,
                      curl_off_t) {
  const auto *cancel = static_cast<const std::atomic<bool> *>(clientp);
  return (cancel != nullptr && cancel->load()) ? 1 : 0;
}

std::string format_curl_error(const std::string &url, CURLcode code,
                              const char *errbuf) {
  std::ostringstream oss;
  oss << "POST " << url << " failed: " << curl_easy_strerror(code);
  if (errbuf != nullptr && errbuf[0] != '\0') {
    oss << " - " << errbuf;
  }
  return oss.str();
}
} // namespace

/**
 * Initialize the CURL handle, ensuring global setup occurs once.
 */
CurlHandle::CurlHandle() {
  static std::once_flag flag;
  std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
  handle_ = curl_easy_init();
  if (!handle_) {
    throw TransientNetworkError("Failed to init curl");
  }
}

CurlHandle::~CurlHandle() { curl_easy_cleanup(handle_); }

CurlHttpClient::CurlHttpClient(std::string user_agent)
    : user_agent_(std::move(user_agent)) {}

HttpResponse CurlHttpClient::post(const std::string &url,
                                  const std::string &body,
                                  const std::vector<std::string> &headers,
                                  std::chrono::milliseconds timeout,
                                  const std::atomic<bool> *cancel) {
  CurlHandle handle;
  CURL *curl = handle.get();
  HttpResponse response;
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE,
                   static_cast<curl_off_t>(body.size()));
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                   static_cast<long>(timeout.count()));
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
  curl_easy_setopt(curl, CURLOPT_XFERINFODATA,
                   const_cast<std::atomic<bool> *>(cancel));
  char errbuf[CURL_ERROR_SIZE];
  errbuf[0] = '\0';
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  CurlSlist header_list;
  header_list.append("Content-Type: application/json");
  for (const auto &h : headers) {
    header_list.append(h);
  }
  header_list.append("User-Agent: " + user_agent_);
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());

  CURLcode res = curl_easy_perform(curl);
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
  if (res == CURLE_ABORTED_BY_CALLBACK) {
    throw RequestCancelled("cancelled during POST " + url);
  }
  if (res != CURLE_OK) {
    std::string msg = format_curl_error(url, res, errbuf);
    http_log()->debug(msg);
    throw TransientNetworkError(msg);
  }
  if (response.status_code < 200 || response.status_code >= 300) {
    std::string msg =
        "POST " + url + " returned HTTP " + std::to_string(response.status_code);
    if (!response.body.empty()) {
      msg += ": " + response.body.substr(0, 200);
    }
    http_log()->debug(msg);
    throw HttpStatusError(static_cast<int>(response.status_code), msg);
  }
  return response;
}

} // namespace llmperf
