#include "metrics_server.hpp"
#include "log.hpp"

#include <spdlog/spdlog.h>

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <sys/time.h>
#include <system_error>
#include <unistd.h>
#include <utility>

namespace llmperf {

namespace {
std::shared_ptr<spdlog::logger> metrics_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("metrics");
  }();
  return logger;
}

constexpr std::size_t kMaxRequestBytes = 8192;
constexpr std::chrono::milliseconds kStreamPoll{250};

const char *reason_phrase(int status) {
  switch (status) {
  case 200:
    return "OK";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 400:
    return "Bad Request";
  default:
    return "Internal Server Error";
  }
}

bool send_all(int socket, const std::string &data) {
  std::size_t sent = 0;
  while (sent < data.size()) {
    ssize_t n = ::send(socket, data.data() + sent, data.size() - sent,
                       MSG_NOSIGNAL);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      return false;
    }
    sent += static_cast<std::size_t>(n);
  }
  return true;
}

std::string sse_event(const std::string &payload) {
  return "data: " + payload + "\n\n";
}
} // namespace

std::optional<std::string>
MetricsFeed::Subscription::next(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout,
               [this] { return closed_ || !messages_.empty(); });
  if (messages_.empty()) {
    return std::nullopt;
  }
  std::string message = std::move(messages_.front());
  messages_.pop_front();
  return message;
}

bool MetricsFeed::Subscription::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

void MetricsFeed::Subscription::push(std::string message) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return;
    }
    // slow readers lose the oldest samples, never block the publisher
    if (messages_.size() >= capacity_ && !messages_.empty()) {
      messages_.pop_front();
    }
    messages_.push_back(std::move(message));
  }
  cv_.notify_one();
}

void MetricsFeed::Subscription::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

void MetricsFeed::set_state_provider(StateProvider provider) {
  std::lock_guard<std::mutex> lock(mutex_);
  provider_ = std::move(provider);
}

void MetricsFeed::set_run_id(std::string run_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  run_id_ = std::move(run_id);
}

void MetricsFeed::publish(const Sample &sample) {
  std::vector<std::shared_ptr<Subscription>> subscribers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    latest_ = sample;
    subscribers = subscribers_;
  }
  if (subscribers.empty()) {
    return;
  }
  const std::string payload = snapshot().dump();
  for (const auto &sub : subscribers) {
    sub->push(payload);
  }
}

std::optional<Sample> MetricsFeed::latest() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return latest_;
}

nlohmann::json MetricsFeed::snapshot() const {
  std::optional<Sample> latest;
  std::string run_id;
  StateProvider provider;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    latest = latest_;
    run_id = run_id_;
    provider = provider_;
  }
  nlohmann::json j;
  j["run_id"] = run_id;
  j["sample"] = latest ? nlohmann::json(*latest) : nlohmann::json(nullptr);
  if (provider) {
    PoolState state = provider();
    j["concurrency"] = state.concurrency;
    j["live_workers"] = state.live_workers;
    j["queue_depth"] = state.queue_depth;
    j["in_flight"] = state.in_flight;
    j["completed"] = state.completed;
  } else if (latest) {
    j["concurrency"] = latest->concurrency;
    j["queue_depth"] = latest->queue_depth;
  }
  return j;
}

std::shared_ptr<MetricsFeed::Subscription>
MetricsFeed::subscribe(std::size_t capacity) {
  auto sub = std::make_shared<Subscription>(capacity == 0 ? 1 : capacity);
  sub->push(snapshot().dump());
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    sub->close();
  } else {
    subscribers_.push_back(sub);
  }
  return sub;
}

void MetricsFeed::unsubscribe(const std::shared_ptr<Subscription> &sub) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = subscribers_.begin(); it != subscribers_.end(); ++it) {
    if (*it == sub) {
      subscribers_.erase(it);
      break;
    }
  }
}

std::size_t MetricsFeed::subscriber_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return subscribers_.size();
}

void MetricsFeed::close() {
  std::vector<std::shared_ptr<Subscription>> subscribers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    subscribers.swap(subscribers_);
  }
  for (const auto &sub : subscribers) {
    sub->close();
  }
}

MetricsServer::MetricsServer(MetricsFeed &feed, MetricsServerOptions options)
    : feed_(feed), options_(std::move(options)) {}

MetricsServer::~MetricsServer() { stop(); }

void MetricsServer::set_event_sink(EventSink sink) {
  std::lock_guard<std::mutex> lock(sink_mutex_);
  sink_ = std::move(sink);
}

void MetricsServer::emit(const std::string &message) {
  metrics_log()->debug("{}", message);
  EventSink sink;
  {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink = sink_;
  }
  if (sink) {
    sink(message);
  }
}

HttpReply MetricsServer::handle_request(const std::string &method,
                                        const std::string &target) const {
  HttpReply reply;
  std::string path = target.substr(0, target.find('?'));
  if (method != "GET") {
    reply.status = 405;
    reply.body = nlohmann::json{{"error", "method not allowed"}}.dump();
    return reply;
  }
  if (path == "/metrics") {
    reply.body = feed_.snapshot().dump();
  } else if (path == "/health") {
    reply.body = nlohmann::json{{"status", "ok"}}.dump();
  } else if (path == "/stream") {
    reply.content_type = "text/event-stream";
    reply.stream = true;
  } else {
    reply.status = 404;
    reply.body = nlohmann::json{{"error", "not found"}}.dump();
  }
  return reply;
}

void MetricsServer::start() {
  if (running_) {
    return;
  }
  stop_requested_ = false;
  auto describe_error = [](int code) {
    return std::system_category().message(code);
  };

  listener_ = ::socket(AF_INET, SOCK_STREAM, 0);
  if (listener_ < 0) {
    throw std::runtime_error("Failed to create metrics socket: " +
                             describe_error(errno));
  }
  int enable = 1;
  setsockopt(listener_, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(enable));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(options_.port));
  std::string bind_address_desc = options_.bind_address.empty()
                                      ? std::string{"0.0.0.0"}
                                      : options_.bind_address;
  if (options_.bind_address.empty() || options_.bind_address == "*") {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else if (inet_pton(AF_INET, options_.bind_address.c_str(),
                       &addr.sin_addr) != 1) {
    metrics_log()->warn("Invalid metrics bind address '{}'; using 0.0.0.0",
                        options_.bind_address);
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    bind_address_desc = "0.0.0.0";
  }
  if (::bind(listener_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) <
      0) {
    int err = errno;
    close_listener();
    throw std::runtime_error("Failed to bind metrics socket: " +
                             describe_error(err));
  }
  if (::listen(listener_, options_.backlog) < 0) {
    int err = errno;
    close_listener();
    throw std::runtime_error("Failed to listen on metrics socket: " +
                             describe_error(err));
  }
  sockaddr_in bound{};
  socklen_t bound_len = sizeof(bound);
  if (::getsockname(listener_, reinterpret_cast<sockaddr *>(&bound),
                    &bound_len) == 0) {
    bound_port_ = ntohs(bound.sin_port);
  } else {
    bound_port_ = options_.port;
  }
  running_ = true;
  metrics_log()->info("Metrics listening on {}:{}", bind_address_desc,
                      bound_port_.load());
  emit("Listening on " + bind_address_desc + ":" +
       std::to_string(bound_port_.load()));
  thread_ = std::thread([this, listener = listener_] { run(listener); });
}

/**
 * Stop accepting, end every stream and join all threads.
 *
 * The listening socket is only shut down while the accept thread may still
 * be using it; the descriptor is closed after that thread has been joined.
 */
void MetricsServer::stop() {
  stop_requested_ = true;
  if (listener_ >= 0) {
    ::shutdown(listener_, SHUT_RDWR);
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  close_listener();
  reap_streams(true);
  running_ = false;
}

void MetricsServer::close_listener() {
  if (listener_ >= 0) {
    ::shutdown(listener_, SHUT_RDWR);
    ::close(listener_);
    listener_ = -1;
  }
}

/**
 * Accept loop: serve one request per connection until stopped.
 *
 * @param listener Listening socket owned by the server; never closed here.
 */
void MetricsServer::run(int listener) {
  while (!stop_requested_) {
    sockaddr_in client_addr{};
    socklen_t client_len = sizeof(client_addr);
    int client = ::accept(listener, reinterpret_cast<sockaddr *>(&client_addr),
                          &client_len);
    if (client < 0) {
      if (stop_requested_) {
        break;
      }
      if (errno == EINTR) {
        continue;
      }
      emit("accept failed: " + std::system_category().message(errno));
      break;
    }
    timeval tv{};
    tv.tv_sec = 2;
    setsockopt(client, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    serve_client(client);
    reap_streams(false);
  }
  running_ = false;
}

void MetricsServer::serve_client(int client) {
  std::string request;
  char buffer[1024];
  while (request.find("\r\n\r\n") == std::string::npos &&
         request.size() < kMaxRequestBytes) {
    ssize_t n = ::recv(client, buffer, sizeof(buffer), 0);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      break;
    }
    request.append(buffer, static_cast<std::size_t>(n));
  }
  std::string line = request.substr(0, request.find("\r\n"));
  std::string method;
  std::string target;
  auto sp1 = line.find(' ');
  if (sp1 != std::string::npos) {
    method = line.substr(0, sp1);
    auto sp2 = line.find(' ', sp1 + 1);
    target = line.substr(sp1 + 1, sp2 == std::string::npos
                                      ? std::string::npos
                                      : sp2 - sp1 - 1);
  }
  HttpReply reply;
  if (method.empty() || target.empty()) {
    reply.status = 400;
    reply.body = nlohmann::json{{"error", "bad request"}}.dump();
  } else {
    reply = handle_request(method, target);
  }
  metrics_log()->debug("{} {} -> {}", method, target, reply.status);

  if (reply.stream) {
    std::string head = "HTTP/1.1 200 OK\r\n"
                       "Content-Type: text/event-stream\r\n"
                       "Cache-Control: no-cache\r\n"
                       "Connection: keep-alive\r\n\r\n";
    if (!send_all(client, head)) {
      ::close(client);
      return;
    }
    StreamClient stream;
    stream.socket = client;
    stream.done = std::make_shared<std::atomic<bool>>(false);
    auto done = stream.done;
    stream.thread = std::thread([this, client, done] {
      stream_to(client);
      done->store(true);
    });
    std::lock_guard<std::mutex> lock(streams_mutex_);
    streams_.push_back(std::move(stream));
    return;
  }

  std::string response = "HTTP/1.1 " + std::to_string(reply.status) + " " +
                         reason_phrase(reply.status) +
                         "\r\nContent-Type: " + reply.content_type +
                         "\r\nContent-Length: " +
                         std::to_string(reply.body.size()) +
                         "\r\nConnection: close\r\n\r\n" + reply.body;
  if (!send_all(client, response)) {
    metrics_log()->debug("Client disconnected before response was sent");
  }
  ::close(client);
}

void MetricsServer::stream_to(int client) {
  auto sub = feed_.subscribe();
  while (!stop_requested_) {
    auto message = sub->next(kStreamPoll);
    if (!message) {
      if (sub->closed()) {
        break;
      }
      continue;
    }
    if (!send_all(client, sse_event(*message))) {
      break;
    }
  }
  feed_.unsubscribe(sub);
}

void MetricsServer::reap_streams(bool join_all) {
  std::vector<StreamClient> finished;
  {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    for (auto it = streams_.begin(); it != streams_.end();) {
      if (join_all || it->done->load()) {
        if (join_all) {
          ::shutdown(it->socket, SHUT_RDWR);
        }
        finished.push_back(std::move(*it));
        it = streams_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto &stream : finished) {
    if (stream.thread.joinable()) {
      stream.thread.join();
    }
    ::close(stream.socket);
  }
}

} // namespace llmperf
