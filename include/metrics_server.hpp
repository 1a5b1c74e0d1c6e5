/**
 * @file metrics_server.hpp
 * @brief Live monitoring surface: latest sample, health and an SSE stream.
 */

#ifndef LLMPERF_METRICS_SERVER_HPP
#define LLMPERF_METRICS_SERVER_HPP

#include "types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace llmperf {

/** Live executor and queue state reported alongside samples. */
struct PoolState {
  int concurrency{0};
  std::size_t live_workers{0};
  std::size_t queue_depth{0};
  std::size_t in_flight{0};
  std::uint64_t completed{0};
};

/**
 * Latest-sample holder and fan-out point for stream subscribers.
 *
 * The feed is a derived view; it never influences tuning.
 */
class MetricsFeed {
public:
  using StateProvider = std::function<PoolState()>;

  /** Bounded per-subscriber mailbox of serialized samples. */
  class Subscription {
  public:
    explicit Subscription(std::size_t capacity) : capacity_(capacity) {}

    /**
     * Wait for the next message.
     *
     * @param timeout Maximum time to wait.
     * @return Message, or empty on timeout or once closed and drained.
     */
    std::optional<std::string> next(std::chrono::milliseconds timeout);

    bool closed() const;

  private:
    friend class MetricsFeed;
    void push(std::string message);
    void close();

    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> messages_;
    bool closed_{false};
  };

  MetricsFeed() = default;
  MetricsFeed(const MetricsFeed &) = delete;
  MetricsFeed &operator=(const MetricsFeed &) = delete;

  void set_state_provider(StateProvider provider);
  void set_run_id(std::string run_id);

  /// Store @p sample as the latest and forward it to every subscriber.
  void publish(const Sample &sample);

  std::optional<Sample> latest() const;

  /**
   * Current view: latest sample (or null), live pool state and run id.
   */
  nlohmann::json snapshot() const;

  /**
   * Register a subscriber. The current snapshot is queued first.
   *
   * @param capacity Messages retained before the oldest is dropped.
   */
  std::shared_ptr<Subscription> subscribe(std::size_t capacity = 64);
  void unsubscribe(const std::shared_ptr<Subscription> &subscription);

  std::size_t subscriber_count() const;

  /// Close every subscription; later subscribers are closed immediately.
  void close();

private:
  mutable std::mutex mutex_;
  std::optional<Sample> latest_;
  std::string run_id_;
  StateProvider provider_;
  std::vector<std::shared_ptr<Subscription>> subscribers_;
  bool closed_{false};
};

struct MetricsServerOptions {
  std::string bind_address{"127.0.0.1"};
  int port{8088}; ///< 0 picks an ephemeral port
  int backlog{16};
};

/** Response produced for one request line. */
struct HttpReply {
  int status{200};
  std::string content_type{"application/json"};
  std::string body;
  bool stream{false}; ///< Switch the connection to server-sent events
};

/**
 * Minimal HTTP/1.1 listener for the monitoring routes.
 *
 * `GET /metrics` returns the feed snapshot, `GET /health` a liveness object
 * and `GET /stream` keeps the connection open and writes one `data:` event
 * per published sample.
 */
class MetricsServer {
public:
  using EventSink = std::function<void(const std::string &)>;

  MetricsServer(MetricsFeed &feed, MetricsServerOptions options);

  /// Stops the listener and every stream connection.
  ~MetricsServer();

  MetricsServer(const MetricsServer &) = delete;
  MetricsServer &operator=(const MetricsServer &) = delete;

  /**
   * Bind, listen and launch the accept thread.
   *
   * @throws std::runtime_error When the socket cannot be bound.
   */
  void start();

  /// Close the listener and join all threads.
  void stop();

  bool running() const { return running_; }

  /// Port actually bound, valid after start().
  int port() const { return bound_port_.load(); }

  /**
   * Route one request without touching sockets.
   *
   * @param method Request method.
   * @param path Request target, query string ignored.
   */
  HttpReply handle_request(const std::string &method,
                           const std::string &path) const;

  /// Register a callback receiving server lifecycle messages.
  void set_event_sink(EventSink sink);

private:
  void run(int listener);
  void serve_client(int client);
  void stream_to(int client);
  void emit(const std::string &message);
  void close_listener();
  void reap_streams(bool join_all);

  struct StreamClient {
    std::thread thread;
    int socket{-1};
    std::shared_ptr<std::atomic<bool>> done;
  };

  MetricsFeed &feed_;
  MetricsServerOptions options_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stop_requested_{false};
  std::atomic<int> bound_port_{0};
  std::mutex sink_mutex_;
  EventSink sink_;
  std::mutex streams_mutex_;
  std::vector<StreamClient> streams_;
  int listener_{-1};
};

} // namespace llmperf

#endif // LLMPERF_METRICS_SERVER_HPP
