/**
 * @file telemetry_store.hpp
 * @brief Durable storage of runs, samples and job outcomes.
 *
 * Declares the SQLite-backed TelemetryStore and the asynchronous
 * TelemetryRecorder that keeps persistence off the executor and tuner paths.
 */

#ifndef LLMPERF_TELEMETRY_STORE_HPP
#define LLMPERF_TELEMETRY_STORE_HPP

#include "types.hpp"

#include <sqlite3.h>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <nlohmann/json_fwd.hpp>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace llmperf {

/**
 * RAII wrapper for a prepared SQLite statement.
 */
class Statement {
public:
  /**
   * Prepare @p sql on @p db.
   *
   * @throws std::runtime_error When preparation fails.
   */
  Statement(sqlite3 *db, const char *sql);
  ~Statement();

  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  sqlite3_stmt *get() const { return stmt_; }

  void bind(int index, const std::string &value);
  void bind(int index, long long value);
  void bind(int index, int value);
  void bind(int index, double value);
  void bind_null(int index);

  /**
   * Step once.
   *
   * @return `true` while a row is available, `false` when done.
   * @throws std::runtime_error On any other result code.
   */
  bool step();

  /// Run a statement that yields no rows.
  void execute();

  long long column_int64(int col) const;
  double column_double(int col) const;
  std::string column_text(int col) const;
  bool column_is_null(int col) const;

private:
  sqlite3 *db_;
  sqlite3_stmt *stmt_{nullptr};
};

/** Aggregate view of one run, computed from persisted rows. */
struct RunSummary {
  Run run;
  std::size_t total_jobs{0};
  std::size_t failed_jobs{0};
  double avg_latency_ms{0.0};
  double max_latency_ms{0.0};
  long long total_tokens{0}; ///< Sum of completion tokens
  std::optional<Sample> best_sample; ///< Sample with highest throughput
};

void to_json(nlohmann::json &j, const RunSummary &s);

/// Random UUID v4 string.
std::string generate_run_id();

/// Hostname of this machine, or "unknown".
std::string local_hostname();

/**
 * SQLite persistence for runs, samples and jobs.
 *
 * Timestamps are stored as epoch milliseconds. All methods are serialized on
 * an internal mutex.
 */
class TelemetryStore {
public:
  /**
   * Open or create the database and its tables.
   *
   * @param db_path Database file; `:memory:` for an in-memory store.
   * @throws std::runtime_error When the database cannot be opened or migrated.
   */
  explicit TelemetryStore(const std::string &db_path);
  ~TelemetryStore();

  TelemetryStore(const TelemetryStore &) = delete;
  TelemetryStore &operator=(const TelemetryStore &) = delete;

  /**
   * Create a new active run.
   *
   * @return Run with a fresh run_id and the current start time.
   */
  Run begin_run(const std::string &model_id, const std::string &host,
                const std::string &notes);

  /// Insert @p run as given.
  void insert_run(const Run &run);

  /**
   * Append a sample.
   *
   * Samples are unique per (run_id, ts); re-recording one is a no-op.
   */
  void record_sample(const std::string &run_id, const Sample &sample);

  /// Append a job outcome.
  void record_job(const std::string &run_id, const JobRecord &record);

  /// Append several rows in one transaction; rolls back on failure.
  void record_batch(const std::string &run_id,
                    const std::vector<JobRecord> &jobs,
                    const std::vector<Sample> &samples);

  /**
   * Set the run's finish time if it is not set yet.
   *
   * @return `true` when this call finished the run.
   */
  bool finish_run(const std::string &run_id, Timestamp finished_at);

  std::optional<Run> load_run(const std::string &run_id);
  std::vector<Run> list_runs();
  std::vector<Sample> load_samples(const std::string &run_id);
  std::vector<JobRecord> load_jobs(const std::string &run_id);

  /**
   * Totals, latency statistics and the best-throughput sample of a run.
   *
   * @throws std::runtime_error When the run does not exist.
   */
  RunSummary run_summary(const std::string &run_id);

  /// Write run, summary, samples and jobs as one JSON document.
  void export_json(const std::string &run_id, const std::string &path);

  /// Write the run's jobs as CSV.
  void export_csv(const std::string &run_id, const std::string &path);

private:
  void exec(const char *sql);
  void insert_sample_locked(const std::string &run_id, const Sample &sample);
  void insert_job_locked(const std::string &run_id, const JobRecord &record);

  sqlite3 *db_ = nullptr;
  std::mutex mutex_;
};

/**
 * Best-effort asynchronous writer in front of a TelemetryStore.
 *
 * Calls never block on disk and never throw. Write failures are logged and
 * the affected rows discarded. Without a store the recorder only logs.
 */
class TelemetryRecorder {
public:
  /**
   * @param store Open store, or null for logging-only operation.
   * @param run Active run the rows belong to.
   */
  TelemetryRecorder(std::unique_ptr<TelemetryStore> store, Run run);

  /// Flushes pending rows and stops the writer thread.
  ~TelemetryRecorder();

  TelemetryRecorder(const TelemetryRecorder &) = delete;
  TelemetryRecorder &operator=(const TelemetryRecorder &) = delete;

  /**
   * Open @p db_path and begin a run, degrading to logging-only when the
   * database is unavailable. An empty path disables persistence.
   */
  static std::unique_ptr<TelemetryRecorder>
  open(const std::string &db_path, const std::string &model_id,
       const std::string &host, const std::string &notes);

  const Run &run() const { return run_; }

  /// Whether rows reach a database.
  bool persistent() const { return store_ != nullptr; }

  void record_job(const JobRecord &record);
  void record_sample(const Sample &sample);

  /// Block until every queued row has been written or discarded.
  void flush();

  /**
   * Flush and mark the run finished. Only the first call has an effect.
   */
  void finish(Timestamp finished_at);

  /// Summary of the active run, if persistence is available.
  std::optional<RunSummary> summary();

  /// Underlying store, or null in logging-only mode.
  TelemetryStore *store() { return store_.get(); }

  std::uint64_t written() const { return written_.load(); }
  std::uint64_t dropped() const { return dropped_.load(); }

private:
  using Row = std::variant<JobRecord, Sample>;

  void writer();
  void stop_writer();

  std::unique_ptr<TelemetryStore> store_;
  Run run_;
  std::deque<Row> queue_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  bool stop_{false};
  bool busy_{false};
  bool finished_{false};
  std::thread thread_;
  std::atomic<std::uint64_t> written_{0};
  std::atomic<std::uint64_t> dropped_{0};
};

} // namespace llmperf

#endif // LLMPERF_TELEMETRY_STORE_HPP
