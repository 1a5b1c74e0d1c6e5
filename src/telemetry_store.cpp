/**
 * @file telemetry_store.cpp
 * @brief SQLite persistence of runs, samples and job outcomes.
 *
 * The store owns one connection guarded by a mutex. The recorder places a
 * writer thread in front of it so callers on the hot path only enqueue.
 */
#include "telemetry_store.hpp"
#include "log.hpp"

#include <array>
#include <cstdio>
#include <fstream>
#include <nlohmann/json.hpp>
#include <random>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string_view>
#include <unistd.h>
#include <utility>

namespace llmperf {

namespace {
std::shared_ptr<spdlog::logger> telemetry_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("telemetry");
  }();
  return logger;
}

const char *kSchema =
    "CREATE TABLE IF NOT EXISTS runs("
    "run_id TEXT PRIMARY KEY,"
    "started_at INTEGER NOT NULL,"
    "finished_at INTEGER,"
    "model_id TEXT NOT NULL,"
    "host TEXT NOT NULL,"
    "notes TEXT);"
    "CREATE TABLE IF NOT EXISTS samples("
    "id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "run_id TEXT NOT NULL REFERENCES runs(run_id),"
    "ts INTEGER NOT NULL,"
    "window_sec REAL NOT NULL,"
    "concurrency INTEGER NOT NULL,"
    "queue_depth INTEGER NOT NULL,"
    "throughput_rps REAL NOT NULL,"
    "p50_ms REAL NOT NULL,"
    "p95_ms REAL NOT NULL,"
    "error_rate REAL NOT NULL,"
    "tokens_in INTEGER NOT NULL,"
    "tokens_out INTEGER NOT NULL,"
    "UNIQUE(run_id, ts));"
    "CREATE TABLE IF NOT EXISTS jobs("
    "id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "run_id TEXT NOT NULL REFERENCES runs(run_id),"
    "started_at INTEGER NOT NULL,"
    "finished_at INTEGER NOT NULL,"
    "latency_ms REAL NOT NULL,"
    "model_id TEXT NOT NULL,"
    "prompt_tokens INTEGER NOT NULL,"
    "completion_tokens INTEGER NOT NULL,"
    "http_status INTEGER,"
    "error_text TEXT);"
    "CREATE INDEX IF NOT EXISTS idx_samples_run ON samples(run_id, ts);"
    "CREATE INDEX IF NOT EXISTS idx_jobs_run ON jobs(run_id, finished_at);";

const char *kSampleColumns =
    "ts,window_sec,concurrency,queue_depth,throughput_rps,p50_ms,p95_ms,"
    "error_rate,tokens_in,tokens_out";

Sample sample_from_row(const Statement &stmt, int first) {
  Sample s;
  s.ts = timestamp_from_epoch_ms(stmt.column_int64(first));
  s.window_sec = stmt.column_double(first + 1);
  s.concurrency = static_cast<int>(stmt.column_int64(first + 2));
  s.queue_depth = static_cast<std::size_t>(stmt.column_int64(first + 3));
  s.throughput_rps = stmt.column_double(first + 4);
  s.p50_ms = stmt.column_double(first + 5);
  s.p95_ms = stmt.column_double(first + 6);
  s.error_rate = stmt.column_double(first + 7);
  s.tokens_in = stmt.column_int64(first + 8);
  s.tokens_out = stmt.column_int64(first + 9);
  return s;
}

Run run_from_row(const Statement &stmt) {
  Run r;
  r.run_id = stmt.column_text(0);
  r.started_at = timestamp_from_epoch_ms(stmt.column_int64(1));
  if (!stmt.column_is_null(2)) {
    r.finished_at = timestamp_from_epoch_ms(stmt.column_int64(2));
  }
  r.model_id = stmt.column_text(3);
  r.host = stmt.column_text(4);
  r.notes = stmt.column_text(5);
  return r;
}

std::string escape_csv_field(std::string_view field) {
  bool needs_wrap = field.find(',') != std::string_view::npos ||
                    field.find('"') != std::string_view::npos ||
                    field.find('\n') != std::string_view::npos ||
                    field.find('\r') != std::string_view::npos;
  std::string escaped;
  escaped.reserve(field.size());
  for (char c : field) {
    if (c == '"') {
      escaped += "\"\"";
    } else {
      escaped += c;
    }
  }
  if (needs_wrap) {
    return std::string("\"") + escaped + "\"";
  }
  return escaped;
}
} // namespace

Statement::Statement(sqlite3 *db, const char *sql) : db_(db) {
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
    std::string msg = sqlite3_errmsg(db_);
    stmt_ = nullptr;
    throw std::runtime_error("Failed to prepare statement: " + msg);
  }
}

Statement::~Statement() {
  if (stmt_) {
    sqlite3_finalize(stmt_);
  }
}

void Statement::bind(int index, const std::string &value) {
  sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void Statement::bind(int index, long long value) {
  sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
}

void Statement::bind(int index, int value) {
  sqlite3_bind_int(stmt_, index, value);
}

void Statement::bind(int index, double value) {
  sqlite3_bind_double(stmt_, index, value);
}

void Statement::bind_null(int index) { sqlite3_bind_null(stmt_, index); }

bool Statement::step() {
  int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) {
    return true;
  }
  if (rc == SQLITE_DONE) {
    return false;
  }
  throw std::runtime_error(std::string("Failed to execute statement: ") +
                           sqlite3_errmsg(db_));
}

void Statement::execute() {
  while (step()) {
  }
}

long long Statement::column_int64(int col) const {
  return static_cast<long long>(sqlite3_column_int64(stmt_, col));
}

double Statement::column_double(int col) const {
  return sqlite3_column_double(stmt_, col);
}

std::string Statement::column_text(int col) const {
  const unsigned char *text = sqlite3_column_text(stmt_, col);
  return text ? reinterpret_cast<const char *>(text) : "";
}

bool Statement::column_is_null(int col) const {
  return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

void to_json(nlohmann::json &j, const RunSummary &s) {
  j = nlohmann::json{{"run_id", s.run.run_id},
                     {"model_id", s.run.model_id},
                     {"host", s.run.host},
                     {"started_at", iso_timestamp(s.run.started_at)},
                     {"total_jobs", s.total_jobs},
                     {"failed_jobs", s.failed_jobs},
                     {"avg_latency_ms", s.avg_latency_ms},
                     {"max_latency_ms", s.max_latency_ms},
                     {"total_tokens", s.total_tokens}};
  if (s.run.finished_at) {
    j["finished_at"] = iso_timestamp(*s.run.finished_at);
  } else {
    j["finished_at"] = nullptr;
  }
  if (s.best_sample) {
    j["best_throughput_rps"] = s.best_sample->throughput_rps;
    j["best_concurrency"] = s.best_sample->concurrency;
    j["best_p95_ms"] = s.best_sample->p95_ms;
  } else {
    j["best_throughput_rps"] = nullptr;
    j["best_concurrency"] = nullptr;
    j["best_p95_ms"] = nullptr;
  }
}

std::string generate_run_id() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  std::array<unsigned char, 16> bytes{};
  for (std::size_t i = 0; i < bytes.size(); i += 8) {
    std::uint64_t word = rng();
    for (std::size_t b = 0; b < 8; ++b) {
      bytes[i + b] = static_cast<unsigned char>(word >> (b * 8));
    }
  }
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);
  char buf[37];
  std::snprintf(buf, sizeof(buf),
                "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-"
                "%02x%02x%02x%02x%02x%02x",
                bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5],
                bytes[6], bytes[7], bytes[8], bytes[9], bytes[10], bytes[11],
                bytes[12], bytes[13], bytes[14], bytes[15]);
  return buf;
}

std::string local_hostname() {
  char buf[256] = {0};
  if (gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0') {
    return "unknown";
  }
  return buf;
}

/**
 * Open the telemetry database and create its schema.
 *
 * @param db_path Path to the SQLite database file to open or create.
 * @throws std::runtime_error When the database cannot be opened or the schema
 *         initialization fails.
 */
TelemetryStore::TelemetryStore(const std::string &db_path) {
  telemetry_log()->debug("Telemetry: opening DB {}", db_path);
  if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
    if (db_) {
      sqlite3_close(db_);
      db_ = nullptr;
    }
    throw std::runtime_error("Failed to open database " + db_path + ": " +
                             msg);
  }
  sqlite3_busy_timeout(db_, 5000);
  try {
    exec("PRAGMA foreign_keys=ON;");
    if (db_path != ":memory:") {
      exec("PRAGMA journal_mode=WAL;");
      exec("PRAGMA synchronous=NORMAL;");
    }
    exec(kSchema);
  } catch (const std::exception &) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
  telemetry_log()->debug("Telemetry: DB initialized");
}

TelemetryStore::~TelemetryStore() {
  if (db_) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

void TelemetryStore::exec(const char *sql) {
  char *err = nullptr;
  if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errmsg(db_);
    sqlite3_free(err);
    throw std::runtime_error("SQLite error: " + msg);
  }
}

Run TelemetryStore::begin_run(const std::string &model_id,
                              const std::string &host,
                              const std::string &notes) {
  Run run;
  run.run_id = generate_run_id();
  run.started_at = now_timestamp();
  run.model_id = model_id;
  run.host = host;
  run.notes = notes;
  insert_run(run);
  telemetry_log()->info("Started run {} (model {}, host {})", run.run_id,
                        model_id, host);
  return run;
}

void TelemetryStore::insert_run(const Run &run) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(db_, "INSERT INTO runs(run_id,started_at,finished_at,"
                      "model_id,host,notes) VALUES(?,?,?,?,?,?)");
  stmt.bind(1, run.run_id);
  stmt.bind(2, to_epoch_ms(run.started_at));
  if (run.finished_at) {
    stmt.bind(3, to_epoch_ms(*run.finished_at));
  } else {
    stmt.bind_null(3);
  }
  stmt.bind(4, run.model_id);
  stmt.bind(5, run.host);
  stmt.bind(6, run.notes);
  stmt.execute();
}

void TelemetryStore::insert_sample_locked(const std::string &run_id,
                                          const Sample &s) {
  Statement stmt(db_, "INSERT OR IGNORE INTO samples(run_id,ts,window_sec,"
                      "concurrency,queue_depth,throughput_rps,p50_ms,p95_ms,"
                      "error_rate,tokens_in,tokens_out) "
                      "VALUES(?,?,?,?,?,?,?,?,?,?,?)");
  stmt.bind(1, run_id);
  stmt.bind(2, to_epoch_ms(s.ts));
  stmt.bind(3, s.window_sec);
  stmt.bind(4, s.concurrency);
  stmt.bind(5, static_cast<long long>(s.queue_depth));
  stmt.bind(6, s.throughput_rps);
  stmt.bind(7, s.p50_ms);
  stmt.bind(8, s.p95_ms);
  stmt.bind(9, s.error_rate);
  stmt.bind(10, s.tokens_in);
  stmt.bind(11, s.tokens_out);
  stmt.execute();
}

void TelemetryStore::insert_job_locked(const std::string &run_id,
                                       const JobRecord &r) {
  Statement stmt(db_, "INSERT INTO jobs(run_id,started_at,finished_at,"
                      "latency_ms,model_id,prompt_tokens,completion_tokens,"
                      "http_status,error_text) VALUES(?,?,?,?,?,?,?,?,?)");
  stmt.bind(1, run_id);
  stmt.bind(2, to_epoch_ms(r.started_at));
  stmt.bind(3, to_epoch_ms(r.finished_at));
  stmt.bind(4, r.latency_ms);
  stmt.bind(5, r.model_id);
  stmt.bind(6, r.prompt_tokens);
  stmt.bind(7, r.completion_tokens);
  if (r.http_status) {
    stmt.bind(8, *r.http_status);
  } else {
    stmt.bind_null(8);
  }
  if (r.error_text) {
    stmt.bind(9, *r.error_text);
  } else {
    stmt.bind_null(9);
  }
  stmt.execute();
}

/**
 * Persist @p sample for @p run_id.
 *
 * Samples are keyed by `(run_id, ts)`: writing the same sample twice keeps
 * one row. SampleAggregator::tick never emits two samples with the same
 * millisecond timestamp.
 */
void TelemetryStore::record_sample(const std::string &run_id,
                                   const Sample &sample) {
  std::lock_guard<std::mutex> lock(mutex_);
  insert_sample_locked(run_id, sample);
}

void TelemetryStore::record_job(const std::string &run_id,
                                const JobRecord &record) {
  std::lock_guard<std::mutex> lock(mutex_);
  insert_job_locked(run_id, record);
}

void TelemetryStore::record_batch(const std::string &run_id,
                                  const std::vector<JobRecord> &jobs,
                                  const std::vector<Sample> &samples) {
  std::lock_guard<std::mutex> lock(mutex_);
  exec("BEGIN IMMEDIATE;");
  try {
    for (const auto &r : jobs) {
      insert_job_locked(run_id, r);
    }
    for (const auto &s : samples) {
      insert_sample_locked(run_id, s);
    }
    exec("COMMIT;");
  } catch (const std::exception &e) {
    char *err = nullptr;
    if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
      telemetry_log()->error("Rollback failed: {}", err ? err : "unknown");
    }
    sqlite3_free(err);
    throw;
  }
}

bool TelemetryStore::finish_run(const std::string &run_id,
                                Timestamp finished_at) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(db_, "UPDATE runs SET finished_at=? "
                      "WHERE run_id=? AND finished_at IS NULL");
  stmt.bind(1, to_epoch_ms(finished_at));
  stmt.bind(2, run_id);
  stmt.execute();
  return sqlite3_changes(db_) > 0;
}

std::optional<Run> TelemetryStore::load_run(const std::string &run_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(db_, "SELECT run_id,started_at,finished_at,model_id,host,"
                      "notes FROM runs WHERE run_id=?");
  stmt.bind(1, run_id);
  if (!stmt.step()) {
    return std::nullopt;
  }
  return run_from_row(stmt);
}

std::vector<Run> TelemetryStore::list_runs() {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(db_, "SELECT run_id,started_at,finished_at,model_id,host,"
                      "notes FROM runs ORDER BY started_at, rowid");
  std::vector<Run> runs;
  while (stmt.step()) {
    runs.push_back(run_from_row(stmt));
  }
  return runs;
}

std::vector<Sample> TelemetryStore::load_samples(const std::string &run_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string sql = std::string("SELECT ") + kSampleColumns +
                    " FROM samples WHERE run_id=? ORDER BY ts";
  Statement stmt(db_, sql.c_str());
  stmt.bind(1, run_id);
  std::vector<Sample> samples;
  while (stmt.step()) {
    samples.push_back(sample_from_row(stmt, 0));
  }
  return samples;
}

std::vector<JobRecord> TelemetryStore::load_jobs(const std::string &run_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  Statement stmt(db_, "SELECT started_at,finished_at,latency_ms,model_id,"
                      "prompt_tokens,completion_tokens,http_status,error_text "
                      "FROM jobs WHERE run_id=? ORDER BY id");
  stmt.bind(1, run_id);
  std::vector<JobRecord> jobs;
  while (stmt.step()) {
    JobRecord r;
    r.started_at = timestamp_from_epoch_ms(stmt.column_int64(0));
    r.finished_at = timestamp_from_epoch_ms(stmt.column_int64(1));
    r.latency_ms = stmt.column_double(2);
    r.model_id = stmt.column_text(3);
    r.prompt_tokens = static_cast<int>(stmt.column_int64(4));
    r.completion_tokens = static_cast<int>(stmt.column_int64(5));
    if (!stmt.column_is_null(6)) {
      r.http_status = static_cast<int>(stmt.column_int64(6));
    }
    if (!stmt.column_is_null(7)) {
      r.error_text = stmt.column_text(7);
    }
    jobs.push_back(std::move(r));
  }
  return jobs;
}

RunSummary TelemetryStore::run_summary(const std::string &run_id) {
  auto run = load_run(run_id);
  if (!run) {
    throw std::runtime_error("Unknown run " + run_id);
  }
  RunSummary summary;
  summary.run = *run;
  std::lock_guard<std::mutex> lock(mutex_);
  {
    Statement stmt(db_,
                   "SELECT COUNT(*),"
                   "COALESCE(SUM(CASE WHEN error_text IS NOT NULL THEN 1 "
                   "ELSE 0 END),0),"
                   "COALESCE(AVG(latency_ms),0),COALESCE(MAX(latency_ms),0),"
                   "COALESCE(SUM(completion_tokens),0) "
                   "FROM jobs WHERE run_id=?");
    stmt.bind(1, run_id);
    if (stmt.step()) {
      summary.total_jobs = static_cast<std::size_t>(stmt.column_int64(0));
      summary.failed_jobs = static_cast<std::size_t>(stmt.column_int64(1));
      summary.avg_latency_ms = stmt.column_double(2);
      summary.max_latency_ms = stmt.column_double(3);
      summary.total_tokens = stmt.column_int64(4);
    }
  }
  std::string sql = std::string("SELECT ") + kSampleColumns +
                    " FROM samples WHERE run_id=? "
                    "ORDER BY throughput_rps DESC, ts LIMIT 1";
  Statement best(db_, sql.c_str());
  best.bind(1, run_id);
  if (best.step()) {
    summary.best_sample = sample_from_row(best, 0);
  }
  return summary;
}

/**
 * Export one run to a JSON document.
 *
 * @param run_id Run to export.
 * @param path Destination file path.
 * @throws std::runtime_error On database query errors or I/O failures.
 */
void TelemetryStore::export_json(const std::string &run_id,
                                 const std::string &path) {
  telemetry_log()->debug("Telemetry: export_json -> {}", path);
  RunSummary summary = run_summary(run_id);
  nlohmann::json j;
  j["run"] = summary.run;
  j["summary"] = summary;
  j["samples"] = load_samples(run_id);
  j["jobs"] = load_jobs(run_id);
  std::ofstream out(path);
  if (!out) {
    throw std::runtime_error("Failed to open JSON file " + path);
  }
  out << j.dump(2);
}

/**
 * Export the jobs of one run to a CSV file.
 *
 * @param run_id Run to export.
 * @param path Destination file path.
 * @throws std::runtime_error On database query errors or I/O failures.
 */
void TelemetryStore::export_csv(const std::string &run_id,
                                const std::string &path) {
  telemetry_log()->debug("Telemetry: export_csv -> {}", path);
  auto jobs = load_jobs(run_id);
  std::ofstream out(path);
  if (!out) {
    throw std::runtime_error("Failed to open CSV file " + path);
  }
  out << "run_id,started_at,finished_at,latency_ms,model_id,prompt_tokens,"
         "completion_tokens,http_status,error_text\n";
  for (const auto &r : jobs) {
    out << escape_csv_field(run_id) << ','
        << escape_csv_field(iso_timestamp(r.started_at)) << ','
        << escape_csv_field(iso_timestamp(r.finished_at)) << ','
        << r.latency_ms << ',' << escape_csv_field(r.model_id) << ','
        << r.prompt_tokens << ',' << r.completion_tokens << ','
        << (r.http_status ? std::to_string(*r.http_status) : std::string())
        << ',' << escape_csv_field(r.error_text.value_or("")) << '\n';
  }
}

TelemetryRecorder::TelemetryRecorder(std::unique_ptr<TelemetryStore> store,
                                     Run run)
    : store_(std::move(store)), run_(std::move(run)) {
  thread_ = std::thread([this] { writer(); });
}

TelemetryRecorder::~TelemetryRecorder() { stop_writer(); }

std::unique_ptr<TelemetryRecorder>
TelemetryRecorder::open(const std::string &db_path,
                        const std::string &model_id, const std::string &host,
                        const std::string &notes) {
  if (!db_path.empty()) {
    try {
      auto store = std::make_unique<TelemetryStore>(db_path);
      Run run = store->begin_run(model_id, host, notes);
      return std::make_unique<TelemetryRecorder>(std::move(store),
                                                 std::move(run));
    } catch (const std::exception &e) {
      telemetry_log()->error(
          "Telemetry store unavailable ({}); continuing without persistence",
          e.what());
    }
  } else {
    telemetry_log()->info("No database configured; telemetry is log-only");
  }
  Run run;
  run.run_id = generate_run_id();
  run.started_at = now_timestamp();
  run.model_id = model_id;
  run.host = host;
  run.notes = notes;
  return std::make_unique<TelemetryRecorder>(nullptr, std::move(run));
}

void TelemetryRecorder::record_job(const JobRecord &record) {
  if (record.failed()) {
    telemetry_log()->debug("Job {} failed after {:.0f}ms: {}", record.job_id,
                           record.latency_ms, *record.error_text);
  }
  if (!store_) {
    return;
  }
  {
    std::lock_guard<std::mutex> lk(mutex_);
    if (stop_) {
      dropped_.fetch_add(1);
      return;
    }
    queue_.emplace_back(record);
  }
  cv_.notify_one();
}

void TelemetryRecorder::record_sample(const Sample &sample) {
  telemetry_log()->info(
      "sample c={} q={} rps={:.2f} p50={:.0f}ms p95={:.0f}ms err={:.3f} "
      "tok_in={} tok_out={}",
      sample.concurrency, sample.queue_depth, sample.throughput_rps,
      sample.p50_ms, sample.p95_ms, sample.error_rate, sample.tokens_in,
      sample.tokens_out);
  if (!store_) {
    return;
  }
  {
    std::lock_guard<std::mutex> lk(mutex_);
    if (stop_) {
      dropped_.fetch_add(1);
      return;
    }
    queue_.emplace_back(sample);
  }
  cv_.notify_one();
}

void TelemetryRecorder::flush() {
  std::unique_lock<std::mutex> lk(mutex_);
  idle_cv_.wait(lk, [this] { return queue_.empty() && !busy_; });
}

void TelemetryRecorder::finish(Timestamp finished_at) {
  {
    std::lock_guard<std::mutex> lk(mutex_);
    if (finished_) {
      return;
    }
    finished_ = true;
  }
  flush();
  run_.finished_at = finished_at;
  if (!store_) {
    return;
  }
  try {
    store_->finish_run(run_.run_id, finished_at);
    telemetry_log()->info("Finished run {} ({} rows written, {} dropped)",
                          run_.run_id, written_.load(), dropped_.load());
  } catch (const std::exception &e) {
    telemetry_log()->error("Failed to finish run {}: {}", run_.run_id,
                           e.what());
  }
}

std::optional<RunSummary> TelemetryRecorder::summary() {
  if (!store_) {
    return std::nullopt;
  }
  flush();
  try {
    return store_->run_summary(run_.run_id);
  } catch (const std::exception &e) {
    telemetry_log()->error("Failed to summarize run {}: {}", run_.run_id,
                           e.what());
    return std::nullopt;
  }
}

void TelemetryRecorder::writer() {
  while (true) {
    std::vector<JobRecord> jobs;
    std::vector<Sample> samples;
    {
      std::unique_lock<std::mutex> lk(mutex_);
      cv_.wait(lk, [this] { return stop_ || !queue_.empty(); });
      if (stop_ && queue_.empty()) {
        break;
      }
      while (!queue_.empty()) {
        Row row = std::move(queue_.front());
        queue_.pop_front();
        if (auto *job = std::get_if<JobRecord>(&row)) {
          jobs.push_back(std::move(*job));
        } else {
          samples.push_back(std::get<Sample>(row));
        }
      }
      busy_ = true;
    }
    const std::size_t rows = jobs.size() + samples.size();
    try {
      store_->record_batch(run_.run_id, jobs, samples);
      written_.fetch_add(rows);
    } catch (const std::exception &e) {
      dropped_.fetch_add(rows);
      telemetry_log()->error("Dropped {} telemetry rows: {}", rows, e.what());
    }
    {
      std::lock_guard<std::mutex> lk(mutex_);
      busy_ = false;
    }
    idle_cv_.notify_all();
  }
  idle_cv_.notify_all();
}

void TelemetryRecorder::stop_writer() {
  {
    std::lock_guard<std::mutex> lk(mutex_);
    stop_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

} // namespace llmperf
