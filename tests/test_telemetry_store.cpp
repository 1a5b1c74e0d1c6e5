#include "telemetry_store.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace llmperf;
using namespace std::chrono_literals;
using Catch::Approx;

namespace {
JobRecord job_record(Timestamp finished, double latency, int status,
                     const char *error = nullptr) {
  JobRecord r;
  r.started_at = finished - 250ms;
  r.finished_at = finished;
  r.latency_ms = latency;
  r.model_id = "sim-model";
  r.prompt_tokens = 6;
  r.completion_tokens = 20;
  r.http_status = status;
  if (error) {
    r.error_text = error;
  }
  return r;
}

Sample sample_at(Timestamp ts, double rps, int concurrency) {
  Sample s;
  s.ts = ts;
  s.window_sec = 60;
  s.concurrency = concurrency;
  s.queue_depth = 2;
  s.throughput_rps = rps;
  s.p50_ms = 120;
  s.p95_ms = 340;
  s.error_rate = 0.0;
  s.tokens_in = 60;
  s.tokens_out = 200;
  return s;
}

std::string read_file(const std::filesystem::path &path) {
  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}
} // namespace

TEST_CASE("run ids are distinct uuids") {
  auto a = generate_run_id();
  auto b = generate_run_id();
  CHECK(a != b);
  CHECK(a.size() == 36);
  CHECK(a[14] == '4');
}

TEST_CASE("job records round trip through the store") {
  TelemetryStore store(":memory:");
  Run run = store.begin_run("sim-model", "bench-host", "smoke");
  auto now = now_timestamp();
  store.record_job(run.run_id, job_record(now, 250.5, 200));
  store.record_job(run.run_id, job_record(now + 10ms, 900, 503, "busy, retry"));

  auto jobs = store.load_jobs(run.run_id);
  REQUIRE(jobs.size() == 2);
  CHECK(jobs[0].started_at == now - 250ms);
  CHECK(jobs[0].finished_at == now);
  CHECK(jobs[0].latency_ms == Approx(250.5));
  CHECK(jobs[0].model_id == "sim-model");
  CHECK(jobs[0].prompt_tokens == 6);
  CHECK(jobs[0].completion_tokens == 20);
  CHECK(jobs[0].http_status == 200);
  CHECK_FALSE(jobs[0].error_text);
  CHECK(jobs[1].http_status == 503);
  REQUIRE(jobs[1].error_text);
  CHECK(*jobs[1].error_text == "busy, retry");

  auto loaded = store.load_run(run.run_id);
  REQUIRE(loaded);
  CHECK(loaded->host == "bench-host");
  CHECK(loaded->notes == "smoke");
  CHECK_FALSE(loaded->finished_at);
}

TEST_CASE("samples are unique per run and timestamp") {
  TelemetryStore store(":memory:");
  Run run = store.begin_run("m", "h", "");
  auto ts = now_timestamp();
  store.record_sample(run.run_id, sample_at(ts, 4.0, 2));
  store.record_sample(run.run_id, sample_at(ts, 9.0, 3));
  store.record_sample(run.run_id, sample_at(ts + 1s, 6.0, 3));
  auto samples = store.load_samples(run.run_id);
  REQUIRE(samples.size() == 2);
  CHECK(samples[0].throughput_rps == Approx(4.0));
  CHECK(samples[0].ts == ts);
  CHECK(samples[1].concurrency == 3);
}

TEST_CASE("a run finishes once") {
  TelemetryStore store(":memory:");
  Run run = store.begin_run("m", "h", "");
  auto end = now_timestamp() + 5s;
  CHECK(store.finish_run(run.run_id, end));
  CHECK_FALSE(store.finish_run(run.run_id, end + 1s));
  auto loaded = store.load_run(run.run_id);
  REQUIRE(loaded);
  REQUIRE(loaded->finished_at);
  CHECK(*loaded->finished_at == end);
}

TEST_CASE("summary aggregates jobs and picks the best sample") {
  TelemetryStore store(":memory:");
  Run run = store.begin_run("m", "h", "");
  auto now = now_timestamp();
  std::vector<JobRecord> jobs{job_record(now, 100, 200),
                              job_record(now, 300, 200),
                              job_record(now, 500, 429, "rate limited")};
  std::vector<Sample> samples{sample_at(now, 3.0, 2),
                              sample_at(now + 1s, 7.5, 4),
                              sample_at(now + 2s, 5.0, 5)};
  store.record_batch(run.run_id, jobs, samples);

  auto summary = store.run_summary(run.run_id);
  CHECK(summary.total_jobs == 3);
  CHECK(summary.failed_jobs == 1);
  CHECK(summary.avg_latency_ms == Approx(300));
  CHECK(summary.max_latency_ms == Approx(500));
  CHECK(summary.total_tokens == 60);
  REQUIRE(summary.best_sample);
  CHECK(summary.best_sample->concurrency == 4);

  nlohmann::json j = summary;
  CHECK(j["best_throughput_rps"].get<double>() == Approx(7.5));
  CHECK(j["failed_jobs"] == 1);

  CHECK_THROWS_AS(store.run_summary("no-such-run"), std::runtime_error);
  CHECK(store.list_runs().size() == 1);
}

TEST_CASE("exports write json and csv") {
  auto dir = std::filesystem::temp_directory_path();
  auto json_path = dir / "llmperf_export_test.json";
  auto csv_path = dir / "llmperf_export_test.csv";
  TelemetryStore store(":memory:");
  Run run = store.begin_run("m", "h", "");
  auto now = now_timestamp();
  store.record_job(run.run_id, job_record(now, 120, 200));
  store.record_job(run.run_id, job_record(now, 80, 500, "said \"no\""));
  store.record_sample(run.run_id, sample_at(now, 2.0, 2));

  store.export_json(run.run_id, json_path.string());
  auto doc = nlohmann::json::parse(read_file(json_path));
  CHECK(doc["run"]["run_id"] == run.run_id);
  CHECK(doc["jobs"].size() == 2);
  CHECK(doc["samples"].size() == 1);
  CHECK(doc["summary"]["total_jobs"] == 2);

  store.export_csv(run.run_id, csv_path.string());
  std::string csv = read_file(csv_path);
  CHECK(csv.rfind("run_id,started_at,finished_at,latency_ms", 0) == 0);
  CHECK(csv.find("\"said \"\"no\"\"\"") != std::string::npos);

  std::filesystem::remove(json_path);
  std::filesystem::remove(csv_path);
}

TEST_CASE("recorder persists rows through its writer thread") {
  auto store = std::make_unique<TelemetryStore>(":memory:");
  Run run = store->begin_run("m", "h", "");
  TelemetryRecorder recorder(std::move(store), run);
  auto now = now_timestamp();
  for (int i = 0; i < 25; ++i) {
    recorder.record_job(job_record(now, 100 + i, 200));
  }
  recorder.record_sample(sample_at(now, 5.0, 3));
  recorder.finish(now + 1s);
  recorder.finish(now + 2s);

  CHECK(recorder.persistent());
  CHECK(recorder.written() == 26);
  REQUIRE(recorder.run().finished_at);
  CHECK(*recorder.run().finished_at == now + 1s);
  auto summary = recorder.summary();
  REQUIRE(summary);
  CHECK(summary->total_jobs == 25);
  REQUIRE(summary->run.finished_at);
  CHECK(*summary->run.finished_at == now + 1s);
}

TEST_CASE("recorder without a database only logs") {
  auto recorder = TelemetryRecorder::open("", "m", "h", "notes");
  REQUIRE(recorder);
  CHECK_FALSE(recorder->persistent());
  CHECK(recorder->store() == nullptr);
  CHECK_FALSE(recorder->run().run_id.empty());
  recorder->record_job(job_record(now_timestamp(), 10, 200));
  recorder->record_sample(sample_at(now_timestamp(), 1.0, 2));
  recorder->finish(now_timestamp());
  CHECK_FALSE(recorder->summary());
  CHECK(recorder->written() == 0);
}

TEST_CASE("unusable database path degrades to logging") {
  auto recorder = TelemetryRecorder::open(
      "/nonexistent-dir/for/llmperf/test.db", "m", "h", "");
  REQUIRE(recorder);
  CHECK_FALSE(recorder->persistent());
}
