#include "app.hpp"

#include <atomic>
#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include <set>
#include <sstream>
#include <string>
#include <vector>

using namespace llmperf;

namespace {
int run_app(App &app, std::vector<std::string> args) {
  args.insert(args.begin(), "llmperf");
  std::vector<char *> argv;
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  return app.run(static_cast<int>(argv.size()), argv.data());
}
} // namespace

TEST_CASE("serve turns json lines into job records", "[app]") {
  App app;
  REQUIRE(run_app(app, {"--simulate", "--simulate-latency", "5ms", "--no-db",
                        "-p", "0", "--drain-timeout", "5s"}) == 0);
  REQUIRE_FALSE(app.should_exit());
  REQUIRE(app.config().simulate_enabled());
  REQUIRE(app.config().db_path().empty());

  std::istringstream in(
      "{\"id\": 7, \"prompt\": \"hello world\"}\n"
      "not json\n"
      "\n"
      "{\"messages\": [{\"role\": \"user\", \"content\": \"one two three\"}],"
      " \"model\": \"other\"}\n"
      "{\"max_tokens\": 5}\n");
  std::ostringstream out;
  std::atomic<bool> interrupt{false};
  REQUIRE(app.serve(in, out, &interrupt) == 0);

  std::istringstream lines(out.str());
  std::string line;
  std::set<std::string> models;
  std::set<int> prompt_tokens;
  bool saw_id = false;
  int count = 0;
  while (std::getline(lines, line)) {
    auto j = nlohmann::json::parse(line);
    REQUIRE(j.contains("latency_ms"));
    REQUIRE(j["error_text"].is_null());
    models.insert(j["model_id"].get<std::string>());
    prompt_tokens.insert(j["prompt_tokens"].get<int>());
    if (j["job_id"] == 7) {
      saw_id = true;
    }
    ++count;
  }
  REQUIRE(count == 2);
  REQUIRE(saw_id);
  REQUIRE(models.count("other") == 1);
  REQUIRE(prompt_tokens == std::set<int>{2, 3});
}

TEST_CASE("invalid configuration exits with code 2", "[app]") {
  App app;
  REQUIRE(run_app(app, {"--min-concurrency", "5", "--max-concurrency",
                        "3"}) == 2);
  REQUIRE(app.should_exit());
}

TEST_CASE("benchmark without a bound exits with code 2", "[app]") {
  App app;
  REQUIRE(run_app(app, {"--bench", "--simulate", "--no-db"}) == 2);
  REQUIRE(app.should_exit());
}

TEST_CASE("print-config exits cleanly", "[app]") {
  App app;
  REQUIRE(run_app(app, {"--print-config", "--max-concurrency", "9"}) == 0);
  REQUIRE(app.should_exit());
  REQUIRE(app.config().concurrency_max() == 9);
}

TEST_CASE("benchmark reports through the app", "[app]") {
  App app;
  REQUIRE(run_app(app, {"--bench", "-n", "10", "--simulate",
                        "--simulate-latency", "2ms", "--no-db", "-p",
                        "0"}) == 0);
  std::ostringstream out;
  REQUIRE(app.bench(out, nullptr) == 0);
  REQUIRE(out.str().find("BENCHMARK SUMMARY") != std::string::npos);
  REQUIRE(out.str().find("Jobs Completed: 10") != std::string::npos);
}
