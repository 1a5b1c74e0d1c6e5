#include "completion_client.hpp"

#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <nlohmann/json.hpp>

using namespace llmperf;
using namespace std::chrono_literals;

namespace {
/// Records the last request and answers with a canned response.
class FakeHttpClient : public HttpClient {
public:
  HttpResponse response;
  std::string last_url;
  std::string last_body;
  std::vector<std::string> last_headers;

  HttpResponse post(const std::string &url, const std::string &body,
                    const std::vector<std::string> &headers,
                    std::chrono::milliseconds,
                    const std::atomic<bool> *) override {
    last_url = url;
    last_body = body;
    last_headers = headers;
    return response;
  }
};

Job sample_job() {
  Job j = make_prompt_job("tell me a short joke", "gpt-test");
  j.id = 11;
  j.max_tokens = 64;
  j.temperature = 0.2;
  return j;
}
} // namespace

TEST_CASE("count_words splits on whitespace") {
  CHECK(count_words("") == 0);
  CHECK(count_words("  one ") == 1);
  CHECK(count_words("two\twords\n") == 2);
  CHECK(count_words("a b  c   d") == 4);
}

TEST_CASE("payload carries model, messages and sampling settings") {
  auto payload = OpenAICompletionClient::build_payload(sample_job());
  CHECK(payload["model"] == "gpt-test");
  CHECK(payload["max_tokens"] == 64);
  CHECK(payload["temperature"].get<double>() == 0.2);
  REQUIRE(payload["messages"].size() == 1);
  CHECK(payload["messages"][0]["role"] == "user");
  CHECK(payload["messages"][0]["content"] == "tell me a short joke");
}

TEST_CASE("usage block wins over word counts") {
  std::string body = R"({"choices":[{"message":{"content":"why not"}}],
                         "usage":{"prompt_tokens":12,"completion_tokens":5}})";
  auto result =
      OpenAICompletionClient::parse_response(sample_job(), body, 200);
  CHECK(result.content == "why not");
  CHECK(result.prompt_tokens == 12);
  CHECK(result.completion_tokens == 5);
  CHECK(result.http_status == 200);
}

TEST_CASE("missing usage falls back to word counts") {
  std::string body =
      R"({"choices":[{"message":{"content":"knock knock who is there"}}],
          "usage":{"prompt_tokens":null}})";
  auto result =
      OpenAICompletionClient::parse_response(sample_job(), body, 200);
  CHECK(result.prompt_tokens == 5);
  CHECK(result.completion_tokens == 5);
}

TEST_CASE("malformed bodies are rejected") {
  CHECK_THROWS_AS(
      OpenAICompletionClient::parse_response(sample_job(), "not json", 200),
      MalformedResponseError);
  CHECK_THROWS_AS(OpenAICompletionClient::parse_response(
                      sample_job(), R"({"choices":[]})", 200),
                  MalformedResponseError);
  try {
    OpenAICompletionClient::parse_response(sample_job(), R"({"id":1})", 200);
    FAIL("expected MalformedResponseError");
  } catch (const MalformedResponseError &e) {
    CHECK(e.status == 200);
  }
}

TEST_CASE("complete posts to the endpoint with the bearer token") {
  auto http = std::make_shared<FakeHttpClient>();
  http->response.status_code = 200;
  http->response.body =
      R"({"choices":[{"message":{"content":"hello there"}}]})";
  OpenAICompletionClient client(http, "http://localhost:9/v1/chat/completions",
                                "sk-test", 5s);
  std::atomic<bool> cancel{false};
  auto result = client.complete(sample_job(), cancel);
  CHECK(result.content == "hello there");
  CHECK(http->last_url == "http://localhost:9/v1/chat/completions");
  REQUIRE(http->last_headers.size() == 1);
  CHECK(http->last_headers[0] == "Authorization: Bearer sk-test");
  auto sent = nlohmann::json::parse(http->last_body);
  CHECK(sent["model"] == "gpt-test");
}

TEST_CASE("no authorization header without an api key") {
  auto http = std::make_shared<FakeHttpClient>();
  http->response.status_code = 200;
  http->response.body = R"({"choices":[{"message":{"content":"x"}}]})";
  OpenAICompletionClient client(http, "http://localhost:9/v1", "", 5s);
  std::atomic<bool> cancel{false};
  client.complete(sample_job(), cancel);
  CHECK(http->last_headers.empty());
}
