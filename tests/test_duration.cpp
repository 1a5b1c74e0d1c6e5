#include "util/duration.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>

using namespace llmperf;
using namespace std::chrono;

TEST_CASE("parse_duration supports combined units") {
  CHECK(parse_duration("1h30m") == seconds{3600 + 30 * 60});
  CHECK(parse_duration("2d3h4m5s") ==
        seconds{2 * 86400 + 3 * 3600 + 4 * 60 + 5});
  CHECK(parse_duration("1s500ms") == milliseconds{1500});
  CHECK(parse_duration("") == milliseconds{0});
}

TEST_CASE("parse_duration treats bare numbers as seconds") {
  CHECK(parse_duration("10") == seconds{10});
  CHECK(parse_duration("0") == milliseconds{0});
  CHECK(parse_duration("250ms") == milliseconds{250});
}

TEST_CASE("parse_duration rejects invalid strings") {
  CHECK_THROWS_AS(parse_duration("1h30"), std::runtime_error);
  CHECK_THROWS_AS(parse_duration("10m5"), std::runtime_error);
  CHECK_THROWS_AS(parse_duration("abc"), std::runtime_error);
  CHECK_THROWS_AS(parse_duration("1.5h"), std::runtime_error);
  CHECK_THROWS_AS(parse_duration("5w"), std::runtime_error);
}

TEST_CASE("format_duration picks a readable unit") {
  CHECK(format_duration(milliseconds{500}) == "500ms");
  CHECK(format_duration(seconds{15}) == "15s");
  CHECK(format_duration(milliseconds{1500}) == "1.5s");
}
