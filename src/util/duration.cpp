#include "util/duration.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace llmperf {

std::chrono::milliseconds parse_duration(const std::string &str) {
  using std::chrono::milliseconds;
  if (str.empty()) {
    return milliseconds{0};
  }

  long long total_ms = 0;
  std::size_t i = 0;
  bool has_unit = false;

  while (i < str.size()) {
    if (!std::isdigit(static_cast<unsigned char>(str[i]))) {
      throw std::runtime_error("Invalid duration string: " + str);
    }
    long long value = 0;
    while (i < str.size() && std::isdigit(static_cast<unsigned char>(str[i]))) {
      value = value * 10 + (str[i] - '0');
      ++i;
    }
    if (i == str.size()) {
      if (has_unit) {
        throw std::runtime_error("Missing unit in duration: " + str);
      }
      total_ms += value * 1000; // bare seconds
      break;
    }
    std::string unit;
    while (i < str.size() && std::isalpha(static_cast<unsigned char>(str[i]))) {
      unit += static_cast<char>(std::tolower(static_cast<unsigned char>(str[i])));
      ++i;
    }
    if (unit == "ms") {
      total_ms += value;
    } else if (unit == "s") {
      total_ms += value * 1000;
    } else if (unit == "m") {
      total_ms += value * 60 * 1000;
    } else if (unit == "h") {
      total_ms += value * 3600 * 1000;
    } else if (unit == "d") {
      total_ms += value * 86400 * 1000;
    } else {
      throw std::runtime_error("Invalid duration suffix '" + unit + "'");
    }
    has_unit = true;
  }

  return milliseconds{total_ms};
}

std::string format_duration(std::chrono::milliseconds d) {
  auto ms = d.count();
  std::ostringstream oss;
  if (ms < 1000) {
    oss << ms << "ms";
  } else if (ms % 1000 == 0) {
    oss << ms / 1000 << 's';
  } else {
    oss << std::fixed << std::setprecision(1)
        << static_cast<double>(ms) / 1000.0 << 's';
  }
  return oss.str();
}

} // namespace llmperf
