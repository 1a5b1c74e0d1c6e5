/**
 * @file duration.hpp
 * @brief Human-readable duration parsing.
 *
 * Parses strings such as "250ms", "15s", "2m" or "1h30m" into
 * std::chrono::milliseconds for configuration and CLI values.
 */
#ifndef LLMPERF_UTIL_DURATION_HPP
#define LLMPERF_UTIL_DURATION_HPP

#include <chrono>
#include <string>

namespace llmperf {

/**
 * Parse a duration string into milliseconds.
 *
 * Units: `ms`, `s`, `m`, `h`, `d`. Several number/unit pairs may be chained
 * and a bare number is read as seconds.
 *
 * @param str Duration text; empty yields zero.
 * @return Parsed duration.
 * @throws std::runtime_error On malformed input or an unknown unit.
 */
std::chrono::milliseconds parse_duration(const std::string &str);

/**
 * Render a duration compactly, e.g. `1500ms` -> "1.5s".
 */
std::string format_duration(std::chrono::milliseconds d);

} // namespace llmperf

#endif // LLMPERF_UTIL_DURATION_HPP
