/**
 * @file log.hpp
 * @brief Logging setup for llmperf.
 *
 * Declares logger initialization, per-module category loggers and level
 * overrides shared by every component.
 */

#ifndef LLMPERF_LOG_HPP
#define LLMPERF_LOG_HPP

#include <cstddef>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace llmperf {

/**
 * Initialize the process logger with a console sink and an optional rotating
 * file sink.
 *
 * @param level Verbosity applied to the default logger.
 * @param pattern spdlog pattern; empty keeps the library default.
 * @param file Log file path. Empty disables file output.
 * @param rotate_files Rotated files to keep when @p file is set. Zero writes a
 *        single non-rotating file.
 * @param compress_rotations Gzip rotated files as they are rolled over.
 */
void init_logger(spdlog::level::level_enum level,
                 const std::string &pattern = "", const std::string &file = "",
                 std::size_t rotate_files = 3, bool compress_rotations = false);

/**
 * Retrieve or create the logger for a module.
 *
 * Category loggers are named `llmperf.<category>` and write to the sinks of the
 * default logger.
 *
 * @param category Module name such as `pool` or `telemetry`.
 * @return Shared category logger.
 */
std::shared_ptr<spdlog::logger> category_logger(const std::string &category);

/**
 * Apply per-category level overrides.
 *
 * @param overrides Category name to level.
 */
void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides);

/// Create the default logger on demand when init_logger() was never called.
void ensure_default_logger();

/**
 * Convert a textual level (`trace` ... `off`) to an spdlog level.
 *
 * @param name Level name, case-sensitive as spdlog expects.
 * @param fallback Level returned for unknown names.
 */
spdlog::level::level_enum parse_log_level(const std::string &name,
                                          spdlog::level::level_enum fallback =
                                              spdlog::level::info);

/// Flush every registered logger. Called before process exit.
void flush_logs();

} // namespace llmperf

#endif // LLMPERF_LOG_HPP
