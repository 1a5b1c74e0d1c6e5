/**
 * @file cli.hpp
 * @brief Command line interface parsing and options for llmperf.
 *
 * Declares CLI parsing helpers, option structures, and related exceptions for
 * the tool.
 */

#ifndef LLMPERF_CLI_HPP
#define LLMPERF_CLI_HPP

#include "config.hpp"

#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <unordered_map>

namespace llmperf {

/**
 * Signals that CLI parsing requested an immediate exit (help, errors, etc.).
 * Used to bubble exit codes from parsing back to the main entry point without
 * treating them as fatal errors.
 */
class CliParseExit : public std::exception {
public:
  /**
   * Construct an exit signal with the desired exit code.
   *
   * @param exit_code Process exit code that should be returned to the caller.
   */
  explicit CliParseExit(int exit_code) noexcept : exit_code_(exit_code) {}

  /// Process exit code requested by the parser.
  int exit_code() const noexcept { return exit_code_; }

  const char *what() const noexcept override {
    return "CLI parsing requested exit";
  }

private:
  int exit_code_;
};

/**
 * Parsed command line options.
 *
 * Unset optionals leave the configuration file and environment values in
 * place; set ones override them.
 */
struct CliOptions {
  std::string config_file; ///< Path to YAML, TOML or JSON configuration
  bool verbose{false};     ///< Shortcut for debug logging
  bool print_config{false}; ///< Print the effective configuration and exit
  bool bench{false};        ///< Run the benchmark instead of serving

  std::string log_level{"info"}; ///< Requested logging level
  std::string log_file;          ///< Log file path, empty for console only
  std::optional<int> log_rotate;
  bool log_compress{false};
  bool log_compress_explicit{false};
  std::unordered_map<std::string, std::string>
      log_categories; ///< Category -> level overrides requested via CLI
  bool log_categories_explicit{false};

  std::optional<std::string> endpoint_url;
  std::optional<std::string> model_id;
  std::optional<std::string> api_key;
  std::optional<std::chrono::milliseconds> request_timeout;
  std::optional<int> max_tokens;
  std::optional<double> temperature;

  std::optional<int> concurrency_min;
  std::optional<int> concurrency_max;
  std::optional<int> concurrency_start;
  std::optional<double> target_p95_ms;
  std::optional<double> target_error_rate;
  std::optional<std::chrono::milliseconds> sample_window;
  std::optional<std::chrono::milliseconds> tune_interval;
  std::optional<int> queue_capacity;
  std::optional<int> max_retries;
  std::optional<std::chrono::milliseconds> drain_timeout;

  std::optional<std::string> db_path;
  bool no_db{false}; ///< Disable persistence regardless of db_path
  std::optional<std::string> notes;
  std::optional<int> metrics_port;
  std::optional<std::string> metrics_bind_address;
  std::string export_json; ///< Export the run as JSON after it finishes
  std::string export_csv;  ///< Export the run's jobs as CSV after it finishes

  bool simulate{false};
  std::optional<std::chrono::milliseconds> simulate_latency;
  std::optional<double> simulate_error_rate;

  std::optional<int> bench_jobs;
  std::optional<std::chrono::milliseconds> bench_duration;
  std::optional<std::string> bench_prompt_file;
  std::optional<double> bench_pace;
  std::string report_json; ///< Write the benchmark report as JSON
};

/**
 * Parse command line arguments.
 *
 * @param argc Argument count.
 * @param argv Argument vector.
 * @return Parsed options.
 * @throws CliParseExit When parsing encounters non-error conditions such as
 *         `--help` or `--version`, or when arguments are invalid.
 */
CliOptions parse_cli(int argc, char **argv);

/**
 * Overlay every option set on the command line onto @p config.
 *
 * @param options Parsed CLI options.
 * @param config Configuration already loaded from file and environment.
 */
void apply_cli_overrides(const CliOptions &options, Config &config);

} // namespace llmperf

#endif // LLMPERF_CLI_HPP
