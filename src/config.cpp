#include "config.hpp"
#include "log.hpp"
#include "util/duration.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace llmperf {

namespace {

std::shared_ptr<spdlog::logger> config_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("config");
  }();
  return logger;
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

/**
 * Convert a YAML scalar to the narrowest JSON type that represents it.
 */
nlohmann::json yaml_scalar_to_json(const std::string &s) {
  if (s == "true" || s == "True" || s == "TRUE")
    return true;
  if (s == "false" || s == "False" || s == "FALSE")
    return false;
  if (!s.empty()) {
    errno = 0;
    char *end = nullptr;
    long long i = std::strtoll(s.c_str(), &end, 10);
    if (errno == 0 && end == s.c_str() + s.size())
      return i;
    errno = 0;
    end = nullptr;
    double d = std::strtod(s.c_str(), &end);
    if (errno == 0 && end == s.c_str() + s.size())
      return d;
  }
  return s;
}

/**
 * Convert a YAML node into a structurally equivalent JSON value.
 *
 * @param node YAML node to transform.
 * @return JSON value mirroring the YAML content.
 */
nlohmann::json yaml_to_json(const YAML::Node &node) {
  using nlohmann::json;
  switch (node.Type()) {
  case YAML::NodeType::Scalar:
    return yaml_scalar_to_json(node.Scalar());
  case YAML::NodeType::Sequence: {
    json arr = json::array();
    std::transform(node.begin(), node.end(), std::back_inserter(arr),
                   [](const YAML::Node &item) { return yaml_to_json(item); });
    return arr;
  }
  case YAML::NodeType::Map: {
    json obj = json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
    }
    return obj;
  }
  default:
    return nullptr;
  }
}

/**
 * Translate a TOML node to JSON.
 *
 * @param node Parsed TOML node.
 * @return Equivalent JSON value; date/time values become strings.
 */
nlohmann::json toml_to_json(const toml::node &node) {
  using nlohmann::json;
  if (const auto *table = node.as_table()) {
    json obj = json::object();
    for (const auto &kv : *table) {
      obj[std::string(kv.first.str())] = toml_to_json(kv.second);
    }
    return obj;
  }
  if (const auto *array = node.as_array()) {
    json arr = json::array();
    for (const auto &item : *array) {
      arr.push_back(toml_to_json(item));
    }
    return arr;
  }
  if (const auto *value = node.as_boolean())
    return value->get();
  if (const auto *value = node.as_integer())
    return value->get();
  if (const auto *value = node.as_floating_point())
    return value->get();
  if (const auto *value = node.as_string())
    return value->get();
  std::ostringstream oss;
  if (const auto *value = node.as_date())
    oss << value->get();
  else if (const auto *value = node.as_time())
    oss << value->get();
  else if (const auto *value = node.as_date_time())
    oss << value->get();
  else
    return nullptr;
  return oss.str();
}

/**
 * Flatten grouped sections into the flat keys load_json() reads.
 *
 * A section key gains the section prefix unless it already carries it, so
 * `concurrency: {min: 2}` and `concurrency: {concurrency_min: 2}` both map to
 * `concurrency_min`.
 */
nlohmann::json normalize_config_sections(const nlohmann::json &source) {
  static const std::pair<std::string_view, std::string_view> sections[] = {
      {"concurrency", "concurrency_"}, {"targets", "target_"},
      {"tuning", ""},                  {"upstream", ""},
      {"queue", ""},                   {"retry", ""},
      {"telemetry", ""},               {"metrics", "metrics_"},
      {"logging", "log_"},             {"bench", "bench_"},
      {"simulate", "simulate_"}};
  nlohmann::json normalized = source;
  for (const auto &[name, prefix] : sections) {
    auto it = source.find(std::string{name});
    if (it == source.end() || !it->is_object()) {
      continue;
    }
    for (const auto &[key, value] : it->items()) {
      std::string flat = key;
      if (!prefix.empty() && flat.rfind(prefix, 0) != 0) {
        flat = std::string{prefix} + flat;
      }
      normalized[flat] = value;
    }
    normalized.erase(std::string{name});
  }
  return normalized;
}

/**
 * Read a duration given as seconds (number) or as text such as "500ms".
 */
std::chrono::milliseconds duration_value(const nlohmann::json &value) {
  if (value.is_number()) {
    return std::chrono::milliseconds(
        std::llround(value.get<double>() * 1000.0));
  }
  if (value.is_string()) {
    return parse_duration(value.get<std::string>());
  }
  throw ConfigError("expected duration number or string");
}

std::string env_value(const char *name) {
  const char *v = std::getenv(name);
  return v != nullptr ? std::string(v) : std::string();
}

int env_int(const std::string &name, const std::string &raw) {
  std::size_t idx = 0;
  int value = 0;
  try {
    value = std::stoi(raw, &idx);
  } catch (const std::exception &) {
    throw ConfigError(name + " must be an integer, got '" + raw + "'");
  }
  if (idx != raw.size()) {
    throw ConfigError(name + " must be an integer, got '" + raw + "'");
  }
  return value;
}

double env_double(const std::string &name, const std::string &raw) {
  std::size_t idx = 0;
  double value = 0.0;
  try {
    value = std::stod(raw, &idx);
  } catch (const std::exception &) {
    throw ConfigError(name + " must be a number, got '" + raw + "'");
  }
  if (idx != raw.size()) {
    throw ConfigError(name + " must be a number, got '" + raw + "'");
  }
  return value;
}

std::chrono::milliseconds env_seconds(const std::string &name,
                                      const std::string &raw) {
  return std::chrono::milliseconds(
      std::llround(env_double(name, raw) * 1000.0));
}

} // namespace

int Config::effective_concurrency_start() const {
  int start = concurrency_start_ > 0 ? concurrency_start_ : concurrency_min_;
  return std::clamp(start, concurrency_min_,
                    std::max(concurrency_min_, concurrency_max_));
}

void Config::validate() const {
  auto fail = [](const std::string &msg) {
    config_log()->error("Invalid configuration: {}", msg);
    throw ConfigError(msg);
  };
  if (concurrency_min_ < 1)
    fail("concurrency_min must be >= 1");
  if (concurrency_max_ < concurrency_min_)
    fail("concurrency_max (" + std::to_string(concurrency_max_) +
         ") must be >= concurrency_min (" + std::to_string(concurrency_min_) +
         ")");
  if (concurrency_start_ < 0)
    fail("concurrency_start must be >= 0");
  if (!(target_p95_ms_ > 0.0))
    fail("target_p95_ms must be > 0");
  if (target_error_rate_ < 0.0 || target_error_rate_ > 1.0)
    fail("target_error_rate must be within [0, 1]");
  if (sample_window_.count() <= 0)
    fail("sample_window must be positive");
  if (tune_interval_.count() <= 0)
    fail("tune_interval must be positive");
  if (increase_step_ < 1 || decrease_step_ < 1)
    fail("increase_step and decrease_step must be >= 1");
  if (queue_capacity_ < 1)
    fail("queue_capacity must be >= 1");
  if (max_retries_ < 0)
    fail("max_retries must be >= 0");
  if (retry_base_delay_.count() < 0 || retry_max_delay_ < retry_base_delay_)
    fail("retry_max_delay must be >= retry_base_delay >= 0");
  if (drain_timeout_.count() < 0)
    fail("drain_timeout must be >= 0");
  if (request_timeout_.count() <= 0)
    fail("request_timeout must be positive");
  if (max_tokens_ < 1)
    fail("max_tokens must be >= 1");
  if (temperature_ < 0.0 || temperature_ > 2.0)
    fail("temperature must be within [0, 2]");
  if (metrics_port_ < 0 || metrics_port_ > 65535)
    fail("metrics_port must be within [0, 65535]");
  if (endpoint_url_.empty() && !simulate_enabled_)
    fail("endpoint_url must not be empty");
  if (model_id_.empty())
    fail("model_id must not be empty");
  if (simulate_error_rate_ < 0.0 || simulate_error_rate_ > 1.0)
    fail("simulate_error_rate must be within [0, 1]");
  if (simulate_latency_.count() < 0)
    fail("simulate_latency must be >= 0");
  if (bench_jobs_ < 0 || bench_duration_.count() < 0 || bench_pace_ < 0.0)
    fail("bench limits must be non-negative");
}

void Config::apply_environment() {
  struct Binding {
    const char *name;
    void (*apply)(Config &, const std::string &, const std::string &);
  };
  static const Binding bindings[] = {
      {"CONCURRENCY_MIN",
       [](Config &c, const std::string &n, const std::string &v) {
         c.set_concurrency_min(env_int(n, v));
       }},
      {"CONCURRENCY_MAX",
       [](Config &c, const std::string &n, const std::string &v) {
         c.set_concurrency_max(env_int(n, v));
       }},
      {"CONCURRENCY_START",
       [](Config &c, const std::string &n, const std::string &v) {
         c.set_concurrency_start(env_int(n, v));
       }},
      {"TARGET_P95_MS",
       [](Config &c, const std::string &n, const std::string &v) {
         c.set_target_p95_ms(env_double(n, v));
       }},
      {"TARGET_ERROR_RATE",
       [](Config &c, const std::string &n, const std::string &v) {
         c.set_target_error_rate(env_double(n, v));
       }},
      {"SAMPLE_WINDOW_SEC",
       [](Config &c, const std::string &n, const std::string &v) {
         c.set_sample_window(env_seconds(n, v));
       }},
      {"TUNE_INTERVAL_SEC",
       [](Config &c, const std::string &n, const std::string &v) {
         c.set_tune_interval(env_seconds(n, v));
       }},
      {"INCREASE_STEP",
       [](Config &c, const std::string &n, const std::string &v) {
         c.set_increase_step(env_int(n, v));
       }},
      {"DECREASE_STEP",
       [](Config &c, const std::string &n, const std::string &v) {
         c.set_decrease_step(env_int(n, v));
       }},
      {"REQUEST_TIMEOUT_SEC",
       [](Config &c, const std::string &n, const std::string &v) {
         c.set_request_timeout(env_seconds(n, v));
       }},
      {"METRICS_PORT",
       [](Config &c, const std::string &n, const std::string &v) {
         c.set_metrics_port(env_int(n, v));
       }},
      {"BACKPRESSURE_QUEUE_MAX",
       [](Config &c, const std::string &n, const std::string &v) {
         c.set_queue_capacity(env_int(n, v));
       }},
      {"LLM_ENDPOINT",
       [](Config &c, const std::string &, const std::string &v) {
         c.set_endpoint_url(v);
       }},
      {"MODEL_ID",
       [](Config &c, const std::string &, const std::string &v) {
         c.set_model_id(v);
       }},
      {"MAX_TOKENS",
       [](Config &c, const std::string &n, const std::string &v) {
         c.set_max_tokens(env_int(n, v));
       }},
      {"TEMPERATURE",
       [](Config &c, const std::string &n, const std::string &v) {
         c.set_temperature(env_double(n, v));
       }},
      {"PERF_DB_PATH",
       [](Config &c, const std::string &, const std::string &v) {
         c.set_db_path(v);
       }},
      {"LLM_API_KEY",
       [](Config &c, const std::string &, const std::string &v) {
         c.set_api_key(v);
       }},
  };
  int applied = 0;
  for (const auto &binding : bindings) {
    std::string raw = env_value(binding.name);
    if (raw.empty()) {
      continue;
    }
    binding.apply(*this, binding.name, raw);
    ++applied;
  }
  if (applied > 0) {
    config_log()->debug("Applied {} environment override(s)", applied);
  }
}

/**
 * Populate configuration settings from a JSON object.
 *
 * @param j JSON document holding flat keys or grouped sections.
 * @throws ConfigError When a value cannot be converted to the expected type.
 */
void Config::load_json(const nlohmann::json &j) {
  nlohmann::json cfg = normalize_config_sections(j);
  std::string current;
  auto has = [&cfg, &current](const char *key) {
    current = key;
    return cfg.contains(key) && !cfg[key].is_null();
  };
  try {
    if (has("concurrency_min"))
      set_concurrency_min(cfg["concurrency_min"].get<int>());
    if (has("concurrency_max"))
      set_concurrency_max(cfg["concurrency_max"].get<int>());
    if (has("concurrency_start"))
      set_concurrency_start(cfg["concurrency_start"].get<int>());
    if (has("target_p95_ms"))
      set_target_p95_ms(cfg["target_p95_ms"].get<double>());
    if (has("target_error_rate"))
      set_target_error_rate(cfg["target_error_rate"].get<double>());
    if (has("sample_window_sec"))
      set_sample_window(duration_value(cfg["sample_window_sec"]));
    if (has("sample_window"))
      set_sample_window(duration_value(cfg["sample_window"]));
    if (has("tune_interval_sec"))
      set_tune_interval(duration_value(cfg["tune_interval_sec"]));
    if (has("tune_interval"))
      set_tune_interval(duration_value(cfg["tune_interval"]));
    if (has("increase_step"))
      set_increase_step(cfg["increase_step"].get<int>());
    if (has("decrease_step"))
      set_decrease_step(cfg["decrease_step"].get<int>());
    if (has("scale_down_when_idle"))
      set_scale_down_when_idle(cfg["scale_down_when_idle"].get<bool>());
    if (has("queue_capacity"))
      set_queue_capacity(cfg["queue_capacity"].get<int>());
    if (has("backpressure_queue_max"))
      set_queue_capacity(cfg["backpressure_queue_max"].get<int>());
    if (has("max_retries"))
      set_max_retries(cfg["max_retries"].get<int>());
    if (has("retry_base_delay"))
      set_retry_base_delay(duration_value(cfg["retry_base_delay"]));
    if (has("retry_max_delay"))
      set_retry_max_delay(duration_value(cfg["retry_max_delay"]));
    if (has("drain_timeout"))
      set_drain_timeout(duration_value(cfg["drain_timeout"]));
    if (has("endpoint_url"))
      set_endpoint_url(cfg["endpoint_url"].get<std::string>());
    if (has("model_id"))
      set_model_id(cfg["model_id"].get<std::string>());
    if (has("api_key"))
      set_api_key(cfg["api_key"].get<std::string>());
    if (has("request_timeout_sec"))
      set_request_timeout(duration_value(cfg["request_timeout_sec"]));
    if (has("request_timeout"))
      set_request_timeout(duration_value(cfg["request_timeout"]));
    if (has("max_tokens"))
      set_max_tokens(cfg["max_tokens"].get<int>());
    if (has("temperature"))
      set_temperature(cfg["temperature"].get<double>());
    if (has("simulate_enabled"))
      set_simulate_enabled(cfg["simulate_enabled"].get<bool>());
    if (has("simulate_latency"))
      set_simulate_latency(duration_value(cfg["simulate_latency"]));
    if (has("simulate_error_rate"))
      set_simulate_error_rate(cfg["simulate_error_rate"].get<double>());
    if (has("simulate_error_status"))
      set_simulate_error_status(cfg["simulate_error_status"].get<int>());
    if (has("db_path"))
      set_db_path(cfg["db_path"].get<std::string>());
    if (has("host"))
      set_host(cfg["host"].get<std::string>());
    if (has("notes"))
      set_notes(cfg["notes"].get<std::string>());
    if (has("metrics_port"))
      set_metrics_port(cfg["metrics_port"].get<int>());
    if (has("metrics_bind_address"))
      set_metrics_bind_address(cfg["metrics_bind_address"].get<std::string>());
    if (has("bench_jobs"))
      set_bench_jobs(cfg["bench_jobs"].get<int>());
    if (has("bench_duration"))
      set_bench_duration(duration_value(cfg["bench_duration"]));
    if (has("bench_prompt_file"))
      set_bench_prompt_file(cfg["bench_prompt_file"].get<std::string>());
    if (has("bench_pace"))
      set_bench_pace(cfg["bench_pace"].get<double>());
    if (has("log_level"))
      set_log_level(cfg["log_level"].get<std::string>());
    if (has("log_pattern"))
      set_log_pattern(cfg["log_pattern"].get<std::string>());
    if (has("log_file"))
      set_log_file(cfg["log_file"].get<std::string>());
    if (has("log_rotate"))
      set_log_rotate(cfg["log_rotate"].get<int>());
    if (has("log_compress"))
      set_log_compress(cfg["log_compress"].get<bool>());
    if (has("log_categories")) {
      std::unordered_map<std::string, std::string> categories;
      for (const auto &[name, level] : cfg["log_categories"].items()) {
        categories[name] = to_lower_copy(level.get<std::string>());
      }
      set_log_categories(std::move(categories));
    }
  } catch (const nlohmann::json::exception &e) {
    throw ConfigError("invalid value for '" + current + "': " + e.what());
  } catch (const ConfigError &e) {
    throw ConfigError("invalid value for '" + current + "': " + e.what());
  } catch (const std::runtime_error &e) {
    // parse_duration failures
    throw ConfigError("invalid value for '" + current + "': " + e.what());
  }
}

nlohmann::json Config::to_json() const {
  nlohmann::json j;
  j["concurrency_min"] = concurrency_min_;
  j["concurrency_max"] = concurrency_max_;
  j["concurrency_start"] = effective_concurrency_start();
  j["target_p95_ms"] = target_p95_ms_;
  j["target_error_rate"] = target_error_rate_;
  j["sample_window"] = format_duration(sample_window_);
  j["tune_interval"] = format_duration(tune_interval_);
  j["increase_step"] = increase_step_;
  j["decrease_step"] = decrease_step_;
  j["scale_down_when_idle"] = scale_down_when_idle_;
  j["queue_capacity"] = queue_capacity_;
  j["max_retries"] = max_retries_;
  j["retry_base_delay"] = format_duration(retry_base_delay_);
  j["retry_max_delay"] = format_duration(retry_max_delay_);
  j["drain_timeout"] = format_duration(drain_timeout_);
  j["endpoint_url"] = endpoint_url_;
  j["model_id"] = model_id_;
  j["api_key"] = api_key_.empty() ? "" : "***";
  j["request_timeout"] = format_duration(request_timeout_);
  j["max_tokens"] = max_tokens_;
  j["temperature"] = temperature_;
  j["simulate_enabled"] = simulate_enabled_;
  j["simulate_latency"] = format_duration(simulate_latency_);
  j["simulate_error_rate"] = simulate_error_rate_;
  j["simulate_error_status"] = simulate_error_status_;
  j["db_path"] = db_path_;
  j["host"] = host_;
  j["notes"] = notes_;
  j["metrics_port"] = metrics_port_;
  j["metrics_bind_address"] = metrics_bind_address_;
  j["bench_jobs"] = bench_jobs_;
  j["bench_duration"] = format_duration(bench_duration_);
  j["bench_prompt_file"] = bench_prompt_file_;
  j["bench_pace"] = bench_pace_;
  j["log_level"] = log_level_;
  j["log_pattern"] = log_pattern_;
  j["log_file"] = log_file_;
  j["log_rotate"] = log_rotate_;
  j["log_compress"] = log_compress_;
  j["log_categories"] = log_categories_;
  return j;
}

Config Config::from_json(const nlohmann::json &j) {
  Config cfg;
  cfg.load_json(j);
  return cfg;
}

/**
 * Load configuration from a file on disk.
 *
 * The format is inferred from the extension: `.yaml`/`.yml`, `.json` or
 * `.toml`/`.tml`. Errors are logged and rethrown.
 *
 * @param path Filesystem location of the configuration file.
 * @return Populated configuration on top of the defaults.
 */
Config Config::from_file(const std::string &path) {
  config_log()->debug("Loading config from {}", path);
  auto pos = path.find_last_of('.');
  if (pos == std::string::npos) {
    config_log()->error("Unknown config file extension for {}", path);
    throw std::runtime_error("Unknown config file extension");
  }
  std::string ext = to_lower_copy(path.substr(pos + 1));
  nlohmann::json j;
  try {
    if (ext == "yaml" || ext == "yml") {
      j = yaml_to_json(YAML::LoadFile(path));
    } else if (ext == "json") {
      std::ifstream f(path);
      if (!f) {
        throw std::runtime_error("Failed to open config file");
      }
      f >> j;
    } else if (ext == "toml" || ext == "tml") {
      j = toml_to_json(toml::parse_file(path));
    } else {
      throw std::runtime_error("Unsupported config format: " + ext);
    }
  } catch (const std::exception &e) {
    config_log()->error("Failed to load config {}: {}", path, e.what());
    throw;
  }
  if (!j.is_object()) {
    throw ConfigError("config root in " + path + " must be a mapping");
  }
  Config cfg;
  cfg.load_json(j);
  config_log()->info("Config loaded from {}", path);
  return cfg;
}

} // namespace llmperf
