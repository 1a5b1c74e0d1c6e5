#include "log.hpp"
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>
#include <zlib.h>

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/details/os.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {
constexpr const char *kRootLoggerName = "llmperf";
constexpr std::size_t kMaxLogFileBytes = 5 * 1024 * 1024;

std::weak_ptr<spdlog::logger> g_root;
std::mutex g_root_mutex;
std::once_flag g_pool_once;

namespace fs = std::filesystem;

std::shared_ptr<spdlog::details::thread_pool> shared_pool() {
  std::call_once(g_pool_once, [] {
    constexpr std::size_t queue_slots = 32768;
    constexpr std::size_t workers = 1;
    spdlog::init_thread_pool(queue_slots, workers);
  });
  return spdlog::thread_pool();
}

/**
 * Path of the @p index-th rotated file for @p base (`app.log` -> `app.2.log`).
 */
fs::path rotated_path(const std::string &base, std::size_t index) {
  fs::path base_path(base);
  if (index == 0) {
    return base_path;
  }
  fs::path stem = base_path.stem();
  fs::path ext = base_path.extension();
  if (stem.empty()) {
    stem = base_path.filename();
    ext.clear();
  }
  std::string name = stem.string() + "." + std::to_string(index) + ext.string();
  return base_path.has_parent_path() ? base_path.parent_path() / name
                                     : fs::path(name);
}

fs::path gz_path(const fs::path &p) { return fs::path(p.string() + ".gz"); }

/**
 * Shift existing `.gz` archives one slot up, dropping the oldest.
 */
void shift_archives(const std::string &base, std::size_t keep) {
  if (keep == 0) {
    return;
  }
  std::error_code ec;
  fs::remove(gz_path(rotated_path(base, keep)), ec);
  for (std::size_t i = keep; i > 1; --i) {
    fs::path from = gz_path(rotated_path(base, i - 1));
    if (!fs::exists(from, ec)) {
      continue;
    }
    fs::path to = gz_path(rotated_path(base, i));
    fs::remove(to, ec);
    fs::rename(from, to, ec);
  }
}

/**
 * Gzip @p path into `<path>.gz` and remove the original.
 *
 * @return `true` when the archive was written.
 */
bool gzip_file(const fs::path &path) {
  auto log = llmperf::category_logger("logging");
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    log->warn("Cannot read {} for compression", path.string());
    return false;
  }
  fs::path target = gz_path(path);
  gzFile gz = gzopen(target.string().c_str(), "wb");
  if (gz == nullptr) {
    log->warn("Cannot create {}", target.string());
    return false;
  }
  std::vector<char> buffer(16 * 1024);
  bool ok = true;
  while (ok && input) {
    input.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    auto got = input.gcount();
    if (got <= 0) {
      break;
    }
    int written = gzwrite(gz, buffer.data(), static_cast<unsigned>(got));
    if (written != got) {
      int err = 0;
      const char *msg = gzerror(gz, &err);
      log->warn("Compression of {} failed: {}", path.string(),
                msg != nullptr ? msg : "unknown");
      ok = false;
    }
  }
  gzclose(gz);
  input.close();
  std::error_code ec;
  if (!ok) {
    fs::remove(target, ec);
    return false;
  }
  fs::remove(path, ec);
  if (ec) {
    log->warn("Could not remove {} after compression: {}", path.string(),
              ec.message());
  }
  log->debug("Archived rotated log to {}", target.string());
  return true;
}

std::vector<spdlog::sink_ptr> build_sinks(const std::string &file,
                                          std::size_t rotate_files,
                                          bool compress) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (file.empty()) {
    return sinks;
  }
  if (rotate_files == 0) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, true));
    return sinks;
  }
  spdlog::file_event_handlers handlers;
  if (compress) {
    handlers.before_open = [rotate_files](const spdlog::filename_t &name) {
      const auto base = spdlog::details::os::filename_to_str(name);
      shift_archives(base, rotate_files);
      fs::path newest = rotated_path(base, 1);
      std::error_code ec;
      if (fs::exists(newest, ec)) {
        gzip_file(newest);
      }
    };
  }
  sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      file, kMaxLogFileBytes, rotate_files, false, handlers));
  return sinks;
}

std::shared_ptr<spdlog::logger>
make_async(const std::string &name, const std::vector<spdlog::sink_ptr> &sinks) {
  return std::make_shared<spdlog::async_logger>(
      name, sinks.begin(), sinks.end(), shared_pool(),
      spdlog::async_overflow_policy::block);
}
} // namespace

namespace llmperf {

void init_logger(spdlog::level::level_enum level, const std::string &pattern,
                 const std::string &file, std::size_t rotate_files,
                 bool compress_rotations) {
  shared_pool();
  std::shared_ptr<spdlog::logger> root;
  {
    std::lock_guard<std::mutex> lock(g_root_mutex);
    root = spdlog::get(kRootLoggerName);
    auto sinks = build_sinks(file, rotate_files, compress_rotations);
    if (!root) {
      root = make_async(kRootLoggerName, sinks);
      spdlog::set_default_logger(root);
      g_root = root;
    } else {
      // re-initialization: point the root and every category at the new sinks
      const std::string prefix = std::string(kRootLoggerName) + ".";
      root->flush();
      spdlog::apply_all([&](const std::shared_ptr<spdlog::logger> &l) {
        if (l->name() == kRootLoggerName ||
            l->name().compare(0, prefix.size(), prefix) == 0) {
          l->flush();
          l->sinks() = sinks;
          l->set_level(level);
        }
      });
    }
  }
  root->set_level(level);
  if (!pattern.empty()) {
    spdlog::set_pattern(pattern);
  }
  root->debug("Logger ready (level={}, file='{}', rotate={}, compress={})",
              spdlog::level::to_string_view(level), file, rotate_files,
              compress_rotations);
}

void ensure_default_logger() {
  auto current = spdlog::default_logger();
  auto ours = g_root.lock();
  if (!current || !ours || current.get() != ours.get()) {
    init_logger(spdlog::level::info);
  }
}

std::shared_ptr<spdlog::logger> category_logger(const std::string &category) {
  const std::string name = std::string(kRootLoggerName) + "." + category;
  if (auto existing = spdlog::get(name)) {
    return existing;
  }
  if (!g_root.lock()) {
    init_logger(spdlog::level::info);
  }
  std::lock_guard<std::mutex> lock(g_root_mutex);
  if (auto existing = spdlog::get(name)) {
    return existing;
  }
  auto root = g_root.lock();
  std::vector<spdlog::sink_ptr> sinks;
  if (root) {
    sinks = root->sinks();
  } else {
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }
  auto logger = make_async(name, sinks);
  logger->set_level(root ? root->level() : spdlog::level::info);
  spdlog::register_logger(logger);
  return logger;
}

void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides) {
  for (const auto &[category, level] : overrides) {
    category_logger(category)->set_level(level);
  }
  if (!overrides.empty()) {
    category_logger("logging")->debug("Applied {} category level override(s)",
                                      overrides.size());
  }
}

spdlog::level::level_enum parse_log_level(const std::string &name,
                                          spdlog::level::level_enum fallback) {
  auto level = spdlog::level::from_str(name);
  // from_str maps unknown names to off; only accept off when asked for it
  if (level == spdlog::level::off && name != "off") {
    return fallback;
  }
  return level;
}

void flush_logs() {
  spdlog::apply_all([](const std::shared_ptr<spdlog::logger> &l) { l->flush(); });
}

} // namespace llmperf
