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

constexpr const char *kRootLoggerName = "sitewatch";
constexpr std::size_t kMaxLogFileBytes = 5 * 1024 * 1024;

std::weak_ptr<spdlog::logger> g_logger;
std::mutex g_logger_mutex;
std::once_flag g_thread_pool_once;

namespace fs = std::filesystem;

void ensure_thread_pool() {
  std::call_once(g_thread_pool_once, [] {
    constexpr std::size_t queue_size = 32768;
    constexpr std::size_t num_threads = 1;
    spdlog::init_thread_pool(queue_size, num_threads);
  });
}

std::shared_ptr<spdlog::details::thread_pool> logging_pool() {
  auto pool = spdlog::thread_pool();
  if (!pool) {
    ensure_thread_pool();
    pool = spdlog::thread_pool();
  }
  return pool;
}

/**
 * Compute the path spdlog uses for the rotated file with the given index
 * (`watch.log` -> `watch.1.log`).
 */
fs::path rotated_path(const std::string &base, std::size_t index) {
  fs::path base_path(base);
  if (index == 0) {
    return base_path;
  }
  std::string stem = base_path.stem().string();
  std::string ext = base_path.extension().string();
  if (stem.empty()) {
    stem = base_path.filename().string();
    ext.clear();
  }
  return base_path.parent_path() /
         (stem + "." + std::to_string(index) + ext);
}

/**
 * Shift existing `.gz` archives up by one index, dropping the oldest.
 */
void shift_compressed_logs(const std::string &base, std::size_t max_files) {
  if (max_files == 0) {
    return;
  }
  std::error_code ec;
  fs::remove(rotated_path(base, max_files).string() + ".gz", ec);
  for (std::size_t i = max_files; i > 1; --i) {
    fs::path from(rotated_path(base, i - 1).string() + ".gz");
    if (!fs::exists(from, ec)) {
      continue;
    }
    fs::path to(rotated_path(base, i).string() + ".gz");
    fs::remove(to, ec);
    fs::rename(from, to, ec);
  }
}

/**
 * Gzip @p path into `<path>.gz` and remove the original on success.
 */
bool gzip_file(const std::string &path) {
  auto log = sitewatch::category_logger("logging");
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    log->warn("Cannot open {} for compression", path);
    return false;
  }
  const std::string target = path + ".gz";
  gzFile gz = gzopen(target.c_str(), "wb");
  if (gz == nullptr) {
    log->warn("Cannot create compressed log {}", target);
    return false;
  }
  char buffer[16 * 1024];
  while (input) {
    input.read(buffer, sizeof(buffer));
    std::streamsize got = input.gcount();
    if (got <= 0) {
      continue;
    }
    int written = gzwrite(gz, buffer, static_cast<unsigned>(got));
    if (written != got) {
      int err = 0;
      const char *msg = gzerror(gz, &err);
      log->warn("Compressing {} failed: {}", path, msg ? msg : "unknown");
      gzclose(gz);
      std::error_code ec;
      fs::remove(target, ec);
      return false;
    }
  }
  gzclose(gz);
  input.close();
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    log->warn("Compressed {} but could not remove it: {}", path,
              ec.message());
  }
  log->debug("Compressed rotated log into {}", target);
  return true;
}

std::vector<spdlog::sink_ptr> make_sinks(const std::string &file,
                                         std::size_t rotate_files,
                                         bool compress_rotations) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (file.empty()) {
    return sinks;
  }
  if (rotate_files == 0) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, true));
    return sinks;
  }
  spdlog::file_event_handlers handlers;
  if (compress_rotations) {
    handlers.before_open = [rotate_files](const spdlog::filename_t &name) {
      const auto base = spdlog::details::os::filename_to_str(name);
      shift_compressed_logs(base, rotate_files);
      std::error_code ec;
      fs::path newest = rotated_path(base, 1);
      if (fs::exists(newest, ec)) {
        gzip_file(newest.string());
      }
    };
  }
  sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      file, kMaxLogFileBytes, rotate_files, false, handlers));
  return sinks;
}

} // namespace

namespace sitewatch {

void init_logger(spdlog::level::level_enum level, const std::string &pattern,
                 const std::string &file, std::size_t rotate_files,
                 bool compress_rotations) {
  ensure_thread_pool();
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  auto logger = spdlog::get(kRootLoggerName);
  if (!logger) {
    auto sinks = make_sinks(file, rotate_files, compress_rotations);
    logger = std::make_shared<spdlog::async_logger>(
        kRootLoggerName, sinks.begin(), sinks.end(), logging_pool(),
        spdlog::async_overflow_policy::block);
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
    g_logger = logger;
  }
  lock.unlock();
  logger->set_level(level);
  if (!pattern.empty()) {
    spdlog::set_pattern(pattern);
  }
  logger->info("Logger ready (level={}, file='{}', rotate={}, compress={})",
               spdlog::level::to_string_view(level), file, rotate_files,
               compress_rotations);
}

void ensure_default_logger() {
  auto current = spdlog::default_logger();
  auto ours = g_logger.lock();
  if (!current || !ours || current.get() != ours.get()) {
    init_logger(spdlog::level::info);
  }
}

std::shared_ptr<spdlog::logger> category_logger(const std::string &category) {
  ensure_thread_pool();
  const std::string name = std::string(kRootLoggerName) + "." + category;
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  if (auto existing = spdlog::get(name)) {
    return existing;
  }
  auto root = g_logger.lock();
  if (!root) {
    lock.unlock();
    init_logger(spdlog::level::info);
    lock.lock();
    if (auto existing = spdlog::get(name)) {
      return existing;
    }
    root = g_logger.lock();
  }
  std::vector<spdlog::sink_ptr> sinks;
  if (root) {
    sinks = root->sinks();
  } else {
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  }
  auto logger = std::make_shared<spdlog::async_logger>(
      name, sinks.begin(), sinks.end(), logging_pool(),
      spdlog::async_overflow_policy::block);
  logger->set_level(root ? root->level() : spdlog::level::info);
  spdlog::register_logger(logger);
  return logger;
}

void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides) {
  if (overrides.empty()) {
    return;
  }
  for (const auto &[category, level] : overrides) {
    auto logger = category_logger(category);
    logger->set_level(level);
    logger->debug("Category '{}' set to {}", category,
                  spdlog::level::to_string_view(level));
  }
  category_logger("logging")
      ->info("Applied {} log category override(s)", overrides.size());
}

} // namespace sitewatch
