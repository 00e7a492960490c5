/**
 * @file log.hpp
 * @brief Logging utilities for sitewatch.
 *
 * Declares logger initialization, category loggers, and log category
 * configuration shared by every component of the watcher.
 */

#ifndef SITEWATCH_LOG_HPP
#define SITEWATCH_LOG_HPP

#include <cstddef>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>

namespace sitewatch {

/**
 * Initialize the global logger with a console sink and an optional file sink.
 *
 * @param level Logging verbosity level applied to the default logger.
 * @param pattern Log message pattern. An empty string keeps the spdlog
 *        default pattern.
 * @param file Optional log file path. When empty only the console sink is
 *        configured.
 * @param rotate_files Number of rotated files to retain when @p file is set
 *        (0 writes a single, never rotated file).
 * @param compress_rotations Gzip rotated files before they are shifted.
 */
void init_logger(spdlog::level::level_enum level,
                 const std::string &pattern = "", const std::string &file = "",
                 std::size_t rotate_files = 3, bool compress_rotations = false);

/**
 * Retrieve or create the logger for a category.
 *
 * Category loggers are registered as `sitewatch.<category>` and share the
 * sinks of the default logger so that their output lands in the same
 * destinations while their level can be tuned independently.
 *
 * @param category Category name such as "scheduler" or "store".
 * @return Shared pointer to the category logger.
 */
std::shared_ptr<spdlog::logger> category_logger(const std::string &category);

/**
 * Apply per-category level overrides.
 *
 * @param overrides Mapping of category name to level.
 */
void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides);

/**
 * Make sure the `sitewatch` default logger is installed.
 *
 * Components call this lazily before creating their category logger so that
 * library code and tests can log without an explicit init_logger() call.
 */
void ensure_default_logger();

} // namespace sitewatch

#endif // SITEWATCH_LOG_HPP
