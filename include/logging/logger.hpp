#ifndef FETCHMAP_LOGGING_LOGGER_HPP
#define FETCHMAP_LOGGING_LOGGER_HPP

#include <string>
#include <memory>
#include <boost/format.hpp>
#include <boost/property_tree/ptree.hpp>

namespace logging {

enum class log_level : int {
  finer = 0,
  debug = 1,
  info = 2,
  warning = 3,
  error = 4
};

/* A destination for log messages. Implementations must be safe
 * to call from several threads at once; the curl worker thread
 * logs alongside the main thread.
 */
struct logger {
  virtual ~logger();
  virtual void write(log_level level, const std::string &msg) = 0;
};

struct log {
  /* Configure the global logger from a property tree. Recognised
   * keys are:
   *
   *   type
   *     One of "stdout", "stderr", "file" or "null". Defaults
   *     to "stderr".
   *
   *   location
   *     Path of the log file, required when type is "file".
   *
   *   level
   *     Minimum level to output: "finer", "debug", "info",
   *     "warning" or "error". Defaults to "info".
   *
   * Throws std::runtime_error for unknown types or levels.
   */
  static void configure(const boost::property_tree::ptree &conf);

  // install a logger directly, mostly useful in tests.
  static void configure(std::shared_ptr<logger> sink, log_level threshold);

  static bool enabled(log_level level);

  static void write(log_level level, const char *msg);
  static void write(log_level level, const std::string &msg);
  static void write(log_level level, const boost::format &fmt);
};

// parses a level name, throwing std::runtime_error if unknown.
log_level level_from_string(const std::string &name);

} // namespace logging

#define FETCHMAP_LOG(lvl, x) do { \
    if (::logging::log::enabled(lvl)) { ::logging::log::write((lvl), (x)); } \
  } while (false)

#define LOG_FINER(x)   FETCHMAP_LOG(::logging::log_level::finer, x)
#define LOG_DEBUG(x)   FETCHMAP_LOG(::logging::log_level::debug, x)
#define LOG_INFO(x)    FETCHMAP_LOG(::logging::log_level::info, x)
#define LOG_WARNING(x) FETCHMAP_LOG(::logging::log_level::warning, x)
#define LOG_ERROR(x)   FETCHMAP_LOG(::logging::log_level::error, x)

#endif /* FETCHMAP_LOGGING_LOGGER_HPP */
