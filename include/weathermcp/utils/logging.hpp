#ifndef WEATHERMCP_UTILS_LOGGING_HPP_
#define WEATHERMCP_UTILS_LOGGING_HPP_

#include <functional>
#include <sstream>
#include <string>

namespace weathermcp {
namespace logging {

/**
 * @brief Log levels
 */
enum class Level { Trace, Debug, Info, Warning, Error, Fatal };

/**
 * @brief Convert a log level to a string
 *
 * @param level The log level
 * @return std::string The upper-case name of the level
 */
std::string levelToString(Level level);

/**
 * @brief Parse a log level from a string
 *
 * Matching is case-insensitive, so "info", "INFO" and "Info" are accepted.
 * "warn" is accepted as an alias of "warning".
 *
 * @param level_str The string representation
 * @return Level The log level
 * @throws std::invalid_argument if the string is not a valid log level
 */
Level levelFromString(const std::string &level_str);

/**
 * @brief Log handler function type
 *
 * @param level The log level
 * @param message The log message
 * @param file The source file
 * @param line The source line
 */
using LogHandler = std::function<void(Level level, const std::string &message,
                                      const std::string &file, int line)>;

/**
 * @brief Set the global log level
 */
void setLevel(Level level);

/**
 * @brief Get the global log level
 */
Level getLevel();

/**
 * @brief Set the global log handler
 *
 * Passing an empty handler restores the default stderr handler.
 *
 * @param handler The log handler
 */
void setHandler(LogHandler handler);

/**
 * @brief Log a message
 *
 * @param level The log level
 * @param message The log message
 * @param file The source file
 * @param line The source line
 */
void log(Level level, const std::string &message, const std::string &file = "",
         int line = 0);

/**
 * @brief Check if a log level is enabled
 */
bool isEnabled(Level level);

/**
 * @brief Default log handler that logs to stderr
 *
 * Format: [LEVEL] [time.millis] [thread] [file:line] message
 */
void defaultHandler(Level level, const std::string &message,
                    const std::string &file, int line);

} // namespace logging
} // namespace weathermcp

// Convenience macros for logging. The message argument is a stream
// expression, e.g. WEATHERMCP_LOG_INFO("Session " << id << " closed").
#define WEATHERMCP_LOG_AT(lvl, msg)                                            \
  do {                                                                         \
    if (weathermcp::logging::isEnabled(lvl)) {                                 \
      std::ostringstream weathermcp_log_stream_;                               \
      weathermcp_log_stream_ << msg;                                           \
      weathermcp::logging::log(lvl, weathermcp_log_stream_.str(), __FILE__,    \
                               __LINE__);                                      \
    }                                                                          \
  } while (0)

#define WEATHERMCP_LOG_TRACE(msg)                                              \
  WEATHERMCP_LOG_AT(weathermcp::logging::Level::Trace, msg)
#define WEATHERMCP_LOG_DEBUG(msg)                                              \
  WEATHERMCP_LOG_AT(weathermcp::logging::Level::Debug, msg)
#define WEATHERMCP_LOG_INFO(msg)                                               \
  WEATHERMCP_LOG_AT(weathermcp::logging::Level::Info, msg)
#define WEATHERMCP_LOG_WARNING(msg)                                            \
  WEATHERMCP_LOG_AT(weathermcp::logging::Level::Warning, msg)
#define WEATHERMCP_LOG_ERROR(msg)                                              \
  WEATHERMCP_LOG_AT(weathermcp::logging::Level::Error, msg)
#define WEATHERMCP_LOG_FATAL(msg)                                              \
  WEATHERMCP_LOG_AT(weathermcp::logging::Level::Fatal, msg)

#endif // WEATHERMCP_UTILS_LOGGING_HPP_
