#include "weathermcp/utils/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace weathermcp {
namespace logging {

namespace {
std::atomic<Level> g_level{Level::Info};

std::mutex g_handler_mutex;
LogHandler g_handler = defaultHandler;

// Serializes writes from the default handler so lines never interleave
std::mutex g_output_mutex;
} // namespace

std::string levelToString(Level level) {
  switch (level) {
  case Level::Trace:
    return "TRACE";
  case Level::Debug:
    return "DEBUG";
  case Level::Info:
    return "INFO";
  case Level::Warning:
    return "WARNING";
  case Level::Error:
    return "ERROR";
  case Level::Fatal:
    return "FATAL";
  default:
    return "UNKNOWN";
  }
}

Level levelFromString(const std::string &level_str) {
  std::string lowered = level_str;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (lowered == "trace") {
    return Level::Trace;
  } else if (lowered == "debug") {
    return Level::Debug;
  } else if (lowered == "info") {
    return Level::Info;
  } else if (lowered == "warning" || lowered == "warn") {
    return Level::Warning;
  } else if (lowered == "error") {
    return Level::Error;
  } else if (lowered == "fatal") {
    return Level::Fatal;
  }
  throw std::invalid_argument("Invalid log level: " + level_str);
}

void setLevel(Level level) { g_level = level; }

Level getLevel() { return g_level; }

void setHandler(LogHandler handler) {
  std::lock_guard<std::mutex> lock(g_handler_mutex);
  g_handler = handler ? std::move(handler) : defaultHandler;
}

void log(Level level, const std::string &message, const std::string &file,
         int line) {
  if (!isEnabled(level)) {
    return;
  }

  LogHandler handler;
  {
    std::lock_guard<std::mutex> lock(g_handler_mutex);
    handler = g_handler;
  }
  handler(level, message, file, line);
}

bool isEnabled(Level level) { return level >= g_level.load(); }

void defaultHandler(Level level, const std::string &message,
                    const std::string &file, int line) {
  auto now = std::chrono::system_clock::now();
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    now.time_since_epoch()) %
                1000;

  std::tm tm{};
  localtime_r(&t, &tm);

  std::ostringstream line_stream;
  line_stream << "[" << levelToString(level) << "] ["
              << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << "."
              << std::setfill('0') << std::setw(3) << millis.count() << "] ["
              << std::this_thread::get_id() << "] ";

  if (!file.empty()) {
    // Basename only
    auto slash = file.find_last_of('/');
    line_stream << "["
                << (slash == std::string::npos ? file : file.substr(slash + 1))
                << ":" << line << "] ";
  }

  line_stream << message;

  std::lock_guard<std::mutex> lock(g_output_mutex);
  std::cerr << line_stream.str() << std::endl;
}

} // namespace logging
} // namespace weathermcp
