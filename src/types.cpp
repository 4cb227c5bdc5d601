#include "weathermcp/types.hpp"

#include <stdexcept>

namespace weathermcp {
namespace types {

std::string loggingLevelToString(LoggingLevel level) {
  switch (level) {
  case LoggingLevel::Debug:
    return "debug";
  case LoggingLevel::Info:
    return "info";
  case LoggingLevel::Notice:
    return "notice";
  case LoggingLevel::Warning:
    return "warning";
  case LoggingLevel::Error:
    return "error";
  case LoggingLevel::Critical:
    return "critical";
  case LoggingLevel::Alert:
    return "alert";
  case LoggingLevel::Emergency:
    return "emergency";
  }
  return "info";
}

LoggingLevel loggingLevelFromString(const std::string &name) {
  static const std::pair<const char *, LoggingLevel> kLevels[] = {
      {"debug", LoggingLevel::Debug},       {"info", LoggingLevel::Info},
      {"notice", LoggingLevel::Notice},     {"warning", LoggingLevel::Warning},
      {"error", LoggingLevel::Error},       {"critical", LoggingLevel::Critical},
      {"alert", LoggingLevel::Alert},       {"emergency", LoggingLevel::Emergency}};

  for (const auto &[candidate, level] : kLevels) {
    if (name == candidate) {
      return level;
    }
  }
  throw std::invalid_argument("Invalid logging level: " + name);
}

} // namespace types
} // namespace weathermcp
