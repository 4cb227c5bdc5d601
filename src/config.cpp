#include "weathermcp/config.hpp"

#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace weathermcp {

namespace {

std::optional<std::string> systemEnvironment(const std::string &name) {
  const char *value = std::getenv(name.c_str());
  if (value == nullptr) {
    return std::nullopt;
  }
  return std::string(value);
}

} // namespace

types::ServerInfo ServerConfig::serverInfo() const {
  types::ServerInfo info;
  info.name = server_name;
  info.version = server_version;
  if (!instructions.empty()) {
    info.instructions = instructions;
  }
  return info;
}

std::uint16_t parsePort(const std::string &text) {
  if (text.empty() || text.size() > 5) {
    throw std::invalid_argument("Invalid port: '" + text + "'");
  }
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      throw std::invalid_argument("Invalid port: '" + text + "'");
    }
  }

  unsigned long value = std::stoul(text);
  if (value > 65535) {
    throw std::invalid_argument("Port out of range: " + text);
  }
  return static_cast<std::uint16_t>(value);
}

std::chrono::seconds parseSeconds(const std::string &text) {
  if (text.empty() || text.size() > 9) {
    throw std::invalid_argument("Invalid number of seconds: '" + text + "'");
  }
  for (char c : text) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      throw std::invalid_argument("Invalid number of seconds: '" + text +
                                  "'");
    }
  }
  return std::chrono::seconds(std::stol(text));
}

ServerConfig ServerConfig::fromEnvironment(
    const std::function<std::optional<std::string>(const std::string &)>
        &lookup) {
  std::function<std::optional<std::string>(const std::string &)> env = lookup;
  if (!env) {
    env = systemEnvironment;
  }

  ServerConfig config;
  if (auto port = env("PORT"); port && !port->empty()) {
    config.port = parsePort(*port);
  }
  if (auto host = env("HOST"); host && !host->empty()) {
    config.host = *host;
  }
  if (auto level = env("WEATHERMCP_LOG_LEVEL"); level && !level->empty()) {
    config.log_level = logging::levelFromString(*level);
  }
  if (auto timeout = env("WEATHERMCP_SESSION_TIMEOUT");
      timeout && !timeout->empty()) {
    config.session_idle_timeout = parseSeconds(*timeout);
  }
  return config;
}

bool ServerConfig::applyArguments(const std::vector<std::string> &args) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    std::string flag = args[i];
    std::optional<std::string> value;

    auto eq = flag.find('=');
    if (flag.rfind("--", 0) == 0 && eq != std::string::npos) {
      value = flag.substr(eq + 1);
      flag = flag.substr(0, eq);
    }

    if (flag == "--help" || flag == "-h") {
      return false;
    }

    if (flag != "--port" && flag != "--host" && flag != "--log-level" &&
        flag != "--endpoint" && flag != "--session-timeout") {
      throw std::invalid_argument("Unknown option: " + flag);
    }

    if (!value) {
      if (i + 1 >= args.size()) {
        throw std::invalid_argument("Missing value for " + flag);
      }
      value = args[++i];
    }

    if (flag == "--port") {
      port = parsePort(*value);
    } else if (flag == "--host") {
      host = *value;
    } else if (flag == "--log-level") {
      log_level = logging::levelFromString(*value);
    } else if (flag == "--session-timeout") {
      session_idle_timeout = parseSeconds(*value);
    } else {
      if (value->empty() || value->front() != '/') {
        throw std::invalid_argument("Endpoint must start with '/': " + *value);
      }
      endpoint = *value;
    }
  }
  return true;
}

std::string usage(const std::string &program) {
  std::ostringstream out;
  out << "Usage: " << program << " [options]\n"
      << "  --port <n>          TCP port to listen on (env PORT, default 8000)\n"
      << "  --host <addr>       Address to bind (env HOST, default 0.0.0.0)\n"
      << "  --endpoint <path>   MCP endpoint path (default /mcp)\n"
      << "  --log-level <lvl>   trace|debug|info|warning|error|fatal\n"
      << "                      (env WEATHERMCP_LOG_LEVEL, default info)\n"
      << "  --session-timeout <s> Close sessions idle for <s> seconds\n"
      << "                      (env WEATHERMCP_SESSION_TIMEOUT, default "
         "3600, 0 never)\n"
      << "  -h, --help          Show this help\n";
  return out.str();
}

} // namespace weathermcp
