#ifndef WEATHERMCP_CONFIG_HPP_
#define WEATHERMCP_CONFIG_HPP_

#include "weathermcp/types.hpp"
#include "weathermcp/utils/logging.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace weathermcp {

/**
 * @brief Runtime settings of the weather server
 */
struct ServerConfig {
  std::string host = "0.0.0.0";
  std::uint16_t port = 8000;
  std::string endpoint = "/mcp";
  logging::Level log_level = logging::Level::Info;
  std::chrono::seconds session_idle_timeout{3600}; ///< 0 disables expiry
  std::string server_name = "MyWeatherMCPServer";
  std::string server_version = "1.0.0";
  std::string instructions = "This server provides weather information.";

  /**
   * @brief Identity reported to clients during initialization
   */
  types::ServerInfo serverInfo() const;

  /**
   * @brief Defaults overlaid with PORT, HOST, WEATHERMCP_LOG_LEVEL and
   * WEATHERMCP_SESSION_TIMEOUT
   *
   * @param lookup Environment accessor; std::getenv when empty
   * @throws std::invalid_argument for an unusable value
   */
  static ServerConfig
  fromEnvironment(const std::function<std::optional<std::string>(
                      const std::string &)> &lookup = nullptr);

  /**
   * @brief Apply --port, --host, --log-level, --endpoint and
   * --session-timeout on top of this configuration
   *
   * Both "--port 9000" and "--port=9000" are accepted.
   *
   * @param args Command line arguments without the program name
   * @return bool false if --help was requested
   * @throws std::invalid_argument for an unknown flag or bad value
   */
  bool applyArguments(const std::vector<std::string> &args);
};

/**
 * @brief Parse a TCP port, 0 to 65535
 *
 * @throws std::invalid_argument if the text is not a port number
 */
std::uint16_t parsePort(const std::string &text);

/**
 * @brief Parse a non-negative number of seconds
 *
 * @throws std::invalid_argument if the text is not a plain decimal number
 */
std::chrono::seconds parseSeconds(const std::string &text);

/**
 * @brief Usage text for the executable
 */
std::string usage(const std::string &program);

} // namespace weathermcp

#endif // WEATHERMCP_CONFIG_HPP_
