#include "weathermcp/config.hpp"
#include "weathermcp/http/http_server.hpp"
#include "weathermcp/router/request_router.hpp"
#include "weathermcp/session/session_registry.hpp"
#include "weathermcp/tools/tool_registry.hpp"
#include "weathermcp/tools/weather_tool.hpp"
#include "weathermcp/utils/error.hpp"
#include "weathermcp/utils/logging.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <signal.h>
#include <string>
#include <thread>
#include <vector>

using namespace weathermcp;

// Global flag for graceful shutdown
std::atomic<bool> g_running(true);

void signal_handler(int) { g_running = false; }

int main(int argc, char **argv) {
  signal(SIGINT, signal_handler);
  signal(SIGTERM, signal_handler);

  ServerConfig config;
  try {
    config = ServerConfig::fromEnvironment();
    std::vector<std::string> args(argv + 1, argv + argc);
    if (!config.applyArguments(args)) {
      std::cout << usage(argv[0]);
      return 0;
    }
  } catch (const std::invalid_argument &e) {
    std::cerr << "Configuration error: " << e.what() << "\n" << usage(argv[0]);
    return 2;
  }

  logging::setLevel(config.log_level);

  auto catalog = std::make_shared<tools::ToolRegistry>();
  try {
    catalog->add(tools::makeWeatherTool(
        std::make_shared<tools::StaticWeatherSource>()));
  } catch (const ToolRegistrationException &e) {
    WEATHERMCP_LOG_FATAL("Invalid tool definition: " << e.what());
    return 1;
  }

  session::SessionRegistry sessions;
  router::RequestRouter router(sessions, config.serverInfo(), catalog);
  http::HttpServer server({.host = config.host,
                           .port = config.port,
                           .endpoint = config.endpoint,
                           .session_idle_timeout =
                               config.session_idle_timeout},
                          router);

  try {
    server.start();
  } catch (const TransportException &e) {
    WEATHERMCP_LOG_FATAL(e.what());
    return 1;
  }

  WEATHERMCP_LOG_INFO("Available cities for weather: Paris, London, Tokyo");

  while (g_running) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  WEATHERMCP_LOG_INFO("Shutting down MCP server...");
  server.stop();
  return 0;
}
