#ifndef WEATHERMCP_HTTP_HTTP_SERVER_HPP_
#define WEATHERMCP_HTTP_HTTP_SERVER_HPP_

#include "weathermcp/router/request_router.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace weathermcp {
namespace http {

/**
 * @brief HTTP listener serving the MCP endpoint
 *
 * Accepts connections on a background thread and serves each connection on
 * its own worker thread, keep-alive included. Requests for the endpoint are
 * turned into RequestEnvelopes and handed to the router; everything else is
 * answered with 404. CORS preflight is answered directly.
 */
class HttpServer {
public:
  /**
   * @brief Listener options
   */
  struct Options {
    std::string host = "0.0.0.0";
    std::uint16_t port = 8000; ///< 0 picks an ephemeral port
    std::string endpoint = "/mcp";
    /// Sessions idle for longer are closed; zero keeps them until DELETE
    /// or shutdown
    std::chrono::seconds session_idle_timeout{0};
  };

  /**
   * @brief Construct a new HttpServer
   *
   * @param options Listener options
   * @param router The router; must outlive the server
   */
  HttpServer(Options options, router::RequestRouter &router);

  /**
   * @brief Stops the server if it is running
   */
  ~HttpServer();

  HttpServer(const HttpServer &) = delete;
  HttpServer &operator=(const HttpServer &) = delete;

  /**
   * @brief Bind, listen and start accepting
   *
   * @throws TransportException if the address cannot be bound
   */
  void start();

  /**
   * @brief Stop accepting, close every live session and wait for workers
   */
  void stop();

  bool isRunning() const;

  /**
   * @brief The bound port; the real one when 0 was requested
   */
  std::uint16_t port() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace http
} // namespace weathermcp

#endif // WEATHERMCP_HTTP_HTTP_SERVER_HPP_
