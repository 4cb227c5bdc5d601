#ifndef WEATHERMCP_ROUTER_REQUEST_ROUTER_HPP_
#define WEATHERMCP_ROUTER_REQUEST_ROUTER_HPP_

#include "weathermcp/session/session_registry.hpp"
#include "weathermcp/session/transport_lifecycle.hpp"
#include "weathermcp/tools/tool_registry.hpp"
#include "weathermcp/transport/http_message.hpp"
#include "weathermcp/types.hpp"

#include <chrono>
#include <cstddef>
#include <memory>

namespace weathermcp {
namespace router {

/**
 * @brief Resolves which session transport receives a request
 *
 * Precedence, first match wins:
 *  1. session id present and bound to an Active session: reuse it
 *  2. no session id and an initialize request: create a new session
 *  3. session id present but unknown: SessionNotFound (-32001)
 *  4. anything else: MalformedRequest (-32600)
 *
 * The router holds no protocol logic of its own and never creates a session
 * for a request that carries a session id.
 */
class RequestRouter {
public:
  /**
   * @brief Construct a new RequestRouter
   *
   * @param registry The session registry; must outlive the router
   * @param server_info Identity handed to every new session
   * @param tools The tool registry shared by all sessions
   * @param id_generator Source of new session ids
   */
  RequestRouter(session::SessionRegistry &registry,
                types::ServerInfo server_info,
                std::shared_ptr<const tools::ToolRegistry> tools,
                session::TransportLifecycle::IdGenerator id_generator =
                    utils::generateSessionId);

  /**
   * @brief Route a request and return the session's reply
   *
   * @throws ProtocolException for malformed requests and unknown sessions;
   * other exceptions from the session propagate unchanged
   */
  transport::HttpReply route(const transport::RequestEnvelope &envelope);

  /**
   * @brief Route a request, turning every failure into an error reply
   *
   * Protocol errors keep their code and HTTP status. Any other exception is
   * logged and answered with a generic -32000 and HTTP 500.
   */
  transport::HttpReply handle(const transport::RequestEnvelope &envelope);

  /**
   * @brief Close every registered session idle for longer than max_idle
   *
   * Clients of an expired session get SessionNotFound and re-initialize.
   *
   * @param max_idle Allowed time since a session's last request
   * @param now Reference time
   * @return std::size_t Number of sessions closed
   */
  std::size_t closeIdleSessions(
      session::TransportLifecycle::Clock::duration max_idle,
      session::TransportLifecycle::Clock::time_point now =
          session::TransportLifecycle::Clock::now());

  session::SessionRegistry &registry() { return registry_; }

private:
  session::SessionRegistry &registry_;
  types::ServerInfo server_info_;
  std::shared_ptr<const tools::ToolRegistry> tools_;
  session::TransportLifecycle::IdGenerator id_generator_;
};

} // namespace router
} // namespace weathermcp

#endif // WEATHERMCP_ROUTER_REQUEST_ROUTER_HPP_
