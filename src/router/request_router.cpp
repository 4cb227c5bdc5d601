#include "weathermcp/router/request_router.hpp"
#include "weathermcp/utils/error.hpp"
#include "weathermcp/utils/json_utils.hpp"
#include "weathermcp/utils/logging.hpp"

#include <stdexcept>

namespace weathermcp {
namespace router {

RequestRouter::RequestRouter(session::SessionRegistry &registry,
                             types::ServerInfo server_info,
                             std::shared_ptr<const tools::ToolRegistry> tools,
                             session::TransportLifecycle::IdGenerator id_generator)
    : registry_(registry), server_info_(std::move(server_info)),
      tools_(std::move(tools)), id_generator_(std::move(id_generator)) {
  if (!tools_) {
    throw std::invalid_argument("RequestRouter requires a tool registry");
  }
  if (!id_generator_) {
    throw std::invalid_argument("RequestRouter requires an id generator");
  }
}

transport::HttpReply
RequestRouter::route(const transport::RequestEnvelope &envelope) {
  WEATHERMCP_LOG_DEBUG("Received " << transport::methodToString(envelope.method)
                                   << " request for session "
                                   << envelope.session_id.value_or("<none>"));

  if (envelope.session_id) {
    auto session = registry_.get(*envelope.session_id);
    if (session && session->state() != session::LifecycleState::Closed) {
      WEATHERMCP_LOG_DEBUG("Reusing transport for session "
                           << *envelope.session_id);
      return session->handleRequest(envelope);
    }

    WEATHERMCP_LOG_WARNING("Session ID " << *envelope.session_id
                                         << " provided, but no active "
                                            "transport found");
    throw ProtocolException::sessionNotFound(*envelope.session_id);
  }

  if (envelope.method == transport::HttpMethod::Post && envelope.body &&
      json_utils::isInitializeRequest(*envelope.body)) {
    WEATHERMCP_LOG_INFO("New client initialization request");

    auto session = session::TransportLifecycle::create(
        registry_, server_info_, tools_, id_generator_);
    try {
      return session->handleRequest(envelope);
    } catch (...) {
      // A half-initialized session must not stay registered
      session->close();
      throw;
    }
  }

  WEATHERMCP_LOG_WARNING("Invalid request: "
                         << transport::methodToString(envelope.method)
                         << " without session ID or non-initialize POST");
  throw ProtocolException::malformedRequest(
      "Bad Request: Session ID required or invalid initialization.");
}

transport::HttpReply
RequestRouter::handle(const transport::RequestEnvelope &envelope) {
  try {
    return route(envelope);
  } catch (const ProtocolException &e) {
    return transport::errorReply(
        createErrorResponse(envelope.correlationId(), e));
  } catch (const OutputSchemaException &e) {
    WEATHERMCP_LOG_ERROR("Tool output rejected: "
                         << e.what() << " "
                         << transport::dumpJson(e.error().data));
  } catch (const std::exception &e) {
    WEATHERMCP_LOG_ERROR("Error handling MCP request: " << e.what());
  }
  return transport::errorReply(createErrorResponse(
      envelope.correlationId(), types::ErrorCode::ServerError,
      "Internal Server Error"));
}

std::size_t RequestRouter::closeIdleSessions(
    session::TransportLifecycle::Clock::duration max_idle,
    session::TransportLifecycle::Clock::time_point now) {
  std::size_t closed = 0;
  for (const auto &session : registry_.snapshot()) {
    if (now - session->lastActivity() <= max_idle) {
      continue;
    }
    WEATHERMCP_LOG_INFO("Expiring idle session " << session->sessionId());
    session->close();
    ++closed;
  }
  return closed;
}

} // namespace router
} // namespace weathermcp
