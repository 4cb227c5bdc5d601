#ifndef WEATHERMCP_SESSION_TRANSPORT_LIFECYCLE_HPP_
#define WEATHERMCP_SESSION_TRANSPORT_LIFECYCLE_HPP_

#include "weathermcp/protocol_server.hpp"
#include "weathermcp/session/session_registry.hpp"
#include "weathermcp/tools/tool_registry.hpp"
#include "weathermcp/transport/http_message.hpp"
#include "weathermcp/transport/streamable_http_transport.hpp"
#include "weathermcp/types.hpp"
#include "weathermcp/utils/session_id.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace weathermcp {
namespace session {

/**
 * @brief Lifecycle states of a session
 *
 * Transitions only move forward; a Closed session never comes back.
 */
enum class LifecycleState {
  Uninitialized, ///< No transport yet
  Initializing,  ///< Transport created, id not yet assigned
  Active,        ///< Id assigned and registered
  Closed         ///< Transport closed and session deregistered
};

std::string stateToString(LifecycleState state);

/**
 * @brief One session: its transport, its protocol server and its state
 *
 * Created by the router for a valid initialization request. The session
 * registers itself when the transport assigns the id and deregisters itself,
 * exactly once, when the transport reports closure. Request handling never
 * touches the registry directly.
 */
class TransportLifecycle
    : public std::enable_shared_from_this<TransportLifecycle> {
  // Restricts construction to create()
  struct ConstructionKey {
    explicit ConstructionKey() = default;
  };

public:
  using IdGenerator = std::function<std::string()>;
  using Clock = std::chrono::system_clock;

  /**
   * @brief Create a session in the Initializing state
   *
   * @param registry Registry the session joins once its id is assigned; must
   * outlive the session
   * @param server_info Identity reported to the client
   * @param tools The shared tool registry
   * @param id_generator Source of the session id
   * @return std::shared_ptr<TransportLifecycle> The new session
   */
  static std::shared_ptr<TransportLifecycle>
  create(SessionRegistry &registry, types::ServerInfo server_info,
         std::shared_ptr<const tools::ToolRegistry> tools,
         IdGenerator id_generator = utils::generateSessionId);

  TransportLifecycle(ConstructionKey, SessionRegistry &registry,
                     types::ServerInfo server_info,
                     std::shared_ptr<const tools::ToolRegistry> tools);

  ~TransportLifecycle();

  TransportLifecycle(const TransportLifecycle &) = delete;
  TransportLifecycle &operator=(const TransportLifecycle &) = delete;

  LifecycleState state() const { return state_.load(); }

  /**
   * @brief The id generated on entry to Initializing
   */
  const std::string &sessionId() const { return session_id_; }

  /**
   * @brief When the session entered Initializing
   */
  Clock::time_point createdAt() const { return created_at_; }

  /**
   * @brief When the session last received a request
   */
  Clock::time_point lastActivity() const;

  /**
   * @brief Hand a request to the session's transport
   *
   * @throws ProtocolException (SessionNotFound) once the session is Closed,
   * plus whatever the transport raises for the request
   */
  transport::HttpReply handleRequest(const transport::RequestEnvelope &envelope);

  /**
   * @brief Close the transport; safe to call any number of times
   */
  void close();

  const ProtocolServer &server() const { return server_; }

private:
  void begin(const IdGenerator &id_generator);

  void onSessionInitialized(const std::string &session_id);

  void onTransportClosed();

  SessionRegistry &registry_;
  std::string session_id_;
  Clock::time_point created_at_;
  std::atomic<Clock::rep> last_activity_{0};
  std::atomic<LifecycleState> state_;

  // Declared before server_ so the server detaches while it is still alive
  std::shared_ptr<transport::StreamableHttpTransport> transport_;
  ProtocolServer server_;
};

} // namespace session
} // namespace weathermcp

#endif // WEATHERMCP_SESSION_TRANSPORT_LIFECYCLE_HPP_
