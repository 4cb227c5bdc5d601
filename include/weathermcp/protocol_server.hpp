#ifndef WEATHERMCP_PROTOCOL_SERVER_HPP_
#define WEATHERMCP_PROTOCOL_SERVER_HPP_

#include "weathermcp/tools/tool_executor.hpp"
#include "weathermcp/tools/tool_registry.hpp"
#include "weathermcp/transport/transport.hpp"
#include "weathermcp/types.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace weathermcp {

/**
 * @brief Protocol server bound to exactly one session transport
 *
 * The ProtocolServer answers the JSON-RPC methods of the protocol
 * (initialize, ping, tools/list, tools/call, logging/setLevel) for a single
 * client. Every session gets its own instance; the tool registry behind it is
 * shared read-only.
 *
 * Protocol errors are answered in-band as JSON-RPC errors. Anything else a
 * handler throws escapes the transport callback and is turned into an
 * internal error by the caller that delivered the message.
 */
class ProtocolServer {
public:
  /**
   * @brief Construct a new ProtocolServer
   *
   * @param server_info Identity reported during initialization
   * @param tools The tool registry
   */
  ProtocolServer(types::ServerInfo server_info,
                 std::shared_ptr<const tools::ToolRegistry> tools);

  /**
   * @brief Detaches from the transport
   */
  ~ProtocolServer();

  ProtocolServer(const ProtocolServer &) = delete;
  ProtocolServer &operator=(const ProtocolServer &) = delete;

  /**
   * @brief Bind to a transport and start it
   *
   * @param transport The session transport
   */
  void connect(std::shared_ptr<transport::Transport> transport);

  /**
   * @brief Drop the transport callbacks; the transport itself is not closed
   */
  void disconnect();

  /**
   * @brief Record the id the transport assigned to this session
   */
  void setSessionId(const std::string &session_id);

  std::string sessionId() const;

  /**
   * @brief Whether an initialize request has been answered
   */
  bool isInitialized() const;

  /**
   * @brief Minimum level of notifications/message sent to this client
   */
  types::LoggingLevel logLevel() const;

  /**
   * @brief Client identity, once initialized
   */
  std::optional<types::ClientInfo> clientInfo() const;

  /**
   * @brief Protocol revision agreed during initialization
   */
  std::string protocolVersion() const;

private:
  class SessionNotifier;

  void handleMessage(const types::JSONRPCMessage &message);

  void handleRequest(const types::JSONRPCRequest &request);

  void handleNotification(const types::JSONRPCNotification &notification);

  nlohmann::json dispatch(const types::JSONRPCRequest &request);

  nlohmann::json handleInitialize(const types::JSONRPCRequest &request);

  nlohmann::json handleListTools() const;

  nlohmann::json handleCallTool(const types::JSONRPCRequest &request);

  nlohmann::json handleSetLevel(const types::JSONRPCRequest &request);

  void send(const types::JSONRPCMessage &message);

  types::ServerInfo server_info_;
  tools::ToolExecutor executor_;

  mutable std::mutex mutex_;
  std::shared_ptr<transport::Transport> transport_;
  std::string session_id_;
  bool initialized_;
  std::string protocol_version_;
  types::LoggingLevel log_level_;
  std::optional<types::ClientInfo> client_info_;
};

} // namespace weathermcp

#endif // WEATHERMCP_PROTOCOL_SERVER_HPP_
