#include "weathermcp/protocol_server.hpp"
#include "weathermcp/utils/error.hpp"
#include "weathermcp/utils/logging.hpp"

#include <algorithm>

namespace weathermcp {

/**
 * @brief Notifier that writes notifications/message to the calling session
 */
class ProtocolServer::SessionNotifier : public tools::Notifier {
public:
  explicit SessionNotifier(ProtocolServer &server) : server_(server) {}

  void notify(types::LoggingLevel level, const nlohmann::json &data) override {
    if (level < server_.logLevel()) {
      return;
    }

    types::JSONRPCNotification notification;
    notification.method = "notifications/message";
    notification.params = nlohmann::json{
        {"level", types::loggingLevelToString(level)},
        {"logger", server_.server_info_.name},
        {"data", data}};
    server_.send(notification);
  }

private:
  ProtocolServer &server_;
};

ProtocolServer::ProtocolServer(types::ServerInfo server_info,
                               std::shared_ptr<const tools::ToolRegistry> tools)
    : server_info_(std::move(server_info)), executor_(std::move(tools)),
      initialized_(false), log_level_(types::LoggingLevel::Debug) {}

ProtocolServer::~ProtocolServer() { disconnect(); }

void ProtocolServer::connect(std::shared_ptr<transport::Transport> transport) {
  if (!transport) {
    throw TransportException("Cannot connect to a null transport");
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    transport_ = transport;
  }

  transport->setMessageCallback(
      [this](const types::JSONRPCMessage &message) { handleMessage(message); });
  transport->setErrorCallback([this](const std::error_code &error) {
    WEATHERMCP_LOG_DEBUG("Transport error in session " << sessionId() << ": "
                                                       << error.message());
  });
  transport->start();
}

void ProtocolServer::disconnect() {
  std::shared_ptr<transport::Transport> transport;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    transport.swap(transport_);
  }

  if (transport) {
    transport->setMessageCallback(nullptr);
    transport->setErrorCallback(nullptr);
  }
}

void ProtocolServer::setSessionId(const std::string &session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  session_id_ = session_id;
}

std::string ProtocolServer::sessionId() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return session_id_;
}

bool ProtocolServer::isInitialized() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return initialized_;
}

types::LoggingLevel ProtocolServer::logLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return log_level_;
}

std::optional<types::ClientInfo> ProtocolServer::clientInfo() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return client_info_;
}

std::string ProtocolServer::protocolVersion() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return protocol_version_;
}

void ProtocolServer::handleMessage(const types::JSONRPCMessage &message) {
  if (const auto *request = std::get_if<types::JSONRPCRequest>(&message)) {
    handleRequest(*request);
  } else if (const auto *notification =
                 std::get_if<types::JSONRPCNotification>(&message)) {
    handleNotification(*notification);
  } else {
    WEATHERMCP_LOG_DEBUG("Ignoring client response in session "
                         << sessionId());
  }
}

void ProtocolServer::handleRequest(const types::JSONRPCRequest &request) {
  WEATHERMCP_LOG_DEBUG("Request " << request.method << " in session "
                                  << sessionId());

  try {
    nlohmann::json result = dispatch(request);
    send(types::JSONRPCResponse{.id = request.id, .result = std::move(result)});
  } catch (const ProtocolException &e) {
    WEATHERMCP_LOG_WARNING("Request " << request.method << " failed: "
                                      << e.what());
    send(createErrorResponse(request.id, e));
  }
}

void ProtocolServer::handleNotification(
    const types::JSONRPCNotification &notification) {
  if (notification.method == "notifications/initialized") {
    WEATHERMCP_LOG_DEBUG("Client finished initialization for session "
                         << sessionId());
    return;
  }
  WEATHERMCP_LOG_DEBUG("Ignoring notification " << notification.method);
}

nlohmann::json ProtocolServer::dispatch(const types::JSONRPCRequest &request) {
  if (request.method == "initialize") {
    return handleInitialize(request);
  }
  if (request.method == "ping") {
    return nlohmann::json::object();
  }
  if (!isInitialized()) {
    throw ProtocolException(types::ErrorCode::InvalidRequest,
                            "Server not initialized");
  }
  if (request.method == "tools/list") {
    return handleListTools();
  }
  if (request.method == "tools/call") {
    return handleCallTool(request);
  }
  if (request.method == "logging/setLevel") {
    return handleSetLevel(request);
  }

  throw ProtocolException(types::ErrorCode::MethodNotFound,
                          "Method not found: " + request.method);
}

nlohmann::json
ProtocolServer::handleInitialize(const types::JSONRPCRequest &request) {
  if (!request.params || !request.params->is_object()) {
    throw ProtocolException(types::ErrorCode::InvalidParams,
                            "Missing parameters for initialize");
  }
  const nlohmann::json &params = *request.params;

  types::ClientInfo client;
  if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
    client = params["clientInfo"].get<types::ClientInfo>();
  }

  // Echo the client's revision when we speak it, else offer our latest
  std::string version = types::kLatestProtocolVersion;
  if (params.contains("protocolVersion") &&
      params["protocolVersion"].is_string()) {
    const auto requested = params["protocolVersion"].get<std::string>();
    const auto &supported = types::supportedProtocolVersions();
    if (std::find(supported.begin(), supported.end(), requested) !=
        supported.end()) {
      version = requested;
    }
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    client_info_ = client;
    protocol_version_ = version;
    initialized_ = true;
  }

  WEATHERMCP_LOG_INFO("Client " << client.name << " v" << client.version
                                << " initialized session " << sessionId()
                                << " (protocol " << version << ")");

  nlohmann::json result = {
      {"protocolVersion", version},
      {"capabilities",
       {{"tools", {{"listChanged", false}}},
        {"logging", nlohmann::json::object()}}},
      {"serverInfo", server_info_}};
  if (server_info_.instructions) {
    result["instructions"] = *server_info_.instructions;
  }
  return result;
}

nlohmann::json ProtocolServer::handleListTools() const {
  nlohmann::json tools = nlohmann::json::array();
  for (const auto &tool : executor_.registry().catalog()) {
    tools.push_back(tool);
  }
  return {{"tools", tools}};
}

nlohmann::json
ProtocolServer::handleCallTool(const types::JSONRPCRequest &request) {
  if (!request.params || !request.params->is_object() ||
      !request.params->contains("name") ||
      !(*request.params)["name"].is_string()) {
    throw ProtocolException(types::ErrorCode::InvalidParams,
                            "tools/call requires a tool name");
  }

  const nlohmann::json &params = *request.params;
  const auto name = params["name"].get<std::string>();
  const nlohmann::json arguments =
      params.contains("arguments") ? params["arguments"] : nlohmann::json();

  SessionNotifier notifier(*this);
  tools::ToolContext context{.notifier = notifier,
                             .session_id = sessionId(),
                             .request_id = request.id};

  tools::ToolInvocationResult outcome =
      executor_.invoke(name, arguments, context);
  if (outcome.isError()) {
    WEATHERMCP_LOG_DEBUG("Tool " << name << " finished with "
                                 << tools::statusToString(outcome.status));
  }
  return nlohmann::json(outcome.toCallToolResult());
}

nlohmann::json
ProtocolServer::handleSetLevel(const types::JSONRPCRequest &request) {
  if (!request.params || !request.params->is_object() ||
      !request.params->contains("level") ||
      !(*request.params)["level"].is_string()) {
    throw ProtocolException(types::ErrorCode::InvalidParams,
                            "logging/setLevel requires a level");
  }

  const auto name = (*request.params)["level"].get<std::string>();
  types::LoggingLevel level;
  try {
    level = types::loggingLevelFromString(name);
  } catch (const std::invalid_argument &) {
    throw ProtocolException(types::ErrorCode::InvalidParams,
                            "Invalid logging level: " + name);
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    log_level_ = level;
  }
  return nlohmann::json::object();
}

void ProtocolServer::send(const types::JSONRPCMessage &message) {
  std::shared_ptr<transport::Transport> transport;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    transport = transport_;
  }

  if (!transport) {
    WEATHERMCP_LOG_WARNING("Dropping message for disconnected session "
                           << sessionId());
    return;
  }

  std::error_code ec = transport->send(message);
  if (ec) {
    WEATHERMCP_LOG_WARNING("Failed to send to session " << sessionId() << ": "
                                                        << ec.message());
  }
}

} // namespace weathermcp
