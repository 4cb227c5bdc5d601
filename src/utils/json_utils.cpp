#include "weathermcp/utils/json_utils.hpp"
#include "weathermcp/utils/error.hpp"
#include <nlohmann/json-schema.hpp>

namespace weathermcp {
namespace json_utils {

namespace {

// Records every error instead of throwing on the first one
class CollectingErrorHandler
    : public nlohmann::json_schema::basic_error_handler {
public:
  void error(const nlohmann::json::json_pointer &ptr,
             const nlohmann::json &instance,
             const std::string &message) override {
    nlohmann::json_schema::basic_error_handler::error(ptr, instance, message);
    violations_.push_back({ptr.to_string(), message});
  }

  std::vector<SchemaViolation> take() { return std::move(violations_); }

private:
  std::vector<SchemaViolation> violations_;
};

} // namespace

std::vector<SchemaViolation> collectViolations(const nlohmann::json &json,
                                               const nlohmann::json &schema) {
  nlohmann::json_schema::json_validator validator;
  try {
    validator.set_root_schema(schema);
  } catch (const std::exception &e) {
    throw std::invalid_argument(std::string("Invalid JSON schema: ") +
                                e.what());
  }

  CollectingErrorHandler handler;
  validator.validate(json, handler);
  return handler.take();
}

nlohmann::json parse(const std::string &json_str) {
  try {
    return nlohmann::json::parse(json_str);
  } catch (const nlohmann::json::parse_error &e) {
    throw ProtocolException(types::ErrorCode::ParseError,
                            "Parse error: " + std::string(e.what()));
  }
}

MessageType getMessageType(const nlohmann::json &json) {
  // Validate it's a JSON-RPC 2.0 message
  if (!json.is_object() || !json.contains("jsonrpc") ||
      json["jsonrpc"] != "2.0") {
    throw ProtocolException(
        types::ErrorCode::InvalidRequest,
        "Invalid JSON-RPC message: missing or invalid jsonrpc version");
  }

  if (json.contains("error") && json.contains("id")) {
    return MessageType::Error;
  }

  if (json.contains("result") && json.contains("id")) {
    return MessageType::Response;
  }

  if (json.contains("method") && json["method"].is_string()) {
    if (json.contains("id")) {
      return MessageType::Request;
    }
    return MessageType::Notification;
  }

  throw ProtocolException(
      types::ErrorCode::InvalidRequest,
      "Invalid JSON-RPC message: cannot determine message type");
}

types::JSONRPCMessage toMessage(const nlohmann::json &json) {
  MessageType type = getMessageType(json);

  try {
    switch (type) {
    case MessageType::Request:
      return json.get<types::JSONRPCRequest>();
    case MessageType::Notification:
      return json.get<types::JSONRPCNotification>();
    case MessageType::Response:
      return json.get<types::JSONRPCResponse>();
    case MessageType::Error:
      return json.get<types::JSONRPCError>();
    }
  } catch (const std::exception &e) {
    throw ProtocolException(types::ErrorCode::InvalidRequest,
                            "Invalid JSON-RPC message: " +
                                std::string(e.what()));
  }

  throw ProtocolException(types::ErrorCode::InvalidRequest,
                          "Unknown message type");
}

nlohmann::json toJson(const types::JSONRPCMessage &message) {
  return std::visit([](const auto &msg) { return nlohmann::json(msg); },
                    message);
}

bool isInitializeRequest(const nlohmann::json &body) {
  if (!body.is_object()) {
    return false;
  }
  try {
    if (getMessageType(body) != MessageType::Request) {
      return false;
    }
  } catch (const ProtocolException &) {
    return false;
  }

  if (body["method"] != "initialize") {
    return false;
  }
  if (!body["id"].is_string() && !body["id"].is_number_integer()) {
    return false;
  }

  if (!body.contains("params") || !body["params"].is_object()) {
    return false;
  }
  const auto &params = body["params"];
  if (!params.contains("protocolVersion") ||
      !params["protocolVersion"].is_string()) {
    return false;
  }
  if (!params.contains("capabilities") || !params["capabilities"].is_object()) {
    return false;
  }
  if (!params.contains("clientInfo") || !params["clientInfo"].is_object()) {
    return false;
  }
  const auto &client_info = params["clientInfo"];
  return client_info.contains("name") && client_info["name"].is_string() &&
         client_info.contains("version") && client_info["version"].is_string();
}

std::optional<types::RequestId> extractRequestId(const nlohmann::json &body) {
  if (!body.is_object() || !body.contains("id")) {
    return std::nullopt;
  }

  const auto &id = body["id"];
  if (id.is_string()) {
    return types::RequestId(id.get<std::string>());
  }
  if (id.is_number_unsigned() &&
      id.get<std::uint64_t>() > static_cast<std::uint64_t>(INT64_MAX)) {
    return std::nullopt;
  }
  if (id.is_number_integer()) {
    return types::RequestId(id.get<std::int64_t>());
  }
  return std::nullopt;
}

} // namespace json_utils
} // namespace weathermcp
