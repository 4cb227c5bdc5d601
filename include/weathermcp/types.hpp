#ifndef WEATHERMCP_TYPES_HPP_
#define WEATHERMCP_TYPES_HPP_

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace weathermcp {
namespace types {

/**
 * @brief JSON-RPC 2.0 error codes plus the server-defined codes used by the
 * session router
 */
enum class ErrorCode {
  // JSON-RPC 2.0 standard error codes
  ParseError = -32700,     ///< Invalid JSON was received
  InvalidRequest = -32600, ///< Malformed request or missing session
  MethodNotFound = -32601, ///< The method does not exist / is not available
  InvalidParams = -32602,  ///< Invalid method parameter(s)
  InternalError = -32603,  ///< Internal JSON-RPC error

  // Server-defined error codes
  ServerError = -32000,    ///< Unhandled failure while processing a request
  SessionNotFound = -32001 ///< Session id supplied but not active
};

/**
 * @brief Structure representing an error in JSON-RPC 2.0
 */
struct ErrorData {
  int code;            ///< Error code
  std::string message; ///< Error message
  nlohmann::json data; ///< Optional additional error data
};

/**
 * @brief JSON-RPC request identifier (string or integer)
 */
using RequestId = std::variant<std::string, std::int64_t>;

/**
 * @brief JSON-RPC 2.0 request message
 */
struct JSONRPCRequest {
  std::string jsonrpc = "2.0";          ///< JSON-RPC version (always "2.0")
  RequestId id;                         ///< Request identifier
  std::string method;                   ///< Method name
  std::optional<nlohmann::json> params; ///< Method parameters
};

/**
 * @brief JSON-RPC 2.0 notification message (request without id)
 */
struct JSONRPCNotification {
  std::string jsonrpc = "2.0";          ///< JSON-RPC version (always "2.0")
  std::string method;                   ///< Method name
  std::optional<nlohmann::json> params; ///< Method parameters
};

/**
 * @brief JSON-RPC 2.0 success response message
 */
struct JSONRPCResponse {
  std::string jsonrpc = "2.0"; ///< JSON-RPC version (always "2.0")
  RequestId id;                ///< Request identifier
  nlohmann::json result;       ///< Result data
};

/**
 * @brief JSON-RPC 2.0 error response message
 *
 * The id is empty when the failing request could not be correlated, in which
 * case it serializes as null.
 */
struct JSONRPCError {
  std::string jsonrpc = "2.0"; ///< JSON-RPC version (always "2.0")
  std::optional<RequestId> id; ///< Request identifier
  ErrorData error;             ///< Error data
};

/**
 * @brief Variant type that can hold any JSON-RPC 2.0 message
 */
using JSONRPCMessage = std::variant<JSONRPCRequest, JSONRPCNotification,
                                    JSONRPCResponse, JSONRPCError>;

/**
 * @brief Severity levels for notifications/message, as named by the protocol
 */
enum class LoggingLevel {
  Debug,
  Info,
  Notice,
  Warning,
  Error,
  Critical,
  Alert,
  Emergency
};

/**
 * @brief Convert a protocol logging level to its wire name
 */
std::string loggingLevelToString(LoggingLevel level);

/**
 * @brief Parse a protocol logging level from its wire name
 *
 * @throws std::invalid_argument if the name is not a protocol level
 */
LoggingLevel loggingLevelFromString(const std::string &name);

/**
 * @brief Server identity reported during initialization
 */
struct ServerInfo {
  std::string name;                        ///< Server name
  std::string version;                     ///< Server version
  std::optional<std::string> instructions; ///< Optional usage instructions
};

/**
 * @brief Client identity received during initialization
 */
struct ClientInfo {
  std::string name;    ///< Client name
  std::string version; ///< Client version
};

/**
 * @brief Declarative hints attached to a catalog entry
 */
struct ToolAnnotations {
  std::optional<std::string> title;
  std::optional<bool> read_only_hint;
  std::optional<bool> destructive_hint;
  std::optional<bool> idempotent_hint;
  std::optional<bool> open_world_hint;
};

/**
 * @brief Tool catalog entry as seen by clients
 */
struct Tool {
  std::string name;                            ///< Tool name
  std::optional<std::string> title;            ///< Display title
  std::string description;                     ///< Tool description
  nlohmann::json input_schema;                 ///< JSON Schema for the input
  std::optional<nlohmann::json> output_schema; ///< JSON Schema for the output
  std::optional<ToolAnnotations> annotations;  ///< Client trust hints
};

/**
 * @brief Text content block
 */
struct TextContent {
  std::string type = "text";
  std::string text;
};

/**
 * @brief Result of a tools/call request
 */
struct CallToolResult {
  std::vector<TextContent> content;                  ///< Human-readable blocks
  std::optional<nlohmann::json> structured_content;  ///< Structured payload
  bool is_error = false; ///< The call did not produce normal results
};

/**
 * @brief Protocol revision advertised when the client asks for an unknown one
 */
inline constexpr const char *kLatestProtocolVersion = "2025-06-18";

/**
 * @brief Protocol revisions this server can speak
 */
inline const std::vector<std::string> &supportedProtocolVersions() {
  static const std::vector<std::string> versions = {
      "2025-06-18", "2025-03-26", "2024-11-05", "2024-10-07"};
  return versions;
}

} // namespace types
} // namespace weathermcp

// JSON serialization/deserialization functions
namespace nlohmann {

// RequestId serialization
template <> struct adl_serializer<weathermcp::types::RequestId> {
  static void to_json(json &j, const weathermcp::types::RequestId &id) {
    std::visit([&j](const auto &value) { j = value; }, id);
  }

  static void from_json(const json &j, weathermcp::types::RequestId &id) {
    if (j.is_string()) {
      id = j.get<std::string>();
    } else if (j.is_number_unsigned() &&
               j.get<std::uint64_t>() > static_cast<std::uint64_t>(
                                            INT64_MAX)) {
      throw std::out_of_range("request id does not fit a signed 64-bit "
                              "integer");
    } else if (j.is_number_integer()) {
      id = j.get<std::int64_t>();
    } else {
      throw std::invalid_argument(
          "request id must be a string or an integer");
    }
  }
};

// ErrorData serialization
template <> struct adl_serializer<weathermcp::types::ErrorData> {
  static void to_json(json &j, const weathermcp::types::ErrorData &error) {
    j = json{{"code", error.code}, {"message", error.message}};
    if (!error.data.is_null()) {
      j["data"] = error.data;
    }
  }

  static void from_json(const json &j, weathermcp::types::ErrorData &error) {
    j.at("code").get_to(error.code);
    j.at("message").get_to(error.message);
    if (j.contains("data")) {
      error.data = j["data"];
    } else {
      error.data = nullptr;
    }
  }
};

// JSONRPCRequest serialization
template <> struct adl_serializer<weathermcp::types::JSONRPCRequest> {
  static void to_json(json &j,
                      const weathermcp::types::JSONRPCRequest &request) {
    j = json::object();
    j["jsonrpc"] = request.jsonrpc;
    j["id"] = request.id;
    j["method"] = request.method;
    if (request.params) {
      j["params"] = *request.params;
    }
  }

  static void from_json(const json &j,
                        weathermcp::types::JSONRPCRequest &request) {
    j.at("jsonrpc").get_to(request.jsonrpc);
    request.id = j.at("id").get<weathermcp::types::RequestId>();
    j.at("method").get_to(request.method);
    if (j.contains("params")) {
      request.params = j["params"];
    }
  }
};

// JSONRPCResponse serialization
template <> struct adl_serializer<weathermcp::types::JSONRPCResponse> {
  static void to_json(json &j,
                      const weathermcp::types::JSONRPCResponse &response) {
    j = json::object();
    j["jsonrpc"] = response.jsonrpc;
    j["id"] = response.id;
    j["result"] = response.result;
  }

  static void from_json(const json &j,
                        weathermcp::types::JSONRPCResponse &response) {
    j.at("jsonrpc").get_to(response.jsonrpc);
    response.id = j.at("id").get<weathermcp::types::RequestId>();
    j.at("result").get_to(response.result);
  }
};

// JSONRPCError serialization
template <> struct adl_serializer<weathermcp::types::JSONRPCError> {
  static void to_json(json &j, const weathermcp::types::JSONRPCError &error) {
    j = json::object();
    j["jsonrpc"] = error.jsonrpc;
    j["error"] = error.error;
    if (error.id) {
      j["id"] = *error.id;
    } else {
      j["id"] = nullptr;
    }
  }

  static void from_json(const json &j,
                        weathermcp::types::JSONRPCError &error) {
    j.at("jsonrpc").get_to(error.jsonrpc);
    if (j.contains("id") && !j["id"].is_null()) {
      error.id = j["id"].get<weathermcp::types::RequestId>();
    } else {
      error.id.reset();
    }
    j.at("error").get_to(error.error);
  }
};

// JSONRPCNotification serialization
template <> struct adl_serializer<weathermcp::types::JSONRPCNotification> {
  static void
  to_json(json &j,
          const weathermcp::types::JSONRPCNotification &notification) {
    j = json::object();
    j["jsonrpc"] = notification.jsonrpc;
    j["method"] = notification.method;
    if (notification.params) {
      j["params"] = *notification.params;
    }
  }

  static void from_json(const json &j,
                        weathermcp::types::JSONRPCNotification &notification) {
    j.at("jsonrpc").get_to(notification.jsonrpc);
    j.at("method").get_to(notification.method);
    if (j.contains("params")) {
      notification.params = j["params"];
    }
  }
};

// ToolAnnotations serialization
template <> struct adl_serializer<weathermcp::types::ToolAnnotations> {
  static void to_json(json &j,
                      const weathermcp::types::ToolAnnotations &annotations) {
    j = json::object();
    if (annotations.title) {
      j["title"] = *annotations.title;
    }
    if (annotations.read_only_hint) {
      j["readOnlyHint"] = *annotations.read_only_hint;
    }
    if (annotations.destructive_hint) {
      j["destructiveHint"] = *annotations.destructive_hint;
    }
    if (annotations.idempotent_hint) {
      j["idempotentHint"] = *annotations.idempotent_hint;
    }
    if (annotations.open_world_hint) {
      j["openWorldHint"] = *annotations.open_world_hint;
    }
  }

  static void from_json(const json &j,
                        weathermcp::types::ToolAnnotations &annotations) {
    if (j.contains("title")) {
      annotations.title = j["title"].get<std::string>();
    }
    if (j.contains("readOnlyHint")) {
      annotations.read_only_hint = j["readOnlyHint"].get<bool>();
    }
    if (j.contains("destructiveHint")) {
      annotations.destructive_hint = j["destructiveHint"].get<bool>();
    }
    if (j.contains("idempotentHint")) {
      annotations.idempotent_hint = j["idempotentHint"].get<bool>();
    }
    if (j.contains("openWorldHint")) {
      annotations.open_world_hint = j["openWorldHint"].get<bool>();
    }
  }
};

// Tool serialization
template <> struct adl_serializer<weathermcp::types::Tool> {
  static void to_json(json &j, const weathermcp::types::Tool &tool) {
    j = json::object();
    j["name"] = tool.name;
    if (tool.title) {
      j["title"] = *tool.title;
    }
    j["description"] = tool.description;
    j["inputSchema"] = tool.input_schema;
    if (tool.output_schema) {
      j["outputSchema"] = *tool.output_schema;
    }
    if (tool.annotations) {
      j["annotations"] = *tool.annotations;
    }
  }

  static void from_json(const json &j, weathermcp::types::Tool &tool) {
    j.at("name").get_to(tool.name);
    if (j.contains("title")) {
      tool.title = j["title"].get<std::string>();
    }
    if (j.contains("description")) {
      j["description"].get_to(tool.description);
    }
    j.at("inputSchema").get_to(tool.input_schema);
    if (j.contains("outputSchema")) {
      tool.output_schema = j["outputSchema"];
    }
    if (j.contains("annotations")) {
      tool.annotations =
          j["annotations"].get<weathermcp::types::ToolAnnotations>();
    }
  }
};

// TextContent serialization
template <> struct adl_serializer<weathermcp::types::TextContent> {
  static void to_json(json &j, const weathermcp::types::TextContent &content) {
    j = json{{"type", content.type}, {"text", content.text}};
  }

  static void from_json(const json &j,
                        weathermcp::types::TextContent &content) {
    j.at("type").get_to(content.type);
    j.at("text").get_to(content.text);
  }
};

// CallToolResult serialization
template <> struct adl_serializer<weathermcp::types::CallToolResult> {
  static void to_json(json &j,
                      const weathermcp::types::CallToolResult &result) {
    j = json::object();
    j["content"] = result.content;
    if (result.structured_content) {
      j["structuredContent"] = *result.structured_content;
    }
    if (result.is_error) {
      j["isError"] = true;
    }
  }

  static void from_json(const json &j,
                        weathermcp::types::CallToolResult &result) {
    j.at("content").get_to(result.content);
    if (j.contains("structuredContent")) {
      result.structured_content = j["structuredContent"];
    }
    result.is_error = j.value("isError", false);
  }
};

// ServerInfo serialization
template <> struct adl_serializer<weathermcp::types::ServerInfo> {
  static void to_json(json &j, const weathermcp::types::ServerInfo &info) {
    j = json{{"name", info.name}, {"version", info.version}};
  }

  static void from_json(const json &j, weathermcp::types::ServerInfo &info) {
    j.at("name").get_to(info.name);
    j.at("version").get_to(info.version);
  }
};

// ClientInfo serialization
template <> struct adl_serializer<weathermcp::types::ClientInfo> {
  static void to_json(json &j, const weathermcp::types::ClientInfo &info) {
    j = json{{"name", info.name}, {"version", info.version}};
  }

  static void from_json(const json &j, weathermcp::types::ClientInfo &info) {
    info.name = j.value("name", "");
    info.version = j.value("version", "");
  }
};

} // namespace nlohmann

#endif // WEATHERMCP_TYPES_HPP_
