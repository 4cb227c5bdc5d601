#ifndef WEATHERMCP_UTILS_JSON_UTILS_HPP_
#define WEATHERMCP_UTILS_JSON_UTILS_HPP_

#include "weathermcp/types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace weathermcp {
namespace json_utils {

/**
 * @brief One violated schema constraint
 */
struct SchemaViolation {
  std::string pointer; ///< JSON pointer of the offending value ("" for root)
  std::string message; ///< Validator message
};

/**
 * @brief Validate JSON against a schema and report every violated constraint
 *
 * Violations are returned in the order the validator visits them, which is
 * deterministic for a given schema and instance.
 *
 * @param json The JSON value to validate
 * @param schema The JSON schema to validate against
 * @return std::vector<SchemaViolation> Empty when the value conforms
 * @throws std::invalid_argument if the schema itself cannot be compiled
 */
std::vector<SchemaViolation> collectViolations(const nlohmann::json &json,
                                               const nlohmann::json &schema);

/**
 * @brief Parse a JSON string
 *
 * @param json_str The JSON string to parse
 * @return nlohmann::json The parsed JSON
 * @throws ProtocolException (ParseError) if parsing fails
 */
nlohmann::json parse(const std::string &json_str);

/**
 * @brief The kind of a JSON-RPC message
 */
enum class MessageType { Request, Notification, Response, Error };

/**
 * @brief Get the type of a JSON-RPC message
 *
 * @param json The JSON message
 * @return MessageType The message type
 * @throws ProtocolException if the message is not a valid JSON-RPC message
 */
MessageType getMessageType(const nlohmann::json &json);

/**
 * @brief Convert a parsed JSON value into a JSON-RPC message
 *
 * @throws ProtocolException if the value is not a valid JSON-RPC message
 */
types::JSONRPCMessage toMessage(const nlohmann::json &json);

/**
 * @brief Serialize a JSON-RPC message to a JSON value
 */
nlohmann::json toJson(const types::JSONRPCMessage &message);

/**
 * @brief Whether a request body is a single JSON-RPC initialize request
 */
bool isInitializeRequest(const nlohmann::json &body);

/**
 * @brief Extract the correlation id of a request body, if it has a usable one
 *
 * Batches and notifications have no correlation id.
 */
std::optional<types::RequestId> extractRequestId(const nlohmann::json &body);

} // namespace json_utils
} // namespace weathermcp

#endif // WEATHERMCP_UTILS_JSON_UTILS_HPP_
