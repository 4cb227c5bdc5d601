#ifndef WEATHERMCP_UTILS_ERROR_HPP_
#define WEATHERMCP_UTILS_ERROR_HPP_

#include "weathermcp/types.hpp"
#include <optional>
#include <stdexcept>
#include <string>

namespace weathermcp {

/**
 * @brief Base exception class for server errors
 *
 * This class extends std::runtime_error and carries the JSON-RPC error data
 * that is reported to the client when the exception reaches a protocol
 * boundary.
 */
class McpException : public std::runtime_error {
public:
  /**
   * @brief Construct a new McpException with error data
   *
   * @param error The error data
   */
  explicit McpException(types::ErrorData error);

  /**
   * @brief Construct a new McpException with error code and message
   *
   * @param code The error code
   * @param message The error message
   * @param data Optional additional data
   */
  McpException(types::ErrorCode code, const std::string &message,
               const nlohmann::json &data = nullptr);

  /**
   * @brief Get the error data
   */
  const types::ErrorData &error() const;

  /**
   * @brief Get the error code as the enum
   */
  types::ErrorCode code() const;

private:
  types::ErrorData error_; ///< The error data
};

/**
 * @brief Exception for protocol-level failures
 *
 * Raised by the request router (MalformedRequest, SessionNotFound) and by the
 * per-session protocol server (unknown method, invalid params, uninitialized
 * session). Never affects sessions other than the one that raised it.
 */
class ProtocolException : public McpException {
public:
  /**
   * @brief Construct a new ProtocolException with error code
   *
   * @param code The error code
   * @param message The error message
   * @param data Optional additional data
   */
  ProtocolException(types::ErrorCode code, const std::string &message,
                    const nlohmann::json &data = nullptr);

  /**
   * @brief A request that carries no session id and is not an initialization
   * request, or whose body has an invalid shape
   */
  static ProtocolException malformedRequest(const std::string &message);

  /**
   * @brief A request bearing a session id that is not among the active
   * sessions; the client must re-initialize
   */
  static ProtocolException sessionNotFound(const std::string &session_id);
};

/**
 * @brief Exception for transport-related errors
 */
class TransportException : public McpException {
public:
  /**
   * @brief Construct a new TransportException
   *
   * @param message The error message
   * @param data Optional additional data
   */
  explicit TransportException(const std::string &message,
                              const nlohmann::json &data = nullptr);
};

/**
 * @brief Raised when a session id is inserted twice into a SessionRegistry
 */
class DuplicateSessionException : public McpException {
public:
  explicit DuplicateSessionException(const std::string &session_id);

  const std::string &sessionId() const { return session_id_; }

private:
  std::string session_id_;
};

/**
 * @brief Raised at startup for an invalid tool definition (duplicate name,
 * missing handler, malformed schema)
 */
class ToolRegistrationException : public McpException {
public:
  explicit ToolRegistrationException(const std::string &message);
};

/**
 * @brief Raised when a handler's structured payload does not match the tool's
 * declared output schema
 *
 * This is an implementation bug, not a client error, and is never coerced.
 */
class OutputSchemaException : public McpException {
public:
  OutputSchemaException(const std::string &tool_name,
                        const nlohmann::json &violations);
};

/**
 * @brief Create an error response from an exception
 *
 * @param id The request ID, if the failing request had one
 * @param exception The exception
 * @return types::JSONRPCError The error response
 */
types::JSONRPCError
createErrorResponse(const std::optional<types::RequestId> &id,
                    const McpException &exception);

/**
 * @brief Create an error response from error code and message
 *
 * @param id The request ID, if the failing request had one
 * @param code The error code
 * @param message The error message
 * @param data Optional additional data
 * @return types::JSONRPCError The error response
 */
types::JSONRPCError
createErrorResponse(const std::optional<types::RequestId> &id,
                    types::ErrorCode code, const std::string &message,
                    const nlohmann::json &data = nullptr);

} // namespace weathermcp

#endif // WEATHERMCP_UTILS_ERROR_HPP_
