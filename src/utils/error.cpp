#include "weathermcp/utils/error.hpp"

namespace weathermcp {

McpException::McpException(types::ErrorData error)
    : std::runtime_error(error.message), error_(std::move(error)) {}

McpException::McpException(types::ErrorCode code, const std::string &message,
                           const nlohmann::json &data)
    : std::runtime_error(message),
      error_({static_cast<int>(code), message, data}) {}

const types::ErrorData &McpException::error() const { return error_; }

types::ErrorCode McpException::code() const {
  return static_cast<types::ErrorCode>(error_.code);
}

ProtocolException::ProtocolException(types::ErrorCode code,
                                     const std::string &message,
                                     const nlohmann::json &data)
    : McpException(code, message, data) {}

ProtocolException
ProtocolException::malformedRequest(const std::string &message) {
  return ProtocolException(types::ErrorCode::InvalidRequest, message);
}

ProtocolException
ProtocolException::sessionNotFound(const std::string &session_id) {
  return ProtocolException(types::ErrorCode::SessionNotFound,
                           "Session not found. Please re-initialize.",
                           {{"sessionId", session_id}});
}

TransportException::TransportException(const std::string &message,
                                       const nlohmann::json &data)
    : McpException(types::ErrorCode::InternalError, message, data) {}

DuplicateSessionException::DuplicateSessionException(
    const std::string &session_id)
    : McpException(types::ErrorCode::ServerError,
                   "Session already registered: " + session_id),
      session_id_(session_id) {}

ToolRegistrationException::ToolRegistrationException(
    const std::string &message)
    : McpException(types::ErrorCode::InternalError, message) {}

OutputSchemaException::OutputSchemaException(const std::string &tool_name,
                                             const nlohmann::json &violations)
    : McpException(types::ErrorCode::InternalError,
                   "Structured content of tool " + tool_name +
                       " does not match its output schema",
                   {{"tool", tool_name}, {"violations", violations}}) {}

types::JSONRPCError
createErrorResponse(const std::optional<types::RequestId> &id,
                    const McpException &exception) {
  return {.jsonrpc = "2.0", .id = id, .error = exception.error()};
}

types::JSONRPCError
createErrorResponse(const std::optional<types::RequestId> &id,
                    types::ErrorCode code, const std::string &message,
                    const nlohmann::json &data) {
  return {.jsonrpc = "2.0",
          .id = id,
          .error = {.code = static_cast<int>(code),
                    .message = message,
                    .data = data}};
}

} // namespace weathermcp
