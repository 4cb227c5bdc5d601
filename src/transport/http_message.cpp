#include "weathermcp/transport/http_message.hpp"
#include "weathermcp/utils/json_utils.hpp"

namespace weathermcp {
namespace transport {

std::string methodToString(HttpMethod method) {
  switch (method) {
  case HttpMethod::Get:
    return "GET";
  case HttpMethod::Post:
    return "POST";
  case HttpMethod::Delete:
    return "DELETE";
  case HttpMethod::Other:
    return "OTHER";
  }
  return "OTHER";
}

std::optional<types::RequestId> RequestEnvelope::correlationId() const {
  if (!body) {
    return std::nullopt;
  }
  return json_utils::extractRequestId(*body);
}

int statusForError(types::ErrorCode code) {
  switch (code) {
  case types::ErrorCode::ParseError:
  case types::ErrorCode::InvalidRequest:
  case types::ErrorCode::InvalidParams:
  case types::ErrorCode::MethodNotFound:
    return 400;
  case types::ErrorCode::SessionNotFound:
    return 404;
  case types::ErrorCode::InternalError:
  case types::ErrorCode::ServerError:
    return 500;
  }
  return 500;
}

std::string dumpJson(const nlohmann::json &value) {
  return value.dump(-1, ' ', false,
                    nlohmann::json::error_handler_t::replace);
}

HttpReply jsonReply(int status, const nlohmann::json &body) {
  HttpReply reply;
  reply.status = status;
  reply.content_type = "application/json";
  reply.body = dumpJson(body);
  return reply;
}

HttpReply errorReply(const types::JSONRPCError &error) {
  return jsonReply(
      statusForError(static_cast<types::ErrorCode>(error.error.code)),
      nlohmann::json(error));
}

HttpReply emptyReply(int status) {
  HttpReply reply;
  reply.status = status;
  return reply;
}

} // namespace transport
} // namespace weathermcp
