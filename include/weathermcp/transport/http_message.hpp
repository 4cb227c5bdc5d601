#ifndef WEATHERMCP_TRANSPORT_HTTP_MESSAGE_HPP_
#define WEATHERMCP_TRANSPORT_HTTP_MESSAGE_HPP_

#include "weathermcp/types.hpp"

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace weathermcp {
namespace transport {

/**
 * @brief Name of the header carrying the session identifier
 */
inline constexpr const char *kSessionIdHeader = "mcp-session-id";

/**
 * @brief HTTP methods accepted at the endpoint
 */
enum class HttpMethod { Get, Post, Delete, Other };

std::string methodToString(HttpMethod method);

/**
 * @brief One inbound request as seen by the router
 */
struct RequestEnvelope {
  HttpMethod method = HttpMethod::Post;
  std::optional<std::string> session_id; ///< Value of the session header
  std::optional<nlohmann::json> body;    ///< Parsed body, empty if none/bad
  std::string accept;                    ///< Value of the Accept header

  /**
   * @brief Correlation id of the body, if it is a single request
   */
  std::optional<types::RequestId> correlationId() const;
};

/**
 * @brief Reply produced for a request, written back by the HTTP listener
 */
struct HttpReply {
  int status = 200;
  std::string content_type; ///< Empty when there is no body
  std::string body;
  std::map<std::string, std::string> headers;
};

/**
 * @brief HTTP status used for a protocol error code
 */
int statusForError(types::ErrorCode code);

/**
 * @brief Serialize a JSON value for the wire
 *
 * Strings echoed from the client may hold invalid UTF-8; such bytes are
 * written as U+FFFD instead of failing the reply.
 */
std::string dumpJson(const nlohmann::json &value);

/**
 * @brief Reply with a JSON body
 */
HttpReply jsonReply(int status, const nlohmann::json &body);

/**
 * @brief Reply carrying a JSON-RPC error envelope
 */
HttpReply errorReply(const types::JSONRPCError &error);

/**
 * @brief Reply with no body
 */
HttpReply emptyReply(int status);

} // namespace transport
} // namespace weathermcp

#endif // WEATHERMCP_TRANSPORT_HTTP_MESSAGE_HPP_
