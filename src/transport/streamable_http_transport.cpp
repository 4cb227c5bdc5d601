#include "weathermcp/transport/streamable_http_transport.hpp"
#include "weathermcp/utils/error.hpp"
#include "weathermcp/utils/json_utils.hpp"
#include "weathermcp/utils/logging.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace weathermcp {
namespace transport {

namespace {

bool isInitialize(const types::JSONRPCMessage &message) {
  const auto *request = std::get_if<types::JSONRPCRequest>(&message);
  return request != nullptr && request->method == "initialize";
}

std::optional<types::RequestId>
respondsTo(const types::JSONRPCMessage &message) {
  if (const auto *response = std::get_if<types::JSONRPCResponse>(&message)) {
    return response->id;
  }
  if (const auto *error = std::get_if<types::JSONRPCError>(&message)) {
    return error->id;
  }
  return std::nullopt;
}

} // namespace

StreamableHttpTransport::StreamableHttpTransport(Config config)
    : config_(std::move(config)), started_(false), closed_(false) {
  if (!config_.session_id_generator) {
    throw std::invalid_argument(
        "StreamableHttpTransport requires a session id generator");
  }
}

StreamableHttpTransport::~StreamableHttpTransport() { close(); }

void StreamableHttpTransport::start() {
  if (closed_) {
    throw TransportException("Cannot start a closed transport");
  }
  started_ = true;
}

std::error_code
StreamableHttpTransport::send(const types::JSONRPCMessage &message) {
  if (!started_) {
    return make_error_code(TransportError::NotStarted);
  }
  if (closed_) {
    return make_error_code(TransportError::Closed);
  }

  std::error_code ec;
  {
    std::lock_guard<std::mutex> lock(exchange_mutex_);
    if (exchange_) {
      nlohmann::json event = json_utils::toJson(message);

      // Slot a response next to the request it answers
      if (auto id = respondsTo(message)) {
        for (std::size_t i = 0; i < exchange_->awaiting.size(); ++i) {
          if (exchange_->awaiting[i] == *id && !exchange_->responses[i]) {
            exchange_->responses[i] = event;
            break;
          }
        }
      }
      exchange_->events.push_back(std::move(event));
    } else {
      ec = make_error_code(TransportError::NoActiveStream);
    }
  }

  if (ec) {
    WEATHERMCP_LOG_DEBUG("Dropping server message: " << ec.message());
    reportError(ec);
  }
  return ec;
}

void StreamableHttpTransport::close() {
  if (closed_.exchange(true)) {
    return;
  }

  {
    std::lock_guard<std::mutex> lock(exchange_mutex_);
    exchange_.reset();
  }

  std::function<void()> callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = close_callback_;
  }

  WEATHERMCP_LOG_DEBUG("Transport closed for session "
                       << sessionId().value_or("<none>"));

  if (callback) {
    callback();
  }
}

bool StreamableHttpTransport::isOpen() const { return started_ && !closed_; }

void StreamableHttpTransport::setMessageCallback(
    std::function<void(const types::JSONRPCMessage &)> callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  message_callback_ = std::move(callback);
}

void StreamableHttpTransport::setErrorCallback(
    std::function<void(const std::error_code &)> callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  error_callback_ = std::move(callback);
}

void StreamableHttpTransport::setCloseCallback(std::function<void()> callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  close_callback_ = std::move(callback);
}

std::optional<std::string> StreamableHttpTransport::sessionId() const {
  std::lock_guard<std::mutex> lock(session_mutex_);
  return session_id_;
}

HttpReply StreamableHttpTransport::handleRequest(const RequestEnvelope &envelope) {
  std::lock_guard<std::mutex> lock(request_mutex_);

  if (closed_) {
    throw ProtocolException::sessionNotFound(
        envelope.session_id.value_or(sessionId().value_or("")));
  }
  if (!started_) {
    throw TransportException("Transport not started");
  }

  switch (envelope.method) {
  case HttpMethod::Post:
    return handlePost(envelope);
  case HttpMethod::Delete:
    return handleDelete(envelope);
  default: {
    // No standalone server-to-client stream is offered
    HttpReply reply = jsonReply(
        405, nlohmann::json(createErrorResponse(
                 std::nullopt, types::ErrorCode::ServerError,
                 "Method not allowed.")));
    reply.headers["Allow"] = "POST, DELETE";
    return reply;
  }
  }
}

HttpReply StreamableHttpTransport::handlePost(const RequestEnvelope &envelope) {
  if (!envelope.body) {
    throw ProtocolException::malformedRequest(
        "Bad Request: Invalid or missing JSON body");
  }

  const nlohmann::json &body = *envelope.body;
  const bool batch = body.is_array();

  std::vector<types::JSONRPCMessage> messages;
  if (batch) {
    if (body.empty()) {
      throw ProtocolException::malformedRequest("Bad Request: Empty batch");
    }
    for (const auto &item : body) {
      messages.push_back(json_utils::toMessage(item));
    }
  } else if (body.is_object()) {
    messages.push_back(json_utils::toMessage(body));
  } else {
    throw ProtocolException::malformedRequest(
        "Bad Request: Body must be a JSON-RPC message or batch");
  }

  const bool has_initialize =
      std::any_of(messages.begin(), messages.end(), isInitialize);

  if (has_initialize) {
    if (sessionId()) {
      throw ProtocolException::malformedRequest(
          "Invalid Request: Server already initialized");
    }
    if (messages.size() > 1) {
      throw ProtocolException::malformedRequest(
          "Invalid Request: Only one initialization request is allowed");
    }
    assignSessionId();
  } else {
    auto id = sessionId();
    if (!id) {
      throw ProtocolException::malformedRequest(
          "Bad Request: Server not initialized");
    }
    if (!envelope.session_id) {
      throw ProtocolException::malformedRequest(
          "Bad Request: Mcp-Session-Id header is required");
    }
    if (*envelope.session_id != *id) {
      throw ProtocolException::sessionNotFound(*envelope.session_id);
    }
  }

  Exchange exchange;
  for (const auto &message : messages) {
    if (const auto *request = std::get_if<types::JSONRPCRequest>(&message)) {
      exchange.awaiting.push_back(request->id);
      exchange.responses.emplace_back();
    }
  }

  // Only notifications or responses: acknowledge without a body
  if (exchange.awaiting.empty()) {
    for (const auto &message : messages) {
      deliver(message);
    }
    HttpReply reply = emptyReply(202);
    if (auto id = sessionId()) {
      reply.headers[kSessionIdHeader] = *id;
    }
    return reply;
  }

  {
    std::lock_guard<std::mutex> lock(exchange_mutex_);
    exchange_ = std::move(exchange);
  }

  try {
    for (const auto &message : messages) {
      deliver(message);
    }
  } catch (...) {
    std::lock_guard<std::mutex> lock(exchange_mutex_);
    exchange_.reset();
    throw;
  }

  std::optional<Exchange> finished;
  {
    std::lock_guard<std::mutex> lock(exchange_mutex_);
    finished.swap(exchange_);
  }

  // Closed mid-request: replies may be missing, the session is gone
  if (!finished || closed_) {
    throw ProtocolException::sessionNotFound(
        envelope.session_id.value_or(sessionId().value_or("")));
  }

  return buildReply(envelope, std::move(*finished), batch);
}

HttpReply
StreamableHttpTransport::handleDelete(const RequestEnvelope &envelope) {
  auto id = sessionId();
  if (!id) {
    throw ProtocolException::malformedRequest(
        "Bad Request: Server not initialized");
  }
  if (!envelope.session_id || *envelope.session_id != *id) {
    throw ProtocolException::sessionNotFound(envelope.session_id.value_or(""));
  }

  WEATHERMCP_LOG_INFO("Client requested termination of session " << *id);
  close();
  return emptyReply(200);
}

void StreamableHttpTransport::assignSessionId() {
  std::string id = config_.session_id_generator();
  {
    std::lock_guard<std::mutex> lock(session_mutex_);
    session_id_ = id;
  }

  if (config_.on_session_initialized) {
    config_.on_session_initialized(id);
  }
}

void StreamableHttpTransport::deliver(const types::JSONRPCMessage &message) {
  std::function<void(const types::JSONRPCMessage &)> callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = message_callback_;
  }

  if (!callback) {
    throw TransportException("No message handler bound to transport");
  }
  callback(message);
}

HttpReply StreamableHttpTransport::buildReply(const RequestEnvelope &envelope,
                                              Exchange exchange,
                                              bool batch) const {
  for (const auto &response : exchange.responses) {
    if (!response) {
      throw TransportException("Request finished without a response");
    }
  }

  HttpReply reply;
  if (envelope.accept.find("text/event-stream") != std::string::npos) {
    std::ostringstream stream;
    for (const auto &event : exchange.events) {
      stream << "event: message\ndata: " << dumpJson(event) << "\n\n";
    }
    reply.status = 200;
    reply.content_type = "text/event-stream";
    reply.body = stream.str();
    reply.headers["Cache-Control"] = "no-cache";
  } else if (batch) {
    nlohmann::json responses = nlohmann::json::array();
    for (auto &response : exchange.responses) {
      responses.push_back(std::move(*response));
    }
    reply = jsonReply(200, responses);
  } else {
    reply = jsonReply(200, *exchange.responses.front());
  }

  if (auto id = sessionId()) {
    reply.headers[kSessionIdHeader] = *id;
  }
  return reply;
}

void StreamableHttpTransport::reportError(const std::error_code &error) {
  std::function<void(const std::error_code &)> callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = error_callback_;
  }
  if (callback) {
    callback(error);
  }
}

} // namespace transport
} // namespace weathermcp
