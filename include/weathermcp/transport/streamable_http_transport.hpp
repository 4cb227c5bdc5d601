#ifndef WEATHERMCP_TRANSPORT_STREAMABLE_HTTP_TRANSPORT_HPP_
#define WEATHERMCP_TRANSPORT_STREAMABLE_HTTP_TRANSPORT_HPP_

#include "weathermcp/transport/http_message.hpp"
#include "weathermcp/transport/transport.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace weathermcp {
namespace transport {

/**
 * @brief Session-bound transport for the single HTTP endpoint
 *
 * Each POST is delivered to the message callback one message at a time, in
 * body order, and whatever the server sends while the POST is being handled
 * is written back as that POST's reply: an SSE stream when the client accepts
 * text/event-stream, plain JSON otherwise.
 *
 * Requests for one transport are handled strictly one after another.
 */
class StreamableHttpTransport : public Transport {
public:
  /**
   * @brief Configuration for StreamableHttpTransport
   */
  struct Config {
    /**
     * @brief Produces the session id when the initialize request arrives
     */
    std::function<std::string()> session_id_generator;

    /**
     * @brief Called once, with the new id, before initialize is dispatched
     */
    std::function<void(const std::string &)> on_session_initialized;
  };

  explicit StreamableHttpTransport(Config config);

  ~StreamableHttpTransport() override;

  void start() override;

  std::error_code send(const types::JSONRPCMessage &message) override;

  void close() override;

  bool isOpen() const override;

  void setMessageCallback(
      std::function<void(const types::JSONRPCMessage &)> callback) override;

  void setErrorCallback(
      std::function<void(const std::error_code &)> callback) override;

  void setCloseCallback(std::function<void()> callback) override;

  /**
   * @brief Handle one HTTP request addressed to this transport
   *
   * @param envelope The request
   * @return HttpReply The reply to write back
   * @throws ProtocolException for malformed bodies, requests before
   * initialization, repeated initialization or a closed transport
   */
  HttpReply handleRequest(const RequestEnvelope &envelope);

  /**
   * @brief The assigned session id, empty until initialize has been received
   */
  std::optional<std::string> sessionId() const;

private:
  /**
   * @brief Messages the server sent while one POST was being handled
   */
  struct Exchange {
    std::vector<types::RequestId> awaiting;   ///< Request ids in body order
    std::vector<nlohmann::json> events;       ///< Everything, in send order
    std::vector<std::optional<nlohmann::json>> responses; ///< By awaiting slot
  };

  HttpReply handlePost(const RequestEnvelope &envelope);

  HttpReply handleDelete(const RequestEnvelope &envelope);

  void assignSessionId();

  void deliver(const types::JSONRPCMessage &message);

  HttpReply buildReply(const RequestEnvelope &envelope, Exchange exchange,
                       bool batch) const;

  void reportError(const std::error_code &error);

  Config config_;

  std::atomic<bool> started_;
  std::atomic<bool> closed_;

  mutable std::mutex session_mutex_;
  std::optional<std::string> session_id_;

  // Serializes handleRequest calls
  std::mutex request_mutex_;

  std::mutex exchange_mutex_;
  std::optional<Exchange> exchange_;

  std::mutex callback_mutex_;
  std::function<void(const types::JSONRPCMessage &)> message_callback_;
  std::function<void(const std::error_code &)> error_callback_;
  std::function<void()> close_callback_;
};

} // namespace transport
} // namespace weathermcp

#endif // WEATHERMCP_TRANSPORT_STREAMABLE_HTTP_TRANSPORT_HPP_
