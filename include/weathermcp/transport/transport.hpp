#ifndef WEATHERMCP_TRANSPORT_TRANSPORT_HPP_
#define WEATHERMCP_TRANSPORT_TRANSPORT_HPP_

#include "weathermcp/types.hpp"
#include <functional>
#include <string>
#include <system_error>

namespace weathermcp {
namespace transport {

/**
 * @brief Errors reported by Transport::send
 */
enum class TransportError {
  NotStarted = 1, ///< start() has not been called
  Closed,         ///< The transport has been closed
  NoActiveStream  ///< Nothing is waiting to receive server messages
};

/**
 * @brief Error category for TransportError values
 */
const std::error_category &transport_category();

std::error_code make_error_code(TransportError error);

/**
 * @brief Abstract base class for transport implementations
 *
 * A transport binds one session to its client. It delivers parsed messages
 * from the client through the message callback and carries the server's
 * messages back through send(). Closure is signalled exactly once through the
 * close callback, whatever triggered it.
 */
class Transport {
public:
  /**
   * @brief Virtual destructor
   */
  virtual ~Transport() = default;

  /**
   * @brief Start accepting messages
   */
  virtual void start() = 0;

  /**
   * @brief Send a message to the client
   *
   * @param message The message to send
   * @return std::error_code An error code if the message could not be sent
   */
  virtual std::error_code send(const types::JSONRPCMessage &message) = 0;

  /**
   * @brief Close the transport; later calls have no effect
   */
  virtual void close() = 0;

  /**
   * @brief Whether the transport is started and not yet closed
   */
  virtual bool isOpen() const = 0;

  /**
   * @brief Set the callback for received messages
   *
   * @param callback The callback to invoke when a message is received
   */
  virtual void setMessageCallback(
      std::function<void(const types::JSONRPCMessage &)> callback) = 0;

  /**
   * @brief Set the callback for transport errors
   *
   * @param callback The callback to invoke when an error occurs
   */
  virtual void
  setErrorCallback(std::function<void(const std::error_code &)> callback) = 0;

  /**
   * @brief Set the callback for connection closure
   *
   * @param callback The callback to invoke when the transport is closed
   */
  virtual void setCloseCallback(std::function<void()> callback) = 0;
};

} // namespace transport
} // namespace weathermcp

namespace std {
template <>
struct is_error_code_enum<weathermcp::transport::TransportError> : true_type {
};
} // namespace std

#endif // WEATHERMCP_TRANSPORT_TRANSPORT_HPP_
