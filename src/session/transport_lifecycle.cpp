#include "weathermcp/session/transport_lifecycle.hpp"
#include "weathermcp/utils/error.hpp"
#include "weathermcp/utils/logging.hpp"

namespace weathermcp {
namespace session {

std::string stateToString(LifecycleState state) {
  switch (state) {
  case LifecycleState::Uninitialized:
    return "uninitialized";
  case LifecycleState::Initializing:
    return "initializing";
  case LifecycleState::Active:
    return "active";
  case LifecycleState::Closed:
    return "closed";
  }
  return "unknown";
}

std::shared_ptr<TransportLifecycle>
TransportLifecycle::create(SessionRegistry &registry,
                           types::ServerInfo server_info,
                           std::shared_ptr<const tools::ToolRegistry> tools,
                           IdGenerator id_generator) {
  if (!id_generator) {
    throw std::invalid_argument("TransportLifecycle requires an id generator");
  }

  auto lifecycle = std::make_shared<TransportLifecycle>(
      ConstructionKey(), registry, std::move(server_info), std::move(tools));
  lifecycle->begin(id_generator);
  return lifecycle;
}

TransportLifecycle::TransportLifecycle(
    ConstructionKey, SessionRegistry &registry, types::ServerInfo server_info,
    std::shared_ptr<const tools::ToolRegistry> tools)
    : registry_(registry), state_(LifecycleState::Uninitialized),
      server_(std::move(server_info), std::move(tools)) {}

TransportLifecycle::~TransportLifecycle() {
  server_.disconnect();
  if (transport_) {
    // Callbacks hold weak references and are inert by now
    transport_->close();
  }
}

void TransportLifecycle::begin(const IdGenerator &id_generator) {
  session_id_ = id_generator();
  if (session_id_.empty()) {
    throw std::invalid_argument("Session id generator returned an empty id");
  }

  std::weak_ptr<TransportLifecycle> weak = weak_from_this();
  const std::string id = session_id_;

  transport::StreamableHttpTransport::Config config{
      .session_id_generator = [id] { return id; },
      .on_session_initialized =
          [weak](const std::string &assigned) {
            if (auto self = weak.lock()) {
              self->onSessionInitialized(assigned);
            }
          }};

  transport_ =
      std::make_shared<transport::StreamableHttpTransport>(std::move(config));
  transport_->setCloseCallback([weak] {
    if (auto self = weak.lock()) {
      self->onTransportClosed();
    }
  });

  created_at_ = Clock::now();
  last_activity_ = created_at_.time_since_epoch().count();
  state_ = LifecycleState::Initializing;
  server_.connect(transport_);

  WEATHERMCP_LOG_DEBUG("Created session transport for " << session_id_);
}

void TransportLifecycle::onSessionInitialized(const std::string &session_id) {
  registry_.insert(session_id, shared_from_this());
  server_.setSessionId(session_id);

  LifecycleState expected = LifecycleState::Initializing;
  if (!state_.compare_exchange_strong(expected, LifecycleState::Active)) {
    // Closed while the id was being assigned; the close path skipped removal
    registry_.remove(session_id);
    return;
  }

  WEATHERMCP_LOG_INFO("Session initialized with ID: " << session_id);
}

void TransportLifecycle::onTransportClosed() {
  LifecycleState previous = state_.exchange(LifecycleState::Closed);
  if (previous == LifecycleState::Closed) {
    return;
  }

  WEATHERMCP_LOG_INFO("Session " << session_id_ << " closed (was "
                                 << stateToString(previous) << ")");
  // Only an Active session owns its registry entry
  if (previous == LifecycleState::Active) {
    registry_.remove(session_id_);
  }
}

transport::HttpReply
TransportLifecycle::handleRequest(const transport::RequestEnvelope &envelope) {
  if (state() == LifecycleState::Closed) {
    throw ProtocolException::sessionNotFound(session_id_);
  }
  last_activity_ = Clock::now().time_since_epoch().count();
  return transport_->handleRequest(envelope);
}

TransportLifecycle::Clock::time_point TransportLifecycle::lastActivity() const {
  return Clock::time_point(Clock::duration(last_activity_.load()));
}

void TransportLifecycle::close() {
  if (transport_) {
    transport_->close();
  }
}

} // namespace session
} // namespace weathermcp
