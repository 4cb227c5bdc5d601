#include "weathermcp/transport/transport.hpp"

namespace weathermcp {
namespace transport {

namespace {
class TransportErrorCategory : public std::error_category {
public:
  const char *name() const noexcept override { return "transport"; }

  std::string message(int ev) const override {
    switch (static_cast<TransportError>(ev)) {
    case TransportError::NotStarted:
      return "Transport not started";
    case TransportError::Closed:
      return "Transport closed";
    case TransportError::NoActiveStream:
      return "No active stream for server messages";
    default:
      return "Unknown error";
    }
  }
};
} // namespace

const std::error_category &transport_category() {
  static TransportErrorCategory category;
  return category;
}

std::error_code make_error_code(TransportError error) {
  return {static_cast<int>(error), transport_category()};
}

} // namespace transport
} // namespace weathermcp
