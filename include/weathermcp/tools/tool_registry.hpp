#ifndef WEATHERMCP_TOOLS_TOOL_REGISTRY_HPP_
#define WEATHERMCP_TOOLS_TOOL_REGISTRY_HPP_

#include "weathermcp/tools/tool_schema.hpp"
#include "weathermcp/types.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace weathermcp {
namespace tools {

/**
 * @brief Side channel through which a handler reports progress to the client
 * whose call it is serving
 *
 * Messages are delivered to the calling session only, in the order they are
 * issued, and before the call's result.
 */
class Notifier {
public:
  virtual ~Notifier() = default;

  /**
   * @brief Emit a notifications/message to the calling client
   *
   * @param level Severity; messages below the session's level are dropped
   * @param data Payload of the message
   */
  virtual void notify(types::LoggingLevel level, const nlohmann::json &data) = 0;
};

/**
 * @brief Per-call capabilities handed to a tool handler
 */
struct ToolContext {
  Notifier &notifier;                         ///< Client side channel
  std::string session_id;                     ///< Calling session
  std::optional<types::RequestId> request_id; ///< Correlation id of the call
};

/**
 * @brief Normal handler result
 */
struct ToolSuccess {
  std::string text;                         ///< Human-readable summary
  std::optional<nlohmann::json> structured; ///< Payload for the output schema
};

/**
 * @brief The handler ran but its data source has nothing for the request
 */
struct DomainMiss {
  std::string explanation; ///< Human-readable reason
};

/**
 * @brief What a handler returns: success or a domain-level miss
 */
using ToolOutcome = std::variant<ToolSuccess, DomainMiss>;

/**
 * @brief Handler signature; receives arguments already validated, defaulted
 * and normalized against the tool's input schema
 */
using ToolHandler =
    std::function<ToolOutcome(const nlohmann::json &arguments,
                              ToolContext &context)>;

/**
 * @brief Everything the server knows about one tool
 */
struct ToolDefinition {
  std::string name;
  std::optional<std::string> title;
  std::string description;
  ObjectSchema input_schema;
  std::optional<ObjectSchema> output_schema;
  std::optional<types::ToolAnnotations> annotations;
  ToolHandler handler;

  /**
   * @brief The catalog entry clients see in tools/list
   */
  types::Tool descriptor() const;
};

/**
 * @brief Holds the tool definitions, keyed by unique name
 *
 * Populated once at startup and shared read-only by every session afterwards;
 * lookups need no locking.
 */
class ToolRegistry {
public:
  /**
   * @brief Register a tool
   *
   * @param definition The tool definition
   * @return ToolRegistry& This instance for method chaining
   * @throws ToolRegistrationException if the name is empty or already taken,
   * or the handler is missing
   */
  ToolRegistry &add(ToolDefinition definition);

  /**
   * @brief Look a tool up by name
   *
   * @return const ToolDefinition* The definition, or nullptr if unknown
   */
  const ToolDefinition *find(const std::string &name) const;

  std::size_t size() const { return definitions_.size(); }

  /**
   * @brief Catalog entries in registration order
   */
  std::vector<types::Tool> catalog() const;

private:
  std::vector<std::string> order_;
  std::unordered_map<std::string, ToolDefinition> definitions_;
};

} // namespace tools
} // namespace weathermcp

#endif // WEATHERMCP_TOOLS_TOOL_REGISTRY_HPP_
