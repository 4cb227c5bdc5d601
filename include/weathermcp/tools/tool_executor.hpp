#ifndef WEATHERMCP_TOOLS_TOOL_EXECUTOR_HPP_
#define WEATHERMCP_TOOLS_TOOL_EXECUTOR_HPP_

#include "weathermcp/tools/tool_registry.hpp"
#include "weathermcp/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace weathermcp {
namespace tools {

/**
 * @brief Discriminated outcome of a tool invocation
 *
 * UnknownTool and InvalidArguments are validation errors, DomainMiss is a
 * successful call whose data source had nothing to return. All three render
 * as a tools/call result flagged isError, never as a protocol error.
 */
struct ToolInvocationResult {
  enum class Status { Success, DomainMiss, UnknownTool, InvalidArguments };

  Status status = Status::Success;
  std::string text;                         ///< Human-readable content
  std::optional<nlohmann::json> structured; ///< Present on success only
  std::vector<json_utils::SchemaViolation> violations; ///< InvalidArguments

  bool isError() const { return status != Status::Success; }

  /**
   * @brief Render the outcome as a tools/call result
   */
  types::CallToolResult toCallToolResult() const;

  static ToolInvocationResult success(std::string text,
                                      std::optional<nlohmann::json> structured);
  static ToolInvocationResult domainMiss(std::string explanation);
  static ToolInvocationResult unknownTool(const std::string &name);
  static ToolInvocationResult
  invalidArguments(const std::string &name,
                   const ValidationResult &validation);
};

/**
 * @brief Convert a status to a short name for logs
 */
std::string statusToString(ToolInvocationResult::Status status);

/**
 * @brief Enforces a tool's contract around its handler
 *
 * Lookup, argument validation and normalization, handler execution and
 * structured output checking. Stateless apart from the registry it reads.
 */
class ToolExecutor {
public:
  /**
   * @brief Construct an executor over a registry
   *
   * @param registry The tool registry; shared read-only between sessions
   */
  explicit ToolExecutor(std::shared_ptr<const ToolRegistry> registry);

  /**
   * @brief Invoke a tool by name
   *
   * @param name The tool name
   * @param raw_arguments The arguments exactly as the client sent them
   * @param context Per-call capabilities passed to the handler
   * @return ToolInvocationResult The classified outcome
   * @throws OutputSchemaException if the handler's structured payload does not
   * match the declared output schema
   */
  ToolInvocationResult invoke(const std::string &name,
                              const nlohmann::json &raw_arguments,
                              ToolContext &context) const;

  const ToolRegistry &registry() const { return *registry_; }

private:
  std::shared_ptr<const ToolRegistry> registry_;
};

} // namespace tools
} // namespace weathermcp

#endif // WEATHERMCP_TOOLS_TOOL_EXECUTOR_HPP_
