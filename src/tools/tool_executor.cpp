#include "weathermcp/tools/tool_executor.hpp"
#include "weathermcp/utils/error.hpp"
#include "weathermcp/utils/logging.hpp"

#include <stdexcept>

namespace weathermcp {
namespace tools {

std::string statusToString(ToolInvocationResult::Status status) {
  switch (status) {
  case ToolInvocationResult::Status::Success:
    return "success";
  case ToolInvocationResult::Status::DomainMiss:
    return "domain-miss";
  case ToolInvocationResult::Status::UnknownTool:
    return "unknown-tool";
  case ToolInvocationResult::Status::InvalidArguments:
    return "invalid-arguments";
  }
  return "unknown";
}

types::CallToolResult ToolInvocationResult::toCallToolResult() const {
  types::CallToolResult result;
  result.content.push_back({.type = "text", .text = text});
  result.structured_content = structured;
  result.is_error = isError();
  return result;
}

ToolInvocationResult
ToolInvocationResult::success(std::string text,
                              std::optional<nlohmann::json> structured) {
  ToolInvocationResult result;
  result.status = Status::Success;
  result.text = std::move(text);
  result.structured = std::move(structured);
  return result;
}

ToolInvocationResult ToolInvocationResult::domainMiss(std::string explanation) {
  ToolInvocationResult result;
  result.status = Status::DomainMiss;
  result.text = std::move(explanation);
  return result;
}

ToolInvocationResult
ToolInvocationResult::unknownTool(const std::string &name) {
  ToolInvocationResult result;
  result.status = Status::UnknownTool;
  result.text = "Tool " + name + " not found";
  return result;
}

ToolInvocationResult
ToolInvocationResult::invalidArguments(const std::string &name,
                                       const ValidationResult &validation) {
  ToolInvocationResult result;
  result.status = Status::InvalidArguments;
  result.text =
      "Invalid arguments for tool " + name + ": " + validation.describe();
  result.violations = validation.violations;
  return result;
}

ToolExecutor::ToolExecutor(std::shared_ptr<const ToolRegistry> registry)
    : registry_(std::move(registry)) {
  if (!registry_) {
    throw std::invalid_argument("ToolExecutor requires a registry");
  }
}

ToolInvocationResult ToolExecutor::invoke(const std::string &name,
                                          const nlohmann::json &raw_arguments,
                                          ToolContext &context) const {
  const ToolDefinition *definition = registry_->find(name);
  if (definition == nullptr) {
    WEATHERMCP_LOG_WARNING("Call to unknown tool " << name);
    return ToolInvocationResult::unknownTool(name);
  }

  // Validate and normalize arguments before the handler sees them
  ValidationResult validation = definition->input_schema.coerce(raw_arguments);
  if (!validation.ok()) {
    WEATHERMCP_LOG_INFO("Rejected arguments for tool " << name << ": "
                                                        << validation.describe());
    return ToolInvocationResult::invalidArguments(name, validation);
  }

  WEATHERMCP_LOG_INFO("Invoking tool " << name << " with "
                                       << validation.value.dump());

  ToolOutcome outcome = definition->handler(validation.value, context);

  if (auto *miss = std::get_if<DomainMiss>(&outcome)) {
    return ToolInvocationResult::domainMiss(std::move(miss->explanation));
  }

  auto &success = std::get<ToolSuccess>(outcome);

  if (definition->output_schema) {
    if (!success.structured) {
      throw OutputSchemaException(
          name, nlohmann::json::array(
                    {{{"path", ""},
                      {"message", "tool declares an output schema but "
                                  "returned no structured content"}}}));
    }

    auto violations = definition->output_schema->check(*success.structured);
    if (!violations.empty()) {
      ValidationResult failed;
      failed.violations = std::move(violations);
      WEATHERMCP_LOG_ERROR("Tool " << name << " broke its output schema: "
                                   << failed.describe());
      throw OutputSchemaException(name, failed.violationsToJson());
    }
  }

  return ToolInvocationResult::success(std::move(success.text),
                                       std::move(success.structured));
}

} // namespace tools
} // namespace weathermcp
