#include "weathermcp/tools/tool_registry.hpp"
#include "weathermcp/utils/error.hpp"
#include "weathermcp/utils/logging.hpp"

namespace weathermcp {
namespace tools {

types::Tool ToolDefinition::descriptor() const {
  types::Tool tool;
  tool.name = name;
  tool.title = title;
  tool.description = description;
  tool.input_schema = input_schema.toJsonSchema();
  if (output_schema) {
    tool.output_schema = output_schema->toJsonSchema();
  }
  tool.annotations = annotations;
  return tool;
}

ToolRegistry &ToolRegistry::add(ToolDefinition definition) {
  if (definition.name.empty()) {
    throw ToolRegistrationException("Tool name must not be empty");
  }
  if (!definition.handler) {
    throw ToolRegistrationException("Tool " + definition.name +
                                    " has no handler");
  }
  if (definitions_.count(definition.name) != 0) {
    throw ToolRegistrationException("Tool already registered: " +
                                    definition.name);
  }

  std::string name = definition.name;
  WEATHERMCP_LOG_DEBUG("Registered tool " << name);

  order_.push_back(name);
  definitions_.emplace(std::move(name), std::move(definition));
  return *this;
}

const ToolDefinition *ToolRegistry::find(const std::string &name) const {
  auto it = definitions_.find(name);
  return it == definitions_.end() ? nullptr : &it->second;
}

std::vector<types::Tool> ToolRegistry::catalog() const {
  std::vector<types::Tool> tools;
  tools.reserve(order_.size());
  for (const auto &name : order_) {
    tools.push_back(definitions_.at(name).descriptor());
  }
  return tools;
}

} // namespace tools
} // namespace weathermcp
