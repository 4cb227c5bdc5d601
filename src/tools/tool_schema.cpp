#include "weathermcp/tools/tool_schema.hpp"
#include "weathermcp/utils/error.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace weathermcp {
namespace tools {

namespace {

nlohmann::json fieldSchema(const FieldSpec &field) {
  nlohmann::json schema = {{"type", fieldTypeName(field.type)}};

  if (!field.allowed_values.empty()) {
    schema["enum"] = field.allowed_values;
  }
  if (field.default_value) {
    schema["default"] = *field.default_value;
  }
  if (!field.description.empty()) {
    schema["description"] = field.description;
  }
  return schema;
}

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

} // namespace

std::string fieldTypeName(FieldType type) {
  switch (type) {
  case FieldType::String:
    return "string";
  case FieldType::Number:
    return "number";
  case FieldType::Integer:
    return "integer";
  case FieldType::Boolean:
    return "boolean";
  }
  return "string";
}

std::string ValidationResult::describe() const {
  std::ostringstream out;
  bool first = true;
  for (const auto &violation : violations) {
    if (!first) {
      out << "; ";
    }
    first = false;
    out << (violation.pointer.empty() ? "arguments" : violation.pointer)
        << ": " << violation.message;
  }
  return out.str();
}

nlohmann::json ValidationResult::violationsToJson() const {
  nlohmann::json list = nlohmann::json::array();
  for (const auto &violation : violations) {
    list.push_back({{"path", violation.pointer}, {"message", violation.message}});
  }
  return list;
}

ObjectSchema::ObjectSchema(std::vector<FieldSpec> fields) {
  for (auto &field : fields) {
    add(std::move(field));
  }
}

ObjectSchema &ObjectSchema::add(FieldSpec field) {
  if (field.name.empty()) {
    throw ToolRegistrationException("Schema field name must not be empty");
  }
  if (find(field.name) != nullptr) {
    throw ToolRegistrationException("Duplicate schema field: " + field.name);
  }

  if (field.default_value) {
    if (field.required) {
      throw ToolRegistrationException("Field " + field.name +
                                      " has a default and cannot be required");
    }
    auto violations = json_utils::collectViolations(*field.default_value,
                                                    fieldSchema(field));
    if (!violations.empty()) {
      throw ToolRegistrationException("Default of field " + field.name +
                                      " is invalid: " +
                                      violations.front().message);
    }
  }

  fields_.push_back(std::move(field));
  return *this;
}

const FieldSpec *ObjectSchema::find(const std::string &name) const {
  auto it = std::find_if(fields_.begin(), fields_.end(),
                         [&name](const FieldSpec &f) { return f.name == name; });
  return it == fields_.end() ? nullptr : &*it;
}

nlohmann::json ObjectSchema::toJsonSchema() const {
  return buildJsonSchema(true);
}

nlohmann::json ObjectSchema::buildJsonSchema(bool strict) const {
  nlohmann::json properties = nlohmann::json::object();
  nlohmann::json required = nlohmann::json::array();

  for (const auto &field : fields_) {
    properties[field.name] = fieldSchema(field);
    if (field.required) {
      required.push_back(field.name);
    }
  }

  nlohmann::json schema = {
      {"$schema", "http://json-schema.org/draft-07/schema#"},
      {"type", "object"},
      {"properties", properties}};
  if (!required.empty()) {
    schema["required"] = required;
  }
  if (strict) {
    schema["additionalProperties"] = false;
  }
  return schema;
}

ValidationResult ObjectSchema::coerce(const nlohmann::json &input) const {
  ValidationResult result;
  result.value = nlohmann::json::object();

  if (input.is_null()) {
    // No arguments at all; required fields are reported below
  } else if (!input.is_object()) {
    result.violations.push_back(
        {"", "expected an object of arguments, got " +
                 std::string(input.type_name())});
    return result;
  }

  for (const auto &field : fields_) {
    if (input.is_object() && input.contains(field.name)) {
      result.value[field.name] = input[field.name];
    } else if (field.default_value) {
      result.value[field.name] = *field.default_value;
    } else {
      continue;
    }

    auto &value = result.value[field.name];
    if (field.lowercase && value.is_string()) {
      value = toLower(value.get<std::string>());
    }
  }

  result.violations =
      json_utils::collectViolations(result.value, buildJsonSchema(false));
  return result;
}

std::vector<json_utils::SchemaViolation>
ObjectSchema::check(const nlohmann::json &payload) const {
  return json_utils::collectViolations(payload, buildJsonSchema(true));
}

} // namespace tools
} // namespace weathermcp
