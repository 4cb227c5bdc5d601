#ifndef WEATHERMCP_TOOLS_TOOL_SCHEMA_HPP_
#define WEATHERMCP_TOOLS_TOOL_SCHEMA_HPP_

#include "weathermcp/utils/json_utils.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace weathermcp {
namespace tools {

/**
 * @brief JSON type of a declared field
 */
enum class FieldType { String, Number, Integer, Boolean };

/**
 * @brief JSON Schema name of a field type ("string", "number", ...)
 */
std::string fieldTypeName(FieldType type);

/**
 * @brief Declarative rule for one field of a tool's input or output
 */
struct FieldSpec {
  std::string name;                            ///< Field name
  FieldType type = FieldType::String;          ///< Expected JSON type
  std::string description;                     ///< Shown in the catalog
  bool required = true;                        ///< Must be present
  std::optional<nlohmann::json> default_value; ///< Applied when absent
  std::vector<std::string> allowed_values;     ///< Enumeration, if any
  bool lowercase = false; ///< Fold string values to lower case on input
};

/**
 * @brief Outcome of validating arguments against an ObjectSchema
 */
struct ValidationResult {
  /**
   * @brief The normalized value: defaults applied, case folded, undeclared
   * fields dropped
   */
  nlohmann::json value;

  /**
   * @brief Every violated constraint, empty on success
   */
  std::vector<json_utils::SchemaViolation> violations;

  bool ok() const { return violations.empty(); }

  /**
   * @brief Human-readable summary listing every violation
   */
  std::string describe() const;

  /**
   * @brief Violations as a JSON array of {path, message}
   */
  nlohmann::json violationsToJson() const;
};

/**
 * @brief Schema of a JSON object described field by field
 *
 * The same declaration drives the catalog's JSON Schema, input coercion and
 * strict output checking, so the three can never disagree.
 */
class ObjectSchema {
public:
  ObjectSchema() = default;

  /**
   * @brief Construct from a list of fields
   *
   * @throws ToolRegistrationException on duplicate names or invalid defaults
   */
  explicit ObjectSchema(std::vector<FieldSpec> fields);

  /**
   * @brief Append a field
   *
   * @return ObjectSchema& This instance for method chaining
   * @throws ToolRegistrationException on duplicate names or invalid defaults
   */
  ObjectSchema &add(FieldSpec field);

  const std::vector<FieldSpec> &fields() const { return fields_; }

  /**
   * @brief Find a field by name, nullptr if absent
   */
  const FieldSpec *find(const std::string &name) const;

  /**
   * @brief JSON Schema (draft-07) published in the tool catalog
   */
  nlohmann::json toJsonSchema() const;

  /**
   * @brief Validate and normalize tool arguments
   *
   * A null input is treated as an empty argument object. Defaults are applied
   * and case folding performed before the constraints are checked, and every
   * violation is reported rather than only the first one.
   */
  ValidationResult coerce(const nlohmann::json &input) const;

  /**
   * @brief Check that a payload matches the declared fields exactly
   *
   * No coercion happens: missing required fields, wrong types, enumeration
   * misses and undeclared fields are all violations.
   */
  std::vector<json_utils::SchemaViolation>
  check(const nlohmann::json &payload) const;

private:
  nlohmann::json buildJsonSchema(bool strict) const;

  std::vector<FieldSpec> fields_;
};

} // namespace tools
} // namespace weathermcp

#endif // WEATHERMCP_TOOLS_TOOL_SCHEMA_HPP_
