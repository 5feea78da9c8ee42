#ifndef CAPBRIDGE_ARGUMENT_SCHEMA_HPP
#define CAPBRIDGE_ARGUMENT_SCHEMA_HPP

// Validation of call arguments against a contract's argument schema.
//
// Supports the JSON Schema subset the capability table uses:
//   type (string or array of strings), properties, required, enum, items,
//   minimum, maximum, minProperties, additionalProperties (boolean only).
// Unknown keywords are ignored.

#include <nlohmann/json.hpp>
#include <string>

namespace argument_schema {

using json = nlohmann::json;

struct ValidationResult {
    bool valid = false;
    std::string error_detail; // e.g. "arguments.text: expected string"
};

// Validate arguments against schema. A null or empty schema accepts anything.
ValidationResult validate(const json &schema, const json &arguments);

} // namespace argument_schema

#endif // CAPBRIDGE_ARGUMENT_SCHEMA_HPP
