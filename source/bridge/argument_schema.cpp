#include "bridge/argument_schema.hpp"

#include <cmath>
#include <vector>

namespace argument_schema {

static bool matches_type(const std::string &type_name, const json &value) {
    if (type_name == "object") {
        return value.is_object();
    }
    if (type_name == "array") {
        return value.is_array();
    }
    if (type_name == "string") {
        return value.is_string();
    }
    if (type_name == "boolean") {
        return value.is_boolean();
    }
    if (type_name == "null") {
        return value.is_null();
    }
    if (type_name == "number") {
        return value.is_number();
    }
    if (type_name == "integer") {
        if (value.is_number_integer()) {
            return true;
        }
        if (value.is_number_float()) {
            double number = value.get<double>();
            return std::isfinite(number) && std::floor(number) == number;
        }
        return false;
    }
    return false;
}

static std::string describe_types(const json &type_keyword) {
    if (type_keyword.is_string()) {
        return type_keyword.get<std::string>();
    }
    std::string joined;
    for (const auto &entry : type_keyword) {
        if (!joined.empty()) {
            joined += " or ";
        }
        joined += entry.is_string() ? entry.get<std::string>() : entry.dump();
    }
    return joined;
}

static bool check_type(const json &type_keyword, const json &value) {
    if (type_keyword.is_string()) {
        return matches_type(type_keyword.get<std::string>(), value);
    }
    if (type_keyword.is_array()) {
        for (const auto &entry : type_keyword) {
            if (entry.is_string() && matches_type(entry.get<std::string>(), value)) {
                return true;
            }
        }
        return false;
    }
    return true;
}

static ValidationResult fail(const std::string &path, const std::string &detail) {
    ValidationResult result;
    result.valid = false;
    result.error_detail = path + ": " + detail;
    return result;
}

static ValidationResult validate_at(const json &schema, const json &value, const std::string &path) {
    ValidationResult ok;
    ok.valid = true;

    if (!schema.is_object() || schema.empty()) {
        return ok;
    }

    if (schema.contains("type") && !check_type(schema["type"], value)) {
        return fail(path, "expected " + describe_types(schema["type"]));
    }

    if (schema.contains("enum") && schema["enum"].is_array()) {
        bool found = false;
        for (const auto &candidate : schema["enum"]) {
            if (candidate == value) {
                found = true;
                break;
            }
        }
        if (!found) {
            return fail(path, "value " + value.dump() + " is not one of " + schema["enum"].dump());
        }
    }

    if (value.is_number()) {
        double number = value.get<double>();
        if (!std::isfinite(number)) {
            return fail(path, "expected a finite number");
        }
        if (schema.contains("minimum") && schema["minimum"].is_number() &&
            number < schema["minimum"].get<double>()) {
            return fail(path, "must be >= " + schema["minimum"].dump());
        }
        if (schema.contains("maximum") && schema["maximum"].is_number() &&
            number > schema["maximum"].get<double>()) {
            return fail(path, "must be <= " + schema["maximum"].dump());
        }
    }

    if (value.is_object()) {
        if (schema.contains("required") && schema["required"].is_array()) {
            for (const auto &required_name : schema["required"]) {
                if (required_name.is_string() && !value.contains(required_name.get<std::string>())) {
                    return fail(path, "missing required property '" + required_name.get<std::string>() + "'");
                }
            }
        }
        if (schema.contains("minProperties") && schema["minProperties"].is_number_integer() &&
            static_cast<long long>(value.size()) < schema["minProperties"].get<long long>()) {
            return fail(path, "expected at least " + schema["minProperties"].dump() + " properties");
        }

        const json empty_properties = json::object();
        const json &properties = (schema.contains("properties") && schema["properties"].is_object())
                                     ? schema["properties"]
                                     : empty_properties;
        bool closed = schema.contains("additionalProperties") && schema["additionalProperties"].is_boolean() &&
                      !schema["additionalProperties"].get<bool>();

        for (auto iterator = value.begin(); iterator != value.end(); ++iterator) {
            std::string child_path = path + "." + iterator.key();
            if (properties.contains(iterator.key())) {
                ValidationResult child = validate_at(properties[iterator.key()], iterator.value(), child_path);
                if (!child.valid) {
                    return child;
                }
            } else if (closed) {
                return fail(child_path, "unexpected property");
            }
        }
    }

    if (value.is_array() && schema.contains("items")) {
        for (size_t index = 0; index < value.size(); ++index) {
            ValidationResult child = validate_at(schema["items"], value[index],
                                                 path + "[" + std::to_string(index) + "]");
            if (!child.valid) {
                return child;
            }
        }
    }

    return ok;
}

ValidationResult validate(const json &schema, const json &arguments) {
    return validate_at(schema, arguments, "arguments");
}

} // namespace argument_schema
