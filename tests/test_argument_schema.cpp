// Tests for argument validation against contract schemas.

#include <nlohmann/json.hpp>
#include <cmath>
#include <iostream>
#include <string>

#include "bridge/argument_schema.hpp"

using json = nlohmann::json;

namespace test_argument_schema {

static json text_schema() {
    return {
        {"type", "object"},
        {"properties", {{"text", {{"type", "string"}}}}},
        {"required", {"text"}},
    };
}

// Test: Arguments matching the schema are accepted.
static bool test_valid_arguments_accepted() {
    argument_schema::ValidationResult result = argument_schema::validate(text_schema(), {{"text", "hello"}});
    bool success = result.valid && result.error_detail.empty();

    if (success) {
        std::cout << "  OK: Matching arguments are accepted" << std::endl;
    } else {
        std::cout << "  FAIL: Matching arguments rejected: " << result.error_detail << std::endl;
    }
    return success;
}

// Test: A missing required property is named in the error.
static bool test_missing_required_property() {
    argument_schema::ValidationResult result = argument_schema::validate(text_schema(), json::object());
    bool success = !result.valid && result.error_detail == "arguments: missing required property 'text'";

    if (success) {
        std::cout << "  OK: Missing required property reported" << std::endl;
    } else {
        std::cout << "  FAIL: Unexpected result for missing property: " << result.error_detail << std::endl;
    }
    return success;
}

// Test: A wrongly typed property reports its path and the expected type.
static bool test_wrong_property_type() {
    argument_schema::ValidationResult result = argument_schema::validate(text_schema(), {{"text", 5}});
    bool success = !result.valid && result.error_detail == "arguments.text: expected string";

    if (success) {
        std::cout << "  OK: Wrong property type reported with its path" << std::endl;
    } else {
        std::cout << "  FAIL: Unexpected result for wrong type: " << result.error_detail << std::endl;
    }
    return success;
}

// Test: Non-object arguments fail an object schema.
static bool test_non_object_arguments() {
    argument_schema::ValidationResult result = argument_schema::validate(text_schema(), json::array());
    bool success = !result.valid && result.error_detail == "arguments: expected object";

    if (success) {
        std::cout << "  OK: Array arguments rejected for object schema" << std::endl;
    } else {
        std::cout << "  FAIL: Unexpected result for array arguments: " << result.error_detail << std::endl;
    }
    return success;
}

// Test: An empty schema accepts anything.
static bool test_empty_schema_accepts_anything() {
    bool success = argument_schema::validate(json::object(), json::array({1, 2})).valid &&
                   argument_schema::validate(json(), "text").valid;

    if (success) {
        std::cout << "  OK: Empty schema accepts any arguments" << std::endl;
    } else {
        std::cout << "  FAIL: Empty schema rejected arguments" << std::endl;
    }
    return success;
}

// Test: integer accepts integral floats and rejects fractions.
static bool test_integer_type() {
    json schema = {{"type", "integer"}, {"minimum", 0}};
    bool accepts_integral_float = argument_schema::validate(schema, 3.0).valid;
    bool rejects_fraction = !argument_schema::validate(schema, 3.5).valid;
    argument_schema::ValidationResult negative = argument_schema::validate(schema, -1);
    bool rejects_negative = !negative.valid && negative.error_detail == "arguments: must be >= 0";
    bool success = accepts_integral_float && rejects_fraction && rejects_negative;

    if (success) {
        std::cout << "  OK: integer type and minimum enforced" << std::endl;
    } else {
        std::cout << "  FAIL: integer handling (integral float " << accepts_integral_float << ", fraction "
                  << rejects_fraction << ", negative " << rejects_negative << ")" << std::endl;
    }
    return success;
}

// Test: Values outside an enum are rejected.
static bool test_enum_rejects_unknown_value() {
    json schema = {{"type", "string"}, {"enum", {"portrait", "landscape"}}};
    bool success = argument_schema::validate(schema, "landscape").valid &&
                   !argument_schema::validate(schema, "sideways").valid;

    if (success) {
        std::cout << "  OK: enum restricts accepted values" << std::endl;
    } else {
        std::cout << "  FAIL: enum not enforced" << std::endl;
    }
    return success;
}

// Test: A union type accepts either member; item errors carry an index path.
static bool test_union_type_with_items() {
    json schema = {
        {"type", {"number", "array"}},
        {"minimum", 0},
        {"maximum", 10000},
        {"items", {{"type", "number"}, {"minimum", 0}, {"maximum", 10000}}},
    };
    bool accepts_number = argument_schema::validate(schema, 200).valid;
    bool accepts_array = argument_schema::validate(schema, json::array({100, 50, 100})).valid;
    argument_schema::ValidationResult bad_item = argument_schema::validate(schema, json::array({100, -1}));
    argument_schema::ValidationResult bad_type = argument_schema::validate(schema, "buzz");
    bool success = accepts_number && accepts_array && !bad_item.valid &&
                   bad_item.error_detail == "arguments[1]: must be >= 0" && !bad_type.valid &&
                   bad_type.error_detail == "arguments: expected number or array";

    if (success) {
        std::cout << "  OK: Union type and array items validated" << std::endl;
    } else {
        std::cout << "  FAIL: Union validation: '" << bad_item.error_detail << "', '" << bad_type.error_detail
                  << "'" << std::endl;
    }
    return success;
}

// Test: maximum is enforced.
static bool test_maximum() {
    json schema = {{"type", "number"}, {"maximum", 10000}};
    bool success = argument_schema::validate(schema, 10000).valid && !argument_schema::validate(schema, 10001).valid;

    if (success) {
        std::cout << "  OK: maximum enforced" << std::endl;
    } else {
        std::cout << "  FAIL: maximum not enforced" << std::endl;
    }
    return success;
}

// Test: minProperties rejects an empty object.
static bool test_min_properties() {
    json schema = {{"type", "object"}, {"minProperties", 1}};
    argument_schema::ValidationResult empty = argument_schema::validate(schema, json::object());
    bool success = !empty.valid && argument_schema::validate(schema, {{"text", "x"}}).valid;

    if (success) {
        std::cout << "  OK: minProperties enforced" << std::endl;
    } else {
        std::cout << "  FAIL: minProperties not enforced" << std::endl;
    }
    return success;
}

// Test: additionalProperties false rejects unknown keys; by default they pass.
static bool test_additional_properties() {
    json open_schema = text_schema();
    json closed_schema = text_schema();
    closed_schema["additionalProperties"] = false;
    json arguments = {{"text", "x"}, {"extra", 1}};

    argument_schema::ValidationResult closed = argument_schema::validate(closed_schema, arguments);
    bool success = argument_schema::validate(open_schema, arguments).valid && !closed.valid &&
                   closed.error_detail == "arguments.extra: unexpected property";

    if (success) {
        std::cout << "  OK: additionalProperties handled" << std::endl;
    } else {
        std::cout << "  FAIL: additionalProperties: " << closed.error_detail << std::endl;
    }
    return success;
}

// Test: Non-finite numbers are rejected.
static bool test_non_finite_number() {
    json schema = {{"type", "number"}};
    argument_schema::ValidationResult result = argument_schema::validate(schema, json(std::nan("")));
    bool success = !result.valid && result.error_detail == "arguments: expected a finite number";

    if (success) {
        std::cout << "  OK: NaN rejected" << std::endl;
    } else {
        std::cout << "  FAIL: NaN result: " << result.error_detail << std::endl;
    }
    return success;
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_valid_arguments_accepted();
    all_passed &= test_missing_required_property();
    all_passed &= test_wrong_property_type();
    all_passed &= test_non_object_arguments();
    all_passed &= test_empty_schema_accepts_anything();
    all_passed &= test_integer_type();
    all_passed &= test_enum_rejects_unknown_value();
    all_passed &= test_union_type_with_items();
    all_passed &= test_maximum();
    all_passed &= test_min_properties();
    all_passed &= test_additional_properties();
    all_passed &= test_non_finite_number();
    return all_passed;
}

} // namespace test_argument_schema
