#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolwire::schema {

// Validator for the JSON Schema subset used in tool input/output schemas:
// - type (string or array of strings)
// - properties, required, additionalProperties (bool or schema)
// - items, minItems, maxItems
// - enum, const
// - minimum, maximum, exclusiveMinimum, exclusiveMaximum
// - minLength, maxLength, pattern
// - allOf, anyOf, oneOf
// Unknown keywords are ignored.

/// Strings longer than this fail a `pattern` check without being matched.
constexpr std::size_t MAX_PATTERN_INPUT_BYTES = 4096;

/// Return every violation as "<json-pointer>: <message>". Empty means valid.
[[nodiscard]] std::vector<std::string> collect_errors(const nlohmann::json& schema,
                                                      const nlohmann::json& instance);

/// Throws ValidationError listing all violations.
void validate(const nlohmann::json& schema, const nlohmann::json& instance);

/// Throws std::invalid_argument if `schema` is not usable as a schema,
/// including any `pattern` that does not compile. Nested schemas are checked.
void check_schema(const nlohmann::json& schema);

} // namespace toolwire::schema
