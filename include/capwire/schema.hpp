#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace capwire {

/// A single reason a value does not match its schema.
struct SchemaViolation {
    std::string kind;     // error_kind::MissingParameter or error_kind::InvalidParams
    std::string message;
};

/// Structural checks over a JSON-Schema subset: `type` (string or list of
/// names), `required`, `properties`, `additionalProperties: false`, `items`
/// and `enum`. Other keywords are accepted and ignored.
class SchemaValidator {
public:
    /// Throws ConfigurationError{InvalidSchema} when `schema` is not a usable
    /// object schema.
    static void check_schema(const nlohmann::json& schema);

    /// Returns the first violation, reporting missing required fields before
    /// any other mismatch. std::nullopt means `value` conforms.
    [[nodiscard]] static std::optional<SchemaViolation> validate(const nlohmann::json& schema,
                                                                const nlohmann::json& value);
};

} // namespace capwire
