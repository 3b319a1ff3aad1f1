#include "capwire/schema.hpp"
#include "capwire/error.hpp"
#include <algorithm>
#include <array>

namespace capwire {

namespace {

constexpr std::array<const char*, 7> kTypeNames = {
    "object", "array", "string", "number", "integer", "boolean", "null"
};

bool is_type_name(const std::string& name) {
    return std::any_of(kTypeNames.begin(), kTypeNames.end(),
                       [&name](const char* t) { return name == t; });
}

bool matches_type(const std::string& type, const nlohmann::json& value) {
    if (type == "object")  return value.is_object();
    if (type == "array")   return value.is_array();
    if (type == "string")  return value.is_string();
    if (type == "number")  return value.is_number();
    if (type == "integer") return value.is_number_integer();
    if (type == "boolean") return value.is_boolean();
    if (type == "null")    return value.is_null();
    return false;
}

const char* type_of(const nlohmann::json& value) {
    if (value.is_number_integer()) return "integer";
    return value.type_name();
}

std::string at(const std::string& path) {
    return path.empty() ? "parameters" : "'" + path + "'";
}

void check_node(const nlohmann::json& node, const std::string& path) {
    auto invalid = [&path](const std::string& msg) {
        throw ConfigurationError(ConfigurationError::Kind::InvalidSchema,
                                 "Invalid schema" + (path.empty() ? std::string() : " at " + path)
                                 + ": " + msg);
    };

    if (!node.is_object()) invalid("schema must be an object");

    if (auto it = node.find("type"); it != node.end()) {
        if (it->is_string()) {
            if (!is_type_name(it->get<std::string>())) invalid("unknown type '" + it->get<std::string>() + "'");
        } else if (it->is_array()) {
            for (const auto& t : *it) {
                if (!t.is_string() || !is_type_name(t.get<std::string>())) invalid("bad entry in 'type'");
            }
        } else {
            invalid("'type' must be a string or an array");
        }
    }
    if (auto it = node.find("required"); it != node.end()) {
        if (!it->is_array()) invalid("'required' must be an array");
        for (const auto& r : *it) {
            if (!r.is_string()) invalid("'required' entries must be strings");
        }
    }
    if (auto it = node.find("properties"); it != node.end()) {
        if (!it->is_object()) invalid("'properties' must be an object");
        for (const auto& [name, sub] : it->items()) {
            check_node(sub, path.empty() ? name : path + "." + name);
        }
    }
    if (auto it = node.find("items"); it != node.end()) {
        check_node(*it, path + "[]");
    }
    if (auto it = node.find("enum"); it != node.end() && !it->is_array()) {
        invalid("'enum' must be an array");
    }
}

std::optional<SchemaViolation> validate_node(const nlohmann::json& schema,
                                             const nlohmann::json& value,
                                             const std::string& path) {
    if (auto it = schema.find("type"); it != schema.end()) {
        bool ok = false;
        if (it->is_string()) {
            ok = matches_type(it->get<std::string>(), value);
        } else {
            for (const auto& t : *it) ok = ok || matches_type(t.get<std::string>(), value);
        }
        if (!ok) {
            return SchemaViolation{std::string(error_kind::InvalidParams),
                                   at(path) + " must be of type " + it->dump()
                                   + ", got " + type_of(value)};
        }
    }

    if (auto it = schema.find("enum"); it != schema.end()) {
        if (std::find(it->begin(), it->end(), value) == it->end()) {
            return SchemaViolation{std::string(error_kind::InvalidParams),
                                   at(path) + " must be one of " + it->dump()};
        }
    }

    if (value.is_object()) {
        if (auto it = schema.find("required"); it != schema.end()) {
            for (const auto& r : *it) {
                const auto name = r.get<std::string>();
                if (!value.contains(name)) {
                    return SchemaViolation{std::string(error_kind::MissingParameter),
                                           "Missing required parameter '"
                                           + (path.empty() ? name : path + "." + name) + "'"};
                }
            }
        }

        auto props = schema.find("properties");
        bool closed = schema.contains("additionalProperties")
                      && schema.at("additionalProperties") == false;
        for (const auto& [name, member] : value.items()) {
            std::string member_path = path.empty() ? name : path + "." + name;
            if (props != schema.end() && props->contains(name)) {
                if (auto v = validate_node(props->at(name), member, member_path)) return v;
            } else if (closed) {
                return SchemaViolation{std::string(error_kind::InvalidParams),
                                       "Unknown parameter '" + member_path + "'"};
            }
        }
    }

    if (value.is_array()) {
        if (auto it = schema.find("items"); it != schema.end()) {
            for (std::size_t i = 0; i < value.size(); ++i) {
                if (auto v = validate_node(*it, value[i], path + "[" + std::to_string(i) + "]")) return v;
            }
        }
    }
    return std::nullopt;
}

} // namespace

void SchemaValidator::check_schema(const nlohmann::json& schema) {
    check_node(schema, "");
    auto it = schema.find("type");
    if (it != schema.end() && !(it->is_string() && it->get<std::string>() == "object")) {
        throw ConfigurationError(ConfigurationError::Kind::InvalidSchema,
                                 "Invalid schema: parameters must be declared with type \"object\"");
    }
}

std::optional<SchemaViolation> SchemaValidator::validate(const nlohmann::json& schema,
                                                         const nlohmann::json& value) {
    return validate_node(schema, value, "");
}

} // namespace capwire
