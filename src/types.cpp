#include "capwire/types.hpp"
#include <stdexcept>

namespace capwire {

namespace {

template <typename T>
void put_optional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value) j[key] = *value;
}

// Absent and null both read as "not set".
template <typename T>
void get_optional(const nlohmann::json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        out.reset();
        return;
    }
    out = it->template get<T>();
}

nlohmann::json content_array(const std::vector<Content>& items) {
    auto arr = nlohmann::json::array();
    for (const auto& item : items) {
        nlohmann::json cj;
        to_json(cj, item);
        arr.push_back(std::move(cj));
    }
    return arr;
}

} // namespace

void to_json(nlohmann::json& j, const TextContent& t) {
    j = nlohmann::json::object();
    j["type"] = "text";
    j["text"] = t.text;
}

void from_json(const nlohmann::json& j, TextContent& t) {
    j.at("text").get_to(t.text);
}

void to_json(nlohmann::json& j, const ImageContent& t) {
    j = nlohmann::json::object();
    j["type"] = "image";
    j["data"] = t.data;
    j["mimeType"] = t.mime_type;
}

void from_json(const nlohmann::json& j, ImageContent& t) {
    j.at("data").get_to(t.data);
    j.at("mimeType").get_to(t.mime_type);
}

void to_json(nlohmann::json& j, const EmbeddedResource& t) {
    nlohmann::json inner = nlohmann::json::object();
    inner["uri"] = t.uri;
    put_optional(inner, "mimeType", t.mime_type);
    put_optional(inner, "text", t.text);
    put_optional(inner, "blob", t.blob);
    j = nlohmann::json::object();
    j["type"] = "resource";
    j["resource"] = std::move(inner);
}

void from_json(const nlohmann::json& j, EmbeddedResource& t) {
    const auto& inner = j.at("resource");
    inner.at("uri").get_to(t.uri);
    get_optional(inner, "mimeType", t.mime_type);
    get_optional(inner, "text", t.text);
    get_optional(inner, "blob", t.blob);
}

void to_json(nlohmann::json& j, const Content& c) {
    std::visit([&j](const auto& item) { to_json(j, item); }, c);
}

void from_json(const nlohmann::json& j, Content& c) {
    auto type = j.at("type").get<std::string>();
    if (type == "text") {
        c = j.get<TextContent>();
    } else if (type == "image") {
        c = j.get<ImageContent>();
    } else if (type == "resource") {
        c = j.get<EmbeddedResource>();
    } else {
        throw std::invalid_argument("unsupported content type '" + type + "'");
    }
}

void to_json(nlohmann::json& j, const ToolDefinition& t) {
    j = nlohmann::json::object();
    j["name"] = t.name;
    put_optional(j, "description", t.description);
    j["inputSchema"] = t.input_schema;
}

void from_json(const nlohmann::json& j, ToolDefinition& t) {
    j.at("name").get_to(t.name);
    get_optional(j, "description", t.description);
    t.input_schema = j.value("inputSchema", nlohmann::json{{"type", "object"}});
}

void to_json(nlohmann::json& j, const CallToolResult& t) {
    j = nlohmann::json::object();
    j["content"] = content_array(t.content);
    if (t.is_error) j["isError"] = true;
}

void from_json(const nlohmann::json& j, CallToolResult& t) {
    t.content.clear();
    auto it = j.find("content");
    if (it != j.end()) {
        for (const auto& cj : *it) t.content.push_back(cj.get<Content>());
    }
    t.is_error = j.value("isError", false);
}

void to_json(nlohmann::json& j, const ResourceDefinition& t) {
    j = nlohmann::json::object();
    j["uri"] = t.uri;
    j["name"] = t.name;
    put_optional(j, "description", t.description);
    put_optional(j, "mimeType", t.mime_type);
}

void from_json(const nlohmann::json& j, ResourceDefinition& t) {
    j.at("uri").get_to(t.uri);
    j.at("name").get_to(t.name);
    get_optional(j, "description", t.description);
    get_optional(j, "mimeType", t.mime_type);
}

void to_json(nlohmann::json& j, const ResourceContent& t) {
    j = nlohmann::json::object();
    j["uri"] = t.uri;
    put_optional(j, "mimeType", t.mime_type);
    put_optional(j, "text", t.text);
    put_optional(j, "blob", t.blob);
}

void from_json(const nlohmann::json& j, ResourceContent& t) {
    j.at("uri").get_to(t.uri);
    get_optional(j, "mimeType", t.mime_type);
    get_optional(j, "text", t.text);
    get_optional(j, "blob", t.blob);
}

void to_json(nlohmann::json& j, const PromptArgument& t) {
    j = nlohmann::json::object();
    j["name"] = t.name;
    put_optional(j, "description", t.description);
    j["required"] = t.required;
}

void from_json(const nlohmann::json& j, PromptArgument& t) {
    j.at("name").get_to(t.name);
    get_optional(j, "description", t.description);
    t.required = j.value("required", false);
}

void to_json(nlohmann::json& j, const PromptDefinition& t) {
    j = nlohmann::json::object();
    j["name"] = t.name;
    put_optional(j, "description", t.description);
    j["arguments"] = t.arguments;
}

void from_json(const nlohmann::json& j, PromptDefinition& t) {
    j.at("name").get_to(t.name);
    get_optional(j, "description", t.description);
    t.arguments = j.value("arguments", std::vector<PromptArgument>{});
}

void to_json(nlohmann::json& j, const PromptMessage& t) {
    j = nlohmann::json::object();
    j["role"] = t.role;
    to_json(j["content"], t.content);
}

void from_json(const nlohmann::json& j, PromptMessage& t) {
    j.at("role").get_to(t.role);
    from_json(j.at("content"), t.content);
}

void to_json(nlohmann::json& j, const GetPromptResult& t) {
    j = nlohmann::json::object();
    put_optional(j, "description", t.description);
    j["messages"] = t.messages;
}

void from_json(const nlohmann::json& j, GetPromptResult& t) {
    get_optional(j, "description", t.description);
    j.at("messages").get_to(t.messages);
}

// An absent capability means the server does not offer that category.
void to_json(nlohmann::json& j, const ServerCapabilities& t) {
    j = nlohmann::json::object();
    put_optional(j, "tools", t.tools);
    put_optional(j, "resources", t.resources);
    put_optional(j, "prompts", t.prompts);
}

void from_json(const nlohmann::json& j, ServerCapabilities& t) {
    get_optional(j, "tools", t.tools);
    get_optional(j, "resources", t.resources);
    get_optional(j, "prompts", t.prompts);
}

void to_json(nlohmann::json& j, const Implementation& t) {
    j = nlohmann::json::object();
    j["name"] = t.name;
    j["version"] = t.version;
}

void from_json(const nlohmann::json& j, Implementation& t) {
    j.at("name").get_to(t.name);
    j.at("version").get_to(t.version);
}

void to_json(nlohmann::json& j, const InitializeResult& t) {
    j = nlohmann::json::object();
    j["protocolVersion"] = t.protocol_version;
    j["capabilities"] = t.capabilities;
    j["serverInfo"] = t.server_info;
}

void from_json(const nlohmann::json& j, InitializeResult& t) {
    j.at("protocolVersion").get_to(t.protocol_version);
    j.at("capabilities").get_to(t.capabilities);
    j.at("serverInfo").get_to(t.server_info);
}

} // namespace capwire
