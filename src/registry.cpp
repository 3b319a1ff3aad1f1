#include "capwire/registry.hpp"
#include "capwire/error.hpp"
#include "capwire/schema.hpp"
#include <algorithm>
#include <stdexcept>

namespace capwire {

std::string_view to_string(Category category) {
    switch (category) {
        case Category::Tool:     return "tool";
        case Category::Resource: return "resource";
        case Category::Prompt:   return "prompt";
    }
    return "unknown";
}

namespace {

bool handler_matches(Category category, const CapabilityHandler& handler) {
    switch (category) {
        case Category::Tool: {
            auto* h = std::get_if<ToolHandler>(&handler);
            return h && *h;
        }
        case Category::Resource: {
            auto* h = std::get_if<ResourceReadHandler>(&handler);
            return h && *h;
        }
        case Category::Prompt: {
            auto* h = std::get_if<PromptGetHandler>(&handler);
            return h && *h;
        }
    }
    return false;
}

nlohmann::json resource_schema() {
    return {
        {"type", "object"},
        {"properties", {{"uri", {{"type", "string"}}}}},
        {"required", {"uri"}}
    };
}

nlohmann::json prompt_schema(const std::vector<PromptArgument>& args) {
    nlohmann::json props = nlohmann::json::object();
    nlohmann::json required = nlohmann::json::array();
    for (const auto& a : args) {
        props[a.name] = {{"type", "string"}};
        if (a.required) required.push_back(a.name);
    }
    nlohmann::json schema = {{"type", "object"}, {"properties", props}};
    if (!required.empty()) schema["required"] = required;
    return schema;
}

std::vector<PromptArgument> prompt_arguments(const nlohmann::json& schema) {
    std::vector<PromptArgument> args;
    auto props = schema.find("properties");
    if (props == schema.end()) return args;
    auto required = schema.value("required", nlohmann::json::array());
    for (const auto& [name, sub] : props->items()) {
        PromptArgument a;
        a.name = name;
        if (sub.contains("description")) a.description = sub.at("description").get<std::string>();
        a.required = std::find(required.begin(), required.end(), name) != required.end();
        args.push_back(std::move(a));
    }
    return args;
}

nlohmann::json make_descriptor(const CapabilityEntry& e) {
    nlohmann::json j;
    switch (e.category) {
        case Category::Tool:
            to_json(j, ToolDefinition{e.name, e.description, e.schema});
            break;
        case Category::Resource:
            to_json(j, ResourceDefinition{e.name, e.name, e.description, std::nullopt});
            break;
        case Category::Prompt:
            to_json(j, PromptDefinition{e.name, e.description, prompt_arguments(e.schema)});
            break;
    }
    return j;
}

} // namespace

CapabilityRegistry::Bucket& CapabilityRegistry::bucket(Category category) {
    switch (category) {
        case Category::Tool:     return tools_;
        case Category::Resource: return resources_;
        case Category::Prompt:   break;
    }
    return prompts_;
}

const CapabilityRegistry::Bucket& CapabilityRegistry::bucket(Category category) const {
    return const_cast<CapabilityRegistry*>(this)->bucket(category);
}

void CapabilityRegistry::add(CapabilityEntry entry) {
    if (entry.name.empty()) {
        throw ConfigurationError(ConfigurationError::Kind::InvalidHandler,
                                 std::string("Empty ") + std::string(to_string(entry.category)) + " name");
    }
    if (!handler_matches(entry.category, entry.handler)) {
        throw ConfigurationError(ConfigurationError::Kind::InvalidHandler,
                                 "Handler for " + std::string(to_string(entry.category)) + " '"
                                 + entry.name + "' is empty or of the wrong kind");
    }
    SchemaValidator::check_schema(entry.schema);
    if (entry.descriptor.is_null()) entry.descriptor = make_descriptor(entry);

    std::lock_guard<std::mutex> lock(mutex_);
    auto& b = bucket(entry.category);
    if (b.index.count(entry.name) > 0) {
        throw ConfigurationError(ConfigurationError::Kind::DuplicateName,
                                 std::string(to_string(entry.category)) + " '" + entry.name
                                 + "' is already registered");
    }
    b.index.emplace(entry.name, b.entries.size());
    b.entries.push_back(std::move(entry));
}

void CapabilityRegistry::add(Category category, const std::string& name, nlohmann::json schema,
                             CapabilityHandler handler, std::optional<std::string> description) {
    CapabilityEntry entry;
    entry.category = category;
    entry.name = name;
    entry.description = std::move(description);
    entry.schema = std::move(schema);
    entry.handler = std::move(handler);
    add(std::move(entry));
}

void CapabilityRegistry::add_tool(ToolDefinition def, ToolHandler handler) {
    CapabilityEntry entry;
    entry.category = Category::Tool;
    entry.name = def.name;
    entry.description = def.description;
    entry.schema = def.input_schema;
    to_json(entry.descriptor, def);
    entry.handler = std::move(handler);
    add(std::move(entry));
}

void CapabilityRegistry::add_resource(ResourceDefinition def, ResourceReadHandler handler) {
    CapabilityEntry entry;
    entry.category = Category::Resource;
    entry.name = def.uri;
    entry.description = def.description;
    entry.schema = resource_schema();
    to_json(entry.descriptor, def);
    entry.handler = std::move(handler);
    add(std::move(entry));
}

void CapabilityRegistry::add_prompt(PromptDefinition def, PromptGetHandler handler) {
    CapabilityEntry entry;
    entry.category = Category::Prompt;
    entry.name = def.name;
    entry.description = def.description;
    entry.schema = prompt_schema(def.arguments);
    to_json(entry.descriptor, def);
    entry.handler = std::move(handler);
    add(std::move(entry));
}

bool CapabilityRegistry::remove(Category category, const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& b = bucket(category);
    auto it = b.index.find(name);
    if (it == b.index.end()) return false;

    b.entries.erase(b.entries.begin() + static_cast<std::ptrdiff_t>(it->second));
    b.index.clear();
    for (std::size_t i = 0; i < b.entries.size(); ++i) b.index.emplace(b.entries[i].name, i);
    return true;
}

std::optional<CapabilityEntry> CapabilityRegistry::resolve(Category category,
                                                           const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& b = bucket(category);
    auto it = b.index.find(name);
    if (it == b.index.end()) return std::nullopt;
    return b.entries[it->second];
}

std::vector<CapabilityEntry> CapabilityRegistry::list(Category category) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bucket(category).entries;
}

std::pair<std::vector<CapabilityEntry>, std::optional<std::string>>
CapabilityRegistry::page(Category category, const std::optional<std::string>& cursor,
                         std::size_t page_size) const {
    std::size_t start = 0;
    if (cursor) {
        std::size_t consumed = 0;
        start = std::stoull(*cursor, &consumed);
        if (consumed != cursor->size()) throw std::invalid_argument("Invalid cursor: " + *cursor);
    }
    if (page_size == 0) page_size = 1;

    std::lock_guard<std::mutex> lock(mutex_);
    const auto& items = bucket(category).entries;
    if (start >= items.size()) return {{}, std::nullopt};

    std::size_t end = std::min(start + page_size, items.size());
    std::vector<CapabilityEntry> page_items(items.begin() + static_cast<std::ptrdiff_t>(start),
                                            items.begin() + static_cast<std::ptrdiff_t>(end));
    std::optional<std::string> next;
    if (end < items.size()) next = std::to_string(end);
    return {std::move(page_items), next};
}

std::size_t CapabilityRegistry::size(Category category) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bucket(category).entries.size();
}

} // namespace capwire
