#pragma once
#include "types.hpp"
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace capwire {

enum class Category { Tool, Resource, Prompt };

std::string_view to_string(Category category);

using ToolHandler = std::function<CallToolResult(const nlohmann::json& arguments)>;
using ResourceReadHandler = std::function<std::vector<ResourceContent>(const std::string& uri)>;
using PromptGetHandler = std::function<GetPromptResult(const std::string& name,
                                                        const nlohmann::json& arguments)>;

using CapabilityHandler = std::variant<ToolHandler, ResourceReadHandler, PromptGetHandler>;

/// One registered capability.
///
/// `schema` describes the value handed to the handler: the tool's
/// `arguments`, the prompt's `arguments`, or the `resources/read` params.
/// `descriptor` is the item returned by discovery.
struct CapabilityEntry {
    Category category = Category::Tool;
    std::string name;   // resource entries are named by URI
    std::optional<std::string> description;
    nlohmann::json schema = nlohmann::json{{"type", "object"}};
    nlohmann::json descriptor;
    CapabilityHandler handler;
};

/// Named handlers for tools, resources and prompts. Names are unique per
/// category and entries keep registration order. Safe for concurrent use.
class CapabilityRegistry {
public:
    /// Register an entry; an empty descriptor is generated from the other
    /// fields. Throws ConfigurationError{DuplicateName | InvalidSchema |
    /// InvalidHandler}.
    void add(CapabilityEntry entry);

    void add(Category category, const std::string& name, nlohmann::json schema,
             CapabilityHandler handler, std::optional<std::string> description = std::nullopt);

    void add_tool(ToolDefinition def, ToolHandler handler);
    void add_resource(ResourceDefinition def, ResourceReadHandler handler);

    /// The argument schema is derived from the declared prompt arguments.
    void add_prompt(PromptDefinition def, PromptGetHandler handler);

    bool remove(Category category, const std::string& name);

    [[nodiscard]] std::optional<CapabilityEntry> resolve(Category category,
                                                         const std::string& name) const;

    /// All entries of a category in registration order.
    [[nodiscard]] std::vector<CapabilityEntry> list(Category category) const;

    /// One page of `list(category)`. The cursor is the opaque string from
    /// the previous page; throws std::invalid_argument for a malformed one.
    [[nodiscard]] std::pair<std::vector<CapabilityEntry>, std::optional<std::string>>
    page(Category category, const std::optional<std::string>& cursor,
         std::size_t page_size = 50) const;

    [[nodiscard]] std::size_t size(Category category) const;

private:
    struct Bucket {
        std::vector<CapabilityEntry> entries;
        std::map<std::string, std::size_t> index;
    };

    Bucket& bucket(Category category);
    const Bucket& bucket(Category category) const;

    mutable std::mutex mutex_;
    Bucket tools_;
    Bucket resources_;
    Bucket prompts_;
};

} // namespace capwire
