/// Echo server: minimal capwire server demonstrating registration.
/// Usage: ./capwire_echo_server
/// Communicates over stdio (newline-delimited JSON-RPC); logs go to stderr.

#include <capwire/capwire.hpp>

int main() {
    capwire::Server::Options opts;
    opts.server_info = {"echo-server", "1.0.0"};

    capwire::Server server{std::move(opts)};

    capwire::ToolDefinition echo_tool;
    echo_tool.name = "echo";
    echo_tool.description = "Echo the input text back to the caller";
    echo_tool.input_schema = {
        {"type", "object"},
        {"properties", {
            {"text", {{"type", "string"}, {"description", "The text to echo"}}}
        }},
        {"required", {"text"}}
    };
    server.add_tool(echo_tool, [](const nlohmann::json& args) -> capwire::CallToolResult {
        capwire::CallToolResult result;
        result.content.push_back(capwire::TextContent{"Echo: " + args.at("text").get<std::string>()});
        return result;
    });

    capwire::ToolDefinition check_url;
    check_url.name = "check_url";
    check_url.description = "Validate an http(s) URL";
    check_url.input_schema = {
        {"type", "object"},
        {"properties", {{"url", {{"type", "string"}}}}},
        {"required", {"url"}}
    };
    server.add_tool(check_url, [](const nlohmann::json& args) -> capwire::CallToolResult {
        auto url = args.at("url").get<std::string>();
        if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) {
            throw capwire::HandlerError("invalid_url", "URL must start with http:// or https://",
                                        capwire::error::InvalidParams, nlohmann::json{{"url", url}});
        }
        capwire::CallToolResult result;
        result.content.push_back(capwire::TextContent{"ok"});
        return result;
    });

    capwire::ResourceDefinition greeting;
    greeting.uri = "memo://greeting";
    greeting.name = "Greeting";
    greeting.mime_type = "text/plain";
    server.add_resource(greeting, [](const std::string& uri) -> std::vector<capwire::ResourceContent> {
        return {capwire::ResourceContent{uri, "text/plain", std::string("Hello from capwire"), std::nullopt}};
    });

    // Serve over stdio; blocks until stdin closes
    server.serve_stdio();
    return 0;
}
