#pragma once
#include "dispatcher.hpp"
#include "json_rpc.hpp"
#include "transport/transport.hpp"
#include "types.hpp"
#include "version.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace capwire {

/// Typed calls against a capability server. Any error response is thrown
/// as DispatchError carrying the server's code and kind.
class Client {
public:
    struct Options {
        Implementation client_info{"capwire-client", std::string(LIBRARY_VERSION)};
        std::chrono::milliseconds request_timeout{30000};
        /// Sent as `params.auth.subject_id` on invocation calls.
        std::optional<std::string> subject_id;
    };

    Client();
    explicit Client(Options opts);
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // ---- Connection ----
    void connect(std::unique_ptr<ITransport> transport);
    void connect(const TransportConfig& config);
    void connect_stdio(const std::string& command,
                       const std::vector<std::string>& args = {});
    void connect_http(const std::string& url);
    void connect_websocket(const std::string& url);
    void disconnect();
    [[nodiscard]] bool is_connected() const;

    // ---- Protocol ----
    /// Performs the handshake and sends `notifications/initialized`.
    [[nodiscard]] InitializeResult initialize();
    void ping();

    [[nodiscard]] PaginatedResult<ToolDefinition> list_tools(std::optional<std::string> cursor = std::nullopt);
    [[nodiscard]] CallToolResult call_tool(const std::string& name,
                                           const nlohmann::json& arguments = nlohmann::json::object());

    [[nodiscard]] PaginatedResult<ResourceDefinition> list_resources(std::optional<std::string> cursor = std::nullopt);
    [[nodiscard]] std::vector<ResourceContent> read_resource(const std::string& uri);

    [[nodiscard]] PaginatedResult<PromptDefinition> list_prompts(std::optional<std::string> cursor = std::nullopt);
    [[nodiscard]] GetPromptResult get_prompt(const std::string& name,
                                             const nlohmann::json& arguments = nlohmann::json::object());

    /// Raw request; error responses are returned, not thrown.
    [[nodiscard]] JsonRpcResponse call(const std::string& method,
                                       std::optional<nlohmann::json> params = std::nullopt);

    void notify(const std::string& method, std::optional<nlohmann::json> params = std::nullopt);

    /// Handle server-originated notifications.
    void on_notification(const std::string& method, NotificationHandler handler);

    [[nodiscard]] TransportStats transport_stats() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace capwire
