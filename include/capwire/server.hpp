#pragma once
#include "authorization.hpp"
#include "middleware.hpp"
#include "monitoring.hpp"
#include "registry.hpp"
#include "transport/transport.hpp"
#include "types.hpp"
#include "version.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace capwire {

class Dispatcher;

/// Serves a capability registry over any transport binding.
class Server {
public:
    struct Options {
        Implementation server_info{"capwire", std::string(LIBRARY_VERSION)};
        std::size_t worker_threads = 4;
        std::size_t page_size = 50;
        /// Subject used for authorization when a request names none.
        std::optional<std::string> default_subject;
        /// One deadline shared by every live session on shutdown().
        std::chrono::milliseconds shutdown_grace{5000};
        /// Install a MetricsMiddleware feeding monitor().
        bool collect_metrics = true;
    };

    Server();
    explicit Server(Options opts);
    ~Server();

    // Non-copyable, non-movable
    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // ---- Registration ----
    void add_tool(ToolDefinition def, ToolHandler handler);
    void add_resource(ResourceDefinition def, ResourceReadHandler handler);
    void add_prompt(PromptDefinition def, PromptGetHandler handler);

    bool remove_tool(const std::string& name);
    bool remove_resource(const std::string& uri);
    bool remove_prompt(const std::string& name);

    [[nodiscard]] CapabilityRegistry& registry();
    [[nodiscard]] Dispatcher& dispatcher();

    // ---- Policy ----
    void set_authorizer(std::shared_ptr<IAuthorizer> authorizer);
    void use(std::shared_ptr<IMiddleware> middleware);

    // ---- Serving ----

    /// Run one session over `transport`; returns when the peer disconnects
    /// or shutdown() is called.
    void serve(std::unique_ptr<ITransport> transport);
    void serve(const TransportConfig& config);

    void serve_stdio();

    /// One POST per frame on `host:port` at /mcp. Blocks until shutdown().
    void serve_http(const std::string& host, uint16_t port);

    /// One session per accepted WebSocket connection. Blocks until
    /// shutdown() and until every connection's session has ended.
    void serve_websocket(const std::string& host, uint16_t port);

    /// Stop listeners and shut every live session down gracefully.
    void shutdown();

    [[nodiscard]] bool is_running() const;

    // ---- Monitoring ----
    void add_health_check(std::shared_ptr<IHealthCheck> check);
    [[nodiscard]] HealthReport health() const;

    /// Request counters (when collect_metrics is on) and live sessions.
    [[nodiscard]] PerformanceMetrics metrics() const;
    [[nodiscard]] std::shared_ptr<Monitor> monitor() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace capwire
