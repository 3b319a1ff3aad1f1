#pragma once
#include "authorization.hpp"
#include "json_rpc.hpp"
#include "middleware.hpp"
#include "registry.hpp"
#include "types.hpp"
#include "version.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace capwire {

using MethodHandler = std::function<nlohmann::json(const nlohmann::json& params, const CallContext& ctx)>;
using NotificationHandler = std::function<void(const nlohmann::json& params, const CallContext& ctx)>;

/// Routes requests through a method table and turns every outcome into
/// exactly one response.
///
/// Built-in methods: `initialize`, `ping`, `tools/list`, `resources/list`,
/// `prompts/list`, `tools/call`, `resources/read`, `prompts/get`. The
/// invocation methods resolve a registry entry, validate the arguments
/// against its schema, consult the authorizer (if any) and run the handler.
/// The registry is borrowed and must outlive the dispatcher.
class Dispatcher {
public:
    struct Options {
        Implementation server_info{"capwire", std::string(LIBRARY_VERSION)};
        std::size_t page_size = 50;
        std::string default_subject = "anonymous";
    };

    explicit Dispatcher(CapabilityRegistry& registry);
    Dispatcher(CapabilityRegistry& registry, Options opts);

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /// Add or replace a method in the table.
    void on_request(const std::string& method, MethodHandler handler);
    void on_notification(const std::string& method, NotificationHandler handler);

    void set_authorizer(std::shared_ptr<IAuthorizer> authorizer);

    /// Middleware runs in the order it was added.
    void use(std::shared_ptr<IMiddleware> middleware);

    [[nodiscard]] bool has_method(const std::string& method) const;

    /// Never throws for request content.
    [[nodiscard]] JsonRpcResponse dispatch(const JsonRpcRequest& request, const CallContext& ctx);

    /// Unknown notifications are ignored; handler failures are logged.
    void handle_notification(const JsonRpcNotification& notification, const CallContext& ctx);

    [[nodiscard]] CapabilityRegistry& registry() noexcept { return registry_; }
    [[nodiscard]] const Options& options() const noexcept { return opts_; }

private:
    void setup_handlers();

    nlohmann::json list(Category category, const char* key, const nlohmann::json& params) const;
    nlohmann::json invoke(Category category, const std::string& method, const nlohmann::json& params,
                          const CallContext& ctx);
    void authorize(const CapabilityEntry& entry, const std::string& method,
                   const nlohmann::json& params, const CallContext& ctx);

    CapabilityRegistry& registry_;
    Options opts_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, MethodHandler> request_handlers_;
    std::unordered_map<std::string, NotificationHandler> notification_handlers_;
    std::shared_ptr<IAuthorizer> authorizer_;
    std::vector<std::shared_ptr<IMiddleware>> middleware_;
};

} // namespace capwire
