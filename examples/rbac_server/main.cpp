/// Role-based access control over WebSocket.
/// Usage: ./capwire_rbac_server [port]
///
/// Subjects are mapped to roles, roles to "<category>:<name>" permissions.
/// Clients name themselves with `params.auth.subject_id`; anonymous callers
/// may only read the public resource.

#include <capwire/capwire.hpp>
#include <set>

namespace {

class RoleAuthorizer : public capwire::IAuthorizer {
public:
    void add_role(const std::string& role, std::set<std::string> permissions) {
        roles_[role] = std::move(permissions);
    }

    void assign(const std::string& subject, const std::string& role) {
        subjects_[subject].insert(role);
    }

    bool check(const std::string& subject_id, capwire::Category category, const std::string& name,
               const std::map<std::string, std::string>& context) override {
        auto permission = std::string(capwire::to_string(category)) + ":" + name;
        auto subject = subjects_.find(subject_id);
        if (subject == subjects_.end()) return false;
        for (const auto& role : subject->second) {
            auto it = roles_.find(role);
            if (it == roles_.end()) continue;
            if (it->second.count(permission) || it->second.count(std::string(capwire::to_string(category)) + ":*")) {
                capwire::logger()->debug("{} granted {} via {} ({})", subject_id, permission, role,
                                         context.count("method") ? context.at("method") : "?");
                return true;
            }
        }
        return false;
    }

private:
    std::map<std::string, std::set<std::string>> roles_;
    std::map<std::string, std::set<std::string>> subjects_;
};

/// Degraded once more than `limit` clients are connected.
class ConnectionLoadCheck : public capwire::IHealthCheck {
public:
    ConnectionLoadCheck(std::shared_ptr<capwire::Monitor> monitor, uint64_t limit)
        : monitor_(std::move(monitor)), limit_(limit) {}

    std::string name() const override { return "connections"; }

    capwire::HealthCheckResult check() override {
        capwire::HealthCheckResult result;
        auto active = monitor_->metrics().active_connections;
        result.status = active > limit_ ? capwire::HealthStatus::Degraded : capwire::HealthStatus::Healthy;
        result.message = std::to_string(active) + " connected";
        return result;
    }

private:
    std::shared_ptr<capwire::Monitor> monitor_;
    uint64_t limit_;
};

} // namespace

int main(int argc, char* argv[]) {
    uint16_t port = argc > 1 ? static_cast<uint16_t>(std::stoi(argv[1])) : 8765;

    capwire::Server::Options opts;
    opts.server_info = {"rbac-server", "1.0.0"};
    opts.default_subject = "anonymous";
    capwire::Server server{std::move(opts)};

    auto authorizer = std::make_shared<RoleAuthorizer>();
    authorizer->add_role("guest", {"resource:doc://public"});
    authorizer->add_role("user", {"resource:*", "tool:add"});
    authorizer->add_role("admin", {"resource:*", "tool:*"});
    authorizer->assign("anonymous", "guest");
    authorizer->assign("alice", "user");
    authorizer->assign("root", "admin");
    server.set_authorizer(authorizer);

    server.add_health_check(std::make_shared<ConnectionLoadCheck>(server.monitor(), 32));
    server.use(std::make_shared<capwire::LoggingMiddleware>());
    server.use(std::make_shared<capwire::RateLimitMiddleware>(100, std::chrono::seconds(1)));

    capwire::ToolDefinition add;
    add.name = "add";
    add.description = "Add two numbers";
    add.input_schema = {
        {"type", "object"},
        {"properties", {{"a", {{"type", "number"}}}, {"b", {{"type", "number"}}}}},
        {"required", {"a", "b"}}
    };
    server.add_tool(add, [](const nlohmann::json& args) -> capwire::CallToolResult {
        double sum = args.at("a").get<double>() + args.at("b").get<double>();
        capwire::CallToolResult result;
        result.content.push_back(capwire::TextContent{nlohmann::json(sum).dump()});
        return result;
    });

    capwire::ToolDefinition purge;
    purge.name = "purge";
    purge.description = "Administrative reset";
    server.add_tool(purge, [](const nlohmann::json&) -> capwire::CallToolResult {
        capwire::CallToolResult result;
        result.content.push_back(capwire::TextContent{"purged"});
        return result;
    });

    capwire::ToolDefinition status;
    status.name = "status";
    status.description = "Health report and request metrics";
    server.add_tool(status, [&server](const nlohmann::json&) -> capwire::CallToolResult {
        nlohmann::json health;
        nlohmann::json metrics;
        capwire::to_json(health, server.health());
        capwire::to_json(metrics, server.metrics());
        capwire::CallToolResult result;
        result.content.push_back(capwire::TextContent{nlohmann::json{{"health", health}, {"metrics", metrics}}.dump()});
        return result;
    });

    for (const char* uri : {"doc://public", "doc://internal"}) {
        capwire::ResourceDefinition def;
        def.uri = uri;
        def.name = uri;
        def.mime_type = "text/plain";
        server.add_resource(def, [](const std::string& u) -> std::vector<capwire::ResourceContent> {
            return {capwire::ResourceContent{u, "text/plain", "contents of " + u, std::nullopt}};
        });
    }

    try {
        server.serve_websocket("127.0.0.1", port);
    } catch (const capwire::Error& e) {
        capwire::logger()->critical("server failed: {}", e.what());
        return 1;
    }
    return 0;
}
