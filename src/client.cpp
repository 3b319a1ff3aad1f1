#include "capwire/client.hpp"
#include "capwire/error.hpp"
#include "capwire/log.hpp"
#include "capwire/session.hpp"
#include "capwire/transport/http_transport.hpp"
#include "capwire/transport/stream_transport.hpp"
#include "capwire/transport/websocket_transport.hpp"

#include <mutex>

namespace capwire {

struct Client::Impl {
    Options opts;
    // Answers server-originated requests such as ping.
    CapabilityRegistry registry;
    Dispatcher dispatcher{registry};

    mutable std::mutex mutex;
    std::unique_ptr<Session> session;

    explicit Impl(Options o) : opts(std::move(o)) {}

    Session& live_session() const {
        std::lock_guard<std::mutex> lock(mutex);
        if (!session) throw TransportError(TransportError::Kind::NotReady, "Client is not connected");
        return *session;
    }

    nlohmann::json request(const std::string& method, nlohmann::json params) {
        auto resp = live_session().request(method, std::move(params), opts.request_timeout);
        if (resp.error) {
            throw DispatchError(resp.error->code, resp.error->kind(), resp.error->message, resp.error->data);
        }
        return resp.result.value_or(nlohmann::json::object());
    }

    nlohmann::json invocation(nlohmann::json params) const {
        if (opts.subject_id) params["auth"] = {{"subject_id", *opts.subject_id}};
        return params;
    }

    static nlohmann::json list_params(const std::optional<std::string>& cursor) {
        nlohmann::json params = nlohmann::json::object();
        if (cursor) params["cursor"] = *cursor;
        return params;
    }

    template <typename T>
    static PaginatedResult<T> paginated(const nlohmann::json& result, const char* key) {
        PaginatedResult<T> page;
        if (result.contains(key)) page.items = result.at(key).get<std::vector<T>>();
        if (result.contains("nextCursor") && result.at("nextCursor").is_string()) {
            page.next_cursor = result.at("nextCursor").get<std::string>();
        }
        return page;
    }
};

Client::Client()
    : Client(Options{}) {}

Client::Client(Options opts)
    : impl_(std::make_unique<Impl>(std::move(opts))) {}

Client::~Client() {
    if (impl_) disconnect();
}

// ---- Connection ----

void Client::connect(std::unique_ptr<ITransport> transport) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->session) throw TransportError(TransportError::Kind::NotReady, "Client is already connected");

    Session::Options sopts;
    sopts.worker_threads = 1;
    sopts.request_timeout = impl_->opts.request_timeout;
    impl_->session = std::make_unique<Session>(std::move(transport), impl_->dispatcher, sopts);
    impl_->session->start();
}

void Client::connect(const TransportConfig& config) {
    connect(TransportFactory::create(config));
}

void Client::connect_stdio(const std::string& command, const std::vector<std::string>& args) {
    connect(StreamTransport::spawn(command, args));
}

void Client::connect_http(const std::string& url) {
    connect(std::make_unique<HttpTransport>(url));
}

void Client::connect_websocket(const std::string& url) {
    connect(std::make_unique<WebSocketTransport>(url));
}

void Client::disconnect() {
    std::unique_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        session = std::move(impl_->session);
    }
    if (session) session->shutdown(std::chrono::milliseconds(1000));
}

bool Client::is_connected() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->session && impl_->session->state() == SessionState::Ready;
}

// ---- Protocol ----

InitializeResult Client::initialize() {
    nlohmann::json info;
    to_json(info, impl_->opts.client_info);
    nlohmann::json params = {
        {"protocolVersion", std::string(PROTOCOL_VERSION)},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", info}
    };

    auto result = impl_->request("initialize", params);
    InitializeResult init;
    from_json(result, init);
    if (init.protocol_version != PROTOCOL_VERSION) {
        logger()->warn("server speaks protocol {}, expected {}", init.protocol_version, PROTOCOL_VERSION);
    }

    impl_->live_session().notify("notifications/initialized");
    return init;
}

void Client::ping() {
    (void)impl_->request("ping", nlohmann::json::object());
}

PaginatedResult<ToolDefinition> Client::list_tools(std::optional<std::string> cursor) {
    auto result = impl_->request("tools/list", Impl::list_params(cursor));
    return Impl::paginated<ToolDefinition>(result, "tools");
}

CallToolResult Client::call_tool(const std::string& name, const nlohmann::json& arguments) {
    auto result = impl_->request("tools/call",
                                 impl_->invocation({{"name", name}, {"arguments", arguments}}));
    CallToolResult out;
    from_json(result, out);
    return out;
}

PaginatedResult<ResourceDefinition> Client::list_resources(std::optional<std::string> cursor) {
    auto result = impl_->request("resources/list", Impl::list_params(cursor));
    return Impl::paginated<ResourceDefinition>(result, "resources");
}

std::vector<ResourceContent> Client::read_resource(const std::string& uri) {
    auto result = impl_->request("resources/read", impl_->invocation({{"uri", uri}}));
    std::vector<ResourceContent> contents;
    if (result.contains("contents")) contents = result.at("contents").get<std::vector<ResourceContent>>();
    return contents;
}

PaginatedResult<PromptDefinition> Client::list_prompts(std::optional<std::string> cursor) {
    auto result = impl_->request("prompts/list", Impl::list_params(cursor));
    return Impl::paginated<PromptDefinition>(result, "prompts");
}

GetPromptResult Client::get_prompt(const std::string& name, const nlohmann::json& arguments) {
    auto result = impl_->request("prompts/get",
                                 impl_->invocation({{"name", name}, {"arguments", arguments}}));
    GetPromptResult out;
    from_json(result, out);
    return out;
}

JsonRpcResponse Client::call(const std::string& method, std::optional<nlohmann::json> params) {
    return impl_->live_session().request(method, std::move(params), impl_->opts.request_timeout);
}

void Client::notify(const std::string& method, std::optional<nlohmann::json> params) {
    impl_->live_session().notify(method, std::move(params));
}

void Client::on_notification(const std::string& method, NotificationHandler handler) {
    impl_->dispatcher.on_notification(method, std::move(handler));
}

TransportStats Client::transport_stats() const {
    return impl_->live_session().transport_stats();
}

} // namespace capwire
