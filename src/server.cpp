#include "capwire/server.hpp"
#include "capwire/codec.hpp"
#include "capwire/dispatcher.hpp"
#include "capwire/error.hpp"
#include "capwire/log.hpp"
#include "capwire/monitoring.hpp"
#include "capwire/session.hpp"
#include "capwire/transport/http_transport.hpp"
#include "capwire/transport/stream_transport.hpp"
#include "capwire/transport/websocket_transport.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace capwire {

// ----------- Server::Impl -----------

struct Server::Impl {
    Options opts;
    CapabilityRegistry registry;
    Dispatcher dispatcher;

    std::shared_ptr<Monitor> monitor = std::make_shared<Monitor>();

    std::mutex mutex;
    std::set<std::shared_ptr<Session>> sessions;
    std::shared_ptr<WebSocketListener> listener;
    std::shared_ptr<HttpServer> http;
    bool stopping{false};
    std::atomic<int> active{0};

    explicit Impl(Options o)
        : opts(std::move(o))
        , dispatcher(registry, dispatcher_options(opts)) {
        if (opts.collect_metrics) dispatcher.use(std::make_shared<MetricsMiddleware>(monitor));
    }

    static Dispatcher::Options dispatcher_options(const Options& o) {
        Dispatcher::Options d;
        d.server_info = o.server_info;
        d.page_size = o.page_size;
        return d;
    }

    Session::Options session_options() const {
        Session::Options s;
        s.worker_threads = opts.worker_threads;
        s.default_subject = opts.default_subject;
        return s;
    }

    std::optional<std::string> handle_http_frame(const std::string& frame, const std::string& session_id) {
        auto msg = Codec::parse(frame);

        CallContext ctx;
        ctx.session_id = session_id;
        ctx.subject_id = opts.default_subject;

        if (auto* req = std::get_if<JsonRpcRequest>(&msg)) {
            return Codec::serialize(dispatcher.dispatch(*req, ctx));
        }
        if (auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
            dispatcher.handle_notification(*notif, ctx);
        }
        return std::nullopt;
    }
};

// ----------- Server -----------

Server::Server()
    : Server(Options{}) {}

Server::Server(Options opts)
    : impl_(std::make_unique<Impl>(std::move(opts))) {}

Server::~Server() {
    if (impl_) shutdown();
}

void Server::add_tool(ToolDefinition def, ToolHandler handler) {
    impl_->registry.add_tool(std::move(def), std::move(handler));
}

void Server::add_resource(ResourceDefinition def, ResourceReadHandler handler) {
    impl_->registry.add_resource(std::move(def), std::move(handler));
}

void Server::add_prompt(PromptDefinition def, PromptGetHandler handler) {
    impl_->registry.add_prompt(std::move(def), std::move(handler));
}

bool Server::remove_tool(const std::string& name) {
    return impl_->registry.remove(Category::Tool, name);
}

bool Server::remove_resource(const std::string& uri) {
    return impl_->registry.remove(Category::Resource, uri);
}

bool Server::remove_prompt(const std::string& name) {
    return impl_->registry.remove(Category::Prompt, name);
}

CapabilityRegistry& Server::registry() {
    return impl_->registry;
}

Dispatcher& Server::dispatcher() {
    return impl_->dispatcher;
}

void Server::set_authorizer(std::shared_ptr<IAuthorizer> authorizer) {
    impl_->dispatcher.set_authorizer(std::move(authorizer));
}

void Server::use(std::shared_ptr<IMiddleware> middleware) {
    impl_->dispatcher.use(std::move(middleware));
}

void Server::serve(std::unique_ptr<ITransport> transport) {
    auto session = std::make_shared<Session>(std::move(transport), impl_->dispatcher,
                                             impl_->session_options());
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->stopping) return;
        impl_->sessions.insert(session);
        session->start();
    }
    ++impl_->active;
    impl_->monitor->connection_opened();

    session->wait();
    session->shutdown(impl_->opts.shutdown_grace);

    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->sessions.erase(session);
    }
    impl_->monitor->connection_closed();
    --impl_->active;
}

void Server::serve(const TransportConfig& config) {
    serve(TransportFactory::create(config));
}

void Server::serve_stdio() {
    serve(StreamTransport::current_process());
}

void Server::serve_http(const std::string& host, uint16_t port) {
    HttpServer::Options hopts;
    hopts.host = host;
    hopts.port = port;
    auto http = std::make_shared<HttpServer>(hopts,
        [this](const std::string& frame, const std::string& session_id) {
            return impl_->handle_http_frame(frame, session_id);
        });

    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->stopping) return;
        impl_->http = http;
    }
    ++impl_->active;

    try {
        auto bound = http->bind();
        logger()->info("serving http on {}:{}", host, bound);
        http->listen();
    } catch (const TransportError& e) {
        logger()->error("http endpoint failed: {}", e.what());
        {
            std::lock_guard<std::mutex> lock(impl_->mutex);
            impl_->http.reset();
        }
        --impl_->active;
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->http.reset();
    }
    --impl_->active;
}

void Server::serve_websocket(const std::string& host, uint16_t port) {
    auto listener = std::make_shared<WebSocketListener>(host, port);
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->stopping) return;
        impl_->listener = listener;
    }
    ++impl_->active;
    logger()->info("serving websocket on {}:{}", host, listener->port());

    struct Connection {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };
    std::vector<Connection> connections;
    auto reap = [&connections](bool all) {
        for (auto it = connections.begin(); it != connections.end();) {
            if (all || it->finished->load()) {
                it->thread.join();
                it = connections.erase(it);
            } else {
                ++it;
            }
        }
    };

    while (auto conn = listener->accept()) {
        reap(false);
        auto finished = std::make_shared<std::atomic<bool>>(false);
        std::thread t([this, finished](std::unique_ptr<WebSocketTransport> c) {
            try {
                serve(std::move(c));
            } catch (const Error& e) {
                logger()->error("websocket session failed: {}", e.what());
            }
            *finished = true;
        }, std::move(conn));
        connections.push_back(Connection{std::move(t), std::move(finished)});
    }
    reap(true);

    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->listener.reset();
    }
    --impl_->active;
}

void Server::shutdown() {
    std::vector<std::shared_ptr<Session>> sessions;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->stopping = true;
        if (impl_->listener) impl_->listener->close();
        if (impl_->http) impl_->http->stop();
        sessions.assign(impl_->sessions.begin(), impl_->sessions.end());
    }

    // Every session stops taking requests at once, then all share one grace period.
    for (const auto& session : sessions) session->begin_shutdown();
    const auto deadline = std::chrono::steady_clock::now() + impl_->opts.shutdown_grace;
    for (const auto& session : sessions) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        session->shutdown(std::max(left, std::chrono::milliseconds(0)));
    }
}

void Server::add_health_check(std::shared_ptr<IHealthCheck> check) {
    impl_->monitor->register_health_check(std::move(check));
}

HealthReport Server::health() const {
    return impl_->monitor->health_check();
}

PerformanceMetrics Server::metrics() const {
    return impl_->monitor->metrics();
}

std::shared_ptr<Monitor> Server::monitor() const {
    return impl_->monitor;
}

bool Server::is_running() const {
    return impl_->active > 0;
}

} // namespace capwire
