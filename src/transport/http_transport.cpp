#include "capwire/transport/http_transport.hpp"
#include "capwire/error.hpp"
#include "capwire/log.hpp"
#include "capwire/version.hpp"
#include "../uuid.hpp"
#include "url.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

namespace capwire {

// ---------- HttpTransport ----------

HttpTransport::HttpTransport(const std::string& url) {
    auto parsed = detail::parse_url(url, "80");
    if (parsed.scheme != "http") {
        throw TransportError(TransportError::Kind::ConnectionFailed,
                             "Unsupported HTTP scheme: " + parsed.scheme);
    }
    path_ = parsed.target;

    int port = 0;
    try {
        port = std::stoi(parsed.port);
    } catch (const std::exception&) {
        throw TransportError(TransportError::Kind::ConnectionFailed, "Invalid port in URL: " + url);
    }
    client_ = std::make_unique<httplib::Client>(parsed.host, port);
    client_->set_connection_timeout(10);
    client_->set_read_timeout(60);
    stats_.mark_connected();
}

HttpTransport::~HttpTransport() {
    close();
}

void HttpTransport::send(const std::string& frame) {
    if (closed_) {
        throw TransportError(TransportError::Kind::Disconnected, "HTTP transport is closed");
    }

    // One exchange at a time keeps replies queued in send order.
    std::lock_guard<std::mutex> post_lock(post_mutex_);

    httplib::Headers headers = {
        {"Accept", "application/json"},
        {"MCP-Protocol-Version", std::string(PROTOCOL_VERSION)}
    };
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!session_id_.empty()) headers.emplace("Mcp-Session-Id", session_id_);
    }

    auto result = client_->Post(path_, headers, frame, "application/json");
    if (!result) {
        throw TransportError(TransportError::Kind::Io,
                             "HTTP POST failed: " + httplib::to_string(result.error()));
    }
    if (result->status < 200 || result->status >= 300) {
        throw TransportError(TransportError::Kind::Io,
                             "HTTP error: " + std::to_string(result->status));
    }
    stats_.record_sent(frame.size());

    std::lock_guard<std::mutex> lock(mutex_);
    if (result->has_header("Mcp-Session-Id")) {
        session_id_ = result->get_header_value("Mcp-Session-Id");
    }
    if (!result->body.empty()) {
        replies_.push_back(result->body);
        cv_.notify_one();
    }
}

std::optional<std::string> HttpTransport::receive() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !replies_.empty() || closed_; });
    if (replies_.empty()) return std::nullopt;

    std::string frame = std::move(replies_.front());
    replies_.pop_front();
    lock.unlock();
    stats_.record_received(frame.size());
    return frame;
}

void HttpTransport::close() {
    if (closed_.exchange(true)) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cv_.notify_all();
    }
    if (client_) client_->stop();
}

bool HttpTransport::is_connected() const {
    return !closed_;
}

TransportStats HttpTransport::stats() const {
    return stats_.snapshot();
}

std::string HttpTransport::session_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_id_;
}

// ---------- HttpServer ----------

HttpServer::HttpServer(Options opts, FrameHandler handler)
    : opts_(std::move(opts))
    , handler_(std::move(handler))
    , server_(std::make_unique<httplib::Server>()) {
    setup_routes();
}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::validate_origin(const std::string& origin) const {
    if (opts_.allowed_origins.empty()) return true;
    for (const auto& allowed : opts_.allowed_origins) {
        if (origin == allowed) return true;
    }
    return false;
}

void HttpServer::setup_routes() {
    server_->Post(opts_.path, [this](const httplib::Request& req, httplib::Response& res) {
        // Origin check guards against DNS rebinding from browsers.
        auto origin = req.get_header_value("Origin");
        if (!origin.empty() && !validate_origin(origin)) {
            res.status = 403;
            res.set_content("{\"error\":\"Invalid origin\"}", "application/json");
            return;
        }

        std::string session_id = req.get_header_value("Mcp-Session-Id");
        if (session_id.empty()) {
            session_id = detail::generate_uuid();
            std::lock_guard<std::mutex> lock(sessions_mutex_);
            sessions_.insert(session_id);
        } else {
            std::lock_guard<std::mutex> lock(sessions_mutex_);
            if (sessions_.count(session_id) == 0) {
                res.status = 404;
                res.set_content("{\"error\":\"Session not found\"}", "application/json");
                return;
            }
        }
        res.set_header("Mcp-Session-Id", session_id);

        try {
            auto reply = handler_(req.body, session_id);
            if (reply) {
                res.status = 200;
                res.set_content(*reply, "application/json");
            } else {
                res.status = 202;
            }
        } catch (const FrameParseError& e) {
            logger()->warn("http: malformed frame: {}", e.what());
            nlohmann::json err = {
                {"jsonrpc", std::string(JSONRPC_VERSION)},
                {"id", nullptr},
                {"error", {{"code", error::ParseError},
                           {"message", e.what()},
                           {"data", {{"kind", std::string(error_kind::ParseError)}}}}}
            };
            res.status = 400;
            res.set_content(err.dump(), "application/json");
        } catch (const std::exception& e) {
            logger()->error("http: frame handler failed: {}", e.what());
            res.status = 500;
            res.set_content("{\"error\":\"Internal server error\"}", "application/json");
        }
    });

    server_->Delete(opts_.path, [this](const httplib::Request& req, httplib::Response& res) {
        std::string session_id = req.get_header_value("Mcp-Session-Id");
        if (session_id.empty()) {
            res.status = 400;
            return;
        }
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        res.status = sessions_.erase(session_id) > 0 ? 200 : 404;
    });
}

uint16_t HttpServer::bind() {
    if (bound_) return port_;
    if (opts_.port == 0) {
        int bound = server_->bind_to_any_port(opts_.host);
        if (bound <= 0) {
            throw TransportError(TransportError::Kind::ConnectionFailed,
                                 "Failed to bind HTTP server on " + opts_.host);
        }
        port_ = static_cast<uint16_t>(bound);
    } else {
        if (!server_->bind_to_port(opts_.host, opts_.port)) {
            throw TransportError(TransportError::Kind::ConnectionFailed,
                                 "Failed to bind HTTP server on " + opts_.host + ":"
                                 + std::to_string(opts_.port));
        }
        port_ = opts_.port;
    }
    bound_ = true;
    logger()->info("http listening on {}:{}{}", opts_.host, port_, opts_.path);
    return port_;
}

void HttpServer::listen() {
    bind();
    if (!server_->listen_after_bind()) {
        throw TransportError(TransportError::Kind::Io,
                             "HTTP server on " + opts_.host + ":" + std::to_string(port_)
                             + " stopped with an error");
    }
}

void HttpServer::stop() {
    if (server_) server_->stop();
}

bool HttpServer::is_running() const {
    return server_->is_running();
}

} // namespace capwire
