#pragma once
#include "transport.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

// Forward declarations to avoid including heavy httplib header
namespace httplib {
    class Server;
    class Client;
}

namespace capwire {

/// Client side of the request/response binding: every send() is one POST,
/// and a non-empty response body becomes the next receive() result.
///
/// This only emulates a duplex channel. Frames arrive strictly as replies
/// to earlier sends, so the server cannot push notifications or requests of
/// its own, and callers must not depend on interleaving beyond that order.
class HttpTransport : public ITransport {
public:
    /// `http://host[:port]/path`. No connection is made until the first send.
    explicit HttpTransport(const std::string& url);
    ~HttpTransport() override;

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    /// Throws TransportError{Io} when the POST fails or the status is not 2xx.
    void send(const std::string& frame) override;
    std::optional<std::string> receive() override;
    void close() override;
    bool is_connected() const override;
    std::string_view transport_type() const override { return "http"; }
    TransportStats stats() const override;

    /// Session id assigned by the server on the first exchange.
    [[nodiscard]] std::string session_id() const;

private:
    std::string path_;
    std::unique_ptr<httplib::Client> client_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> replies_;
    std::string session_id_;

    std::mutex post_mutex_;
    std::atomic<bool> closed_{false};
    StatsRecorder stats_;
};

/// HTTP endpoint that hands each POSTed frame to a callback and returns its
/// reply in the response body (202 with no body when there is none).
class HttpServer {
public:
    struct Options {
        std::string host = "127.0.0.1";
        uint16_t port = 8080;   // 0 picks an ephemeral port
        std::string path = "/mcp";
        std::vector<std::string> allowed_origins;
    };

    /// Returns the reply frame for `frame`, or std::nullopt. May throw
    /// FrameParseError, which becomes a 400 with a parse-error envelope.
    using FrameHandler = std::function<std::optional<std::string>(
        const std::string& frame, const std::string& session_id)>;

    HttpServer(Options opts, FrameHandler handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Bind the listening socket. Returns the bound port. Throws
    /// TransportError{ConnectionFailed}.
    uint16_t bind();

    /// Serve until stop(). Binds first if bind() was not called.
    void listen();

    void stop();

    [[nodiscard]] bool is_running() const;
    [[nodiscard]] uint16_t port() const { return port_; }

private:
    bool validate_origin(const std::string& origin) const;
    void setup_routes();

    Options opts_;
    FrameHandler handler_;
    std::unique_ptr<httplib::Server> server_;
    uint16_t port_{0};
    bool bound_{false};

    std::mutex sessions_mutex_;
    std::set<std::string> sessions_;
};

} // namespace capwire
