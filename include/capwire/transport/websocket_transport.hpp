#pragma once
#include "transport.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace capwire {

class WebSocketListener;

/// One frame per WebSocket message. Outbound messages are text; inbound
/// binary messages are delivered as text as well.
///
/// Runs its own io_context on a private thread; receive() waits on an
/// inbound queue filled by the read loop.
class WebSocketTransport : public ITransport {
public:
    /// Connect to `ws://host[:port][/path]`. Resolution, TCP connect and the
    /// upgrade handshake all happen here; any failure throws
    /// TransportError{ConnectionFailed}.
    explicit WebSocketTransport(const std::string& url);
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    void send(const std::string& frame) override;
    std::optional<std::string> receive() override;

    /// Performs the close handshake, bounded by the close timeout.
    void close() override;

    bool is_connected() const override;
    std::string_view transport_type() const override { return "websocket"; }
    TransportStats stats() const override;

    void set_close_timeout(std::chrono::milliseconds timeout);

    struct Impl;

    /// Only WebSocketListener can mint one.
    class AcceptKey {
        AcceptKey() {}
        friend class WebSocketListener;
    };

    /// Server side of a connection whose handshake the listener completed.
    WebSocketTransport(AcceptKey, std::unique_ptr<Impl> impl);

private:
    std::unique_ptr<Impl> impl_;
};

/// Listening socket that yields one server-side WebSocketTransport per
/// accepted connection.
class WebSocketListener {
public:
    /// Bind and listen. Port 0 picks an ephemeral port, see port().
    /// Throws TransportError{ConnectionFailed} if the address is unusable.
    WebSocketListener(const std::string& host, uint16_t port);
    ~WebSocketListener();

    WebSocketListener(const WebSocketListener&) = delete;
    WebSocketListener& operator=(const WebSocketListener&) = delete;

    /// Block until a client connects and completes the upgrade handshake.
    /// Returns nullptr once the listener has been closed. A client that
    /// fails the handshake is dropped and accept keeps waiting.
    [[nodiscard]] std::unique_ptr<WebSocketTransport> accept();

    /// Stop listening; wakes a blocked accept(). Thread-safe.
    void close();

    [[nodiscard]] uint16_t port() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace capwire
