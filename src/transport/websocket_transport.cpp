#include "capwire/transport/websocket_transport.hpp"
#include "capwire/error.hpp"
#include "capwire/log.hpp"
#include "url.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <thread>

namespace capwire {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

// ---------- WebSocketTransport::Impl ----------

struct WebSocketTransport::Impl {
    net::io_context ioc;
    websocket::stream<beast::tcp_stream> ws{ioc};
    std::optional<net::executor_work_guard<net::io_context::executor_type>> work;
    std::thread io_thread;
    beast::flat_buffer read_buffer;

    std::mutex queue_mutex;
    std::condition_variable queue_cv;
    std::deque<std::string> inbound;
    bool peer_closed = false;
    std::string read_error;

    std::mutex send_mutex;
    std::atomic<bool> connected{false};
    std::atomic<bool> closed{false};
    std::chrono::milliseconds close_timeout{2000};
    StatsRecorder stats;

    void connect(const std::string& url) {
        auto parsed = detail::parse_url(url, "80");
        if (parsed.scheme != "ws") {
            throw TransportError(TransportError::Kind::ConnectionFailed,
                                 "Unsupported WebSocket scheme: " + parsed.scheme);
        }
        try {
            tcp::resolver resolver(ioc);
            auto results = resolver.resolve(parsed.host, parsed.port);
            beast::get_lowest_layer(ws).connect(results);
            beast::get_lowest_layer(ws).expires_never();
            ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
            ws.handshake(parsed.host + ":" + parsed.port, parsed.target);
        } catch (const beast::system_error& e) {
            throw TransportError(TransportError::Kind::ConnectionFailed,
                                 "WebSocket connect to " + url + " failed: " + e.code().message());
        }
    }

    void accept_handshake() {
        beast::get_lowest_layer(ws).expires_never();
        ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        ws.accept();
    }

    void start() {
        ws.text(true);
        connected = true;
        stats.mark_connected();
        work.emplace(net::make_work_guard(ioc));
        do_read();
        io_thread = std::thread([this] { ioc.run(); });
    }

    void do_read() {
        ws.async_read(read_buffer, [this](beast::error_code ec, std::size_t) { on_read(ec); });
    }

    void on_read(beast::error_code ec) {
        if (ec) {
            std::lock_guard<std::mutex> lock(queue_mutex);
            if (ec == websocket::error::closed || ec == net::error::eof
                || ec == net::error::operation_aborted || closed) {
                peer_closed = true;
            } else {
                read_error = ec.message();
                logger()->error("websocket read failed: {}", read_error);
            }
            connected = false;
            queue_cv.notify_all();
            return;
        }
        {
            std::lock_guard<std::mutex> lock(queue_mutex);
            inbound.push_back(beast::buffers_to_string(read_buffer.data()));
        }
        read_buffer.consume(read_buffer.size());
        queue_cv.notify_one();
        do_read();
    }

    void shutdown() {
        if (closed.exchange(true)) return;
        connected = false;

        // An in-flight send must finish before the io_context stops.
        std::lock_guard<std::mutex> send_lock(send_mutex);
        if (io_thread.joinable()) {
            std::promise<void> done;
            auto finished = done.get_future();
            net::post(ws.get_executor(), [this, &done] {
                if (!ws.is_open()) {
                    done.set_value();
                    return;
                }
                ws.async_close(websocket::close_code::normal,
                               [&done](beast::error_code) { done.set_value(); });
            });
            if (finished.wait_for(close_timeout) != std::future_status::ready) {
                logger()->debug("websocket close handshake timed out");
            }
            work.reset();
            ioc.stop();
            io_thread.join();
        }
        beast::error_code ignored;
        beast::get_lowest_layer(ws).socket().close(ignored);

        std::lock_guard<std::mutex> lock(queue_mutex);
        queue_cv.notify_all();
    }
};

// ---------- WebSocketTransport ----------

WebSocketTransport::WebSocketTransport(const std::string& url)
    : impl_(std::make_unique<Impl>()) {
    impl_->connect(url);
    impl_->start();
    logger()->debug("websocket connected to {}", url);
}

WebSocketTransport::WebSocketTransport(AcceptKey, std::unique_ptr<Impl> impl)
    : impl_(std::move(impl)) {
    impl_->start();
}

WebSocketTransport::~WebSocketTransport() {
    close();
}

void WebSocketTransport::send(const std::string& frame) {
    if (impl_->closed || !impl_->connected) {
        throw TransportError(TransportError::Kind::Disconnected, "WebSocket is not connected");
    }

    std::lock_guard<std::mutex> lock(impl_->send_mutex);
    if (impl_->closed) {
        throw TransportError(TransportError::Kind::Disconnected, "WebSocket is closed");
    }
    std::promise<beast::error_code> written;
    auto result = written.get_future();
    net::post(impl_->ws.get_executor(), [this, &frame, &written] {
        impl_->ws.async_write(net::buffer(frame),
            [&written](beast::error_code ec, std::size_t) { written.set_value(ec); });
    });

    auto ec = result.get();
    if (ec) {
        auto kind = (ec == websocket::error::closed || ec == net::error::broken_pipe)
            ? TransportError::Kind::Disconnected : TransportError::Kind::Io;
        throw TransportError(kind, "WebSocket write failed: " + ec.message());
    }
    impl_->stats.record_sent(frame.size());
}

std::optional<std::string> WebSocketTransport::receive() {
    std::unique_lock<std::mutex> lock(impl_->queue_mutex);
    impl_->queue_cv.wait(lock, [this] {
        return !impl_->inbound.empty() || impl_->peer_closed
               || !impl_->read_error.empty() || impl_->closed;
    });

    if (!impl_->inbound.empty()) {
        std::string frame = std::move(impl_->inbound.front());
        impl_->inbound.pop_front();
        lock.unlock();
        impl_->stats.record_received(frame.size());
        return frame;
    }
    if (!impl_->read_error.empty() && !impl_->closed) {
        throw TransportError(TransportError::Kind::Io, "WebSocket read failed: " + impl_->read_error);
    }
    return std::nullopt;
}

void WebSocketTransport::close() {
    impl_->shutdown();
}

bool WebSocketTransport::is_connected() const {
    return impl_->connected;
}

TransportStats WebSocketTransport::stats() const {
    return impl_->stats.snapshot();
}

void WebSocketTransport::set_close_timeout(std::chrono::milliseconds timeout) {
    impl_->close_timeout = timeout;
}

// ---------- WebSocketListener ----------

struct WebSocketListener::Impl {
    net::io_context ioc;
    tcp::acceptor acceptor{ioc};
    std::mutex accept_mutex;
    std::atomic<bool> closed{false};
    uint16_t port = 0;
};

WebSocketListener::WebSocketListener(const std::string& host, uint16_t port)
    : impl_(std::make_unique<Impl>()) {
    beast::error_code ec;
    auto address = net::ip::make_address(host, ec);
    if (ec) {
        throw TransportError(TransportError::Kind::ConnectionFailed,
                             "Invalid listen address '" + host + "': " + ec.message());
    }
    tcp::endpoint endpoint{address, port};

    auto fail = [&](const char* what) {
        throw TransportError(TransportError::Kind::ConnectionFailed,
                             std::string("WebSocket listener ") + what + ": " + ec.message());
    };
    impl_->acceptor.open(endpoint.protocol(), ec);
    if (ec) fail("open");
    impl_->acceptor.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) fail("set_option");
    impl_->acceptor.bind(endpoint, ec);
    if (ec) fail("bind");
    impl_->acceptor.listen(net::socket_base::max_listen_connections, ec);
    if (ec) fail("listen");

    impl_->port = impl_->acceptor.local_endpoint().port();
    logger()->info("websocket listening on {}:{}", host, impl_->port);
}

WebSocketListener::~WebSocketListener() {
    close();
}

std::unique_ptr<WebSocketTransport> WebSocketListener::accept() {
    std::lock_guard<std::mutex> lock(impl_->accept_mutex);
    while (!impl_->closed) {
        auto conn = std::make_unique<WebSocketTransport::Impl>();
        auto& socket = beast::get_lowest_layer(conn->ws).socket();

        beast::error_code accept_ec = net::error::operation_aborted;
        impl_->acceptor.async_accept(socket, [&accept_ec](beast::error_code ec) { accept_ec = ec; });
        impl_->ioc.restart();
        impl_->ioc.run();

        if (impl_->closed || accept_ec == net::error::operation_aborted) return nullptr;
        if (accept_ec) {
            logger()->warn("websocket accept failed: {}", accept_ec.message());
            continue;
        }

        try {
            conn->accept_handshake();
        } catch (const beast::system_error& e) {
            logger()->warn("websocket handshake failed: {}", e.code().message());
            continue;
        }
        return std::make_unique<WebSocketTransport>(WebSocketTransport::AcceptKey{}, std::move(conn));
    }
    return nullptr;
}

void WebSocketListener::close() {
    if (impl_->closed.exchange(true)) return;
    net::post(impl_->ioc, [this] {
        beast::error_code ignored;
        impl_->acceptor.close(ignored);
    });
    // Without a concurrent accept() nobody runs the io_context; close directly.
    std::unique_lock<std::mutex> lock(impl_->accept_mutex, std::try_to_lock);
    if (lock.owns_lock()) {
        beast::error_code ignored;
        impl_->acceptor.close(ignored);
    }
}

uint16_t WebSocketListener::port() const {
    return impl_->port;
}

} // namespace capwire
