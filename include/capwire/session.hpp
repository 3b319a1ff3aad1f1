#pragma once
#include "correlator.hpp"
#include "dispatcher.hpp"
#include "transport/transport.hpp"
#include "worker_pool.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace capwire {

enum class SessionState {
    Connecting,
    Ready,
    Closing,
    Closed
};

std::string_view to_string(SessionState state);

/// One live connection: owns the transport, a receive loop thread and a
/// worker pool. Inbound requests are dispatched on the pool and answered
/// through the correlator; inbound notifications are handled in arrival
/// order on the loop thread.
class Session {
public:
    struct Options {
        std::size_t worker_threads = 4;
        std::chrono::milliseconds request_timeout{30000};
        std::optional<std::string> default_subject;
        std::optional<std::string> client_ip;
    };

    Session(std::unique_ptr<ITransport> transport, Dispatcher& dispatcher);
    Session(std::unique_ptr<ITransport> transport, Dispatcher& dispatcher, Options opts);

    /// Aborts if still open.
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /// Move to Ready and launch the receive loop.
    void start();

    /// Send a request and wait for its response. Throws TransportError when
    /// the session is not Ready or the connection drops, CorrelationError
    /// {Timeout} when no response arrives in time.
    [[nodiscard]] JsonRpcResponse request(const std::string& method,
                                          std::optional<nlohmann::json> params = std::nullopt,
                                          std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    void notify(const std::string& method, std::optional<nlohmann::json> params = std::nullopt);

    /// Move to Closing without waiting: new requests are refused with
    /// `shutting_down`, in-flight handlers keep running.
    void begin_shutdown();

    /// Refuse new requests, give in-flight handlers until `deadline`, then
    /// close. Safe to call from any thread, including from one of this
    /// session's own handlers, and more than once.
    void shutdown(std::chrono::milliseconds deadline = std::chrono::milliseconds(5000));

    /// Close the transport immediately and fail all pending calls.
    void abort();

    /// Block until the receive loop has ended. After a close from inside a
    /// handler, also until that handler has returned.
    void wait();

    [[nodiscard]] SessionState state() const;
    [[nodiscard]] const std::string& id() const noexcept { return id_; }
    [[nodiscard]] TransportStats transport_stats() const;
    [[nodiscard]] std::size_t in_flight() const;

private:
    void loop();
    void on_request(JsonRpcRequest request);
    void on_notification(JsonRpcNotification notification);
    void on_malformed(const std::string& frame, const std::exception& error);
    void reject(const RequestId& id, int code, std::string_view kind, const std::string& message);
    void finish(const std::string& reason);
    CallContext call_context() const;

    std::string id_;
    Options opts_;
    std::unique_ptr<ITransport> transport_;
    Dispatcher& dispatcher_;
    Correlator correlator_;
    WorkerPool pool_;

    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    SessionState state_{SessionState::Connecting};
    bool loop_done_{false};
    std::size_t in_flight_{0};

    std::mutex finish_mutex_;
    std::thread loop_thread_;
};

} // namespace capwire
