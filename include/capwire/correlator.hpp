#pragma once
#include "json_rpc.hpp"
#include "transport/transport.hpp"
#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace capwire {

class Correlator;
struct PendingTable;

/// Handle to one outstanding request. Resolves with the matching response,
/// or with an error on timeout, cancellation or disconnect.
class PendingCall {
public:
    PendingCall() = default;

    /// Wait without a deadline.
    [[nodiscard]] JsonRpcResponse get();

    /// Wait at most `timeout`. On expiry the pending slot is dropped (a late
    /// response is discarded) and CorrelationError{Timeout} is thrown.
    [[nodiscard]] JsonRpcResponse get(std::chrono::milliseconds timeout);

    /// Drop the pending slot. A later get() throws CorrelationError{Cancelled}.
    /// Returns false when the response had already arrived.
    bool cancel();

    [[nodiscard]] const RequestId& id() const noexcept { return id_; }
    [[nodiscard]] bool valid() const noexcept { return future_.valid(); }

private:
    friend class Correlator;
    PendingCall(std::weak_ptr<PendingTable> table, RequestId id, std::string method,
                std::future<JsonRpcResponse> future);

    std::weak_ptr<PendingTable> table_;
    RequestId id_;
    std::string method_;
    std::future<JsonRpcResponse> future_;
    bool cancelled_{false};
};

/// Turns a transport's frame stream into matched request/response pairs.
///
/// Outbound requests get a single-fulfilment slot keyed by id; inbound
/// frames are routed to that slot (responses) or to the request,
/// notification and error sinks. The transport is borrowed and must
/// outlive the correlator; PendingCall handles may outlive both.
class Correlator {
public:
    using RequestSink = std::function<void(JsonRpcRequest)>;
    using NotificationSink = std::function<void(JsonRpcNotification)>;
    using ErrorSink = std::function<void(const std::string& frame, const std::exception& error)>;

    explicit Correlator(ITransport& transport);
    ~Correlator();

    Correlator(const Correlator&) = delete;
    Correlator& operator=(const Correlator&) = delete;

    void on_request(RequestSink sink);
    void on_notification(NotificationSink sink);
    void on_error(ErrorSink sink);

    /// Send a request with a generated integer id.
    [[nodiscard]] PendingCall submit(const std::string& method,
                                     std::optional<nlohmann::json> params = std::nullopt);

    /// Send a request with a caller-chosen id. Throws CorrelationError
    /// {Malformed} if that id is already outstanding.
    [[nodiscard]] PendingCall submit(JsonRpcRequest request);

    void notify(const std::string& method, std::optional<nlohmann::json> params = std::nullopt);
    void respond(const JsonRpcResponse& response);

    /// Route one inbound frame. Never throws for frame content.
    void handle_frame(const std::string& frame);

    /// Resolve every pending slot with TransportError{Disconnected} and
    /// refuse further sends.
    void fail_all(const std::string& reason = "Connection closed");

    [[nodiscard]] std::size_t pending_count() const;
    [[nodiscard]] bool is_failed() const noexcept { return failed_; }

private:
    void send_frame(const std::string& frame);
    void complete(JsonRpcResponse response);

    ITransport& transport_;
    std::mutex send_mutex_;

    std::shared_ptr<PendingTable> table_;
    std::atomic<int64_t> next_id_{1};
    std::atomic<bool> failed_{false};

    std::mutex sinks_mutex_;
    RequestSink request_sink_;
    NotificationSink notification_sink_;
    ErrorSink error_sink_;
};

} // namespace capwire
