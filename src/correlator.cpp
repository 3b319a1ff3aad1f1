#include "capwire/correlator.hpp"
#include "capwire/codec.hpp"
#include "capwire/error.hpp"
#include "capwire/log.hpp"

namespace capwire {

struct PendingTable {
    std::mutex mutex;
    std::map<RequestId, std::promise<JsonRpcResponse>> slots;
    std::string failure_reason;

    bool erase(const RequestId& id) {
        std::lock_guard<std::mutex> lock(mutex);
        return slots.erase(id) > 0;
    }
};

// ---------- PendingCall ----------

PendingCall::PendingCall(std::weak_ptr<PendingTable> table, RequestId id, std::string method,
                         std::future<JsonRpcResponse> future)
    : table_(std::move(table))
    , id_(std::move(id))
    , method_(std::move(method))
    , future_(std::move(future)) {}

JsonRpcResponse PendingCall::get() {
    if (cancelled_) {
        throw CorrelationError(CorrelationError::Kind::Cancelled,
                               "Request cancelled: " + method_ + " id=" + to_string(id_));
    }
    if (!future_.valid()) {
        throw CorrelationError(CorrelationError::Kind::Cancelled, "Pending call already consumed");
    }
    return future_.get();
}

JsonRpcResponse PendingCall::get(std::chrono::milliseconds timeout) {
    if (cancelled_ || !future_.valid()) return get();

    if (future_.wait_for(timeout) == std::future_status::timeout) {
        auto table = table_.lock();
        // If the slot is gone the response (or a disconnect) won the race.
        if (!table || table->erase(id_)) {
            future_ = {};
            throw CorrelationError(CorrelationError::Kind::Timeout,
                                   "Request timed out: " + method_ + " id=" + to_string(id_));
        }
    }
    return future_.get();
}

bool PendingCall::cancel() {
    if (cancelled_ || !future_.valid()) return false;
    auto table = table_.lock();
    if (table && table->erase(id_)) {
        cancelled_ = true;
        future_ = {};
        return true;
    }
    return false;
}

// ---------- Correlator ----------

Correlator::Correlator(ITransport& transport)
    : transport_(transport)
    , table_(std::make_shared<PendingTable>()) {}

Correlator::~Correlator() {
    fail_all("Correlator destroyed");
}

void Correlator::on_request(RequestSink sink) {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    request_sink_ = std::move(sink);
}

void Correlator::on_notification(NotificationSink sink) {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    notification_sink_ = std::move(sink);
}

void Correlator::on_error(ErrorSink sink) {
    std::lock_guard<std::mutex> lock(sinks_mutex_);
    error_sink_ = std::move(sink);
}

void Correlator::send_frame(const std::string& frame) {
    if (failed_) {
        std::lock_guard<std::mutex> lock(table_->mutex);
        throw TransportError(TransportError::Kind::Disconnected, table_->failure_reason);
    }
    std::lock_guard<std::mutex> lock(send_mutex_);
    logger()->debug("--> {}", frame);
    transport_.send(frame);
}

PendingCall Correlator::submit(const std::string& method, std::optional<nlohmann::json> params) {
    JsonRpcRequest req;
    req.id = RequestId{next_id_++};
    req.method = method;
    req.params = std::move(params);
    return submit(std::move(req));
}

PendingCall Correlator::submit(JsonRpcRequest request) {
    std::future<JsonRpcResponse> future;
    {
        std::lock_guard<std::mutex> lock(table_->mutex);
        if (failed_) {
            throw TransportError(TransportError::Kind::Disconnected, table_->failure_reason);
        }
        if (table_->slots.count(request.id) > 0) {
            throw CorrelationError(CorrelationError::Kind::Malformed,
                                   "Request id already outstanding: " + to_string(request.id));
        }
        future = table_->slots[request.id].get_future();
    }

    try {
        send_frame(Codec::serialize(request));
    } catch (...) {
        table_->erase(request.id);
        throw;
    }
    return PendingCall(table_, request.id, request.method, std::move(future));
}

void Correlator::notify(const std::string& method, std::optional<nlohmann::json> params) {
    JsonRpcNotification notif;
    notif.method = method;
    notif.params = std::move(params);
    send_frame(Codec::serialize(notif));
}

void Correlator::respond(const JsonRpcResponse& response) {
    send_frame(Codec::serialize(response));
}

void Correlator::complete(JsonRpcResponse response) {
    std::promise<JsonRpcResponse> slot;
    {
        std::lock_guard<std::mutex> lock(table_->mutex);
        auto it = table_->slots.find(response.id);
        if (it == table_->slots.end()) {
            logger()->debug("discarding response for unknown id {}", to_string(response.id));
            return;
        }
        slot = std::move(it->second);
        table_->slots.erase(it);
    }
    slot.set_value(std::move(response));
}

void Correlator::handle_frame(const std::string& frame) {
    logger()->debug("<-- {}", frame);

    JsonRpcMessage msg;
    try {
        msg = Codec::parse(frame);
    } catch (const FrameParseError& e) {
        logger()->warn("malformed frame: {}", e.what());
        ErrorSink sink;
        {
            std::lock_guard<std::mutex> lock(sinks_mutex_);
            sink = error_sink_;
        }
        if (sink) sink(frame, e);
        return;
    }

    if (auto* resp = std::get_if<JsonRpcResponse>(&msg)) {
        complete(std::move(*resp));
        return;
    }

    if (auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        RequestSink sink;
        {
            std::lock_guard<std::mutex> lock(sinks_mutex_);
            sink = request_sink_;
        }
        if (sink) {
            sink(std::move(*req));
            return;
        }
        // Nobody serves requests on this side; still answer exactly once.
        JsonRpcResponse reply;
        reply.id = req->id;
        reply.error = make_error(error::MethodNotFound, error_kind::MethodNotFound,
                                 "Method not found: " + req->method);
        try {
            respond(reply);
        } catch (const TransportError& e) {
            logger()->warn("could not reject request {}: {}", to_string(req->id), e.what());
        }
        return;
    }

    auto& notif = std::get<JsonRpcNotification>(msg);
    NotificationSink sink;
    {
        std::lock_guard<std::mutex> lock(sinks_mutex_);
        sink = notification_sink_;
    }
    if (sink) {
        sink(std::move(notif));
    } else {
        logger()->debug("unhandled notification {}", notif.method);
    }
}

void Correlator::fail_all(const std::string& reason) {
    std::map<RequestId, std::promise<JsonRpcResponse>> slots;
    {
        std::lock_guard<std::mutex> lock(table_->mutex);
        if (!failed_.exchange(true)) table_->failure_reason = reason;
        slots.swap(table_->slots);
    }
    if (!slots.empty()) {
        logger()->debug("failing {} pending request(s): {}", slots.size(), reason);
    }
    for (auto& [id, slot] : slots) {
        slot.set_exception(std::make_exception_ptr(
            TransportError(TransportError::Kind::Disconnected, reason)));
    }
}

std::size_t Correlator::pending_count() const {
    std::lock_guard<std::mutex> lock(table_->mutex);
    return table_->slots.size();
}

} // namespace capwire
