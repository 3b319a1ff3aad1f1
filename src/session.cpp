#include "capwire/session.hpp"
#include "capwire/codec.hpp"
#include "capwire/error.hpp"
#include "capwire/log.hpp"
#include "uuid.hpp"

namespace capwire {

std::string_view to_string(SessionState state) {
    switch (state) {
        case SessionState::Connecting: return "connecting";
        case SessionState::Ready:      return "ready";
        case SessionState::Closing:    return "closing";
        case SessionState::Closed:     return "closed";
    }
    return "unknown";
}

namespace {

ITransport& require_transport(const std::unique_ptr<ITransport>& transport) {
    if (!transport) throw TransportError(TransportError::Kind::NotReady, "Session needs a transport");
    return *transport;
}

template <typename F>
class ScopeExit {
public:
    explicit ScopeExit(F f) : f_(std::move(f)) {}
    ~ScopeExit() { f_(); }

    ScopeExit(const ScopeExit&) = delete;
    ScopeExit& operator=(const ScopeExit&) = delete;

private:
    F f_;
};

} // namespace

Session::Session(std::unique_ptr<ITransport> transport, Dispatcher& dispatcher)
    : Session(std::move(transport), dispatcher, Options{}) {}

Session::Session(std::unique_ptr<ITransport> transport, Dispatcher& dispatcher, Options opts)
    : id_(detail::generate_uuid())
    , opts_(std::move(opts))
    , transport_(std::move(transport))
    , dispatcher_(dispatcher)
    , correlator_(require_transport(transport_))
    , pool_(opts_.worker_threads) {
    correlator_.on_request([this](JsonRpcRequest request) { on_request(std::move(request)); });
    correlator_.on_notification([this](JsonRpcNotification n) { on_notification(std::move(n)); });
    correlator_.on_error([this](const std::string& frame, const std::exception& e) { on_malformed(frame, e); });
}

Session::~Session() {
    abort();
    if (loop_thread_.joinable()) loop_thread_.join();
    // Workers may still be unwinding a task that closed this session.
    pool_.stop();
}

void Session::start() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != SessionState::Connecting) {
            throw TransportError(TransportError::Kind::NotReady,
                                 "Session " + id_ + " is already " + std::string(to_string(state_)));
        }
        state_ = SessionState::Ready;
    }
    logger()->info("session {} started over {}", id_, transport_->transport_type());
    loop_thread_ = std::thread([this] { loop(); });
}

void Session::loop() {
    std::string reason = "Connection closed by peer";
    for (;;) {
        std::optional<std::string> frame;
        try {
            frame = transport_->receive();
        } catch (const TransportError& e) {
            logger()->error("session {} receive failed: {}", id_, e.what());
            reason = e.what();
            break;
        }
        if (!frame) break;
        correlator_.handle_frame(*frame);
    }

    correlator_.fail_all(reason);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == SessionState::Ready) state_ = SessionState::Closing;
        loop_done_ = true;
    }
    state_cv_.notify_all();
    logger()->info("session {} input ended", id_);
}

CallContext Session::call_context() const {
    CallContext ctx;
    ctx.session_id = id_;
    ctx.subject_id = opts_.default_subject;
    ctx.client_ip = opts_.client_ip;
    return ctx;
}

void Session::on_request(JsonRpcRequest request) {
    const RequestId id = request.id;
    bool accepted = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == SessionState::Ready) {
            ++in_flight_;
            accepted = true;
        }
    }
    if (!accepted) {
        reject(id, error::InternalError, error_kind::ShuttingDown,
               "Session is shutting down; " + request.method + " refused");
        return;
    }

    auto done = [this] {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            --in_flight_;
        }
        state_cv_.notify_all();
    };

    try {
        pool_.submit([this, done, ctx = call_context(), request = std::move(request)] {
            ScopeExit release{done};
            try {
                auto response = dispatcher_.dispatch(request, ctx);
                correlator_.respond(response);
            } catch (const std::exception& e) {
                logger()->warn("session {} could not answer {} id={}: {}", id_, request.method,
                               to_string(request.id), e.what());
            }
        });
    } catch (const Error&) {
        done();
        reject(id, error::InternalError, error_kind::ShuttingDown, "Session is shutting down");
    }
}

void Session::on_notification(JsonRpcNotification notification) {
    dispatcher_.handle_notification(notification, call_context());
}

void Session::on_malformed(const std::string& frame, const std::exception& error) {
    if (auto id = Codec::recover_id(frame)) {
        reject(*id, error::InvalidRequest, error_kind::InvalidRequest,
               std::string("Invalid request: ") + error.what());
    }
}

void Session::reject(const RequestId& id, int code, std::string_view kind, const std::string& message) {
    JsonRpcResponse response;
    response.id = id;
    response.error = make_error(code, kind, message);
    logger()->warn("session {} rejected id={}: {}", id_, to_string(id), message);
    try {
        correlator_.respond(response);
    } catch (const Error& e) {
        logger()->warn("session {} could not send rejection: {}", id_, e.what());
    }
}

JsonRpcResponse Session::request(const std::string& method, std::optional<nlohmann::json> params,
                                 std::optional<std::chrono::milliseconds> timeout) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != SessionState::Ready) {
            throw TransportError(TransportError::Kind::NotReady,
                                 "Session " + id_ + " is " + std::string(to_string(state_)));
        }
    }
    auto call = correlator_.submit(method, std::move(params));
    return call.get(timeout.value_or(opts_.request_timeout));
}

void Session::notify(const std::string& method, std::optional<nlohmann::json> params) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == SessionState::Connecting || state_ == SessionState::Closed) {
            throw TransportError(TransportError::Kind::NotReady,
                                 "Session " + id_ + " is " + std::string(to_string(state_)));
        }
    }
    correlator_.notify(method, std::move(params));
}

void Session::begin_shutdown() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == SessionState::Closed || state_ == SessionState::Closing) return;
        state_ = SessionState::Closing;
    }
    logger()->debug("session {} refusing new requests", id_);
}

void Session::shutdown(std::chrono::milliseconds deadline) {
    // A handler shutting down its own session counts itself as in flight.
    const std::size_t own = pool_.on_worker_thread() ? 1 : 0;
    {
        std::unique_lock<std::mutex> lock(state_mutex_);
        if (state_ == SessionState::Closed) return;
        state_ = SessionState::Closing;
        if (!state_cv_.wait_for(lock, deadline, [this, own] { return in_flight_ <= own; })) {
            logger()->warn("session {} closing with {} handler(s) still running", id_, in_flight_ - own);
        }
    }
    finish("Session shut down");
}

void Session::abort() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == SessionState::Closed) return;
    }
    logger()->debug("session {} aborting", id_);
    finish("Session aborted");
}

void Session::finish(const std::string& reason) {
    std::lock_guard<std::mutex> guard(finish_mutex_);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == SessionState::Closed) return;
        state_ = SessionState::Closing;
    }

    transport_->close();
    correlator_.fail_all(reason);
    if (loop_thread_.joinable() && loop_thread_.get_id() != std::this_thread::get_id()) {
        loop_thread_.join();
    }
    // On a worker this only stops intake; ~Session joins.
    pool_.stop();

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = SessionState::Closed;
        loop_done_ = true;
    }
    state_cv_.notify_all();
    logger()->info("session {} closed", id_);
}

void Session::wait() {
    std::unique_lock<std::mutex> lock(state_mutex_);
    state_cv_.wait(lock, [this] {
        if (state_ == SessionState::Connecting) return true;
        if (!loop_done_) return false;
        // Closed from inside a handler: hold until that handler has unwound.
        return state_ != SessionState::Closed || in_flight_ == 0;
    });
}

SessionState Session::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

TransportStats Session::transport_stats() const {
    return transport_->stats();
}

std::size_t Session::in_flight() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return in_flight_;
}

} // namespace capwire
