#include "capwire/middleware.hpp"
#include "capwire/error.hpp"
#include "capwire/log.hpp"

namespace capwire {

namespace {

std::string timing_key(const JsonRpcRequest& request, const CallContext& ctx) {
    return ctx.session_id + "/" + to_string(request.id);
}

} // namespace

void LoggingMiddleware::before_request(const JsonRpcRequest& request, const CallContext& ctx) {
    logger()->log(opts_.level, "request {} id={} session={}", request.method,
                  to_string(request.id), ctx.session_id);
    if (opts_.log_timing) {
        std::lock_guard<std::mutex> lock(mutex_);
        started_[timing_key(request, ctx)] = Clock::now();
    }
}

void LoggingMiddleware::after_response(const JsonRpcRequest& request, const JsonRpcResponse& response,
                                       const CallContext& ctx) {
    long long elapsed_us = -1;
    if (opts_.log_timing) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = started_.find(timing_key(request, ctx));
        if (it != started_.end()) {
            elapsed_us = std::chrono::duration_cast<std::chrono::microseconds>(
                Clock::now() - it->second).count();
            started_.erase(it);
        }
    }

    const char* outcome = response.error ? "error" : "ok";
    if (elapsed_us >= 0) {
        logger()->log(opts_.level, "response {} id={} {} in {}us", request.method,
                      to_string(request.id), outcome, elapsed_us);
    } else {
        logger()->log(opts_.level, "response {} id={} {}", request.method,
                      to_string(request.id), outcome);
    }
    if (opts_.log_responses) {
        nlohmann::json j;
        to_json(j, response);
        logger()->log(opts_.level, "response body: {}", j.dump());
    }
}

void LoggingMiddleware::on_error(const JsonRpcRequest& request, const JsonRpcError& error,
                                 const CallContext&) {
    logger()->warn("request {} id={} failed: {} ({}, {})", request.method, to_string(request.id),
                   error.message, error.code, error.kind());
}

// ---------- RateLimitMiddleware ----------

RateLimitMiddleware::RateLimitMiddleware(std::size_t max_requests, std::chrono::milliseconds window)
    : max_requests_(max_requests)
    , window_(window) {
    if (window_.count() <= 0) {
        throw ConfigurationError(ConfigurationError::Kind::InvalidValue,
                                 "Rate limit window must be positive");
    }
}

void RateLimitMiddleware::before_request(const JsonRpcRequest& request, const CallContext&) {
    auto now = Clock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    while (!hits_.empty() && now - hits_.front() >= window_) hits_.pop_front();

    if (hits_.size() >= max_requests_) {
        throw DispatchError(error::RateLimited, std::string(error_kind::RateLimited),
                            "Rate limit exceeded for " + request.method,
                            nlohmann::json{{"limit", max_requests_}, {"window_ms", window_.count()}});
    }
    hits_.push_back(now);
}

} // namespace capwire
