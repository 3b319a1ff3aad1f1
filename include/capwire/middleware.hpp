#pragma once
#include "authorization.hpp"
#include "json_rpc.hpp"
#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <spdlog/common.h>

namespace capwire {

/// Hooks run by the Dispatcher around every request.
class IMiddleware {
public:
    virtual ~IMiddleware() = default;

    /// Throw DispatchError to reject the request; the error becomes its
    /// response and no later stage runs.
    virtual void before_request(const JsonRpcRequest& request, const CallContext& ctx) {
        (void)request;
        (void)ctx;
    }

    virtual void after_response(const JsonRpcRequest& request, const JsonRpcResponse& response,
                                const CallContext& ctx) {
        (void)request;
        (void)response;
        (void)ctx;
    }

    virtual void on_error(const JsonRpcRequest& request, const JsonRpcError& error,
                          const CallContext& ctx) {
        (void)request;
        (void)error;
        (void)ctx;
    }
};

class LoggingMiddleware : public IMiddleware {
public:
    struct Options {
        spdlog::level::level_enum level = spdlog::level::info;
        bool log_responses = false;
        bool log_timing = true;
    };

    LoggingMiddleware() : LoggingMiddleware(Options{}) {}
    explicit LoggingMiddleware(Options opts) : opts_(opts) {}

    void before_request(const JsonRpcRequest& request, const CallContext& ctx) override;
    void after_response(const JsonRpcRequest& request, const JsonRpcResponse& response,
                        const CallContext& ctx) override;
    void on_error(const JsonRpcRequest& request, const JsonRpcError& error,
                  const CallContext& ctx) override;

private:
    using Clock = std::chrono::steady_clock;

    Options opts_;
    std::mutex mutex_;
    std::map<std::string, Clock::time_point> started_;  // keyed by session + id
};

/// Sliding-window limit shared by every session using this instance.
/// Requests over the limit are rejected with -32001 `rate_limited`.
class RateLimitMiddleware : public IMiddleware {
public:
    RateLimitMiddleware(std::size_t max_requests, std::chrono::milliseconds window);

    void before_request(const JsonRpcRequest& request, const CallContext& ctx) override;

private:
    using Clock = std::chrono::steady_clock;

    std::size_t max_requests_;
    std::chrono::milliseconds window_;
    std::mutex mutex_;
    std::deque<Clock::time_point> hits_;
};

} // namespace capwire
