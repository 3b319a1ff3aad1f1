#pragma once
#include "middleware.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

namespace capwire {

// ---------- Health ----------

/// Ordered from best to worst; a report takes the worst of its checks.
enum class HealthStatus {
    Healthy,
    Degraded,
    Unhealthy,
    Unknown
};

std::string_view to_string(HealthStatus status);

struct HealthCheckResult {
    std::string name;
    HealthStatus status = HealthStatus::Unknown;
    std::optional<std::string> message;
    std::chrono::microseconds duration{0};
};

struct HealthReport {
    HealthStatus status = HealthStatus::Healthy;
    std::vector<HealthCheckResult> checks;
    std::chrono::microseconds total_duration{0};
};

class IHealthCheck {
public:
    virtual ~IHealthCheck() = default;

    virtual std::string name() const = 0;

    /// Exceptions are caught by the Monitor and reported as Unhealthy.
    virtual HealthCheckResult check() = 0;
};

// ---------- Request metrics ----------

struct PerformanceMetrics {
    uint64_t total_requests = 0;
    uint64_t successful_requests = 0;
    uint64_t failed_requests = 0;
    double avg_response_time_ms = 0.0;
    double p95_response_time_ms = 0.0;
    double p99_response_time_ms = 0.0;
    uint64_t active_connections = 0;
};

/// Request counters, response-time percentiles over a bounded window of
/// recent samples, live connection count and registered health checks.
/// Thread-safe.
class Monitor {
public:
    struct Options {
        /// Response times kept for avg/p95/p99; older samples are dropped.
        std::size_t max_samples = 10000;
        /// Log every recorded request (debug on success, warn on failure).
        bool detailed_logging = false;
    };

    Monitor() : Monitor(Options{}) {}
    explicit Monitor(Options opts);

    Monitor(const Monitor&) = delete;
    Monitor& operator=(const Monitor&) = delete;

    /// Throws ConfigurationError{InvalidHandler} for a null check.
    void register_health_check(std::shared_ptr<IHealthCheck> check);

    /// Run every registered check in registration order.
    [[nodiscard]] HealthReport health_check() const;

    void record_request(const std::string& method, bool success,
                        std::optional<std::chrono::microseconds> elapsed,
                        const std::string& error_message = {});

    void connection_opened();
    void connection_closed();

    [[nodiscard]] PerformanceMetrics metrics() const;

private:
    void refresh_latencies();

    Options opts_;
    mutable std::mutex mutex_;
    PerformanceMetrics metrics_;
    std::deque<double> samples_ms_;
    std::vector<std::shared_ptr<IHealthCheck>> checks_;
};

/// Feeds every dispatched request into a Monitor. Register it first so its
/// timing also covers requests rejected by later middleware.
class MetricsMiddleware : public IMiddleware {
public:
    explicit MetricsMiddleware(std::shared_ptr<Monitor> monitor);

    void before_request(const JsonRpcRequest& request, const CallContext& ctx) override;
    void after_response(const JsonRpcRequest& request, const JsonRpcResponse& response,
                        const CallContext& ctx) override;

    [[nodiscard]] const std::shared_ptr<Monitor>& monitor() const noexcept { return monitor_; }

private:
    using Clock = std::chrono::steady_clock;

    std::shared_ptr<Monitor> monitor_;
    std::mutex mutex_;
    std::map<std::string, Clock::time_point> started_;  // keyed by session + id
};

void to_json(nlohmann::json& j, const HealthCheckResult& r);
void to_json(nlohmann::json& j, const HealthReport& r);
void to_json(nlohmann::json& j, const PerformanceMetrics& m);

} // namespace capwire
