#include "capwire/monitoring.hpp"
#include "capwire/error.hpp"
#include "capwire/log.hpp"
#include <algorithm>
#include <numeric>

namespace capwire {

std::string_view to_string(HealthStatus status) {
    switch (status) {
        case HealthStatus::Healthy:   return "healthy";
        case HealthStatus::Degraded:  return "degraded";
        case HealthStatus::Unhealthy: return "unhealthy";
        case HealthStatus::Unknown:   return "unknown";
    }
    return "unknown";
}

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::microseconds since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start);
}

// Nearest-rank on an ascending sample set: index floor(n * q), clamped.
double percentile(const std::vector<double>& sorted, double q) {
    if (sorted.empty()) return 0.0;
    auto idx = static_cast<std::size_t>(static_cast<double>(sorted.size()) * q);
    return sorted[std::min(idx, sorted.size() - 1)];
}

std::string timing_key(const JsonRpcRequest& request, const CallContext& ctx) {
    return ctx.session_id + "/" + to_string(request.id);
}

} // namespace

// ---------- Monitor ----------

Monitor::Monitor(Options opts)
    : opts_(opts) {
    if (opts_.max_samples == 0) opts_.max_samples = 1;
}

void Monitor::register_health_check(std::shared_ptr<IHealthCheck> check) {
    if (!check) {
        throw ConfigurationError(ConfigurationError::Kind::InvalidHandler, "Null health check");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    checks_.push_back(std::move(check));
}

HealthReport Monitor::health_check() const {
    std::vector<std::shared_ptr<IHealthCheck>> checks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        checks = checks_;
    }

    HealthReport report;
    auto started = Clock::now();
    for (const auto& check : checks) {
        auto check_started = Clock::now();
        HealthCheckResult result;
        try {
            result = check->check();
        } catch (const std::exception& e) {
            result.status = HealthStatus::Unhealthy;
            result.message = e.what();
        }
        if (result.name.empty()) result.name = check->name();
        if (result.duration.count() == 0) result.duration = since(check_started);

        if (result.status > report.status) report.status = result.status;
        if (result.status != HealthStatus::Healthy) {
            logger()->warn("health check '{}' is {}{}{}", result.name, to_string(result.status),
                           result.message ? ": " : "", result.message.value_or(""));
        }
        report.checks.push_back(std::move(result));
    }
    report.total_duration = since(started);
    return report;
}

void Monitor::record_request(const std::string& method, bool success,
                             std::optional<std::chrono::microseconds> elapsed,
                             const std::string& error_message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++metrics_.total_requests;
        if (success) {
            ++metrics_.successful_requests;
        } else {
            ++metrics_.failed_requests;
        }
        if (elapsed) {
            samples_ms_.push_back(static_cast<double>(elapsed->count()) / 1000.0);
            while (samples_ms_.size() > opts_.max_samples) samples_ms_.pop_front();
            refresh_latencies();
        }
    }

    if (!opts_.detailed_logging) return;
    const long long us = elapsed ? static_cast<long long>(elapsed->count()) : -1;
    if (success) {
        logger()->debug("request {} completed in {}us", method, us);
    } else {
        logger()->warn("request {} failed in {}us: {}", method, us,
                       error_message.empty() ? "unknown error" : error_message);
    }
}

void Monitor::refresh_latencies() {
    std::vector<double> sorted(samples_ms_.begin(), samples_ms_.end());
    std::sort(sorted.begin(), sorted.end());
    metrics_.avg_response_time_ms =
        std::accumulate(sorted.begin(), sorted.end(), 0.0) / static_cast<double>(sorted.size());
    metrics_.p95_response_time_ms = percentile(sorted, 0.95);
    metrics_.p99_response_time_ms = percentile(sorted, 0.99);
}

void Monitor::connection_opened() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++metrics_.active_connections;
}

void Monitor::connection_closed() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (metrics_.active_connections > 0) --metrics_.active_connections;
}

PerformanceMetrics Monitor::metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metrics_;
}

// ---------- MetricsMiddleware ----------

MetricsMiddleware::MetricsMiddleware(std::shared_ptr<Monitor> monitor)
    : monitor_(std::move(monitor)) {
    if (!monitor_) {
        throw ConfigurationError(ConfigurationError::Kind::InvalidHandler, "MetricsMiddleware needs a monitor");
    }
}

void MetricsMiddleware::before_request(const JsonRpcRequest& request, const CallContext& ctx) {
    std::lock_guard<std::mutex> lock(mutex_);
    started_[timing_key(request, ctx)] = Clock::now();
}

void MetricsMiddleware::after_response(const JsonRpcRequest& request, const JsonRpcResponse& response,
                                       const CallContext& ctx) {
    std::optional<std::chrono::microseconds> elapsed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = started_.find(timing_key(request, ctx));
        if (it != started_.end()) {
            elapsed = since(it->second);
            started_.erase(it);
        }
    }
    monitor_->record_request(request.method, !response.error.has_value(), elapsed,
                             response.error ? response.error->message : std::string());
}

// ---------- JSON ----------

void to_json(nlohmann::json& j, const HealthCheckResult& r) {
    j = nlohmann::json::object();
    j["name"] = r.name;
    j["status"] = std::string(to_string(r.status));
    if (r.message) j["message"] = *r.message;
    j["duration_us"] = r.duration.count();
}

void to_json(nlohmann::json& j, const HealthReport& r) {
    j = nlohmann::json::object();
    j["status"] = std::string(to_string(r.status));
    j["checks"] = nlohmann::json::array();
    for (const auto& c : r.checks) {
        nlohmann::json cj;
        to_json(cj, c);
        j["checks"].push_back(std::move(cj));
    }
    j["total_duration_us"] = r.total_duration.count();
}

void to_json(nlohmann::json& j, const PerformanceMetrics& m) {
    j = {
        {"total_requests", m.total_requests},
        {"successful_requests", m.successful_requests},
        {"failed_requests", m.failed_requests},
        {"avg_response_time_ms", m.avg_response_time_ms},
        {"p95_response_time_ms", m.p95_response_time_ms},
        {"p99_response_time_ms", m.p99_response_time_ms},
        {"active_connections", m.active_connections}
    };
}

} // namespace capwire
