#include "capwire/transport/transport.hpp"
#include "capwire/transport/stream_transport.hpp"
#include "capwire/transport/websocket_transport.hpp"
#include "capwire/transport/http_transport.hpp"
#include "capwire/error.hpp"

namespace capwire {

// ---------- StatsRecorder ----------

void StatsRecorder::mark_connected() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = std::chrono::system_clock::now();
    stats_.connection_time = now;
    stats_.last_activity = now;
}

void StatsRecorder::record_sent(std::size_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.messages_sent;
    stats_.bytes_sent += bytes;
    stats_.last_activity = std::chrono::system_clock::now();
}

void StatsRecorder::record_received(std::size_t bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.messages_received;
    stats_.bytes_received += bytes;
    stats_.last_activity = std::chrono::system_clock::now();
}

TransportStats StatsRecorder::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

// ---------- TransportFactory ----------

namespace {

struct CustomRegistry {
    std::mutex mutex;
    std::map<std::string, TransportCreator> creators;
};

CustomRegistry& custom_registry() {
    static CustomRegistry registry;
    return registry;
}

} // namespace

void TransportFactory::register_custom(const std::string& name, TransportCreator creator) {
    if (!creator) {
        throw ConfigurationError(ConfigurationError::Kind::InvalidHandler,
                                 "Transport creator for '" + name + "' is empty");
    }
    auto& reg = custom_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    reg.creators[name] = std::move(creator);
}

bool TransportFactory::unregister_custom(const std::string& name) {
    auto& reg = custom_registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return reg.creators.erase(name) > 0;
}

std::unique_ptr<ITransport> TransportFactory::create(const TransportConfig& config) {
    if (const auto* stdio = std::get_if<StdioConfig>(&config)) {
        if (!stdio->command) return StreamTransport::current_process();
        return StreamTransport::spawn(*stdio->command, stdio->args);
    }
    if (const auto* ws = std::get_if<WebSocketConfig>(&config)) {
        return std::make_unique<WebSocketTransport>(ws->url);
    }
    if (const auto* http = std::get_if<HttpConfig>(&config)) {
        return std::make_unique<HttpTransport>(http->url);
    }

    const auto& custom = std::get<CustomConfig>(config);
    TransportCreator creator;
    {
        auto& reg = custom_registry();
        std::lock_guard<std::mutex> lock(reg.mutex);
        auto it = reg.creators.find(custom.name);
        if (it == reg.creators.end()) {
            throw ConfigurationError(ConfigurationError::Kind::UnknownTransport,
                                     "Unknown custom transport: " + custom.name);
        }
        creator = it->second;
    }
    return creator(custom);
}

} // namespace capwire
