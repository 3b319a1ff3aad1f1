#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace capwire {

/// Per-transport traffic counters. Counts are exact: one message per frame,
/// bytes as written to / read from the wire.
struct TransportStats {
    uint64_t messages_sent = 0;
    uint64_t messages_received = 0;
    uint64_t bytes_sent = 0;
    uint64_t bytes_received = 0;
    std::optional<std::chrono::system_clock::time_point> connection_time;
    std::optional<std::chrono::system_clock::time_point> last_activity;
};

/// Mutex-guarded stats owned by a single transport instance.
class StatsRecorder {
public:
    void mark_connected();
    void record_sent(std::size_t bytes);
    void record_received(std::size_t bytes);
    [[nodiscard]] TransportStats snapshot() const;

private:
    mutable std::mutex mutex_;
    TransportStats stats_;
};

/// A bidirectional channel of text frames, each carrying one envelope.
///
/// Implementations must allow one thread inside receive() while another
/// calls send(); concurrent senders are serialized by the caller.
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Write one complete frame. Throws TransportError.
    virtual void send(const std::string& frame) = 0;

    /// Block until one complete frame is available. Returns std::nullopt
    /// once the peer has closed the channel. Throws TransportError.
    virtual std::optional<std::string> receive() = 0;

    /// Release the channel. Safe to call more than once, and from another
    /// thread to unblock a pending receive().
    virtual void close() = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;

    [[nodiscard]] virtual std::string_view transport_type() const = 0;

    [[nodiscard]] virtual TransportStats stats() const = 0;
};

// ---------- Configuration ----------

struct StdioConfig {
    /// Child to spawn; when empty the current process's stdin/stdout is used.
    std::optional<std::string> command;
    std::vector<std::string> args;
};

struct WebSocketConfig {
    std::string url;
};

struct HttpConfig {
    std::string url;
};

struct CustomConfig {
    std::string name;
    std::map<std::string, std::string> options;
};

using TransportConfig = std::variant<StdioConfig, WebSocketConfig, HttpConfig, CustomConfig>;

using TransportCreator = std::function<std::unique_ptr<ITransport>(const CustomConfig&)>;

/// Builds a transport binding from a configuration value.
class TransportFactory {
public:
    /// Register a binding for CustomConfig{name}. Re-registering a name
    /// replaces the previous creator.
    static void register_custom(const std::string& name, TransportCreator creator);

    static bool unregister_custom(const std::string& name);

    /// Throws ConfigurationError{UnknownTransport} for an unregistered
    /// custom name and TransportError when the binding fails to connect.
    [[nodiscard]] static std::unique_ptr<ITransport> create(const TransportConfig& config);
};

} // namespace capwire
