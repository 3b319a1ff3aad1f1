#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace capwire {

namespace error {
    constexpr int ParseError       = -32700;
    constexpr int InvalidRequest   = -32600;
    constexpr int MethodNotFound   = -32601;
    constexpr int InvalidParams    = -32602;
    constexpr int InternalError    = -32603;
    constexpr int PermissionDenied = -32000;
    constexpr int RateLimited      = -32001;
    constexpr int ResourceNotFound = -32002;
} // namespace error

/// Machine-readable strings carried in `error.data.kind`.
namespace error_kind {
    constexpr std::string_view ParseError       = "parse_error";
    constexpr std::string_view InvalidRequest   = "invalid_request";
    constexpr std::string_view MethodNotFound   = "method_not_found";
    constexpr std::string_view InvalidParams    = "invalid_params";
    constexpr std::string_view MissingParameter = "missing_parameter";
    constexpr std::string_view PermissionDenied = "permission_denied";
    constexpr std::string_view RateLimited      = "rate_limited";
    constexpr std::string_view InternalError    = "internal_error";
    constexpr std::string_view ShuttingDown     = "shutting_down";
} // namespace error_kind

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class TransportError : public Error {
public:
    enum class Kind { NotReady, ConnectionFailed, Io, Disconnected };

    TransportError(Kind kind, const std::string& msg)
        : Error(msg), kind_(kind) {}

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

class CorrelationError : public Error {
public:
    enum class Kind { Timeout, Cancelled, Malformed };

    CorrelationError(Kind kind, const std::string& msg)
        : Error(msg), kind_(kind) {}

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

/// Thrown by Codec when a frame is not a valid envelope.
class FrameParseError : public CorrelationError {
public:
    explicit FrameParseError(const std::string& msg)
        : CorrelationError(Kind::Malformed, msg) {}
};

/// An error that maps onto a JSON-RPC error envelope.
class DispatchError : public Error {
public:
    DispatchError(int code, std::string kind, const std::string& msg,
                  std::optional<nlohmann::json> data = std::nullopt)
        : Error(msg), code_(code), kind_(std::move(kind)), data_(std::move(data)) {}

    [[nodiscard]] int code() const noexcept { return code_; }
    [[nodiscard]] const std::string& kind() const noexcept { return kind_; }
    [[nodiscard]] const std::optional<nlohmann::json>& data() const noexcept { return data_; }

private:
    int code_;
    std::string kind_;
    std::optional<nlohmann::json> data_;
};

/// Thrown from capability handlers to report a domain failure, e.g.
/// `throw HandlerError("invalid_url", "URL must start with http");`
class HandlerError : public DispatchError {
public:
    HandlerError(std::string kind, const std::string& msg,
                 int code = error::InternalError,
                 std::optional<nlohmann::json> data = std::nullopt)
        : DispatchError(code, std::move(kind), msg, std::move(data)) {}
};

class ConfigurationError : public Error {
public:
    enum class Kind { DuplicateName, InvalidSchema, InvalidHandler, UnknownTransport, InvalidValue };

    ConfigurationError(Kind kind, const std::string& msg)
        : Error(msg), kind_(kind) {}

    [[nodiscard]] Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

} // namespace capwire
