#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <optional>
#include <string_view>

namespace capwire {

class Codec {
public:
    /// Parse one text frame into an envelope.
    /// Throws FrameParseError on invalid JSON or missing required fields.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Serialize an envelope to a single-line frame (no trailing newline).
    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);

    /// Best-effort recovery of a request id from a frame that failed to
    /// parse as an envelope, so the peer can still be answered.
    [[nodiscard]] static std::optional<RequestId> recover_id(std::string_view raw) noexcept;

private:
    static JsonRpcMessage parse_object(const nlohmann::json& j);
};

} // namespace capwire
