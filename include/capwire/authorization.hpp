#pragma once
#include "registry.hpp"
#include <map>
#include <optional>
#include <string>

namespace capwire {

/// Per-call facts the dispatcher needs besides the request itself.
struct CallContext {
    std::string session_id;
    std::optional<std::string> subject_id;   // session default subject
    std::optional<std::string> client_ip;
};

/// Decides whether a subject may invoke a capability. `context` holds the
/// request's `params.context` entries rendered as strings, plus `method`,
/// `session_id` and, when known, `user_id` and `client_ip`.
class IAuthorizer {
public:
    virtual ~IAuthorizer() = default;

    virtual bool check(const std::string& subject_id,
                       Category category,
                       const std::string& name,
                       const std::map<std::string, std::string>& context) = 0;
};

} // namespace capwire
