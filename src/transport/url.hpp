#pragma once
#include "capwire/error.hpp"
#include <string>

namespace capwire::detail {

struct Url {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;  // path and query, always starts with '/'
};

/// Split `scheme://host[:port][/target]`. Throws
/// TransportError{ConnectionFailed} for anything else.
inline Url parse_url(const std::string& url, const std::string& default_port) {
    Url out;
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        throw TransportError(TransportError::Kind::ConnectionFailed, "Invalid URL: " + url);
    }
    out.scheme = url.substr(0, scheme_end);
    std::string rest = url.substr(scheme_end + 3);

    auto slash = rest.find('/');
    std::string hostport = slash == std::string::npos ? rest : rest.substr(0, slash);
    out.target = slash == std::string::npos ? "/" : rest.substr(slash);

    if (!hostport.empty() && hostport.front() == '[') {
        // [v6addr]:port
        auto close = hostport.find(']');
        if (close == std::string::npos) {
            throw TransportError(TransportError::Kind::ConnectionFailed, "Invalid URL: " + url);
        }
        out.host = hostport.substr(1, close - 1);
        if (close + 1 < hostport.size() && hostport[close + 1] == ':') {
            out.port = hostport.substr(close + 2);
        }
    } else {
        auto colon = hostport.rfind(':');
        if (colon == std::string::npos) {
            out.host = hostport;
        } else {
            out.host = hostport.substr(0, colon);
            out.port = hostport.substr(colon + 1);
        }
    }
    if (out.port.empty()) out.port = default_port;
    if (out.host.empty()) {
        throw TransportError(TransportError::Kind::ConnectionFailed, "URL has no host: " + url);
    }
    return out;
}

} // namespace capwire::detail
