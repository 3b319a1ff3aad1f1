#pragma once
#include <string>

namespace capwire::detail {

/// Random RFC 4122 version-4 identifier.
std::string generate_uuid();

} // namespace capwire::detail
