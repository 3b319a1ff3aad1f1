#pragma once
#include <memory>
#include <string_view>
#include <spdlog/spdlog.h>

namespace capwire {

/// The library-wide "capwire" logger. It writes to stderr so that a
/// stdio-served session never mixes log lines into its frame stream.
/// Levels from SPDLOG_LEVEL are applied on first use.
std::shared_ptr<spdlog::logger> logger();

/// Set the library log level by name ("trace", "debug", "info", "warn",
/// "error", "critical", "off"). Throws ConfigurationError on unknown names.
void set_log_level(std::string_view level);

void set_log_level(spdlog::level::level_enum level);

} // namespace capwire
