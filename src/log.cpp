#include "capwire/log.hpp"
#include "capwire/error.hpp"
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>

namespace capwire {

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        auto existing = spdlog::get("capwire");
        if (existing) return existing;
        auto created = spdlog::stderr_color_mt("capwire");
        created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        created->set_level(spdlog::level::info);
        spdlog::cfg::load_env_levels();
        return created;
    }();
    return instance;
}

void set_log_level(std::string_view level) {
    std::string name(level);
    auto parsed = spdlog::level::from_str(name);
    // from_str maps unknown names to "off"; only accept "off" when asked for it.
    if (parsed == spdlog::level::off && name != "off") {
        throw ConfigurationError(ConfigurationError::Kind::InvalidValue,
                                 "Unknown log level: " + name);
    }
    set_log_level(parsed);
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace capwire
