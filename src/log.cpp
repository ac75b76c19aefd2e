// =============================================================================
// log.cpp - Library logger
// =============================================================================

#include "swaptrade/log.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>

namespace swaptrade {

namespace {
constexpr const char* LOGGER_NAME = "swaptrade";
}

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = [] {
        auto existing = spdlog::get(LOGGER_NAME);
        if (existing) return existing;
        auto created = spdlog::stderr_color_mt(LOGGER_NAME);
        created->set_level(spdlog::level::warn);
        created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        return created;
    }();
    return instance;
}

bool set_log_level(std::string_view level) {
    std::string name{level};
    auto parsed = spdlog::level::from_str(name);
    // from_str maps anything unknown to off
    if (parsed == spdlog::level::off && name != "off") {
        return false;
    }
    logger()->set_level(parsed);
    return true;
}

} // namespace swaptrade
