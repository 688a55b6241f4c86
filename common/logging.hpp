#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <memory>
#include <string>

namespace geomill {
namespace logging {

// Map a GEOMILL_LOG_LEVEL value to a spdlog level (unknown names keep info)
inline spdlog::level::level_enum level_from_name(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "warn") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::info;
}

// Shared logger. The library is loaded into a host process, so output goes
// to stderr and never to stdout.
inline std::shared_ptr<spdlog::logger> get_logger() {
    static std::shared_ptr<spdlog::logger> logger = []() {
        auto existing = spdlog::get("geomill");
        if (existing) {
            return existing;
        }
        auto log = spdlog::stderr_color_mt("geomill");
        log->set_pattern("[%H:%M:%S.%e] [geomill] [%^%l%$] %v");

        const char* level_env = std::getenv("GEOMILL_LOG_LEVEL");
        log->set_level(level_env ? level_from_name(level_env) : spdlog::level::info);
        return log;
    }();
    return logger;
}

}  // namespace logging
}  // namespace geomill
