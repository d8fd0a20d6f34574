#include "arbor/log.hpp"
#include "arbor/error.hpp"

#include <cstdlib>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace arbor {
namespace logging {

namespace {

std::shared_ptr<spdlog::logger> create_logger() {
    auto existing = spdlog::get("arbor");
    if (existing)
        return existing;

    auto lg = spdlog::stderr_color_mt("arbor");
    lg->set_pattern("[%H:%M:%S.%e] [arbor] [%^%l%$] %v");

    spdlog::level::level_enum level = spdlog::level::warn;
    if (const char *env = std::getenv("ARBOR_LOG_LEVEL")) {
        try {
            level = parse_level(env);
        } catch (const ValueError &e) {
            lg->warn("ignoring ARBOR_LOG_LEVEL: {}", e.what());
        }
    }
    lg->set_level(level);
    return lg;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> instance = create_logger();
    return instance;
}

void set_level(spdlog::level::level_enum level) { logger()->set_level(level); }

spdlog::level::level_enum parse_level(const std::string &name) {
    if (name == "trace")
        return spdlog::level::trace;
    if (name == "debug")
        return spdlog::level::debug;
    if (name == "info")
        return spdlog::level::info;
    if (name == "warn" || name == "warning")
        return spdlog::level::warn;
    if (name == "error")
        return spdlog::level::err;
    if (name == "off")
        return spdlog::level::off;
    throw ValueError::invalid_option("log_level", name);
}

} // namespace logging
} // namespace arbor
