#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace arbor {
namespace logging {

// Library-wide "arbor" logger writing to stderr. The initial level comes
// from ARBOR_LOG_LEVEL (trace|debug|info|warn|error|off), default warn.
std::shared_ptr<spdlog::logger> logger();

void set_level(spdlog::level::level_enum level);

// Parses a level name; throws ValueError on unknown names.
spdlog::level::level_enum parse_level(const std::string &name);

} // namespace logging
} // namespace arbor
