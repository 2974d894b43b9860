#pragma once

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

// ---------------------------------------------------------------------------
// Library-wide logger. Created on first use and registered with spdlog so that
// tools can adjust its level (logging::logger()->set_level(...)).
// ---------------------------------------------------------------------------
namespace logging {

constexpr const char* LOGGER_NAME = "rulebt";

inline std::shared_ptr<spdlog::logger> logger() {
    auto log = spdlog::get(LOGGER_NAME);
    if (!log) {
        log = spdlog::stderr_color_mt(LOGGER_NAME);
        log->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    }
    return log;
}

}  // namespace logging
