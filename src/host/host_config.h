#pragma once

#include <functional>
#include <string>

#include "../core/controller_config.h"
#include "../logging.h"

namespace xanchor {
namespace host {

struct HostConfig {
    std::string providers_dir;  // empty = "providers" next to the executable
    double tick_hz = 60.0;
    double run_seconds = 0.0;  // 0 = run until interrupted
#ifdef NDEBUG
    LogLevel log_level = LogLevel::INFO;
#else
    LogLevel log_level = LogLevel::DEBUG;
#endif
    core::ControllerConfig controller;
};

// Returns the value of an environment variable or nullptr
using EnvironmentLookup = std::function<const char*(const char*)>;

// Overrides from XANCHOR_* environment variables. Invalid values are logged and ignored.
void ApplyEnvironment(HostConfig& config, const EnvironmentLookup& lookup);

// Defaults plus overrides from the process environment
HostConfig LoadHostConfig();

bool ParseLogLevel(const std::string& text, LogLevel& out_level);

}  // namespace host
}  // namespace xanchor
