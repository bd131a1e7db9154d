#include "host_config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace xanchor {
namespace host {

// The frame period is converted to integer nanoseconds, so rates outside this range are not usable
static constexpr double kMinTickHz = 1.0;
static constexpr double kMaxTickHz = 1000.0;

static bool ParsePositive(const char* text, double& out_value) {
    char* end = nullptr;
    double value = std::strtod(text, &end);
    if (end == text || *end != '\0' || !(value > 0.0)) {
        return false;
    }
    out_value = value;
    return true;
}

static bool ParseBool(const std::string& text, bool& out_value) {
    if (text == "1" || text == "true" || text == "on" || text == "yes") {
        out_value = true;
        return true;
    }
    if (text == "0" || text == "false" || text == "off" || text == "no") {
        out_value = false;
        return true;
    }
    return false;
}

static void LogInvalid(const char* variable, const char* value) {
    LOG_ERROR((std::string("Ignoring invalid ") + variable + "=" + value).c_str());
}

bool ParseLogLevel(const std::string& text, LogLevel& out_level) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") {
        out_level = LogLevel::DEBUG;
    } else if (lower == "info") {
        out_level = LogLevel::INFO;
    } else if (lower == "error") {
        out_level = LogLevel::LOG_ERROR;
    } else {
        return false;
    }
    return true;
}

void ApplyEnvironment(HostConfig& config, const EnvironmentLookup& lookup) {
    if (const char* value = lookup("XANCHOR_PROVIDERS_DIR")) {
        if (*value != '\0') {
            config.providers_dir = value;
        }
    }

    if (const char* value = lookup("XANCHOR_TICK_HZ")) {
        double tick_hz = 0.0;
        if (!ParsePositive(value, tick_hz)) {
            LogInvalid("XANCHOR_TICK_HZ", value);
        } else {
            config.tick_hz = std::min(std::max(tick_hz, kMinTickHz), kMaxTickHz);
            if (config.tick_hz != tick_hz) {
                LOG_INFO(("XANCHOR_TICK_HZ=" + std::string(value) + " clamped to " +
                          std::to_string(config.tick_hz))
                             .c_str());
            }
        }
    }

    if (const char* value = lookup("XANCHOR_RUN_SECONDS")) {
        if (!ParsePositive(value, config.run_seconds)) {
            LogInvalid("XANCHOR_RUN_SECONDS", value);
        }
    }

    if (const char* value = lookup("XANCHOR_LOG_LEVEL")) {
        if (!ParseLogLevel(value, config.log_level)) {
            LogInvalid("XANCHOR_LOG_LEVEL", value);
        }
    }

    if (const char* value = lookup("XANCHOR_PROXIMITY_THRESHOLD")) {
        double threshold = 0.0;
        if (ParsePositive(value, threshold)) {
            config.controller.proximity_threshold = static_cast<float>(threshold);
        } else {
            LogInvalid("XANCHOR_PROXIMITY_THRESHOLD", value);
        }
    }

    if (const char* value = lookup("XANCHOR_GATE_UNPERSIST")) {
        if (!ParseBool(value, config.controller.gate_unpersist_on_success)) {
            LogInvalid("XANCHOR_GATE_UNPERSIST", value);
        }
    }
}

HostConfig LoadHostConfig() {
    HostConfig config;
    ApplyEnvironment(config, [](const char* name) -> const char* { return std::getenv(name); });
    return config;
}

}  // namespace host
}  // namespace xanchor
