#pragma once

#include <openxr/openxr.h>

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace xanchor {
namespace core {

// Opaque anchor identifier assigned by the anchor subsystem
using AnchorHandle = uint64_t;
static constexpr AnchorHandle XA_NULL_ANCHOR = 0;

enum class TrackingState : uint32_t {
    NOT_TRACKING = 0,
    LIMITED = 1,
    TRACKING = 2,
};

// Per-anchor companion data owned by the controller
struct AnchorRecord {
    AnchorHandle handle = XA_NULL_ANCHOR;
    XrPosef world_pose{{0.0f, 0.0f, 0.0f, 1.0f}, {0.0f, 0.0f, 0.0f}};
    TrackingState tracking_state = TrackingState::NOT_TRACKING;
    std::string persisted_name;  // empty when not persisted
    bool is_persisted = false;
};

// One anchor as reported by the subsystem in a change notification
struct AnchorChange {
    AnchorHandle handle = XA_NULL_ANCHOR;
    XrPosef pose{{0.0f, 0.0f, 0.0f, 1.0f}, {0.0f, 0.0f, 0.0f}};
    bool pose_valid = false;
    TrackingState tracking_state = TrackingState::NOT_TRACKING;
};

struct AnchorsChangedEvent {
    std::vector<AnchorChange> added;
    std::vector<AnchorChange> updated;
    std::vector<AnchorHandle> removed;
};

using AnchorsChangedCallback = std::function<void(const AnchorsChangedEvent&)>;

// Failures the controller absorbs and reports
enum class AnchorError : uint32_t {
    SUBSYSTEM_UNAVAILABLE = 1,
    CREATION_FAILED = 2,
    PERSIST_FAILED = 3,
    POSITION_UNAVAILABLE = 4,
};

using AnchorErrorCallback = std::function<void(AnchorError, const std::string&)>;

inline const char* AnchorErrorToString(AnchorError error) {
    switch (error) {
        case AnchorError::SUBSYSTEM_UNAVAILABLE:
            return "SubsystemUnavailable";
        case AnchorError::CREATION_FAILED:
            return "CreationFailed";
        case AnchorError::PERSIST_FAILED:
            return "PersistFailed";
        case AnchorError::POSITION_UNAVAILABLE:
            return "PositionUnavailable";
    }
    return "Unknown";
}

inline const char* TrackingStateToString(TrackingState state) {
    switch (state) {
        case TrackingState::NOT_TRACKING:
            return "NotTracking";
        case TrackingState::LIMITED:
            return "Limited";
        case TrackingState::TRACKING:
            return "Tracking";
    }
    return "Unknown";
}

}  // namespace core
}  // namespace xanchor
