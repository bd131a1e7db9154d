#include "provider_subsystem.h"

#include <cstring>
#include <sstream>
#include <utility>

#include "../logging.h"

namespace xanchor {
namespace host {

// Upper bound on poll_anchor_changes calls per frame
static constexpr int kMaxPollsPerUpdate = 16;

XrResult ToXrResult(XaResult result) {
    switch (result) {
        case XA_RESULT_SUCCESS:
            return XR_SUCCESS;
        case XA_RESULT_NAME_TAKEN:
            return XR_ERROR_SPATIAL_ANCHOR_NAME_INVALID_MSFT;
        case XA_RESULT_NAME_NOT_FOUND:
            return XR_ERROR_SPATIAL_ANCHOR_NAME_NOT_FOUND_MSFT;
        case XA_RESULT_ANCHOR_NOT_FOUND:
            return XR_ERROR_HANDLE_INVALID;
        case XA_RESULT_STORE_UNAVAILABLE:
            return XR_ERROR_FEATURE_UNSUPPORTED;
        case XA_RESULT_FAILURE:
        default:
            return XR_ERROR_RUNTIME_FAILURE;
    }
}

core::TrackingState ToTrackingState(XaTrackingState state) {
    switch (state) {
        case XA_TRACKING_STATE_TRACKING:
            return core::TrackingState::TRACKING;
        case XA_TRACKING_STATE_LIMITED:
            return core::TrackingState::LIMITED;
        case XA_TRACKING_STATE_NOT_TRACKING:
        default:
            return core::TrackingState::NOT_TRACKING;
    }
}

XrPosef ToXrPose(const XaPose& pose) {
    XrPosef result;
    result.orientation = XrQuaternionf{pose.orientation.x, pose.orientation.y, pose.orientation.z, pose.orientation.w};
    result.position = XrVector3f{pose.position.x, pose.position.y, pose.position.z};
    return result;
}

XaPose ToXaPose(const XrPosef& pose) {
    XaPose result;
    result.orientation = XaQuaternion{pose.orientation.x, pose.orientation.y, pose.orientation.z, pose.orientation.w};
    result.position = XaVector3f{pose.position.x, pose.position.y, pose.position.z};
    return result;
}

// ============================================================================
// ProviderAnchorStore
// ============================================================================

std::vector<std::string> ProviderAnchorStore::EnumeratePersistedNames() { return loader_.EnumeratePersistedNames(); }

core::AnchorHandle ProviderAnchorStore::LoadAnchor(const std::string& name) {
    return static_cast<core::AnchorHandle>(loader_.LoadAnchor(name.c_str()));
}

XrResult ProviderAnchorStore::PersistAnchor(core::AnchorHandle handle, const std::string& name) {
    if (name.empty() || name.size() >= XA_MAX_ANCHOR_NAME_SIZE) {
        return XR_ERROR_SPATIAL_ANCHOR_NAME_INVALID_MSFT;
    }
    return ToXrResult(loader_.PersistAnchor(static_cast<XaAnchorId>(handle), name.c_str()));
}

XrResult ProviderAnchorStore::UnpersistAnchor(const std::string& name) {
    return ToXrResult(loader_.UnpersistAnchor(name.c_str()));
}

// ============================================================================
// ProviderSubsystem
// ============================================================================

ProviderSubsystem::ProviderSubsystem(const ProviderLoader& loader)
    : loader_(loader), predicted_time_(0), next_registration_(1) {}

void ProviderSubsystem::Update(int64_t predicted_time) {
    predicted_time_ = predicted_time;
    UpdateDevices();

    core::AnchorsChangedEvent event = DrainAnchorChanges();
    if (event.added.empty() && event.updated.empty() && event.removed.empty()) {
        return;
    }

    // Copy so a subscriber may unregister from inside its callback
    std::map<uint64_t, core::AnchorsChangedCallback> callbacks = callbacks_;
    for (const auto& [registration, callback] : callbacks) {
        if (callbacks_.find(registration) != callbacks_.end()) {
            callback(event);
        }
    }
}

void ProviderSubsystem::UpdateDevices() {
    devices_.clear();

    XaDeviceState states[XA_MAX_DEVICES] = {};
    uint32_t count = 0;
    loader_.UpdateDevices(predicted_time_, states, &count);

    for (uint32_t i = 0; i < count && i < XA_MAX_DEVICES; i++) {
        // Providers may fill the whole buffer without a terminator
        std::string user_path(states[i].user_path, strnlen(states[i].user_path, sizeof(states[i].user_path)));
        if (!user_path.empty()) {
            devices_[user_path] = states[i];
        }
    }
}

core::AnchorsChangedEvent ProviderSubsystem::DrainAnchorChanges() {
    core::AnchorsChangedEvent event;
    XaAnchorChange changes[XA_MAX_ANCHOR_CHANGES] = {};

    for (int poll = 0; poll < kMaxPollsPerUpdate; poll++) {
        uint32_t count = 0;
        loader_.PollAnchorChanges(changes, XA_MAX_ANCHOR_CHANGES, &count);
        if (count > XA_MAX_ANCHOR_CHANGES) {
            LOG_ERROR("Provider reported more anchor changes than requested");
            count = XA_MAX_ANCHOR_CHANGES;
        }

        for (uint32_t i = 0; i < count; i++) {
            const XaAnchorChange& change = changes[i];
            if (change.anchor_id == XA_NULL_ANCHOR_ID) {
                continue;
            }

            if (change.kind == XA_ANCHOR_CHANGE_REMOVED) {
                event.removed.push_back(static_cast<core::AnchorHandle>(change.anchor_id));
                continue;
            }

            core::AnchorChange converted;
            converted.handle = static_cast<core::AnchorHandle>(change.anchor_id);
            converted.pose = ToXrPose(change.pose);
            converted.pose_valid = change.pose_valid != 0;
            converted.tracking_state = ToTrackingState(change.tracking_state);

            if (change.kind == XA_ANCHOR_CHANGE_ADDED) {
                event.added.push_back(converted);
            } else {
                event.updated.push_back(converted);
            }
        }

        if (count < XA_MAX_ANCHOR_CHANGES) {
            break;
        }
    }

    return event;
}

bool ProviderSubsystem::IsAvailable() const { return loader_.IsLoaded() && loader_.IsTrackingAvailable(); }

XrResult ProviderSubsystem::CreateAnchor(const XrPosef& pose, core::AnchorHandle& out_handle) {
    out_handle = core::XA_NULL_ANCHOR;
    if (!loader_.IsLoaded()) {
        return XR_ERROR_RUNTIME_FAILURE;
    }

    XaAnchorId anchor_id = loader_.CreateAnchor(ToXaPose(pose));
    if (anchor_id == XA_NULL_ANCHOR_ID) {
        return XR_ERROR_CREATE_SPATIAL_ANCHOR_FAILED_MSFT;
    }

    out_handle = static_cast<core::AnchorHandle>(anchor_id);
    return XR_SUCCESS;
}

std::future<std::shared_ptr<core::IAnchorStore>> ProviderSubsystem::LoadStoreAsync() {
    if (!loader_.HasStore()) {
        LOG_INFO("Provider has no anchor store");
        std::promise<std::shared_ptr<core::IAnchorStore>> unavailable;
        unavailable.set_value(nullptr);
        return unavailable.get_future();
    }

    const ProviderLoader* loader = &loader_;
    return std::async(std::launch::async, [loader]() -> std::shared_ptr<core::IAnchorStore> {
        if (!loader->OpenStore()) {
            LOG_ERROR("Provider failed to open its anchor store");
            return nullptr;
        }
        return std::make_shared<ProviderAnchorStore>(*loader);
    });
}

uint64_t ProviderSubsystem::RegisterAnchorsChangedCallback(core::AnchorsChangedCallback callback) {
    if (!callback) {
        LOG_ERROR("RegisterAnchorsChangedCallback: Null callback");
        return 0;
    }
    uint64_t registration = next_registration_++;
    callbacks_[registration] = std::move(callback);
    return registration;
}

void ProviderSubsystem::UnregisterAnchorsChangedCallback(uint64_t registration) {
    if (callbacks_.erase(registration) == 0) {
        std::ostringstream msg;
        msg << "UnregisterAnchorsChangedCallback: Unknown registration " << registration;
        LOG_ERROR(msg.str().c_str());
    }
}

bool ProviderSubsystem::GetInputStateBoolean(const char* user_path, const char* component_path,
                                             XrBool32& out_value) {
    uint32_t value = 0;
    if (!loader_.GetInputStateBoolean(predicted_time_, user_path, component_path, &value)) {
        return false;
    }
    out_value = value ? XR_TRUE : XR_FALSE;
    return true;
}

bool ProviderSubsystem::GetDevicePosition(const char* user_path, XrVector3f& out_position) {
    auto it = devices_.find(user_path);
    if (it == devices_.end() || !it->second.is_active) {
        return false;
    }
    const XaVector3f& position = it->second.pose.position;
    out_position = XrVector3f{position.x, position.y, position.z};
    return true;
}

}  // namespace host
}  // namespace xanchor
