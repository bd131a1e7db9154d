#include "anchor_interaction_controller.h"

#include <chrono>
#include <exception>
#include <limits>
#include <sstream>
#include <utility>

#include "../common.h"
#include "../logging.h"
#include "pose_math.h"

namespace xanchor {
namespace core {

const char* ControllerStateToString(ControllerState state) {
    switch (state) {
        case ControllerState::UNINITIALIZED:
            return "Uninitialized";
        case ControllerState::AWAITING_STORE:
            return "AwaitingStore";
        case ControllerState::READY:
            return "Ready";
        case ControllerState::DISABLED:
            return "Disabled";
    }
    return "Unknown";
}

AnchorInteractionController::AnchorInteractionController(IAnchorSubsystem* subsystem, IGestureInput* input,
                                                         ISceneHost* scene, ControllerConfig config)
    : subsystem_(subsystem),
      input_(input),
      scene_(scene),
      config_(std::move(config)),
      name_generator_(config_.name_prefix, config_.name_suffix_length, config_.max_name_attempts,
                      config_.name_seed),
      state_(ControllerState::UNINITIALIZED),
      registration_(0),
      was_active_(config_.input_sources.size(), true),
      unavailable_logged_(false) {}

AnchorInteractionController::~AnchorInteractionController() { Teardown(); }

XrResult AnchorInteractionController::Initialize() {
    if (state_ != ControllerState::UNINITIALIZED) {
        LOG_ERROR("AnchorInteractionController::Initialize: Already initialized");
        return XR_ERROR_CALL_ORDER_INVALID;
    }

    if (!subsystem_ || !subsystem_->IsAvailable()) {
        ReportError(AnchorError::SUBSYSTEM_UNAVAILABLE,
                    "Anchor subsystem not available; anchor functionality will not be enabled");
        SetState(ControllerState::DISABLED);
        return XR_ERROR_FEATURE_UNSUPPORTED;
    }

    store_future_ = subsystem_->LoadStoreAsync();
    SetState(ControllerState::AWAITING_STORE);
    LOG_INFO("Anchor controller waiting for anchor store");

    // A subsystem without a store may hand back an empty future
    if (!store_future_.valid()) {
        OnStoreLoaded(nullptr);
    }
    return XR_SUCCESS;
}

void AnchorInteractionController::Tick() {
    if (state_ == ControllerState::AWAITING_STORE && store_future_.valid() &&
        store_future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
        std::shared_ptr<IAnchorStore> store;
        try {
            store = store_future_.get();
        } catch (const std::exception& e) {
            std::ostringstream msg;
            msg << "Loading the anchor store failed: " << e.what();
            LOG_ERROR(msg.str().c_str());
        }
        OnStoreLoaded(std::move(store));
    }

    // Must stay last so edges only come from genuine input transitions
    SampleGestures();
}

void AnchorInteractionController::Teardown() {
    if (subsystem_ && registration_ != 0) {
        subsystem_->UnregisterAnchorsChangedCallback(registration_);
        registration_ = 0;
    }

    anchors_.Clear();
    pending_loads_.clear();
    store_.reset();
    store_future_ = std::future<std::shared_ptr<IAnchorStore>>();
    was_active_.assign(config_.input_sources.size(), true);

    if (state_ != ControllerState::UNINITIALIZED) {
        LOG_INFO("Anchor controller torn down");
    }
    SetState(ControllerState::UNINITIALIZED);
}

void AnchorInteractionController::OnStoreLoaded(std::shared_ptr<IAnchorStore> store) {
    store_future_ = std::future<std::shared_ptr<IAnchorStore>>();

    registration_ = subsystem_->RegisterAnchorsChangedCallback(
        [this](const AnchorsChangedEvent& event) { OnAnchorsChanged(event); });
    if (registration_ == 0) {
        ReportError(AnchorError::SUBSYSTEM_UNAVAILABLE, "Could not subscribe to anchor change notifications");
        SetState(ControllerState::DISABLED);
        return;
    }

    SetState(ControllerState::READY);

    if (!store) {
        LOG_INFO("Anchor store not available, anchor persistence will not be enabled");
        return;
    }

    store_ = std::move(store);
    LoadPersistedAnchors();
}

// Loads are issued in the same step that subscribes, so notifications delivered through Tick always
// find the pending entry. A subsystem that reports the anchor from inside LoadAnchor has already
// inserted the record, which is then marked persisted directly.
void AnchorInteractionController::LoadPersistedAnchors() {
    for (const std::string& name : store_->EnumeratePersistedNames()) {
        AnchorHandle handle = store_->LoadAnchor(name);
        if (handle == XA_NULL_ANCHOR) {
            LOG_ERROR(("Persisted anchor could not be loaded: " + name).c_str());
            continue;
        }

        AnchorRecord* loaded = anchors_.Find(handle);
        if (loaded) {
            loaded->persisted_name = name;
            loaded->is_persisted = true;
            if (scene_) {
                scene_->UpdateAnchorVisual(*loaded);
            }
            continue;
        }
        pending_loads_[handle] = name;
    }

    std::ostringstream msg;
    msg << "Requested " << pending_loads_.size() << " persisted anchor(s) from the anchor store";
    LOG_INFO(msg.str().c_str());
}

bool AnchorInteractionController::IsActivating(const std::string& user_path) {
    XrBool32 value = XR_FALSE;
    if (input_->GetInputStateBoolean(user_path.c_str(), config_.primary_activation_component.c_str(), value)) {
        return value != XR_FALSE;
    }
    if (input_->GetInputStateBoolean(user_path.c_str(), config_.secondary_activation_component.c_str(), value)) {
        return value != XR_FALSE;
    }
    return false;
}

void AnchorInteractionController::SampleGestures() {
    if (!input_) {
        return;
    }

    for (size_t i = 0; i < config_.input_sources.size(); i++) {
        const std::string& source = config_.input_sources[i];
        bool active = IsActivating(source);

        if (active && !was_active_[i] && state_ == ControllerState::READY) {
            XrVector3f position{0.0f, 0.0f, 0.0f};
            if (input_->GetDevicePosition(source.c_str(), position)) {
                OnActivate(position);
            } else {
                ReportError(AnchorError::POSITION_UNAVAILABLE, "No position for " + source + ", activation ignored");
            }
        }
        was_active_[i] = active;
    }
}

void AnchorInteractionController::OnActivate(const XrVector3f& position) {
    if (state_ != ControllerState::READY || !subsystem_->IsAvailable()) {
        return;
    }

    // First, check if there is a nearby anchor to persist or forget
    if (!anchors_.Empty()) {
        float closest_distance = std::numeric_limits<float>::infinity();
        AnchorHandle closest = XA_NULL_ANCHOR;
        for (const AnchorRecord& record : anchors_.Records()) {
            float distance = Distance(position, record.world_pose.position);
            if (distance < closest_distance) {
                closest_distance = distance;
                closest = record.handle;
            }
        }

        if (closest != XA_NULL_ANCHOR && closest_distance < config_.proximity_threshold) {
            XrResult result = TogglePersistence(closest);
            if (XR_FAILED(result)) {
                LOG_DEBUG("Persistence toggle did not complete");
            }
            return;
        }
    }

    // No anchor nearby, create one facing away from the viewer
    XrVector3f viewer{0.0f, 0.0f, 0.0f};
    if (!input_ || !input_->GetDevicePosition(config_.viewer_path.c_str(), viewer)) {
        viewer = XrVector3f{0.0f, 0.0f, 0.0f};
    }

    XrVector3f forward{position.x - viewer.x, position.y - viewer.y, position.z - viewer.z};
    XrQuaternionf orientation = LookRotation(forward, XrVector3f{0.0f, 1.0f, 0.0f});

    XrResult result = AddAnchor(MakePose(position, orientation));
    if (XR_FAILED(result)) {
        LOG_DEBUG("Anchor creation will be retried on the next activation");
    }
}

XrResult AnchorInteractionController::AddAnchor(const XrPosef& pose) {
    if (state_ != ControllerState::READY) {
        LOG_ERROR("AddAnchor: Controller not ready");
        return XR_ERROR_CALL_ORDER_INVALID;
    }

    AnchorHandle handle = XA_NULL_ANCHOR;
    XrResult result = subsystem_->CreateAnchor(pose, handle);
    if (XR_SUCCEEDED(result) && handle == XA_NULL_ANCHOR) {
        result = XR_ERROR_RUNTIME_FAILURE;
    }
    if (XR_FAILED(result)) {
        ReportError(AnchorError::CREATION_FAILED, std::string("Anchor creation failed: ") + ResultToString(result));
        return result;
    }

    // The subsystem reports this anchor again as Added; that duplicate is ignored
    AnchorRecord record;
    record.handle = handle;
    record.world_pose = pose;
    record.tracking_state = TrackingState::TRACKING;
    if (anchors_.Insert(record) && scene_) {
        scene_->SpawnAnchorVisual(record);
    }

    LOG_INFO(("Anchor created: " + std::to_string(handle)).c_str());
    return XR_SUCCESS;
}

// Store calls may deliver change notifications that grow or shrink the anchor set, so the record is
// looked up again after each one instead of holding a pointer across the call.
XrResult AnchorInteractionController::TogglePersistence(AnchorHandle handle) {
    const AnchorRecord* current = anchors_.Find(handle);
    if (!current) {
        LOG_ERROR(("TogglePersistence: Unknown anchor " + std::to_string(handle)).c_str());
        return XR_ERROR_HANDLE_INVALID;
    }

    if (!store_) {
        LOG_INFO("Anchor store was not available");
        return XR_ERROR_FEATURE_UNSUPPORTED;
    }

    if (!current->is_persisted) {
        std::string name = name_generator_.Generate(CollectTakenNames());
        if (name.empty()) {
            ReportError(AnchorError::PERSIST_FAILED,
                        "Anchor could not be persisted, no free name: " + std::to_string(handle));
            return XR_ERROR_LIMIT_REACHED;
        }

        XrResult result = store_->PersistAnchor(handle, name);
        if (XR_FAILED(result)) {
            std::ostringstream msg;
            msg << "Anchor could not be persisted: " << handle << " (" << ResultToString(result) << ")";
            ReportError(AnchorError::PERSIST_FAILED, msg.str());
            return result;
        }

        AnchorRecord* record = anchors_.Find(handle);
        if (!record) {
            LOG_ERROR(("Anchor removed while being persisted: " + std::to_string(handle)).c_str());
            return XR_ERROR_HANDLE_INVALID;
        }
        record->persisted_name = name;
        record->is_persisted = true;
        LOG_INFO(("Anchor persisted: " + std::to_string(handle) + " as " + name).c_str());
    } else {
        std::string name = current->persisted_name;
        XrResult result = store_->UnpersistAnchor(name);
        if (XR_FAILED(result)) {
            std::ostringstream msg;
            msg << "Unpersisting " << name << " failed: " << ResultToString(result);
            LOG_ERROR(msg.str().c_str());
            if (config_.gate_unpersist_on_success) {
                return result;
            }
        }

        // Ungated, a rejected unpersist still forgets the name locally, so the toggle succeeded
        AnchorRecord* record = anchors_.Find(handle);
        if (!record) {
            LOG_ERROR(("Anchor removed while being forgotten: " + std::to_string(handle)).c_str());
            return XR_ERROR_HANDLE_INVALID;
        }
        record->persisted_name.clear();
        record->is_persisted = false;
        LOG_INFO(("Anchor forgotten: " + std::to_string(handle)).c_str());
    }

    if (scene_) {
        scene_->UpdateAnchorVisual(*anchors_.Find(handle));
    }
    return XR_SUCCESS;
}

std::unordered_set<std::string> AnchorInteractionController::CollectTakenNames() {
    std::unordered_set<std::string> taken;
    if (store_) {
        for (std::string& name : store_->EnumeratePersistedNames()) {
            taken.insert(std::move(name));
        }
    }
    for (const AnchorRecord& record : anchors_.Records()) {
        if (record.is_persisted) {
            taken.insert(record.persisted_name);
        }
    }
    for (const auto& pending : pending_loads_) {
        taken.insert(pending.second);
    }
    return taken;
}

void AnchorInteractionController::OnAnchorsChanged(const AnchorsChangedEvent& event) {
    if (state_ != ControllerState::READY) {
        LOG_DEBUG("Anchor change notification ignored, controller not ready");
        return;
    }

    for (const AnchorChange& added : event.added) {
        ProcessAddedAnchor(added);
    }

    for (const AnchorChange& updated : event.updated) {
        AnchorRecord* record = anchors_.Find(updated.handle);
        if (!record) {
            continue;
        }
        record->tracking_state = updated.tracking_state;
        if (updated.pose_valid) {
            record->world_pose = updated.pose;
        }
        if (scene_) {
            scene_->UpdateAnchorVisual(*record);
        }
    }

    for (AnchorHandle removed : event.removed) {
        if (anchors_.Erase(removed)) {
            LOG_INFO(("Anchor removed: " + std::to_string(removed)).c_str());
            if (scene_) {
                scene_->DestroyAnchorVisual(removed);
            }
        }
    }
}

void AnchorInteractionController::ProcessAddedAnchor(const AnchorChange& change) {
    // Anchors created by AddAnchor are reported again here; those double adds are ignored
    if (change.handle == XA_NULL_ANCHOR || anchors_.Contains(change.handle)) {
        return;
    }

    AnchorRecord record;
    record.handle = change.handle;
    record.tracking_state = change.tracking_state;
    if (change.pose_valid) {
        record.world_pose = change.pose;
    }

    auto pending = pending_loads_.find(change.handle);
    if (pending != pending_loads_.end()) {
        record.persisted_name = pending->second;
        record.is_persisted = true;
        pending_loads_.erase(pending);
    }

    anchors_.Insert(record);
    LOG_INFO(("Anchor added: " + std::to_string(record.handle) +
              (record.is_persisted ? " (persisted as " + record.persisted_name + ")" : std::string()))
                 .c_str());
    if (scene_) {
        scene_->SpawnAnchorVisual(record);
    }
}

void AnchorInteractionController::SetState(ControllerState state) {
    if (state_ != state) {
        std::ostringstream msg;
        msg << "Anchor controller: " << ControllerStateToString(state_) << " -> " << ControllerStateToString(state);
        LOG_DEBUG(msg.str().c_str());
    }
    state_ = state;
}

void AnchorInteractionController::ReportError(AnchorError error, const std::string& message) {
    std::string line = std::string("[") + AnchorErrorToString(error) + "] " + message;
    if (error == AnchorError::POSITION_UNAVAILABLE) {
        LOG_DEBUG(line.c_str());
    } else if (error != AnchorError::SUBSYSTEM_UNAVAILABLE || !unavailable_logged_) {
        LOG_ERROR(line.c_str());
    }
    if (error == AnchorError::SUBSYSTEM_UNAVAILABLE) {
        unavailable_logged_ = true;
    }

    if (error_callback_) {
        error_callback_(error, message);
    }
}

}  // namespace core
}  // namespace xanchor
