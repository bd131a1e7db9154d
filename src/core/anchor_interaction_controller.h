#pragma once

#include <openxr/openxr.h>

#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "anchor_name_generator.h"
#include "anchor_set.h"
#include "anchor_types.h"
#include "controller_config.h"
#include "ianchor_subsystem.h"
#include "igesture_input.h"
#include "iscene_host.h"

namespace xanchor {
namespace core {

enum class ControllerState : uint32_t {
    UNINITIALIZED = 0,
    AWAITING_STORE = 1,
    READY = 2,
    DISABLED = 3,
};

const char* ControllerStateToString(ControllerState state);

/**
 * Air-tap driven anchor creation and persistence toggling
 *
 * A rising activation edge on an input source either toggles persistence of the nearest tracked
 * anchor (when closer than the proximity threshold) or asks the subsystem for a new anchor at the
 * source position. Anchors loaded from the persisted store are recognized by the handle returned
 * from the load request when their Added notification arrives.
 *
 * Single-threaded: Tick(), the change callback and every public method must be called from the
 * host's scheduling thread. Collaborators are not owned and must outlive the controller.
 */
class AnchorInteractionController {
   public:
    AnchorInteractionController(IAnchorSubsystem* subsystem, IGestureInput* input, ISceneHost* scene,
                                ControllerConfig config = ControllerConfig());
    ~AnchorInteractionController();

    AnchorInteractionController(const AnchorInteractionController&) = delete;
    AnchorInteractionController& operator=(const AnchorInteractionController&) = delete;

    // Lifecycle
    XrResult Initialize();
    void Tick();

    // Unregisters and discards all state. Called while the store is still opening, this waits for the
    // subsystem's LoadStoreAsync future to finish when that future blocks on destruction
    // (std::async), so a store open that never completes also stalls Teardown.
    void Teardown();

    // Gesture handling. SampleGestures runs last in Tick().
    void SampleGestures();
    void OnActivate(const XrVector3f& position);

    XrResult AddAnchor(const XrPosef& pose);
    XrResult TogglePersistence(AnchorHandle handle);

    // Subsystem change notification
    void OnAnchorsChanged(const AnchorsChangedEvent& event);

    ControllerState GetState() const { return state_; }
    bool HasStore() const { return store_ != nullptr; }
    const std::vector<AnchorRecord>& GetAnchors() const { return anchors_.Records(); }
    const AnchorRecord* FindAnchor(AnchorHandle handle) const { return anchors_.Find(handle); }
    const std::unordered_map<AnchorHandle, std::string>& GetPendingLoads() const { return pending_loads_; }

    void SetErrorCallback(AnchorErrorCallback callback) { error_callback_ = std::move(callback); }

   private:
    void SetState(ControllerState state);
    void OnStoreLoaded(std::shared_ptr<IAnchorStore> store);
    void LoadPersistedAnchors();
    void ProcessAddedAnchor(const AnchorChange& change);
    bool IsActivating(const std::string& user_path);
    std::unordered_set<std::string> CollectTakenNames();
    void ReportError(AnchorError error, const std::string& message);

    IAnchorSubsystem* subsystem_;
    IGestureInput* input_;
    ISceneHost* scene_;
    ControllerConfig config_;
    AnchorNameGenerator name_generator_;

    ControllerState state_;
    std::future<std::shared_ptr<IAnchorStore>> store_future_;
    std::shared_ptr<IAnchorStore> store_;
    uint64_t registration_;

    AnchorSet anchors_;
    std::unordered_map<AnchorHandle, std::string> pending_loads_;
    std::vector<bool> was_active_;

    AnchorErrorCallback error_callback_;
    bool unavailable_logged_;
};

}  // namespace core
}  // namespace xanchor
