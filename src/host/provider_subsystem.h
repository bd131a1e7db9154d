#pragma once

#include <openxr/openxr.h>

#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <xanchor_provider.h>

#include "../core/ianchor_subsystem.h"
#include "../core/igesture_input.h"
#include "provider_loader.h"

namespace xanchor {
namespace host {

// Conversions between the provider C ABI and the core types
XrResult ToXrResult(XaResult result);
core::TrackingState ToTrackingState(XaTrackingState state);
XrPosef ToXrPose(const XaPose& pose);
XaPose ToXaPose(const XrPosef& pose);

// Persisted anchor store backed by the provider's store callbacks
class ProviderAnchorStore : public core::IAnchorStore {
   public:
    explicit ProviderAnchorStore(const ProviderLoader& loader) : loader_(loader) {}

    std::vector<std::string> EnumeratePersistedNames() override;
    core::AnchorHandle LoadAnchor(const std::string& name) override;
    XrResult PersistAnchor(core::AnchorHandle handle, const std::string& name) override;
    XrResult UnpersistAnchor(const std::string& name) override;

   private:
    const ProviderLoader& loader_;
};

/**
 * Anchor subsystem and gesture input over a loaded provider
 *
 * Update() must run once per frame on the scheduling thread before the controller ticks: it
 * refreshes the tracked device table and delivers the provider's queued anchor changes to the
 * registered callbacks as one event.
 */
class ProviderSubsystem : public core::IAnchorSubsystem, public core::IGestureInput {
   public:
    explicit ProviderSubsystem(const ProviderLoader& loader);

    void Update(int64_t predicted_time);

    // IAnchorSubsystem interface implementation
    bool IsAvailable() const override;
    XrResult CreateAnchor(const XrPosef& pose, core::AnchorHandle& out_handle) override;
    std::future<std::shared_ptr<core::IAnchorStore>> LoadStoreAsync() override;
    uint64_t RegisterAnchorsChangedCallback(core::AnchorsChangedCallback callback) override;
    void UnregisterAnchorsChangedCallback(uint64_t registration) override;

    // IGestureInput interface implementation
    bool GetInputStateBoolean(const char* user_path, const char* component_path, XrBool32& out_value) override;
    bool GetDevicePosition(const char* user_path, XrVector3f& out_position) override;

    size_t GetCallbackCount() const { return callbacks_.size(); }

   private:
    void UpdateDevices();
    core::AnchorsChangedEvent DrainAnchorChanges();

    const ProviderLoader& loader_;
    int64_t predicted_time_;

    // Device table (user path -> latest state), rebuilt every Update
    std::unordered_map<std::string, XaDeviceState> devices_;

    // Ordered by registration so subscribers are called in the order they registered
    std::map<uint64_t, core::AnchorsChangedCallback> callbacks_;
    uint64_t next_registration_;
};

}  // namespace host
}  // namespace xanchor
