#pragma once

#include <openxr/openxr.h>

#include <future>
#include <memory>
#include <string>
#include <vector>

#include "anchor_types.h"

namespace xanchor {
namespace core {

/**
 * Persisted-anchor store opened from the anchor subsystem
 *
 * Names are unique within a store. LoadAnchor returns the handle the anchor will use once it
 * has loaded; the anchor data itself arrives later through the subsystem's change events.
 * Implementations should not deliver change notifications from inside these calls. The controller
 * tolerates it, but only notifications delivered after the call returns keep the normal order.
 */
class IAnchorStore {
   public:
    virtual ~IAnchorStore() = default;

    virtual std::vector<std::string> EnumeratePersistedNames() = 0;

    // Returns XA_NULL_ANCHOR if the name could not be loaded
    virtual AnchorHandle LoadAnchor(const std::string& name) = 0;

    virtual XrResult PersistAnchor(AnchorHandle handle, const std::string& name) = 0;
    virtual XrResult UnpersistAnchor(const std::string& name) = 0;
};

/**
 * Interface for the platform anchor subsystem - allows dependency injection for testing
 *
 * The controller only forwards requests here; tracking, relocalization and storage are the
 * subsystem's business. Change notifications must be delivered on the scheduling thread.
 */
class IAnchorSubsystem {
   public:
    virtual ~IAnchorSubsystem() = default;

    virtual bool IsAvailable() const = 0;

    // Anchor creation
    virtual XrResult CreateAnchor(const XrPosef& pose, AnchorHandle& out_handle) = 0;

    // Opening the store may take an unbounded time; a null store means persistence is unavailable
    virtual std::future<std::shared_ptr<IAnchorStore>> LoadStoreAsync() = 0;

    // Change notifications, delivered on the scheduling thread and never from inside a call the
    // subscriber is making on this subsystem or its store. Register returns 0 on failure.
    virtual uint64_t RegisterAnchorsChangedCallback(AnchorsChangedCallback callback) = 0;
    virtual void UnregisterAnchorsChangedCallback(uint64_t registration) = 0;
};

}  // namespace core
}  // namespace xanchor
