#pragma once

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

#define XANCHOR_PROVIDER_API_VERSION 1

// Platform-specific export macro
#ifdef _WIN32
#define XANCHOR_PROVIDER_EXPORT __declspec(dllexport)
#else
#define XANCHOR_PROVIDER_EXPORT __attribute__((visibility("default")))
#endif

// Forward declarations
typedef struct XaProviderCallbacks XaProviderCallbacks;

// 3D position vector
typedef struct {
    float x, y, z;
} XaVector3f;

// Quaternion for orientation
typedef struct {
    float x, y, z, w;
} XaQuaternion;

// 6DOF pose (position + orientation)
typedef struct {
    XaVector3f position;
    XaQuaternion orientation;
} XaPose;

// Anchor identifier chosen by the provider. 0 is never a valid anchor.
typedef uint64_t XaAnchorId;

#define XA_NULL_ANCHOR_ID 0
#define XA_MAX_ANCHOR_NAME_SIZE 256
#define XA_MAX_DEVICES 16
#define XA_MAX_ANCHOR_CHANGES 64

// Provider information
typedef struct {
    char name[256];          // e.g., "Dummy Anchor Provider"
    char manufacturer[256];  // e.g., "xanchor"
    uint32_t api_version;    // XANCHOR_PROVIDER_API_VERSION the provider was built against
} XaProviderInfo;

typedef enum {
    XA_RESULT_SUCCESS = 0,
    XA_RESULT_FAILURE = 1,           // Generic rejection
    XA_RESULT_NAME_TAKEN = 2,        // Persist: name already used in the store
    XA_RESULT_NAME_NOT_FOUND = 3,    // Unpersist: no such name
    XA_RESULT_ANCHOR_NOT_FOUND = 4,  // Persist: unknown anchor id
    XA_RESULT_STORE_UNAVAILABLE = 5,
} XaResult;

typedef enum {
    XA_TRACKING_STATE_NOT_TRACKING = 0,
    XA_TRACKING_STATE_LIMITED = 1,
    XA_TRACKING_STATE_TRACKING = 2,
} XaTrackingState;

typedef enum {
    XA_ANCHOR_CHANGE_ADDED = 0,
    XA_ANCHOR_CHANGE_UPDATED = 1,
    XA_ANCHOR_CHANGE_REMOVED = 2,
} XaAnchorChangeKind;

// One queued anchor change
typedef struct {
    XaAnchorChangeKind kind;
    XaAnchorId anchor_id;
    XaPose pose;
    uint32_t pose_valid;  // 1 if pose holds the current anchor pose
    XaTrackingState tracking_state;
} XaAnchorChange;

// Tracked device state (hands, controllers, head)
typedef struct {
    char user_path[256];  // OpenXR user path: "/user/hand/left", "/user/head", etc.
    XaPose pose;
    uint32_t is_active;  // 1 if device is connected/tracked, 0 otherwise
} XaDeviceState;

// Component state result codes
typedef enum {
    XA_COMPONENT_UNAVAILABLE = 0,  // Component doesn't exist on this device
    XA_COMPONENT_AVAILABLE = 1,    // Component exists and state is valid
} XaComponentResult;

// Provider callbacks - implement these in your provider
//
// Threading: open_store runs on its own thread and may still be running while the host calls any
// other callback from the frame loop (create_anchor, poll_anchor_changes, update_devices and the
// rest). Every other callback, the store callbacks included, is called from the frame loop thread.
// A provider whose open_store touches state the other callbacks also use must synchronize it.
struct XaProviderCallbacks {
    // ========== Lifecycle ==========

    // Called once when the provider is loaded
    // Return: 1 on success, 0 on failure
    int (*initialize)(void);

    // Called when the host shuts down
    void (*shutdown)(void);

    // Get provider information (name, manufacturer, API version)
    void (*get_provider_info)(XaProviderInfo* info);

    // Check if spatial anchors can be created right now
    // Return: 1 if available, 0 if not
    int (*is_tracking_available)(void);

    // ========== Anchors ==========

    // Request a new anchor at pose
    // Returns: the new anchor id, or XA_NULL_ANCHOR_ID on failure
    // The anchor is also reported through poll_anchor_changes as ADDED
    XaAnchorId (*create_anchor)(const XaPose* pose);

    // Drain queued anchor changes, oldest first
    // out_changes: array with room for max_changes entries
    // out_count: write the number of changes written here
    // Called once per frame until it reports fewer than max_changes
    void (*poll_anchor_changes)(XaAnchorChange* out_changes, uint32_t max_changes, uint32_t* out_count);

    // ========== Anchor Store (Optional) ==========

    // Open the persisted anchor store. May block; the host calls it on a separate thread, concurrently
    // with the frame loop callbacks. The host waits for it to return before shutdown.
    // Return: 1 if the store is available, 0 otherwise
    // This callback is optional - set to NULL if persistence is not supported
    int (*open_store)(void);

    // Enumerate persisted anchor names
    // names: array to fill with null-terminated names, valid until the next store call
    // max_names: size of the names array (0 to query the count)
    // Returns: number of persisted names (may be > max_names)
    uint32_t (*enumerate_persisted_names)(const char** names, uint32_t max_names);

    // Request a persisted anchor be loaded
    // Returns: the id the anchor will use once loaded (reported later as ADDED), or XA_NULL_ANCHOR_ID
    XaAnchorId (*load_anchor)(const char* name);

    XaResult (*persist_anchor)(XaAnchorId anchor_id, const char* name);
    XaResult (*unpersist_anchor)(const char* name);

    // ========== Input ==========

    // Update all tracked devices (hands, controllers, head)
    // predicted_time: nanoseconds since epoch
    // out_states: array to fill with device states (must have space for XA_MAX_DEVICES)
    // out_count: write the number of devices here (must be <= XA_MAX_DEVICES)
    void (*update_devices)(int64_t predicted_time, XaDeviceState* out_states, uint32_t* out_count);

    // Get boolean input state (for /click components)
    // user_path: OpenXR user path (e.g., "/user/hand/left")
    // component_path: OpenXR component path (e.g., "/input/select/click")
    // out_value: write the boolean value here (0 or 1)
    // Returns: XA_COMPONENT_AVAILABLE if component exists, XA_COMPONENT_UNAVAILABLE otherwise
    XaComponentResult (*get_input_state_boolean)(int64_t predicted_time, const char* user_path,
                                                 const char* component_path, uint32_t* out_value);
};

// Every provider MUST export this function as "xanchor_provider_register"
// callbacks: pointer to struct that the host has allocated
// Return: 1 on success, 0 on failure
typedef int (*XaProviderRegisterFunc)(XaProviderCallbacks* callbacks);

#ifdef __cplusplus
}
#endif
