#pragma once

#include <string>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#else
#include <dlfcn.h>
#endif

#include <xanchor_provider.h>

#include "../logging.h"

namespace xanchor {
namespace host {

class ProviderLoader {
   public:
    ProviderLoader() : library_handle_(nullptr), callbacks_{}, loaded_(false) {}

    ~ProviderLoader() { Unload(); }

    ProviderLoader(const ProviderLoader&) = delete;
    ProviderLoader& operator=(const ProviderLoader&) = delete;

    // Load provider from a specific directory
    bool LoadProvider(const std::string& provider_path) {
        if (loaded_) {
            LOG_ERROR("Provider already loaded");
            return false;
        }

        // Look for standardized provider library name
        std::string lib_path = provider_path;
#ifdef _WIN32
        lib_path += "\\provider.dll";
        library_handle_ = LoadLibraryA(lib_path.c_str());
        if (!library_handle_) {
            LOG_ERROR(("Failed to load provider library: " + lib_path).c_str());
            return false;
        }

        XaProviderRegisterFunc register_func =
            (XaProviderRegisterFunc)GetProcAddress((HMODULE)library_handle_, "xanchor_provider_register");
#else
        lib_path += "/libprovider.so";
        library_handle_ = dlopen(lib_path.c_str(), RTLD_NOW);
        if (!library_handle_) {
            LOG_ERROR((std::string("Failed to load provider library: ") + dlerror()).c_str());
            return false;
        }

        XaProviderRegisterFunc register_func =
            (XaProviderRegisterFunc)dlsym(library_handle_, "xanchor_provider_register");
#endif

        if (!register_func) {
            LOG_ERROR("Failed to find xanchor_provider_register function");
            Unload();
            return false;
        }

        if (!Register(register_func)) {
            Unload();
            return false;
        }

        LOG_INFO(("Provider loaded successfully: " + lib_path).c_str());
        return true;
    }

    // Register and initialize a provider from its register function (also used for in-process providers)
    bool Register(XaProviderRegisterFunc register_func) {
        if (loaded_) {
            LOG_ERROR("Provider already loaded");
            return false;
        }

        callbacks_ = {};
        if (!register_func || !register_func(&callbacks_)) {
            LOG_ERROR("Provider registration failed");
            return false;
        }

        // Verify all required callbacks are present
        if (!callbacks_.initialize || !callbacks_.is_tracking_available || !callbacks_.create_anchor ||
            !callbacks_.poll_anchor_changes) {
            LOG_ERROR("Provider missing required callbacks");
            callbacks_ = {};
            return false;
        }

        if (callbacks_.get_provider_info) {
            XaProviderInfo info = {};
            callbacks_.get_provider_info(&info);
            if (info.api_version != XANCHOR_PROVIDER_API_VERSION) {
                LOG_ERROR("Provider built against an unsupported API version");
                callbacks_ = {};
                return false;
            }
        }

        if (!callbacks_.initialize()) {
            LOG_ERROR("Provider initialization failed");
            callbacks_ = {};
            return false;
        }

        loaded_ = true;
        return true;
    }

    void Unload() {
        if (loaded_ && callbacks_.shutdown) {
            callbacks_.shutdown();
        }
        callbacks_ = {};

        if (library_handle_) {
#ifdef _WIN32
            FreeLibrary((HMODULE)library_handle_);
#else
            dlclose(library_handle_);
#endif
            library_handle_ = nullptr;
        }

        loaded_ = false;
    }

    void GetProviderInfo(XaProviderInfo* info) const {
        if (loaded_ && callbacks_.get_provider_info) {
            callbacks_.get_provider_info(info);
        }
    }

    bool IsTrackingAvailable() const {
        if (!loaded_ || !callbacks_.is_tracking_available) {
            return false;
        }
        return callbacks_.is_tracking_available() != 0;
    }

    XaAnchorId CreateAnchor(const XaPose& pose) const {
        if (!loaded_ || !callbacks_.create_anchor) {
            return XA_NULL_ANCHOR_ID;
        }
        return callbacks_.create_anchor(&pose);
    }

    void PollAnchorChanges(XaAnchorChange* out_changes, uint32_t max_changes, uint32_t* out_count) const {
        if (loaded_ && callbacks_.poll_anchor_changes) {
            callbacks_.poll_anchor_changes(out_changes, max_changes, out_count);
        } else {
            *out_count = 0;
        }
    }

    bool HasStore() const { return loaded_ && callbacks_.open_store; }

    bool OpenStore() const {
        if (!HasStore()) {
            return false;
        }
        return callbacks_.open_store() != 0;
    }

    std::vector<std::string> EnumeratePersistedNames() const {
        std::vector<std::string> names;
        if (!loaded_ || !callbacks_.enumerate_persisted_names) {
            return names;
        }

        uint32_t count = callbacks_.enumerate_persisted_names(nullptr, 0);
        if (count == 0) {
            return names;
        }

        std::vector<const char*> name_ptrs(count, nullptr);
        uint32_t written = callbacks_.enumerate_persisted_names(name_ptrs.data(), count);
        for (uint32_t i = 0; i < written && i < count; i++) {
            if (name_ptrs[i]) {
                names.push_back(name_ptrs[i]);
            }
        }
        return names;
    }

    XaAnchorId LoadAnchor(const char* name) const {
        if (!loaded_ || !callbacks_.load_anchor) {
            return XA_NULL_ANCHOR_ID;
        }
        return callbacks_.load_anchor(name);
    }

    XaResult PersistAnchor(XaAnchorId anchor_id, const char* name) const {
        if (!loaded_ || !callbacks_.persist_anchor) {
            return XA_RESULT_STORE_UNAVAILABLE;
        }
        return callbacks_.persist_anchor(anchor_id, name);
    }

    XaResult UnpersistAnchor(const char* name) const {
        if (!loaded_ || !callbacks_.unpersist_anchor) {
            return XA_RESULT_STORE_UNAVAILABLE;
        }
        return callbacks_.unpersist_anchor(name);
    }

    void UpdateDevices(int64_t predicted_time, XaDeviceState* out_states, uint32_t* out_count) const {
        if (loaded_ && callbacks_.update_devices) {
            callbacks_.update_devices(predicted_time, out_states, out_count);
        } else {
            // Provider doesn't report devices
            *out_count = 0;
        }
    }

    bool GetInputStateBoolean(int64_t predicted_time, const char* user_path, const char* component_path,
                              uint32_t* out_value) const {
        if (!loaded_ || !callbacks_.get_input_state_boolean) {
            return false;
        }
        return callbacks_.get_input_state_boolean(predicted_time, user_path, component_path, out_value) ==
               XA_COMPONENT_AVAILABLE;
    }

    bool IsLoaded() const { return loaded_; }

   private:
    void* library_handle_;
    XaProviderCallbacks callbacks_;
    bool loaded_;
};

}  // namespace host
}  // namespace xanchor
